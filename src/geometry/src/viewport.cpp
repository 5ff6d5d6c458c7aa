#include "geometry/viewport.hpp"

#include <algorithm>
#include <cmath>

namespace tg::geometry {

void ScrollModel::set_start(double fraction) {
    start_ = std::clamp(finite_or(fraction, 0.0), 0.0, 1.0);
}

double ScrollModel::max_offset() const {
    return std::max(0.0, content_ - view_);
}

double ScrollModel::update(double content_size, double view_size, bool pin_end) {
    content_ = std::max(0.0, finite_or(content_size, 0.0));
    view_ = std::max(0.0, finite_or(view_size, 0.0));

    // No content to scroll over means fully visible
    ratio_ = content_ > 0.0 ? view_ / content_ : 1.0;
    ratio_ = std::clamp(ratio_, 0.0, 1.0);

    if (ratio_ >= 1.0) {
        start_ = 0.0;
        end_ = 1.0;
        offset_ = 0.0;
        return offset_;
    }

    const double max_start = 1.0 - ratio_;
    double start = pin_end ? max_start : std::clamp(start_, 0.0, max_start);
    double offset = start * content_;
    const double max_scroll = max_offset();
    if (max_scroll > 0.0) {
        offset = std::min(offset, max_scroll);
        start = offset / content_;
    }
    start_ = start;
    end_ = std::min(1.0, start_ + ratio_);
    offset_ = offset;
    return offset_;
}

ScrollModel::Handle ScrollModel::handle(double min_length) const {
    Handle h;
    if (!scrollable()) {
        return h;
    }
    h.visible = true;
    h.length = std::max(std::max(0.0, min_length), ratio_ * view_);
    const double avail = std::max(0.0, view_ - h.length);
    const double max_scroll = max_offset();
    if (max_scroll > 0.0) {
        h.pos = (offset_ / max_scroll) * avail;
    }
    return h;
}

double ViewportSynchronizer::update_horizontal(double content_width, double view_width) {
    double offset = horizontal_.update(content_width, view_width, keep_right_);
    auto handle = horizontal_.handle(frame_.min_handle);
    if (handle.visible) {
        h_handle_ = RectF{frame_.track_left + handle.pos, frame_.h_bar_top, handle.length, frame_.thickness};
    } else {
        h_handle_ = RectF{};
    }
    return offset;
}

double ViewportSynchronizer::update_vertical(double content_height, double view_height) {
    double offset = vertical_.update(content_height, view_height);
    auto handle = vertical_.handle(frame_.min_handle);
    if (handle.visible) {
        v_handle_ = RectF{frame_.v_bar_left, frame_.track_top + handle.pos, frame_.thickness, handle.length};
    } else {
        v_handle_ = RectF{};
    }
    return offset;
}

bool ViewportSynchronizer::is_right_aligned() const {
    if (horizontal_.content_size() <= horizontal_.view_size() + 1e-6) {
        return true;
    }
    return horizontal_.end() >= 1.0 - 1e-4;
}

ViewMetrics ViewportSynchronizer::metrics() const {
    ViewMetrics m;
    m.view_w = horizontal_.view_size();
    m.view_h = vertical_.view_size();
    m.timeline_w = std::max(m.view_w, horizontal_.content_size());
    m.content_h = std::max(m.view_h, vertical_.content_size());
    m.h_offset = horizontal_.offset();
    m.v_offset = vertical_.offset();
    return m;
}

} // namespace tg::geometry
