#include "geometry/track_layout.hpp"
#include "core/log.hpp"
#include "core/log_config.hpp"
#include "core/rect.hpp"

#include <algorithm>
#include <cmath>

namespace tg::geometry {

const TrackRow* TrackLayout::row(timeline::TrackNumber number) const {
    auto it = row_index.find(number);
    return it != row_index.end() ? &rows[it->second] : nullptr;
}

double TrackLayout::offset_of(timeline::TrackNumber number) const {
    const TrackRow* r = row(number);
    return r ? r->offset : 0.0;
}

double TrackLayoutEngine::pixels_per_second(double tick_pixels, double zoom_factor, const LayoutConfig& config) {
    double tick = finite_or(tick_pixels, 0.0);
    if (tick <= 0.0) tick = config.default_tick_pixels;
    double zoom = finite_or(zoom_factor, 0.0);
    if (zoom <= 0.0) zoom = 1.0;
    return tick / zoom;
}

TrackLayout TrackLayoutEngine::compute(const TrackLayoutInput& input, const LayoutConfig& config) {
    TrackLayout layout;
    layout.pixels_per_second = pixels_per_second(input.tick_pixels, input.zoom_factor, config);
    layout.track_gap = config.track_gap;
    layout.top_margin = config.track_margin_top;

    const double view_w = std::max(0.0, finite_or(input.view_width, 0.0));
    const double view_h = std::max(0.0, finite_or(input.view_height, 0.0));
    const double duration = std::max(0.0, finite_or(input.duration, 0.0));
    layout.duration_width = duration * layout.pixels_per_second;
    layout.timeline_width = std::max(view_w, layout.duration_width);

    if (config.track_height > 0.0) {
        layout.base_height = config.track_height;
    } else {
        const size_t count = input.tracks.empty() ? 1 : input.tracks.size();
        layout.base_height = std::max(1.0, view_h / static_cast<double>(count));
    }

    layout.rows.reserve(input.tracks.size());
    double cumulative = 0.0;
    for (const timeline::Track* track : input.tracks) {
        if (track == nullptr) continue;
        if (layout.has_track(track->number)) {
            tg::log::warn("TrackLayout: duplicate track number " + std::to_string(track->number) + " ignored");
            continue;
        }
        if (!layout.rows.empty()) {
            cumulative += layout.track_gap;
        }
        double extra = 0.0;
        if (track->panel_expanded) {
            extra = std::max(0.0, finite_or(track->panel_height, 0.0));
        }
        TrackRow row;
        row.track = track;
        row.offset = layout.top_margin + cumulative;
        row.height = layout.base_height + extra;
        row.panel_height = extra;
        layout.row_index.emplace(track->number, layout.rows.size());
        layout.rows.push_back(row);
        cumulative += row.height;
        if (extra > 0.0) {
            TG_GEOM_DEBUG("TrackLayout: track " + std::to_string(track->number) + " base=" +
                          std::to_string(layout.base_height) + " extra=" + std::to_string(extra));
        }
    }
    layout.content_height = layout.top_margin + cumulative;
    return layout;
}

} // namespace tg::geometry
