#include "geometry/geometry_cache.hpp"
#include "core/log.hpp"
#include "core/log_config.hpp"
#include "core/profiling.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <utility>

namespace tg::geometry {

GeometryCache::GeometryCache(const timeline::Project& project, LayoutConfig config)
    : project_(project), config_(config.sanitized()) {
}

void GeometryCache::set_canvas_size(double width, double height) {
    canvas_w_ = std::max(0.0, finite_or(width, 0.0));
    canvas_h_ = std::max(0.0, finite_or(height, 0.0));
}

void GeometryCache::set_zoom_factor(double zoom) {
    if (!std::isfinite(zoom) || zoom <= 0.0) {
        tg::log::warn("GeometryCache: ignoring zoom factor " + std::to_string(zoom));
        return;
    }
    if (zoom != zoom_factor_) {
        zoom_factor_ = zoom;
        mark_dirty();
    }
}

void GeometryCache::set_track_name_width(double width) {
    double clamped = std::max(config_.min_track_name_width, finite_or(width, config_.track_name_width));
    if (clamped != config_.track_name_width) {
        config_.track_name_width = clamped;
        mark_dirty();
    }
}

void GeometryCache::set_duration_override(std::optional<double> seconds) {
    if (seconds && (!std::isfinite(*seconds) || *seconds < 0.0)) {
        seconds.reset();
    }
    duration_override_ = seconds;
    mark_dirty();
}

void GeometryCache::set_keep_right(bool keep) {
    sync_.set_keep_right(keep);
}

void GeometryCache::set_pending_override(ItemKind kind, const timeline::ItemId& id, const ItemOverride& ov) {
    auto& overrides = kind == ItemKind::Clip ? clip_overrides_ : transition_overrides_;
    overrides[id] = ov;
    mark_dirty();
}

void GeometryCache::clear_pending_overrides() {
    if (clip_overrides_.empty() && transition_overrides_.empty()) return;
    clip_overrides_.clear();
    transition_overrides_.clear();
    mark_dirty();
}

double GeometryCache::canvas_view_width() const {
    return std::max(0.0, canvas_w_ - config_.track_name_width - config_.scroll_bar_thickness);
}

double GeometryCache::canvas_view_height() const {
    return std::max(0.0, canvas_h_ - config_.ruler_height - config_.scroll_bar_thickness);
}

// ---------------------------------------------------------------------------
// Rebuild
// ---------------------------------------------------------------------------

void GeometryCache::ensure() {
    if (dirty_) {
        rebuild();
    }
}

template <typename T>
expected<RectF, GeometryError> GeometryCache::compute_rect(const T& item, const ItemOverride* ov) const {
    const double position = finite_or(ov && ov->position ? *ov->position : item.position, 0.0);
    const double start = finite_or(ov && ov->start ? *ov->start : item.start, 0.0);
    double end = finite_or(ov && ov->end ? *ov->end : item.end, start);
    if (end < start) {
        end = start;
    }
    const timeline::TrackNumber layer = ov && ov->layer ? *ov->layer : item.layer;
    const TrackRow* row = layout_.row(layer);
    if (row == nullptr) {
        return make_unexpected(GeometryError::MissingTrack);
    }
    const double pps = layout_.pixels_per_second;
    return RectF{config_.track_name_width + position * pps,
                 config_.ruler_height + row->offset,
                 (end - start) * pps,
                 layout_.base_height};
}

template <typename T>
std::vector<GeometryEntry<T>> GeometryCache::build_entries(const std::vector<const T*>& items,
                                                           const std::unordered_set<timeline::ItemId>& selected,
                                                           const OverrideMap& overrides,
                                                           const char* kind_name) const {
    std::vector<GeometryEntry<T>> entries;
    entries.reserve(items.size());
    for (const T* item : items) {
        if (item == nullptr) continue;
        auto ov_it = overrides.find(item->id);
        const ItemOverride* ov = ov_it != overrides.end() ? &ov_it->second : nullptr;
        auto rect = compute_rect(*item, ov);
        if (!rect) {
            const timeline::TrackNumber layer = ov && ov->layer ? *ov->layer : item->layer;
            tg::log::warn(std::string("GeometryCache: skipping ") + kind_name + " '" + item->id +
                          "', layer " + std::to_string(layer) + ": " + to_string(rect.error()));
            continue;
        }
        GeometryEntry<T> entry;
        entry.rect = *rect;
        entry.item = item;
        entry.selected = selected.count(item->id) != 0;
        entries.push_back(entry);
    }
    return entries;
}

void GeometryCache::build_track_geometry() {
    tracks_.clear();
    track_lookup_.clear();
    tracks_.reserve(layout_.rows.size());
    for (const auto& row : layout_.rows) {
        const double y = config_.ruler_height + row.offset;
        TrackGeometry geo;
        geo.track = row.track;
        geo.rect = RectF{config_.track_name_width, y, layout_.timeline_width, row.height};
        geo.name_rect = RectF{0.0, y, config_.track_name_width, row.height};
        if (row.panel_height > 0.0) {
            geo.panel_rect = RectF{config_.track_name_width, y + layout_.base_height,
                                   layout_.timeline_width, row.panel_height};
        }
        track_lookup_.emplace(row.track->number, tracks_.size());
        tracks_.push_back(geo);
    }
}

void GeometryCache::sync_viewport(double timeline_w, double content_h, double view_w, double view_h) {
    ScrollbarFrame frame;
    frame.track_left = config_.track_name_width;
    frame.h_bar_top = canvas_h_ - config_.scroll_bar_thickness;
    frame.track_top = config_.ruler_height;
    frame.v_bar_left = canvas_w_ - config_.scroll_bar_thickness;
    frame.thickness = config_.scroll_bar_thickness;
    frame.min_handle = config_.min_scroll_handle;
    sync_.set_frame(frame);
    sync_.update_horizontal(timeline_w, view_w);
    sync_.update_vertical(content_h, view_h);

    resize_handle_ = RectF{config_.track_name_width - config_.resize_handle_width / 2.0,
                           config_.ruler_height + layout_.top_margin,
                           config_.resize_handle_width,
                           std::max(0.0, content_h - layout_.top_margin)};
}

void GeometryCache::rebuild() {
    TG_PROFILE_SCOPE("geometry.rebuild");

    // Track layout first: item rects depend on its offsets
    TrackLayoutInput input;
    input.tracks = project_.tracks();
    input.view_width = canvas_view_width();
    input.view_height = canvas_view_height();
    input.zoom_factor = zoom_factor_;
    input.tick_pixels = project_.tick_pixels();
    input.duration = duration_override_ ? *duration_override_ : project_.duration();
    layout_ = TrackLayoutEngine::compute(input, config_);
    build_track_geometry();

    const auto& selection = project_.selection();
    clips_.assign(build_entries(project_.clips(), selection.clips, clip_overrides_, "clip"));
    transitions_.assign(build_entries(project_.transitions(), selection.transitions,
                                      transition_overrides_, "transition"));
    markers_ = build_marker_geometry(project_.markers(), layout_.pixels_per_second,
                                     layout_.content_height, config_);

    sync_viewport(layout_.timeline_width, layout_.content_height, input.view_width, input.view_height);

    dirty_ = false;
    ++rebuild_count_;
    TG_GEOM_DEBUG("GeometryCache: rebuilt tracks=" + std::to_string(tracks_.size()) +
                  " clips=" + std::to_string(clips_.size()) +
                  " transitions=" + std::to_string(transitions_.size()) +
                  " timeline_w=" + std::to_string(layout_.timeline_width));
}

void GeometryCache::refresh_viewport(std::optional<double> view_w, std::optional<double> view_h,
                                     std::optional<double> timeline_w) {
    TG_PROFILE_SCOPE("geometry.refresh_viewport");
    ensure();

    const double vw = std::max(0.0, finite_or(view_w.value_or(canvas_view_width()), 0.0));
    const double vh = std::max(0.0, finite_or(view_h.value_or(canvas_view_height()), 0.0));
    double tw = 0.0;
    if (timeline_w) {
        tw = std::max(finite_or(*timeline_w, 0.0), vw);
    } else {
        tw = std::max(layout_.duration_width, vw);
    }
    layout_.timeline_width = tw;

    sync_viewport(tw, layout_.content_height, vw, vh);

    // Rows span the whole content width; widths follow, rects stay in place
    for (auto& geo : tracks_) {
        geo.rect.w = tw;
        if (geo.panel_rect) {
            geo.panel_rect->w = tw;
        }
    }
}

// ---------------------------------------------------------------------------
// Scrolling
// ---------------------------------------------------------------------------

void GeometryCache::scroll_horizontal_to(double fraction) {
    sync_.scroll_horizontal_to(fraction);
    refresh_viewport();
}

void GeometryCache::scroll_vertical_to(double fraction) {
    sync_.scroll_vertical_to(fraction);
    refresh_viewport();
}

void GeometryCache::scroll_by_pixels(double dx, double dy) {
    ensure();
    const auto& h = sync_.horizontal();
    const auto& v = sync_.vertical();
    if (h.content_size() > 0.0) {
        sync_.scroll_horizontal_to((h.offset() + finite_or(dx, 0.0)) / h.content_size());
    }
    if (v.content_size() > 0.0) {
        sync_.scroll_vertical_to((v.offset() + finite_or(dy, 0.0)) / v.content_size());
    }
    refresh_viewport();
}

bool GeometryCache::is_view_right_aligned() {
    ensure();
    return sync_.is_right_aligned();
}

ViewMetrics GeometryCache::view_state() {
    ensure();
    return sync_.metrics();
}

// ---------------------------------------------------------------------------
// Iteration
// ---------------------------------------------------------------------------

template <typename T>
std::vector<GeometryEntry<T>> GeometryCache::visible_entries(const IntervalIndex<T>& index,
                                                             bool reverse, bool viewport) const {
    const ViewMetrics m = sync_.metrics();
    const double view_left = config_.track_name_width + m.h_offset;
    const double view_right = view_left + m.view_w;
    const double view_top = config_.ruler_height + m.v_offset;
    const double view_bottom = view_top + m.view_h;
    const double margin = std::max(config_.paint_margin_min, m.view_w * config_.paint_margin_fraction);

    auto ordered = paint_order(index.iter_in_range(view_left - margin, view_right + margin,
                                                   view_top, view_bottom), reverse);
    std::vector<GeometryEntry<T>> result;
    result.reserve(ordered.size());
    for (const auto* entry : ordered) {
        GeometryEntry<T> out = *entry;
        if (viewport) {
            out.rect.translate(-m.h_offset, -m.v_offset);
        }
        result.push_back(out);
    }
    return result;
}

std::vector<ClipEntry> GeometryCache::iter_clips(bool reverse, bool viewport) {
    ensure();
    return visible_entries(clips_, reverse, viewport);
}

std::vector<TransitionEntry> GeometryCache::iter_transitions(bool reverse, bool viewport) {
    ensure();
    return visible_entries(transitions_, reverse, viewport);
}

std::vector<ItemView> GeometryCache::iter_items(bool reverse, bool viewport) {
    ensure();
    std::vector<ItemView> result;
    auto append_clips = [&] {
        for (const auto& e : visible_entries(clips_, reverse, viewport)) {
            result.push_back(ItemView{e.rect, ItemRef{e.item}, e.selected});
        }
    };
    auto append_transitions = [&] {
        for (const auto& e : visible_entries(transitions_, reverse, viewport)) {
            result.push_back(ItemView{e.rect, ItemRef{e.item}, e.selected});
        }
    };
    // Transitions paint under clips
    if (reverse) {
        append_clips();
        append_transitions();
    } else {
        append_transitions();
        append_clips();
    }
    return result;
}

std::vector<TrackView> GeometryCache::iter_tracks() {
    ensure();
    const ViewMetrics m = sync_.metrics();
    std::vector<TrackView> result;
    result.reserve(tracks_.size());
    for (const auto& geo : tracks_) {
        TrackView view;
        view.track = geo.track;
        view.rect = geo.rect.translated(-m.h_offset, -m.v_offset);
        view.name_rect = geo.name_rect.translated(0.0, -m.v_offset);
        if (geo.panel_rect) {
            view.panel_rect = geo.panel_rect->translated(-m.h_offset, -m.v_offset);
        }
        result.push_back(view);
    }
    return result;
}

std::vector<MarkerGeometry> GeometryCache::iter_markers() {
    ensure();
    const ViewMetrics m = sync_.metrics();
    std::vector<MarkerGeometry> result;
    result.reserve(markers_.size());
    for (const auto& geo : markers_) {
        MarkerGeometry out = geo;
        out.line_rect.translate(-m.h_offset, -m.v_offset);
        // Icons sit in the ruler, which never scrolls vertically
        if (out.icon_rect) out.icon_rect->translate(-m.h_offset, 0.0);
        if (out.hit_rect) out.hit_rect->translate(-m.h_offset, 0.0);
        result.push_back(out);
    }
    return result;
}

std::optional<RectF> GeometryCache::panel_rect(timeline::TrackNumber track) {
    ensure();
    auto it = track_lookup_.find(track);
    if (it == track_lookup_.end()) return std::nullopt;
    const auto& panel = tracks_[it->second].panel_rect;
    if (!panel) return std::nullopt;
    const ViewMetrics m = sync_.metrics();
    return panel->translated(-m.h_offset, -m.v_offset);
}

RectF GeometryCache::timeline_handle_rect() {
    ensure();
    const ViewMetrics m = sync_.metrics();
    const double handle_w = config_.project_handle_width;
    const double handle_h = std::max(0.0, layout_.content_height - layout_.top_margin);
    if (handle_w <= 0.0 || handle_h <= 0.0) return RectF{};
    if (m.timeline_w <= 0.0 || m.view_w <= 0.0) return RectF{};

    // Only shown while the content's right edge is on screen
    const bool right_aligned = m.h_offset + m.view_w >= m.timeline_w - 0.5;
    if (!right_aligned) return RectF{};

    const double name_w = config_.track_name_width;
    const double timeline_right = name_w + m.timeline_w - m.h_offset;
    const double visible_limit = name_w + m.view_w;
    double handle_x = std::max(name_w, timeline_right - handle_w);
    handle_x = std::min(handle_x, visible_limit - handle_w);
    handle_x = std::max(name_w, handle_x);
    return RectF{handle_x, config_.ruler_height + layout_.top_margin - m.v_offset, handle_w, handle_h};
}

RectF GeometryCache::resize_handle_rect() {
    ensure();
    return resize_handle_;
}

RectF GeometryCache::h_scrollbar_rect() {
    ensure();
    return sync_.h_handle_rect();
}

RectF GeometryCache::v_scrollbar_rect() {
    ensure();
    return sync_.v_handle_rect();
}

// ---------------------------------------------------------------------------
// Hit testing & lookups
// ---------------------------------------------------------------------------

HitResult GeometryCache::hit(const PointF& pos) {
    ensure();
    HitScene scene;
    scene.content_left = config_.track_name_width;
    scene.ruler_height = config_.ruler_height;
    scene.items = iter_items(true, true);
    for (const auto& view : iter_tracks()) {
        if (!view.panel_rect) continue;
        scene.panels.push_back(PanelRegion{view.track->number, *view.panel_rect, view.name_rect});
    }
    scene.h_scroll = sync_.h_handle_rect();
    scene.v_scroll = sync_.v_handle_rect();
    scene.timeline_handle = timeline_handle_rect();
    scene.resize_handle = resize_handle_;
    return HitTester::hit(pos, scene);
}

expected<RectF, GeometryError> GeometryCache::calc_item_rect(const timeline::Clip& clip, bool viewport) {
    ensure();
    auto rect = compute_rect(clip, nullptr);
    if (rect && viewport) {
        const ViewMetrics m = sync_.metrics();
        return rect->translated(-m.h_offset, -m.v_offset);
    }
    return rect;
}

expected<RectF, GeometryError> GeometryCache::calc_item_rect(const timeline::Transition& transition, bool viewport) {
    ensure();
    auto rect = compute_rect(transition, nullptr);
    if (rect && viewport) {
        const ViewMetrics m = sync_.metrics();
        return rect->translated(-m.h_offset, -m.v_offset);
    }
    return rect;
}

bool GeometryCache::update_item_rect(ItemKind kind, const timeline::ItemId& id, const RectF& rect) {
    if (!std::isfinite(rect.x) || !std::isfinite(rect.y) || !std::isfinite(rect.w) || !std::isfinite(rect.h)) {
        tg::log::warn("GeometryCache::update_item_rect: non-finite rect for '" + id + "'");
        return false;
    }
    ensure();
    return kind == ItemKind::Clip ? clips_.update_rect(id, rect) : transitions_.update_rect(id, rect);
}

expected<RectF, GeometryError> GeometryCache::item_rect_by_id(ItemKind kind, const timeline::ItemId& id) {
    ensure();
    std::optional<RectF> found;
    if (kind == ItemKind::Clip) {
        if (const auto* e = clips_.find(id)) found = e->rect;
    } else {
        if (const auto* e = transitions_.find(id)) found = e->rect;
    }
    if (!found) {
        return make_unexpected(GeometryError::UnknownItem);
    }
    const ViewMetrics m = sync_.metrics();
    return found->translated(-m.h_offset, -m.v_offset);
}

std::optional<timeline::TrackNumber> GeometryCache::track_at(double y) {
    ensure();
    if (y < config_.ruler_height) return std::nullopt;
    const ViewMetrics m = sync_.metrics();
    for (const auto& geo : tracks_) {
        const double top = geo.rect.top() - m.v_offset;
        if (y >= top && y <= top + geo.rect.h) {
            return geo.track->number;
        }
    }
    return std::nullopt;
}

std::optional<MarkerGeometry> GeometryCache::marker_at(const PointF& pos) {
    auto markers = iter_markers();
    // Later markers draw over earlier ones
    for (auto it = markers.rbegin(); it != markers.rend(); ++it) {
        auto pick = it->pick_rect();
        if (pick && pick->contains(pos)) {
            return *it;
        }
    }
    return std::nullopt;
}

double GeometryCache::seconds_at(double x) {
    ensure();
    const ViewMetrics m = sync_.metrics();
    return (x - config_.track_name_width + m.h_offset) / layout_.pixels_per_second;
}

double GeometryCache::x_at_seconds(double seconds) {
    ensure();
    const ViewMetrics m = sync_.metrics();
    return config_.track_name_width + finite_or(seconds, 0.0) * layout_.pixels_per_second - m.h_offset;
}

std::vector<ItemView> GeometryCache::query_time_range(double from_s, double to_s) {
    ensure();
    from_s = finite_or(from_s, 0.0);
    to_s = finite_or(to_s, 0.0);
    if (to_s < from_s) std::swap(from_s, to_s);
    const double left = config_.track_name_width + from_s * layout_.pixels_per_second;
    const double right = config_.track_name_width + to_s * layout_.pixels_per_second;
    const double top = -std::numeric_limits<double>::infinity();
    const double bottom = std::numeric_limits<double>::infinity();

    std::vector<ItemView> result;
    for (const auto* e : transitions_.iter_in_range(left, right, top, bottom)) {
        result.push_back(ItemView{e->rect, ItemRef{e->item}, e->selected});
    }
    for (const auto* e : clips_.iter_in_range(left, right, top, bottom)) {
        result.push_back(ItemView{e->rect, ItemRef{e->item}, e->selected});
    }
    return result;
}

const TrackLayout& GeometryCache::layout() {
    ensure();
    return layout_;
}

const IntervalIndex<timeline::Clip>& GeometryCache::clip_index() {
    ensure();
    return clips_;
}

const IntervalIndex<timeline::Transition>& GeometryCache::transition_index() {
    ensure();
    return transitions_;
}

} // namespace tg::geometry
