#pragma once
#include "core/expected.hpp"
#include "core/rect.hpp"
#include "geometry/geometry_entry.hpp"
#include "geometry/geometry_error.hpp"
#include "geometry/hit_tester.hpp"
#include "geometry/interval_index.hpp"
#include "geometry/layout_config.hpp"
#include "geometry/marker_layout.hpp"
#include "geometry/track_layout.hpp"
#include "geometry/viewport.hpp"
#include "timeline/project.hpp"

#include <cstdint>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace tg::geometry {

// Values that replace an item's stored fields while it is being dragged
struct ItemOverride {
    std::optional<double> position;
    std::optional<double> start;
    std::optional<double> end;
    std::optional<timeline::TrackNumber> layer;
};

// Cached, content-space geometry of one track row
struct TrackGeometry {
    const timeline::Track* track = nullptr;
    RectF rect;       // content row, right of the gutter
    RectF name_rect;  // gutter cell
    std::optional<RectF> panel_rect;
};

// Track row as yielded to painters, in viewport coordinates. The name cell
// scrolls vertically only.
struct TrackView {
    RectF rect;
    const timeline::Track* track = nullptr;
    RectF name_rect;
    std::optional<RectF> panel_rect;
};

/**
 * @brief Geometry cache for one timeline canvas.
 *
 * Holds the rectangle of every track, clip, transition and marker plus the
 * scroll state of both axes. Painters and input handlers pull from it right
 * before they need geometry; every iteration and query calls ensure() first,
 * so nothing stale is returned once mark_dirty() has been called.
 *
 * The project is read, never written. Cached entries point at project elements
 * without owning them: callers must mark_dirty() after any edit and before the
 * next read. Single-threaded; use from the UI thread only.
 */
class GeometryCache {
public:
    explicit GeometryCache(const timeline::Project& project, LayoutConfig config = LayoutConfig{});
    GeometryCache(const GeometryCache&) = delete;
    GeometryCache& operator=(const GeometryCache&) = delete;

    // Canvas inputs
    void set_canvas_size(double width, double height);
    double canvas_width() const { return canvas_w_; }
    double canvas_height() const { return canvas_h_; }
    void set_zoom_factor(double zoom);
    double zoom_factor() const { return zoom_factor_; }
    void set_track_name_width(double width);
    void set_duration_override(std::optional<double> seconds);
    void set_keep_right(bool keep);
    void set_pending_override(ItemKind kind, const timeline::ItemId& id, const ItemOverride& ov);
    void clear_pending_overrides();
    const LayoutConfig& config() const { return config_; }

    // Cache state
    void mark_dirty() { dirty_ = true; }
    bool is_dirty() const { return dirty_; }
    void ensure();
    // Rescroll/resize without touching the interval indices. Missing arguments
    // are derived from the canvas size and the last layout.
    void refresh_viewport(std::optional<double> view_w = std::nullopt,
                          std::optional<double> view_h = std::nullopt,
                          std::optional<double> timeline_w = std::nullopt);
    uint64_t rebuild_count() const { return rebuild_count_; }

    // Scrolling
    void scroll_horizontal_to(double fraction);
    void scroll_vertical_to(double fraction);
    void scroll_by_pixels(double dx, double dy);
    bool is_view_right_aligned();
    ViewMetrics view_state();

    // Paint-ordered iteration over the visible window (plus paint margin).
    // viewport=false yields content-space rects.
    std::vector<ClipEntry> iter_clips(bool reverse = false, bool viewport = true);
    std::vector<TransitionEntry> iter_transitions(bool reverse = false, bool viewport = true);
    // Transitions then clips; with reverse, clips then transitions, each reversed
    std::vector<ItemView> iter_items(bool reverse = false, bool viewport = true);
    std::vector<TrackView> iter_tracks();
    std::vector<MarkerGeometry> iter_markers();

    std::optional<RectF> panel_rect(timeline::TrackNumber track);
    RectF timeline_handle_rect();
    RectF resize_handle_rect();
    RectF h_scrollbar_rect();
    RectF v_scrollbar_rect();

    HitResult hit(const PointF& pos);

    expected<RectF, GeometryError> calc_item_rect(const timeline::Clip& clip, bool viewport = false);
    expected<RectF, GeometryError> calc_item_rect(const timeline::Transition& transition, bool viewport = false);
    // Drag fast path: replaces one cached content-space rect and re-sorts that index
    [[nodiscard]] bool update_item_rect(ItemKind kind, const timeline::ItemId& id, const RectF& rect);

    expected<RectF, GeometryError> item_rect_by_id(ItemKind kind, const timeline::ItemId& id);
    std::optional<timeline::TrackNumber> track_at(double y);
    std::optional<MarkerGeometry> marker_at(const PointF& pos);
    double seconds_at(double x);
    double x_at_seconds(double seconds);
    // Items overlapping [from_s, to_s] on any track, content space, left to right
    std::vector<ItemView> query_time_range(double from_s, double to_s);

    const TrackLayout& layout();
    const IntervalIndex<timeline::Clip>& clip_index();
    const IntervalIndex<timeline::Transition>& transition_index();

private:
    using OverrideMap = std::unordered_map<timeline::ItemId, ItemOverride>;

    void rebuild();
    void build_track_geometry();
    void sync_viewport(double timeline_w, double content_h, double view_w, double view_h);
    double canvas_view_width() const;
    double canvas_view_height() const;

    template <typename T>
    expected<RectF, GeometryError> compute_rect(const T& item, const ItemOverride* ov) const;
    template <typename T>
    std::vector<GeometryEntry<T>> build_entries(const std::vector<const T*>& items,
                                                const std::unordered_set<timeline::ItemId>& selected,
                                                const OverrideMap& overrides,
                                                const char* kind_name) const;
    template <typename T>
    std::vector<GeometryEntry<T>> visible_entries(const IntervalIndex<T>& index, bool reverse, bool viewport) const;

    const timeline::Project& project_;
    LayoutConfig config_;

    double canvas_w_ = 0.0;
    double canvas_h_ = 0.0;
    double zoom_factor_ = 1.0;
    std::optional<double> duration_override_;
    OverrideMap clip_overrides_;
    OverrideMap transition_overrides_;

    bool dirty_ = true;
    uint64_t rebuild_count_ = 0;

    TrackLayout layout_;
    std::vector<TrackGeometry> tracks_;
    std::unordered_map<timeline::TrackNumber, size_t> track_lookup_;
    IntervalIndex<timeline::Clip> clips_;
    IntervalIndex<timeline::Transition> transitions_;
    std::vector<MarkerGeometry> markers_;
    ViewportSynchronizer sync_;
    RectF resize_handle_;
};

} // namespace tg::geometry
