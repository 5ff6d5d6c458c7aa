#pragma once
#include "geometry/layout_config.hpp"
#include "timeline/project.hpp"

#include <unordered_map>
#include <vector>

namespace tg::geometry {

struct TrackLayoutInput {
    std::vector<const timeline::Track*> tracks;  // display order, top row first
    double view_width = 0.0;
    double view_height = 0.0;
    double zoom_factor = 1.0;   // seconds per tick
    double tick_pixels = 100.0; // pixels per tick
    double duration = 0.0;      // project duration, seconds
};

// One stacked row. Offsets are content-space y relative to the top of the
// content area (below the ruler) and include the top margin.
struct TrackRow {
    const timeline::Track* track = nullptr;
    double offset = 0.0;
    double height = 0.0;        // base + panel
    double panel_height = 0.0;  // 0 when collapsed
};

struct TrackLayout {
    double pixels_per_second = 1.0;
    double base_height = 1.0;
    double track_gap = 0.0;
    double top_margin = 0.0;
    double content_height = 0.0;
    double duration_width = 0.0;  // duration * pixels_per_second
    double timeline_width = 0.0;  // max(view width, duration_width)
    std::vector<TrackRow> rows;
    std::unordered_map<timeline::TrackNumber, size_t> row_index;

    bool has_track(timeline::TrackNumber number) const { return row_index.count(number) != 0; }
    const TrackRow* row(timeline::TrackNumber number) const;
    double offset_of(timeline::TrackNumber number) const;
};

/**
 * @brief Vertical stacking and horizontal extent of the content area.
 *
 * Pure function of its inputs: no clip or transition data is read, so this
 * runs first in every rebuild and its offsets feed the interval indices.
 */
class TrackLayoutEngine {
public:
    static TrackLayout compute(const TrackLayoutInput& input, const LayoutConfig& config);

    // tick_pixels / zoom_factor, guarding both against zero and non-finite input
    static double pixels_per_second(double tick_pixels, double zoom_factor, const LayoutConfig& config);
};

} // namespace tg::geometry
