#pragma once
#include "core/rect.hpp"
#include "geometry/layout_config.hpp"
#include "timeline/project.hpp"

#include <optional>
#include <vector>

namespace tg::geometry {

struct MarkerGeometry {
    const timeline::Marker* marker = nullptr;
    double seconds = 0.0;
    RectF line_rect;                // hairline through the content area
    std::optional<RectF> icon_rect; // in the ruler
    std::optional<RectF> hit_rect;  // icon grown by the hit padding

    // Rect used for pointer hits: padded when padding is configured
    std::optional<RectF> pick_rect() const { return hit_rect ? hit_rect : icon_rect; }
};

// Markers are few, so they are kept as a plain list rebuilt with everything else.
std::vector<MarkerGeometry> build_marker_geometry(const std::vector<const timeline::Marker*>& markers,
                                                  double pixels_per_second,
                                                  double content_height,
                                                  const LayoutConfig& config);

} // namespace tg::geometry
