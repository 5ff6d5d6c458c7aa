#include "geometry/marker_layout.hpp"

#include <algorithm>

namespace tg::geometry {

std::vector<MarkerGeometry> build_marker_geometry(const std::vector<const timeline::Marker*>& markers,
                                                  double pixels_per_second,
                                                  double content_height,
                                                  const LayoutConfig& config) {
    std::vector<MarkerGeometry> result;
    result.reserve(markers.size());

    const double top_margin = config.track_margin_top;
    const double line_height = std::max(0.0, content_height - top_margin);
    const double icon_w = config.marker_icon_width;
    const double icon_h = config.marker_icon_height;
    const double offset_x = -icon_w / 2.0;
    const double offset_y = config.marker_icon_offset_y;
    const double pad = config.marker_hit_padding;

    for (const timeline::Marker* marker : markers) {
        if (marker == nullptr) continue;
        MarkerGeometry geo;
        geo.marker = marker;
        geo.seconds = finite_or(marker->position, 0.0);
        const double mx = config.track_name_width + geo.seconds * pixels_per_second;
        geo.line_rect = RectF{mx, config.ruler_height + top_margin, 0.5, line_height};
        if (icon_w > 0.0 && icon_h > 0.0) {
            RectF icon{mx + offset_x, std::max(0.0, config.ruler_height - icon_h - offset_y), icon_w, icon_h};
            geo.icon_rect = icon;
            if (pad > 0.0) {
                geo.hit_rect = icon.adjusted(-pad, -pad, pad, pad);
            }
        }
        result.push_back(geo);
    }
    return result;
}

} // namespace tg::geometry
