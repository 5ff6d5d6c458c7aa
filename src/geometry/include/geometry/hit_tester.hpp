#pragma once
#include "core/rect.hpp"
#include "geometry/geometry_entry.hpp"

#include <optional>
#include <vector>

namespace tg::geometry {

enum class HitRegion {
    Clip,
    Transition,
    Panel,
    HScroll,
    VScroll,
    TimelineHandle,  // project duration handle at the content's right edge
    Handle,          // name gutter / content separator
    Ruler,
    Background
};

const char* to_string(HitRegion region);

struct HitResult {
    HitRegion region = HitRegion::Background;
    std::optional<ItemRef> item;                  // Clip / Transition hits
    std::optional<timeline::TrackNumber> track;   // Panel hits

    bool is_item() const { return region == HitRegion::Clip || region == HitRegion::Transition; }
};

struct PanelRegion {
    timeline::TrackNumber track = 0;
    RectF panel;  // viewport coords
    RectF name;   // gutter strip for the same track row
};

// Everything under the pointer, already in viewport coordinates
struct HitScene {
    double content_left = 0.0;  // right edge of the name gutter
    double ruler_height = 0.0;  // bottom edge of the ruler
    std::vector<ItemView> items; // topmost first (reverse paint order)
    std::vector<PanelRegion> panels;
    RectF h_scroll;
    RectF v_scroll;
    RectF timeline_handle;
    RectF resize_handle;
};

/**
 * @brief Resolves a point to exactly one region.
 *
 * Regions overlap on screen, so the order is fixed: items inside the content
 * area, track panels, horizontal then vertical scrollbar, project duration
 * handle, gutter resize handle, ruler, background. First match wins.
 */
class HitTester {
public:
    static HitResult hit(const PointF& pos, const HitScene& scene);
};

} // namespace tg::geometry
