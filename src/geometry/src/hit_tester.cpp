#include "geometry/hit_tester.hpp"

namespace tg::geometry {

const char* to_string(HitRegion region) {
    switch (region) {
        case HitRegion::Clip: return "clip";
        case HitRegion::Transition: return "transition";
        case HitRegion::Panel: return "panel";
        case HitRegion::HScroll: return "h-scroll";
        case HitRegion::VScroll: return "v-scroll";
        case HitRegion::TimelineHandle: return "timeline-handle";
        case HitRegion::Handle: return "handle";
        case HitRegion::Ruler: return "ruler";
        case HitRegion::Background: return "background";
    }
    return "background";
}

HitResult HitTester::hit(const PointF& pos, const HitScene& scene) {
    HitResult result;

    if (pos.x >= scene.content_left && pos.y >= scene.ruler_height) {
        for (const auto& view : scene.items) {
            if (view.rect.contains(pos)) {
                result.region = view.kind() == ItemKind::Clip ? HitRegion::Clip : HitRegion::Transition;
                result.item = view.item;
                return result;
            }
        }
    }

    for (const auto& region : scene.panels) {
        if (region.panel.is_empty()) continue;
        // The panel row extends under the gutter so its label strip is part of it
        RectF combined{region.name.x, region.panel.y, region.name.w + region.panel.w, region.panel.h};
        if (region.panel.contains(pos) || combined.contains(pos)) {
            result.region = HitRegion::Panel;
            result.track = region.track;
            return result;
        }
    }

    if (scene.h_scroll.contains(pos)) {
        result.region = HitRegion::HScroll;
    } else if (scene.v_scroll.contains(pos)) {
        result.region = HitRegion::VScroll;
    } else if (scene.timeline_handle.contains(pos)) {
        result.region = HitRegion::TimelineHandle;
    } else if (scene.resize_handle.contains(pos)) {
        result.region = HitRegion::Handle;
    } else if (pos.y <= scene.ruler_height) {
        result.region = HitRegion::Ruler;
    }
    return result;
}

} // namespace tg::geometry
