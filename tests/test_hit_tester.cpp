#include <catch2/catch_test_macros.hpp>
#include "geometry/hit_tester.hpp"
#include "test_support.hpp"

#include <string>

using namespace tg::geometry;
using tg::PointF;
using tg::RectF;

namespace {

// Every region stacked over the same point (300, 100) so each case can peel
// the winner away and check who is next.
struct Stack {
    tg::timeline::Clip clip = tg::test::make_clip("clip", 0, 1, 1);
    tg::timeline::Transition tran = tg::test::make_transition("tran", 0, 1, 1);
    HitScene scene;

    Stack() {
        scene.content_left = 140.0;
        scene.ruler_height = 40.0;
        scene.items.push_back(ItemView{RectF{250, 50, 100, 100}, ItemRef{&clip}, false});
        scene.panels.push_back(PanelRegion{7, RectF{140, 60, 400, 80}, RectF{0, 60, 140, 48}});
        scene.h_scroll = RectF{280, 90, 50, 20};
        scene.v_scroll = RectF{290, 80, 20, 50};
        scene.timeline_handle = RectF{295, 50, 10, 100};
        scene.resize_handle = RectF{297, 48, 6, 100};
    }
};

const PointF kProbe{300, 100};

} // namespace

TEST_CASE("HitTester precedence walks down one region at a time", "[hit]") {
    Stack s;
    auto r = HitTester::hit(kProbe, s.scene);
    REQUIRE(r.region == HitRegion::Clip);
    REQUIRE(r.is_item());
    REQUIRE(id_of(*r.item) == "clip");

    s.scene.items.clear();
    r = HitTester::hit(kProbe, s.scene);
    REQUIRE(r.region == HitRegion::Panel);
    REQUIRE(r.track == 7);

    s.scene.panels.clear();
    REQUIRE(HitTester::hit(kProbe, s.scene).region == HitRegion::HScroll);

    s.scene.h_scroll = RectF{};
    REQUIRE(HitTester::hit(kProbe, s.scene).region == HitRegion::VScroll);

    s.scene.v_scroll = RectF{};
    REQUIRE(HitTester::hit(kProbe, s.scene).region == HitRegion::TimelineHandle);

    s.scene.timeline_handle = RectF{};
    REQUIRE(HitTester::hit(kProbe, s.scene).region == HitRegion::Handle);

    s.scene.resize_handle = RectF{};
    REQUIRE(HitTester::hit(kProbe, s.scene).region == HitRegion::Background);
    REQUIRE(HitTester::hit(PointF{300, 40}, s.scene).region == HitRegion::Ruler);
}

TEST_CASE("HitTester handles inside the ruler band beat the ruler", "[hit]") {
    Stack s;
    s.scene.items.clear();
    s.scene.panels.clear();
    s.scene.h_scroll = s.scene.v_scroll = RectF{};
    s.scene.timeline_handle = RectF{295, 10, 10, 100};
    s.scene.resize_handle = RectF{297, 20, 6, 100};
    const PointF in_ruler{300, 30};

    REQUIRE(HitTester::hit(in_ruler, s.scene).region == HitRegion::TimelineHandle);

    s.scene.timeline_handle = RectF{};
    REQUIRE(HitTester::hit(in_ruler, s.scene).region == HitRegion::Handle);

    s.scene.resize_handle = RectF{};
    REQUIRE(HitTester::hit(in_ruler, s.scene).region == HitRegion::Ruler);
}

TEST_CASE("HitTester first item in the list wins", "[hit]") {
    Stack s;
    s.scene.items.insert(s.scene.items.begin(), ItemView{RectF{280, 90, 40, 40}, ItemRef{&s.tran}, true});
    auto r = HitTester::hit(kProbe, s.scene);
    REQUIRE(r.region == HitRegion::Transition);
    REQUIRE(kind_of(*r.item) == ItemKind::Transition);
}

TEST_CASE("HitTester ignores items under the gutter and ruler", "[hit]") {
    Stack s;
    s.scene.items = {ItemView{RectF{0, 0, 1000, 1000}, ItemRef{&s.clip}, false}};
    s.scene.panels.clear();
    s.scene.h_scroll = s.scene.v_scroll = s.scene.timeline_handle = s.scene.resize_handle = RectF{};
    REQUIRE(HitTester::hit(PointF{100, 100}, s.scene).region == HitRegion::Background);
    REQUIRE(HitTester::hit(PointF{300, 20}, s.scene).region == HitRegion::Ruler);
    REQUIRE(HitTester::hit(PointF{300, 100}, s.scene).region == HitRegion::Clip);
}

TEST_CASE("HitTester panel includes the gutter strip of its row", "[hit]") {
    Stack s;
    s.scene.items.clear();
    auto r = HitTester::hit(PointF{20, 100}, s.scene);
    REQUIRE(r.region == HitRegion::Panel);
    REQUIRE(r.track == 7);
    // Outside the panel's vertical band
    REQUIRE(HitTester::hit(PointF{20, 150}, s.scene).region == HitRegion::Background);
}

TEST_CASE("HitRegion names", "[hit]") {
    REQUIRE(std::string(to_string(HitRegion::HScroll)) == "h-scroll");
    REQUIRE(std::string(to_string(HitRegion::TimelineHandle)) == "timeline-handle");
    REQUIRE(std::string(to_string(HitRegion::Background)) == "background");
}
