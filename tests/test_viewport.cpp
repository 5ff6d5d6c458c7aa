#include <catch2/catch_test_macros.hpp>
#include "geometry/viewport.hpp"

#include <cmath>
#include <random>

using namespace tg::geometry;

static inline bool tg_approx(double a, double b, double eps = 1e-9) {
    return std::fabs(a - b) <= eps;
}

TEST_CASE("ScrollModel content smaller than view shows everything", "[viewport]") {
    ScrollModel m;
    m.set_start(0.7);
    REQUIRE(m.update(300.0, 500.0) == 0.0);
    REQUIRE(m.start() == 0.0);
    REQUIRE(m.end() == 1.0);
    REQUIRE_FALSE(m.scrollable());
    REQUIRE_FALSE(m.handle(20.0).visible);
}

TEST_CASE("ScrollModel zero content is fully visible", "[viewport]") {
    ScrollModel m;
    m.update(0.0, 0.0);
    REQUIRE(m.ratio() == 1.0);
    REQUIRE(m.offset() == 0.0);
}

TEST_CASE("ScrollModel clamps the start fraction", "[viewport]") {
    ScrollModel m;
    m.set_start(0.9);
    double offset = m.update(1000.0, 250.0);
    REQUIRE(tg_approx(m.start(), 0.75));
    REQUIRE(tg_approx(m.end(), 1.0));
    REQUIRE(tg_approx(offset, 750.0));
    REQUIRE(tg_approx(m.max_offset(), 750.0));

    m.set_start(-5.0);
    m.update(1000.0, 250.0);
    REQUIRE(m.start() == 0.0);
    REQUIRE(tg_approx(m.end(), 0.25));
}

TEST_CASE("ScrollModel pin_end sticks to the right edge", "[viewport]") {
    ScrollModel m;
    m.update(1000.0, 250.0, true);
    REQUIRE(tg_approx(m.offset(), 750.0));
    m.update(2000.0, 250.0, true);
    REQUIRE(tg_approx(m.offset(), 1750.0));
    REQUIRE(tg_approx(m.end(), 1.0));
}

TEST_CASE("ScrollModel window stays within bounds for any input", "[viewport]") {
    std::mt19937 rng(42);
    std::uniform_real_distribution<double> size(0.0, 10000.0);
    std::uniform_real_distribution<double> frac(-0.5, 1.5);
    ScrollModel m;
    for (int i = 0; i < 500; ++i) {
        m.set_start(frac(rng));
        const double content = size(rng);
        const double view = size(rng);
        m.update(content, view, i % 7 == 0);
        REQUIRE(m.start() >= 0.0);
        REQUIRE(m.start() <= m.end());
        REQUIRE(m.end() <= 1.0);
        REQUIRE(m.offset() >= 0.0);
        REQUIRE(m.offset() <= m.max_offset() + 1e-9);
        if (content > view && content > 0.0) {
            REQUIRE(tg_approx(m.end() - m.start(), view / content, 1e-9));
        }
    }
}

TEST_CASE("ScrollModel handle respects minimum length", "[viewport]") {
    ScrollModel m;
    m.update(100000.0, 200.0);
    auto h = m.handle(20.0);
    REQUIRE(h.visible);
    REQUIRE(h.length == 20.0);
    REQUIRE(h.pos == 0.0);

    m.set_start(1.0);
    m.update(100000.0, 200.0);
    h = m.handle(20.0);
    REQUIRE(tg_approx(h.pos + h.length, 200.0));
}

TEST_CASE("ViewportSynchronizer places handle rects on the frame", "[viewport]") {
    ViewportSynchronizer sync;
    ScrollbarFrame frame;
    frame.track_left = 140.0;
    frame.h_bar_top = 588.0;
    frame.track_top = 40.0;
    frame.v_bar_left = 788.0;
    frame.thickness = 12.0;
    frame.min_handle = 20.0;
    sync.set_frame(frame);

    sync.update_horizontal(1296.0, 648.0);
    sync.update_vertical(200.0, 548.0);
    const auto& h = sync.h_handle_rect();
    REQUIRE(h.x == 140.0);
    REQUIRE(h.y == 588.0);
    REQUIRE(tg_approx(h.w, 324.0));
    REQUIRE(h.h == 12.0);
    REQUIRE(sync.v_handle_rect().is_empty());

    auto m = sync.metrics();
    REQUIRE(m.view_w == 648.0);
    REQUIRE(m.timeline_w == 1296.0);
    REQUIRE(m.content_h == 548.0);
}

TEST_CASE("ViewportSynchronizer keep_right follows growing content", "[viewport]") {
    ViewportSynchronizer sync;
    sync.update_horizontal(1000.0, 400.0);
    REQUIRE_FALSE(sync.is_right_aligned());

    sync.set_keep_right(true);
    sync.update_horizontal(1000.0, 400.0);
    REQUIRE(sync.is_right_aligned());
    REQUIRE(tg_approx(sync.metrics().h_offset, 600.0));

    sync.update_horizontal(3000.0, 400.0);
    REQUIRE(sync.is_right_aligned());
    REQUIRE(tg_approx(sync.metrics().h_offset, 2600.0));

    sync.set_keep_right(false);
    sync.scroll_horizontal_to(0.0);
    sync.update_horizontal(3000.0, 400.0);
    REQUIRE_FALSE(sync.is_right_aligned());
}

TEST_CASE("ViewportSynchronizer content narrower than view is right aligned", "[viewport]") {
    ViewportSynchronizer sync;
    sync.update_horizontal(300.0, 400.0);
    REQUIRE(sync.is_right_aligned());
}
