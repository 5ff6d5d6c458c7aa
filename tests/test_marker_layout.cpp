#include <catch2/catch_test_macros.hpp>
#include "geometry/marker_layout.hpp"

#include <limits>

using namespace tg::geometry;
using tg::timeline::Marker;

TEST_CASE("Marker line spans the content below the ruler", "[markers]") {
    Marker m{"m1", 2.0, "cue"};
    LayoutConfig cfg;
    auto geo = build_marker_geometry({&m}, 100.0, 208.0, cfg);
    REQUIRE(geo.size() == 1);
    REQUIRE(geo[0].marker == &m);
    REQUIRE(geo[0].seconds == 2.0);
    REQUIRE(geo[0].line_rect == tg::RectF{340.0, 48.0, 0.5, 200.0});
}

TEST_CASE("Marker icon sits at the ruler bottom", "[markers]") {
    Marker m{"m1", 1.0, ""};
    LayoutConfig cfg;
    auto geo = build_marker_geometry({&m}, 50.0, 100.0, cfg);
    REQUIRE(geo[0].icon_rect.has_value());
    // x = 140 + 50 - 8/2, y = 40 - 10 + 6
    REQUIRE(*geo[0].icon_rect == tg::RectF{186.0, 36.0, 8.0, 10.0});
    REQUIRE_FALSE(geo[0].hit_rect.has_value());
    REQUIRE(geo[0].pick_rect() == geo[0].icon_rect);
}

TEST_CASE("Marker hit rect grows by padding", "[markers]") {
    Marker m{"m1", 0.0, ""};
    LayoutConfig cfg;
    cfg.marker_hit_padding = 3.0;
    auto geo = build_marker_geometry({&m}, 100.0, 100.0, cfg);
    REQUIRE(geo[0].hit_rect.has_value());
    REQUIRE(*geo[0].hit_rect == tg::RectF{133.0, 33.0, 14.0, 16.0});
    REQUIRE(geo[0].pick_rect() == geo[0].hit_rect);
}

TEST_CASE("Marker without icon size and non-finite position", "[markers]") {
    Marker m{"m1", std::numeric_limits<double>::quiet_NaN(), ""};
    LayoutConfig cfg;
    cfg.marker_icon_width = 0.0;
    auto geo = build_marker_geometry({&m, nullptr}, 100.0, 100.0, cfg);
    REQUIRE(geo.size() == 1);
    REQUIRE(geo[0].seconds == 0.0);
    REQUIRE(geo[0].line_rect.x == 140.0);
    REQUIRE_FALSE(geo[0].icon_rect.has_value());
    REQUIRE_FALSE(geo[0].pick_rect().has_value());
}
