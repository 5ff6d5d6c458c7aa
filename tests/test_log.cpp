#include <catch2/catch_test_macros.hpp>
#include "core/log.hpp"
#include "test_support.hpp"

#include <stdexcept>
#include <string>

TEST_CASE("log sink receives messages at or above level", "[log]") {
    tg::test::LogCapture capture;
    tg::log::set_level(tg::log::Level::Warn);
    tg::log::info("dropped");
    tg::log::warn("kept warn");
    tg::log::error("kept error");
    REQUIRE(capture.lines().size() == 2);
    REQUIRE(capture.lines()[0].level == tg::log::Level::Warn);
    REQUIRE(capture.lines()[0].msg == "kept warn");
    REQUIRE(capture.lines()[1].level == tg::log::Level::Error);
}

TEST_CASE("log level can be lowered to trace", "[log]") {
    tg::test::LogCapture capture;
    tg::log::set_level(tg::log::Level::Trace);
    REQUIRE(tg::log::level() == tg::log::Level::Trace);
    tg::log::trace("t");
    tg::log::debug("d");
    REQUIRE(capture.lines().size() == 2);
}

TEST_CASE("throwing sink does not escape write", "[log]") {
    tg::test::LogCapture capture;
    tg::log::set_sink([](tg::log::Level, const std::string&) { throw std::runtime_error("sink failure"); });
    REQUIRE_NOTHROW(tg::log::critical("boom"));
}

TEST_CASE("level names", "[log]") {
    REQUIRE(std::string(tg::log::level_name(tg::log::Level::Warn)) == "warn");
    REQUIRE(std::string(tg::log::level_name(tg::log::Level::Critical)) == "critical");
}
