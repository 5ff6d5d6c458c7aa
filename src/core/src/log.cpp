#include "core/log.hpp"
#include <atomic>
#include <cstdio>
#include <exception>
#include <mutex>

#include <spdlog/spdlog.h>

namespace tg::log {

static SinkFn g_sink;
static std::mutex g_mutex;
static std::atomic<int> g_level{static_cast<int>(Level::Info)};

const char* level_name(Level lvl) noexcept {
    switch(lvl) {
        case Level::Trace: return "trace";
        case Level::Debug: return "debug";
        case Level::Info: return "info";
        case Level::Warn: return "warn";
        case Level::Error: return "error";
        case Level::Critical: return "critical";
    }
    return "unknown";
}

void set_sink(SinkFn sink) noexcept {
    std::scoped_lock lock(g_mutex);
    g_sink = std::move(sink);
}

void set_level(Level lvl) noexcept {
    g_level.store(static_cast<int>(lvl), std::memory_order_relaxed);
    // Keep spdlog's own filter at least as permissive as ours
    switch(lvl) {
        case Level::Trace: spdlog::set_level(spdlog::level::trace); break;
        case Level::Debug: spdlog::set_level(spdlog::level::debug); break;
        default: spdlog::set_level(spdlog::level::info); break;
    }
}

Level level() noexcept { return static_cast<Level>(g_level.load(std::memory_order_relaxed)); }

static void default_emit(Level lvl, const std::string& msg) {
    switch(lvl) {
        case Level::Trace: spdlog::trace("[geometry] {}", msg); break;
        case Level::Debug: spdlog::debug("[geometry] {}", msg); break;
        case Level::Info: spdlog::info("[geometry] {}", msg); break;
        case Level::Warn: spdlog::warn("[geometry] {}", msg); break;
        case Level::Error: spdlog::error("[geometry] {}", msg); break;
        case Level::Critical: spdlog::critical("[geometry] {}", msg); break;
    }
}

void write(Level lvl, const std::string& msg) noexcept {
    if(static_cast<int>(lvl) < g_level.load(std::memory_order_relaxed)) return;
    std::scoped_lock lock(g_mutex);
    try {
        if(g_sink) { g_sink(lvl, msg); return; }
        default_emit(lvl, msg);
    } catch(const std::exception& e) {
        // A failing sink must not take the UI thread down with it
        std::fputs(e.what(), stderr);
        std::fputc('\n', stderr);
    }
}

void trace(const std::string& msg) noexcept { write(Level::Trace, msg); }
void debug(const std::string& msg) noexcept { write(Level::Debug, msg); }
void info(const std::string& msg) noexcept { write(Level::Info, msg); }
void warn(const std::string& msg) noexcept { write(Level::Warn, msg); }
void error(const std::string& msg) noexcept { write(Level::Error, msg); }
void critical(const std::string& msg) noexcept { write(Level::Critical, msg); }

} // namespace tg::log
