#pragma once
#include <string>
#include <functional>

namespace tg::log {

enum class Level { Trace, Debug, Info, Warn, Error, Critical };

using SinkFn = std::function<void(Level, const std::string&)>;

// Replace the default spdlog emitter (tests capture warnings this way).
// Passing an empty function restores the default.
void set_sink(SinkFn sink) noexcept;

// Messages below this level are dropped before reaching any sink.
void set_level(Level lvl) noexcept;
Level level() noexcept;

void write(Level lvl, const std::string& msg) noexcept;

void trace(const std::string& msg) noexcept;
void debug(const std::string& msg) noexcept;
void info(const std::string& msg) noexcept;
void warn(const std::string& msg) noexcept;
void error(const std::string& msg) noexcept;
void critical(const std::string& msg) noexcept;

const char* level_name(Level lvl) noexcept;

} // namespace tg::log
