#pragma once
#include <string>

// Compile-time switches for verbose logging.
// Define TG_GEOMETRY_DEBUG (e.g. via -DTG_GEOMETRY_DEBUG) to trace every rebuild step.

namespace tg { namespace log { void debug(const std::string&) noexcept; } }

#if defined(TG_GEOMETRY_DEBUG)
  #define TG_GEOM_DEBUG(msg) ::tg::log::debug(msg)
#else
  #define TG_GEOM_DEBUG(msg) do {} while(0)
#endif
