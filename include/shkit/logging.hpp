#pragma once

#include "shkit/export.hpp"

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace shkit {

// Library logger "shkit", writing to stderr. Created on first use at
// level warn.
SHKIT_API std::shared_ptr<spdlog::logger> logger();

// Accepts trace, debug, info, warn, error, critical and off.
// Returns false and leaves the level unchanged for anything else.
SHKIT_API bool set_log_level(const std::string& level);

} // namespace shkit
