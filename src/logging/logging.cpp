#include "shkit/logging.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace shkit {

namespace {

constexpr const char* kLoggerName = "shkit";

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    static std::once_flag once;
    static std::shared_ptr<spdlog::logger> instance;
    std::call_once(once, [] {
        instance = spdlog::get(kLoggerName);
        if (!instance) {
            instance = spdlog::stderr_color_mt(kLoggerName);
            instance->set_pattern("[%n] [%l] %v");
            instance->set_level(spdlog::level::warn);
        }
    });
    return instance;
}

bool set_log_level(const std::string& level) {
    auto parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to off; only accept off when asked for.
    if (parsed == spdlog::level::off && level != "off") {
        return false;
    }
    logger()->set_level(parsed);
    return true;
}

} // namespace shkit
