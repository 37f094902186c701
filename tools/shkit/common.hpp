/**
 * shkit CLI - Common utilities and types
 */

#pragma once

#include <shkit/config.hpp>
#include <shkit/logging.hpp>

#include <nlohmann/json.hpp>

#include <iostream>
#include <optional>
#include <string>

namespace shkit::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string config_path;       // --config
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void print_warning(const std::string& msg, const GlobalOptions& opts) {
    if (!opts.json && !opts.quiet) {
        std::cerr << "Warning: " << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    std::cout << j.dump(2) << std::endl;
}

/**
 * Load configuration and apply its log level.
 * Priority for the level: --verbose > config/environment.
 */
inline std::optional<Config> load_runtime_config(const GlobalOptions& opts) {
    auto result = load_config(opts.config_path.empty()
                                  ? std::nullopt
                                  : std::make_optional(opts.config_path));
    if (!result.ok) {
        print_error(result.error, opts.json);
        return std::nullopt;
    }

    for (const auto& warning : result.warnings) {
        print_warning(warning, opts);
    }

    std::string level = opts.verbose ? "debug" : result.config.log_level;
    if (!set_log_level(level)) {
        print_warning("unknown log level: " + level, opts);
    }
    return result.config;
}

} // namespace shkit::cli
