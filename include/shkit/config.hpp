#pragma once

#include "shkit/export.hpp"

#include <optional>
#include <string>
#include <vector>

namespace shkit {

// ============================================================================
// Configuration
// ============================================================================

struct Config {
    std::string test_root_base;      // empty: system temp directory
    bool keep_test_root = false;     // leave test roots behind for inspection
    std::string log_level = "warn";
    int skip_callers = 2;            // default for the CLI validate commands

    // Source path for diagnostics, empty for built-in defaults
    std::string source_path;
};

struct ConfigParseResult {
    bool ok = false;
    std::string error;
    Config config;
    std::vector<std::string> warnings;
};

/**
 * Parse a JSON configuration object:
 *
 *   {
 *     "test_root_base": "/tmp/shkit",
 *     "keep_test_root": false,
 *     "log_level": "debug",
 *     "skip_callers": 2
 *   }
 *
 * All keys are optional. Unknown keys are reported as warnings; wrong
 * types and skip_callers < 1 are errors.
 */
SHKIT_API ConfigParseResult parse_config(const std::string& json_str,
                                         const std::string& source_path = "");

/**
 * Load configuration.
 * Priority: environment overrides > config file > defaults.
 * The file is path when given, else $SHKIT_CONFIG, else none.
 *
 * Environment overrides:
 *   SHKIT_TMPDIR           test_root_base
 *   SHKIT_KEEP_TEST_ROOT   keep_test_root ("1" or "true")
 *   SHKIT_LOG_LEVEL        log_level
 */
SHKIT_API ConfigParseResult load_config(const std::optional<std::string>& path = std::nullopt);

} // namespace shkit
