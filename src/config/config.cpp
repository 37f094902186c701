#include "shkit/config.hpp"
#include "shkit/logging.hpp"
#include "shkit/platform.hpp"

#include <algorithm>
#include <cctype>

#include <nlohmann/json.hpp>

namespace shkit {

namespace {

const char* const kKnownKeys[] = {
    "test_root_base", "keep_test_root", "log_level", "skip_callers",
};

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool is_known_key(const std::string& key) {
    return std::find(std::begin(kKnownKeys), std::end(kKnownKeys), key) != std::end(kKnownKeys);
}

bool is_truthy(const std::string& value) {
    auto lower = to_lower(value);
    return lower == "1" || lower == "true";
}

void apply_env_overrides(Config& config) {
    if (auto base = get_env("SHKIT_TMPDIR"); base && !base->empty()) {
        config.test_root_base = *base;
    }
    if (auto keep = get_env("SHKIT_KEEP_TEST_ROOT")) {
        config.keep_test_root = is_truthy(*keep);
    }
    if (auto level = get_env("SHKIT_LOG_LEVEL"); level && !level->empty()) {
        config.log_level = to_lower(*level);
    }
}

} // namespace

ConfigParseResult parse_config(const std::string& json_str, const std::string& source_path) {
    ConfigParseResult result;
    result.config.source_path = source_path;

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_str);
    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("JSON parse error: ") + e.what();
        return result;
    }

    if (!j.is_object()) {
        result.error = "JSON must be an object";
        return result;
    }

    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!is_known_key(it.key())) {
            result.warnings.push_back("unknown key: " + it.key());
        }
    }

    if (j.contains("test_root_base")) {
        if (!j["test_root_base"].is_string()) {
            result.error = "test_root_base must be a string";
            return result;
        }
        result.config.test_root_base = j["test_root_base"].get<std::string>();
    }

    if (j.contains("keep_test_root")) {
        if (!j["keep_test_root"].is_boolean()) {
            result.error = "keep_test_root must be a boolean";
            return result;
        }
        result.config.keep_test_root = j["keep_test_root"].get<bool>();
    }

    if (j.contains("log_level")) {
        if (!j["log_level"].is_string()) {
            result.error = "log_level must be a string";
            return result;
        }
        result.config.log_level = to_lower(j["log_level"].get<std::string>());
    }

    if (j.contains("skip_callers")) {
        if (!j["skip_callers"].is_number_integer()) {
            result.error = "skip_callers must be an integer";
            return result;
        }
        auto skip = j["skip_callers"].get<long long>();
        if (skip < 1 || skip > 1024) {
            result.error = "skip_callers must be between 1 and 1024";
            return result;
        }
        result.config.skip_callers = static_cast<int>(skip);
    }

    result.ok = true;
    return result;
}

ConfigParseResult load_config(const std::optional<std::string>& path) {
    std::optional<std::string> config_path = path;
    if (!config_path || config_path->empty()) {
        config_path = get_env("SHKIT_CONFIG");
    }

    ConfigParseResult result;
    if (config_path && !config_path->empty()) {
        auto content = read_file(*config_path);
        if (!content) {
            result.error = "cannot read config file: " + *config_path;
            return result;
        }
        result = parse_config(*content, *config_path);
        if (!result.ok) {
            return result;
        }
        for (const auto& warning : result.warnings) {
            logger()->debug("{}: {}", *config_path, warning);
        }
    } else {
        result.ok = true;
    }

    apply_env_overrides(result.config);
    return result;
}

} // namespace shkit
