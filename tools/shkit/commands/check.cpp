/**
 * shkit CLI - check command
 *
 * Report both predicates for a value. Never fatal.
 */

#include "../common.hpp"
#include <shkit/validation.hpp>
#include <CLI/CLI.hpp>
#include <cstdlib>

namespace shkit::cli::commands {

namespace {

struct CheckOptions {
    std::string value;
    bool identifier = false;  // also require a valid identifier
};

int cmd_check(const GlobalOptions& opts, const CheckOptions& c) {
    if (!load_runtime_config(opts)) {
        return 1;
    }

    auto offset = find_unescaped_metacharacter(c.value);
    auto id_error = classify_identifier(c.value);

    bool ok = !offset && (!c.identifier || id_error == IdentifierError::None);

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = ok;
        j["value"] = c.value;
        j["input_safe"] = !offset.has_value();
        j["offset"] = offset ? nlohmann::json(*offset) : nlohmann::json(nullptr);
        j["identifier_valid"] = id_error == IdentifierError::None;
        j["reason"] = identifier_error_reason(id_error);
        output_json(j);
    } else if (!opts.quiet) {
        if (offset) {
            std::cout << "input: unsafe (offset " << *offset << ")" << std::endl;
        } else {
            std::cout << "input: safe" << std::endl;
        }
        if (id_error == IdentifierError::None) {
            std::cout << "identifier: valid" << std::endl;
        } else {
            std::cout << "identifier: invalid (" << identifier_error_reason(id_error) << ")"
                      << std::endl;
        }
    }

    return ok ? 0 : 1;
}

} // anonymous namespace

void setup_check(CLI::App* app, GlobalOptions& opts) {
    static CheckOptions c;

    app->add_option("value", c.value, "Value to classify")->required();
    app->add_flag("--identifier", c.identifier, "Also require a valid identifier");

    app->callback([&opts]() {
        std::exit(cmd_check(opts, c));
    });
}

} // namespace shkit::cli::commands
