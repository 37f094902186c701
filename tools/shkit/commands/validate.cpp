/**
 * shkit CLI - validate-input and validate-identifier commands
 *
 * Exit silently with 0 when the value passes; otherwise the fatal report
 * goes to stderr and the process exits with 1.
 */

#include "../common.hpp"
#include <shkit/call_stack.hpp>
#include <shkit/diagnostics.hpp>
#include <CLI/CLI.hpp>
#include <cstdlib>

namespace shkit::cli::commands {

namespace {

struct ValidateOptions {
    std::string description;
    std::string value;
    int skip_callers = 0;  // 0: take the configured default
};

int resolve_skip_callers(const ValidateOptions& v, const Config& config) {
    return v.skip_callers > 0 ? v.skip_callers : config.skip_callers;
}

int cmd_validate_input(const GlobalOptions& opts, const ValidateOptions& v) {
    SHKIT_FRAME();
    auto config = load_runtime_config(opts);
    if (!config) {
        return 1;
    }

    SHKIT_HERE();
    validate_input_or_die(v.description, v.value, resolve_skip_callers(v, *config));

    if (opts.json) {
        output_json({{"ok", true}, {"value", v.value}});
    }
    return 0;
}

int cmd_validate_identifier(const GlobalOptions& opts, const ValidateOptions& v) {
    SHKIT_FRAME();
    auto config = load_runtime_config(opts);
    if (!config) {
        return 1;
    }

    SHKIT_HERE();
    validate_identifier_or_die(v.description, v.value, resolve_skip_callers(v, *config));

    if (opts.json) {
        output_json({{"ok", true}, {"value", v.value}});
    }
    return 0;
}

void add_validate_options(CLI::App* app, ValidateOptions& v) {
    app->add_option("description", v.description, "What the value represents")->required();
    app->add_option("value", v.value, "Value to validate")->required();
    app->add_option("--skip-callers", v.skip_callers,
                    "Innermost frames to omit from the trace (default from config: 2)")
        ->check(CLI::Range(1, 1024));
}

} // anonymous namespace

void setup_validate_input(CLI::App* app, GlobalOptions& opts) {
    static ValidateOptions v;
    add_validate_options(app, v);

    app->callback([&opts]() {
        std::exit(cmd_validate_input(opts, v));
    });
}

void setup_validate_identifier(CLI::App* app, GlobalOptions& opts) {
    static ValidateOptions v;
    add_validate_options(app, v);

    app->callback([&opts]() {
        std::exit(cmd_validate_identifier(opts, v));
    });
}

} // namespace shkit::cli::commands
