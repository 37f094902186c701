/**
 * shkit CLI - Entry Point
 *
 * Shell test kit command-line interface.
 */

#include <CLI/CLI.hpp>
#include <shkit/call_stack.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace shkit::cli::commands {
    void setup_validate_input(CLI::App* app, GlobalOptions& opts);
    void setup_validate_identifier(CLI::App* app, GlobalOptions& opts);
    void setup_check(CLI::App* app, GlobalOptions& opts);
    void setup_join(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    SHKIT_FRAME();
    using namespace shkit::cli;

    if (argc > 0) {
        shkit::set_program_path(argv[0]);
    }

    CLI::App app{"shkit - shell test kit"};
    app.set_version_flag("-V,--version", SHKIT_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--config", opts.config_path, "JSON configuration file");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Debug logging");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");

    // Commands
    auto* validate_input_cmd = app.add_subcommand(
        "validate-input", "Fail unless a value is safe for dynamic evaluation");
    commands::setup_validate_input(validate_input_cmd, opts);

    auto* validate_identifier_cmd = app.add_subcommand(
        "validate-identifier", "Fail unless a value is a valid identifier");
    commands::setup_validate_identifier(validate_identifier_cmd, opts);

    auto* check_cmd = app.add_subcommand("check", "Classify a value without failing fatally");
    commands::setup_check(check_cmd, opts);

    auto* join_cmd = app.add_subcommand("join", "Join items with a delimiter");
    commands::setup_join(join_cmd, opts);

    SHKIT_HERE();
    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
