/**
 * shkit CLI - join command
 */

#include "../common.hpp"
#include <shkit/call_stack.hpp>
#include <shkit/output.hpp>
#include <CLI/CLI.hpp>
#include <cstdlib>

namespace shkit::cli::commands {

namespace {

struct JoinOptions {
    std::string delimiter;
    std::vector<std::string> items;
    std::string export_name;  // --export
};

int cmd_join(const GlobalOptions& opts, const JoinOptions& j) {
    SHKIT_FRAME();
    if (!load_runtime_config(opts)) {
        return 1;
    }

    std::string joined;
    if (!j.export_name.empty()) {
        SHKIT_HERE();
        joined = join_into_env(j.export_name, j.delimiter, j.items);
    } else {
        joined = join(j.delimiter, j.items);
    }

    if (opts.json) {
        nlohmann::json out;
        out["ok"] = true;
        out["result"] = joined;
        if (!j.export_name.empty()) {
            out["exported"] = j.export_name;
        }
        output_json(out);
    } else if (!j.export_name.empty()) {
        std::cout << j.export_name << "=" << joined << std::endl;
    } else {
        std::cout << joined << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_join(CLI::App* app, GlobalOptions& opts) {
    static JoinOptions j;

    app->add_option("delimiter", j.delimiter, "Delimiter placed between items")->required();
    app->add_option("items", j.items, "Items to join");
    app->add_option("--export", j.export_name, "Also export the result under this variable name");

    app->callback([&opts]() {
        std::exit(cmd_join(opts, j));
    });
}

} // namespace shkit::cli::commands
