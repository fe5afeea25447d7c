/**
 * ocx CLI - update command
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace ocx::cli::commands {

namespace {

struct UpdateOptions {
    std::vector<std::string> components;
    std::string version;
};

int cmd_update(const GlobalOptions& opts, const UpdateOptions& update_opts) {
    init_command(opts);

    auto project = open_target(opts, false);
    if (project.isErr()) {
        print_error(project.error(), opts.json);
        return 1;
    }

    auto summary = project.value().update(update_opts.components, update_opts.version);
    if (summary.isErr()) {
        print_error(summary.error(), opts.json);
        return 1;
    }

    print_install_summary(summary.value(), opts);
    return 0;
}

} // anonymous namespace

void setup_update(CLI::App* app, GlobalOptions& opts) {
    static UpdateOptions update_opts;

    app->add_option("components", update_opts.components,
                    "Installed components to update (default: all)");
    app->add_option("--version", update_opts.version, "Version constraint to update to");

    app->callback([&opts]() {
        std::exit(cmd_update(opts, update_opts));
    });
}

} // namespace ocx::cli::commands
