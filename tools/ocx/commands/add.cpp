/**
 * ocx CLI - add command
 *
 * Resolve components and install them with their dependencies.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace ocx::cli::commands {

namespace {

struct AddOptions {
    std::vector<std::string> components;
    bool overwrite = false;
};

int cmd_add(const GlobalOptions& opts, const AddOptions& add_opts, bool ghost) {
    init_command(opts);

    auto project = open_target(opts, ghost);
    if (project.isErr()) {
        print_error(project.error(), opts.json);
        return 1;
    }

    InstallOptions options;
    options.overwrite = add_opts.overwrite;

    auto summary = project.value().add(add_opts.components, options);
    if (summary.isErr()) {
        print_error(summary.error(), opts.json);
        return 1;
    }

    print_install_summary(summary.value(), opts);
    return 0;
}

} // anonymous namespace

void setup_add(CLI::App* app, GlobalOptions& opts) {
    static AddOptions add_opts;

    app->add_option("components", add_opts.components, "[registry/]name[@constraint]")
        ->required();
    app->add_flag("--overwrite", add_opts.overwrite,
                  "Take over paths owned by other components or untracked files");

    app->callback([&opts]() {
        std::exit(cmd_add(opts, add_opts, false));
    });
}

void setup_ghost_add(CLI::App* app, GlobalOptions& opts) {
    static AddOptions add_opts;

    app->add_option("components", add_opts.components, "[registry/]name[@constraint]")
        ->required();
    app->add_flag("--overwrite", add_opts.overwrite,
                  "Take over paths owned by other components or untracked files");

    app->callback([&opts]() {
        std::exit(cmd_add(opts, add_opts, true));
    });
}

} // namespace ocx::cli::commands
