/**
 * ocx CLI - Entry Point
 *
 * Installs versioned components from registries into a project, and runs
 * tools against foreign repositories through ghost mode.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace ocx::cli::commands {
    void setup_init(CLI::App* app, GlobalOptions& opts);
    void setup_add(CLI::App* app, GlobalOptions& opts);
    void setup_update(CLI::App* app, GlobalOptions& opts);
    void setup_diff(CLI::App* app, GlobalOptions& opts);
    void setup_registry(CLI::App* app, GlobalOptions& opts, bool ghost);
    void setup_search(CLI::App* app, GlobalOptions& opts);
    void setup_ghost(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace ocx::cli;

    CLI::App app{"ocx - component manager with ghost mode"};
    app.set_version_flag("-V,--version", OCX_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--cwd", opts.cwd, "Project directory (default: current)");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");
    app.add_option("--profile", opts.profile, "Ghost profile to use for this invocation");

    // Commands
    auto* init_cmd = app.add_subcommand("init", "Create ocx.json in the project");
    commands::setup_init(init_cmd, opts);

    auto* add_cmd = app.add_subcommand("add", "Install components and their dependencies");
    commands::setup_add(add_cmd, opts);

    auto* update_cmd = app.add_subcommand("update", "Move installed components to newer releases");
    commands::setup_update(update_cmd, opts);

    auto* diff_cmd = app.add_subcommand("diff", "Report drift against the lockfile");
    commands::setup_diff(diff_cmd, opts);

    auto* registry_cmd = app.add_subcommand("registry", "Manage the project's registries");
    commands::setup_registry(registry_cmd, opts, false);

    auto* search_cmd = app.add_subcommand("search", "Search registries or installed components");
    commands::setup_search(search_cmd, opts);

    auto* ghost_cmd = app.add_subcommand("ghost", "Use your own components in any repository");
    commands::setup_ghost(ghost_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
