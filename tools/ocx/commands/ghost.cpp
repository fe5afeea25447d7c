/**
 * ocx CLI - ghost command
 *
 * Ghost mode: keep components in a profile under the ocx home and use them
 * in repositories that carry no ocx configuration of their own.
 */

#include "../common.hpp"
#include <ocx/overlay.hpp>
#include <CLI/CLI.hpp>

namespace ocx::cli::commands {

void setup_registry(CLI::App* app, GlobalOptions& opts, bool ghost);
void setup_ghost_add(CLI::App* app, GlobalOptions& opts);

namespace {

nlohmann::json profile_to_json(const Profile& profile) {
    nlohmann::json j;
    j["name"] = profile.name;
    j["path"] = profile.directory;
    j["componentPath"] = profile.config.component_path;
    j["include"] = profile.config.include;
    j["exclude"] = profile.config.exclude;
    j["maxFiles"] = profile.config.max_files;
    j["registries"] = nlohmann::json::array();
    for (const auto& r : profile.config.registries) {
        j["registries"].push_back(r.name);
    }
    return j;
}

int cmd_ghost_init(const GlobalOptions& opts) {
    init_command(opts);

    auto store = open_profile_store();
    if (store.isErr()) {
        print_error(store.error(), opts.json);
        return 1;
    }

    auto profile = store.value().current(profile_selection(opts));
    if (profile.isErr()) {
        print_error(profile.error(), opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["home"] = store.value().home();
        j["profile"] = profile.value().name;
        output_json(j);
    } else {
        print_success("Ghost mode ready in " + store.value().home(), opts);
        print_success("Current profile: " + profile.value().name, opts);
    }
    return 0;
}

int cmd_profile_create(const GlobalOptions& opts, const std::string& name,
                       const std::string& from) {
    init_command(opts);

    auto store = open_profile_store();
    if (store.isErr()) {
        print_error(store.error(), opts.json);
        return 1;
    }

    std::optional<std::string> clone_from;
    if (!from.empty()) clone_from = from;

    auto profile = store.value().create(name, clone_from);
    if (profile.isErr()) {
        print_error(profile.error(), opts.json);
        return 1;
    }

    if (opts.json) {
        auto j = profile_to_json(profile.value());
        j["ok"] = true;
        output_json(j);
    } else {
        print_success("Created profile " + name +
                          (clone_from ? " (from " + *clone_from + ")" : ""),
                      opts);
    }
    return 0;
}

int cmd_profile_use(const GlobalOptions& opts, const std::string& name) {
    init_command(opts);

    auto store = open_profile_store();
    if (store.isErr()) {
        print_error(store.error(), opts.json);
        return 1;
    }

    auto used = store.value().use(name);
    if (used.isErr()) {
        print_error(used.error(), opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["profile"] = name;
        output_json(j);
    } else {
        print_success("Using profile " + name, opts);
    }
    return 0;
}

int cmd_profile_list(const GlobalOptions& opts) {
    init_command(opts);

    auto store = open_profile_store();
    if (store.isErr()) {
        print_error(store.error(), opts.json);
        return 1;
    }

    auto names = store.value().list();
    auto active = store.value().current(profile_selection(opts));
    if (active.isErr()) {
        print_error(active.error(), opts.json);
        return 1;
    }
    // current() may have just created the default profile
    names = store.value().list();

    if (opts.json) {
        nlohmann::json j;
        j["profiles"] = names;
        j["active"] = active.value().name;
        output_json(j);
        return 0;
    }

    std::cout << "Profiles:" << std::endl;
    for (const auto& n : names) {
        std::string marker = (n == active.value().name) ? " (active)" : "";
        std::cout << "  " << n << marker << std::endl;
    }
    return 0;
}

int cmd_profile_show(const GlobalOptions& opts, const std::string& name) {
    init_command(opts);

    auto store = open_profile_store();
    if (store.isErr()) {
        print_error(store.error(), opts.json);
        return 1;
    }

    auto profile = name.empty() ? store.value().current(profile_selection(opts))
                                : store.value().load(name);
    if (profile.isErr()) {
        print_error(profile.error(), opts.json);
        return 1;
    }

    const auto& p = profile.value();
    if (opts.json) {
        output_json(profile_to_json(p));
        return 0;
    }

    std::cout << "Profile: " << p.name << std::endl;
    std::cout << "Path: " << p.directory << std::endl;
    std::cout << "Component path: " << p.config.component_path << std::endl;
    if (p.config.max_files > 0) {
        std::cout << "Max files: " << p.config.max_files << std::endl;
    }
    if (!p.config.include.empty()) {
        std::cout << "\nInclude:" << std::endl;
        for (const auto& g : p.config.include) std::cout << "  " << g << std::endl;
    }
    if (!p.config.exclude.empty()) {
        std::cout << "\nExclude:" << std::endl;
        for (const auto& g : p.config.exclude) std::cout << "  " << g << std::endl;
    }
    if (!p.config.registries.empty()) {
        std::cout << "\nRegistries:" << std::endl;
        for (const auto& r : p.config.registries) {
            std::cout << "  " << r.name << "  " << r.base_url << std::endl;
        }
    }
    return 0;
}

int cmd_profile_remove(const GlobalOptions& opts, const std::string& name) {
    init_command(opts);

    auto store = open_profile_store();
    if (store.isErr()) {
        print_error(store.error(), opts.json);
        return 1;
    }

    auto removed = store.value().remove(name, profile_selection(opts));
    if (removed.isErr()) {
        print_error(removed.error(), opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["profile"] = name;
        output_json(j);
    } else {
        print_success("Removed profile " + name, opts);
    }
    return 0;
}

struct RunOptions {
    std::string repository;
    std::vector<std::string> command;
};

int cmd_ghost_run(const GlobalOptions& opts, const RunOptions& run_opts) {
    init_command(opts);

    auto store = open_profile_store();
    if (store.isErr()) {
        print_error(store.error(), opts.json);
        return 1;
    }

    auto profile = store.value().current(profile_selection(opts));
    if (profile.isErr()) {
        print_error(profile.error(), opts.json);
        return 1;
    }

    std::vector<std::string> argv = run_opts.command;
    if (argv.empty()) {
        argv.push_back(get_env("SHELL").value_or("/bin/sh"));
    }

    OverlayManager manager(store.value().home());
    auto session = manager.begin(profile.value(), canonical_path(run_opts.repository));
    if (session.isErr()) {
        print_error(session.error(), opts.json);
        return 1;
    }

    auto exit_code = manager.run(*session.value(), argv);

    // Sync and tear down even when the command could not be started
    auto report = manager.end(*session.value());

    if (exit_code.isErr()) {
        print_error(exit_code.error(), opts.json);
        return 1;
    }
    if (report.isErr()) {
        print_error(report.error(), opts.json);
        return 1;
    }

    for (const auto& path : report.value().skipped) {
        print_warning("not synced, already exists in the repository: " + path);
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["profile"] = profile.value().name;
        j["exitCode"] = exit_code.value();
        j["synced"] = report.value().copied;
        j["skipped"] = report.value().skipped;
        output_json(j);
    } else {
        for (const auto& path : report.value().copied) {
            print_success("Synced " + path, opts);
        }
    }
    return exit_code.value();
}

} // anonymous namespace

void setup_ghost(CLI::App* app, GlobalOptions& opts) {
    app->require_subcommand(1);

    // ghost init
    auto* init_cmd = app->add_subcommand("init", "Create the ocx home and the default profile");
    init_cmd->callback([&opts]() {
        std::exit(cmd_ghost_init(opts));
    });

    // ghost profile ...
    auto* profile_cmd = app->add_subcommand("profile", "Manage ghost profiles");
    profile_cmd->require_subcommand(1);

    static std::string create_name;
    static std::string create_from;
    auto* create_cmd = profile_cmd->add_subcommand("create", "Create a profile");
    create_cmd->add_option("name", create_name, "Profile name")->required();
    create_cmd->add_option("--from", create_from, "Copy an existing profile");
    create_cmd->callback([&opts]() {
        std::exit(cmd_profile_create(opts, create_name, create_from));
    });

    static std::string use_name;
    auto* use_cmd = profile_cmd->add_subcommand("use", "Make a profile current");
    use_cmd->add_option("name", use_name, "Profile name")->required();
    use_cmd->callback([&opts]() {
        std::exit(cmd_profile_use(opts, use_name));
    });

    auto* list_cmd = profile_cmd->add_subcommand("list", "List profiles");
    list_cmd->callback([&opts]() {
        std::exit(cmd_profile_list(opts));
    });

    static std::string show_name;
    auto* show_cmd = profile_cmd->add_subcommand("show", "Show profile details");
    show_cmd->add_option("name", show_name, "Profile name (defaults to current)");
    show_cmd->callback([&opts]() {
        std::exit(cmd_profile_show(opts, show_name));
    });

    static std::string remove_name;
    auto* remove_cmd = profile_cmd->add_subcommand("remove", "Delete a profile");
    remove_cmd->add_option("name", remove_name, "Profile name")->required();
    remove_cmd->callback([&opts]() {
        std::exit(cmd_profile_remove(opts, remove_name));
    });

    // ghost registry ...
    auto* registry_cmd = app->add_subcommand("registry", "Manage the current profile's registries");
    setup_registry(registry_cmd, opts, true);

    // ghost add <id>...
    auto* add_cmd = app->add_subcommand("add", "Install components into the current profile");
    setup_ghost_add(add_cmd, opts);

    // ghost run <repo> [-- cmd args]
    static RunOptions run_opts;
    auto* run_cmd = app->add_subcommand("run", "Run a command in a repository with the profile overlaid");
    run_cmd->add_option("repository", run_opts.repository, "Repository directory")->required();
    run_cmd->add_option("command", run_opts.command, "Command and arguments (default: $SHELL)");
    run_cmd->callback([&opts]() {
        std::exit(cmd_ghost_run(opts, run_opts));
    });
}

} // namespace ocx::cli::commands
