/**
 * ocx CLI - registry command
 *
 * Manage the registry list of the project, or of the current ghost profile.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>
#include <ocx/registry_client.hpp>

namespace ocx::cli::commands {

namespace {

struct RegistryAddOptions {
    std::string name;
    std::string url;
    std::string version;
};

int cmd_registry_add(const GlobalOptions& opts, const RegistryAddOptions& add_opts, bool ghost) {
    init_command(opts);

    auto project = open_target(opts, ghost);
    if (project.isErr()) {
        print_error(project.error(), opts.json);
        return 1;
    }

    Registry registry;
    registry.name = add_opts.name;
    registry.base_url = add_opts.url;
    registry.pinned_version = add_opts.version;

    auto added = project.value().add_registry(registry);
    if (added.isErr()) {
        print_error(added.error(), opts.json);
        return 1;
    }

    // Probe the discovery document; an unreachable registry is still added
    ocx::RegistryClient client(make_transport());
    auto capabilities = client.fetch_capabilities(registry);
    if (capabilities.isErr()) {
        print_warning("registry " + registry.name + " did not answer: " +
                      capabilities.error().message());
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["registry"] = registry.name;
        if (capabilities.isOk() && !capabilities.value().is_null()) {
            j["capabilities"] = capabilities.value();
        }
        output_json(j);
    } else {
        print_success("Added registry " + registry.name + " (" + registry.base_url + ")", opts);
    }
    return 0;
}

int cmd_registry_remove(const GlobalOptions& opts, const std::string& name, bool ghost) {
    init_command(opts);

    auto project = open_target(opts, ghost);
    if (project.isErr()) {
        print_error(project.error(), opts.json);
        return 1;
    }

    auto removed = project.value().remove_registry(name);
    if (removed.isErr()) {
        print_error(removed.error(), opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["registry"] = name;
        output_json(j);
    } else {
        print_success("Removed registry " + name, opts);
    }
    return 0;
}

int cmd_registry_list(const GlobalOptions& opts, bool ghost) {
    init_command(opts);

    auto project = open_target(opts, ghost);
    if (project.isErr()) {
        print_error(project.error(), opts.json);
        return 1;
    }

    const auto& config = project.value().config();

    if (opts.json) {
        nlohmann::json j;
        j["registries"] = nlohmann::json::array();
        for (const auto& r : config.registries) {
            nlohmann::json entry;
            entry["name"] = r.name;
            entry["url"] = r.base_url;
            if (!r.pinned_version.empty()) entry["version"] = r.pinned_version;
            j["registries"].push_back(entry);
        }
        j["locked"] = config.lock_registries;
        output_json(j);
        return 0;
    }

    if (config.registries.empty()) {
        std::cout << "No registries configured." << std::endl;
        return 0;
    }
    for (const auto& r : config.registries) {
        std::cout << "  " << r.name << "  " << r.base_url;
        if (!r.pinned_version.empty()) std::cout << "  (pinned " << r.pinned_version << ")";
        std::cout << std::endl;
    }
    if (config.lock_registries) {
        std::cout << "Registry list is locked." << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_registry(CLI::App* app, GlobalOptions& opts, bool ghost) {
    app->require_subcommand(1);

    // Each parent (project / ghost) gets its own option storage
    static RegistryAddOptions add_opts[2];
    static std::string remove_name[2];
    const size_t slot = ghost ? 1 : 0;

    // registry add <name> <url>
    auto* add_cmd = app->add_subcommand("add", "Add a registry");
    add_cmd->add_option("name", add_opts[slot].name, "Registry name")->required();
    add_cmd->add_option("url", add_opts[slot].url, "Base URL (https)")->required();
    add_cmd->add_option("--version", add_opts[slot].version, "Pin the registry to one release");
    add_cmd->callback([&opts, slot, ghost]() {
        std::exit(cmd_registry_add(opts, add_opts[slot], ghost));
    });

    // registry remove <name>
    auto* remove_cmd = app->add_subcommand("remove", "Remove a registry");
    remove_cmd->add_option("name", remove_name[slot], "Registry name")->required();
    remove_cmd->callback([&opts, slot, ghost]() {
        std::exit(cmd_registry_remove(opts, remove_name[slot], ghost));
    });

    // registry list
    auto* list_cmd = app->add_subcommand("list", "List configured registries");
    list_cmd->callback([&opts, ghost]() {
        std::exit(cmd_registry_list(opts, ghost));
    });
}

} // namespace ocx::cli::commands
