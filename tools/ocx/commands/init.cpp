/**
 * ocx CLI - init command
 *
 * Create ocx.json with default settings.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace ocx::cli::commands {

namespace {

struct InitOptions {
    std::vector<std::string> registries;  // name=url
};

int cmd_init(const GlobalOptions& opts, const InitOptions& init_opts) {
    init_command(opts);

    std::string root = resolve_project_root(opts);
    auto paths = ProjectPaths::for_project(root);
    bool existed = is_regular_file(paths.config_file);

    ProjectConfig seed;
    for (const auto& spec : init_opts.registries) {
        auto eq = spec.find('=');
        if (eq == std::string::npos) {
            print_error(Error(ErrorCode::INVALID_ARGUMENT,
                              "expected --registry name=https://..., got " + spec),
                        opts.json);
            return 1;
        }
        Registry registry;
        registry.name = spec.substr(0, eq);
        registry.base_url = spec.substr(eq + 1);
        auto added = add_registry(seed, registry);
        if (added.isErr()) {
            print_error(added.error(), opts.json);
            return 1;
        }
    }

    auto project = Project::init(paths, make_transport(), seed);
    if (project.isErr()) {
        print_error(project.error(), opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["path"] = paths.config_file;
        j["created"] = !existed;
        output_json(j);
    } else if (existed) {
        print_success(paths.config_file + " already exists.", opts);
    } else {
        print_success("Created " + paths.config_file, opts);
        if (project.value().config().registries.empty()) {
            print_success("Next: ocx registry add <name> <https-url>", opts);
        }
    }
    return 0;
}

} // anonymous namespace

void setup_init(CLI::App* app, GlobalOptions& opts) {
    static InitOptions init_opts;

    app->add_option("--registry", init_opts.registries, "Registry to configure (name=url)");

    app->callback([&opts]() {
        std::exit(cmd_init(opts, init_opts));
    });
}

} // namespace ocx::cli::commands
