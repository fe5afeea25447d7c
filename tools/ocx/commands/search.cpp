/**
 * ocx CLI - search command
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace ocx::cli::commands {

namespace {

struct SearchOptions {
    std::string query;
    bool installed = false;
};

int cmd_search(const GlobalOptions& opts, const SearchOptions& search_opts) {
    init_command(opts);

    auto project = open_target(opts, false);
    if (project.isErr()) {
        print_error(project.error(), opts.json);
        return 1;
    }

    auto hits = project.value().search(search_opts.query, search_opts.installed);
    if (hits.isErr()) {
        print_error(hits.error(), opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["results"] = nlohmann::json::array();
        for (const auto& hit : hits.value()) {
            nlohmann::json entry;
            entry["registry"] = hit.registry;
            entry["name"] = hit.summary.name;
            entry["type"] = component_type_to_string(hit.summary.type);
            entry["version"] = hit.summary.latest_version;
            entry["description"] = hit.summary.description;
            if (hit.installed_version) entry["installed"] = *hit.installed_version;
            j["results"].push_back(entry);
        }
        output_json(j);
        return 0;
    }

    if (hits.value().empty()) {
        std::cout << "No components found." << std::endl;
        return 0;
    }

    for (const auto& hit : hits.value()) {
        std::cout << hit.registry << "/" << hit.summary.name << "@"
                  << hit.summary.latest_version << "  ["
                  << component_type_to_string(hit.summary.type) << "]";
        if (hit.installed_version) {
            std::cout << "  (installed " << *hit.installed_version << ")";
        }
        std::cout << std::endl;
        if (!hit.summary.description.empty()) {
            std::cout << "    " << hit.summary.description << std::endl;
        }
    }
    return 0;
}

} // anonymous namespace

void setup_search(CLI::App* app, GlobalOptions& opts) {
    static SearchOptions search_opts;

    app->add_option("query", search_opts.query, "Text to match in names and descriptions");
    app->add_flag("--installed", search_opts.installed, "Search installed components only");

    app->callback([&opts]() {
        std::exit(cmd_search(opts, search_opts));
    });
}

} // namespace ocx::cli::commands
