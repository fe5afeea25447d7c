/**
 * ocx CLI - diff command
 *
 * Compare installed files with the lockfile; --fix restores them.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace ocx::cli::commands {

namespace {

struct DiffOptions {
    std::string component;
    bool fix = false;
};

void print_drift(const std::vector<Drift>& drift) {
    std::string current;
    for (const auto& d : drift) {
        if (d.component_id != current) {
            current = d.component_id;
            std::cout << current << std::endl;
        }
        std::cout << "  " << drift_kind_to_string(d.kind) << "  " << d.path << std::endl;
    }
}

int cmd_diff(const GlobalOptions& opts, const DiffOptions& diff_opts) {
    init_command(opts);

    auto project = open_target(opts, false);
    if (project.isErr()) {
        print_error(project.error(), opts.json);
        return 1;
    }

    std::optional<std::string> component;
    if (!diff_opts.component.empty()) component = diff_opts.component;

    if (diff_opts.fix) {
        auto report = project.value().fix(component);
        if (report.isErr()) {
            print_error(report.error(), opts.json);
            return 1;
        }

        if (opts.json) {
            nlohmann::json j;
            j["ok"] = true;
            j["drift"] = nlohmann::json::array();
            for (const auto& d : report.value().drift) j["drift"].push_back(drift_to_json(d));
            j["reinstalled"] = report.value().reinstalled;
            output_json(j);
            return 0;
        }

        if (report.value().drift.empty()) {
            print_success("No drift.", opts);
            return 0;
        }
        if (!opts.quiet) print_drift(report.value().drift);
        for (const auto& id : report.value().reinstalled) {
            print_success("Restored " + id, opts);
        }
        return 0;
    }

    auto drift = project.value().diff(component);
    if (drift.isErr()) {
        print_error(drift.error(), opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["drift"] = nlohmann::json::array();
        for (const auto& d : drift.value()) j["drift"].push_back(drift_to_json(d));
        output_json(j);
    } else if (drift.value().empty()) {
        print_success("No drift.", opts);
    } else if (!opts.quiet) {
        print_drift(drift.value());
    }
    return 0;
}

} // anonymous namespace

void setup_diff(CLI::App* app, GlobalOptions& opts) {
    static DiffOptions diff_opts;

    app->add_option("component", diff_opts.component, "Installed component (default: all)");
    app->add_flag("--fix", diff_opts.fix, "Reinstall components with missing or modified files");

    app->callback([&opts]() {
        std::exit(cmd_diff(opts, diff_opts));
    });
}

} // namespace ocx::cli::commands
