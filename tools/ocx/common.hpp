/**
 * ocx CLI - Common utilities and types
 */

#pragma once

#include <ocx/diff.hpp>
#include <ocx/errors.hpp>
#include <ocx/http.hpp>
#include <ocx/platform.hpp>
#include <ocx/profile_store.hpp>
#include <ocx/project.hpp>
#include <ocx/types.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ocx::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string cwd;               // --cwd
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
    std::string profile;           // --profile
};

/**
 * Library logging: warn by default, debug with -v, errors only with -q.
 */
inline void configure_logging(const GlobalOptions& opts) {
    if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (opts.quiet) {
        spdlog::set_level(spdlog::level::err);
    } else {
        spdlog::set_level(spdlog::level::warn);
    }
}

/**
 * Warning collector for accumulating warnings during command execution.
 * In JSON mode, warnings are collected and output at the end.
 * In text mode, warnings are printed immediately to stderr.
 */
struct WarningCollector {
    std::vector<std::string> warnings;
    bool json_mode = false;
    bool quiet = false;

    void add(const std::string& msg) {
        if (json_mode) {
            warnings.push_back(msg);
        } else if (!quiet) {
            std::cerr << "Warning: " << msg << std::endl;
        }
    }

    void clear() { warnings.clear(); }
    bool empty() const { return warnings.empty(); }

    nlohmann::json to_json() const {
        return nlohmann::json(warnings);
    }
};

inline WarningCollector& get_warning_collector() {
    static WarningCollector collector;
    return collector;
}

inline void init_command(const GlobalOptions& opts) {
    configure_logging(opts);
    auto& collector = get_warning_collector();
    collector.clear();
    collector.json_mode = opts.json;
    collector.quiet = opts.quiet;
}

/**
 * Output utilities.
 */
inline void print_error(const ocx::Error& error, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"]["kind"] = ocx::error_code_to_string(error.code());
        j["error"]["message"] = error.message();
        auto& collector = get_warning_collector();
        if (!collector.empty()) {
            j["warnings"] = collector.to_json();
        }
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error [" << ocx::error_code_to_string(error.code()) << "]: "
                  << error.message() << std::endl;
    }
}

inline void print_warning(const std::string& msg) {
    get_warning_collector().add(msg);
}

inline void print_success(const std::string& msg, const GlobalOptions& opts) {
    if (!opts.json && !opts.quiet) {
        std::cout << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    auto& collector = get_warning_collector();
    if (!collector.empty() && !j.contains("warnings")) {
        nlohmann::json output = j;
        output["warnings"] = collector.to_json();
        std::cout << output.dump(2) << std::endl;
    } else {
        std::cout << j.dump(2) << std::endl;
    }
}

/**
 * Project root: --cwd, else the working directory.
 */
inline std::string resolve_project_root(const GlobalOptions& opts) {
    if (!opts.cwd.empty()) {
        return ocx::canonical_path(opts.cwd);
    }
    return std::filesystem::current_path().string();
}

inline std::shared_ptr<ocx::HttpTransport> make_transport() {
    return std::make_shared<ocx::CurlTransport>();
}

inline ocx::ProfileSelection profile_selection(const GlobalOptions& opts) {
    return ocx::ProfileSelection::from_environment(
        opts.profile.empty() ? std::nullopt : std::make_optional(opts.profile));
}

inline ocx::Result<ocx::ProfileStore> open_profile_store() {
    auto home = ocx::resolve_ocx_home();
    if (home.isErr()) return ocx::Result<ocx::ProfileStore>::err(home.error());
    return ocx::Result<ocx::ProfileStore>::ok(ocx::ProfileStore(home.value()));
}

/**
 * The project a command acts on: the working project, or the current ghost
 * profile for `ocx ghost ...` commands.
 */
inline ocx::Result<ocx::Project> open_target(const GlobalOptions& opts, bool ghost) {
    if (!ghost) {
        return ocx::Project::open(ocx::ProjectPaths::for_project(resolve_project_root(opts)),
                                  make_transport());
    }

    auto store = open_profile_store();
    if (store.isErr()) return ocx::Result<ocx::Project>::err(store.error());

    auto profile = store.value().current(profile_selection(opts));
    if (profile.isErr()) return ocx::Result<ocx::Project>::err(profile.error());

    return ocx::Project::open(ocx::ProjectPaths::for_profile(profile.value()), make_transport());
}

/**
 * JSON renderings shared by several commands.
 */
inline nlohmann::json lock_entry_to_json(const ocx::LockEntry& entry) {
    nlohmann::json j;
    j["id"] = entry.component_id;
    j["registry"] = entry.registry;
    j["version"] = entry.version;
    j["type"] = ocx::component_type_to_string(entry.type);
    j["contentHash"] = entry.content_hash;
    j["files"] = entry.installed_files;
    return j;
}

inline nlohmann::json drift_to_json(const ocx::Drift& drift) {
    nlohmann::json j;
    j["component"] = drift.component_id;
    j["path"] = drift.path;
    j["kind"] = ocx::drift_kind_to_string(drift.kind);
    if (!drift.expected_hash.empty()) j["expected"] = drift.expected_hash;
    if (!drift.actual_hash.empty()) j["actual"] = drift.actual_hash;
    return j;
}

inline nlohmann::json install_summary_to_json(const ocx::InstallSummary& summary) {
    nlohmann::json j;
    j["ok"] = true;
    j["installed"] = nlohmann::json::array();
    for (const auto& entry : summary.entries) {
        j["installed"].push_back(lock_entry_to_json(entry));
    }
    j["skipped"] = summary.skipped;
    return j;
}

inline void print_install_summary(const ocx::InstallSummary& summary, const GlobalOptions& opts) {
    if (opts.json) {
        output_json(install_summary_to_json(summary));
        return;
    }
    for (const auto& entry : summary.entries) {
        bool skipped = std::find(summary.skipped.begin(), summary.skipped.end(),
                                 entry.component_id) != summary.skipped.end();
        print_success((skipped ? "  = " : "  + ") + entry.component_id + "@" + entry.version +
                          (skipped ? " (up to date)" : ""),
                      opts);
    }
    if (summary.entries.empty()) {
        print_success("Nothing to install.", opts);
    }
}

} // namespace ocx::cli
