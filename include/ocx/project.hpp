#pragma once

/**
 * @file project.hpp
 * @brief High-level operations on one project (or one ghost profile)
 *
 * A project is a directory with a configuration file (ocx.json, or
 * ghost.json for a profile), its lockfile ocx.lock and the state directory
 * .ocx. Mutating operations hold .ocx/operation.lock for their duration;
 * a second concurrent invocation fails with CONCURRENT_OPERATION.
 *
 * @example
 * ```cpp
 * auto project = ocx::Project::open(ocx::ProjectPaths::for_project("."),
 *                                   std::make_shared<ocx::CurlTransport>());
 * if (project.isOk()) {
 *     auto installed = project.value().add({"kdco/researcher"});
 * }
 * ```
 */

#include "ocx/diff.hpp"
#include "ocx/errors.hpp"
#include "ocx/file_lock.hpp"
#include "ocx/http.hpp"
#include "ocx/installer.hpp"
#include "ocx/profile_store.hpp"
#include "ocx/project_config.hpp"
#include "ocx/types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ocx {

constexpr const char* kProjectConfigFile = "ocx.json";
constexpr const char* kLockFile = "ocx.lock";
constexpr const char* kStateDirectory = ".ocx";

struct ProjectPaths {
    std::string root;
    std::string config_file;     // ocx.json or ghost.json
    std::string lock_file;       // ocx.lock
    std::string state_dir;       // .ocx
    std::string operation_lock;  // .ocx/operation.lock
    std::string fragments;       // .ocx/fragments.json

    static ProjectPaths for_project(const std::string& root);
    static ProjectPaths for_profile(const Profile& profile);
};

struct SearchHit {
    std::string registry;
    ComponentSummary summary;
    std::optional<std::string> installed_version;
};

struct FixReport {
    std::vector<Drift> drift;                // what diff found before fixing
    std::vector<std::string> reinstalled;    // component ids rewritten
};

class Project {
public:
    // Writes the configuration when it does not exist yet; otherwise opens it
    static Result<Project> init(const ProjectPaths& paths,
                                std::shared_ptr<HttpTransport> transport,
                                const ProjectConfig& seed = ProjectConfig());

    static Result<Project> open(const ProjectPaths& paths,
                                std::shared_ptr<HttpTransport> transport);

    const ProjectPaths& paths() const { return paths_; }
    const ProjectConfig& config() const { return config_; }

    // "[registry/]name[@constraint]" requests, resolved and installed
    Result<InstallSummary> add(const std::vector<std::string>& requests,
                               const InstallOptions& options = {});

    // Installed components (all when ids is empty) moved to the highest
    // release satisfying version_constraint
    Result<InstallSummary> update(const std::vector<std::string>& ids,
                                  const std::string& version_constraint = "");

    Result<std::vector<Drift>> diff(const std::optional<std::string>& component_id = std::nullopt);

    // Reinstall the locked version of every component with Missing or
    // Modified files. Added files are reported, never deleted.
    Result<FixReport> fix(const std::optional<std::string>& component_id = std::nullopt);

    Result<void> add_registry(const Registry& registry);
    Result<void> remove_registry(const std::string& name);

    // Case-insensitive substring match on name and description; with
    // installed_only the lockfile is searched instead of the registries
    Result<std::vector<SearchHit>> search(const std::string& query, bool installed_only = false);

    Result<std::vector<LockEntry>> installed() const;

private:
    Project(ProjectPaths paths, ProjectConfig config, std::shared_ptr<HttpTransport> transport)
        : paths_(std::move(paths)),
          config_(std::move(config)),
          transport_(std::move(transport)) {}

    InstallerLayout layout() const;
    Result<std::unique_ptr<FileLock>> lock_operation() const;
    Result<InstallSummary> install_requests(const std::vector<ComponentRequest>& requests,
                                            const InstallOptions& options);

    ProjectPaths paths_;
    ProjectConfig config_;
    std::shared_ptr<HttpTransport> transport_;
};

} // namespace ocx
