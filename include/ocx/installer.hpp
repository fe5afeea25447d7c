#pragma once

/**
 * @file installer.hpp
 * @brief Writes a resolved plan into a project, one component at a time
 *
 * Per plan entry, in order: fetch files, place them, check ownership,
 * write, merge the config fragment, hash what landed on disk, record the
 * lock entry. A component is the unit of atomicity: a failure rolls back
 * that component's writes and records nothing, while components committed
 * before it stay installed. Reinstalling a locked release whose bytes no
 * longer hash to the recorded content hash fails with HASH_MISMATCH.
 *
 * Placement under componentPath:
 *
 *   skill     skill/<name>/<source>   (owns skill/<name>)
 *   agent     agent/<source>
 *   plugin    plugin/<source>
 *   command   command/<source>
 *   tool      tool/<source>
 *   bundle    no files
 *
 * An explicit target is taken relative to the project root instead.
 */

#include "ocx/config_merge.hpp"
#include "ocx/errors.hpp"
#include "ocx/lockfile.hpp"
#include "ocx/registry_client.hpp"
#include "ocx/resolver.hpp"
#include "ocx/types.hpp"

#include <set>
#include <string>
#include <vector>

namespace ocx {

struct InstallerLayout {
    std::string project_root;
    std::string component_path = ".opencode";
    std::set<std::string> reserved;  // project-relative paths no component may claim
};

struct InstallOptions {
    bool overwrite = false;  // take over paths owned by other components or untracked
    bool reinstall = false;  // rewrite even when the installed copy is intact
};

struct InstallSummary {
    std::vector<LockEntry> entries;    // one per plan entry, in plan order
    std::vector<std::string> skipped;  // already installed at that version, intact
};

// Project-relative target of one declared file
Result<std::string> place_file(const ComponentManifest& manifest,
                               const FileSpec& file,
                               const InstallerLayout& layout);

// Directory the component owns exclusively, empty when it owns none
std::string owned_root(const ComponentManifest& manifest, const std::string& component_path);

class Installer {
public:
    Installer(RegistryClient& client, IntegrityStore& store, AggregateConfig& config,
              InstallerLayout layout);

    Result<InstallSummary> install(const std::vector<PlanEntry>& plan,
                                   const InstallOptions& options = {});

private:
    // skipped is set when the installed copy was left as it is
    Result<LockEntry> install_one(const PlanEntry& entry, const InstallOptions& options,
                                  bool& skipped);

    RegistryClient& client_;
    IntegrityStore& store_;
    AggregateConfig& config_;
    InstallerLayout layout_;
};

} // namespace ocx
