#pragma once

/**
 * @file overlay.hpp
 * @brief Ghost mode: project a profile's components onto a foreign repository
 *
 * A session builds a mapping from virtual paths to real files (visible
 * repository files plus the profile's component tree and aggregate config),
 * materialises it in a private directory under the ocx home and never writes
 * to the repository while it runs. Ending the session copies files created
 * under the virtual component area back into the repository, then discards
 * the overlay.
 *
 * @example
 * ```cpp
 * ocx::OverlayManager manager(home);
 * auto session = manager.begin(profile, "/src/project");
 * if (session.isOk()) {
 *     manager.run(*session.value(), {"opencode"});
 *     auto report = manager.end(*session.value());
 * }
 * ```
 */

#include "ocx/errors.hpp"
#include "ocx/file_lock.hpp"
#include "ocx/profile_store.hpp"

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace ocx {

// ============================================================================
// Overlay Mapping
// ============================================================================

enum class MappingOrigin {
    Repository,
    Profile
};

struct MappingEntry {
    std::string source;  // absolute path of the backing file
    MappingOrigin origin = MappingOrigin::Repository;
};

struct OverlayMapping {
    std::string repository_root;
    std::string profile_root;
    std::string component_path;                    // virtual component area
    std::map<std::string, MappingEntry> entries;   // virtual path -> backing file
    std::set<std::string> hidden;                  // repository paths filtered out
};

// Pure: reads the repository and profile trees, writes nothing. Fails with
// OVERLAY_TOO_LARGE as soon as the entry count passes the profile's maxFiles.
Result<OverlayMapping> build_overlay_mapping(const Profile& profile,
                                             const std::string& repository_root);

// ============================================================================
// Version Control Redirection
// ============================================================================

struct VcsRedirect {
    std::string git_dir;    // GIT_DIR
    std::string work_tree;  // GIT_WORK_TREE
};

// Follows a `.git` file's "gitdir:" line. nullopt outside a git checkout.
std::optional<VcsRedirect> find_vcs_redirect(const std::string& repository_root);

// ============================================================================
// Materializer
// ============================================================================

class Materializer {
public:
    virtual ~Materializer() = default;

    // Build the view of mapping inside the empty directory overlay_root
    virtual Result<void> materialize(const OverlayMapping& mapping,
                                     const std::string& overlay_root) = 0;
};

// One symlink per mapped file; directories are real
class SymlinkMaterializer : public Materializer {
public:
    Result<void> materialize(const OverlayMapping& mapping,
                             const std::string& overlay_root) override;
};

// ============================================================================
// Session
// ============================================================================

class OverlaySession {
public:
    ~OverlaySession();

    OverlaySession(const OverlaySession&) = delete;
    OverlaySession& operator=(const OverlaySession&) = delete;

    const std::string& profile_name() const { return profile_name_; }
    const std::string& overlay_root() const { return overlay_root_; }
    const OverlayMapping& mapping() const { return mapping_; }
    bool active() const { return active_; }

    // GIT_DIR / GIT_WORK_TREE for processes run inside the overlay
    std::map<std::string, std::string> environment() const;

private:
    friend class OverlayManager;

    OverlaySession(std::string profile_name, std::string overlay_root, std::string marker_path,
                   OverlayMapping mapping, std::optional<VcsRedirect> vcs,
                   std::unique_ptr<FileLock> marker);

    // Remove the overlay and the marker; no synchronisation
    void teardown();

    std::string profile_name_;
    std::string overlay_root_;
    std::string marker_path_;
    OverlayMapping mapping_;
    std::optional<VcsRedirect> vcs_;
    std::unique_ptr<FileLock> marker_;
    bool active_ = true;
};

struct SyncReport {
    std::vector<std::string> copied;   // repository-relative paths written
    std::vector<std::string> skipped;  // already present in the repository, left untouched
};

// ============================================================================
// Overlay Manager
// ============================================================================

class OverlayManager {
public:
    // state_root is the ocx home; sessions live under <state_root>/sessions
    explicit OverlayManager(std::string state_root,
                            std::shared_ptr<Materializer> materializer = nullptr);

    // CONCURRENT_OPERATION when the same (profile, repository) is already live
    Result<std::unique_ptr<OverlaySession>> begin(const Profile& profile,
                                                  const std::string& repository_root);

    // Sync new component files back, then discard the overlay
    Result<SyncReport> end(OverlaySession& session);

    // Run argv inside the overlay and wait; returns the exit code
    Result<int> run(const OverlaySession& session, const std::vector<std::string>& argv);

private:
    std::string state_root_;
    std::shared_ptr<Materializer> materializer_;
};

} // namespace ocx
