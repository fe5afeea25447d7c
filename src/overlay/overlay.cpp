#include "ocx/overlay.hpp"
#include "ocx/digest.hpp"
#include "ocx/exec.hpp"
#include "ocx/glob.hpp"
#include "ocx/platform.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <utility>

namespace ocx {

namespace fs = std::filesystem;

namespace {

Error too_large(const Profile& profile, const std::string& repository_root) {
    return Error(ErrorCode::OVERLAY_TOO_LARGE,
                 repository_root + " maps more than " +
                     std::to_string(profile.config.max_files) + " files (maxFiles of profile " +
                     profile.name + ")");
}

// Visit every file (or symlink) below root, skipping .git; an error from f stops the walk
template<typename F>
Result<void> walk_tree(const std::string& root, F&& f) {
    std::error_code ec;
    fs::recursive_directory_iterator it(root, ec);
    if (ec) {
        return Result<void>::err(Error(ErrorCode::IO_ERROR,
                                       "cannot enumerate " + root + ": " + ec.message()));
    }

    for (auto end = fs::recursive_directory_iterator(); it != end; it.increment(ec)) {
        if (ec) {
            return Result<void>::err(Error(ErrorCode::IO_ERROR,
                                           "cannot enumerate " + root + ": " + ec.message()));
        }

        std::error_code type_ec;
        bool symlink = it->is_symlink(type_ec);
        if (it->path().filename() == ".git") {
            if (!symlink && it->is_directory(type_ec)) it.disable_recursion_pending();
            continue;
        }
        if (!symlink && it->is_directory(type_ec)) continue;

        auto keep_going = f(it->path().string(),
                            relative_portable_path(it->path().string(), root));
        if (keep_going.isErr()) return keep_going;
    }
    return Result<void>::ok();
}

std::string session_key(const std::string& profile_name, const std::string& repository_root) {
    std::string key = profile_name + "\n" + repository_root;
    auto hash = compute_sha256(std::vector<uint8_t>(key.begin(), key.end()));
    if (!hash.ok) return profile_name;
    return hash.hex_digest.substr(0, 24);
}

} // namespace

// ============================================================================
// Mapping
// ============================================================================

Result<OverlayMapping> build_overlay_mapping(const Profile& profile,
                                             const std::string& repository_root) {
    using R = Result<OverlayMapping>;

    OverlayMapping mapping;
    mapping.repository_root = canonical_path(repository_root);
    mapping.profile_root = profile.directory;
    mapping.component_path = profile.config.component_path;

    if (!is_directory(mapping.repository_root)) {
        return R::err(Error(ErrorCode::INVALID_ARGUMENT,
                            "not a directory: " + repository_root));
    }

    size_t limit = profile.config.max_files;
    const auto& include = profile.config.include;
    const auto& exclude = profile.config.exclude;

    auto walked = walk_tree(mapping.repository_root,
                            [&](const std::string& full, const std::string& rel) -> Result<void> {
        if (!is_visible(rel, include, exclude)) {
            mapping.hidden.insert(rel);
            return Result<void>::ok();
        }
        mapping.entries[rel] = MappingEntry{full, MappingOrigin::Repository};
        if (limit != 0 && mapping.entries.size() > limit) {
            return Result<void>::err(too_large(profile, repository_root));
        }
        return Result<void>::ok();
    });
    if (walked.isErr()) return R::err(walked.error());

    // Profile layer: shadows repository files at the same virtual path
    auto layer = [&](const std::string& virtual_path, const std::string& full) -> Result<void> {
        mapping.entries[virtual_path] = MappingEntry{full, MappingOrigin::Profile};
        mapping.hidden.erase(virtual_path);
        if (limit != 0 && mapping.entries.size() > limit) {
            return Result<void>::err(too_large(profile, repository_root));
        }
        return Result<void>::ok();
    };

    std::string component_root = join_path(profile.directory, profile.config.component_path);
    if (is_directory(component_root)) {
        walked = walk_tree(component_root,
                           [&](const std::string& full, const std::string& rel) -> Result<void> {
            return layer(join_path(profile.config.component_path, rel), full);
        });
        if (walked.isErr()) return R::err(walked.error());
    }

    std::string profile_config = join_path(profile.directory, profile.config.config_file);
    if (is_regular_file(profile_config)) {
        auto layered = layer(profile.config.config_file, profile_config);
        if (layered.isErr()) return R::err(layered.error());
    }

    spdlog::debug("overlay for {}: {} entries, {} hidden", mapping.repository_root,
                  mapping.entries.size(), mapping.hidden.size());
    return R::ok(std::move(mapping));
}

// ============================================================================
// VCS Redirect
// ============================================================================

std::optional<VcsRedirect> find_vcs_redirect(const std::string& repository_root) {
    std::string root = canonical_path(repository_root);
    std::string dot_git = join_path(root, ".git");

    if (is_directory(dot_git)) {
        return VcsRedirect{dot_git, root};
    }

    if (is_regular_file(dot_git)) {
        auto text = read_file_text(dot_git);
        if (!text) return std::nullopt;

        const std::string prefix = "gitdir:";
        auto pos = text->find(prefix);
        if (pos == std::string::npos) return std::nullopt;

        std::string target = text->substr(pos + prefix.size());
        auto eol = target.find_first_of("\r\n");
        if (eol != std::string::npos) target = target.substr(0, eol);
        size_t start = target.find_first_not_of(" \t");
        if (start == std::string::npos) return std::nullopt;
        target = target.substr(start);

        fs::path git_dir(target);
        if (git_dir.is_relative()) git_dir = fs::path(root) / git_dir;
        return VcsRedirect{canonical_path(git_dir.string()), root};
    }

    return std::nullopt;
}

// ============================================================================
// Symlink Materializer
// ============================================================================

Result<void> SymlinkMaterializer::materialize(const OverlayMapping& mapping,
                                              const std::string& overlay_root) {
    if (!create_directories(join_path(overlay_root, mapping.component_path))) {
        return Result<void>::err(Error(ErrorCode::IO_ERROR,
                                       "cannot create component area in " + overlay_root));
    }

    for (const auto& [virtual_path, entry] : mapping.entries) {
        fs::path link = fs::path(overlay_root) / virtual_path;

        std::error_code ec;
        fs::create_directories(link.parent_path(), ec);
        if (!ec) fs::create_symlink(entry.source, link, ec);
        if (ec) {
            return Result<void>::err(Error(ErrorCode::IO_ERROR,
                                           "cannot map " + virtual_path + ": " + ec.message()));
        }
    }
    return Result<void>::ok();
}

// ============================================================================
// Session
// ============================================================================

OverlaySession::OverlaySession(std::string profile_name, std::string overlay_root,
                               std::string marker_path, OverlayMapping mapping,
                               std::optional<VcsRedirect> vcs,
                               std::unique_ptr<FileLock> marker)
    : profile_name_(std::move(profile_name)),
      overlay_root_(std::move(overlay_root)),
      marker_path_(std::move(marker_path)),
      mapping_(std::move(mapping)),
      vcs_(std::move(vcs)),
      marker_(std::move(marker)) {}

OverlaySession::~OverlaySession() {
    if (active_) {
        spdlog::warn("ghost session for {} ended without sync", mapping_.repository_root);
        teardown();
    }
}

void OverlaySession::teardown() {
    if (!remove_directory(overlay_root_)) {
        spdlog::warn("could not remove overlay {}", overlay_root_);
    }
    // Unlink while still holding the lock, then release it
    remove_file(marker_path_);
    marker_.reset();
    active_ = false;
}

std::map<std::string, std::string> OverlaySession::environment() const {
    std::map<std::string, std::string> env;
    if (vcs_) {
        env["GIT_DIR"] = vcs_->git_dir;
        env["GIT_WORK_TREE"] = vcs_->work_tree;
    }
    env["OCX_GHOST_PROFILE"] = profile_name_;
    env["OCX_GHOST_REPOSITORY"] = mapping_.repository_root;
    return env;
}

// ============================================================================
// Overlay Manager
// ============================================================================

OverlayManager::OverlayManager(std::string state_root, std::shared_ptr<Materializer> materializer)
    : state_root_(std::move(state_root)), materializer_(std::move(materializer)) {
    if (!materializer_) {
        materializer_ = std::make_shared<SymlinkMaterializer>();
    }
}

Result<std::unique_ptr<OverlaySession>> OverlayManager::begin(const Profile& profile,
                                                              const std::string& repository_root) {
    using R = Result<std::unique_ptr<OverlaySession>>;

    auto mapping = build_overlay_mapping(profile, repository_root);
    if (mapping.isErr()) return R::err(mapping.error());

    const std::string& repo = mapping.value().repository_root;
    std::string sessions = join_path(state_root_, "sessions");
    std::string key = session_key(profile.name, repo);
    std::string marker_path = join_path(sessions, key + ".lock");

    auto marker = FileLock::try_acquire(marker_path);
    if (marker.isErr()) {
        if (marker.error().code() == ErrorCode::CONCURRENT_OPERATION) {
            return R::err(Error(ErrorCode::CONCURRENT_OPERATION,
                                "a ghost session for profile " + profile.name + " on " + repo +
                                    " is already running"));
        }
        return R::err(marker.error());
    }

    // Leftovers from a session that died without cleanup
    std::string overlay_root = join_path(sessions, key);
    remove_directory(overlay_root);
    if (!create_directories(overlay_root)) {
        remove_file(marker_path);
        return R::err(Error(ErrorCode::IO_ERROR, "cannot create " + overlay_root));
    }

    auto materialized = materializer_->materialize(mapping.value(), overlay_root);
    if (materialized.isErr()) {
        remove_directory(overlay_root);
        remove_file(marker_path);
        return R::err(materialized.error());
    }

    auto vcs = find_vcs_redirect(repo);
    spdlog::info("ghost session started for {} with profile {} ({} entries)", repo, profile.name,
                 mapping.value().entries.size());

    return R::ok(std::unique_ptr<OverlaySession>(
        new OverlaySession(profile.name, overlay_root, marker_path, std::move(mapping.value()),
                           std::move(vcs), std::move(marker.value()))));
}

Result<SyncReport> OverlayManager::end(OverlaySession& session) {
    using R = Result<SyncReport>;

    if (!session.active()) {
        return R::err(Error(ErrorCode::INVALID_ARGUMENT, "ghost session already ended"));
    }

    SyncReport report;
    const OverlayMapping& mapping = session.mapping();
    std::string area = join_path(session.overlay_root(), mapping.component_path);

    // Mapped files are symlinks; anything regular was created during the session
    if (is_directory(area)) {
        auto walked = walk_tree(area, [&](const std::string& full,
                                          const std::string& rel) -> Result<void> {
            if (is_symlink(full) || !is_regular_file(full)) return Result<void>::ok();

            std::string virtual_path = join_path(mapping.component_path, rel);
            if (mapping.entries.count(virtual_path)) {
                // A mapped file replaced in place, not a new one
                spdlog::debug("not syncing rewritten mapped file {}", virtual_path);
                return Result<void>::ok();
            }

            std::string target = join_path(mapping.repository_root, virtual_path);
            if (path_exists(target) || is_symlink(target)) {
                spdlog::warn("not syncing {}: already present in {}", virtual_path,
                             mapping.repository_root);
                report.skipped.push_back(virtual_path);
                return Result<void>::ok();
            }

            if (!create_directories(get_parent_directory(target)) || !copy_file(full, target)) {
                return Result<void>::err(
                    Error(ErrorCode::IO_ERROR, "cannot sync " + virtual_path + " into " +
                                                   mapping.repository_root));
            }
            report.copied.push_back(virtual_path);
            return Result<void>::ok();
        });
        if (walked.isErr()) {
            return R::err(walked.error().withContext("overlay kept at " + session.overlay_root()));
        }
    }

    session.teardown();
    spdlog::info("ghost session ended for {}: {} synced, {} skipped", mapping.repository_root,
                 report.copied.size(), report.skipped.size());
    return R::ok(std::move(report));
}

Result<int> OverlayManager::run(const OverlaySession& session,
                                const std::vector<std::string>& argv) {
    if (!session.active()) {
        return Result<int>::err(Error(ErrorCode::INVALID_ARGUMENT, "ghost session already ended"));
    }

    auto result = run_process(argv, session.overlay_root(), session.environment());
    if (!result.ok) {
        return Result<int>::err(Error(ErrorCode::IO_ERROR, result.error));
    }
    return Result<int>::ok(result.exit_code);
}

} // namespace ocx
