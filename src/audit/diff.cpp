#include "ocx/diff.hpp"
#include "ocx/digest.hpp"
#include "ocx/platform.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>

namespace ocx {

namespace fs = std::filesystem;

namespace {

// Regular files (and symlinks) below dir, as project-relative portable paths
std::vector<std::string> walk_files(const std::string& dir, const std::string& project_root) {
    std::vector<std::string> files;

    std::error_code ec;
    fs::recursive_directory_iterator it(dir, ec);
    if (ec) return files;

    for (auto end = fs::recursive_directory_iterator(); it != end; it.increment(ec)) {
        if (ec) break;
        std::error_code type_ec;
        if (it->is_directory(type_ec) && !it->is_symlink(type_ec)) continue;
        files.push_back(relative_portable_path(it->path().string(), project_root));
    }

    std::sort(files.begin(), files.end());
    return files;
}

} // namespace

std::vector<Drift> diff_entry(const LockEntry& entry, const std::string& project_root,
                              const IntegrityStore* store) {
    std::vector<Drift> drifts;
    bool needs_aggregate_check = false;

    for (const auto& path : entry.installed_files) {
        std::string full = join_path(project_root, path);
        auto recorded = entry.file_hashes.find(path);
        std::string expected = recorded != entry.file_hashes.end() ? recorded->second : "";

        if (!path_exists(full) && !is_symlink(full)) {
            drifts.push_back(Drift{entry.component_id, path, DriftKind::Missing, expected, ""});
            continue;
        }

        if (!is_regular_file(full)) {
            drifts.push_back(Drift{entry.component_id, path, DriftKind::Modified, expected, ""});
            continue;
        }

        if (expected.empty()) {
            needs_aggregate_check = true;
            continue;
        }

        auto actual = compute_sha256(full);
        if (!actual.ok) {
            spdlog::warn("cannot hash {}: {}", full, actual.error);
            drifts.push_back(Drift{entry.component_id, path, DriftKind::Modified, expected, ""});
            continue;
        }

        std::string actual_hash = format_digest(actual.hex_digest);
        if (actual_hash != expected) {
            drifts.push_back(
                Drift{entry.component_id, path, DriftKind::Modified, expected, actual_hash});
        }
    }

    // Entries without per-file hashes can only be checked as a whole
    if (needs_aggregate_check && drifts.empty()) {
        auto content = compute_content_hash(project_root, entry.installed_files);
        if (!content.ok || content.content_hash != entry.content_hash) {
            for (const auto& path : entry.installed_files) {
                if (entry.file_hashes.count(path)) continue;
                auto actual = content.file_hashes.find(path);
                drifts.push_back(Drift{entry.component_id, path, DriftKind::Modified,
                                       entry.content_hash,
                                       actual != content.file_hashes.end() ? actual->second : ""});
            }
        }
    }

    if (!entry.root.empty()) {
        std::string root = join_path(project_root, entry.root);
        if (is_directory(root)) {
            for (const auto& path : walk_files(root, project_root)) {
                if (std::binary_search(entry.installed_files.begin(),
                                       entry.installed_files.end(), path)) {
                    continue;
                }
                if (store && store->owner_of(path)) continue;

                std::string actual_hash;
                auto actual = compute_sha256(join_path(project_root, path));
                if (actual.ok) actual_hash = format_digest(actual.hex_digest);
                drifts.push_back(
                    Drift{entry.component_id, path, DriftKind::Added, "", actual_hash});
            }
        }
    }

    std::sort(drifts.begin(), drifts.end(), [](const Drift& a, const Drift& b) {
        return a.path < b.path;
    });
    return drifts;
}

bool entry_intact(const LockEntry& entry, const std::string& project_root) {
    LockEntry without_root = entry;
    without_root.root.clear();
    return diff_entry(without_root, project_root).empty();
}

Result<std::vector<Drift>> DiffEngine::diff(const std::optional<std::string>& component_id) const {
    using R = Result<std::vector<Drift>>;

    std::vector<LockEntry> entries;
    if (component_id) {
        auto entry = store_.get(*component_id);
        if (!entry) {
            return R::err(Error(ErrorCode::FILE_NOT_FOUND,
                                "component not installed: " + *component_id));
        }
        entries.push_back(*entry);
    } else {
        entries = store_.all_entries();
    }

    std::vector<Drift> drifts;
    for (const auto& entry : entries) {
        auto found = diff_entry(entry, project_root_, &store_);
        drifts.insert(drifts.end(), found.begin(), found.end());
    }

    spdlog::debug("diff checked {} entries, {} drifted paths", entries.size(), drifts.size());
    return R::ok(std::move(drifts));
}

} // namespace ocx
