#include "ocx/installer.hpp"
#include "ocx/diff.hpp"
#include "ocx/digest.hpp"
#include "ocx/platform.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <map>
#include <optional>
#include <utility>

namespace ocx {

namespace {

// One file about to be written, with what it replaces
struct StagedFile {
    std::string path;                                // project-relative
    std::vector<uint8_t> content;
    std::optional<std::vector<uint8_t>> previous;    // nullopt when the file did not exist
};

std::string type_directory(ComponentType type) {
    return component_type_to_string(type);
}

void rollback(const std::vector<StagedFile>& written, const std::string& project_root) {
    for (auto it = written.rbegin(); it != written.rend(); ++it) {
        std::string full = join_path(project_root, it->path);
        if (it->previous) {
            auto restored = atomic_write_file(full, *it->previous);
            if (!restored.ok) {
                spdlog::warn("rollback could not restore {}: {}", it->path, restored.error);
            }
        } else if (!remove_file(full)) {
            spdlog::warn("rollback could not remove {}", it->path);
        }
    }
}

// Drop now-empty directories between path's parent and stop_at
void prune_empty_parents(const std::string& path, const std::string& stop_at) {
    std::string dir = get_parent_directory(path);
    while (!dir.empty() && dir != stop_at && dir.size() > stop_at.size()) {
        if (!is_directory(dir) || !list_directory(dir).empty()) break;
        if (!remove_directory(dir)) break;
        dir = get_parent_directory(dir);
    }
}

} // namespace

std::string owned_root(const ComponentManifest& manifest, const std::string& component_path) {
    if (manifest.type != ComponentType::Skill) return "";
    return to_portable_path(join_path(component_path, "skill/" + manifest.name));
}

Result<std::string> place_file(const ComponentManifest& manifest,
                               const FileSpec& file,
                               const InstallerLayout& layout) {
    using R = Result<std::string>;
    std::string id = manifest.name + "@" + manifest.version;

    auto source = validate_relative_path(file.source, layout.project_root);
    if (!source.safe) {
        return R::err(Error(ErrorCode::INVALID_ARGUMENT, id + ": bad file source: " + source.error));
    }

    std::string relative;
    if (!file.target.empty()) {
        relative = file.target;
    } else {
        switch (manifest.type) {
            case ComponentType::Skill:
                relative = join_path(layout.component_path,
                                     "skill/" + manifest.name + "/" + source.normalized_path);
                break;
            case ComponentType::Agent:
            case ComponentType::Plugin:
            case ComponentType::Command:
            case ComponentType::Tool:
                relative = join_path(layout.component_path,
                                     type_directory(manifest.type) + "/" + source.normalized_path);
                break;
            case ComponentType::Bundle:
                return R::err(Error(ErrorCode::INVALID_ARGUMENT,
                                    id + ": bundles own no files but declares " + file.source));
        }
    }

    auto target = validate_relative_path(relative, layout.project_root);
    if (!target.safe) {
        return R::err(Error(ErrorCode::INVALID_ARGUMENT, id + ": bad file target: " + target.error));
    }

    const std::string& placed = target.normalized_path;
    for (const auto& reserved : layout.reserved) {
        if (placed == reserved || placed.rfind(reserved + "/", 0) == 0) {
            return R::err(Error(ErrorCode::PATH_CONFLICT,
                                id + ": " + placed + " is reserved for ocx"));
        }
    }
    return R::ok(placed);
}

Installer::Installer(RegistryClient& client, IntegrityStore& store, AggregateConfig& config,
                     InstallerLayout layout)
    : client_(client), store_(store), config_(config), layout_(std::move(layout)) {}

Result<InstallSummary> Installer::install(const std::vector<PlanEntry>& plan,
                                          const InstallOptions& options) {
    InstallSummary summary;

    for (const auto& entry : plan) {
        bool skipped = false;
        auto installed = install_one(entry, options, skipped);
        if (installed.isErr()) {
            return Result<InstallSummary>::err(installed.error());
        }
        if (skipped) {
            summary.skipped.push_back(entry.component_id);
        }
        summary.entries.push_back(std::move(installed.value()));
    }

    return Result<InstallSummary>::ok(std::move(summary));
}

Result<LockEntry> Installer::install_one(const PlanEntry& plan_entry,
                                         const InstallOptions& options,
                                         bool& skipped) {
    using R = Result<LockEntry>;
    const std::string& id = plan_entry.component_id;
    const ComponentManifest& manifest = plan_entry.manifest;

    auto existing = store_.get(id);
    if (existing && existing->version == plan_entry.version && !options.reinstall &&
        entry_intact(*existing, layout_.project_root)) {
        spdlog::debug("{}@{} already installed", id, plan_entry.version);
        skipped = true;
        return R::ok(*existing);
    }

    // 1. Fetch every declared file before touching the project
    std::vector<StagedFile> staged;
    std::map<std::string, std::string> sources;  // target -> source
    for (const auto& file : manifest.files) {
        auto target = place_file(manifest, file, layout_);
        if (target.isErr()) return R::err(target.error());

        if (sources.count(target.value())) {
            return R::err(Error(ErrorCode::PATH_CONFLICT,
                                id + ": " + file.source + " and " + sources[target.value()] +
                                    " both target " + target.value()));
        }
        sources[target.value()] = file.source;

        auto content = client_.fetch_file(plan_entry.registry, plan_entry.name, file.source);
        if (content.isErr()) return R::err(content.error());

        StagedFile staged_file;
        staged_file.path = target.value();
        staged_file.content = std::move(content.value());
        staged.push_back(std::move(staged_file));
    }

    std::string root = owned_root(manifest, layout_.component_path);

    // 2. Ownership: every target is ours, free, or taken over with overwrite
    std::map<std::string, std::vector<std::string>> transfers;  // previous owner -> paths
    for (auto& file : staged) {
        std::string full = join_path(layout_.project_root, file.path);
        auto owner = store_.owner_of(file.path);

        if (owner && *owner != id) {
            if (!options.overwrite) {
                return R::err(Error(ErrorCode::PATH_CONFLICT,
                                    file.path + " is owned by " + *owner + ", requested by " + id));
            }
            transfers[*owner].push_back(file.path);
        }

        if (is_directory(full)) {
            return R::err(Error(ErrorCode::PATH_CONFLICT,
                                id + ": " + file.path + " is a directory"));
        }

        if (path_exists(full)) {
            file.previous = read_file_bytes(full);
            if (!file.previous) {
                return R::err(Error(ErrorCode::IO_ERROR, "cannot read " + full));
            }
            bool untracked = !owner;
            if (untracked && *file.previous != file.content && !options.overwrite) {
                return R::err(Error(ErrorCode::PATH_CONFLICT,
                                    file.path + " exists and is not managed by ocx, requested by " +
                                        id));
            }
        }
    }

    for (const auto& other : store_.all_entries()) {
        if (!root.empty() && other.component_id != id && other.root == root) {
            return R::err(Error(ErrorCode::PATH_CONFLICT,
                                root + " is owned by " + other.component_id + ", requested by " +
                                    id));
        }
    }

    // 3. Write, rolling back this component on the first failure
    std::vector<StagedFile> written;
    for (const auto& file : staged) {
        std::string full = join_path(layout_.project_root, file.path);
        std::string parent = get_parent_directory(full);
        if (!parent.empty() && !create_directories(parent)) {
            rollback(written, layout_.project_root);
            return R::err(Error(ErrorCode::IO_ERROR, id + ": cannot create " + parent));
        }

        auto result = atomic_write_file(full, file.content);
        if (!result.ok) {
            rollback(written, layout_.project_root);
            return R::err(Error(ErrorCode::IO_ERROR, id + ": " + result.error));
        }
        written.push_back(file);
    }

    // 4. Hash what is on disk
    std::vector<std::string> paths;
    for (const auto& file : staged) {
        paths.push_back(file.path);
    }
    std::sort(paths.begin(), paths.end());

    auto hashed = compute_content_hash(layout_.project_root, paths);
    if (!hashed.ok) {
        rollback(written, layout_.project_root);
        return R::err(Error(ErrorCode::IO_ERROR, id + ": " + hashed.error));
    }

    // The same release with the same files must hash the same as when it was locked
    if (existing && existing->version == plan_entry.version &&
        existing->installed_files == paths && existing->content_hash != hashed.content_hash) {
        rollback(written, layout_.project_root);
        return R::err(Error(ErrorCode::HASH_MISMATCH,
                            id + "@" + plan_entry.version + " from " + plan_entry.registry.name +
                                " no longer matches the locked content hash " +
                                existing->content_hash));
    }

    std::string now = get_current_timestamp();
    LockEntry entry;
    entry.component_id = id;
    entry.registry = plan_entry.registry.name;
    entry.version = plan_entry.version;
    entry.type = manifest.type;
    entry.content_hash = hashed.content_hash;
    entry.installed_files = paths;
    entry.file_hashes = hashed.file_hashes;
    entry.root = root;
    entry.installed_at = existing ? existing->installed_at : now;
    entry.updated_at = now;

    // 5. Previous owners give up transferred paths and are rehashed
    std::vector<LockEntry> updates{entry};
    std::vector<LockEntry> previous_owners;
    for (const auto& [owner_id, lost] : transfers) {
        auto owner = store_.get(owner_id);
        if (!owner) continue;
        previous_owners.push_back(*owner);

        LockEntry shrunk = *owner;
        shrunk.installed_files.erase(
            std::remove_if(shrunk.installed_files.begin(), shrunk.installed_files.end(),
                           [&](const std::string& p) {
                               return std::find(lost.begin(), lost.end(), p) != lost.end();
                           }),
            shrunk.installed_files.end());
        for (const auto& p : lost) {
            shrunk.file_hashes.erase(p);
        }

        std::vector<std::string> present;
        for (const auto& p : shrunk.installed_files) {
            if (path_exists(join_path(layout_.project_root, p))) present.push_back(p);
        }
        auto rehashed = compute_content_hash(layout_.project_root, present);
        if (rehashed.ok) {
            shrunk.content_hash = rehashed.content_hash;
        }
        shrunk.updated_at = now;
        updates.push_back(std::move(shrunk));

        spdlog::info("{} transferred {} path(s) from {}", id, lost.size(), owner_id);
    }

    // 6. Record
    auto recorded = store_.record_all(updates);
    if (recorded.isErr()) {
        rollback(written, layout_.project_root);
        return R::err(recorded.error().withContext(id));
    }

    // 7. Config fragment, only once the lock entry that owns it exists
    std::optional<nlohmann::ordered_json> previous_fragment;
    for (const auto& [fragment_id, fragment] : config_.fragments()) {
        if (fragment_id == id) previous_fragment = fragment;
    }

    auto merged = config_.apply(id, manifest.config_fragment);
    if (merged.isErr()) {
        auto restored = previous_fragment ? config_.apply(id, *previous_fragment)
                                          : config_.remove(id);
        if (restored.isErr()) {
            spdlog::warn("rollback could not restore config fragment of {}: {}", id,
                         restored.error().message());
        }

        std::vector<LockEntry> previous_entries = previous_owners;
        if (existing) previous_entries.push_back(*existing);
        auto unrecorded = previous_entries.empty() ? Result<void>::ok()
                                                   : store_.record_all(previous_entries);
        if (unrecorded.isOk() && !existing) unrecorded = store_.remove(id);
        if (unrecorded.isErr()) {
            spdlog::warn("rollback could not restore the lock entry of {}: {}", id,
                         unrecorded.error().message());
        }

        rollback(written, layout_.project_root);
        return R::err(merged.error().withContext(id));
    }

    // Files the previous version declared and this one does not
    if (existing) {
        for (const auto& old_path : existing->installed_files) {
            if (std::binary_search(paths.begin(), paths.end(), old_path)) continue;
            if (store_.owner_of(old_path)) continue;

            std::string full = join_path(layout_.project_root, old_path);
            if (path_exists(full) && !remove_file(full)) {
                spdlog::warn("could not remove stale file {}", old_path);
                continue;
            }
            std::string stop = existing->root.empty()
                                   ? join_path(layout_.project_root, layout_.component_path)
                                   : join_path(layout_.project_root, existing->root);
            prune_empty_parents(full, stop);
        }
    }

    spdlog::info("installed {}@{} ({} files)", id, entry.version, entry.installed_files.size());
    return R::ok(std::move(entry));
}

} // namespace ocx
