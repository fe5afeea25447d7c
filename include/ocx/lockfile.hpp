#pragma once

/**
 * @file lockfile.hpp
 * @brief Integrity store persisted as ocx.lock
 *
 * Document shape:
 *
 *   {
 *     "lockVersion": 1,
 *     "installed": {
 *       "registry/name": {
 *         "registry": "...", "version": "...", "type": "skill",
 *         "contentHash": "sha256:...", "installedFiles": [...],
 *         "fileHashes": {"path": "sha256:..."}, "root": "...",
 *         "installedAt": "...", "updatedAt": "..."
 *       }
 *     }
 *   }
 *
 * Every mutation is applied to a copy, validated, written atomically and
 * only then swapped in, so the file on disk and the in-memory view never
 * disagree and a crash leaves the previous document in place.
 */

#include "ocx/errors.hpp"
#include "ocx/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ocx {

constexpr int kLockVersion = 1;

// Parse/serialize without touching disk
Result<std::map<std::string, LockEntry>> parse_lockfile(const std::string& text);
std::string serialize_lockfile(const std::map<std::string, LockEntry>& entries);

class IntegrityStore {
public:
    // A missing file opens an empty store; a malformed one is CONFIG_INVALID
    static Result<IntegrityStore> open(const std::string& path);

    // Insert or replace. Fails with PATH_CONFLICT when another entry already
    // claims one of the entry's paths.
    Result<void> record(const LockEntry& entry);

    // Replace several entries in one write (used when a path changes owner)
    Result<void> record_all(const std::vector<LockEntry>& entries);

    std::optional<LockEntry> get(const std::string& component_id) const;

    // Removing an unknown id is a no-op
    Result<void> remove(const std::string& component_id);

    std::vector<LockEntry> all_entries() const;

    // Component id that lists path, if any
    std::optional<std::string> owner_of(const std::string& path) const;

    const std::string& path() const { return path_; }

private:
    explicit IntegrityStore(std::string path) : path_(std::move(path)) {}

    Result<void> commit(std::map<std::string, LockEntry> next);

    std::string path_;
    std::map<std::string, LockEntry> entries_;
};

} // namespace ocx
