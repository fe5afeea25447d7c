#pragma once

/**
 * @file diff.hpp
 * @brief Drift detection between installed files and the integrity store
 *
 * For each lock entry every installed path is re-read and re-hashed:
 *
 *   Modified  recorded hash and on-disk hash differ (HashMismatch)
 *   Missing   listed in the entry but absent on disk
 *   Added     present under the component's owned directory, listed by no entry
 *
 * An empty result means no drift.
 */

#include "ocx/errors.hpp"
#include "ocx/lockfile.hpp"
#include "ocx/types.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ocx {

enum class DriftKind {
    Added,
    Missing,
    Modified
};

inline const char* drift_kind_to_string(DriftKind kind) {
    switch (kind) {
        case DriftKind::Added: return "Added";
        case DriftKind::Missing: return "Missing";
        case DriftKind::Modified: return "Modified";
        default: return "Modified";
    }
}

struct Drift {
    std::string component_id;
    std::string path;           // project-relative, portable
    DriftKind kind = DriftKind::Modified;
    std::string expected_hash;  // empty for Added
    std::string actual_hash;    // empty for Missing
};

// Drift of one entry. With a store, paths claimed by other entries are never
// reported as Added.
std::vector<Drift> diff_entry(const LockEntry& entry, const std::string& project_root,
                              const IntegrityStore* store = nullptr);

// True when an entry has neither Missing nor Modified paths
bool entry_intact(const LockEntry& entry, const std::string& project_root);

class DiffEngine {
public:
    DiffEngine(const IntegrityStore& store, std::string project_root)
        : store_(store), project_root_(std::move(project_root)) {}

    // All entries, or just component_id (FILE_NOT_FOUND when not installed).
    // Sorted by component id, then path.
    Result<std::vector<Drift>> diff(const std::optional<std::string>& component_id = std::nullopt) const;

private:
    const IntegrityStore& store_;
    std::string project_root_;
};

} // namespace ocx
