#include "ocx/lockfile.hpp"
#include "ocx/platform.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>

namespace ocx {

namespace {

// Helper to safely get a string from JSON
std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

// Helper to safely get a string array from JSON
std::vector<std::string> get_string_array(const nlohmann::json& j, const std::string& key) {
    std::vector<std::string> result;
    if (j.contains(key) && j[key].is_array()) {
        for (const auto& elem : j[key]) {
            if (elem.is_string()) {
                result.push_back(elem.get<std::string>());
            }
        }
    }
    return result;
}

nlohmann::json entry_to_json(const LockEntry& entry) {
    nlohmann::json j;
    j["registry"] = entry.registry;
    j["version"] = entry.version;
    j["type"] = component_type_to_string(entry.type);
    j["contentHash"] = entry.content_hash;
    j["installedFiles"] = entry.installed_files;
    j["fileHashes"] = entry.file_hashes;
    if (!entry.root.empty()) {
        j["root"] = entry.root;
    }
    j["installedAt"] = entry.installed_at;
    j["updatedAt"] = entry.updated_at;
    return j;
}

// Every path must belong to at most one entry
Result<void> check_unique_paths(const std::map<std::string, LockEntry>& entries) {
    std::map<std::string, std::string> owners;
    for (const auto& [id, entry] : entries) {
        for (const auto& file : entry.installed_files) {
            auto inserted = owners.emplace(file, id);
            if (!inserted.second) {
                return Result<void>::err(
                    Error(ErrorCode::PATH_CONFLICT, file + " is claimed by both " +
                                                        inserted.first->second + " and " + id));
            }
        }
    }
    return Result<void>::ok();
}

} // namespace

Result<std::map<std::string, LockEntry>> parse_lockfile(const std::string& text) {
    using R = Result<std::map<std::string, LockEntry>>;

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        return R::err(Error(ErrorCode::CONFIG_INVALID, std::string("lockfile: ") + e.what()));
    }

    if (!j.is_object()) {
        return R::err(Error(ErrorCode::CONFIG_INVALID, "lockfile: JSON must be an object"));
    }

    if (j.contains("lockVersion")) {
        if (!j["lockVersion"].is_number_integer() || j["lockVersion"].get<int>() > kLockVersion) {
            return R::err(Error(ErrorCode::CONFIG_INVALID,
                                "lockfile: unsupported lockVersion " + j["lockVersion"].dump()));
        }
    }

    std::map<std::string, LockEntry> entries;
    if (!j.contains("installed")) return R::ok(std::move(entries));
    if (!j["installed"].is_object()) {
        return R::err(Error(ErrorCode::CONFIG_INVALID, "lockfile: installed must be an object"));
    }

    for (auto& [id, value] : j["installed"].items()) {
        if (!value.is_object()) {
            return R::err(Error(ErrorCode::CONFIG_INVALID, "lockfile: entry " + id +
                                                               " must be an object"));
        }

        LockEntry entry;
        entry.component_id = id;
        entry.registry = get_string(value, "registry").value_or("");
        entry.version = get_string(value, "version").value_or("");
        if (auto type = get_string(value, "type")) {
            entry.type = parse_component_type(*type).value_or(ComponentType::Skill);
        }
        entry.content_hash = get_string(value, "contentHash").value_or("");
        entry.installed_files = get_string_array(value, "installedFiles");
        if (value.contains("fileHashes") && value["fileHashes"].is_object()) {
            for (auto& [file, hash] : value["fileHashes"].items()) {
                if (hash.is_string()) {
                    entry.file_hashes[file] = hash.get<std::string>();
                }
            }
        }
        entry.root = get_string(value, "root").value_or("");
        entry.installed_at = get_string(value, "installedAt").value_or("");
        entry.updated_at = get_string(value, "updatedAt").value_or(entry.installed_at);

        if (entry.registry.empty() || entry.version.empty()) {
            return R::err(Error(ErrorCode::CONFIG_INVALID,
                                "lockfile: entry " + id + " lacks registry or version"));
        }

        std::sort(entry.installed_files.begin(), entry.installed_files.end());
        entries[id] = std::move(entry);
    }

    auto unique = check_unique_paths(entries);
    if (unique.isErr()) {
        return R::err(Error(ErrorCode::CONFIG_INVALID, "lockfile: " + unique.error().message()));
    }
    return R::ok(std::move(entries));
}

std::string serialize_lockfile(const std::map<std::string, LockEntry>& entries) {
    nlohmann::json j;
    j["lockVersion"] = kLockVersion;
    j["installed"] = nlohmann::json::object();
    for (const auto& [id, entry] : entries) {
        j["installed"][id] = entry_to_json(entry);
    }
    return j.dump(2) + "\n";
}

Result<IntegrityStore> IntegrityStore::open(const std::string& path) {
    IntegrityStore store(path);

    if (!path_exists(path)) {
        return Result<IntegrityStore>::ok(std::move(store));
    }

    auto text = read_file_text(path);
    if (!text) {
        return Result<IntegrityStore>::err(Error(ErrorCode::IO_ERROR, "cannot read " + path));
    }

    auto parsed = parse_lockfile(*text);
    if (parsed.isErr()) {
        return Result<IntegrityStore>::err(parsed.error().withContext(path));
    }

    store.entries_ = std::move(parsed.value());
    return Result<IntegrityStore>::ok(std::move(store));
}

Result<void> IntegrityStore::commit(std::map<std::string, LockEntry> next) {
    auto unique = check_unique_paths(next);
    if (unique.isErr()) return unique;

    std::string parent = get_parent_directory(path_);
    if (!parent.empty() && !create_directories(parent)) {
        return Result<void>::err(Error(ErrorCode::IO_ERROR, "cannot create " + parent));
    }

    auto written = atomic_write_file(path_, serialize_lockfile(next));
    if (!written.ok) {
        return Result<void>::err(Error(ErrorCode::IO_ERROR, written.error));
    }

    entries_ = std::move(next);
    return Result<void>::ok();
}

Result<void> IntegrityStore::record(const LockEntry& entry) {
    return record_all({entry});
}

Result<void> IntegrityStore::record_all(const std::vector<LockEntry>& entries) {
    std::map<std::string, LockEntry> next = entries_;
    for (const auto& entry : entries) {
        if (entry.component_id.empty()) {
            return Result<void>::err(Error(ErrorCode::INVALID_ARGUMENT,
                                           "lock entry without a component id"));
        }
        LockEntry copy = entry;
        std::sort(copy.installed_files.begin(), copy.installed_files.end());
        next[entry.component_id] = std::move(copy);
    }

    auto committed = commit(std::move(next));
    if (committed.isOk()) {
        for (const auto& entry : entries) {
            spdlog::debug("recorded {}@{}", entry.component_id, entry.version);
        }
    }
    return committed;
}

std::optional<LockEntry> IntegrityStore::get(const std::string& component_id) const {
    auto it = entries_.find(component_id);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

Result<void> IntegrityStore::remove(const std::string& component_id) {
    if (!entries_.count(component_id)) return Result<void>::ok();

    std::map<std::string, LockEntry> next = entries_;
    next.erase(component_id);
    return commit(std::move(next));
}

std::vector<LockEntry> IntegrityStore::all_entries() const {
    std::vector<LockEntry> result;
    result.reserve(entries_.size());
    for (const auto& [id, entry] : entries_) {
        result.push_back(entry);
    }
    return result;
}

std::optional<std::string> IntegrityStore::owner_of(const std::string& path) const {
    for (const auto& [id, entry] : entries_) {
        if (std::binary_search(entry.installed_files.begin(), entry.installed_files.end(), path)) {
            return id;
        }
    }
    return std::nullopt;
}

} // namespace ocx
