#include "ocx/registry_client.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace ocx {

namespace {

// Helper to safely get a string from JSON
std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

std::string join_url(const std::string& base, const std::string& path) {
    std::string result = base;
    while (!result.empty() && result.back() == '/') result.pop_back();
    if (path.empty() || path[0] != '/') result += '/';
    return result + path;
}

std::string bytes_to_string(const std::vector<uint8_t>& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

// "dependencies": ["reg/a@^1", "b"] or {"reg/a": "^1", "b": "*"}
bool parse_dependencies(const nlohmann::json& j, std::vector<std::string>& out,
                        std::string& error) {
    if (!j.contains("dependencies") || j["dependencies"].is_null()) return true;

    const auto& deps = j["dependencies"];
    if (deps.is_array()) {
        for (const auto& elem : deps) {
            if (!elem.is_string()) {
                error = "dependency entries must be strings";
                return false;
            }
            out.push_back(elem.get<std::string>());
        }
        return true;
    }
    if (deps.is_object()) {
        for (auto& [id, constraint] : deps.items()) {
            if (!constraint.is_string()) {
                error = "dependency constraint for " + id + " must be a string";
                return false;
            }
            std::string c = constraint.get<std::string>();
            out.push_back(c.empty() || c == "*" ? id : id + "@" + c);
        }
        return true;
    }
    error = "dependencies must be an array or object";
    return false;
}

// "files": ["SKILL.md", {"source": "x.md", "target": "docs/x.md"}]
bool parse_files(const nlohmann::json& j, std::vector<FileSpec>& out, std::string& error) {
    if (!j.contains("files") || j["files"].is_null()) return true;
    if (!j["files"].is_array()) {
        error = "files must be an array";
        return false;
    }

    for (const auto& elem : j["files"]) {
        FileSpec spec;
        if (elem.is_string()) {
            spec.source = elem.get<std::string>();
        } else if (elem.is_object()) {
            spec.source = get_string(elem, "source").value_or("");
            spec.target = get_string(elem, "target").value_or("");
        } else {
            error = "file entries must be strings or objects";
            return false;
        }
        if (spec.source.empty()) {
            error = "file entry without a source";
            return false;
        }
        out.push_back(std::move(spec));
    }
    return true;
}

bool parse_release(const nlohmann::ordered_json& release, const ComponentDocument& doc,
                   const std::string& version, ComponentManifest& out, std::string& error) {
    if (!release.is_object()) {
        error = "release " + version + " must be an object";
        return false;
    }

    // ordered_json -> json for the generic helpers; config keeps its key order
    nlohmann::json plain = nlohmann::json::parse(release.dump());

    out.name = doc.name;
    out.type = doc.type;
    out.version = version;
    out.description = get_string(plain, "description").value_or(doc.description);

    if (auto type = get_string(plain, "type")) {
        auto parsed = parse_component_type(*type);
        if (!parsed) {
            error = "unknown component type: " + *type;
            return false;
        }
        out.type = *parsed;
    }

    if (!parse_dependencies(plain, out.dependencies, error)) return false;
    if (!parse_files(plain, out.files, error)) return false;

    if (release.contains("config")) {
        if (!release["config"].is_object()) {
            error = "config must be an object";
            return false;
        }
        out.config_fragment = release["config"];
    }
    return true;
}

} // namespace

// ============================================================================
// Document Parsing
// ============================================================================

Result<std::vector<ComponentSummary>> parse_index_document(const std::string& text) {
    using R = Result<std::vector<ComponentSummary>>;

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        return R::err(Error(ErrorCode::REGISTRY_UNAVAILABLE,
                            std::string("malformed index: ") + e.what()));
    }

    const nlohmann::json* list = &j;
    if (j.is_object() && j.contains("components")) {
        list = &j["components"];
    }
    if (!list->is_array()) {
        return R::err(Error(ErrorCode::REGISTRY_UNAVAILABLE,
                            "malformed index: expected an array of components"));
    }

    std::vector<ComponentSummary> summaries;
    for (const auto& elem : *list) {
        if (!elem.is_object()) continue;
        auto name = get_string(elem, "name");
        if (!name || name->empty()) continue;

        ComponentSummary summary;
        summary.name = *name;
        if (auto type = get_string(elem, "type")) {
            summary.type = parse_component_type(*type).value_or(ComponentType::Skill);
        }
        summary.latest_version = get_string(elem, "latestVersion")
                                     .value_or(get_string(elem, "version").value_or(""));
        summary.description = get_string(elem, "description").value_or("");
        summaries.push_back(std::move(summary));
    }
    return R::ok(std::move(summaries));
}

Result<ComponentDocument> parse_component_document(const std::string& text) {
    using R = Result<ComponentDocument>;

    nlohmann::ordered_json j;
    try {
        j = nlohmann::ordered_json::parse(text);
    } catch (const nlohmann::ordered_json::parse_error& e) {
        return R::err(Error(ErrorCode::REGISTRY_UNAVAILABLE,
                            std::string("malformed component document: ") + e.what()));
    }

    if (!j.is_object()) {
        return R::err(Error(ErrorCode::REGISTRY_UNAVAILABLE,
                            "malformed component document: expected an object"));
    }

    ComponentDocument doc;
    if (j.contains("name") && j["name"].is_string()) {
        doc.name = j["name"].get<std::string>();
    }
    if (j.contains("description") && j["description"].is_string()) {
        doc.description = j["description"].get<std::string>();
    }
    if (j.contains("type") && j["type"].is_string()) {
        std::string type = j["type"].get<std::string>();
        auto parsed = parse_component_type(type);
        if (!parsed) {
            return R::err(Error(ErrorCode::REGISTRY_UNAVAILABLE,
                                "unknown component type: " + type));
        }
        doc.type = *parsed;
    }

    std::string error;
    if (j.contains("versions")) {
        if (!j["versions"].is_object()) {
            return R::err(Error(ErrorCode::REGISTRY_UNAVAILABLE,
                                "malformed component document: versions must be an object"));
        }
        for (auto& [version, release] : j["versions"].items()) {
            if (!parse_version(version)) {
                return R::err(Error(ErrorCode::REGISTRY_UNAVAILABLE,
                                    "invalid version in component document: " + version));
            }
            ComponentManifest manifest;
            if (!parse_release(release, doc, version, manifest, error)) {
                return R::err(Error(ErrorCode::REGISTRY_UNAVAILABLE, error));
            }
            doc.releases[version] = std::move(manifest);
        }
    } else {
        std::string version = j.contains("version") && j["version"].is_string()
                                  ? j["version"].get<std::string>()
                                  : "";
        if (!parse_version(version)) {
            return R::err(Error(ErrorCode::REGISTRY_UNAVAILABLE,
                                "component document has no valid version"));
        }
        ComponentManifest manifest;
        if (!parse_release(j, doc, version, manifest, error)) {
            return R::err(Error(ErrorCode::REGISTRY_UNAVAILABLE, error));
        }
        doc.releases[version] = std::move(manifest);
    }

    return R::ok(std::move(doc));
}

// ============================================================================
// Registry Client
// ============================================================================

RegistryClient::RegistryClient(std::shared_ptr<HttpTransport> transport)
    : transport_(std::move(transport)) {}

Result<FetchResult> RegistryClient::request(const Registry& registry,
                                            const std::string& path) {
    std::string url = join_url(registry.base_url, path);
    if (!is_https_url(url)) {
        return Result<FetchResult>::err(
            Error(ErrorCode::INVALID_ARGUMENT,
                  "registry " + registry.name + " is not https: " + registry.base_url));
    }

    FetchResult response = transport_->get(url);
    if (!response.ok) {
        response.error = url + ": " + response.error;
    }
    return Result<FetchResult>::ok(std::move(response));
}

Result<std::vector<ComponentSummary>> RegistryClient::fetch_index(const Registry& registry) {
    using R = Result<std::vector<ComponentSummary>>;

    auto cached = index_cache_.find(registry.base_url);
    if (cached != index_cache_.end()) {
        return R::ok(cached->second);
    }

    auto response = request(registry, "/index.json");
    if (response.isErr()) return R::err(response.error());
    if (!response.value().ok) {
        return R::err(Error(ErrorCode::REGISTRY_UNAVAILABLE,
                            "registry " + registry.name + ": " + response.value().error));
    }

    auto parsed = parse_index_document(bytes_to_string(response.value().data));
    if (parsed.isErr()) {
        return R::err(parsed.error().withContext("registry " + registry.name));
    }

    index_cache_[registry.base_url] = parsed.value();
    return parsed;
}

Result<bool> RegistryClient::lists_component(const Registry& registry,
                                             const std::string& name) {
    auto index = fetch_index(registry);
    if (index.isErr()) return Result<bool>::err(index.error());

    for (const auto& summary : index.value()) {
        if (summary.name == name) return Result<bool>::ok(true);
    }
    return Result<bool>::ok(false);
}

Result<const ComponentDocument*> RegistryClient::load_document(const Registry& registry,
                                                               const std::string& name) {
    using R = Result<const ComponentDocument*>;

    std::string key = registry.base_url + "\n" + name;
    auto cached = document_cache_.find(key);
    if (cached != document_cache_.end()) {
        return R::ok(&cached->second);
    }

    auto response = request(registry, "/components/" + name + ".json");
    if (response.isErr()) return R::err(response.error());

    // A missing component document is FileNotFound; any other failure means
    // the registry is unavailable
    const FetchResult& fetched = response.value();
    if (!fetched.ok) {
        ErrorCode code = fetched.http_status == 404 ? ErrorCode::FILE_NOT_FOUND
                                                    : ErrorCode::REGISTRY_UNAVAILABLE;
        return R::err(Error(code, make_component_id(registry.name, name) + ": " + fetched.error));
    }

    auto parsed = parse_component_document(bytes_to_string(fetched.data));
    if (parsed.isErr()) {
        return R::err(parsed.error().withContext(make_component_id(registry.name, name)));
    }

    ComponentDocument doc = std::move(parsed.value());
    if (doc.name.empty()) doc.name = name;
    for (auto& [version, release] : doc.releases) {
        release.name = name;
    }

    spdlog::debug("loaded {} ({} releases)", make_component_id(registry.name, name),
                  doc.releases.size());

    auto inserted = document_cache_.emplace(key, std::move(doc));
    return R::ok(&inserted.first->second);
}

Result<std::vector<std::string>> RegistryClient::fetch_versions(const Registry& registry,
                                                                const std::string& name) {
    using R = Result<std::vector<std::string>>;

    auto doc = load_document(registry, name);
    if (doc.isErr()) return R::err(doc.error());

    std::vector<std::string> versions;
    for (const auto& [version, release] : doc.value()->releases) {
        if (!registry.pinned_version.empty()) {
            auto pinned = parse_version(registry.pinned_version);
            auto candidate = parse_version(version);
            if (!pinned || !candidate || !(*pinned == *candidate)) continue;
        }
        versions.push_back(version);
    }

    sort_versions(versions);
    return R::ok(std::move(versions));
}

Result<ComponentManifest> RegistryClient::fetch_manifest(const Registry& registry,
                                                         const std::string& name,
                                                         const VersionRange& range) {
    using R = Result<ComponentManifest>;

    auto versions = fetch_versions(registry, name);
    if (versions.isErr()) return R::err(versions.error());

    std::string id = make_component_id(registry.name, name);
    if (versions.value().empty()) {
        std::string why = registry.pinned_version.empty()
                              ? "no releases published"
                              : "registry pinned to " + registry.pinned_version +
                                    " which is not published";
        return R::err(Error(ErrorCode::UNSATISFIABLE_VERSION, id + ": " + why));
    }

    auto best = highest_satisfying(versions.value(), range);
    if (!best) {
        return R::err(Error(ErrorCode::UNSATISFIABLE_VERSION,
                            id + ": no release satisfies the requested constraint"));
    }

    auto doc = load_document(registry, name);
    if (doc.isErr()) return R::err(doc.error());
    return R::ok(doc.value()->releases.at(*best));
}

Result<ComponentManifest> RegistryClient::fetch_manifest(const Registry& registry,
                                                         const std::string& name,
                                                         const std::string& constraint) {
    auto range = parse_range(constraint);
    if (!range) {
        return Result<ComponentManifest>::err(
            Error(ErrorCode::INVALID_ARGUMENT,
                  make_component_id(registry.name, name) + ": invalid version constraint '" +
                      constraint + "'"));
    }
    return fetch_manifest(registry, name, *range);
}

Result<std::vector<uint8_t>> RegistryClient::fetch_file(const Registry& registry,
                                                        const std::string& name,
                                                        const std::string& path) {
    using R = Result<std::vector<uint8_t>>;

    auto response = request(registry, "/components/" + name + "/" + path);
    if (response.isErr()) return R::err(response.error());
    if (!response.value().ok) {
        return R::err(Error(ErrorCode::FILE_NOT_FOUND, make_component_id(registry.name, name) +
                                                           ": " + response.value().error));
    }
    return R::ok(std::move(response.value().data));
}

Result<nlohmann::json> RegistryClient::fetch_capabilities(const Registry& registry) {
    using R = Result<nlohmann::json>;

    auto response = request(registry, "/.well-known/ocx.json");
    if (response.isErr()) return R::err(response.error());

    const FetchResult& fetched = response.value();
    if (!fetched.ok) {
        // An absent discovery document is fine
        if (fetched.http_status == 404) return R::ok(nlohmann::json());
        return R::err(Error(ErrorCode::REGISTRY_UNAVAILABLE,
                            "registry " + registry.name + ": " + fetched.error));
    }

    try {
        return R::ok(nlohmann::json::parse(bytes_to_string(fetched.data)));
    } catch (const nlohmann::json::parse_error& e) {
        return R::err(Error(ErrorCode::REGISTRY_UNAVAILABLE,
                            "registry " + registry.name + ": malformed capabilities document: " +
                                e.what()));
    }
}

} // namespace ocx
