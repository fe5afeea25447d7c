#pragma once

/**
 * @file registry_client.hpp
 * @brief Read-only access to component registries
 *
 * Registry protocol (all requests relative to Registry::base_url):
 *
 *   GET /index.json                 component summaries
 *   GET /components/{name}.json     component document, every release
 *   GET /components/{name}/{path}   raw file bytes
 *   GET /.well-known/ocx.json       optional capabilities document
 *
 * Index and component documents are memoised per client, so a single
 * resolution never fetches the same document twice. Nothing is retried.
 */

#include "ocx/errors.hpp"
#include "ocx/http.hpp"
#include "ocx/semver.hpp"
#include "ocx/types.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace ocx {

// ============================================================================
// Registry Documents
// ============================================================================

// Every release of one component, keyed by version string
struct ComponentDocument {
    std::string name;
    ComponentType type = ComponentType::Skill;
    std::string description;
    std::map<std::string, ComponentManifest> releases;
};

// Accepts a bare array of summaries or {"components": [...]}
Result<std::vector<ComponentSummary>> parse_index_document(const std::string& text);

// Accepts {"versions": {...}} or a single top-level release
Result<ComponentDocument> parse_component_document(const std::string& text);

// ============================================================================
// Registry Client
// ============================================================================

class RegistryClient {
public:
    explicit RegistryClient(std::shared_ptr<HttpTransport> transport);

    Result<std::vector<ComponentSummary>> fetch_index(const Registry& registry);

    // Highest release satisfying range (the pinned version only, when the
    // registry is pinned)
    Result<ComponentManifest> fetch_manifest(const Registry& registry,
                                             const std::string& name,
                                             const VersionRange& range);
    Result<ComponentManifest> fetch_manifest(const Registry& registry,
                                             const std::string& name,
                                             const std::string& constraint);

    // Candidate versions after pin filtering, ascending
    Result<std::vector<std::string>> fetch_versions(const Registry& registry,
                                                    const std::string& name);

    Result<std::vector<uint8_t>> fetch_file(const Registry& registry,
                                            const std::string& name,
                                            const std::string& path);

    // Null json when the registry publishes no capabilities document
    Result<nlohmann::json> fetch_capabilities(const Registry& registry);

    // True when the registry's index lists the component
    Result<bool> lists_component(const Registry& registry, const std::string& name);

private:
    Result<const ComponentDocument*> load_document(const Registry& registry,
                                                   const std::string& name);
    // Err only for non-https registries; HTTP failures stay in FetchResult
    Result<FetchResult> request(const Registry& registry, const std::string& path);

    std::shared_ptr<HttpTransport> transport_;
    std::map<std::string, std::vector<ComponentSummary>> index_cache_;
    std::map<std::string, ComponentDocument> document_cache_;
};

} // namespace ocx
