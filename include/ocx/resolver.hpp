#pragma once

/**
 * @file resolver.hpp
 * @brief Dependency resolution into a topologically ordered install plan
 *
 * Each component id binds to exactly one (registry, version). Constraints
 * placed on one component by different dependents are intersected and the
 * highest release satisfying all of them wins. Identical requests against
 * identical registry state always produce the identical plan.
 */

#include "ocx/errors.hpp"
#include "ocx/registry_client.hpp"
#include "ocx/types.hpp"

#include <map>
#include <string>
#include <vector>

namespace ocx {

struct PlanEntry {
    std::string component_id;   // "registry/name"
    Registry registry;
    std::string name;
    std::string version;
    ComponentManifest manifest;
    std::vector<std::string> dependencies;  // component ids, sorted
};

// One constraint placed on a component, and who placed it
struct VersionDemand {
    std::string from;        // "requested" or "registry/name@version"
    std::string constraint;  // as written, empty for any release
};

class Resolver {
public:
    // registries are given in priority order
    Resolver(RegistryClient& client, std::vector<Registry> registries);

    // Dependencies come before dependents; ties are broken by component id
    Result<std::vector<PlanEntry>> resolve(const std::vector<ComponentRequest>& requests);

    // Registry an unqualified name binds to: the registry of a qualified root
    // of the same name in the current resolve, else the first registry, in
    // priority order, whose index lists it
    Result<Registry> locate(const ComponentRequest& request);

private:
    Result<std::vector<PlanEntry>> resolve_pass(const std::vector<ComponentRequest>& requests,
                                                const std::map<std::string, std::string>& pinned,
                                                std::map<std::string, std::string>& reselected);

    RegistryClient& client_;
    std::vector<Registry> registries_;
    std::map<std::string, std::string> located_;  // name -> registry name
    std::map<std::string, std::string> rooted_;   // name -> registry of a qualified root
};

// Render demands as "^1.0.0 (a/x@1.2.0), * (requested)"
std::string describe_demands(const std::vector<VersionDemand>& demands);

// Returns the first cycle found as "a -> b -> a", or empty when acyclic.
// Nodes and edges are visited in sorted order.
std::string find_cycle(const std::map<std::string, std::vector<std::string>>& edges);

// Kahn ordering with a lexicographic ready queue. Every dependency must be a
// key of edges and the graph must be acyclic.
std::vector<std::string> topological_order(
    const std::map<std::string, std::vector<std::string>>& edges);

} // namespace ocx
