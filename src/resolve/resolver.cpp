#include "ocx/resolver.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <deque>
#include <functional>
#include <set>
#include <tuple>
#include <utility>

namespace ocx {

namespace {

// Passes before giving up on a selection that keeps changing
constexpr int kMaxResolvePasses = 16;

struct QueuedRequest {
    std::string component_id;
    Registry registry;
    std::string name;
    VersionDemand demand;
};

VersionRange exact_range(const std::string& version) {
    return parse_range("=" + version).value_or(any_version());
}

} // namespace

std::string describe_demands(const std::vector<VersionDemand>& demands) {
    std::string out;
    for (const auto& demand : demands) {
        if (!out.empty()) out += ", ";
        out += (demand.constraint.empty() ? "*" : demand.constraint) + " (" + demand.from + ")";
    }
    return out;
}

std::string find_cycle(const std::map<std::string, std::vector<std::string>>& edges) {
    enum class Mark { Unvisited, Active, Done };
    std::map<std::string, Mark> marks;
    std::vector<std::string> stack;
    std::string cycle;

    std::function<bool(const std::string&)> visit = [&](const std::string& node) {
        marks[node] = Mark::Active;
        stack.push_back(node);

        auto it = edges.find(node);
        if (it != edges.end()) {
            std::vector<std::string> deps = it->second;
            std::sort(deps.begin(), deps.end());
            for (const auto& dep : deps) {
                Mark mark = marks.count(dep) ? marks[dep] : Mark::Unvisited;
                if (mark == Mark::Active) {
                    auto start = std::find(stack.begin(), stack.end(), dep);
                    for (auto s = start; s != stack.end(); ++s) {
                        cycle += *s + " -> ";
                    }
                    cycle += dep;
                    return true;
                }
                if (mark == Mark::Unvisited && visit(dep)) return true;
            }
        }

        stack.pop_back();
        marks[node] = Mark::Done;
        return false;
    };

    for (const auto& [node, deps] : edges) {
        if (marks.count(node) && marks[node] != Mark::Unvisited) continue;
        if (visit(node)) return cycle;
    }
    return "";
}

std::vector<std::string> topological_order(
    const std::map<std::string, std::vector<std::string>>& edges) {
    std::map<std::string, size_t> pending;
    std::map<std::string, std::vector<std::string>> dependents;

    for (const auto& [node, deps] : edges) {
        std::set<std::string> unique(deps.begin(), deps.end());
        pending[node] = unique.size();
        for (const auto& dep : unique) {
            dependents[dep].push_back(node);
        }
    }

    std::set<std::string> ready;
    for (const auto& [node, count] : pending) {
        if (count == 0) ready.insert(node);
    }

    std::vector<std::string> order;
    while (!ready.empty()) {
        std::string node = *ready.begin();
        ready.erase(ready.begin());
        order.push_back(node);

        for (const auto& dependent : dependents[node]) {
            if (--pending[dependent] == 0) {
                ready.insert(dependent);
            }
        }
    }
    return order;
}

Resolver::Resolver(RegistryClient& client, std::vector<Registry> registries)
    : client_(client), registries_(std::move(registries)) {}

Result<Registry> Resolver::locate(const ComponentRequest& request) {
    using R = Result<Registry>;

    if (request.qualified()) {
        for (const auto& registry : registries_) {
            if (registry.name == request.registry) return R::ok(registry);
        }
        return R::err(Error(ErrorCode::INVALID_ARGUMENT,
                            "registry not configured: " + request.registry + " (requested by " +
                                request.registry + "/" + request.name + ")"));
    }

    auto rooted = rooted_.find(request.name);
    if (rooted != rooted_.end()) {
        for (const auto& registry : registries_) {
            if (registry.name == rooted->second) return R::ok(registry);
        }
    }

    auto cached = located_.find(request.name);
    if (cached != located_.end()) {
        for (const auto& registry : registries_) {
            if (registry.name == cached->second) return R::ok(registry);
        }
    }

    for (const auto& registry : registries_) {
        auto listed = client_.lists_component(registry, request.name);
        if (listed.isErr()) return R::err(listed.error());
        if (listed.value()) {
            located_[request.name] = registry.name;
            return R::ok(registry);
        }
    }

    if (registries_.empty()) {
        return R::err(Error(ErrorCode::INVALID_ARGUMENT,
                            "no registries configured to search for " + request.name));
    }
    return R::err(Error(ErrorCode::FILE_NOT_FOUND,
                        "component not found in any configured registry: " + request.name));
}

Result<std::vector<PlanEntry>> Resolver::resolve_pass(
    const std::vector<ComponentRequest>& requests,
    const std::map<std::string, std::string>& pinned,
    std::map<std::string, std::string>& reselected) {
    using R = Result<std::vector<PlanEntry>>;

    std::map<std::string, std::vector<VersionDemand>> demands;
    std::map<std::string, PlanEntry> nodes;
    std::deque<QueuedRequest> queue;

    auto enqueue = [&](const ComponentRequest& request, const std::string& from) -> Result<void> {
        auto registry = locate(request);
        if (registry.isErr()) {
            return Result<void>::err(registry.error().withContext(from));
        }
        QueuedRequest item;
        item.component_id = make_component_id(registry.value().name, request.name);
        item.registry = registry.value();
        item.name = request.name;
        item.demand = VersionDemand{from, request.constraint};
        queue.push_back(std::move(item));
        return Result<void>::ok();
    };

    // Roots in identifier order so the walk never depends on argument order
    std::vector<ComponentRequest> roots = requests;
    std::sort(roots.begin(), roots.end(), [](const ComponentRequest& a, const ComponentRequest& b) {
        return std::make_tuple(a.registry, a.name, a.constraint) <
               std::make_tuple(b.registry, b.name, b.constraint);
    });
    for (const auto& request : roots) {
        auto queued = enqueue(request, "requested");
        if (queued.isErr()) return R::err(queued.error());
    }

    auto intersect_demands = [](const std::vector<VersionDemand>& list,
                                const std::string& id) -> Result<VersionRange> {
        VersionRange range = any_version();
        for (const auto& demand : list) {
            auto parsed = parse_range(demand.constraint);
            if (!parsed) {
                return Result<VersionRange>::err(
                    Error(ErrorCode::INVALID_ARGUMENT, id + ": invalid version constraint '" +
                                                           demand.constraint + "' (" +
                                                           demand.from + ")"));
            }
            range = intersect(range, *parsed);
        }
        return Result<VersionRange>::ok(std::move(range));
    };

    while (!queue.empty()) {
        QueuedRequest item = std::move(queue.front());
        queue.pop_front();

        demands[item.component_id].push_back(item.demand);
        if (nodes.count(item.component_id)) continue;

        std::string version;
        auto prior = pinned.find(item.component_id);
        if (prior != pinned.end()) {
            version = prior->second;
        } else {
            auto range = intersect_demands(demands[item.component_id], item.component_id);
            if (range.isErr()) return R::err(range.error());
            auto manifest = client_.fetch_manifest(item.registry, item.name, range.value());
            if (manifest.isErr()) {
                if (manifest.error().code() == ErrorCode::UNSATISFIABLE_VERSION) {
                    return R::err(Error(ErrorCode::UNSATISFIABLE_VERSION,
                                        item.component_id + ": no release satisfies " +
                                            describe_demands(demands[item.component_id])));
                }
                return R::err(manifest.error());
            }
            version = manifest.value().version;
        }

        auto manifest = client_.fetch_manifest(item.registry, item.name, exact_range(version));
        if (manifest.isErr()) return R::err(manifest.error());

        PlanEntry entry;
        entry.component_id = item.component_id;
        entry.registry = item.registry;
        entry.name = item.name;
        entry.version = version;
        entry.manifest = manifest.value();

        std::string from = item.component_id + "@" + version;
        std::set<std::string> dep_ids;
        for (const auto& dep_text : entry.manifest.dependencies) {
            auto dep = parse_component_request(dep_text);
            if (!dep) {
                return R::err(Error(ErrorCode::INVALID_ARGUMENT,
                                    from + ": invalid dependency '" + dep_text + "'"));
            }
            auto queued = enqueue(*dep, from);
            if (queued.isErr()) return R::err(queued.error());
            dep_ids.insert(queue.back().component_id);
        }
        entry.dependencies.assign(dep_ids.begin(), dep_ids.end());

        nodes[item.component_id] = std::move(entry);
    }

    // Re-select every node against the full set of demands
    reselected.clear();
    for (const auto& [id, entry] : nodes) {
        auto range = intersect_demands(demands[id], id);
        if (range.isErr()) return R::err(range.error());

        auto versions = client_.fetch_versions(entry.registry, entry.name);
        if (versions.isErr()) return R::err(versions.error());

        auto best = highest_satisfying(versions.value(), range.value());
        if (!best) {
            return R::err(Error(ErrorCode::UNSATISFIABLE_VERSION,
                                id + ": no release satisfies " + describe_demands(demands[id])));
        }
        reselected[id] = *best;
    }

    std::vector<PlanEntry> entries;
    for (auto& [id, entry] : nodes) {
        entries.push_back(std::move(entry));
    }
    return R::ok(std::move(entries));
}

Result<std::vector<PlanEntry>> Resolver::resolve(const std::vector<ComponentRequest>& requests) {
    using R = Result<std::vector<PlanEntry>>;

    // An explicitly qualified root decides the registry of that name for the whole graph
    rooted_.clear();
    for (const auto& registry : registries_) {
        for (const auto& request : requests) {
            if (request.qualified() && request.registry == registry.name) {
                rooted_.emplace(request.name, registry.name);
            }
        }
    }

    std::map<std::string, std::string> selected;
    for (int pass = 0; pass < kMaxResolvePasses; ++pass) {
        std::map<std::string, std::string> reselected;
        auto entries = resolve_pass(requests, selected, reselected);
        if (entries.isErr()) return entries;

        bool stable = true;
        for (const auto& entry : entries.value()) {
            auto it = reselected.find(entry.component_id);
            if (it == reselected.end() || it->second != entry.version) {
                stable = false;
                break;
            }
        }

        if (!stable) {
            spdlog::debug("resolution pass {} changed selection, retrying", pass + 1);
            selected = std::move(reselected);
            continue;
        }

        std::map<std::string, std::vector<std::string>> edges;
        std::map<std::string, PlanEntry> by_id;
        for (auto& entry : entries.value()) {
            edges[entry.component_id] = entry.dependencies;
            by_id[entry.component_id] = std::move(entry);
        }

        std::string cycle = find_cycle(edges);
        if (!cycle.empty()) {
            return R::err(Error(ErrorCode::CYCLIC_DEPENDENCY, cycle));
        }

        std::vector<PlanEntry> plan;
        for (const auto& id : topological_order(edges)) {
            plan.push_back(std::move(by_id[id]));
        }
        return R::ok(std::move(plan));
    }

    return R::err(Error(ErrorCode::UNSATISFIABLE_VERSION,
                        "version selection did not converge after " +
                            std::to_string(kMaxResolvePasses) + " passes"));
}

} // namespace ocx
