#include "ocx/project.hpp"
#include "ocx/config_merge.hpp"
#include "ocx/lockfile.hpp"
#include "ocx/platform.hpp"
#include "ocx/registry_client.hpp"
#include "ocx/resolver.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <set>

namespace ocx {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool contains_ci(const std::string& haystack, const std::string& needle) {
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

ProjectPaths make_paths(const std::string& root, const std::string& config_name) {
    ProjectPaths paths;
    paths.root = root;
    paths.config_file = join_path(root, config_name);
    paths.lock_file = join_path(root, kLockFile);
    paths.state_dir = join_path(root, kStateDirectory);
    paths.operation_lock = join_path(paths.state_dir, "operation.lock");
    paths.fragments = join_path(paths.state_dir, "fragments.json");
    return paths;
}

// "registry/name" -> name
std::string component_name(const std::string& component_id) {
    auto slash = component_id.find('/');
    return slash == std::string::npos ? component_id : component_id.substr(slash + 1);
}

} // namespace

ProjectPaths ProjectPaths::for_project(const std::string& root) {
    return make_paths(root, kProjectConfigFile);
}

ProjectPaths ProjectPaths::for_profile(const Profile& profile) {
    return make_paths(profile.directory, kProfileConfigFile);
}

Result<Project> Project::init(const ProjectPaths& paths,
                              std::shared_ptr<HttpTransport> transport,
                              const ProjectConfig& seed) {
    if (!is_regular_file(paths.config_file)) {
        auto saved = save_project_config(paths.config_file, seed);
        if (saved.isErr()) return Result<Project>::err(saved.error());
        spdlog::info("initialized {}", paths.config_file);
    }
    return open(paths, std::move(transport));
}

Result<Project> Project::open(const ProjectPaths& paths,
                              std::shared_ptr<HttpTransport> transport) {
    auto config = load_project_config(paths.config_file);
    if (config.isErr()) return Result<Project>::err(config.error());
    return Result<Project>::ok(Project(paths, std::move(config.value()), std::move(transport)));
}

InstallerLayout Project::layout() const {
    InstallerLayout layout;
    layout.project_root = paths_.root;
    layout.component_path = config_.component_path;
    layout.reserved = {
        relative_portable_path(paths_.config_file, paths_.root),
        relative_portable_path(paths_.lock_file, paths_.root),
        relative_portable_path(paths_.state_dir, paths_.root),
        config_.config_file,
    };
    return layout;
}

Result<std::unique_ptr<FileLock>> Project::lock_operation() const {
    return FileLock::try_acquire(paths_.operation_lock);
}

Result<InstallSummary> Project::install_requests(const std::vector<ComponentRequest>& requests,
                                                 const InstallOptions& options) {
    using R = Result<InstallSummary>;

    auto lock = lock_operation();
    if (lock.isErr()) return R::err(lock.error());

    auto store = IntegrityStore::open(paths_.lock_file);
    if (store.isErr()) return R::err(store.error());

    auto aggregate = AggregateConfig::open(paths_.fragments,
                                           join_path(paths_.root, config_.config_file),
                                           config_.base_config);
    if (aggregate.isErr()) return R::err(aggregate.error());

    RegistryClient client(transport_);
    Resolver resolver(client, config_.registries);

    auto plan = resolver.resolve(requests);
    if (plan.isErr()) return R::err(plan.error());

    Installer installer(client, store.value(), aggregate.value(), layout());
    return installer.install(plan.value(), options);
}

Result<InstallSummary> Project::add(const std::vector<std::string>& requests,
                                    const InstallOptions& options) {
    using R = Result<InstallSummary>;

    if (requests.empty()) {
        return R::err(Error(ErrorCode::INVALID_ARGUMENT, "no components given"));
    }

    std::vector<ComponentRequest> parsed;
    for (const auto& text : requests) {
        auto request = parse_component_request(text);
        if (!request) {
            return R::err(Error(ErrorCode::INVALID_ARGUMENT, "invalid component: '" + text + "'"));
        }
        if (!parse_range(request->constraint)) {
            return R::err(Error(ErrorCode::INVALID_ARGUMENT,
                                "invalid version constraint in '" + text + "'"));
        }
        parsed.push_back(*request);
    }

    return install_requests(parsed, options);
}

Result<InstallSummary> Project::update(const std::vector<std::string>& ids,
                                       const std::string& version_constraint) {
    using R = Result<InstallSummary>;

    if (!parse_range(version_constraint)) {
        return R::err(Error(ErrorCode::INVALID_ARGUMENT,
                            "invalid version constraint: '" + version_constraint + "'"));
    }

    auto entries = installed();
    if (entries.isErr()) return R::err(entries.error());

    std::vector<ComponentRequest> requests;
    auto request_for = [&](const LockEntry& entry) {
        ComponentRequest request;
        request.registry = entry.registry;
        request.name = component_name(entry.component_id);
        request.constraint = version_constraint;
        requests.push_back(request);
    };

    if (ids.empty()) {
        for (const auto& entry : entries.value()) {
            request_for(entry);
        }
    } else {
        for (const auto& id : ids) {
            auto it = std::find_if(entries.value().begin(), entries.value().end(),
                                   [&](const LockEntry& e) {
                                       return e.component_id == id ||
                                              component_name(e.component_id) == id;
                                   });
            if (it == entries.value().end()) {
                return R::err(Error(ErrorCode::FILE_NOT_FOUND, "component not installed: " + id));
            }
            request_for(*it);
        }
    }

    if (requests.empty()) {
        return R::ok(InstallSummary());
    }
    return install_requests(requests, InstallOptions());
}

Result<std::vector<Drift>> Project::diff(const std::optional<std::string>& component_id) {
    auto store = IntegrityStore::open(paths_.lock_file);
    if (store.isErr()) return Result<std::vector<Drift>>::err(store.error());

    DiffEngine engine(store.value(), paths_.root);
    return engine.diff(component_id);
}

Result<FixReport> Project::fix(const std::optional<std::string>& component_id) {
    using R = Result<FixReport>;

    auto lock = lock_operation();
    if (lock.isErr()) return R::err(lock.error());

    auto store = IntegrityStore::open(paths_.lock_file);
    if (store.isErr()) return R::err(store.error());

    FixReport report;
    {
        DiffEngine engine(store.value(), paths_.root);
        auto drift = engine.diff(component_id);
        if (drift.isErr()) return R::err(drift.error());
        report.drift = std::move(drift.value());
    }

    std::set<std::string> broken;
    for (const auto& d : report.drift) {
        if (d.kind != DriftKind::Added) broken.insert(d.component_id);
    }
    if (broken.empty()) return R::ok(std::move(report));

    auto aggregate = AggregateConfig::open(paths_.fragments,
                                           join_path(paths_.root, config_.config_file),
                                           config_.base_config);
    if (aggregate.isErr()) return R::err(aggregate.error());

    RegistryClient client(transport_);
    std::vector<PlanEntry> plan;
    for (const auto& id : broken) {
        auto entry = store.value().get(id);
        if (!entry) continue;

        const Registry* registry = find_registry(config_, entry->registry);
        if (!registry) {
            return R::err(Error(ErrorCode::INVALID_ARGUMENT,
                                id + ": registry not configured: " + entry->registry));
        }

        std::string name = component_name(id);
        auto manifest = client.fetch_manifest(*registry, name, "=" + entry->version);
        if (manifest.isErr()) return R::err(manifest.error());

        PlanEntry plan_entry;
        plan_entry.component_id = id;
        plan_entry.registry = *registry;
        plan_entry.name = name;
        plan_entry.version = entry->version;
        plan_entry.manifest = std::move(manifest.value());
        plan.push_back(std::move(plan_entry));
    }

    InstallOptions options;
    options.overwrite = true;
    options.reinstall = true;

    Installer installer(client, store.value(), aggregate.value(), layout());
    auto installed_plan = installer.install(plan, options);
    if (installed_plan.isErr()) return R::err(installed_plan.error());

    report.reinstalled.assign(broken.begin(), broken.end());
    return R::ok(std::move(report));
}

Result<void> Project::add_registry(const Registry& registry) {
    if (config_.lock_registries) {
        return Result<void>::err(Error(ErrorCode::INVALID_ARGUMENT,
                                       "registries are locked by lockRegistries in " +
                                           paths_.config_file));
    }

    ProjectConfig next = config_;
    auto added = ocx::add_registry(next, registry);
    if (added.isErr()) return added;

    auto saved = save_project_config(paths_.config_file, next);
    if (saved.isErr()) return saved;

    config_ = std::move(next);
    return Result<void>::ok();
}

Result<void> Project::remove_registry(const std::string& name) {
    if (config_.lock_registries) {
        return Result<void>::err(Error(ErrorCode::INVALID_ARGUMENT,
                                       "registries are locked by lockRegistries in " +
                                           paths_.config_file));
    }

    ProjectConfig next = config_;
    auto removed = ocx::remove_registry(next, name);
    if (removed.isErr()) return removed;

    auto saved = save_project_config(paths_.config_file, next);
    if (saved.isErr()) return saved;

    config_ = std::move(next);
    return Result<void>::ok();
}

Result<std::vector<LockEntry>> Project::installed() const {
    auto store = IntegrityStore::open(paths_.lock_file);
    if (store.isErr()) return Result<std::vector<LockEntry>>::err(store.error());
    return Result<std::vector<LockEntry>>::ok(store.value().all_entries());
}

Result<std::vector<SearchHit>> Project::search(const std::string& query, bool installed_only) {
    using R = Result<std::vector<SearchHit>>;

    auto entries = installed();
    if (entries.isErr()) return R::err(entries.error());

    std::vector<SearchHit> hits;

    if (installed_only) {
        for (const auto& entry : entries.value()) {
            if (!query.empty() && !contains_ci(entry.component_id, query)) continue;
            SearchHit hit;
            hit.registry = entry.registry;
            hit.summary.name = component_name(entry.component_id);
            hit.summary.type = entry.type;
            hit.summary.latest_version = entry.version;
            hit.installed_version = entry.version;
            hits.push_back(std::move(hit));
        }
        return R::ok(std::move(hits));
    }

    RegistryClient client(transport_);
    for (const auto& registry : config_.registries) {
        auto index = client.fetch_index(registry);
        if (index.isErr()) return R::err(index.error());

        for (const auto& summary : index.value()) {
            if (!query.empty() && !contains_ci(summary.name, query) &&
                !contains_ci(summary.description, query)) {
                continue;
            }
            SearchHit hit;
            hit.registry = registry.name;
            hit.summary = summary;
            std::string id = make_component_id(registry.name, summary.name);
            for (const auto& entry : entries.value()) {
                if (entry.component_id == id) hit.installed_version = entry.version;
            }
            hits.push_back(std::move(hit));
        }
    }
    return R::ok(std::move(hits));
}

} // namespace ocx
