#include "ocx/project_config.hpp"
#include "ocx/http.hpp"
#include "ocx/platform.hpp"

#include <algorithm>

namespace ocx {

namespace {

using ojson = nlohmann::ordered_json;

// Helper to safely get a string array from JSON
bool get_string_array(const ojson& j, const std::string& key,
                      std::vector<std::string>& out, std::string& error) {
    if (!j.contains(key)) return true;
    if (!j[key].is_array()) {
        error = key + " must be an array of strings";
        return false;
    }
    for (const auto& elem : j[key]) {
        if (!elem.is_string()) {
            error = key + " must be an array of strings";
            return false;
        }
        out.push_back(elem.get<std::string>());
    }
    return true;
}

Result<void> validate_registry(const Registry& registry) {
    if (!is_valid_name(registry.name)) {
        return Result<void>::err(Error(ErrorCode::INVALID_ARGUMENT,
                                       "invalid registry name: '" + registry.name + "'"));
    }
    if (!is_https_url(registry.base_url)) {
        return Result<void>::err(Error(ErrorCode::INVALID_ARGUMENT,
                                       "registry " + registry.name + " must use https: " +
                                           registry.base_url));
    }
    return Result<void>::ok();
}

// A project-relative directory or file name
bool is_relative_setting(const std::string& value) {
    if (value.empty()) return false;
    auto check = validate_relative_path(value, ".");
    return check.safe;
}

} // namespace

Result<ProjectConfig> parse_project_config(const std::string& text) {
    using R = Result<ProjectConfig>;

    ProjectConfig config;
    try {
        config.raw = ojson::parse(text);
    } catch (const ojson::parse_error& e) {
        return R::err(Error(ErrorCode::CONFIG_INVALID, e.what()));
    }

    const ojson& j = config.raw;
    if (!j.is_object()) {
        return R::err(Error(ErrorCode::CONFIG_INVALID, "JSON must be an object"));
    }

    if (j.contains("registries")) {
        if (!j["registries"].is_object()) {
            return R::err(Error(ErrorCode::CONFIG_INVALID, "registries must be an object"));
        }
        for (auto& [name, value] : j["registries"].items()) {
            Registry registry;
            registry.name = name;
            if (value.is_string()) {
                registry.base_url = value.get<std::string>();
            } else if (value.is_object()) {
                if (value.contains("url") && value["url"].is_string()) {
                    registry.base_url = value["url"].get<std::string>();
                }
                if (value.contains("version") && value["version"].is_string()) {
                    registry.pinned_version = value["version"].get<std::string>();
                }
            } else {
                return R::err(Error(ErrorCode::CONFIG_INVALID,
                                    "registry " + name + " must be a URL or {url, version}"));
            }

            auto valid = validate_registry(registry);
            if (valid.isErr()) {
                return R::err(Error(ErrorCode::CONFIG_INVALID, valid.error().message()));
            }
            config.registries.push_back(std::move(registry));
        }
    }

    if (j.contains("lockRegistries")) {
        if (!j["lockRegistries"].is_boolean()) {
            return R::err(Error(ErrorCode::CONFIG_INVALID, "lockRegistries must be a boolean"));
        }
        config.lock_registries = j["lockRegistries"].get<bool>();
    }

    if (j.contains("componentPath")) {
        if (!j["componentPath"].is_string() ||
            !is_relative_setting(j["componentPath"].get<std::string>())) {
            return R::err(Error(ErrorCode::CONFIG_INVALID,
                                "componentPath must be a project-relative path"));
        }
        config.component_path =
            validate_relative_path(j["componentPath"].get<std::string>(), ".").normalized_path;
    }

    if (j.contains("configFile")) {
        if (!j["configFile"].is_string() ||
            !is_relative_setting(j["configFile"].get<std::string>())) {
            return R::err(Error(ErrorCode::CONFIG_INVALID,
                                "configFile must be a project-relative path"));
        }
        config.config_file =
            validate_relative_path(j["configFile"].get<std::string>(), ".").normalized_path;
    }

    if (j.contains("config")) {
        if (!j["config"].is_object()) {
            return R::err(Error(ErrorCode::CONFIG_INVALID, "config must be an object"));
        }
        config.base_config = j["config"];
    }

    std::string error;
    if (!get_string_array(j, "include", config.include, error) ||
        !get_string_array(j, "exclude", config.exclude, error)) {
        return R::err(Error(ErrorCode::CONFIG_INVALID, error));
    }
    if (j.contains("maxFiles")) {
        if (!j["maxFiles"].is_number_unsigned() && !j["maxFiles"].is_number_integer()) {
            return R::err(Error(ErrorCode::CONFIG_INVALID, "maxFiles must be a number"));
        }
        auto max_files = j["maxFiles"].get<long long>();
        if (max_files < 0) {
            return R::err(Error(ErrorCode::CONFIG_INVALID, "maxFiles must not be negative"));
        }
        config.max_files = static_cast<size_t>(max_files);
    }
    config.has_visibility =
        j.contains("include") || j.contains("exclude") || j.contains("maxFiles");

    return R::ok(std::move(config));
}

std::string serialize_project_config(const ProjectConfig& config) {
    ojson j = config.raw.is_object() ? config.raw : ojson::object();

    ojson registries = ojson::object();
    for (const auto& registry : config.registries) {
        if (registry.pinned_version.empty()) {
            registries[registry.name] = registry.base_url;
        } else {
            registries[registry.name] = {{"url", registry.base_url},
                                         {"version", registry.pinned_version}};
        }
    }
    j["registries"] = registries;
    j["lockRegistries"] = config.lock_registries;
    j["componentPath"] = config.component_path;
    j["configFile"] = config.config_file;
    j["config"] = config.base_config;

    if (config.has_visibility) {
        j["include"] = config.include;
        j["exclude"] = config.exclude;
        j["maxFiles"] = config.max_files;
    }

    return j.dump(2) + "\n";
}

Result<ProjectConfig> load_project_config(const std::string& path) {
    using R = Result<ProjectConfig>;

    if (!is_regular_file(path)) {
        return R::err(Error(ErrorCode::CONFIG_INVALID,
                            path + " not found (run `ocx init` first)"));
    }

    auto text = read_file_text(path);
    if (!text) {
        return R::err(Error(ErrorCode::IO_ERROR, "cannot read " + path));
    }

    auto parsed = parse_project_config(*text);
    if (parsed.isErr()) {
        return R::err(parsed.error().withContext(path));
    }
    return parsed;
}

Result<void> save_project_config(const std::string& path, const ProjectConfig& config) {
    std::string parent = get_parent_directory(path);
    if (!parent.empty() && !create_directories(parent)) {
        return Result<void>::err(Error(ErrorCode::IO_ERROR, "cannot create " + parent));
    }

    auto written = atomic_write_file(path, serialize_project_config(config));
    if (!written.ok) {
        return Result<void>::err(Error(ErrorCode::IO_ERROR, written.error));
    }
    return Result<void>::ok();
}

Result<void> add_registry(ProjectConfig& config, const Registry& registry) {
    auto valid = validate_registry(registry);
    if (valid.isErr()) return valid;

    if (find_registry(config, registry.name)) {
        return Result<void>::err(Error(ErrorCode::INVALID_ARGUMENT,
                                       "registry already configured: " + registry.name));
    }
    config.registries.push_back(registry);
    return Result<void>::ok();
}

Result<void> remove_registry(ProjectConfig& config, const std::string& name) {
    auto it = std::find_if(config.registries.begin(), config.registries.end(),
                           [&](const Registry& r) { return r.name == name; });
    if (it == config.registries.end()) {
        return Result<void>::err(Error(ErrorCode::INVALID_ARGUMENT,
                                       "registry not configured: " + name));
    }
    config.registries.erase(it);
    return Result<void>::ok();
}

const Registry* find_registry(const ProjectConfig& config, const std::string& name) {
    for (const auto& registry : config.registries) {
        if (registry.name == name) return &registry;
    }
    return nullptr;
}

ProjectConfig default_profile_config() {
    ProjectConfig config;
    config.has_visibility = true;
    config.exclude = {
        "**/AGENTS.md",
        "**/CLAUDE.md",
        "**/CONTEXT.md",
        "**/.opencode/**",
        "**/opencode.json",
        "**/opencode.jsonc",
    };
    config.max_files = 10000;
    return config;
}

} // namespace ocx
