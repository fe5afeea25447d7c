#pragma once

/**
 * @file project_config.hpp
 * @brief ocx.json (project) and ghost.json (profile) configuration
 *
 * ocx.json:
 *
 *   {
 *     "registries": {"main": "https://...", "pinned": {"url": "https://...", "version": "1.2.0"}},
 *     "lockRegistries": false,
 *     "componentPath": ".opencode",
 *     "configFile": "opencode.json",
 *     "config": {}
 *   }
 *
 * ghost.json carries the same keys plus "include", "exclude" and "maxFiles".
 * Registry order is resolution priority. Unknown keys survive a rewrite.
 */

#include "ocx/errors.hpp"
#include "ocx/types.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace ocx {

constexpr const char* kDefaultComponentPath = ".opencode";
constexpr const char* kDefaultConfigFile = "opencode.json";

struct ProjectConfig {
    std::vector<Registry> registries;  // priority order
    bool lock_registries = false;
    std::string component_path = kDefaultComponentPath;
    std::string config_file = kDefaultConfigFile;
    nlohmann::ordered_json base_config = nlohmann::ordered_json::object();

    // Ghost profiles only
    bool has_visibility = false;
    std::vector<std::string> include;
    std::vector<std::string> exclude;
    size_t max_files = 0;  // 0 = unlimited

    // Document as read, so unknown keys are written back
    nlohmann::ordered_json raw = nlohmann::ordered_json::object();
};

Result<ProjectConfig> parse_project_config(const std::string& text);
std::string serialize_project_config(const ProjectConfig& config);

// A missing file is CONFIG_INVALID naming the path
Result<ProjectConfig> load_project_config(const std::string& path);
Result<void> save_project_config(const std::string& path, const ProjectConfig& config);

// Registry list edits. Names are unique; URLs must be https.
Result<void> add_registry(ProjectConfig& config, const Registry& registry);
Result<void> remove_registry(ProjectConfig& config, const std::string& name);
const Registry* find_registry(const ProjectConfig& config, const std::string& name);

// Built-in seed for ghost profiles: hides the repository's own agent
// configuration and caps the overlay at 10000 entries
ProjectConfig default_profile_config();

} // namespace ocx
