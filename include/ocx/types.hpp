#pragma once

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ocx {

// ============================================================================
// Component Type
// ============================================================================

enum class ComponentType {
    Skill,
    Agent,
    Plugin,
    Command,
    Tool,
    Bundle
};

inline const char* component_type_to_string(ComponentType t) {
    switch (t) {
        case ComponentType::Skill: return "skill";
        case ComponentType::Agent: return "agent";
        case ComponentType::Plugin: return "plugin";
        case ComponentType::Command: return "command";
        case ComponentType::Tool: return "tool";
        case ComponentType::Bundle: return "bundle";
        default: return "skill";
    }
}

// Accepts the bare name and the "ocx:" prefixed registry spelling
std::optional<ComponentType> parse_component_type(const std::string& s);

// ============================================================================
// Registry
// ============================================================================

// Registry, component and profile names: [A-Za-z0-9._-], not starting with
// '.' or '-'
bool is_valid_name(const std::string& name);

struct Registry {
    std::string name;
    std::string base_url;        // https:// only
    std::string pinned_version;  // empty when not pinned
};

// ============================================================================
// Component Request / Identifier
// ============================================================================

// "[registry/]name[@constraint]"
struct ComponentRequest {
    std::string registry;    // empty when unqualified
    std::string name;
    std::string constraint;  // empty means any release

    bool qualified() const { return !registry.empty(); }
};

std::optional<ComponentRequest> parse_component_request(const std::string& text);

// "registry/name"
inline std::string make_component_id(const std::string& registry, const std::string& name) {
    return registry + "/" + name;
}

// ============================================================================
// Component Manifest (one resolved release)
// ============================================================================

struct FileSpec {
    std::string source;  // path within the component on the registry
    std::string target;  // explicit project-relative target, empty for the type default
};

struct ComponentSummary {
    std::string name;
    ComponentType type = ComponentType::Skill;
    std::string latest_version;
    std::string description;
};

struct ComponentManifest {
    std::string name;
    ComponentType type = ComponentType::Skill;
    std::string version;
    std::string description;
    std::vector<std::string> dependencies;  // request strings
    std::vector<FileSpec> files;
    nlohmann::ordered_json config_fragment = nlohmann::ordered_json::object();
};

// ============================================================================
// Lock Entry
// ============================================================================

struct LockEntry {
    std::string component_id;   // "registry/name"
    std::string registry;
    std::string version;
    ComponentType type = ComponentType::Skill;
    std::string content_hash;   // "sha256:<hex>" over path-sorted file contents
    std::vector<std::string> installed_files;          // project-relative, sorted
    std::map<std::string, std::string> file_hashes;    // path -> "sha256:<hex>"
    std::string root;           // directory owned exclusively, may be empty
    std::string installed_at;   // RFC3339
    std::string updated_at;     // RFC3339
};

} // namespace ocx
