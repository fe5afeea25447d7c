#include "ocx/types.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

namespace ocx {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

} // namespace

// Registry and component names end up in URLs and directory names
bool is_valid_name(const std::string& name) {
    if (name.empty() || name[0] == '.' || name[0] == '-') return false;
    for (char c : name) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '-' && c != '_' && c != '.') {
            return false;
        }
    }
    return true;
}

std::optional<ComponentType> parse_component_type(const std::string& s) {
    std::string lower = to_lower(trim(s));
    if (lower.rfind("ocx:", 0) == 0) {
        lower = lower.substr(4);
    }

    if (lower == "skill") return ComponentType::Skill;
    if (lower == "agent") return ComponentType::Agent;
    if (lower == "plugin") return ComponentType::Plugin;
    if (lower == "command") return ComponentType::Command;
    if (lower == "tool") return ComponentType::Tool;
    if (lower == "bundle") return ComponentType::Bundle;
    return std::nullopt;
}

std::optional<ComponentRequest> parse_component_request(const std::string& text) {
    std::string s = trim(text);
    if (s.empty()) return std::nullopt;

    ComponentRequest request;

    // Version constraint after the last '@'
    auto at_pos = s.rfind('@');
    if (at_pos != std::string::npos) {
        if (at_pos == 0) return std::nullopt;
        request.constraint = trim(s.substr(at_pos + 1));
        s = trim(s.substr(0, at_pos));
    }

    auto slash = s.find('/');
    if (slash != std::string::npos) {
        request.registry = s.substr(0, slash);
        request.name = s.substr(slash + 1);
        if (!is_valid_name(request.registry)) return std::nullopt;
    } else {
        request.name = s;
    }

    if (!is_valid_name(request.name)) return std::nullopt;
    return request;
}

} // namespace ocx
