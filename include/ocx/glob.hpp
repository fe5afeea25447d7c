#pragma once

#include <string>
#include <vector>

namespace ocx {

// ============================================================================
// Path Globs
// ============================================================================
//
// Patterns match the whole portable relative path:
//   *      any run of characters within one segment
//   ?      one character other than '/'
//   [...]  character class, [!...] or [^...] negated, a-z ranges
//   **     zero or more whole segments
//
// "**/AGENTS.md" matches "AGENTS.md" and "docs/AGENTS.md";
// "vendor/**" matches everything below vendor.

bool glob_match(const std::string& pattern, const std::string& path);

bool matches_any(const std::vector<std::string>& patterns, const std::string& path);

// Visible iff (include is empty or some include matches) and no exclude matches
bool is_visible(const std::string& path,
                const std::vector<std::string>& include,
                const std::vector<std::string>& exclude);

} // namespace ocx
