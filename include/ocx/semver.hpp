#pragma once

/**
 * @file semver.hpp
 * @brief Semantic Versioning 2.0.0 support
 *
 * ocx uses SemVer 2.0.0 (https://semver.org/spec/v2.0.0.html) for component
 * versions. This header provides:
 * - Version parsing and comparison
 * - Version range parsing (>=, <, ^, ~, ||, *)
 * - Range satisfaction, intersection and highest-match selection
 *
 * @example
 * ```cpp
 * #include <ocx/semver.hpp>
 *
 * auto a = ocx::parse_range("^1.2.0");
 * auto b = ocx::parse_range("<1.4.0");
 * auto both = ocx::intersect(*a, *b);
 * auto best = ocx::highest_satisfying({"1.2.0", "1.3.5", "1.4.0"}, both);
 * // best == "1.3.5"
 * ```
 */

// cpp-semver requires <cstdint> but doesn't include it (GCC strictness)
#include <cstdint>
#include <semver/semver.hpp>
#include <optional>
#include <string>
#include <vector>

namespace ocx {

/// Semantic version type (MAJOR.MINOR.PATCH[-prerelease][+build])
using Version = semver::version;

/// Comparator operators for range expressions
enum class Comparator {
    Eq,   ///< =X.Y.Z or X.Y.Z (exact match)
    Lt,   ///< <X.Y.Z
    Le,   ///< <=X.Y.Z
    Gt,   ///< >X.Y.Z
    Ge    ///< >=X.Y.Z
};

/// A single comparator constraint (e.g., ">=1.0.0" or "<2.0.0")
struct Constraint {
    Comparator op;
    Version version;
};

/// Constraints that must ALL be satisfied (AND). An empty set matches
/// every version.
using ComparatorSet = std::vector<Constraint>;

/**
 * @brief A version range is a union of comparator sets (OR)
 *
 * e.g., ">=1.0.0 <2.0.0 || >=3.0.0" is two sets ORed together
 */
struct VersionRange {
    std::vector<ComparatorSet> sets;

    /// True when some set names an exact prerelease version
    bool allows_prerelease(const Version& version) const;
};

/// The range that matches every release ("*")
VersionRange any_version();

/**
 * @brief Parse a SemVer 2.0.0 version string
 * @param str Version string (e.g., "1.2.3", "1.0.0-alpha+build")
 * @return Parsed version or nullopt on failure
 */
std::optional<Version> parse_version(const std::string& str);

/**
 * @brief Parse a version range string
 * @param str Range string (e.g., ">=1.0.0 <2.0.0", "^1.2.0 || 3.0.0", "*")
 * @return Parsed range or nullopt on failure
 *
 * Supports: =, <, <=, >, >=, ^, ~ comparators, space-separated AND, || for
 * OR. Empty, "*", "x" and "latest" mean any release.
 */
std::optional<VersionRange> parse_range(const std::string& str);

/// Check if a version satisfies a single constraint
bool satisfies(const Version& version, const Constraint& constraint);

/// Check if a version satisfies a comparator set (all constraints)
bool satisfies(const Version& version, const ComparatorSet& set);

/// Check if a version satisfies a version range (any set)
bool satisfies(const Version& version, const VersionRange& range);

/// Range satisfied exactly by versions satisfying both a and b
VersionRange intersect(const VersionRange& a, const VersionRange& b);

/**
 * @brief Pick the highest version string satisfying the range
 *
 * Unparseable candidates are skipped. Prerelease versions are only
 * considered when the range names them exactly.
 */
std::optional<std::string> highest_satisfying(const std::vector<std::string>& candidates,
                                              const VersionRange& range);

/// Order version strings ascending; unparseable strings sort first
void sort_versions(std::vector<std::string>& versions);

} // namespace ocx
