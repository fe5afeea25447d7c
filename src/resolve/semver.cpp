#include "ocx/semver.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace ocx {

namespace {

std::string trim(const std::string& in) {
    size_t start = 0;
    while (start < in.size() && std::isspace(static_cast<unsigned char>(in[start]))) ++start;
    size_t end = in.size();
    while (end > start && std::isspace(static_cast<unsigned char>(in[end - 1]))) --end;
    return in.substr(start, end - start);
}

// Split string by delimiter, preserving empty parts
std::vector<std::string> split(const std::string& s, const std::string& delim) {
    std::vector<std::string> parts;
    size_t start = 0;
    size_t pos;
    while ((pos = s.find(delim, start)) != std::string::npos) {
        parts.push_back(s.substr(start, pos - start));
        start = pos + delim.length();
    }
    parts.push_back(s.substr(start));
    return parts;
}

// Split string by whitespace into tokens
std::vector<std::string> tokenize(const std::string& s) {
    std::vector<std::string> tokens;
    std::istringstream iss(s);
    std::string token;
    while (iss >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

bool is_wildcard(const std::string& s) {
    return s.empty() || s == "*" || s == "x" || s == "X" || s == "latest";
}

// "1" -> "1.0.0", "1.2" -> "1.2.0"; full versions are returned unchanged
std::string pad_partial(const std::string& s) {
    size_t core_end = s.find_first_of("-+");
    std::string core = s.substr(0, core_end);
    size_t dots = static_cast<size_t>(std::count(core.begin(), core.end(), '.'));
    if (dots >= 2 || core_end != std::string::npos) return s;
    return dots == 1 ? s + ".0" : s + ".0.0";
}

std::optional<Version> parse_bound(const std::string& s) {
    try {
        return semver::version::parse(pad_partial(s));
    } catch (const semver::semver_exception&) {
        return std::nullopt;
    }
}

std::optional<Version> make_version(unsigned long long major,
                                    unsigned long long minor,
                                    unsigned long long patch) {
    return parse_version(std::to_string(major) + "." + std::to_string(minor) + "." +
                         std::to_string(patch));
}

// Caret: changes that do not modify the left-most non-zero component
bool expand_caret(const std::string& version_str, ComparatorSet& set) {
    auto lower = parse_bound(version_str);
    if (!lower) return false;

    auto major = static_cast<unsigned long long>(lower->major());
    auto minor = static_cast<unsigned long long>(lower->minor());
    auto patch = static_cast<unsigned long long>(lower->patch());

    std::optional<Version> upper;
    if (major > 0) {
        upper = make_version(major + 1, 0, 0);
    } else if (minor > 0) {
        upper = make_version(0, minor + 1, 0);
    } else {
        upper = make_version(0, 0, patch + 1);
    }
    if (!upper) return false;

    set.push_back(Constraint{Comparator::Ge, *lower});
    set.push_back(Constraint{Comparator::Lt, *upper});
    return true;
}

// Tilde: patch-level changes only
bool expand_tilde(const std::string& version_str, ComparatorSet& set) {
    auto lower = parse_bound(version_str);
    if (!lower) return false;

    auto upper = make_version(static_cast<unsigned long long>(lower->major()),
                              static_cast<unsigned long long>(lower->minor()) + 1, 0);
    if (!upper) return false;

    set.push_back(Constraint{Comparator::Ge, *lower});
    set.push_back(Constraint{Comparator::Lt, *upper});
    return true;
}

// Parse a single token like ">=1.0.0", "^1.2.0", "~1.2.3", "=1.0.0" or "1.0.0"
// into one or more constraints appended to set
bool parse_constraint(const std::string& str, ComparatorSet& set) {
    std::string s = trim(str);
    if (s.empty()) return false;
    if (is_wildcard(s)) return true;

    if (s[0] == '^') return expand_caret(trim(s.substr(1)), set);
    if (s[0] == '~') return expand_tilde(trim(s.substr(1)), set);

    Comparator op = Comparator::Eq;
    std::string version_str;

    if (s.rfind(">=", 0) == 0) {
        op = Comparator::Ge;
        version_str = s.substr(2);
    } else if (s.rfind("<=", 0) == 0) {
        op = Comparator::Le;
        version_str = s.substr(2);
    } else if (s.rfind(">", 0) == 0) {
        op = Comparator::Gt;
        version_str = s.substr(1);
    } else if (s.rfind("<", 0) == 0) {
        op = Comparator::Lt;
        version_str = s.substr(1);
    } else if (s.rfind("=", 0) == 0) {
        op = Comparator::Eq;
        version_str = s.substr(1);
    } else {
        // No operator means exact match
        op = Comparator::Eq;
        version_str = s;
    }

    version_str = trim(version_str);
    if (version_str.empty()) return false;

    std::optional<Version> version = op == Comparator::Eq ? parse_version(version_str)
                                                           : parse_bound(version_str);
    if (!version) return false;

    set.push_back(Constraint{op, *version});
    return true;
}

// Parse a comparator set (space-separated constraints ANDed together)
std::optional<ComparatorSet> parse_comparator_set(const std::string& str) {
    ComparatorSet set;
    if (is_wildcard(trim(str))) return set;

    auto tokens = tokenize(str);
    if (tokens.empty()) return std::nullopt;

    for (const auto& token : tokens) {
        if (!parse_constraint(token, set)) return std::nullopt;
    }
    return set;
}

} // namespace

bool VersionRange::allows_prerelease(const Version& version) const {
    for (const auto& set : sets) {
        for (const auto& constraint : set) {
            if (constraint.op == Comparator::Eq && constraint.version == version) {
                return true;
            }
        }
    }
    return false;
}

VersionRange any_version() {
    VersionRange range;
    range.sets.push_back(ComparatorSet{});
    return range;
}

std::optional<Version> parse_version(const std::string& str) {
    std::string s = trim(str);
    if (s.empty()) return std::nullopt;

    try {
        return semver::version::parse(s);
    } catch (const semver::semver_exception&) {
        return std::nullopt;
    }
}

std::optional<VersionRange> parse_range(const std::string& str) {
    std::string s = trim(str);
    if (is_wildcard(s)) return any_version();

    // Split by || for OR
    auto or_parts = split(s, "||");

    VersionRange range;
    for (const auto& part : or_parts) {
        auto set = parse_comparator_set(trim(part));
        if (!set) return std::nullopt;
        range.sets.push_back(*set);
    }

    if (range.sets.empty()) return std::nullopt;
    return range;
}

bool satisfies(const Version& version, const Constraint& constraint) {
    switch (constraint.op) {
        case Comparator::Eq:
            return version == constraint.version;
        case Comparator::Lt:
            return version < constraint.version;
        case Comparator::Le:
            return version <= constraint.version;
        case Comparator::Gt:
            return version > constraint.version;
        case Comparator::Ge:
            return version >= constraint.version;
    }
    return false;
}

bool satisfies(const Version& version, const ComparatorSet& set) {
    // All constraints in a set must be satisfied (AND)
    for (const auto& constraint : set) {
        if (!satisfies(version, constraint)) {
            return false;
        }
    }
    return true;
}

bool satisfies(const Version& version, const VersionRange& range) {
    // Any set in the range must be satisfied (OR)
    for (const auto& set : range.sets) {
        if (satisfies(version, set)) {
            return true;
        }
    }
    return false;
}

VersionRange intersect(const VersionRange& a, const VersionRange& b) {
    // (a1 | a2) & (b1 | b2) == (a1 & b1) | (a1 & b2) | (a2 & b1) | (a2 & b2)
    VersionRange result;
    for (const auto& left : a.sets) {
        for (const auto& right : b.sets) {
            ComparatorSet combined = left;
            combined.insert(combined.end(), right.begin(), right.end());
            result.sets.push_back(std::move(combined));
        }
    }
    return result;
}

std::optional<std::string> highest_satisfying(const std::vector<std::string>& candidates,
                                              const VersionRange& range) {
    std::optional<Version> best;
    std::optional<std::string> best_str;

    for (const auto& candidate : candidates) {
        auto version = parse_version(candidate);
        if (!version) continue;
        if (version->is_prerelease() && !range.allows_prerelease(*version)) continue;
        if (!satisfies(*version, range)) continue;

        if (!best || *version > *best) {
            best = version;
            best_str = trim(candidate);
        }
    }
    return best_str;
}

void sort_versions(std::vector<std::string>& versions) {
    std::stable_sort(versions.begin(), versions.end(),
                     [](const std::string& a, const std::string& b) {
                         auto va = parse_version(a);
                         auto vb = parse_version(b);
                         if (!va || !vb) return !va && vb.has_value();
                         return *va < *vb;
                     });
}

} // namespace ocx
