#include "ocx/glob.hpp"

namespace ocx {

namespace {

std::vector<std::string> split_segments(const std::string& path) {
    std::vector<std::string> segments;
    std::string current;
    for (char c : path) {
        if (c == '/') {
            if (!current.empty()) segments.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    if (!current.empty()) segments.push_back(current);
    return segments;
}

// Match a [...] class starting at pattern[pi] == '['. On success pi points
// past the closing ']'.
bool match_class(const std::string& pattern, size_t& pi, char c, bool& matched) {
    size_t i = pi + 1;
    bool negate = false;
    if (i < pattern.size() && (pattern[i] == '!' || pattern[i] == '^')) {
        negate = true;
        ++i;
    }

    bool found = false;
    bool first = true;
    while (i < pattern.size() && (first || pattern[i] != ']')) {
        first = false;
        char lo = pattern[i];
        if (i + 2 < pattern.size() && pattern[i + 1] == '-' && pattern[i + 2] != ']') {
            char hi = pattern[i + 2];
            if (c >= lo && c <= hi) found = true;
            i += 3;
        } else {
            if (c == lo) found = true;
            ++i;
        }
    }

    if (i >= pattern.size()) return false;  // unterminated, treat '[' literally
    pi = i + 1;
    matched = found != negate;
    return true;
}

bool match_segment(const std::string& pattern, size_t pi,
                   const std::string& text, size_t ti) {
    while (pi < pattern.size()) {
        char p = pattern[pi];

        if (p == '*') {
            while (pi < pattern.size() && pattern[pi] == '*') ++pi;
            if (pi == pattern.size()) return true;
            for (size_t k = ti; k <= text.size(); ++k) {
                if (match_segment(pattern, pi, text, k)) return true;
            }
            return false;
        }

        if (ti >= text.size()) return false;

        if (p == '?') {
            ++pi;
            ++ti;
            continue;
        }

        if (p == '[') {
            size_t next = pi;
            bool matched = false;
            if (match_class(pattern, next, text[ti], matched)) {
                if (!matched) return false;
                pi = next;
                ++ti;
                continue;
            }
        }

        if (p != text[ti]) return false;
        ++pi;
        ++ti;
    }
    return ti == text.size();
}

bool match_segments(const std::vector<std::string>& pattern, size_t pi,
                    const std::vector<std::string>& path, size_t si) {
    while (pi < pattern.size()) {
        if (pattern[pi] == "**") {
            while (pi < pattern.size() && pattern[pi] == "**") ++pi;
            if (pi == pattern.size()) return true;
            for (size_t k = si; k <= path.size(); ++k) {
                if (match_segments(pattern, pi, path, k)) return true;
            }
            return false;
        }

        if (si >= path.size()) return false;
        if (!match_segment(pattern[pi], 0, path[si], 0)) return false;
        ++pi;
        ++si;
    }
    return si == path.size();
}

} // namespace

bool glob_match(const std::string& pattern, const std::string& path) {
    return match_segments(split_segments(pattern), 0, split_segments(path), 0);
}

bool matches_any(const std::vector<std::string>& patterns, const std::string& path) {
    for (const auto& pattern : patterns) {
        if (glob_match(pattern, path)) return true;
    }
    return false;
}

bool is_visible(const std::string& path,
                const std::vector<std::string>& include,
                const std::vector<std::string>& exclude) {
    if (!include.empty() && !matches_any(include, path)) return false;
    return !matches_any(exclude, path);
}

} // namespace ocx
