#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ocx {

// ============================================================================
// Atomic File Operations
// ============================================================================

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
};

// Write content atomically using temp file + fsync + rename + fsync(dir)
AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content);
AtomicWriteResult atomic_write_file(const std::string& path, const std::vector<uint8_t>& content);

// Update symlink atomically (create under temp name, rename over, fsync parent)
AtomicWriteResult atomic_update_symlink(const std::string& link_path, const std::string& target);

// ============================================================================
// File Reading
// ============================================================================

std::optional<std::vector<uint8_t>> read_file_bytes(const std::string& path);
std::optional<std::string> read_file_text(const std::string& path);

// ============================================================================
// Path Utilities
// ============================================================================

// Convert a path to use forward slashes (portable format)
// ocx stores every project-relative path in this form.
std::string to_portable_path(const std::string& path);

// Get the directory containing a file path
std::string get_parent_directory(const std::string& path);

// Get the filename from a path
std::string get_filename(const std::string& path);

// Join path components
std::string join_path(const std::string& base, const std::string& rel);

// Portable path of `path` relative to `base` (both absolute or both relative)
std::string relative_portable_path(const std::string& path, const std::string& base);

// Check if a path exists
bool path_exists(const std::string& path);

// Check if a path is a directory
bool is_directory(const std::string& path);

// Check if a path is a regular file
bool is_regular_file(const std::string& path);

// Check if a path is a symlink
bool is_symlink(const std::string& path);

// Read symlink target
std::optional<std::string> read_symlink(const std::string& path);

// List directory entries
std::vector<std::string> list_directory(const std::string& path);

// Create parent directories recursively
bool create_directories(const std::string& path);

// Remove a directory recursively
bool remove_directory(const std::string& path);

// Remove a file
bool remove_file(const std::string& path);

// Copy a file, replacing the destination
bool copy_file(const std::string& src, const std::string& dst);

// Canonical absolute form of an existing path (or the input on failure)
std::string canonical_path(const std::string& path);

// ============================================================================
// Relative Path Safety
// ============================================================================

// Rejects absolute paths and paths escaping root via ".."
struct PathValidation {
    bool safe = false;
    std::string error;
    std::string normalized_path;  // Normalized relative path, forward slashes
};

PathValidation validate_relative_path(const std::string& entry_path, const std::string& root);

// ============================================================================
// Environment
// ============================================================================

// Get an environment variable
std::optional<std::string> get_env(const std::string& name);

// Get current timestamp as RFC3339 string
std::string get_current_timestamp();

// Generate a UUID string
std::string generate_uuid();

} // namespace ocx
