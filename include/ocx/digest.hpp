#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace ocx {

// ============================================================================
// SHA-256 Hashing
// ============================================================================

struct HashResult {
    bool ok = false;
    std::string error;
    std::string hex_digest;     // Lowercase hex string (64 chars)
};

// Compute SHA-256 hash of data
HashResult compute_sha256(const std::vector<uint8_t>& data);
HashResult compute_sha256(const std::string& file_path);

// "sha256:<hex>", the form stored in lock entries
std::string format_digest(const std::string& hex_digest);

// ============================================================================
// Component Content Hash
// ============================================================================

struct ContentHashResult {
    bool ok = false;
    std::string error;
    std::string content_hash;                        // "sha256:<hex>"
    std::map<std::string, std::string> file_hashes;  // relative path -> "sha256:<hex>"
};

// Hash the files as they are on disk under root. The content hash covers the
// concatenated contents in path-sorted order.
ContentHashResult compute_content_hash(const std::string& root,
                                       const std::vector<std::string>& relative_paths);

} // namespace ocx
