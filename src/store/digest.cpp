#include "ocx/digest.hpp"
#include "ocx/platform.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <fstream>

namespace ocx {

namespace {

// RAII wrapper for EVP_MD_CTX
class EvpMdCtx {
public:
    EvpMdCtx() : ctx_(EVP_MD_CTX_new()) {}
    ~EvpMdCtx() { if (ctx_) EVP_MD_CTX_free(ctx_); }

    EvpMdCtx(const EvpMdCtx&) = delete;
    EvpMdCtx& operator=(const EvpMdCtx&) = delete;

    EVP_MD_CTX* get() { return ctx_; }
    explicit operator bool() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_;
};

std::string bytes_to_hex(const unsigned char* data, size_t len) {
    static const char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        result.push_back(hex_chars[(data[i] >> 4) & 0x0F]);
        result.push_back(hex_chars[data[i] & 0x0F]);
    }
    return result;
}

bool init_sha256(EvpMdCtx& ctx, std::string& error) {
    if (!ctx) {
        error = "EVP_MD_CTX_new failed";
        return false;
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        error = "EVP_DigestInit_ex failed";
        return false;
    }
    return true;
}

bool finish_sha256(EvpMdCtx& ctx, std::string& hex, std::string& error) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    if (EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1) {
        error = "EVP_DigestFinal_ex failed";
        return false;
    }

    hex = bytes_to_hex(hash, hash_len);
    return true;
}

} // namespace

HashResult compute_sha256(const std::vector<uint8_t>& data) {
    HashResult result;

    EvpMdCtx ctx;
    if (!init_sha256(ctx, result.error)) return result;

    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        result.error = "EVP_DigestUpdate failed";
        return result;
    }

    if (!finish_sha256(ctx, result.hex_digest, result.error)) return result;
    result.ok = true;
    return result;
}

HashResult compute_sha256(const std::string& file_path) {
    HashResult result;

    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        result.error = "failed to open file: " + file_path;
        return result;
    }

    EvpMdCtx ctx;
    if (!init_sha256(ctx, result.error)) return result;

    char buffer[8192];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        if (EVP_DigestUpdate(ctx.get(), buffer, static_cast<size_t>(file.gcount())) != 1) {
            result.error = "EVP_DigestUpdate failed";
            return result;
        }
    }

    if (!finish_sha256(ctx, result.hex_digest, result.error)) return result;
    result.ok = true;
    return result;
}

std::string format_digest(const std::string& hex_digest) {
    return "sha256:" + hex_digest;
}

ContentHashResult compute_content_hash(const std::string& root,
                                       const std::vector<std::string>& relative_paths) {
    ContentHashResult result;

    std::vector<std::string> sorted = relative_paths;
    std::sort(sorted.begin(), sorted.end());
    sorted.erase(std::unique(sorted.begin(), sorted.end()), sorted.end());

    EvpMdCtx ctx;
    if (!init_sha256(ctx, result.error)) return result;

    for (const auto& rel : sorted) {
        auto bytes = read_file_bytes(join_path(root, rel));
        if (!bytes) {
            result.error = "failed to read installed file: " + rel;
            return result;
        }

        auto file_hash = compute_sha256(*bytes);
        if (!file_hash.ok) {
            result.error = file_hash.error;
            return result;
        }
        result.file_hashes[rel] = format_digest(file_hash.hex_digest);

        if (EVP_DigestUpdate(ctx.get(), bytes->data(), bytes->size()) != 1) {
            result.error = "EVP_DigestUpdate failed";
            return result;
        }
    }

    std::string hex;
    if (!finish_sha256(ctx, hex, result.error)) return result;

    result.content_hash = format_digest(hex);
    result.ok = true;
    return result;
}

} // namespace ocx
