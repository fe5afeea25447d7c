#include "ocx/platform.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <random>
#include <sstream>

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#endif

namespace ocx {

namespace fs = std::filesystem;

namespace {

#ifndef _WIN32
// fsync a file descriptor
bool fsync_fd(int fd) {
#ifdef __APPLE__
    return fcntl(fd, F_FULLFSYNC, 0) == 0;
#else
    return fsync(fd) == 0;
#endif
}

// fsync a directory by path
bool fsync_directory(const std::string& dir_path) {
    int dir_fd = open(dir_path.c_str(), O_RDONLY);
    if (dir_fd < 0) return false;

    bool result = fsync_fd(dir_fd);
    close(dir_fd);
    return result;
}
#endif

// Generate a temporary filename next to the final path
std::string make_temp_filename(const std::string& base) {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::string hex_chars = "0123456789abcdef";
    std::string suffix;
    for (int i = 0; i < 8; ++i) {
        suffix += hex_chars[static_cast<size_t>(dis(gen))];
    }

    return base + ".tmp." + suffix;
}

} // namespace

AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content) {
    return atomic_write_file(path, std::vector<uint8_t>(content.begin(), content.end()));
}

AtomicWriteResult atomic_write_file(const std::string& path, const std::vector<uint8_t>& content) {
    AtomicWriteResult result;
    std::string temp_path = make_temp_filename(path);

#ifdef _WIN32
    std::ofstream temp_file(temp_path, std::ios::binary);
    if (!temp_file) {
        result.error = "failed to create temp file: " + temp_path;
        return result;
    }

    temp_file.write(reinterpret_cast<const char*>(content.data()),
                    static_cast<std::streamsize>(content.size()));
    temp_file.flush();
    temp_file.close();

    if (!MoveFileExA(temp_path.c_str(), path.c_str(),
                     MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH)) {
        DeleteFileA(temp_path.c_str());
        result.error = "failed to rename temp file: " + path;
        return result;
    }

    result.ok = true;
#else
    // POSIX implementation: temp + fsync(file) + rename + fsync(dir)
    std::string dir_path = get_parent_directory(path);

    int fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        result.error = "failed to create temp file for " + path + ": " +
                       std::string(strerror(errno));
        return result;
    }

    size_t total = 0;
    while (total < content.size()) {
        ssize_t written = write(fd, content.data() + total, content.size() - total);
        if (written < 0) {
            if (errno == EINTR) continue;
            close(fd);
            unlink(temp_path.c_str());
            result.error = "failed to write " + path + ": " + std::string(strerror(errno));
            return result;
        }
        total += static_cast<size_t>(written);
    }

    if (!fsync_fd(fd)) {
        close(fd);
        unlink(temp_path.c_str());
        result.error = "failed to fsync temp file for " + path;
        return result;
    }

    close(fd);

    if (rename(temp_path.c_str(), path.c_str()) != 0) {
        unlink(temp_path.c_str());
        result.error = "failed to rename temp file to " + path + ": " +
                       std::string(strerror(errno));
        return result;
    }

    if (!dir_path.empty()) {
        fsync_directory(dir_path);
    }

    result.ok = true;
#endif

    return result;
}

AtomicWriteResult atomic_update_symlink(const std::string& link_path, const std::string& target) {
    AtomicWriteResult result;

#ifdef _WIN32
    // Windows doesn't have atomic symlink updates
    std::error_code ec;
    fs::remove(link_path, ec);
    fs::create_symlink(target, link_path, ec);
    if (ec) {
        result.error = ec.message();
        return result;
    }
    result.ok = true;
#else
    std::string temp_path = make_temp_filename(link_path);

    if (symlink(target.c_str(), temp_path.c_str()) != 0) {
        result.error = "failed to create symlink: " + std::string(strerror(errno));
        return result;
    }

    if (rename(temp_path.c_str(), link_path.c_str()) != 0) {
        unlink(temp_path.c_str());
        result.error = "failed to rename symlink: " + std::string(strerror(errno));
        return result;
    }

    std::string parent = get_parent_directory(link_path);
    if (!parent.empty()) {
        fsync_directory(parent);
    }

    result.ok = true;
#endif

    return result;
}

std::optional<std::vector<uint8_t>> read_file_bytes(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) return std::nullopt;
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(file)),
                                std::istreambuf_iterator<char>());
}

std::optional<std::string> read_file_text(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) return std::nullopt;
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

std::string to_portable_path(const std::string& path) {
    std::string result = path;
    std::replace(result.begin(), result.end(), '\\', '/');
    return result;
}

std::string get_parent_directory(const std::string& path) {
    fs::path p(path);
    return p.parent_path().string();
}

std::string get_filename(const std::string& path) {
    fs::path p(path);
    return p.filename().string();
}

std::string join_path(const std::string& base, const std::string& rel) {
    fs::path p(base);
    p /= rel;
    return to_portable_path(p.string());
}

std::string relative_portable_path(const std::string& path, const std::string& base) {
    return to_portable_path(fs::path(path).lexically_relative(base).generic_string());
}

bool path_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool is_directory(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool is_regular_file(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool is_symlink(const std::string& path) {
    std::error_code ec;
    return fs::is_symlink(path, ec);
}

std::optional<std::string> read_symlink(const std::string& path) {
    std::error_code ec;
    auto target = fs::read_symlink(path, ec);
    if (ec) return std::nullopt;
    return target.string();
}

std::vector<std::string> list_directory(const std::string& path) {
    std::vector<std::string> entries;

    std::error_code ec;
    if (!fs::is_directory(path, ec)) return entries;

    for (const auto& entry : fs::directory_iterator(path, ec)) {
        entries.push_back(entry.path().filename().string());
    }

    std::sort(entries.begin(), entries.end());
    return entries;
}

bool create_directories(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    return !ec;
}

bool remove_directory(const std::string& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    return !ec;
}

bool remove_file(const std::string& path) {
    std::error_code ec;
    return fs::remove(path, ec);
}

bool copy_file(const std::string& src, const std::string& dst) {
    std::error_code ec;
    fs::copy_file(src, dst, fs::copy_options::overwrite_existing, ec);
    return !ec;
}

std::string canonical_path(const std::string& path) {
    std::error_code ec;
    auto canonical = fs::weakly_canonical(fs::absolute(path, ec), ec);
    if (ec) return path;
    return canonical.string();
}

PathValidation validate_relative_path(const std::string& entry_path, const std::string& root) {
    PathValidation result;

    if (entry_path.empty()) {
        result.error = "empty path";
        return result;
    }

    // Reject absolute paths
    fs::path path(to_portable_path(entry_path));
    if (entry_path[0] == '/' || entry_path[0] == '\\' || path.has_root_name()) {
        result.error = "absolute path not allowed: " + entry_path;
        return result;
    }

    // Normalize path and check for traversal
    fs::path normalized;
    for (const auto& component : path) {
        std::string comp = component.string();
        if (comp == "..") {
            result.error = "path traversal not allowed: " + entry_path;
            return result;
        }
        if (comp != "." && !comp.empty()) {
            normalized /= comp;
        }
    }

    if (normalized.empty()) {
        result.error = "path resolves to the root: " + entry_path;
        return result;
    }

    // Verify the path stays within root even through existing symlinks
    std::error_code ec;
    fs::path canonical_root = fs::weakly_canonical(root, ec);
    fs::path canonical_full = fs::weakly_canonical(fs::path(root) / normalized, ec);
    if (!ec) {
        std::string root_str = canonical_root.string();
        std::string full_str = canonical_full.string();
        if (full_str.rfind(root_str, 0) != 0) {
            result.error = "path escapes root: " + entry_path;
            return result;
        }
    }

    result.safe = true;
    result.normalized_path = normalized.generic_string();
    return result;
}

std::optional<std::string> get_env(const std::string& name) {
#ifdef _MSC_VER
    char* val = nullptr;
    size_t len = 0;
    if (_dupenv_s(&val, &len, name.c_str()) == 0 && val != nullptr) {
        std::string result(val);
        free(val);
        return result;
    }
    return std::nullopt;
#else
    const char* val = std::getenv(name.c_str());
    if (val) {
        return std::string(val);
    }
    return std::nullopt;
#endif
}

std::string get_current_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf;
#ifdef _WIN32
    gmtime_s(&tm_buf, &time_t_now);
#else
    gmtime_r(&time_t_now, &tm_buf);
#endif

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
    return buf;
}

std::string generate_uuid() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis;

    uint64_t a = dis(gen);
    uint64_t b = dis(gen);

    // Set version 4 (random) and variant bits
    a = (a & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;  // Version 4
    b = (b & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;  // Variant 1

    char buf[37];
    snprintf(buf, sizeof(buf),
             "%08x-%04x-%04x-%04x-%012llx",
             static_cast<uint32_t>(a >> 32),
             static_cast<uint16_t>((a >> 16) & 0xFFFF),
             static_cast<uint16_t>(a & 0xFFFF),
             static_cast<uint16_t>(b >> 48),
             static_cast<unsigned long long>(b & 0xFFFFFFFFFFFFULL));

    return buf;
}

} // namespace ocx
