#include "ocx/file_lock.hpp"
#include "ocx/platform.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <utility>

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#endif

namespace ocx {

FileLock::FileLock(std::string path, std::intptr_t handle)
    : path_(std::move(path)), handle_(handle) {}

FileLock::~FileLock() {
#ifdef _WIN32
    HANDLE h = reinterpret_cast<HANDLE>(handle_);
    OVERLAPPED overlapped{};
    UnlockFileEx(h, 0, MAXDWORD, MAXDWORD, &overlapped);
    CloseHandle(h);
#else
    int fd = static_cast<int>(handle_);
    flock(fd, LOCK_UN);
    close(fd);
#endif
    spdlog::debug("released lock {}", path_);
}

Result<std::unique_ptr<FileLock>> FileLock::try_acquire(const std::string& path) {
    using R = Result<std::unique_ptr<FileLock>>;

    std::string parent = get_parent_directory(path);
    if (!parent.empty() && !create_directories(parent)) {
        return R::err(Error(ErrorCode::IO_ERROR, "cannot create lock directory " + parent));
    }

#ifdef _WIN32
    HANDLE h = CreateFileA(path.c_str(), GENERIC_READ | GENERIC_WRITE,
                           FILE_SHARE_READ | FILE_SHARE_WRITE, nullptr, OPEN_ALWAYS,
                           FILE_ATTRIBUTE_NORMAL, nullptr);
    if (h == INVALID_HANDLE_VALUE) {
        return R::err(Error(ErrorCode::IO_ERROR, "failed to open lock file: " + path));
    }

    OVERLAPPED overlapped{};
    if (!LockFileEx(h, LOCKFILE_EXCLUSIVE_LOCK | LOCKFILE_FAIL_IMMEDIATELY, 0, MAXDWORD,
                    MAXDWORD, &overlapped)) {
        CloseHandle(h);
        return R::err(Error(ErrorCode::CONCURRENT_OPERATION,
                            "another ocx operation holds " + path));
    }

    std::intptr_t handle = reinterpret_cast<std::intptr_t>(h);
#else
    int fd = open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        return R::err(Error(ErrorCode::IO_ERROR, "failed to open lock file " + path + ": " +
                                                     std::string(strerror(errno))));
    }

    if (flock(fd, LOCK_EX | LOCK_NB) != 0) {
        int err = errno;
        close(fd);
        if (err == EWOULDBLOCK) {
            return R::err(Error(ErrorCode::CONCURRENT_OPERATION,
                                "another ocx operation holds " + path));
        }
        return R::err(Error(ErrorCode::IO_ERROR, "failed to lock " + path + ": " +
                                                     std::string(strerror(err))));
    }

    std::intptr_t handle = static_cast<std::intptr_t>(fd);
#endif

    spdlog::debug("acquired lock {}", path);
    return R::ok(std::unique_ptr<FileLock>(new FileLock(path, handle)));
}

} // namespace ocx
