#pragma once

#include "ocx/errors.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace ocx {

// Exclusive, non-blocking advisory lock on a file. Held until destroyed.
// On POSIX this is flock(2), so two handles in one process also conflict.
class FileLock {
public:
    // CONCURRENT_OPERATION when another holder exists, IO_ERROR when the
    // lock file cannot be opened
    static Result<std::unique_ptr<FileLock>> try_acquire(const std::string& path);

    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    const std::string& path() const { return path_; }

private:
    FileLock(std::string path, std::intptr_t handle);

    std::string path_;
    std::intptr_t handle_;
};

} // namespace ocx
