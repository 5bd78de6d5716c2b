#pragma once

#include <kiln/result.hpp>
#include <filesystem>
#include <optional>

namespace kiln {

// Exclusive flock(2) on a lock file, released when the object is
// destroyed. Two FileLocks on the same path exclude each other across
// processes and across threads of one process.
class FileLock {
public:
    // Blocks until the lock is held. Creates the file if needed.
    static Result<FileLock> acquire(const std::filesystem::path& path);
    // Returns nullopt when someone else holds the lock
    static std::optional<FileLock> try_acquire(const std::filesystem::path& path);

    FileLock(FileLock&& o) noexcept;
    FileLock& operator=(FileLock&& o) noexcept;
    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;
    ~FileLock();

private:
    explicit FileLock(int fd) : fd_(fd) {}
    int fd_ = -1;
};

} // namespace kiln
