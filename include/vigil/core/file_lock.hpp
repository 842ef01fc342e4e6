/**
 * @file file_lock.hpp
 * @brief Exclusive advisory file lock with a bounded acquisition wait
 *
 * Wraps flock(2). Locks belong to the open file description, so two
 * descriptors opened on the same path contend even within one process.
 */

#pragma once

#include <vigil/core/result.hpp>

#include <chrono>
#include <filesystem>

namespace vigil::core {

/**
 * @struct lock_options
 * @brief Acquisition bounds for file_lock
 */
struct lock_options {
    /// Give up with lock_timeout_error after this long
    std::chrono::milliseconds timeout{5000};

    /// Sleep between non-blocking attempts
    std::chrono::milliseconds poll_interval{10};
};

/**
 * @class file_lock
 * @brief RAII holder of an exclusive flock
 *
 * Move-only. The lock is released (and an owned descriptor closed) on
 * destruction or release().
 */
class file_lock {
public:
    /**
     * @brief Lock an already open descriptor
     *
     * The descriptor stays owned by the caller and must outlive the lock.
     *
     * @param fd Open file descriptor
     * @param options Timeout and poll interval
     * @return The held lock, lock_timeout_error, or archive_io_error
     */
    [[nodiscard]] static auto acquire(int fd, const lock_options& options)
        -> Result<file_lock>;

    /**
     * @brief Open (creating if needed) and lock a dedicated lock file
     * @param path Lock file location; parent directories are created
     * @param options Timeout and poll interval
     * @return The held lock owning its descriptor
     */
    [[nodiscard]] static auto acquire(const std::filesystem::path& path,
                                      const lock_options& options)
        -> Result<file_lock>;

    ~file_lock();

    file_lock(const file_lock&) = delete;
    auto operator=(const file_lock&) -> file_lock& = delete;
    file_lock(file_lock&& other) noexcept;
    auto operator=(file_lock&& other) noexcept -> file_lock&;

    /**
     * @brief Release the lock early
     */
    void release() noexcept;

    [[nodiscard]] auto held() const noexcept -> bool { return fd_ >= 0; }

    [[nodiscard]] auto fd() const noexcept -> int { return fd_; }

private:
    file_lock(int fd, bool owns_fd) noexcept;

    int fd_{-1};
    bool owns_fd_{false};
};

}  // namespace vigil::core
