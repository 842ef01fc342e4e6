/**
 * @file file_lock.cpp
 * @brief flock(2) based exclusive lock with timeout
 */

#include <vigil/core/file_lock.hpp>

#include <vigil/compat/format.hpp>

#include <cerrno>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace vigil::core {

using kcenon::common::make_error;

file_lock::file_lock(int fd, bool owns_fd) noexcept : fd_(fd), owns_fd_(owns_fd) {}

file_lock::~file_lock() { release(); }

file_lock::file_lock(file_lock&& other) noexcept
    : fd_(other.fd_), owns_fd_(other.owns_fd_) {
    other.fd_ = -1;
    other.owns_fd_ = false;
}

auto file_lock::operator=(file_lock&& other) noexcept -> file_lock& {
    if (this != &other) {
        release();
        fd_ = other.fd_;
        owns_fd_ = other.owns_fd_;
        other.fd_ = -1;
        other.owns_fd_ = false;
    }
    return *this;
}

void file_lock::release() noexcept {
    if (fd_ < 0) {
        return;
    }
    ::flock(fd_, LOCK_UN);
    if (owns_fd_) {
        ::close(fd_);
    }
    fd_ = -1;
    owns_fd_ = false;
}

auto file_lock::acquire(int fd, const lock_options& options) -> Result<file_lock> {
    auto deadline = std::chrono::steady_clock::now() + options.timeout;

    while (true) {
        if (::flock(fd, LOCK_EX | LOCK_NB) == 0) {
            return file_lock{fd, false};
        }

        int err = errno;
        if (err == EINTR) {
            continue;
        }
        if (err != EWOULDBLOCK) {
            return make_error<file_lock>(
                error_codes::archive_io_error,
                vigil::compat::format("flock failed: {}", std::strerror(err)),
                "lock");
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return make_error<file_lock>(
                error_codes::lock_timeout_error,
                vigil::compat::format("Lock not acquired within {} ms",
                                      options.timeout.count()),
                "lock");
        }
        std::this_thread::sleep_for(options.poll_interval);
    }
}

auto file_lock::acquire(const std::filesystem::path& path, const lock_options& options)
    -> Result<file_lock> {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return make_error<file_lock>(
                error_codes::archive_io_error,
                vigil::compat::format("Failed to create lock directory {}: {}",
                                      path.parent_path().string(), ec.message()),
                "lock");
        }
    }

    int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        return make_error<file_lock>(
            error_codes::archive_io_error,
            vigil::compat::format("Failed to open lock file {}: {}", path.string(),
                                  std::strerror(errno)),
            "lock");
    }

    auto locked = acquire(fd, options);
    if (locked.is_err()) {
        ::close(fd);
        return locked;
    }

    // Hand descriptor ownership to the returned lock
    auto held = std::move(locked.value());
    held.owns_fd_ = true;
    return held;
}

}  // namespace vigil::core
