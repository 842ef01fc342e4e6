/**
 * @file archive_writer.cpp
 * @brief Implementation of durable archive appends and atomic replacement
 */

#include <vigil/archive/archive_writer.hpp>

#include <vigil/archive/archive_grammar.hpp>
#include <vigil/archive/archive_layout.hpp>
#include <vigil/compat/format.hpp>
#include <vigil/core/file_lock.hpp>
#include <vigil/integration/logger_adapter.hpp>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <random>
#include <string>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace vigil::archive {

using core::entity_type;
using integration::archive_operation;
using integration::logger_adapter;
using kcenon::common::make_error;
using kcenon::common::ok;

namespace {

/// Conflict suffixes tried before giving up on a prayer file name
constexpr int kMaxPrayerSuffix = 10000;

/// Closes a POSIX descriptor on scope exit
class scoped_fd {
public:
    explicit scoped_fd(int fd) noexcept : fd_(fd) {}
    ~scoped_fd() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    scoped_fd(const scoped_fd&) = delete;
    auto operator=(const scoped_fd&) -> scoped_fd& = delete;

    [[nodiscard]] auto get() const noexcept -> int { return fd_; }
    [[nodiscard]] auto valid() const noexcept -> bool { return fd_ >= 0; }

    /// Close now and report failure (a failed close can lose buffered data)
    [[nodiscard]] auto close() noexcept -> int {
        int rc = ::close(fd_);
        fd_ = -1;
        return rc;
    }

private:
    int fd_;
};

/// Generate a unique temporary filename beside @p base
auto generate_temp_filename(const std::filesystem::path& base) -> std::filesystem::path {
    static thread_local std::mt19937_64 gen{std::random_device{}()};
    std::uniform_int_distribution<std::uint64_t> dist;

    auto temp_name = base.filename().string() + ".tmp." + std::to_string(dist(gen));
    return base.parent_path() / temp_name;
}

auto io_error(const std::string& what, const std::filesystem::path& path, int err)
    -> error_info {
    return error_info{error_codes::archive_io_error,
                      vigil::compat::format("{} {}: {}", what, path.string(),
                                            std::strerror(err)),
                      "archive"};
}

/// write(2) until every byte is out
auto write_all(int fd, std::string_view data) -> int {
    while (!data.empty()) {
        auto written = ::write(fd, data.data(), data.size());
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return errno;
        }
        data.remove_prefix(static_cast<std::size_t>(written));
    }
    return 0;
}

auto read_all(int fd) -> std::string {
    std::string content;
    char buffer[8192];
    off_t offset = 0;
    while (true) {
        auto n = ::pread(fd, buffer, sizeof(buffer), offset);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            break;
        }
        content.append(buffer, static_cast<std::size_t>(n));
        offset += n;
    }
    return content;
}

/// Persist a rename or link by syncing the containing directory
void sync_directory(const std::filesystem::path& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        return;
    }
    ::fsync(fd);
    ::close(fd);
}

auto ensure_parent(const std::filesystem::path& target) -> VoidResult {
    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
        return make_error<std::monostate>(
            error_codes::archive_io_error,
            vigil::compat::format("Failed to create directory {}: {}",
                                  target.parent_path().string(), ec.message()),
            "archive");
    }
    return ok();
}

auto disabled_path() -> Result<std::filesystem::path> {
    return std::filesystem::path{};
}

}  // namespace

// =============================================================================
// Construction
// =============================================================================

archive_writer::archive_writer(const core::durability_config& config,
                               const core::clock_source& clock)
    : config_(config), clock_(clock) {}

auto archive_writer::enabled() const noexcept -> bool { return config_.archiving_enabled; }

auto archive_writer::root() const -> const std::filesystem::path& {
    return config_.archive_root;
}

auto archive_writer::resolve(entity_type type, std::string_view partition_key) const
    -> Result<std::filesystem::path> {
    auto relative = relative_path(type, partition_key);
    if (relative.is_err()) {
        return relative;
    }
    return config_.archive_root / relative.value();
}

// =============================================================================
// Core Contract
// =============================================================================

auto archive_writer::append(entity_type type, std::string_view partition_key,
                            const archive_event& event) -> Result<std::filesystem::path> {
    if (!config_.archiving_enabled) {
        return disabled_path();
    }

    auto resolved = resolve(type, partition_key);
    if (resolved.is_err()) {
        return resolved;
    }
    const auto target = resolved.value();
    auto type_name = std::string{core::to_string(type)};

    auto fail = [&](const error_info& err) -> Result<std::filesystem::path> {
        logger_adapter::log_archive_write(type_name, target, archive_operation::append,
                                          false, err.message);
        return Result<std::filesystem::path>(err);
    };

    // Prayer files are only ever created whole by create_prayer_archive()
    int flags = O_RDWR | O_APPEND | O_CLOEXEC;
    if (partition_scheme_of(type) != partition_scheme::per_instance) {
        auto parent = ensure_parent(target);
        if (parent.is_err()) {
            return fail(parent.error());
        }
        flags |= O_CREAT;
    }

    scoped_fd fd{::open(target.c_str(), flags, 0644)};
    if (!fd.valid()) {
        return fail(io_error("Failed to open", target, errno));
    }

    auto locked = core::file_lock::acquire(
        fd.get(), core::lock_options{config_.lock_timeout, config_.lock_poll_interval});
    if (locked.is_err()) {
        return fail(locked.error());
    }
    auto lock = std::move(locked.value());

    struct stat st {};
    if (::fstat(fd.get(), &st) != 0) {
        return fail(io_error("Failed to stat", target, errno));
    }

    append_context context;
    context.file_empty = st.st_size == 0 &&
                         partition_scheme_of(type) != partition_scheme::per_instance;
    if (type == entity_type::activity_log && st.st_size > 0) {
        context.last_date_header = scan_last_date_header(read_all(fd.get()));
    }

    auto rendered = render_append(type, partition_key, event, context);
    if (rendered.is_err()) {
        return fail(rendered.error());
    }

    if (int err = write_all(fd.get(), rendered.value()); err != 0) {
        return fail(io_error("Failed to append to", target, err));
    }
    if (::fsync(fd.get()) != 0) {
        return fail(io_error("Failed to sync", target, errno));
    }
    lock.release();

    if (fd.close() != 0) {
        return fail(io_error("Failed to close", target, errno));
    }
    if (context.file_empty) {
        sync_directory(target.parent_path());
    }

    logger_adapter::log_archive_write(type_name, target, archive_operation::append, true);
    return target;
}

auto archive_writer::create_or_replace(entity_type type, std::string_view partition_key,
                                       std::string_view content)
    -> Result<std::filesystem::path> {
    if (!config_.archiving_enabled) {
        return disabled_path();
    }

    auto resolved = resolve(type, partition_key);
    if (resolved.is_err()) {
        return resolved;
    }
    const auto target = resolved.value();

    auto written = write_atomic(target, content);
    logger_adapter::log_archive_write(std::string{core::to_string(type)}, target,
                                      archive_operation::create_or_replace,
                                      written.is_ok(),
                                      written.is_ok() ? "" : written.error().message);
    if (written.is_err()) {
        return Result<std::filesystem::path>(written.error());
    }
    return target;
}

auto archive_writer::write_atomic(const std::filesystem::path& target,
                                  std::string_view content) const -> VoidResult {
    auto parent = ensure_parent(target);
    if (parent.is_err()) {
        return parent;
    }

    auto temp_path = generate_temp_filename(target);
    scoped_fd fd{::open(temp_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644)};
    if (!fd.valid()) {
        return VoidResult(io_error("Failed to create", temp_path, errno));
    }

    auto discard = [&](const error_info& err) -> VoidResult {
        std::error_code ec;
        std::filesystem::remove(temp_path, ec);
        return VoidResult(err);
    };

    if (int err = write_all(fd.get(), content); err != 0) {
        return discard(io_error("Failed to write", temp_path, err));
    }
    if (::fsync(fd.get()) != 0) {
        return discard(io_error("Failed to sync", temp_path, errno));
    }
    if (fd.close() != 0) {
        return discard(io_error("Failed to close", temp_path, errno));
    }

    // Atomic rename
    std::error_code ec;
    std::filesystem::rename(temp_path, target, ec);
    if (ec) {
        return discard(error_info{error_codes::archive_io_error,
                                  "Failed to rename temp file: " + ec.message(),
                                  "archive"});
    }
    sync_directory(target.parent_path());
    return ok();
}

// =============================================================================
// Entity Helpers
// =============================================================================

auto archive_writer::create_prayer_archive(const prayer_submitted& prayer)
    -> Result<std::filesystem::path> {
    if (!config_.archiving_enabled) {
        return disabled_path();
    }

    const auto base_key = partition_for(entity_type::prayer, prayer.submitted_at);
    auto base_path = resolve(entity_type::prayer, base_key);
    if (base_path.is_err()) {
        return base_path;
    }

    auto fail = [&](const error_info& err) -> Result<std::filesystem::path> {
        logger_adapter::log_archive_write("prayer", base_path.value(),
                                          archive_operation::create_or_replace, false,
                                          err.message);
        return Result<std::filesystem::path>(err);
    };

    auto parent = ensure_parent(base_path.value());
    if (parent.is_err()) {
        return fail(parent.error());
    }

    auto content = render_prayer_file(prayer);
    auto temp_path = generate_temp_filename(base_path.value());
    {
        scoped_fd fd{
            ::open(temp_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644)};
        if (!fd.valid()) {
            return fail(io_error("Failed to create", temp_path, errno));
        }
        int err = write_all(fd.get(), content);
        if (err == 0 && ::fsync(fd.get()) != 0) {
            err = errno;
        }
        if (err == 0 && fd.close() != 0) {
            err = errno;
        }
        if (err != 0) {
            ::unlink(temp_path.c_str());
            return fail(io_error("Failed to write", temp_path, err));
        }
    }

    std::filesystem::path published;
    for (int n = 1; n <= kMaxPrayerSuffix && published.empty(); ++n) {
        auto key = n == 1 ? base_key : vigil::compat::format("{}_{}", base_key, n);
        auto candidate = resolve(entity_type::prayer, key);
        if (candidate.is_err()) {
            ::unlink(temp_path.c_str());
            return fail(candidate.error());
        }
        if (::link(temp_path.c_str(), candidate.value().c_str()) == 0) {
            published = candidate.value();
        } else if (errno != EEXIST) {
            int err = errno;
            ::unlink(temp_path.c_str());
            return fail(io_error("Failed to publish", candidate.value(), err));
        }
    }
    ::unlink(temp_path.c_str());

    if (published.empty()) {
        return fail(error_info{error_codes::archive_io_error,
                               "No free prayer file name for " + base_key, "archive"});
    }
    sync_directory(published.parent_path());

    logger_adapter::log_archive_write("prayer", published,
                                      archive_operation::create_or_replace, true);
    return published;
}

auto archive_writer::append_prayer_activity(const std::filesystem::path& prayer_file,
                                            const prayer_activity& activity)
    -> Result<std::filesystem::path> {
    if (!config_.archiving_enabled) {
        return disabled_path();
    }

    auto relative = prayer_file.lexically_normal().lexically_relative(
        config_.archive_root.lexically_normal());
    auto key = partition_key_of(entity_type::prayer, relative);
    if (!key) {
        return make_error<std::filesystem::path>(
            error_codes::invalid_partition_key,
            vigil::compat::format("{} is not a prayer archive under {}", prayer_file.string(),
                                  config_.archive_root.string()),
            "archive");
    }
    return append(entity_type::prayer, *key, activity);
}

auto archive_writer::write_session_snapshot(const std::vector<ledger_entry>& sessions,
                                            const archive_time& taken_at)
    -> Result<std::filesystem::path> {
    return create_or_replace(entity_type::session,
                             partition_for(entity_type::session, taken_at),
                             render_session_snapshot(sessions, taken_at));
}

auto archive_writer::write_invite_tokens(const std::vector<invite_token_state>& tokens)
    -> Result<std::filesystem::path> {
    archive_time now = to_second_time(clock_.now());
    return create_or_replace(entity_type::invite_token, kInviteTokenPartition,
                             render_invite_tokens(tokens, now));
}

auto archive_writer::write_role_definitions(const std::vector<role_definition>& roles)
    -> Result<std::filesystem::path> {
    archive_time now = to_second_time(clock_.now());
    return create_or_replace(entity_type::role, kRoleDefinitionsPartition,
                             render_role_definitions(roles, now));
}

auto archive_writer::sweep_stale_temp_files(std::chrono::seconds older_than)
    -> Result<std::size_t> {
    std::size_t removed = 0;
    std::error_code ec;
    if (!config_.archiving_enabled ||
        !std::filesystem::is_directory(config_.archive_root, ec)) {
        return removed;
    }

    std::vector<std::filesystem::path> stale;
    auto now = std::filesystem::file_time_type::clock::now();
    for (auto it = std::filesystem::recursive_directory_iterator(config_.archive_root, ec);
         !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec) || !is_temp_file(it->path())) {
            continue;
        }
        std::error_code time_ec;
        auto modified = std::filesystem::last_write_time(it->path(), time_ec);
        if (!time_ec && now - modified >= older_than) {
            stale.push_back(it->path());
        }
    }
    if (ec) {
        return make_error<std::size_t>(
            error_codes::archive_io_error,
            vigil::compat::format("Failed to scan {}: {}", config_.archive_root.string(),
                                  ec.message()),
            "archive");
    }

    for (const auto& path : stale) {
        std::error_code remove_ec;
        if (std::filesystem::remove(path, remove_ec)) {
            ++removed;
            logger_adapter::info("Removed stale temp file {}", path.string());
        } else if (remove_ec) {
            logger_adapter::warn("Failed to remove stale temp file {}: {}", path.string(),
                                 remove_ec.message());
        }
    }
    return removed;
}

}  // namespace vigil::archive
