/**
 * @file archive_writer.hpp
 * @brief Durable creation and appending of archive partitions
 *
 * This file provides the archive_writer class, the first half of every
 * archive-first mutation: the archive write must succeed, and its returned
 * path be stored on the relational row, before the row is written.
 */

#pragma once

#include <vigil/archive/archive_event.hpp>
#include <vigil/core/clock.hpp>
#include <vigil/core/durability_config.hpp>
#include <vigil/core/entity_type.hpp>
#include <vigil/core/result.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string_view>
#include <vector>

namespace vigil::archive {

/**
 * @class archive_writer
 * @brief Appends events to and atomically replaces archive partitions
 *
 * Durability model:
 * - append(): the target is opened with O_APPEND and an exclusive advisory
 *   lock is taken (bounded by durability_config::lock_timeout). Under the
 *   lock the header is written if the file is still empty, the rendered
 *   event is written, and the file is fsync'ed before the lock is released.
 * - create_or_replace(): content goes to "<target>.tmp.<n>" beside the
 *   target, is fsync'ed, then renamed over the target. Readers see either
 *   the previous file or the new one, never a mix.
 *
 * When archiving is disabled every write succeeds without touching the
 * filesystem and returns an empty path.
 *
 * Thread Safety: All methods are thread-safe. Appends to the same file
 * serialize through the file lock; concurrent create_or_replace calls for
 * the same partition are last-writer-wins.
 *
 * @example
 * @code
 * core::durability_config config;
 * config.archive_root = "/srv/vigil/text_archives";
 *
 * archive_writer writer{config};
 * auto key = partition_for(core::entity_type::user, to_minute_time(now));
 * auto path = writer.append(core::entity_type::user, key,
 *                           user_registered{"alice", "", to_minute_time(now)});
 * if (path.is_err()) {
 *     return;  // the relational write must not happen
 * }
 * @endcode
 */
class archive_writer {
public:
    /**
     * @param config Archive root, enable flag and lock bounds; must outlive the writer
     * @param clock Time source for snapshot stamps
     */
    explicit archive_writer(const core::durability_config& config,
                            const core::clock_source& clock =
                                core::system_clock_source::instance());

    archive_writer(const archive_writer&) = delete;
    auto operator=(const archive_writer&) -> archive_writer& = delete;

    // =========================================================================
    // Core Contract
    // =========================================================================

    /**
     * @brief Append one event to a partition
     *
     * Monthly partitions are created with their header on first use. Prayer
     * partitions must already exist (see create_prayer_archive()).
     *
     * @param type Entity type selecting grammar and directory
     * @param partition_key Partition within the type
     * @param event Event to render; must belong to @p type
     * @return Resolved file path, or archive_io_error / lock_timeout_error /
     *         invalid_partition_key
     */
    [[nodiscard]] auto append(core::entity_type type,
                              std::string_view partition_key,
                              const archive_event& event) -> Result<std::filesystem::path>;

    /**
     * @brief Atomically replace a partition with @p content
     * @return Resolved file path or archive_io_error
     */
    [[nodiscard]] auto create_or_replace(core::entity_type type,
                                         std::string_view partition_key,
                                         std::string_view content)
        -> Result<std::filesystem::path>;

    // =========================================================================
    // Entity Helpers
    // =========================================================================

    /**
     * @brief Create the per-instance file of a new prayer
     *
     * Files are named after the submission minute. When that name is taken
     * a numeric suffix is added (_2, _3, ...); the file is published with
     * link(2) so two writers can never claim the same name.
     */
    [[nodiscard]] auto create_prayer_archive(const prayer_submitted& prayer)
        -> Result<std::filesystem::path>;

    /**
     * @brief Append an Activity line to an existing prayer file
     * @param prayer_file Path previously returned by create_prayer_archive()
     */
    [[nodiscard]] auto append_prayer_activity(const std::filesystem::path& prayer_file,
                                              const prayer_activity& activity)
        -> Result<std::filesystem::path>;

    /**
     * @brief Replace the daily session snapshot containing @p taken_at
     */
    [[nodiscard]] auto write_session_snapshot(const std::vector<ledger_entry>& sessions,
                                              const archive_time& taken_at)
        -> Result<std::filesystem::path>;

    /**
     * @brief Replace the invite token snapshot, stamped with the current time
     */
    [[nodiscard]] auto write_invite_tokens(const std::vector<invite_token_state>& tokens)
        -> Result<std::filesystem::path>;

    /**
     * @brief Replace the role definitions snapshot
     */
    [[nodiscard]] auto write_role_definitions(const std::vector<role_definition>& roles)
        -> Result<std::filesystem::path>;

    /**
     * @brief Remove temporary files left behind by interrupted writes
     * @param older_than Only files untouched for at least this long; the
     *        default spares temp files of writes still in flight
     * @return Number of files removed
     */
    [[nodiscard]] auto sweep_stale_temp_files(
        std::chrono::seconds older_than = std::chrono::minutes{5}) -> Result<std::size_t>;

    // =========================================================================
    // Accessors
    // =========================================================================

    [[nodiscard]] auto enabled() const noexcept -> bool;

    [[nodiscard]] auto root() const -> const std::filesystem::path&;

    /**
     * @brief Absolute location a partition resolves to
     */
    [[nodiscard]] auto resolve(core::entity_type type, std::string_view partition_key) const
        -> Result<std::filesystem::path>;

private:
    [[nodiscard]] auto write_atomic(const std::filesystem::path& target,
                                    std::string_view content) const -> VoidResult;

    const core::durability_config& config_;
    const core::clock_source& clock_;
};

}  // namespace vigil::archive
