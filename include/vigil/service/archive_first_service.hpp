/**
 * @file archive_first_service.hpp
 * @brief Normal write path: archive first, then the canonical row
 *
 * Every mutation renders its event into the text archive through
 * archive_writer and, only when that write reached disk, stores the row
 * with the returned archive path. A failed archive write leaves the store
 * untouched and is returned to the caller.
 */

#pragma once

#include <vigil/archive/archive_event.hpp>
#include <vigil/archive/archive_writer.hpp>
#include <vigil/core/clock.hpp>
#include <vigil/core/result.hpp>
#include <vigil/storage/canonical_store.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace vigil::service {

/**
 * @brief Fields of a new prayer supplied by the caller
 */
struct prayer_submission {
    std::string prayer_id;
    std::string author;
    std::string text;
    std::string generated_prayer;
    std::string project_tag;
    std::string target_audience;
};

/**
 * @class archive_first_service
 * @brief Pairs each archive write with its canonical store write
 *
 * Timestamps of user, prayer and activity events come from the injected
 * clock at minute precision, matching the human-readable archive lines.
 *
 * Thread Safety: Not thread-safe; the store connection is owned by one
 * caller at a time. The archive writer underneath is thread-safe.
 */
class archive_first_service {
public:
    /**
     * @param writer Archive writer; must outlive the service
     * @param store Canonical store; must outlive the service
     * @param clock Time source for event timestamps
     */
    archive_first_service(archive::archive_writer& writer,
                          storage::canonical_store& store,
                          const core::clock_source& clock =
                              core::system_clock_source::instance());

    /**
     * @brief Register a user (users/YYYY_MM_users.txt)
     * @param invited_by Empty for direct registrations
     */
    [[nodiscard]] auto register_user(const std::string& display_name,
                                     const std::string& invited_by = "")
        -> Result<storage::user_record>;

    /**
     * @brief Create a prayer file and its row, and log the submission
     */
    [[nodiscard]] auto submit_prayer(const prayer_submission& submission)
        -> Result<storage::prayer_record>;

    /**
     * @brief Append an Activity line to a prayer and store the event
     *
     * Prayers written before archiving was enabled have no file yet; one is
     * created from the stored row first and its path backfilled.
     *
     * @return The stored event, or record_not_found for an unknown prayer
     */
    [[nodiscard]] auto record_prayer_activity(const std::string& prayer_id,
                                              const std::string& actor,
                                              const std::string& action,
                                              const std::string& detail = "")
        -> Result<storage::event_record>;

    /**
     * @brief Append one event to its time-bucketed log
     *
     * Accepts marks, attributes, activity log lines, auth requests and
     * approvals, invite usage, security events, notifications and role
     * assignments. Sessions are written through snapshot_sessions().
     *
     * @return The stored event, or record_not_found for an assignment whose
     *         role is not defined
     */
    [[nodiscard]] auto record_ledger_event(const archive::ledger_entry& entry)
        -> Result<storage::event_record>;

    /**
     * @brief Replace today's session snapshot and upsert its rows
     */
    [[nodiscard]] auto snapshot_sessions(const std::vector<archive::ledger_entry>& sessions)
        -> Result<std::filesystem::path>;

    /**
     * @brief Replace the invite token snapshot and upsert its rows
     */
    [[nodiscard]] auto snapshot_invite_tokens(
        const std::vector<archive::invite_token_state>& tokens)
        -> Result<std::filesystem::path>;

    /**
     * @brief Replace the role definitions snapshot and upsert its rows
     */
    [[nodiscard]] auto snapshot_roles(const std::vector<archive::role_definition>& roles)
        -> Result<std::filesystem::path>;

private:
    [[nodiscard]] auto ensure_prayer_archive(storage::prayer_record& prayer) -> VoidResult;
    [[nodiscard]] auto log_activity(const std::string& actor,
                                    const std::string& action,
                                    const std::string& detail) -> VoidResult;

    archive::archive_writer& writer_;
    storage::canonical_store& store_;
    const core::clock_source& clock_;
};

}  // namespace vigil::service
