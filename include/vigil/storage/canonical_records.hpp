/**
 * @file canonical_records.hpp
 * @brief Row types of the canonical (relational) store
 *
 * Every row carries the archive_path of the partition that made it durable.
 * The path is empty only for legacy rows written before archiving and for
 * placeholders created during recovery.
 */

#pragma once

#include <vigil/archive/archive_time.hpp>
#include <vigil/core/entity_type.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace vigil::storage {

/**
 * @enum upsert_mode
 * @brief What an upsert does to a row that already matches the natural key
 */
enum class upsert_mode {
    /// Leave business fields alone; only fill an empty archive_path
    insert_missing,
    /// Refresh business fields from the incoming record
    update_existing
};

/**
 * @enum upsert_outcome
 * @brief What an upsert actually did
 */
enum class upsert_outcome { inserted, updated, unchanged, path_backfilled };

/**
 * @struct upsert_result
 * @brief Surrogate key of the matched or inserted row, plus the outcome
 */
struct upsert_result {
    std::int64_t pk{0};
    upsert_outcome outcome{upsert_outcome::unchanged};
};

/**
 * @brief Represents a row of the users table
 */
struct user_record {
    std::int64_t pk{0};
    std::string display_name;  ///< natural key
    std::string invited_by;
    archive::archive_time created_at{archive::second_time{}};
    std::string archive_path;
    bool is_placeholder{false};
};

/**
 * @brief Represents a row of the prayers table
 */
struct prayer_record {
    std::int64_t pk{0};
    std::string prayer_id;  ///< natural key
    std::string author;     ///< empty for placeholders
    std::string text;
    std::string generated_prayer;
    std::string project_tag;
    std::string target_audience;
    archive::archive_time submitted_at{archive::second_time{}};
    std::string archive_path;
    bool is_placeholder{false};
};

/**
 * @brief Represents an invite token
 */
struct invite_token_record {
    std::int64_t pk{0};
    std::string token;  ///< natural key
    std::string created_by;
    std::string expires_at;
    bool used{false};
    std::string used_by;
    std::string created_at;
    std::string archive_path;
};

/**
 * @brief Represents a row of the roles table
 */
struct role_record {
    std::int64_t pk{0};
    std::string name;  ///< natural key
    std::string description;
    std::string permissions{"[]"};
    bool is_system_role{false};
    std::string created_by;
    std::string archive_path;
    bool is_placeholder{false};
};

/**
 * @enum event_stream
 * @brief Event tables sharing the (subject, action, actor, time) layout
 */
enum class event_stream {
    prayer_activity,  ///< Activity section of prayer files
    interaction_mark,
    interaction_attribute,
    activity_log,
    auth_request,
    auth_approval,
    session,
    invite_usage,
    security_event,
    notification,
    role_assignment  ///< user_roles; subject is the grantee, detail starts with the role
};

/// Streams whose tables the initial schema creates
inline constexpr std::array<event_stream, 10> initial_event_streams = {
    event_stream::prayer_activity, event_stream::interaction_mark,
    event_stream::interaction_attribute, event_stream::activity_log,
    event_stream::auth_request, event_stream::auth_approval,
    event_stream::session, event_stream::invite_usage,
    event_stream::security_event, event_stream::notification};

/// All event streams in declaration order
inline constexpr std::array<event_stream, 11> all_event_streams = {
    event_stream::prayer_activity, event_stream::interaction_mark,
    event_stream::interaction_attribute, event_stream::activity_log,
    event_stream::auth_request, event_stream::auth_approval,
    event_stream::session, event_stream::invite_usage,
    event_stream::security_event, event_stream::notification,
    event_stream::role_assignment};

/**
 * @brief Table holding the stream's rows
 */
[[nodiscard]] auto table_name(event_stream stream) noexcept -> std::string_view;

/**
 * @brief True when subject_id is a foreign key into prayers
 */
[[nodiscard]] auto references_prayer(event_stream stream) noexcept -> bool;

/**
 * @brief True when subject_id is a foreign key into users
 */
[[nodiscard]] auto references_user(event_stream stream) noexcept -> bool;

/**
 * @brief Stream fed by a time-bucketed entity type, if any
 */
[[nodiscard]] auto stream_for(core::entity_type type) noexcept
    -> std::optional<event_stream>;

/**
 * @brief Represents one row of an event table
 *
 * The natural key is (subject_id, action, actor, occurred_at) where
 * occurred_at is compared at the coarser of the two precisions.
 */
struct event_record {
    std::int64_t pk{0};
    std::string subject_id;
    std::string action;
    std::string actor;  ///< empty when no user is attached
    std::string detail;
    archive::archive_time occurred_at{archive::second_time{}};
    std::string archive_path;
};

/**
 * @brief Role named by a role assignment's detail (its first field)
 */
[[nodiscard]] auto assigned_role(const event_record& record) -> std::string_view;

}  // namespace vigil::storage
