/**
 * @file archive_event.hpp
 * @brief Typed events carried by archive files
 */

#pragma once

#include <vigil/archive/archive_time.hpp>
#include <vigil/core/entity_type.hpp>

#include <cstddef>
#include <string>
#include <variant>

namespace vigil::archive {

/**
 * @struct user_registered
 * @brief One line of a monthly registration file
 */
struct user_registered {
    std::string display_name;
    std::string invited_by;  ///< empty for direct registrations
    archive_time joined_at{minute_time{}};
};

/**
 * @struct prayer_submitted
 * @brief Header and body block of a per-prayer file
 */
struct prayer_submitted {
    std::string prayer_id;
    std::string author;
    archive_time submitted_at{minute_time{}};
    std::string project_tag;
    std::string target_audience;
    std::string text;
    std::string generated_prayer;
};

/**
 * @struct prayer_activity
 * @brief One line of a prayer file's Activity section
 */
struct prayer_activity {
    std::string prayer_id;
    std::string actor;
    std::string action;  ///< prayed, answered, testimony, archived, restored, flagged, ...
    std::string detail;
    archive_time occurred_at{minute_time{}};
};

/**
 * @struct ledger_entry
 * @brief One event of a time-bucketed log
 *
 * Covers marks, attributes, the monthly activity log, auth requests and
 * approvals, session snapshot rows, invite usage, security events and
 * notifications, role assignments. Columns that are not part of the natural key travel in
 * detail, joined by '|'.
 */
struct ledger_entry {
    core::entity_type type{core::entity_type::activity_log};
    std::string subject_id;
    std::string action;
    std::string actor;
    std::string detail;
    archive_time occurred_at{second_time{}};
};

/**
 * @struct invite_token_state
 * @brief One row of the invite token snapshot
 */
struct invite_token_state {
    std::string token;
    std::string created_by;
    std::string expires_at;  ///< ISO text, empty when unknown
    bool used{false};
    std::string used_by;
    std::string created_at;  ///< ISO text, empty when unknown
};

/**
 * @struct role_definition
 * @brief One row of the role definitions snapshot
 */
struct role_definition {
    std::string name;
    std::string description;
    std::string permissions;  ///< JSON array text, kept verbatim
    bool is_system_role{false};
    std::string created_by;  ///< empty for roles nobody created
};

/**
 * @struct unparsed_line
 * @brief A line no grammar rule or timestamp layout accepted
 */
struct unparsed_line {
    std::string text;
    std::string reason;
};

/// Any event produced by archive_reader
using archive_event = std::variant<user_registered, prayer_submitted, prayer_activity,
                                   ledger_entry, invite_token_state, role_definition,
                                   unparsed_line>;

/**
 * @struct parsed_event
 * @brief An event plus the 1-based line where it ended
 */
struct parsed_event {
    std::size_t line_number{0};
    archive_event event;
};

/**
 * @brief True when @p event is an unparsed_line
 */
[[nodiscard]] inline auto is_unparsed(const archive_event& event) noexcept -> bool {
    return std::holds_alternative<unparsed_line>(event);
}

}  // namespace vigil::archive
