/**
 * @file canonical_records.cpp
 * @brief Event stream table mapping
 */

#include <vigil/storage/canonical_records.hpp>

namespace vigil::storage {

auto table_name(event_stream stream) noexcept -> std::string_view {
    switch (stream) {
        case event_stream::prayer_activity:
            return "prayer_activity";
        case event_stream::interaction_mark:
            return "prayer_marks";
        case event_stream::interaction_attribute:
            return "prayer_attributes";
        case event_stream::activity_log:
            return "activity_log";
        case event_stream::auth_request:
            return "auth_requests";
        case event_stream::auth_approval:
            return "auth_approvals";
        case event_stream::session:
            return "sessions";
        case event_stream::invite_usage:
            return "invite_usage";
        case event_stream::security_event:
            return "security_events";
        case event_stream::notification:
            return "notifications";
        case event_stream::role_assignment:
            return "user_roles";
    }
    return "";
}

auto references_prayer(event_stream stream) noexcept -> bool {
    switch (stream) {
        case event_stream::prayer_activity:
        case event_stream::interaction_mark:
        case event_stream::interaction_attribute:
            return true;
        default:
            return false;
    }
}

auto references_user(event_stream stream) noexcept -> bool {
    return stream == event_stream::role_assignment;
}

auto assigned_role(const event_record& record) -> std::string_view {
    std::string_view detail = record.detail;
    return detail.substr(0, detail.find('|'));
}

auto stream_for(core::entity_type type) noexcept -> std::optional<event_stream> {
    using core::entity_type;
    switch (type) {
        case entity_type::interaction_mark:
            return event_stream::interaction_mark;
        case entity_type::interaction_attribute:
            return event_stream::interaction_attribute;
        case entity_type::activity_log:
            return event_stream::activity_log;
        case entity_type::auth_request:
            return event_stream::auth_request;
        case entity_type::auth_approval:
            return event_stream::auth_approval;
        case entity_type::session:
            return event_stream::session;
        case entity_type::invite_usage:
            return event_stream::invite_usage;
        case entity_type::security_event:
            return event_stream::security_event;
        case entity_type::notification:
            return event_stream::notification;
        case entity_type::role_assignment:
            return event_stream::role_assignment;
        case entity_type::user:
        case entity_type::prayer:
        case entity_type::invite_token:
        case entity_type::role:
            return std::nullopt;
    }
    return std::nullopt;
}

}  // namespace vigil::storage
