/**
 * @file entity_handler.cpp
 * @brief Implementation of the per-entity-type upsert strategies
 */

#include <vigil/recovery/entity_handler.hpp>

#include <vigil/compat/format.hpp>
#include <vigil/integration/logger_adapter.hpp>

namespace vigil::recovery {

using archive::archive_time;
using core::entity_type;
using integration::logger_adapter;
using kcenon::common::make_error;
using kcenon::common::ok;

namespace {

auto mismatch(entity_type type) -> Result<storage::upsert_result> {
    return make_error<storage::upsert_result>(
        error_codes::invalid_argument,
        vigil::compat::format("Event does not belong to {} archives", core::to_string(type)),
        "recovery");
}

/// Invite tokens carry their times as text; unknown times map to the epoch
auto token_time(const archive::invite_token_state& token) -> archive_time {
    auto parsed = archive::parse_with_fallbacks(
        token.created_at, {archive::time_format::iso_8601, archive::time_format::sql_datetime});
    return parsed ? *parsed : archive_time{archive::second_time{}};
}

}  // namespace

// =============================================================================
// Event to Record Conversion
// =============================================================================

auto make_record(const archive::user_registered& user, std::string_view archive_path)
    -> storage::user_record {
    storage::user_record record;
    record.display_name = user.display_name;
    record.invited_by = user.invited_by;
    record.created_at = user.joined_at;
    record.archive_path = std::string(archive_path);
    return record;
}

auto make_record(const archive::prayer_submitted& prayer, std::string_view archive_path)
    -> storage::prayer_record {
    storage::prayer_record record;
    record.prayer_id = prayer.prayer_id;
    record.author = prayer.author;
    record.text = prayer.text;
    record.generated_prayer = prayer.generated_prayer;
    record.project_tag = prayer.project_tag;
    record.target_audience = prayer.target_audience;
    record.submitted_at = prayer.submitted_at;
    record.archive_path = std::string(archive_path);
    return record;
}

auto make_record(const archive::prayer_activity& activity, std::string_view archive_path)
    -> storage::event_record {
    storage::event_record record;
    record.subject_id = activity.prayer_id;
    record.action = activity.action;
    record.actor = activity.actor;
    record.detail = activity.detail;
    record.occurred_at = activity.occurred_at;
    record.archive_path = std::string(archive_path);
    return record;
}

auto make_record(const archive::ledger_entry& entry, std::string_view archive_path)
    -> storage::event_record {
    storage::event_record record;
    record.subject_id = entry.subject_id;
    record.action = entry.action;
    record.actor = entry.actor;
    record.detail = entry.detail;
    record.occurred_at = entry.occurred_at;
    record.archive_path = std::string(archive_path);
    return record;
}

auto make_record(const archive::invite_token_state& token, std::string_view archive_path)
    -> storage::invite_token_record {
    storage::invite_token_record record;
    record.token = token.token;
    record.created_by = token.created_by;
    record.expires_at = token.expires_at;
    record.used = token.used;
    record.used_by = token.used_by;
    record.created_at = token.created_at;
    record.archive_path = std::string(archive_path);
    return record;
}

auto make_record(const archive::role_definition& role, std::string_view archive_path)
    -> storage::role_record {
    storage::role_record record;
    record.name = role.name;
    record.description = role.description;
    record.permissions = role.permissions;
    record.is_system_role = role.is_system_role;
    record.created_by = role.created_by;
    record.archive_path = std::string(archive_path);
    return record;
}

auto natural_key(const archive::archive_event& event) -> std::string {
    if (const auto* user = std::get_if<archive::user_registered>(&event)) {
        return user->display_name;
    }
    if (const auto* prayer = std::get_if<archive::prayer_submitted>(&event)) {
        return prayer->prayer_id;
    }
    if (const auto* activity = std::get_if<archive::prayer_activity>(&event)) {
        return vigil::compat::format("{} {} by {} at {}", activity->prayer_id,
                                     activity->action, activity->actor,
                                     archive::format_iso(activity->occurred_at));
    }
    if (const auto* entry = std::get_if<archive::ledger_entry>(&event)) {
        return vigil::compat::format("{} {} by {} at {}", entry->subject_id, entry->action,
                                     entry->actor, archive::format_iso(entry->occurred_at));
    }
    if (const auto* token = std::get_if<archive::invite_token_state>(&event)) {
        return token->token;
    }
    if (const auto* role = std::get_if<archive::role_definition>(&event)) {
        return role->name;
    }
    return std::get<archive::unparsed_line>(event).text;
}

// =============================================================================
// entity_handler
// =============================================================================

auto entity_handler::upsert(entity_type type,
                            const archive::archive_event& event,
                            std::string_view archive_path,
                            storage::upsert_mode mode) -> Result<storage::upsert_result> {
    switch (type) {
        case entity_type::user:
            if (const auto* user = std::get_if<archive::user_registered>(&event)) {
                return store_.upsert_user(make_record(*user, archive_path), mode);
            }
            break;

        case entity_type::prayer:
            if (const auto* prayer = std::get_if<archive::prayer_submitted>(&event)) {
                return store_.upsert_prayer(make_record(*prayer, archive_path), mode);
            }
            if (const auto* activity = std::get_if<archive::prayer_activity>(&event)) {
                return store_.upsert_event(storage::event_stream::prayer_activity,
                                           make_record(*activity, archive_path), mode);
            }
            break;

        case entity_type::invite_token:
            if (const auto* token = std::get_if<archive::invite_token_state>(&event)) {
                return store_.upsert_invite_token(make_record(*token, archive_path), mode);
            }
            break;

        case entity_type::role:
            if (const auto* role = std::get_if<archive::role_definition>(&event)) {
                return store_.upsert_role(make_record(*role, archive_path), mode);
            }
            break;

        case entity_type::interaction_mark:
        case entity_type::interaction_attribute:
        case entity_type::activity_log:
        case entity_type::auth_request:
        case entity_type::auth_approval:
        case entity_type::session:
        case entity_type::invite_usage:
        case entity_type::security_event:
        case entity_type::notification:
        case entity_type::role_assignment:
            if (const auto* entry = std::get_if<archive::ledger_entry>(&event)) {
                if (auto stream = storage::stream_for(type)) {
                    return store_.upsert_event(*stream, make_record(*entry, archive_path), mode);
                }
            }
            break;
    }
    return mismatch(type);
}

auto entity_handler::create_placeholders(const archive::archive_event& event)
    -> Result<std::size_t> {
    std::size_t created = 0;

    auto user = [&](const std::string& name, const archive_time& seen_at) -> VoidResult {
        if (name.empty()) {
            return ok();
        }
        auto inserted = store_.ensure_placeholder_user(name, seen_at);
        if (inserted.is_err()) {
            return VoidResult(inserted.error());
        }
        if (inserted.value()) {
            logger_adapter::info("Created placeholder user '{}'", name);
            ++created;
        }
        return ok();
    };

    auto prayer = [&](const std::string& prayer_id, const archive_time& seen_at) -> VoidResult {
        if (prayer_id.empty()) {
            return ok();
        }
        auto inserted = store_.ensure_placeholder_prayer(prayer_id, seen_at);
        if (inserted.is_err()) {
            return VoidResult(inserted.error());
        }
        if (inserted.value()) {
            logger_adapter::info("Created placeholder prayer '{}'", prayer_id);
            ++created;
        }
        return ok();
    };

    auto role = [&](const std::string& name) -> VoidResult {
        if (name.empty()) {
            return ok();
        }
        auto inserted = store_.ensure_placeholder_role(name);
        if (inserted.is_err()) {
            return VoidResult(inserted.error());
        }
        if (inserted.value()) {
            logger_adapter::info("Created placeholder role '{}'", name);
            ++created;
        }
        return ok();
    };

    auto ensure_references = [&]() -> VoidResult {
        if (const auto* submitted = std::get_if<archive::prayer_submitted>(&event)) {
            return user(submitted->author, submitted->submitted_at);
        }
        if (const auto* activity = std::get_if<archive::prayer_activity>(&event)) {
            auto referenced = prayer(activity->prayer_id, activity->occurred_at);
            if (referenced.is_err()) {
                return referenced;
            }
            return user(activity->actor, activity->occurred_at);
        }
        if (const auto* entry = std::get_if<archive::ledger_entry>(&event)) {
            auto stream = storage::stream_for(entry->type);
            if (stream && storage::references_prayer(*stream)) {
                auto referenced = prayer(entry->subject_id, entry->occurred_at);
                if (referenced.is_err()) {
                    return referenced;
                }
            }
            if (stream && storage::references_user(*stream)) {
                auto grantee = user(entry->subject_id, entry->occurred_at);
                if (grantee.is_err()) {
                    return grantee;
                }
            }
            if (stream == storage::event_stream::role_assignment) {
                auto named = role(std::string{storage::assigned_role(make_record(*entry, {}))});
                if (named.is_err()) {
                    return named;
                }
            }
            return user(entry->actor, entry->occurred_at);
        }
        if (const auto* definition = std::get_if<archive::role_definition>(&event)) {
            return user(definition->created_by, archive_time{archive::second_time{}});
        }
        if (const auto* token = std::get_if<archive::invite_token_state>(&event)) {
            auto creator = user(token->created_by, token_time(*token));
            if (creator.is_err()) {
                return creator;
            }
            return user(token->used_by, token_time(*token));
        }
        return ok();
    };

    auto result = ensure_references();
    if (result.is_err()) {
        return Result<std::size_t>(result.error());
    }
    return created;
}

auto entity_handler::find_existing(entity_type type, const archive::archive_event& event) const
    -> std::optional<stored_row> {
    switch (type) {
        case entity_type::user:
            if (const auto* user = std::get_if<archive::user_registered>(&event)) {
                if (auto row = store_.find_user(user->display_name)) {
                    return stored_row{row->pk, row->archive_path};
                }
            }
            break;

        case entity_type::prayer:
            if (const auto* prayer = std::get_if<archive::prayer_submitted>(&event)) {
                if (auto row = store_.find_prayer(prayer->prayer_id)) {
                    return stored_row{row->pk, row->archive_path};
                }
            } else if (const auto* activity = std::get_if<archive::prayer_activity>(&event)) {
                if (auto row = store_.find_event(storage::event_stream::prayer_activity,
                                                 make_record(*activity, {}))) {
                    return stored_row{row->pk, row->archive_path};
                }
            }
            break;

        case entity_type::invite_token:
            if (const auto* token = std::get_if<archive::invite_token_state>(&event)) {
                if (auto row = store_.find_invite_token(token->token)) {
                    return stored_row{row->pk, row->archive_path};
                }
            }
            break;

        case entity_type::role:
            if (const auto* role = std::get_if<archive::role_definition>(&event)) {
                if (auto row = store_.find_role(role->name)) {
                    return stored_row{row->pk, row->archive_path};
                }
            }
            break;

        case entity_type::interaction_mark:
        case entity_type::interaction_attribute:
        case entity_type::activity_log:
        case entity_type::auth_request:
        case entity_type::auth_approval:
        case entity_type::session:
        case entity_type::invite_usage:
        case entity_type::security_event:
        case entity_type::notification:
        case entity_type::role_assignment:
            if (const auto* entry = std::get_if<archive::ledger_entry>(&event)) {
                auto stream = storage::stream_for(type);
                if (!stream) {
                    break;
                }
                if (auto row = store_.find_event(*stream, make_record(*entry, {}))) {
                    return stored_row{row->pk, row->archive_path};
                }
            }
            break;
    }
    return std::nullopt;
}

}  // namespace vigil::recovery
