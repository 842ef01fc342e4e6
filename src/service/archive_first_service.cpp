/**
 * @file archive_first_service.cpp
 * @brief Implementation of the archive-first write path
 */

#include <vigil/service/archive_first_service.hpp>

#include <vigil/archive/archive_layout.hpp>
#include <vigil/compat/format.hpp>
#include <vigil/integration/logger_adapter.hpp>
#include <vigil/recovery/entity_handler.hpp>

#include <algorithm>
#include <cctype>

namespace vigil::service {

using archive::to_minute_time;
using core::entity_type;
using integration::logger_adapter;
using kcenon::common::make_error;
using kcenon::common::ok;

namespace {

/// Names travel through line and pipe formats; they must read back unchanged
auto is_archivable_name(const std::string& name) -> bool {
    if (name.empty() || std::isspace(static_cast<unsigned char>(name.front())) ||
        std::isspace(static_cast<unsigned char>(name.back()))) {
        return false;
    }
    return std::none_of(name.begin(), name.end(), [](char c) {
        return c == '|' || std::iscntrl(static_cast<unsigned char>(c));
    });
}

void abandon_transaction(storage::canonical_store& store) {
    auto rolled = store.rollback();
    if (rolled.is_err()) {
        logger_adapter::error("Rollback of snapshot rows failed: {}", rolled.error().message);
    }
}

}  // namespace

archive_first_service::archive_first_service(archive::archive_writer& writer,
                                             storage::canonical_store& store,
                                             const core::clock_source& clock)
    : writer_(writer), store_(store), clock_(clock) {}

// =============================================================================
// Users and Prayers
// =============================================================================

auto archive_first_service::register_user(const std::string& display_name,
                                          const std::string& invited_by)
    -> Result<storage::user_record> {
    if (!is_archivable_name(display_name) ||
        (!invited_by.empty() && !is_archivable_name(invited_by))) {
        return make_error<storage::user_record>(
            error_codes::invalid_argument,
            vigil::compat::format("Display name '{}' is empty or contains separators",
                                  display_name),
            "service");
    }

    archive::user_registered event{display_name, invited_by, to_minute_time(clock_.now())};
    auto path = writer_.append(entity_type::user,
                               archive::partition_for(entity_type::user, event.joined_at),
                               event);
    if (path.is_err()) {
        return Result<storage::user_record>(path.error());
    }

    auto record = recovery::make_record(event, path.value().string());
    auto stored = store_.upsert_user(record, storage::upsert_mode::update_existing);
    if (stored.is_err()) {
        return Result<storage::user_record>(stored.error());
    }
    record.pk = stored.value().pk;

    auto logged = log_activity(display_name, "joined",
                               invited_by.empty() ? "" : "invited by " + invited_by);
    if (logged.is_err()) {
        return Result<storage::user_record>(logged.error());
    }
    return record;
}

auto archive_first_service::submit_prayer(const prayer_submission& submission)
    -> Result<storage::prayer_record> {
    if (submission.prayer_id.empty() || submission.author.empty()) {
        return make_error<storage::prayer_record>(
            error_codes::invalid_argument, "Prayer id and author are required", "service");
    }

    archive::prayer_submitted event;
    event.prayer_id = submission.prayer_id;
    event.author = submission.author;
    event.submitted_at = to_minute_time(clock_.now());
    event.project_tag = submission.project_tag;
    event.target_audience = submission.target_audience;
    event.text = submission.text;
    event.generated_prayer = submission.generated_prayer;

    auto path = writer_.create_prayer_archive(event);
    if (path.is_err()) {
        return Result<storage::prayer_record>(path.error());
    }

    auto record = recovery::make_record(event, path.value().string());
    auto stored = store_.upsert_prayer(record, storage::upsert_mode::update_existing);
    if (stored.is_err()) {
        return Result<storage::prayer_record>(stored.error());
    }
    record.pk = stored.value().pk;

    auto logged = log_activity(submission.author, "submitted",
                               vigil::compat::format("prayer {}", submission.prayer_id));
    if (logged.is_err()) {
        return Result<storage::prayer_record>(logged.error());
    }
    return record;
}

auto archive_first_service::record_prayer_activity(const std::string& prayer_id,
                                                   const std::string& actor,
                                                   const std::string& action,
                                                   const std::string& detail)
    -> Result<storage::event_record> {
    if (!is_archivable_name(actor) || action.empty()) {
        return make_error<storage::event_record>(
            error_codes::invalid_argument, "Activity needs a valid actor and an action",
            "service");
    }
    auto prayer = store_.find_prayer(prayer_id);
    if (!prayer) {
        return make_error<storage::event_record>(
            error_codes::record_not_found,
            vigil::compat::format("Prayer '{}' does not exist", prayer_id), "service");
    }

    auto prepared = ensure_prayer_archive(*prayer);
    if (prepared.is_err()) {
        return Result<storage::event_record>(prepared.error());
    }

    archive::prayer_activity activity{prayer_id, actor, action, detail,
                                      to_minute_time(clock_.now())};
    std::filesystem::path written;
    if (!prayer->archive_path.empty()) {
        auto path = writer_.append_prayer_activity(prayer->archive_path, activity);
        if (path.is_err()) {
            return Result<storage::event_record>(path.error());
        }
        written = path.value();
    }

    auto record = recovery::make_record(activity, written.string());
    auto stored = store_.upsert_event(storage::event_stream::prayer_activity, record,
                                      storage::upsert_mode::update_existing);
    if (stored.is_err()) {
        return Result<storage::event_record>(stored.error());
    }
    record.pk = stored.value().pk;

    auto logged = log_activity(actor, action, vigil::compat::format("prayer {}", prayer_id));
    if (logged.is_err()) {
        return Result<storage::event_record>(logged.error());
    }
    return record;
}

// =============================================================================
// Time-bucketed Logs
// =============================================================================

auto archive_first_service::record_ledger_event(const archive::ledger_entry& entry)
    -> Result<storage::event_record> {
    auto stream = storage::stream_for(entry.type);
    if (!stream || entry.type == entity_type::session) {
        return make_error<storage::event_record>(
            error_codes::invalid_argument,
            vigil::compat::format("{} events are not written to a log",
                                  core::to_string(entry.type)),
            "service");
    }

    if (entry.type == entity_type::role_assignment) {
        auto grant = recovery::make_record(entry, {});
        auto role = storage::assigned_role(grant);
        if (!store_.find_role(role)) {
            return make_error<storage::event_record>(
                error_codes::record_not_found,
                vigil::compat::format("Role '{}' is not defined", role), "service");
        }
    }

    auto path = writer_.append(entry.type, archive::partition_for(entry.type, entry.occurred_at),
                               entry);
    if (path.is_err()) {
        return Result<storage::event_record>(path.error());
    }

    auto record = recovery::make_record(entry, path.value().string());
    auto stored = store_.upsert_event(*stream, record, storage::upsert_mode::update_existing);
    if (stored.is_err()) {
        return Result<storage::event_record>(stored.error());
    }
    record.pk = stored.value().pk;
    return record;
}

// =============================================================================
// Snapshots
// =============================================================================

auto archive_first_service::snapshot_sessions(const std::vector<archive::ledger_entry>& sessions)
    -> Result<std::filesystem::path> {
    auto path = writer_.write_session_snapshot(sessions,
                                               archive::to_second_time(clock_.now()));
    if (path.is_err()) {
        return path;
    }

    auto begun = store_.begin_transaction();
    if (begun.is_err()) {
        return Result<std::filesystem::path>(begun.error());
    }
    for (const auto& session : sessions) {
        auto stored = store_.upsert_event(storage::event_stream::session,
                                          recovery::make_record(session, path.value().string()),
                                          storage::upsert_mode::update_existing);
        if (stored.is_err()) {
            abandon_transaction(store_);
            return Result<std::filesystem::path>(stored.error());
        }
    }
    auto committed = store_.commit();
    if (committed.is_err()) {
        abandon_transaction(store_);
        return Result<std::filesystem::path>(committed.error());
    }
    return path;
}

auto archive_first_service::snapshot_invite_tokens(
    const std::vector<archive::invite_token_state>& tokens) -> Result<std::filesystem::path> {
    auto path = writer_.write_invite_tokens(tokens);
    if (path.is_err()) {
        return path;
    }

    auto begun = store_.begin_transaction();
    if (begun.is_err()) {
        return Result<std::filesystem::path>(begun.error());
    }
    for (const auto& token : tokens) {
        auto stored = store_.upsert_invite_token(
            recovery::make_record(token, path.value().string()),
            storage::upsert_mode::update_existing);
        if (stored.is_err()) {
            abandon_transaction(store_);
            return Result<std::filesystem::path>(stored.error());
        }
    }
    auto committed = store_.commit();
    if (committed.is_err()) {
        abandon_transaction(store_);
        return Result<std::filesystem::path>(committed.error());
    }
    return path;
}

auto archive_first_service::snapshot_roles(const std::vector<archive::role_definition>& roles)
    -> Result<std::filesystem::path> {
    auto path = writer_.write_role_definitions(roles);
    if (path.is_err()) {
        return path;
    }

    auto begun = store_.begin_transaction();
    if (begun.is_err()) {
        return Result<std::filesystem::path>(begun.error());
    }
    for (const auto& role : roles) {
        auto stored = store_.upsert_role(recovery::make_record(role, path.value().string()),
                                         storage::upsert_mode::update_existing);
        if (stored.is_err()) {
            abandon_transaction(store_);
            return Result<std::filesystem::path>(stored.error());
        }
    }
    auto committed = store_.commit();
    if (committed.is_err()) {
        abandon_transaction(store_);
        return Result<std::filesystem::path>(committed.error());
    }
    return path;
}

// =============================================================================
// Helpers
// =============================================================================

auto archive_first_service::ensure_prayer_archive(storage::prayer_record& prayer)
    -> VoidResult {
    if (!prayer.archive_path.empty() || !writer_.enabled()) {
        return ok();
    }

    archive::prayer_submitted event;
    event.prayer_id = prayer.prayer_id;
    event.author = prayer.author;
    event.submitted_at = prayer.submitted_at;
    event.project_tag = prayer.project_tag;
    event.target_audience = prayer.target_audience;
    event.text = prayer.text;
    event.generated_prayer = prayer.generated_prayer;

    auto path = writer_.create_prayer_archive(event);
    if (path.is_err()) {
        return VoidResult(path.error());
    }

    prayer.archive_path = path.value().string();
    auto stored = store_.upsert_prayer(prayer, storage::upsert_mode::insert_missing);
    if (stored.is_err()) {
        return VoidResult(stored.error());
    }
    logger_adapter::info("Created archive for legacy prayer '{}' at {}", prayer.prayer_id,
                         prayer.archive_path);
    return ok();
}

auto archive_first_service::log_activity(const std::string& actor,
                                         const std::string& action,
                                         const std::string& detail) -> VoidResult {
    archive::ledger_entry entry;
    entry.type = entity_type::activity_log;
    entry.actor = actor;
    entry.action = action;
    entry.detail = detail;
    entry.occurred_at = to_minute_time(clock_.now());

    auto recorded = record_ledger_event(entry);
    if (recorded.is_err()) {
        return VoidResult(recorded.error());
    }
    return ok();
}

}  // namespace vigil::service
