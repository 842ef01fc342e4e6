/**
 * @file consistency_validator.cpp
 * @brief Implementation of the archive/store consistency validator
 */

#include <vigil/recovery/consistency_validator.hpp>

#include <vigil/archive/archive_reader.hpp>
#include <vigil/compat/format.hpp>
#include <vigil/integration/logger_adapter.hpp>
#include <vigil/recovery/entity_handler.hpp>

#include <filesystem>
#include <system_error>

namespace vigil::recovery {

using core::entity_type;
using integration::logger_adapter;
using kcenon::common::ok;

namespace {

auto path_resolves(const std::filesystem::path& root, const std::string& stored) -> bool {
    std::error_code ec;
    std::filesystem::path path{stored};
    if (std::filesystem::exists(path, ec)) {
        return true;
    }
    return path.is_relative() && std::filesystem::exists(root / path, ec);
}

auto event_key(const storage::event_record& row) -> std::string {
    return vigil::compat::format("{} {} by {} at {}", row.subject_id, row.action, row.actor,
                                 archive::format_iso(row.occurred_at));
}

void abandon_transaction(storage::canonical_store& store) {
    auto rolled = store.rollback();
    if (rolled.is_err()) {
        logger_adapter::error("Rollback failed: {}", rolled.error().message);
    }
}

}  // namespace

auto to_string(divergence_kind kind) -> std::string_view {
    switch (kind) {
        case divergence_kind::missing_row:
            return "missing_row";
        case divergence_kind::missing_archive_path:
            return "missing_archive_path";
        case divergence_kind::unresolved_archive_path:
            return "unresolved_archive_path";
    }
    return "missing_row";
}

auto divergence_report::count(divergence_kind kind) const noexcept -> std::size_t {
    std::size_t n = 0;
    for (const auto& found : divergences) {
        if (found.kind == kind) ++n;
    }
    return n;
}

auto store_snapshot::total() const noexcept -> std::size_t {
    std::size_t sum = prayer_activity_rows;
    for (const auto& [type, count] : rows) {
        sum += count;
    }
    return sum;
}

// =============================================================================
// Construction
// =============================================================================

consistency_validator::consistency_validator(const core::durability_config& config,
                                             storage::canonical_store& store)
    : config_(config), store_(store) {}

// =============================================================================
// Validation
// =============================================================================

auto consistency_validator::validate(entity_type type) const -> Result<divergence_report> {
    divergence_report report;
    report.type = type;

    archive::archive_reader reader{config_};
    auto partitions = reader.list_partitions(type);
    if (partitions.is_err()) {
        return Result<divergence_report>(partitions.error());
    }

    entity_handler handler{store_};
    for (const auto& partition : partitions.value()) {
        ++report.partitions;
        auto events = reader.parse(type, partition);
        if (events.is_err()) {
            return Result<divergence_report>(events.error());
        }
        for (const auto& parsed : events.value()) {
            if (archive::is_unparsed(parsed.event)) {
                ++report.unparsed_lines;
                continue;
            }
            ++report.archive_records;
            if (!handler.find_existing(type, parsed.event)) {
                report.divergences.push_back(divergence{divergence_kind::missing_row,
                                                        natural_key(parsed.event),
                                                        partition.string(),
                                                        parsed.line_number});
            }
        }
    }

    auto checked = check_rows(type, report);
    if (checked.is_err()) {
        return Result<divergence_report>(checked.error());
    }

    if (!report.consistent()) {
        logger_adapter::warn("{}: {} missing row(s), {} without archive path, {} unresolved",
                             core::to_string(type),
                             report.count(divergence_kind::missing_row),
                             report.count(divergence_kind::missing_archive_path),
                             report.count(divergence_kind::unresolved_archive_path));
    }
    return report;
}

auto consistency_validator::validate_all() const -> Result<std::vector<divergence_report>> {
    std::vector<divergence_report> reports;
    for (auto type : core::recovery_order()) {
        auto report = validate(type);
        if (report.is_err()) {
            return Result<std::vector<divergence_report>>(report.error());
        }
        reports.push_back(std::move(report.value()));
    }
    return reports;
}

auto consistency_validator::check_rows(entity_type type, divergence_report& report) const
    -> VoidResult {
    auto inspect = [&](std::string key, const std::string& archive_path) {
        ++report.canonical_rows;
        if (archive_path.empty()) {
            report.divergences.push_back(
                divergence{divergence_kind::missing_archive_path, std::move(key), {}, 0});
        } else if (!path_resolves(config_.archive_root, archive_path)) {
            report.divergences.push_back(divergence{divergence_kind::unresolved_archive_path,
                                                    std::move(key), archive_path, 0});
        }
    };

    auto inspect_events = [&](storage::event_stream stream) -> VoidResult {
        auto rows = store_.list_events(stream);
        if (rows.is_err()) {
            return VoidResult(rows.error());
        }
        for (const auto& row : rows.value()) {
            inspect(event_key(row), row.archive_path);
        }
        return ok();
    };

    switch (type) {
        case entity_type::user: {
            auto rows = store_.list_users();
            if (rows.is_err()) {
                return VoidResult(rows.error());
            }
            for (const auto& row : rows.value()) {
                inspect(row.display_name, row.archive_path);
            }
            return ok();
        }
        case entity_type::prayer: {
            auto rows = store_.list_prayers();
            if (rows.is_err()) {
                return VoidResult(rows.error());
            }
            for (const auto& row : rows.value()) {
                inspect(row.prayer_id, row.archive_path);
            }
            return inspect_events(storage::event_stream::prayer_activity);
        }
        case entity_type::invite_token: {
            auto rows = store_.list_invite_tokens();
            if (rows.is_err()) {
                return VoidResult(rows.error());
            }
            for (const auto& row : rows.value()) {
                inspect(row.token, row.archive_path);
            }
            return ok();
        }
        case entity_type::role: {
            auto rows = store_.list_roles();
            if (rows.is_err()) {
                return VoidResult(rows.error());
            }
            for (const auto& row : rows.value()) {
                inspect(row.name, row.archive_path);
            }
            return ok();
        }
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
            if (auto stream = storage::stream_for(type)) {
                return inspect_events(*stream);
            }
            return ok();
    }
    return ok();
}

auto consistency_validator::snapshot() const -> Result<store_snapshot> {
    store_snapshot snapshot;

    for (auto type : core::all_entity_types) {
        Result<std::size_t> count = [&]() -> Result<std::size_t> {
            switch (type) {
                case entity_type::user:
                    return store_.user_count();
                case entity_type::prayer:
                    return store_.prayer_count();
                case entity_type::invite_token:
                    return store_.invite_token_count();
                case entity_type::role:
                    return store_.role_count();
                default:
                    return store_.event_count(*storage::stream_for(type));
            }
        }();
        if (count.is_err()) {
            return Result<store_snapshot>(count.error());
        }
        snapshot.rows[type] = count.value();
    }

    auto activity = store_.event_count(storage::event_stream::prayer_activity);
    if (activity.is_err()) {
        return Result<store_snapshot>(activity.error());
    }
    snapshot.prayer_activity_rows = activity.value();
    return snapshot;
}

// =============================================================================
// Repair
// =============================================================================

auto consistency_validator::repair_missing_references(entity_type type)
    -> Result<repair_report> {
    repair_report report;
    report.type = type;

    archive::archive_reader reader{config_};
    auto partitions = reader.list_partitions(type);
    if (partitions.is_err()) {
        return Result<repair_report>(partitions.error());
    }

    auto begun = store_.begin_transaction();
    if (begun.is_err()) {
        return Result<repair_report>(begun.error());
    }

    entity_handler handler{store_};
    for (const auto& partition : partitions.value()) {
        auto events = reader.parse(type, partition);
        if (events.is_err()) {
            abandon_transaction(store_);
            return Result<repair_report>(events.error());
        }
        for (const auto& parsed : events.value()) {
            if (archive::is_unparsed(parsed.event)) {
                continue;
            }
            auto existing = handler.find_existing(type, parsed.event);
            if (!existing) {
                ++report.still_missing;
                continue;
            }
            if (!existing->archive_path.empty()) {
                continue;
            }
            auto upserted = handler.upsert(type, parsed.event, partition.string(),
                                           storage::upsert_mode::insert_missing);
            if (upserted.is_err()) {
                abandon_transaction(store_);
                return Result<repair_report>(upserted.error());
            }
            if (upserted.value().outcome == storage::upsert_outcome::path_backfilled) {
                ++report.backfilled;
            }
        }
    }

    auto committed = store_.commit();
    if (committed.is_err()) {
        abandon_transaction(store_);
        return Result<repair_report>(committed.error());
    }

    logger_adapter::info("Repaired {} archive reference(s) for {}", report.backfilled,
                         core::to_string(type));
    return report;
}

}  // namespace vigil::recovery
