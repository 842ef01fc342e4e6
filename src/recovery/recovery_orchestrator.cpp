/**
 * @file recovery_orchestrator.cpp
 * @brief Implementation of archive replay into the canonical store
 */

#include <vigil/recovery/recovery_orchestrator.hpp>

#include <vigil/compat/format.hpp>
#include <vigil/integration/logger_adapter.hpp>
#include <vigil/recovery/entity_handler.hpp>

#include <set>

namespace vigil::recovery {

using core::entity_type;
using integration::logger_adapter;
using integration::recovery_outcome;
using kcenon::common::ok;

namespace {

constexpr std::string_view kEventSavepoint = "vigil_replay_event";

auto checkpoint_key(const std::filesystem::path& root, const std::filesystem::path& partition)
    -> std::string {
    auto relative = partition.lexically_relative(root);
    if (relative.empty() || *relative.begin() == "..") {
        return partition.generic_string();
    }
    return relative.generic_string();
}

auto completed_key(std::string_view type, std::string_view partition) -> std::string {
    return vigil::compat::format("{}\t{}", type, partition);
}

void abandon_transaction(storage::canonical_store& store) {
    auto rolled = store.rollback();
    if (rolled.is_err()) {
        logger_adapter::error("Rollback of partition transaction failed: {}",
                              rolled.error().message);
    }
}

void tally(entity_stats& stats, storage::upsert_outcome outcome) {
    switch (outcome) {
        case storage::upsert_outcome::inserted:
            ++stats.inserted;
            break;
        case storage::upsert_outcome::updated:
            ++stats.updated;
            break;
        case storage::upsert_outcome::unchanged:
            ++stats.unchanged;
            break;
        case storage::upsert_outcome::path_backfilled:
            ++stats.backfilled;
            break;
    }
}

}  // namespace

auto to_string(recovery_state state) -> std::string_view {
    switch (state) {
        case recovery_state::not_started:
            return "not_started";
        case recovery_state::running:
            return "running";
        case recovery_state::completed:
            return "completed";
        case recovery_state::failed:
            return "failed";
        case recovery_state::cancelled:
            return "cancelled";
    }
    return "not_started";
}

auto recovery_report::rows_written() const noexcept -> std::uint64_t {
    std::uint64_t rows = 0;
    for (const auto& [type, counters] : stats) {
        rows += counters.inserted + counters.updated + counters.backfilled;
    }
    return rows;
}

// =============================================================================
// Construction
// =============================================================================

recovery_orchestrator::recovery_orchestrator(const core::durability_config& config,
                                             storage::canonical_store& store)
    : config_(config), store_(store) {}

void recovery_orchestrator::request_cancel() noexcept {
    cancel_requested_.store(true);
}

auto recovery_orchestrator::state() const noexcept -> recovery_state {
    return state_.load();
}

auto recovery_orchestrator::recovery_plan() -> std::vector<std::vector<entity_type>> {
    return core::dependency_tiers();
}

// =============================================================================
// Run
// =============================================================================

auto recovery_orchestrator::run(const recovery_options& options) -> Result<recovery_report> {
    cancel_requested_.store(false);
    state_.store(recovery_state::running);
    started_ = std::chrono::steady_clock::now();
    report_ = recovery_report{};
    report_.state = recovery_state::running;
    report_.dry_run = options.dry_run;

    logger_adapter::info("Recovery started from {}{}", config_.archive_root.string(),
                         options.dry_run ? " (dry run)" : "");

    std::set<std::string> completed;
    if (!options.dry_run) {
        if (options.resume) {
            auto checkpoint = store_.load_checkpoint();
            if (checkpoint.is_err()) {
                return finish(recovery_state::failed, checkpoint.error());
            }
            for (const auto& entry : checkpoint.value()) {
                completed.insert(completed_key(entry.entity_type, entry.partition_path));
            }
            if (!completed.empty()) {
                logger_adapter::info("Resuming recovery: {} partition(s) already replayed",
                                     completed.size());
            }
        } else {
            auto cleared = store_.clear_checkpoint();
            if (cleared.is_err()) {
                return finish(recovery_state::failed, cleared.error());
            }
        }
    }

    archive::archive_reader reader{config_};
    for (const auto& tier : recovery_plan()) {
        for (auto type : tier) {
            auto& stats = report_.stats[type];
            auto partitions = reader.list_partitions(type);
            if (partitions.is_err()) {
                report_.failed_type = type;
                return finish(recovery_state::failed, partitions.error());
            }

            const auto total = partitions.value().size();
            std::size_t done = 0;
            for (const auto& partition : partitions.value()) {
                if (cancel_requested_.load()) {
                    report_.failed_type = type;
                    report_.failed_partition = partition;
                    return finish(recovery_state::cancelled,
                                  error_info{error_codes::recovery_cancelled,
                                             "Recovery cancelled", "recovery"});
                }

                const auto key = checkpoint_key(config_.archive_root, partition);
                if (completed.count(completed_key(core::to_string(type), key)) > 0) {
                    ++stats.partitions_skipped;
                } else {
                    auto replayed = replay_partition(reader, type, partition, key, options, stats);
                    if (replayed.is_err()) {
                        report_.failed_type = type;
                        report_.failed_partition = partition;
                        return finish(recovery_state::failed,
                                      error_info{error_codes::recovery_failed,
                                                 replayed.error().message, "recovery"});
                    }
                    ++stats.partitions;
                }

                ++done;
                if (options.on_progress) {
                    options.on_progress(recovery_progress{type, partition, done, total});
                }
            }
            logger_adapter::debug("Replayed {}: {} partition(s), {} event(s), {} unparsed",
                                  core::to_string(type), stats.partitions, stats.events,
                                  stats.unparsed);
        }
    }

    if (!options.dry_run) {
        auto cleared = store_.clear_checkpoint();
        if (cleared.is_err()) {
            return finish(recovery_state::failed, cleared.error());
        }
    }

    if (options.validate_after && !options.dry_run) {
        consistency_validator validator{config_, store_};
        auto validation = validator.validate_all();
        if (validation.is_err()) {
            report_.warnings.push_back(vigil::compat::format(
                "post-recovery validation failed: {}", validation.error().message));
        } else {
            for (const auto& found : validation.value()) {
                for (const auto& item : found.divergences) {
                    report_.warnings.push_back(vigil::compat::format(
                        "{}: {} {}", core::to_string(found.type), to_string(item.kind),
                        item.key));
                }
            }
            report_.validation = validation.value();
        }
    }

    state_.store(recovery_state::completed);
    report_.state = recovery_state::completed;
    report_.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_);
    logger_adapter::log_recovery_finished(recovery_outcome::completed, report_.rows_written(),
                                          report_.unparsed_lines);
    return report_;
}

// =============================================================================
// Partition Replay
// =============================================================================

auto recovery_orchestrator::replay_partition(const archive::archive_reader& reader,
                                             entity_type type,
                                             const std::filesystem::path& partition,
                                             const std::string& checkpoint_key,
                                             const recovery_options& options,
                                             entity_stats& stats) -> VoidResult {
    auto events = reader.parse(type, partition);
    if (events.is_err()) {
        return VoidResult(events.error());
    }

    auto note_unparsed = [&](const archive::parsed_event& parsed) {
        const auto& line = std::get<archive::unparsed_line>(parsed.event);
        ++stats.unparsed;
        ++report_.unparsed_lines;
        report_.warnings.push_back(vigil::compat::format("{}:{}: {}", partition.string(),
                                                         parsed.line_number, line.reason));
    };

    if (options.dry_run) {
        for (const auto& parsed : events.value()) {
            if (archive::is_unparsed(parsed.event)) {
                note_unparsed(parsed);
            } else {
                ++stats.events;
            }
        }
        return ok();
    }

    auto begun = store_.begin_transaction();
    if (begun.is_err()) {
        return begun;
    }

    const auto archive_path = partition.string();
    for (const auto& parsed : events.value()) {
        if (archive::is_unparsed(parsed.event)) {
            note_unparsed(parsed);
            continue;
        }
        ++stats.events;
        auto applied = apply_event(type, parsed.event, archive_path, options.mode, stats);
        if (applied.is_err()) {
            abandon_transaction(store_);
            return vigil_void_error(applied.error().code,
                                    vigil::compat::format("{}:{}: {}", archive_path,
                                                          parsed.line_number,
                                                          applied.error().message),
                                    "recovery");
        }
    }

    auto marked = store_.mark_partition_complete(core::to_string(type), checkpoint_key);
    if (marked.is_err()) {
        abandon_transaction(store_);
        return marked;
    }

    auto committed = store_.commit();
    if (committed.is_err()) {
        abandon_transaction(store_);
        return committed;
    }
    return ok();
}

auto recovery_orchestrator::apply_event(entity_type type,
                                        const archive::archive_event& event,
                                        const std::string& archive_path,
                                        storage::upsert_mode mode,
                                        entity_stats& stats) -> VoidResult {
    entity_handler handler{store_};

    auto opened = store_.savepoint(kEventSavepoint);
    if (opened.is_err()) {
        return opened;
    }

    auto first = handler.upsert(type, event, archive_path, mode);
    if (first.is_ok()) {
        tally(stats, first.value().outcome);
        return store_.release_savepoint(kEventSavepoint);
    }

    // Anything but a missing reference is fatal for the partition
    auto undone = store_.rollback_to_savepoint(kEventSavepoint);
    if (undone.is_err()) {
        return undone;
    }
    if (first.error().code != error_codes::constraint_violation) {
        auto released = store_.release_savepoint(kEventSavepoint);
        if (released.is_err()) {
            logger_adapter::warn("Release of event savepoint failed: {}",
                                 released.error().message);
        }
        return VoidResult(first.error());
    }

    auto placeholders = handler.create_placeholders(event);
    if (placeholders.is_err()) {
        return VoidResult(placeholders.error());
    }
    stats.placeholders += placeholders.value();

    auto retried = handler.upsert(type, event, archive_path, mode);
    if (retried.is_err()) {
        return vigil_void_error(
            error_codes::recovery_failed,
            vigil::compat::format("{} still rejected after creating placeholders: {}",
                                  natural_key(event), retried.error().message),
            "recovery");
    }
    tally(stats, retried.value().outcome);
    return store_.release_savepoint(kEventSavepoint);
}

auto recovery_orchestrator::finish(recovery_state state, const error_info& error)
    -> Result<recovery_report> {
    state_.store(state);
    report_.state = state;
    report_.cause = error.message;
    report_.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_);

    std::string position;
    if (report_.failed_type) {
        position = vigil::compat::format("{} {}: ", core::to_string(*report_.failed_type),
                                         report_.failed_partition.string());
    }
    logger_adapter::log_recovery_finished(
        state == recovery_state::cancelled ? recovery_outcome::cancelled
                                           : recovery_outcome::failed,
        report_.rows_written(), report_.unparsed_lines, position + error.message);
    return Result<recovery_report>(error);
}

}  // namespace vigil::recovery
