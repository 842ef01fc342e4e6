/**
 * @file recovery_orchestrator.hpp
 * @brief Rebuilds the canonical store from the text archive
 *
 * Entity types are replayed in dependency order (see recovery_plan()); the
 * partitions of each type in lexicographic path order. Every partition is
 * upserted inside one store transaction that also records the partition in
 * the checkpoint table, so an interrupted run resumes at the first
 * partition that did not commit.
 */

#pragma once

#include <vigil/archive/archive_event.hpp>
#include <vigil/archive/archive_reader.hpp>
#include <vigil/core/durability_config.hpp>
#include <vigil/core/entity_type.hpp>
#include <vigil/core/result.hpp>
#include <vigil/recovery/consistency_validator.hpp>
#include <vigil/storage/canonical_store.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vigil::recovery {

/**
 * @enum recovery_state
 * @brief Lifecycle of one recovery run
 */
enum class recovery_state { not_started, running, completed, failed, cancelled };

[[nodiscard]] auto to_string(recovery_state state) -> std::string_view;

/**
 * @brief Position reported after each partition
 */
struct recovery_progress {
    core::entity_type type{core::entity_type::user};
    std::filesystem::path partition;
    std::size_t partitions_done{0};
    std::size_t partitions_total{0};
};

/**
 * @brief Options of a recovery run
 */
struct recovery_options {
    /// Parse and count without touching the store
    bool dry_run{false};

    /// What to do with rows that already match
    storage::upsert_mode mode{storage::upsert_mode::insert_missing};

    /// Skip partitions recorded by an earlier, interrupted run
    bool resume{true};

    /// Run the consistency validator once all types are replayed
    bool validate_after{true};

    /// Called after each partition; may call request_cancel()
    std::function<void(const recovery_progress&)> on_progress;
};

/**
 * @brief Per-type counters
 */
struct entity_stats {
    std::size_t partitions{0};
    std::size_t partitions_skipped{0};
    std::size_t events{0};
    std::size_t inserted{0};
    std::size_t updated{0};
    std::size_t unchanged{0};
    std::size_t backfilled{0};
    std::size_t placeholders{0};
    std::size_t unparsed{0};
};

/**
 * @brief Outcome of a recovery run
 */
struct recovery_report {
    recovery_state state{recovery_state::not_started};
    bool dry_run{false};

    /// Failure or cancellation position
    std::optional<core::entity_type> failed_type;
    std::filesystem::path failed_partition;
    std::string cause;

    std::map<core::entity_type, entity_stats> stats;
    std::uint64_t unparsed_lines{0};

    /// One entry per unparsed line ("path:line: reason") and per divergence
    std::vector<std::string> warnings;

    /// Findings of the post-recovery validation, when it ran
    std::vector<divergence_report> validation;

    std::chrono::milliseconds elapsed{0};

    /// Rows inserted, updated or backfilled
    [[nodiscard]] auto rows_written() const noexcept -> std::uint64_t;
};

/**
 * @class recovery_orchestrator
 * @brief Replays archive partitions into a canonical store
 *
 * A forward reference (an event naming a user or prayer that has no row)
 * rolls back to the event's savepoint, creates placeholders and retries
 * once. Cancellation is cooperative and observed between partitions.
 *
 * Thread Safety: run() must not be called concurrently; request_cancel()
 * and state() may be called from any thread.
 *
 * @example
 * @code
 * recovery_orchestrator recovery{config, store};
 * auto result = recovery.run();
 * if (result.is_err()) {
 *     const auto& report = recovery.report();
 *     // report.failed_type, report.failed_partition, report.cause
 * }
 * @endcode
 */
class recovery_orchestrator {
public:
    /**
     * @param config Archive root; must outlive the orchestrator
     * @param store Target store with the current schema; must outlive the orchestrator
     */
    recovery_orchestrator(const core::durability_config& config,
                          storage::canonical_store& store);

    recovery_orchestrator(const recovery_orchestrator&) = delete;
    auto operator=(const recovery_orchestrator&) -> recovery_orchestrator& = delete;

    /**
     * @brief Replay the whole archive
     * @return The report, or recovery_failed / recovery_cancelled; report()
     *         holds the failure position in either case
     */
    [[nodiscard]] auto run(const recovery_options& options = {}) -> Result<recovery_report>;

    /**
     * @brief Stop at the next partition boundary
     */
    void request_cancel() noexcept;

    [[nodiscard]] auto state() const noexcept -> recovery_state;

    /**
     * @brief Report of the most recent run
     */
    [[nodiscard]] auto report() const -> const recovery_report& { return report_; }

    /**
     * @brief Dependency tiers; every type depends only on earlier tiers
     */
    [[nodiscard]] static auto recovery_plan() -> std::vector<std::vector<core::entity_type>>;

private:
    [[nodiscard]] auto replay_partition(const archive::archive_reader& reader,
                                        core::entity_type type,
                                        const std::filesystem::path& partition,
                                        const std::string& checkpoint_key,
                                        const recovery_options& options,
                                        entity_stats& stats) -> VoidResult;
    [[nodiscard]] auto apply_event(core::entity_type type,
                                   const archive::archive_event& event,
                                   const std::string& archive_path,
                                   storage::upsert_mode mode,
                                   entity_stats& stats) -> VoidResult;
    [[nodiscard]] auto finish(recovery_state state, const error_info& error)
        -> Result<recovery_report>;

    const core::durability_config& config_;
    storage::canonical_store& store_;
    std::atomic<bool> cancel_requested_{false};
    std::atomic<recovery_state> state_{recovery_state::not_started};
    std::chrono::steady_clock::time_point started_{};
    recovery_report report_;
};

}  // namespace vigil::recovery
