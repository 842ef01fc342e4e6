/**
 * @file migration_manager.hpp
 * @brief Versioned, crash-safe schema evolution of the canonical store
 *
 * Each schema version moves through
 *
 *   pending -> validating -> applying -> applied
 *                                    \-> rolled_back
 *   applied -> rolling_back -> pending
 *
 * The "applying" state is committed to the bookkeeping table before the
 * forward script runs in its own transaction, so an interrupted apply is
 * visible at the next startup and is resolved by introspection rather than
 * by re-running the script.
 */

#pragma once

#include <vigil/core/clock.hpp>
#include <vigil/core/durability_config.hpp>
#include <vigil/core/file_lock.hpp>
#include <vigil/core/result.hpp>
#include <vigil/storage/schema_catalog.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Forward declaration of SQLite handle
struct sqlite3;

namespace vigil::storage {

/**
 * @enum version_status
 * @brief Lifecycle state of one schema version
 */
enum class version_status {
    pending,
    validating,
    applying,
    applied,
    rolling_back,
    rolled_back,
    fail_closed
};

[[nodiscard]] auto to_string(version_status status) -> std::string_view;

[[nodiscard]] auto version_status_from_string(std::string_view text)
    -> std::optional<version_status>;

/**
 * @brief One row of the schema_migrations bookkeeping table
 */
struct migration_record {
    std::string version_id;
    version_status status{version_status::pending};
    std::string checksum;
    std::int64_t applied_seq{0};  ///< 0 unless applied
    std::string applied_at;
    std::chrono::milliseconds duration{0};
    std::string error;  ///< last failure, if any
};

/**
 * @brief Catalog version joined with its bookkeeping state
 */
struct version_state {
    std::string id;
    std::string description;
    version_status status{version_status::pending};

    /// Applied with a script whose checksum differs from the catalog's
    bool checksum_mismatch{false};
};

/**
 * @brief Snapshot returned by migration_manager::status()
 */
struct migration_status {
    std::optional<std::string> current_version;
    std::vector<version_state> versions;
    std::vector<std::string> pending;
    bool fail_closed{false};
    std::string fail_closed_reason;
};

/**
 * @enum startup_decision
 * @brief What the process may do after startup()
 */
enum class startup_decision {
    ready,                 ///< schema is current
    maintenance_required,  ///< pending work exceeds the maintenance threshold
    degraded,              ///< pending versions left unapplied
    fail_closed            ///< refuse to serve
};

[[nodiscard]] auto to_string(startup_decision decision) -> std::string_view;

/**
 * @brief Outcome of migration_manager::startup()
 */
struct startup_report {
    startup_decision decision{startup_decision::ready};

    /// Versions found mid-apply or mid-rollback and their resolution
    std::vector<std::string> resolved;

    /// Versions applied during this startup
    std::vector<std::string> applied;

    /// Versions still pending afterwards
    std::vector<std::string> pending;

    /// Scaled estimate for the pending versions
    std::chrono::seconds estimated_duration{0};

    std::string message;
};

/**
 * @brief Callback performing a data migration on the raw connection
 *
 * Runs inside a transaction opened by run_data_migration(); it must not
 * begin or end transactions itself.
 */
using data_migration_function = std::function<VoidResult(sqlite3* db)>;

/**
 * @brief Applies and rolls back schema versions of one SQLite database
 *
 * An exclusive lock file (see durability_config::migration_lock_path) is held
 * for the duration of one version's apply or rollback. A failure whose
 * rollback also fails puts the manager into a fail-closed state that is
 * persisted and refuses every further operation.
 *
 * Thread Safety: This class is NOT thread-safe.
 *
 * @example
 * @code
 * migration_manager migrations{db, config, schema_catalog::builtin()};
 * auto report = migrations.startup();
 * if (report.is_ok() && report.value().decision == startup_decision::ready) {
 *     // serve requests
 * }
 * @endcode
 */
class migration_manager {
public:
    /**
     * @param db Open connection; must outlive the manager
     * @param config Lock path, timeouts and maintenance threshold
     * @param catalog Known schema versions
     * @param clock Time source for bookkeeping stamps
     */
    migration_manager(sqlite3* db,
                      const core::durability_config& config,
                      schema_catalog catalog,
                      const core::clock_source& clock =
                          core::system_clock_source::instance());

    ~migration_manager() = default;

    migration_manager(const migration_manager&) = delete;
    auto operator=(const migration_manager&) -> migration_manager& = delete;
    migration_manager(migration_manager&&) = delete;
    auto operator=(migration_manager&&) -> migration_manager& = delete;

    // ========================================================================
    // Version Operations
    // ========================================================================

    /**
     * @brief Unapplied versions in dependency order
     *
     * Ties are broken by catalog order.
     *
     * @return dependency_error for an unknown dependency or a cycle
     */
    [[nodiscard]] auto pending_versions() const -> Result<std::vector<std::string>>;

    /**
     * @brief Apply one pending version
     *
     * @return unknown_version, invalid_version_state, dependency_error,
     *         migration_validation_failed, lock_timeout_error,
     *         migration_failed (rolled back) or migration_fail_closed
     */
    [[nodiscard]] auto apply(std::string_view id) -> VoidResult;

    /**
     * @brief Apply every pending version in dependency order
     * @return Ids applied; stops at the first failure
     */
    [[nodiscard]] auto apply_pending() -> Result<std::vector<std::string>>;

    /**
     * @brief Run the reverse script of an applied version
     *
     * @return dependency_error while another applied version depends on it
     */
    [[nodiscard]] auto rollback(std::string_view id) -> VoidResult;

    /**
     * @brief Most recently applied version
     */
    [[nodiscard]] auto current_version() const -> std::optional<std::string>;

    [[nodiscard]] auto status() const -> Result<migration_status>;

    /**
     * @brief Bookkeeping rows, applied versions first in apply order
     */
    [[nodiscard]] auto history() const -> Result<std::vector<migration_record>>;

    // ========================================================================
    // Startup
    // ========================================================================

    /**
     * @brief Resolve interrupted versions, then apply or defer pending ones
     *
     * Resolution runs under the migration lock; a holder that outlasts
     * lock_timeout yields lock_timeout_error.
     *
     * Pending work whose estimated duration exceeds the maintenance threshold,
     * or that is flagged for maintenance, is reported as
     * maintenance_required and not applied.
     */
    [[nodiscard]] auto startup() -> Result<startup_report>;

    /**
     * @brief Metadata estimate scaled by the affected tables' row counts
     */
    [[nodiscard]] auto estimate_duration(std::string_view id) const
        -> Result<std::chrono::seconds>;

    // ========================================================================
    // Validation
    // ========================================================================

    /**
     * @brief Reject forward scripts that can delete rows or end transactions
     *
     * Rejected: DELETE, DROP TABLE, TRUNCATE, REPLACE statements and
     * INSERT OR REPLACE, plus BEGIN/COMMIT/ROLLBACK. Keywords inside string
     * literals and comments are ignored.
     */
    [[nodiscard]] static auto validate_forward_script(std::string_view script) -> VoidResult;

    /**
     * @brief PRAGMA integrity_check and foreign_key_check
     */
    [[nodiscard]] auto validate_schema_integrity() const -> VoidResult;

    // ========================================================================
    // Data Migrations
    // ========================================================================

    /**
     * @brief Run a one-off data migration that must keep sessions alive
     *
     * Every session id present before the migration must still be present
     * afterwards, otherwise the transaction is rolled back with
     * session_continuity_error. Each id runs at most once.
     */
    [[nodiscard]] auto run_data_migration(std::string_view id,
                                          std::string_view description,
                                          const data_migration_function& migration)
        -> VoidResult;

    // ========================================================================
    // State
    // ========================================================================

    [[nodiscard]] auto is_fail_closed() const noexcept -> bool { return fail_closed_; }

    [[nodiscard]] auto catalog() const noexcept -> const schema_catalog& { return catalog_; }

private:
    enum class effect_state { none, partial, all };

    using record_map = std::map<std::string, migration_record, std::less<>>;

    [[nodiscard]] auto execute(std::string_view sql) -> VoidResult;

    /**
     * @brief Run @p body between BEGIN IMMEDIATE and COMMIT
     *
     * On failure the transaction is rolled back; @p rollback_failed is set
     * when that rollback itself fails.
     */
    [[nodiscard]] auto in_transaction(const std::function<VoidResult()>& body,
                                      bool& rollback_failed) -> VoidResult;
    [[nodiscard]] auto ensure_bookkeeping() -> VoidResult;
    [[nodiscard]] auto load_records() const -> Result<record_map>;
    [[nodiscard]] auto set_status(std::string_view id, version_status status,
                                  std::string_view error = {}) -> VoidResult;
    [[nodiscard]] auto mark_applied(const schema_version& version,
                                    std::chrono::milliseconds duration) -> VoidResult;
    [[nodiscard]] auto acquire_lock() -> Result<core::file_lock>;
    [[nodiscard]] auto count_table_rows() const -> Result<std::map<std::string, std::int64_t>>;
    [[nodiscard]] auto verify_no_row_loss(const std::map<std::string, std::int64_t>& before,
                                          const std::vector<std::string>& may_vanish) const
        -> VoidResult;
    [[nodiscard]] auto probe(const schema_probe& probe) const -> bool;
    [[nodiscard]] auto effects_of(const schema_version& version) const -> effect_state;
    [[nodiscard]] auto run_reverse(const schema_version& version) -> VoidResult;
    [[nodiscard]] auto fail_closed_error() const -> VoidResult;
    [[nodiscard]] auto resolve_interrupted(startup_report& report) -> VoidResult;
    void enter_fail_closed(std::string_view id, const std::string& reason);

    sqlite3* db_{nullptr};
    core::durability_config config_;
    schema_catalog catalog_;
    const core::clock_source& clock_;
    bool fail_closed_{false};
    std::string fail_closed_reason_;
};

}  // namespace vigil::storage
