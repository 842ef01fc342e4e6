/**
 * @file sqlite_canonical_store.hpp
 * @brief SQLite implementation of the canonical store
 *
 * The store does not create its own tables. The schema is owned by the
 * migration_manager, which must have brought the database to the latest
 * built-in version (see schema_catalog::builtin()) before the store is used.
 */

#pragma once

#include <vigil/core/clock.hpp>
#include <vigil/storage/canonical_store.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

// Forward declaration of SQLite handle
struct sqlite3;

namespace vigil::storage {

/**
 * @brief Configuration for the SQLite canonical store
 */
struct sqlite_store_config {
    /// Enable write-ahead logging (ignored for ":memory:")
    bool wal_mode{true};

    /// Milliseconds SQLite waits on a locked database
    int busy_timeout_ms{5000};

    /// Page cache size in megabytes
    std::size_t cache_size_mb{16};
};

/**
 * @brief canonical_store over a single SQLite connection
 *
 * Foreign keys are enforced, so an event naming an unknown user or prayer
 * fails with constraint_violation.
 *
 * Thread Safety: This class is NOT thread-safe. Each thread should use its
 * own instance.
 *
 * @example
 * @code
 * auto store = sqlite_canonical_store::open("vigil.db");
 * if (store.is_err()) { ... }
 *
 * migration_manager migrations{store.value()->native_handle(), config,
 *                              schema_catalog::builtin()};
 * auto startup = migrations.startup();
 * @endcode
 */
class sqlite_canonical_store final : public canonical_store {
public:
    [[nodiscard]] static auto open(std::string_view db_path)
        -> Result<std::unique_ptr<sqlite_canonical_store>>;

    /**
     * @param db_path Database file, or ":memory:"
     * @param config Connection tuning
     * @param clock Time source for checkpoint stamps; must outlive the store
     */
    [[nodiscard]] static auto open(std::string_view db_path,
                                   const sqlite_store_config& config,
                                   const core::clock_source& clock =
                                       core::system_clock_source::instance())
        -> Result<std::unique_ptr<sqlite_canonical_store>>;

    ~sqlite_canonical_store() override;

    sqlite_canonical_store(const sqlite_canonical_store&) = delete;
    auto operator=(const sqlite_canonical_store&) -> sqlite_canonical_store& = delete;
    sqlite_canonical_store(sqlite_canonical_store&&) = delete;
    auto operator=(sqlite_canonical_store&&) -> sqlite_canonical_store& = delete;

    // =========================================================================
    // canonical_store Implementation
    // =========================================================================

    [[nodiscard]] auto begin_transaction() -> VoidResult override;
    [[nodiscard]] auto commit() -> VoidResult override;
    [[nodiscard]] auto rollback() -> VoidResult override;
    [[nodiscard]] auto savepoint(std::string_view name) -> VoidResult override;
    [[nodiscard]] auto release_savepoint(std::string_view name) -> VoidResult override;
    [[nodiscard]] auto rollback_to_savepoint(std::string_view name) -> VoidResult override;

    [[nodiscard]] auto upsert_user(const user_record& record, upsert_mode mode)
        -> Result<upsert_result> override;
    [[nodiscard]] auto find_user(std::string_view display_name) const
        -> std::optional<user_record> override;
    [[nodiscard]] auto list_users() const -> Result<std::vector<user_record>> override;
    [[nodiscard]] auto user_count() const -> Result<std::size_t> override;
    [[nodiscard]] auto ensure_placeholder_user(std::string_view display_name,
                                               const archive::archive_time& seen_at)
        -> Result<bool> override;

    [[nodiscard]] auto upsert_prayer(const prayer_record& record, upsert_mode mode)
        -> Result<upsert_result> override;
    [[nodiscard]] auto find_prayer(std::string_view prayer_id) const
        -> std::optional<prayer_record> override;
    [[nodiscard]] auto list_prayers() const -> Result<std::vector<prayer_record>> override;
    [[nodiscard]] auto prayer_count() const -> Result<std::size_t> override;
    [[nodiscard]] auto ensure_placeholder_prayer(std::string_view prayer_id,
                                                 const archive::archive_time& seen_at)
        -> Result<bool> override;

    [[nodiscard]] auto upsert_event(event_stream stream, const event_record& record,
                                    upsert_mode mode) -> Result<upsert_result> override;
    [[nodiscard]] auto find_event(event_stream stream, const event_record& key) const
        -> std::optional<event_record> override;
    [[nodiscard]] auto list_events(event_stream stream) const
        -> Result<std::vector<event_record>> override;
    [[nodiscard]] auto event_count(event_stream stream) const -> Result<std::size_t> override;

    [[nodiscard]] auto upsert_invite_token(const invite_token_record& record, upsert_mode mode)
        -> Result<upsert_result> override;
    [[nodiscard]] auto find_invite_token(std::string_view token) const
        -> std::optional<invite_token_record> override;
    [[nodiscard]] auto list_invite_tokens() const
        -> Result<std::vector<invite_token_record>> override;
    [[nodiscard]] auto invite_token_count() const -> Result<std::size_t> override;

    [[nodiscard]] auto upsert_role(const role_record& record, upsert_mode mode)
        -> Result<upsert_result> override;
    [[nodiscard]] auto find_role(std::string_view name) const
        -> std::optional<role_record> override;
    [[nodiscard]] auto list_roles() const -> Result<std::vector<role_record>> override;
    [[nodiscard]] auto role_count() const -> Result<std::size_t> override;
    [[nodiscard]] auto ensure_placeholder_role(std::string_view name) -> Result<bool> override;

    [[nodiscard]] auto load_checkpoint() const
        -> Result<std::vector<checkpoint_entry>> override;
    [[nodiscard]] auto mark_partition_complete(std::string_view entity_type,
                                               std::string_view partition_path)
        -> VoidResult override;
    [[nodiscard]] auto clear_checkpoint() -> VoidResult override;

    // =========================================================================
    // SQLite Access
    // =========================================================================

    /**
     * @brief Raw connection, shared with the migration manager
     */
    [[nodiscard]] auto native_handle() const noexcept -> sqlite3* { return db_; }

    [[nodiscard]] auto path() const -> const std::string& { return path_; }

private:
    sqlite_canonical_store(sqlite3* db, std::string path, const core::clock_source& clock);

    [[nodiscard]] auto execute(std::string_view sql) -> VoidResult;
    [[nodiscard]] auto count_rows(std::string_view table) const -> Result<std::size_t>;
    [[nodiscard]] auto insert_user(const user_record& record) -> Result<std::int64_t>;
    [[nodiscard]] auto update_user(std::int64_t pk, const user_record& record) -> VoidResult;
    [[nodiscard]] auto insert_prayer(const prayer_record& record) -> Result<std::int64_t>;
    [[nodiscard]] auto update_prayer(std::int64_t pk, const prayer_record& record)
        -> VoidResult;
    [[nodiscard]] auto lookup_user(std::string_view display_name) const
        -> Result<std::optional<user_record>>;
    [[nodiscard]] auto lookup_prayer(std::string_view prayer_id) const
        -> Result<std::optional<prayer_record>>;
    [[nodiscard]] auto lookup_event(event_stream stream, const event_record& key) const
        -> Result<std::optional<event_record>>;
    [[nodiscard]] auto lookup_invite_token(std::string_view token) const
        -> Result<std::optional<invite_token_record>>;
    [[nodiscard]] auto lookup_role(std::string_view name) const
        -> Result<std::optional<role_record>>;
    [[nodiscard]] auto backfill_path(std::string_view table, std::string_view pk_column,
                                     std::int64_t pk, std::string_view archive_path)
        -> VoidResult;

    sqlite3* db_{nullptr};
    std::string path_;
    const core::clock_source& clock_;
};

}  // namespace vigil::storage
