/**
 * @file canonical_store.hpp
 * @brief Abstract access layer of the relational (canonical) store
 *
 * The durability core only ever talks to the relational engine through this
 * interface: keyed lookups, idempotent upserts, transactions and savepoints,
 * and the recovery checkpoint table.
 */

#pragma once

#include <vigil/core/result.hpp>
#include <vigil/storage/canonical_records.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vigil::storage {

/**
 * @struct checkpoint_entry
 * @brief One partition recorded as fully replayed
 */
struct checkpoint_entry {
    std::string entity_type;
    std::string partition_path;
    std::string completed_at;
};

/**
 * @brief Abstract interface for canonical store access
 *
 * Upserts are idempotent by natural key. A write that violates a foreign
 * key (for example an event naming a user that does not exist yet, or a
 * role assignment naming an unknown role) fails
 * with error_codes::constraint_violation and leaves the store unchanged.
 *
 * Implementations are not required to be thread-safe; the recovery engine
 * and the write path each own their connection.
 */
class canonical_store {
public:
    virtual ~canonical_store() = default;

    // =========================================================================
    // Transactions
    // =========================================================================

    [[nodiscard]] virtual auto begin_transaction() -> VoidResult = 0;
    [[nodiscard]] virtual auto commit() -> VoidResult = 0;
    [[nodiscard]] virtual auto rollback() -> VoidResult = 0;

    /**
     * @brief Open a named savepoint inside the current transaction
     */
    [[nodiscard]] virtual auto savepoint(std::string_view name) -> VoidResult = 0;
    [[nodiscard]] virtual auto release_savepoint(std::string_view name) -> VoidResult = 0;
    [[nodiscard]] virtual auto rollback_to_savepoint(std::string_view name) -> VoidResult = 0;

    // =========================================================================
    // Users
    // =========================================================================

    [[nodiscard]] virtual auto upsert_user(const user_record& record, upsert_mode mode)
        -> Result<upsert_result> = 0;

    [[nodiscard]] virtual auto find_user(std::string_view display_name) const
        -> std::optional<user_record> = 0;

    [[nodiscard]] virtual auto list_users() const -> Result<std::vector<user_record>> = 0;

    [[nodiscard]] virtual auto user_count() const -> Result<std::size_t> = 0;

    /**
     * @brief Insert a placeholder user unless one with the name exists
     * @return true when a placeholder was created
     */
    [[nodiscard]] virtual auto ensure_placeholder_user(std::string_view display_name,
                                                       const archive::archive_time& seen_at)
        -> Result<bool> = 0;

    // =========================================================================
    // Prayers
    // =========================================================================

    [[nodiscard]] virtual auto upsert_prayer(const prayer_record& record, upsert_mode mode)
        -> Result<upsert_result> = 0;

    [[nodiscard]] virtual auto find_prayer(std::string_view prayer_id) const
        -> std::optional<prayer_record> = 0;

    [[nodiscard]] virtual auto list_prayers() const -> Result<std::vector<prayer_record>> = 0;

    [[nodiscard]] virtual auto prayer_count() const -> Result<std::size_t> = 0;

    [[nodiscard]] virtual auto ensure_placeholder_prayer(std::string_view prayer_id,
                                                         const archive::archive_time& seen_at)
        -> Result<bool> = 0;

    // =========================================================================
    // Events
    // =========================================================================

    [[nodiscard]] virtual auto upsert_event(event_stream stream, const event_record& record,
                                            upsert_mode mode) -> Result<upsert_result> = 0;

    /**
     * @brief Find the row matching @p key's natural key
     *
     * A minute-precision key matches any row inside that minute; a
     * second-precision key matches the same second or a minute-precision
     * row covering it.
     */
    [[nodiscard]] virtual auto find_event(event_stream stream, const event_record& key) const
        -> std::optional<event_record> = 0;

    [[nodiscard]] virtual auto list_events(event_stream stream) const
        -> Result<std::vector<event_record>> = 0;

    [[nodiscard]] virtual auto event_count(event_stream stream) const
        -> Result<std::size_t> = 0;

    // =========================================================================
    // Invite Tokens
    // =========================================================================

    [[nodiscard]] virtual auto upsert_invite_token(const invite_token_record& record,
                                                   upsert_mode mode)
        -> Result<upsert_result> = 0;

    [[nodiscard]] virtual auto find_invite_token(std::string_view token) const
        -> std::optional<invite_token_record> = 0;

    [[nodiscard]] virtual auto list_invite_tokens() const
        -> Result<std::vector<invite_token_record>> = 0;

    [[nodiscard]] virtual auto invite_token_count() const -> Result<std::size_t> = 0;

    // =========================================================================
    // Roles
    // =========================================================================

    [[nodiscard]] virtual auto upsert_role(const role_record& record, upsert_mode mode)
        -> Result<upsert_result> = 0;

    [[nodiscard]] virtual auto find_role(std::string_view name) const
        -> std::optional<role_record> = 0;

    [[nodiscard]] virtual auto list_roles() const -> Result<std::vector<role_record>> = 0;

    [[nodiscard]] virtual auto role_count() const -> Result<std::size_t> = 0;

    /**
     * @brief Insert a placeholder role unless one with the name exists
     *
     * Lets an assignment naming a role whose definition was never archived
     * be recovered; the definitions snapshot replaces it later.
     */
    [[nodiscard]] virtual auto ensure_placeholder_role(std::string_view name) -> Result<bool> = 0;

    // =========================================================================
    // Recovery Checkpoints
    // =========================================================================

    [[nodiscard]] virtual auto load_checkpoint() const
        -> Result<std::vector<checkpoint_entry>> = 0;

    [[nodiscard]] virtual auto mark_partition_complete(std::string_view entity_type,
                                                       std::string_view partition_path)
        -> VoidResult = 0;

    [[nodiscard]] virtual auto clear_checkpoint() -> VoidResult = 0;
};

}  // namespace vigil::storage
