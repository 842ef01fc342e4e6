/**
 * @file entity_handler.hpp
 * @brief Per-entity-type mapping of archive events onto canonical rows
 *
 * Dispatch is a closed switch over core::entity_type: each type accepts a
 * fixed set of event alternatives and maps them onto one table. Used by the
 * recovery engine for replay, by the validator for lookups, and by the
 * archive-first service for the normal write path.
 */

#pragma once

#include <vigil/archive/archive_event.hpp>
#include <vigil/core/result.hpp>
#include <vigil/storage/canonical_store.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace vigil::recovery {

// =============================================================================
// Event to Record Conversion
// =============================================================================

[[nodiscard]] auto make_record(const archive::user_registered& user, std::string_view archive_path)
    -> storage::user_record;

[[nodiscard]] auto make_record(const archive::prayer_submitted& prayer,
                               std::string_view archive_path) -> storage::prayer_record;

[[nodiscard]] auto make_record(const archive::prayer_activity& activity,
                               std::string_view archive_path) -> storage::event_record;

[[nodiscard]] auto make_record(const archive::ledger_entry& entry, std::string_view archive_path)
    -> storage::event_record;

[[nodiscard]] auto make_record(const archive::invite_token_state& token,
                               std::string_view archive_path) -> storage::invite_token_record;

[[nodiscard]] auto make_record(const archive::role_definition& role,
                               std::string_view archive_path) -> storage::role_record;

/**
 * @brief Human-readable natural key of an event, for reports and logs
 */
[[nodiscard]] auto natural_key(const archive::archive_event& event) -> std::string;

/**
 * @brief Row matched by an archive event
 */
struct stored_row {
    std::int64_t pk{0};
    std::string archive_path;
};

/**
 * @class entity_handler
 * @brief Upserts archive events into a canonical store
 *
 * The handler does not manage transactions; callers wrap calls in the
 * transaction or savepoint they need.
 */
class entity_handler {
public:
    explicit entity_handler(storage::canonical_store& store) : store_(store) {}

    /**
     * @brief Upsert one event as a row of @p type's table
     *
     * @param type Entity type the event was read as
     * @param event Parsed event; unparsed lines are rejected
     * @param archive_path Partition the event came from
     * @param mode What to do with an already matching row
     * @return The upsert result, invalid_argument when the event does not
     *         belong to @p type, or the store's error (constraint_violation
     *         for a missing user, prayer or role)
     */
    [[nodiscard]] auto upsert(core::entity_type type,
                              const archive::archive_event& event,
                              std::string_view archive_path,
                              storage::upsert_mode mode) -> Result<storage::upsert_result>;

    /**
     * @brief Create placeholder users, prayers and roles the event refers to
     * @return Number of placeholders created
     */
    [[nodiscard]] auto create_placeholders(const archive::archive_event& event)
        -> Result<std::size_t>;

    /**
     * @brief Row matching the event's natural key, if any
     */
    [[nodiscard]] auto find_existing(core::entity_type type,
                                     const archive::archive_event& event) const
        -> std::optional<stored_row>;

private:
    storage::canonical_store& store_;
};

}  // namespace vigil::recovery
