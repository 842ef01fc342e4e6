/**
 * @file archive_grammar.hpp
 * @brief Per-entity-type line grammars of the text archive
 *
 * Every archive file format is described here once, for both directions:
 * the render_* functions produce the exact bytes the writer appends or
 * replaces, and make_line_parser() returns the matching incremental parser
 * used by archive_reader.
 *
 * Human-readable files (registrations, prayer files, the activity log) use
 * minute-precision timestamps. Pipe-delimited logs and snapshots use ISO
 * 8601 timestamps with seconds. Both parsers fall back to the other layouts
 * before giving up and yielding an unparsed_line.
 */

#pragma once

#include <vigil/archive/archive_event.hpp>
#include <vigil/core/result.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vigil::archive {

// =============================================================================
// Rendering
// =============================================================================

/**
 * @struct append_context
 * @brief What the writer observed in the target file under the append lock
 */
struct append_context {
    /// The file has no bytes yet; the header must precede the event
    bool file_empty{true};

    /// Last day header present in an activity log file
    std::optional<std::chrono::sys_days> last_date_header;
};

/**
 * @brief Title block written once at the top of a monthly file
 *
 * Empty for prayer files and snapshots, which carry their own headers.
 */
[[nodiscard]] auto file_header(core::entity_type type, std::string_view partition_key)
    -> std::string;

/**
 * @brief Exact bytes appended for one event, header and newline included
 * @return The text, or invalid_argument when @p event does not belong to @p type
 */
[[nodiscard]] auto render_append(core::entity_type type,
                                 std::string_view partition_key,
                                 const archive_event& event,
                                 const append_context& context) -> Result<std::string>;

/**
 * @brief Full initial content of a per-prayer file, ending in "Activity:\n"
 */
[[nodiscard]] auto render_prayer_file(const prayer_submitted& prayer) -> std::string;

/**
 * @brief One Activity section line, without the trailing newline
 */
[[nodiscard]] auto render_prayer_activity(const prayer_activity& activity) -> std::string;

/**
 * @brief Daily session snapshot; rows are ledger entries of type session
 */
[[nodiscard]] auto render_session_snapshot(const std::vector<ledger_entry>& sessions,
                                           const archive_time& taken_at) -> std::string;

/**
 * @brief Invite token snapshot
 *
 * Unused tokens that have not expired at @p now are listed as active; every
 * other token is listed under the expired section so the snapshot keeps the
 * full token set.
 */
[[nodiscard]] auto render_invite_tokens(const std::vector<invite_token_state>& tokens,
                                        const archive_time& now) -> std::string;

/**
 * @brief Role definitions snapshot, one row per role in the given order
 */
[[nodiscard]] auto render_role_definitions(const std::vector<role_definition>& roles,
                                           const archive_time& now) -> std::string;

/**
 * @brief Last activity-log day header found in @p content
 */
[[nodiscard]] auto scan_last_date_header(std::string_view content)
    -> std::optional<std::chrono::sys_days>;

/**
 * @brief Replace the column separator inside a value
 */
[[nodiscard]] auto sanitize_field(std::string_view value) -> std::string;

// =============================================================================
// Parsing
// =============================================================================

/**
 * @class line_parser
 * @brief Incremental parser for one archive file
 *
 * Lines are fed in order without their newline. A parser may hold state
 * across lines (the prayer header block, the activity log's current day),
 * so a fresh instance is required for every pass over a file.
 */
class line_parser {
public:
    virtual ~line_parser() = default;

    /**
     * @brief Consume one line
     * @param line Line content without the newline
     * @param line_number 1-based line number
     * @return An event completed by this line, if any
     */
    [[nodiscard]] virtual auto feed(std::string_view line, std::size_t line_number)
        -> std::optional<parsed_event> = 0;

    /**
     * @brief Flush an event still being assembled at end of file
     */
    [[nodiscard]] virtual auto finish() -> std::optional<parsed_event> = 0;
};

/**
 * @brief Grammar-specific parser for files of @p type
 */
[[nodiscard]] auto make_line_parser(core::entity_type type) -> std::unique_ptr<line_parser>;

}  // namespace vigil::archive
