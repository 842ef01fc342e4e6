/**
 * @file archive_time.hpp
 * @brief Precision-aware timestamps for archive lines and canonical rows
 *
 * Human-readable archive lines carry minute precision ("June 14 2024 at
 * 14:45") while canonical rows and pipe-delimited logs carry second
 * precision. The two are distinct types; comparisons between them are made
 * at the coarser precision, never by strict equality.
 *
 * All calendar conversions are UTC.
 */

#pragma once

#include <chrono>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace vigil::archive {

/// Timestamp known to the minute
using minute_time = std::chrono::sys_time<std::chrono::minutes>;

/// Timestamp known to the second
using second_time = std::chrono::sys_seconds;

/// Either precision, as parsed from an archive line or read from a row
using archive_time = std::variant<minute_time, second_time>;

/**
 * @enum time_precision
 * @brief Granularity of an archive_time
 */
enum class time_precision { minute, second };

/**
 * @enum time_format
 * @brief Textual timestamp layouts understood by the archive grammars
 */
enum class time_format {
    human,              ///< "June 14 2024 at 14:45" (also "June 14, 2024 at 14:45")
    human_abbreviated,  ///< "Jun 14 2024 at 14:45"
    iso_8601,           ///< "2024-06-14T14:45:03", optional fraction and 'Z'
    sql_datetime        ///< "2024-06-14 14:45:03"
};

// =============================================================================
// Precision handling
// =============================================================================

[[nodiscard]] auto precision_of(const archive_time& t) noexcept -> time_precision;

/**
 * @brief Second-precision view (minute times map to :00)
 */
[[nodiscard]] auto as_seconds(const archive_time& t) noexcept -> second_time;

/**
 * @brief Minute-precision view (seconds are truncated)
 */
[[nodiscard]] auto as_minutes(const archive_time& t) noexcept -> minute_time;

/**
 * @brief True when both refer to the same instant at the coarser precision
 *
 * A minute_time matches every second_time inside that minute.
 */
[[nodiscard]] auto same_instant(const archive_time& a, const archive_time& b) noexcept
    -> bool;

/**
 * @brief Half-open interval [first, last) of seconds covered by @p t
 */
[[nodiscard]] auto match_window(const archive_time& t) noexcept
    -> std::pair<second_time, second_time>;

[[nodiscard]] auto to_minute_time(std::chrono::system_clock::time_point tp) noexcept
    -> minute_time;

[[nodiscard]] auto to_second_time(std::chrono::system_clock::time_point tp) noexcept
    -> second_time;

// =============================================================================
// Formatting
// =============================================================================

/**
 * @brief "June 14 2024 at 14:45"
 */
[[nodiscard]] auto format_human(const archive_time& t) -> std::string;

/**
 * @brief "June 14, 2024 at 14:45", used in snapshot headers
 */
[[nodiscard]] auto format_snapshot_stamp(const archive_time& t) -> std::string;

/**
 * @brief "June 14 2024", the activity log's date header
 */
[[nodiscard]] auto format_human_date(std::chrono::sys_days day) -> std::string;

/**
 * @brief "June 2024", used in monthly file titles
 */
[[nodiscard]] auto format_month_title(std::chrono::year_month ym) -> std::string;

/**
 * @brief "HH:MM"
 */
[[nodiscard]] auto format_clock(const archive_time& t) -> std::string;

/**
 * @brief "2024-06-14T14:45:03"
 */
[[nodiscard]] auto format_iso(const archive_time& t) -> std::string;

/**
 * @brief "2024-06-14 14:45:03", the canonical store's column format
 */
[[nodiscard]] auto format_sql(const archive_time& t) -> std::string;

// =============================================================================
// Parsing
// =============================================================================

/**
 * @brief Parse @p text in exactly one layout
 *
 * Human layouts yield minute_time. ISO and SQL layouts yield second_time,
 * or minute_time when the seconds field is absent.
 */
[[nodiscard]] auto parse_time(std::string_view text, time_format format)
    -> std::optional<archive_time>;

/**
 * @brief Try each layout in order and return the first match
 */
[[nodiscard]] auto parse_with_fallbacks(std::string_view text,
                                        std::initializer_list<time_format> formats)
    -> std::optional<archive_time>;

/**
 * @brief "June 14 2024" (or "Jun 14 2024")
 */
[[nodiscard]] auto parse_human_date(std::string_view text)
    -> std::optional<std::chrono::sys_days>;

/**
 * @brief "HH:MM" as an offset into the day
 */
[[nodiscard]] auto parse_clock(std::string_view text) -> std::optional<std::chrono::minutes>;

}  // namespace vigil::archive
