/**
 * @file archive_layout.hpp
 * @brief Directory layout and partition keys of the archive tree
 *
 * @code
 * <root>/users/YYYY_MM_users.txt
 * <root>/prayers/YYYY/MM/YYYY_MM_DD_prayer_at_HHMM[_N].txt
 * <root>/prayers/marks/YYYY_MM_marks.txt
 * <root>/prayers/attributes/YYYY_MM_attributes.txt
 * <root>/activity/activity_YYYY_MM.txt
 * <root>/auth/YYYY_MM_auth_requests.txt
 * <root>/auth/YYYY_MM_auth_approvals.txt
 * <root>/auth/YYYY_MM_security_events.txt
 * <root>/auth/YYYY_MM_DD_sessions_snapshot.txt
 * <root>/auth/notifications/YYYY_MM_notifications.txt
 * <root>/system/invite_tokens.txt
 * <root>/system/YYYY_MM_invite_usage.txt
 * <root>/roles/role_definitions.txt
 * <root>/roles/YYYY_MM_role_assignments.txt
 * @endcode
 */

#pragma once

#include <vigil/archive/archive_time.hpp>
#include <vigil/core/entity_type.hpp>
#include <vigil/core/result.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vigil::archive {

/**
 * @enum partition_scheme
 * @brief How an entity type's events are split across files
 */
enum class partition_scheme {
    per_instance,  ///< one file per entity (prayers)
    monthly,       ///< YYYY_MM
    daily,         ///< YYYY_MM_DD
    fixed          ///< a single snapshot file
};

/// Partition key of the invite token snapshot
inline constexpr std::string_view kInviteTokenPartition = "invite_tokens";

/// Partition key of the role definitions snapshot
inline constexpr std::string_view kRoleDefinitionsPartition = "role_definitions";

[[nodiscard]] auto partition_scheme_of(core::entity_type type) noexcept -> partition_scheme;

/**
 * @brief Only key of a fixed-scheme type; empty for every other scheme
 */
[[nodiscard]] auto fixed_partition_key(core::entity_type type) noexcept -> std::string_view;

/**
 * @brief Check that @p key has the shape the type's scheme requires
 * @return ok, or invalid_partition_key
 */
[[nodiscard]] auto validate_partition_key(core::entity_type type, std::string_view key)
    -> VoidResult;

/**
 * @brief Path of a partition relative to the archive root
 */
[[nodiscard]] auto relative_path(core::entity_type type, std::string_view key)
    -> Result<std::filesystem::path>;

/**
 * @brief Partition key of the time bucket containing @p t
 *
 * For prayers this is the base per-instance key without a conflict suffix.
 */
[[nodiscard]] auto partition_for(core::entity_type type, const archive_time& t)
    -> std::string;

/**
 * @brief Month a monthly or daily partition belongs to
 */
[[nodiscard]] auto partition_month(core::entity_type type, std::string_view key)
    -> std::optional<std::chrono::year_month>;

/**
 * @brief Recover the partition key from a path relative to the archive root
 */
[[nodiscard]] auto partition_key_of(core::entity_type type,
                                    const std::filesystem::path& relative)
    -> std::optional<std::string>;

/**
 * @brief True for temporary files left by an atomic write ("x.txt.tmp.N")
 */
[[nodiscard]] auto is_temp_file(const std::filesystem::path& path) -> bool;

/**
 * @brief All partition files of a type, in lexicographic path order
 *
 * Temporary files and files whose names do not match the type's pattern
 * are skipped. A missing directory yields an empty list.
 */
[[nodiscard]] auto list_partitions(const std::filesystem::path& root,
                                   core::entity_type type)
    -> Result<std::vector<std::filesystem::path>>;

}  // namespace vigil::archive
