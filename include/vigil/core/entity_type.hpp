/**
 * @file entity_type.hpp
 * @brief Closed set of durable entity types and their dependency tiers
 */

#pragma once

#include <array>
#include <optional>
#include <string_view>
#include <vector>

namespace vigil::core {

/**
 * @enum entity_type
 * @brief Every entity kind that is archived before it is stored
 */
enum class entity_type {
    user,
    prayer,
    interaction_mark,
    interaction_attribute,
    activity_log,
    auth_request,
    auth_approval,
    session,
    invite_token,
    invite_usage,
    security_event,
    notification,
    role,
    role_assignment
};

/// All entity types in declaration order
inline constexpr std::array<entity_type, 14> all_entity_types = {
    entity_type::user,           entity_type::prayer,
    entity_type::interaction_mark, entity_type::interaction_attribute,
    entity_type::activity_log,   entity_type::auth_request,
    entity_type::auth_approval,  entity_type::session,
    entity_type::invite_token,   entity_type::invite_usage,
    entity_type::security_event, entity_type::notification,
    entity_type::role,           entity_type::role_assignment};

/**
 * @brief Stable lowercase name ("user", "interaction_mark", ...)
 */
[[nodiscard]] auto to_string(entity_type type) noexcept -> std::string_view;

/**
 * @brief Inverse of to_string()
 */
[[nodiscard]] auto entity_type_from_string(std::string_view name) noexcept
    -> std::optional<entity_type>;

/**
 * @brief Position of a type in the fixed recovery dependency graph
 *
 * Tier 0: users. Tier 1: invite tokens and role definitions. Tier 2: prayers.
 * Tier 3: prayer interactions, attributes and the activity log.
 * Tier 4: auth, session, invite usage, notification and role assignment
 * records.
 * Types in the same tier never reference each other.
 */
[[nodiscard]] auto dependency_tier(entity_type type) noexcept -> int;

/**
 * @brief Types whose rows must exist before rows of @p type can be stored
 */
[[nodiscard]] auto dependencies(entity_type type) -> std::vector<entity_type>;

/**
 * @brief All types grouped by tier, lowest tier first
 */
[[nodiscard]] auto dependency_tiers() -> std::vector<std::vector<entity_type>>;

/**
 * @brief All types flattened in dependency order
 */
[[nodiscard]] auto recovery_order() -> std::vector<entity_type>;

}  // namespace vigil::core
