/**
 * @file entity_type.cpp
 * @brief Names and dependency graph of durable entity types
 */

#include <vigil/core/entity_type.hpp>

#include <algorithm>

namespace vigil::core {

auto to_string(entity_type type) noexcept -> std::string_view {
    switch (type) {
        case entity_type::user:
            return "user";
        case entity_type::prayer:
            return "prayer";
        case entity_type::interaction_mark:
            return "interaction_mark";
        case entity_type::interaction_attribute:
            return "interaction_attribute";
        case entity_type::activity_log:
            return "activity_log";
        case entity_type::auth_request:
            return "auth_request";
        case entity_type::auth_approval:
            return "auth_approval";
        case entity_type::session:
            return "session";
        case entity_type::invite_token:
            return "invite_token";
        case entity_type::invite_usage:
            return "invite_usage";
        case entity_type::security_event:
            return "security_event";
        case entity_type::notification:
            return "notification";
        case entity_type::role:
            return "role";
        case entity_type::role_assignment:
            return "role_assignment";
    }
    return "unknown";
}

auto entity_type_from_string(std::string_view name) noexcept
    -> std::optional<entity_type> {
    for (auto type : all_entity_types) {
        if (to_string(type) == name) {
            return type;
        }
    }
    return std::nullopt;
}

auto dependency_tier(entity_type type) noexcept -> int {
    switch (type) {
        case entity_type::user:
            return 0;
        case entity_type::invite_token:
        case entity_type::role:
            return 1;
        case entity_type::prayer:
            return 2;
        case entity_type::interaction_mark:
        case entity_type::interaction_attribute:
        case entity_type::activity_log:
            return 3;
        case entity_type::auth_request:
        case entity_type::auth_approval:
        case entity_type::session:
        case entity_type::invite_usage:
        case entity_type::security_event:
        case entity_type::notification:
        case entity_type::role_assignment:
            return 4;
    }
    return 4;
}

auto dependencies(entity_type type) -> std::vector<entity_type> {
    switch (type) {
        case entity_type::user:
            return {};
        case entity_type::invite_token:
        case entity_type::role:
        case entity_type::prayer:
        case entity_type::activity_log:
        case entity_type::auth_request:
        case entity_type::auth_approval:
        case entity_type::session:
        case entity_type::security_event:
        case entity_type::notification:
            return {entity_type::user};
        case entity_type::interaction_mark:
        case entity_type::interaction_attribute:
            return {entity_type::user, entity_type::prayer};
        case entity_type::invite_usage:
            return {entity_type::user, entity_type::invite_token};
        case entity_type::role_assignment:
            return {entity_type::user, entity_type::role};
    }
    return {};
}

auto dependency_tiers() -> std::vector<std::vector<entity_type>> {
    std::vector<std::vector<entity_type>> tiers;
    for (auto type : all_entity_types) {
        auto tier = static_cast<std::size_t>(dependency_tier(type));
        if (tiers.size() <= tier) {
            tiers.resize(tier + 1);
        }
        tiers[tier].push_back(type);
    }
    return tiers;
}

auto recovery_order() -> std::vector<entity_type> {
    std::vector<entity_type> order(all_entity_types.begin(), all_entity_types.end());
    std::stable_sort(order.begin(), order.end(), [](entity_type a, entity_type b) {
        return dependency_tier(a) < dependency_tier(b);
    });
    return order;
}

}  // namespace vigil::core
