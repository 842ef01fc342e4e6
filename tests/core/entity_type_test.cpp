/**
 * @file entity_type_test.cpp
 * @brief Unit tests for entity type names and the recovery dependency graph
 */

#include <vigil/core/entity_type.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <set>

using namespace vigil::core;

TEST_CASE("entity_type names round trip", "[entity_type]") {
    std::set<std::string_view> seen;
    for (auto type : all_entity_types) {
        auto name = to_string(type);
        CHECK(seen.insert(name).second);

        auto parsed = entity_type_from_string(name);
        REQUIRE(parsed.has_value());
        CHECK(*parsed == type);
    }
    CHECK_FALSE(entity_type_from_string("prayers").has_value());
    CHECK_FALSE(entity_type_from_string("").has_value());
}

TEST_CASE("dependency tiers follow the fixed graph", "[entity_type][recovery]") {
    auto tiers = dependency_tiers();
    REQUIRE(tiers.size() == 5);

    CHECK(tiers[0] == std::vector<entity_type>{entity_type::user});
    CHECK(tiers[1] == std::vector<entity_type>{entity_type::invite_token, entity_type::role});
    CHECK(tiers[2] == std::vector<entity_type>{entity_type::prayer});
    CHECK(tiers[3].size() == 3);
    CHECK(tiers[4].size() == 7);

    std::size_t total = 0;
    for (const auto& tier : tiers) {
        total += tier.size();
    }
    CHECK(total == all_entity_types.size());
}

TEST_CASE("every dependency sits in an earlier tier", "[entity_type][recovery]") {
    for (auto type : all_entity_types) {
        for (auto dependency : dependencies(type)) {
            INFO(to_string(type) << " depends on " << to_string(dependency));
            CHECK(dependency_tier(dependency) < dependency_tier(type));
        }
    }
}

TEST_CASE("recovery order is tier order", "[entity_type][recovery]") {
    auto order = recovery_order();
    REQUIRE(order.size() == all_entity_types.size());
    CHECK(order.front() == entity_type::user);
    CHECK(std::is_sorted(order.begin(), order.end(), [](entity_type a, entity_type b) {
        return dependency_tier(a) < dependency_tier(b);
    }));

    auto position = [&](entity_type type) {
        return std::find(order.begin(), order.end(), type) - order.begin();
    };
    CHECK(position(entity_type::invite_token) < position(entity_type::invite_usage));
    CHECK(position(entity_type::prayer) < position(entity_type::interaction_mark));
    CHECK(position(entity_type::role) < position(entity_type::role_assignment));
    CHECK(position(entity_type::role) < position(entity_type::prayer));
}

TEST_CASE("role definitions come right after users", "[entity_type][recovery]") {
    CHECK(dependencies(entity_type::role) == std::vector<entity_type>{entity_type::user});
    CHECK(dependency_tier(entity_type::role) == 1);
    CHECK(dependencies(entity_type::role_assignment) ==
          std::vector<entity_type>{entity_type::user, entity_type::role});
}
