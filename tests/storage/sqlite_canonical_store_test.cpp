/**
 * @file sqlite_canonical_store_test.cpp
 * @brief Unit tests for the SQLite canonical store
 */

#include <vigil/storage/sqlite_canonical_store.hpp>

#include "../support/test_fixtures.hpp"

#include <catch2/catch_test_macros.hpp>

#include <sqlite3.h>

#include <string_view>

using namespace vigil::storage;
using namespace vigil::archive;
using vigil::test::make_config;
using vigil::test::open_migrated_store;
using vigil::test::temp_directory;
using vigil::test::utc;

namespace {

auto make_user(const std::string& name, const std::string& invited_by = "",
               const std::string& path = "") -> user_record {
    user_record user;
    user.display_name = name;
    user.invited_by = invited_by;
    user.created_at = to_minute_time(utc(2024, 6, 1, 8, 30));
    user.archive_path = path;
    return user;
}

auto make_prayer(const std::string& id, const std::string& author) -> prayer_record {
    prayer_record prayer;
    prayer.prayer_id = id;
    prayer.author = author;
    prayer.text = "Please pray";
    prayer.submitted_at = to_minute_time(utc(2024, 6, 14, 14, 45));
    prayer.archive_path = "/archives/prayers/2024/06/2024_06_14_prayer_at_1445.txt";
    return prayer;
}

auto make_mark(const archive_time& when, const std::string& path = "") -> event_record {
    event_record mark;
    mark.subject_id = "p-1";
    mark.action = "prayed";
    mark.actor = "bob";
    mark.occurred_at = when;
    mark.archive_path = path;
    return mark;
}

/// Store with users alice and bob and prayer p-1
auto seeded_store(const vigil::core::durability_config& config)
    -> std::unique_ptr<sqlite_canonical_store> {
    auto store = open_migrated_store(config);
    REQUIRE(store->upsert_user(make_user("alice"), upsert_mode::insert_missing).is_ok());
    REQUIRE(store->upsert_user(make_user("bob", "alice"), upsert_mode::insert_missing).is_ok());
    REQUIRE(store->upsert_prayer(make_prayer("p-1", "alice"), upsert_mode::insert_missing)
                .is_ok());
    return store;
}

}  // namespace

// =============================================================================
// Users
// =============================================================================

TEST_CASE("user upserts are idempotent by display name", "[store][user]") {
    temp_directory dir{"vigil_store_users"};
    auto config = make_config(dir.path());
    auto store = open_migrated_store(config);

    auto first = store->upsert_user(make_user("alice", "", "/a/users/2024_06_users.txt"),
                                    upsert_mode::insert_missing);
    REQUIRE(first.is_ok());
    CHECK(first.value().outcome == upsert_outcome::inserted);

    auto again = store->upsert_user(make_user("alice", "", "/a/users/2024_06_users.txt"),
                                    upsert_mode::insert_missing);
    REQUIRE(again.is_ok());
    CHECK(again.value().outcome == upsert_outcome::unchanged);
    CHECK(again.value().pk == first.value().pk);
    CHECK(store->user_count().value() == 1);

    SECTION("insert_missing leaves business fields alone") {
        auto changed = store->upsert_user(make_user("alice", "carol"),
                                          upsert_mode::insert_missing);
        REQUIRE(changed.is_ok());
        CHECK(changed.value().outcome == upsert_outcome::unchanged);
        CHECK(store->find_user("alice")->invited_by.empty());
    }

    SECTION("update_existing refreshes them") {
        REQUIRE(store->upsert_user(make_user("bob"), upsert_mode::insert_missing).is_ok());
        auto changed = store->upsert_user(make_user("alice", "bob"),
                                          upsert_mode::update_existing);
        REQUIRE(changed.is_ok());
        CHECK(changed.value().outcome == upsert_outcome::updated);

        auto alice = store->find_user("alice");
        REQUIRE(alice.has_value());
        CHECK(alice->invited_by == "bob");
        CHECK(alice->archive_path == "/a/users/2024_06_users.txt");
    }

    SECTION("Stored fields read back with their precision") {
        auto alice = store->find_user("alice");
        REQUIRE(alice.has_value());
        CHECK(precision_of(alice->created_at) == time_precision::minute);
        CHECK(as_seconds(alice->created_at) == to_second_time(utc(2024, 6, 1, 8, 30)));
        CHECK_FALSE(alice->is_placeholder);
    }
}

TEST_CASE("legacy rows get their archive path backfilled", "[store][user]") {
    temp_directory dir{"vigil_store_backfill"};
    auto config = make_config(dir.path());
    auto store = open_migrated_store(config);

    REQUIRE(store->upsert_user(make_user("alice"), upsert_mode::insert_missing).is_ok());
    CHECK(store->find_user("alice")->archive_path.empty());

    auto backfilled = store->upsert_user(make_user("alice", "", "/a/users/2024_06_users.txt"),
                                         upsert_mode::insert_missing);
    REQUIRE(backfilled.is_ok());
    CHECK(backfilled.value().outcome == upsert_outcome::path_backfilled);
    CHECK(store->find_user("alice")->archive_path == "/a/users/2024_06_users.txt");
}

TEST_CASE("placeholder users", "[store][user][placeholder]") {
    temp_directory dir{"vigil_store_placeholder"};
    auto config = make_config(dir.path());
    auto store = open_migrated_store(config);

    auto seen = to_second_time(utc(2024, 6, 14, 15, 0, 0));
    auto created = store->ensure_placeholder_user("carol", seen);
    REQUIRE(created.is_ok());
    CHECK(created.value());

    auto repeated = store->ensure_placeholder_user("carol", seen);
    REQUIRE(repeated.is_ok());
    CHECK_FALSE(repeated.value());

    auto placeholder = store->find_user("carol");
    REQUIRE(placeholder.has_value());
    CHECK(placeholder->is_placeholder);
    CHECK(placeholder->archive_path.empty());

    SECTION("The real registration replaces the placeholder") {
        auto real = store->upsert_user(make_user("carol", "", "/a/users/2024_06_users.txt"),
                                       upsert_mode::insert_missing);
        REQUIRE(real.is_ok());
        CHECK(real.value().outcome == upsert_outcome::updated);

        auto carol = store->find_user("carol");
        REQUIRE(carol.has_value());
        CHECK_FALSE(carol->is_placeholder);
        CHECK(carol->archive_path == "/a/users/2024_06_users.txt");
        CHECK(precision_of(carol->created_at) == time_precision::minute);
    }

    SECTION("An existing user never becomes a placeholder") {
        REQUIRE(store->upsert_user(make_user("dave"), upsert_mode::insert_missing).is_ok());
        auto none = store->ensure_placeholder_user("dave", seen);
        REQUIRE(none.is_ok());
        CHECK_FALSE(none.value());
        CHECK_FALSE(store->find_user("dave")->is_placeholder);
    }
}

// =============================================================================
// Prayers
// =============================================================================

TEST_CASE("prayer upserts and foreign keys", "[store][prayer]") {
    temp_directory dir{"vigil_store_prayers"};
    auto config = make_config(dir.path());
    auto store = seeded_store(config);

    SECTION("Unknown author is a constraint violation") {
        auto orphan = store->upsert_prayer(make_prayer("p-2", "nobody"),
                                           upsert_mode::insert_missing);
        REQUIRE(orphan.is_err());
        CHECK(orphan.error().code == vigil::error_codes::constraint_violation);
        CHECK_FALSE(store->find_prayer("p-2").has_value());
    }

    SECTION("Placeholder prayers are replaced by the real submission") {
        REQUIRE(store->ensure_placeholder_prayer("p-9", to_minute_time(utc(2024, 6, 14)))
                    .value());
        auto placeholder = store->find_prayer("p-9");
        REQUIRE(placeholder.has_value());
        CHECK(placeholder->is_placeholder);
        CHECK(placeholder->author.empty());

        auto real = store->upsert_prayer(make_prayer("p-9", "bob"), upsert_mode::insert_missing);
        REQUIRE(real.is_ok());
        CHECK(real.value().outcome == upsert_outcome::updated);
        CHECK(store->find_prayer("p-9")->author == "bob");
        CHECK_FALSE(store->find_prayer("p-9")->is_placeholder);
    }

    SECTION("Optional fields round trip") {
        auto prayer = make_prayer("p-3", "bob");
        prayer.generated_prayer = "Lord, hear us.";
        prayer.project_tag = "harvest";
        prayer.target_audience = "everyone";
        REQUIRE(store->upsert_prayer(prayer, upsert_mode::insert_missing).is_ok());

        auto stored = store->find_prayer("p-3");
        REQUIRE(stored.has_value());
        CHECK(stored->generated_prayer == "Lord, hear us.");
        CHECK(stored->project_tag == "harvest");
        CHECK(stored->target_audience == "everyone");
        CHECK(store->list_prayers().value().size() == 2);
    }
}

// =============================================================================
// Events
// =============================================================================

TEST_CASE("event matching honours timestamp precision", "[store][event]") {
    temp_directory dir{"vigil_store_events"};
    auto config = make_config(dir.path());
    auto store = seeded_store(config);

    auto stored_at = to_second_time(utc(2024, 6, 14, 15, 0, 12));
    auto inserted = store->upsert_event(event_stream::interaction_mark, make_mark(stored_at),
                                        upsert_mode::insert_missing);
    REQUIRE(inserted.is_ok());
    CHECK(inserted.value().outcome == upsert_outcome::inserted);

    SECTION("A minute reading matches the stored second") {
        auto key = make_mark(to_minute_time(utc(2024, 6, 14, 15, 0)));
        auto found = store->find_event(event_stream::interaction_mark, key);
        REQUIRE(found.has_value());
        CHECK(found->pk == inserted.value().pk);

        auto upserted = store->upsert_event(event_stream::interaction_mark, key,
                                            upsert_mode::update_existing);
        REQUIRE(upserted.is_ok());
        CHECK(upserted.value().outcome == upsert_outcome::unchanged);
        CHECK(precision_of(store->find_event(event_stream::interaction_mark, key)->occurred_at) ==
              time_precision::second);
    }

    SECTION("Two second readings must agree exactly") {
        auto other = make_mark(to_second_time(utc(2024, 6, 14, 15, 0, 13)));
        CHECK_FALSE(store->find_event(event_stream::interaction_mark, other).has_value());

        auto upserted = store->upsert_event(event_stream::interaction_mark, other,
                                            upsert_mode::insert_missing);
        REQUIRE(upserted.is_ok());
        CHECK(upserted.value().outcome == upsert_outcome::inserted);
        CHECK(store->event_count(event_stream::interaction_mark).value() == 2);
    }

    SECTION("The next minute is a different event") {
        auto later = make_mark(to_minute_time(utc(2024, 6, 14, 15, 1)));
        CHECK_FALSE(store->find_event(event_stream::interaction_mark, later).has_value());
    }

    SECTION("A second reading refines a stored minute") {
        auto minute_key = make_mark(to_minute_time(utc(2024, 6, 14, 16, 30)));
        REQUIRE(store->upsert_event(event_stream::interaction_mark, minute_key,
                                    upsert_mode::insert_missing)
                    .is_ok());

        auto precise = make_mark(to_second_time(utc(2024, 6, 14, 16, 30, 45)));
        auto refined = store->upsert_event(event_stream::interaction_mark, precise,
                                           upsert_mode::update_existing);
        REQUIRE(refined.is_ok());
        CHECK(refined.value().outcome == upsert_outcome::updated);

        auto stored = store->find_event(event_stream::interaction_mark, precise);
        REQUIRE(stored.has_value());
        CHECK(precision_of(stored->occurred_at) == time_precision::second);
        CHECK(as_seconds(stored->occurred_at) == std::get<second_time>(precise.occurred_at));
    }

    SECTION("Archive paths are backfilled on legacy events") {
        auto with_path = make_mark(stored_at, "/a/prayers/marks/2024_06_marks.txt");
        auto backfilled = store->upsert_event(event_stream::interaction_mark, with_path,
                                              upsert_mode::insert_missing);
        REQUIRE(backfilled.is_ok());
        CHECK(backfilled.value().outcome == upsert_outcome::path_backfilled);
        CHECK(store->find_event(event_stream::interaction_mark, with_path)->archive_path ==
              "/a/prayers/marks/2024_06_marks.txt");
    }
}

TEST_CASE("a failed lookup stops the upsert instead of inserting twice", "[store][event]") {
    temp_directory dir{"vigil_store_lookup_failure"};
    auto config = make_config(dir.path());
    auto store = seeded_store(config);

    auto mark = make_mark(to_second_time(utc(2024, 6, 14, 15, 0, 12)));
    REQUIRE(store->upsert_event(event_stream::interaction_mark, mark,
                                upsert_mode::insert_missing)
                .is_ok());

    // Reads of the natural key column are refused; inserts still work
    auto* db = store->native_handle();
    sqlite3_set_authorizer(
        db,
        [](void*, int action, const char* table, const char* column, const char*,
           const char*) -> int {
            if (action == SQLITE_READ && table && column &&
                std::string_view{table} == "prayer_marks" &&
                std::string_view{column} == "subject_id") {
                return SQLITE_DENY;
            }
            return SQLITE_OK;
        },
        nullptr);

    auto again = store->upsert_event(event_stream::interaction_mark, mark,
                                     upsert_mode::insert_missing);
    CHECK_FALSE(store->find_event(event_stream::interaction_mark, mark).has_value());
    sqlite3_set_authorizer(db, nullptr, nullptr);

    REQUIRE(again.is_err());
    CHECK(again.error().code == vigil::error_codes::store_error);
    CHECK(store->event_count(event_stream::interaction_mark).value() == 1);
}

TEST_CASE("events respect foreign keys", "[store][event]") {
    temp_directory dir{"vigil_store_event_fk"};
    auto config = make_config(dir.path());
    auto store = seeded_store(config);
    auto when = to_second_time(utc(2024, 6, 14, 15, 0, 0));

    SECTION("Unknown prayer") {
        auto mark = make_mark(when);
        mark.subject_id = "p-404";
        auto result = store->upsert_event(event_stream::interaction_mark, mark,
                                          upsert_mode::insert_missing);
        REQUIRE(result.is_err());
        CHECK(result.error().code == vigil::error_codes::constraint_violation);
    }

    SECTION("Unknown actor") {
        auto mark = make_mark(when);
        mark.actor = "mallory";
        auto result = store->upsert_event(event_stream::interaction_mark, mark,
                                          upsert_mode::insert_missing);
        REQUIRE(result.is_err());
        CHECK(result.error().code == vigil::error_codes::constraint_violation);
        CHECK(store->event_count(event_stream::interaction_mark).value() == 0);
    }

    SECTION("Events without an actor are stored with none") {
        event_record entry;
        entry.subject_id = "";
        entry.action = "maintenance started";
        entry.occurred_at = to_minute_time(utc(2024, 6, 14, 3, 0));
        auto result = store->upsert_event(event_stream::activity_log, entry,
                                          upsert_mode::insert_missing);
        REQUIRE(result.is_ok());

        auto found = store->find_event(event_stream::activity_log, entry);
        REQUIRE(found.has_value());
        CHECK(found->actor.empty());

        auto again = store->upsert_event(event_stream::activity_log, entry,
                                         upsert_mode::insert_missing);
        REQUIRE(again.is_ok());
        CHECK(again.value().outcome == upsert_outcome::unchanged);
    }

    SECTION("Streams that do not reference prayers accept any subject") {
        event_record request;
        request.subject_id = "bob";
        request.action = "pending";
        request.actor = "bob";
        request.occurred_at = when;
        auto result = store->upsert_event(event_stream::auth_request, request,
                                          upsert_mode::insert_missing);
        CHECK(result.is_ok());
    }
}

// =============================================================================
// Invite Tokens
// =============================================================================

TEST_CASE("invite token upserts", "[store][invite_token]") {
    temp_directory dir{"vigil_store_tokens"};
    auto config = make_config(dir.path());
    auto store = seeded_store(config);

    invite_token_record token;
    token.token = "tok-a";
    token.created_by = "alice";
    token.expires_at = "2024-07-01T00:00:00";
    token.created_at = "2024-06-01T00:00:00";
    token.archive_path = "/a/system/invite_tokens.txt";

    auto inserted = store->upsert_invite_token(token, upsert_mode::insert_missing);
    REQUIRE(inserted.is_ok());
    CHECK(inserted.value().outcome == upsert_outcome::inserted);

    token.used = true;
    token.used_by = "bob";

    SECTION("insert_missing keeps the first state") {
        auto kept = store->upsert_invite_token(token, upsert_mode::insert_missing);
        REQUIRE(kept.is_ok());
        CHECK(kept.value().outcome == upsert_outcome::unchanged);
        CHECK_FALSE(store->find_invite_token("tok-a")->used);
    }

    SECTION("update_existing records the redemption") {
        auto updated = store->upsert_invite_token(token, upsert_mode::update_existing);
        REQUIRE(updated.is_ok());
        CHECK(updated.value().outcome == upsert_outcome::updated);

        auto stored = store->find_invite_token("tok-a");
        REQUIRE(stored.has_value());
        CHECK(stored->used);
        CHECK(stored->used_by == "bob");
    }

    SECTION("Redemption by an unknown user is rejected") {
        token.used_by = "mallory";
        auto rejected = store->upsert_invite_token(token, upsert_mode::update_existing);
        REQUIRE(rejected.is_err());
        CHECK(rejected.error().code == vigil::error_codes::constraint_violation);
    }
}

// =============================================================================
// Roles
// =============================================================================

TEST_CASE("role upserts and placeholders", "[store][role]") {
    temp_directory dir{"vigil_store_roles"};
    auto config = make_config(dir.path());
    auto store = seeded_store(config);

    role_record moderator;
    moderator.name = "moderator";
    moderator.description = "Reviews flagged prayers";
    moderator.permissions = R"(["read", "flag"])";
    moderator.created_by = "alice";
    moderator.archive_path = "/a/roles/role_definitions.txt";

    SECTION("Definitions are idempotent by name") {
        REQUIRE(store->upsert_role(moderator, upsert_mode::insert_missing).value().outcome ==
                upsert_outcome::inserted);
        REQUIRE(store->upsert_role(moderator, upsert_mode::update_existing).value().outcome ==
                upsert_outcome::unchanged);

        moderator.permissions = R"(["read", "flag", "hide"])";
        CHECK(store->upsert_role(moderator, upsert_mode::insert_missing).value().outcome ==
              upsert_outcome::unchanged);
        CHECK(store->upsert_role(moderator, upsert_mode::update_existing).value().outcome ==
              upsert_outcome::updated);

        auto stored = store->find_role("moderator");
        REQUIRE(stored.has_value());
        CHECK(stored->permissions == moderator.permissions);
        CHECK(stored->created_by == "alice");
        CHECK(store->role_count().value() == 1);
    }

    SECTION("A real definition replaces a placeholder") {
        REQUIRE(store->ensure_placeholder_role("moderator").value());
        CHECK_FALSE(store->ensure_placeholder_role("moderator").value());
        CHECK(store->find_role("moderator")->is_placeholder);

        auto replaced = store->upsert_role(moderator, upsert_mode::insert_missing);
        REQUIRE(replaced.is_ok());
        CHECK(replaced.value().outcome == upsert_outcome::updated);

        auto stored = store->find_role("moderator");
        REQUIRE(stored.has_value());
        CHECK_FALSE(stored->is_placeholder);
        CHECK(stored->description == "Reviews flagged prayers");
    }

    SECTION("A creator that is not a user is rejected") {
        moderator.created_by = "mallory";
        auto rejected = store->upsert_role(moderator, upsert_mode::insert_missing);
        REQUIRE(rejected.is_err());
        CHECK(rejected.error().code == vigil::error_codes::constraint_violation);
        CHECK(store->role_count().value() == 0);
    }
}

TEST_CASE("role assignments need a known user and role", "[store][role]") {
    temp_directory dir{"vigil_store_user_roles"};
    auto config = make_config(dir.path());
    auto store = seeded_store(config);

    event_record grant;
    grant.subject_id = "bob";
    grant.action = "assigned";
    grant.actor = "alice";
    grant.detail = "moderator||";
    grant.occurred_at = to_second_time(utc(2024, 6, 14, 9, 30, 0));
    grant.archive_path = "/a/roles/2024_06_role_assignments.txt";
    CHECK(assigned_role(grant) == "moderator");

    auto unknown_role = store->upsert_event(event_stream::role_assignment, grant,
                                            upsert_mode::insert_missing);
    REQUIRE(unknown_role.is_err());
    CHECK(unknown_role.error().code == vigil::error_codes::constraint_violation);

    REQUIRE(store->ensure_placeholder_role("moderator").is_ok());
    auto inserted = store->upsert_event(event_stream::role_assignment, grant,
                                        upsert_mode::insert_missing);
    REQUIRE(inserted.is_ok());
    CHECK(inserted.value().outcome == upsert_outcome::inserted);

    grant.subject_id = "mallory";
    auto unknown_user = store->upsert_event(event_stream::role_assignment, grant,
                                            upsert_mode::insert_missing);
    REQUIRE(unknown_user.is_err());
    CHECK(unknown_user.error().code == vigil::error_codes::constraint_violation);
    CHECK(store->event_count(event_stream::role_assignment).value() == 1);
}

// =============================================================================
// Transactions and checkpoints
// =============================================================================

TEST_CASE("transactions and savepoints", "[store][transaction]") {
    temp_directory dir{"vigil_store_tx"};
    auto config = make_config(dir.path());
    auto store = open_migrated_store(config);

    REQUIRE(store->begin_transaction().is_ok());
    REQUIRE(store->upsert_user(make_user("alice"), upsert_mode::insert_missing).is_ok());

    REQUIRE(store->savepoint("one_event").is_ok());
    REQUIRE(store->upsert_user(make_user("bob"), upsert_mode::insert_missing).is_ok());
    REQUIRE(store->rollback_to_savepoint("one_event").is_ok());
    REQUIRE(store->release_savepoint("one_event").is_ok());

    SECTION("Commit keeps work outside the rolled back savepoint") {
        REQUIRE(store->commit().is_ok());
        CHECK(store->find_user("alice").has_value());
        CHECK_FALSE(store->find_user("bob").has_value());
    }

    SECTION("Rollback discards everything") {
        REQUIRE(store->rollback().is_ok());
        CHECK(store->user_count().value() == 0);
    }

    SECTION("Nested begin is a transaction error") {
        auto nested = store->begin_transaction();
        REQUIRE(nested.is_err());
        CHECK(nested.error().code == vigil::error_codes::transaction_error);
        REQUIRE(store->rollback().is_ok());
    }
}

TEST_CASE("recovery checkpoints", "[store][checkpoint]") {
    temp_directory dir{"vigil_store_checkpoint"};
    auto config = make_config(dir.path());
    vigil::test::manual_clock clock{utc(2024, 6, 14, 12, 0, 0)};

    auto opened = sqlite_canonical_store::open((dir.path() / "vigil.db").string(),
                                               sqlite_store_config{}, clock);
    REQUIRE(opened.is_ok());
    auto store = std::move(opened.value());
    migration_manager migrations{store->native_handle(), config, schema_catalog::builtin()};
    REQUIRE(migrations.apply_pending().is_ok());

    REQUIRE(store->mark_partition_complete("user", "users/2024_05_users.txt").is_ok());
    REQUIRE(store->mark_partition_complete("user", "users/2024_06_users.txt").is_ok());
    clock.advance(std::chrono::minutes{5});
    REQUIRE(store->mark_partition_complete("user", "users/2024_05_users.txt").is_ok());

    auto entries = store->load_checkpoint();
    REQUIRE(entries.is_ok());
    REQUIRE(entries.value().size() == 2);
    CHECK(entries.value()[0].partition_path == "users/2024_05_users.txt");
    CHECK(entries.value()[0].completed_at == "2024-06-14 12:05:00");
    CHECK(entries.value()[1].completed_at == "2024-06-14 12:00:00");

    REQUIRE(store->clear_checkpoint().is_ok());
    CHECK(store->load_checkpoint().value().empty());
}
