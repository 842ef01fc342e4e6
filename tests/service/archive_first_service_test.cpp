/**
 * @file archive_first_service_test.cpp
 * @brief Tests for the archive-first write path
 */

#include <vigil/recovery/recovery_orchestrator.hpp>
#include <vigil/service/archive_first_service.hpp>

#include "../support/test_fixtures.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace vigil::service;
using vigil::archive::archive_writer;
using vigil::archive::ledger_entry;
using vigil::archive::to_minute_time;
using vigil::archive::to_second_time;
using vigil::core::entity_type;
using vigil::storage::upsert_mode;
using vigil::test::make_config;
using vigil::test::manual_clock;
using vigil::test::open_migrated_store;
using vigil::test::read_file;
using vigil::test::temp_directory;
using vigil::test::utc;
using vigil::test::write_file;

namespace {

auto rain_prayer() -> prayer_submission {
    prayer_submission prayer;
    prayer.prayer_id = "p-1";
    prayer.author = "alice";
    prayer.text = "Please pray for rain";
    prayer.project_tag = "harvest";
    return prayer;
}

}  // namespace

TEST_CASE("every write lands in the archive before the store", "[service]") {
    temp_directory dir{"vigil_service_write"};
    auto config = make_config(dir.path());
    manual_clock clock{utc(2024, 6, 14, 9, 30)};
    archive_writer writer{config, clock};
    auto store = open_migrated_store(config);
    archive_first_service service{writer, *store, clock};

    auto alice = service.register_user("alice");
    REQUIRE(alice.is_ok());
    auto users_file = config.archive_root / "users" / "2024_06_users.txt";
    CHECK(alice.value().archive_path == users_file.string());
    CHECK(read_file(users_file).find("alice joined directly") != std::string::npos);

    auto stored = store->find_user("alice");
    REQUIRE(stored.has_value());
    CHECK(stored->archive_path == users_file.string());

    // Registration is also written to the monthly activity log
    auto log = store->list_events(vigil::storage::event_stream::activity_log);
    REQUIRE(log.is_ok());
    REQUIRE(log.value().size() == 1);
    CHECK(log.value()[0].actor == "alice");
    CHECK(log.value()[0].action == "joined");

    SECTION("Prayers get their own file and activity is appended to it") {
        auto prayer = service.submit_prayer(rain_prayer());
        REQUIRE(prayer.is_ok());
        std::filesystem::path prayer_file = prayer.value().archive_path;
        CHECK(prayer_file.filename() == "2024_06_14_prayer_at_0930.txt");
        CHECK(read_file(prayer_file).find("Please pray for rain") != std::string::npos);

        clock.advance(std::chrono::minutes{5});
        REQUIRE(service.register_user("bob", "alice").is_ok());
        auto prayed = service.record_prayer_activity("p-1", "bob", "prayed");
        REQUIRE(prayed.is_ok());
        CHECK(prayed.value().archive_path == prayer_file.string());
        CHECK(read_file(prayer_file).find("bob prayed this prayer") != std::string::npos);
        CHECK(store->event_count(vigil::storage::event_stream::prayer_activity).value() == 1);
    }

    SECTION("Ledger events go to their time bucket") {
        REQUIRE(service.register_user("bob").is_ok());
        REQUIRE(service.submit_prayer(rain_prayer()).is_ok());

        ledger_entry mark;
        mark.type = entity_type::interaction_mark;
        mark.subject_id = "p-1";
        mark.action = "prayed";
        mark.actor = "bob";
        mark.occurred_at = to_second_time(utc(2024, 6, 14, 9, 31, 12));
        auto recorded = service.record_ledger_event(mark);
        REQUIRE(recorded.is_ok());
        CHECK(recorded.value().archive_path ==
              (config.archive_root / "prayers" / "marks" / "2024_06_marks.txt").string());
        CHECK(store->find_event(vigil::storage::event_stream::interaction_mark,
                                recorded.value())
                  .has_value());
    }

    SECTION("Session rows only travel through snapshots") {
        ledger_entry session;
        session.type = entity_type::session;
        session.subject_id = "s-1";
        session.action = "active";
        session.actor = "alice";
        session.occurred_at = to_second_time(clock.now());

        auto direct = service.record_ledger_event(session);
        REQUIRE(direct.is_err());
        CHECK(direct.error().code == vigil::error_codes::invalid_argument);

        auto snapshot = service.snapshot_sessions({session});
        REQUIRE(snapshot.is_ok());
        CHECK(read_file(snapshot.value()).find("Total active sessions: 1") != std::string::npos);
        CHECK(store->event_count(vigil::storage::event_stream::session).value() == 1);
    }

    SECTION("Invite token snapshots replace the file and upsert each token") {
        vigil::archive::invite_token_state token{"tok-1", "alice", "2024-07-01T00:00:00",
                                                 false, "", "2024-06-14T09:30:00"};
        REQUIRE(service.snapshot_invite_tokens({token}).is_ok());
        token.used = true;
        token.used_by = "alice";
        auto path = service.snapshot_invite_tokens({token});
        REQUIRE(path.is_ok());

        auto stored_token = store->find_invite_token("tok-1");
        REQUIRE(stored_token.has_value());
        CHECK(stored_token->used);
        CHECK(stored_token->used_by == "alice");
        CHECK(store->invite_token_count().value() == 1);
    }

    SECTION("Role assignments need a defined role") {
        ledger_entry grant;
        grant.type = entity_type::role_assignment;
        grant.subject_id = "alice";
        grant.action = "assigned";
        grant.actor = "alice";
        grant.detail = "moderator||";
        grant.occurred_at = to_second_time(clock.now());

        auto undefined = service.record_ledger_event(grant);
        REQUIRE(undefined.is_err());
        CHECK(undefined.error().code == vigil::error_codes::record_not_found);
        CHECK_FALSE(std::filesystem::exists(config.archive_root / "roles" /
                                            "2024_06_role_assignments.txt"));

        vigil::archive::role_definition moderator{"moderator", "Reviews flagged prayers",
                                                  R"(["read", "flag"])", false, "alice"};
        auto definitions = service.snapshot_roles({moderator});
        REQUIRE(definitions.is_ok());
        CHECK(definitions.value() == config.archive_root / "roles" / "role_definitions.txt");
        CHECK(read_file(definitions.value()).find("moderator|Reviews flagged prayers|") !=
              std::string::npos);

        auto stored = service.record_ledger_event(grant);
        REQUIRE(stored.is_ok());
        CHECK(stored.value().archive_path ==
              (config.archive_root / "roles" / "2024_06_role_assignments.txt").string());
        CHECK(store->event_count(vigil::storage::event_stream::role_assignment).value() == 1);
        CHECK(store->find_role("moderator")->archive_path == definitions.value().string());
    }
}

TEST_CASE("a failed archive write leaves the store untouched", "[service]") {
    temp_directory dir{"vigil_service_blocked"};
    auto config = make_config(dir.path());
    // A plain file where the archive root should be
    write_file(config.archive_root, "not a directory");

    manual_clock clock{utc(2024, 6, 14, 9, 30)};
    archive_writer writer{config, clock};
    auto store = open_migrated_store(config);
    archive_first_service service{writer, *store, clock};

    auto result = service.register_user("alice");
    REQUIRE(result.is_err());
    CHECK(result.error().code == vigil::error_codes::archive_io_error);
    CHECK(store->user_count().value() == 0);
    CHECK(store->event_count(vigil::storage::event_stream::activity_log).value() == 0);
}

TEST_CASE("invalid requests are refused before anything is written", "[service]") {
    temp_directory dir{"vigil_service_invalid"};
    auto config = make_config(dir.path());
    archive_writer writer{config};
    auto store = open_migrated_store(config);
    archive_first_service service{writer, *store};

    auto nameless = service.register_user("");
    REQUIRE(nameless.is_err());
    CHECK(nameless.error().code == vigil::error_codes::invalid_argument);

    for (const char* name : {" alice", "alice ", "al|ice", "al\nice"}) {
        auto refused = service.register_user(name);
        REQUIRE(refused.is_err());
        CHECK(refused.error().code == vigil::error_codes::invalid_argument);
    }
    CHECK(service.record_prayer_activity("p-1", "", "prayed").is_err());

    auto unknown = service.record_prayer_activity("p-missing", "alice", "prayed");
    REQUIRE(unknown.is_err());
    CHECK(unknown.error().code == vigil::error_codes::record_not_found);

    CHECK_FALSE(std::filesystem::exists(config.archive_root / "users"));
}

TEST_CASE("legacy prayers get an archive file on first activity", "[service][legacy]") {
    temp_directory dir{"vigil_service_legacy"};
    auto config = make_config(dir.path());
    manual_clock clock{utc(2024, 6, 20, 12, 0)};
    archive_writer writer{config, clock};
    auto store = open_migrated_store(config);

    // Rows written before archiving existed
    for (const char* name : {"alice", "bob"}) {
        vigil::storage::user_record user;
        user.display_name = name;
        user.created_at = to_minute_time(utc(2024, 1, 5, 10, 0));
        REQUIRE(store->upsert_user(user, upsert_mode::insert_missing).is_ok());
    }
    vigil::storage::prayer_record legacy;
    legacy.prayer_id = "p-old";
    legacy.author = "alice";
    legacy.text = "An old request";
    legacy.submitted_at = to_minute_time(utc(2024, 1, 5, 10, 15));
    REQUIRE(store->upsert_prayer(legacy, upsert_mode::insert_missing).is_ok());

    archive_first_service service{writer, *store, clock};
    auto prayed = service.record_prayer_activity("p-old", "bob", "prayed");
    REQUIRE(prayed.is_ok());

    auto backfilled = store->find_prayer("p-old");
    REQUIRE(backfilled.has_value());
    REQUIRE_FALSE(backfilled->archive_path.empty());
    std::filesystem::path prayer_file = backfilled->archive_path;
    CHECK(prayer_file.filename() == "2024_01_05_prayer_at_1015.txt");
    CHECK(prayed.value().archive_path == backfilled->archive_path);

    auto content = read_file(prayer_file);
    CHECK(content.find("An old request") != std::string::npos);
    CHECK(content.find("bob prayed this prayer") != std::string::npos);
}

TEST_CASE("with archiving disabled the store is written alone", "[service]") {
    temp_directory dir{"vigil_service_disabled"};
    auto config = make_config(dir.path());
    config.archiving_enabled = false;
    archive_writer writer{config};
    auto store = open_migrated_store(config);
    archive_first_service service{writer, *store};

    auto alice = service.register_user("alice");
    REQUIRE(alice.is_ok());
    CHECK(alice.value().archive_path.empty());
    REQUIRE(service.submit_prayer(rain_prayer()).is_ok());
    REQUIRE(service.record_prayer_activity("p-1", "alice", "answered").is_ok());

    CHECK(store->user_count().value() == 1);
    CHECK(store->prayer_count().value() == 1);
    CHECK_FALSE(std::filesystem::exists(config.archive_root));
}

TEST_CASE("a wiped store is rebuilt from what the service archived", "[service][recovery]") {
    temp_directory dir{"vigil_service_rebuild"};
    auto config = make_config(dir.path());
    manual_clock clock{utc(2024, 6, 14, 9, 0)};
    archive_writer writer{config, clock};

    {
        auto store = open_migrated_store(config);
        archive_first_service service{writer, *store, clock};
        REQUIRE(service.register_user("alice").is_ok());
        clock.advance(std::chrono::minutes{1});
        REQUIRE(service.register_user("bob", "alice").is_ok());
        clock.advance(std::chrono::minutes{1});
        REQUIRE(service.submit_prayer(rain_prayer()).is_ok());
        clock.advance(std::chrono::minutes{1});
        REQUIRE(service.record_prayer_activity("p-1", "bob", "prayed").is_ok());
        clock.advance(std::chrono::minutes{1});
        REQUIRE(service.record_prayer_activity("p-1", "alice", "answered").is_ok());
    }

    // The in-memory store is gone; only the archive remains
    auto rebuilt = open_migrated_store(config);
    vigil::recovery::recovery_orchestrator recovery{config, *rebuilt};
    auto result = recovery.run();
    REQUIRE(result.is_ok());
    CHECK(result.value().unparsed_lines == 0);

    CHECK(rebuilt->user_count().value() == 2);
    CHECK(rebuilt->find_user("bob")->invited_by == "alice");

    auto prayer = rebuilt->find_prayer("p-1");
    REQUIRE(prayer.has_value());
    CHECK(prayer->author == "alice");
    CHECK(prayer->project_tag == "harvest");
    CHECK(prayer->text == "Please pray for rain");
    CHECK(vigil::archive::format_iso(prayer->submitted_at) == "2024-06-14T09:02:00");

    auto activity = rebuilt->list_events(vigil::storage::event_stream::prayer_activity);
    REQUIRE(activity.is_ok());
    REQUIRE(activity.value().size() == 2);
    CHECK(activity.value()[0].actor == "bob");
    CHECK(activity.value()[0].action == "prayed");
    CHECK(activity.value()[1].actor == "alice");
    CHECK(activity.value()[1].action == "answered");

    // joined x2, submitted, prayed, answered
    CHECK(rebuilt->event_count(vigil::storage::event_stream::activity_log).value() == 5);
}
