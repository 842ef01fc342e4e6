/**
 * @file migration_manager_test.cpp
 * @brief Unit tests for schema versioning, rollback and crash resolution
 */

#include <vigil/storage/migration_manager.hpp>
#include <vigil/storage/sqlite_canonical_store.hpp>

#include "../support/test_fixtures.hpp"

#include <catch2/catch_test_macros.hpp>

#include <sqlite3.h>

#include <algorithm>

using namespace vigil::storage;
using vigil::test::make_config;
using vigil::test::temp_directory;

namespace {

const char* kTagsReverse = "DROP INDEX idx_prayer_tags_tag;\nDROP TABLE prayer_tags;\n";

auto tags_version(const std::string& reverse = kTagsReverse) -> schema_version {
    schema_version v;
    v.id = "007_prayer_tags";
    v.description = "Free-form tags on prayers";
    v.dependencies = {"001_initial_schema"};
    v.forward_script = R"(
        CREATE TABLE prayer_tags (
            prayer_id TEXT NOT NULL REFERENCES prayers(prayer_id),
            tag       TEXT NOT NULL
        );
        CREATE INDEX idx_prayer_tags_tag ON prayer_tags(tag);
    )";
    v.reverse_script = reverse;
    v.probes = {schema_probe{probe_kind::table, "prayer_tags", {}},
                schema_probe{probe_kind::index, "prayer_tags", "idx_prayer_tags_tag"}};
    v.created_tables = {"prayer_tags"};
    v.estimated_duration = std::chrono::seconds{1};
    return v;
}

auto catalog_with(std::vector<schema_version> extra) -> schema_catalog {
    auto catalog = schema_catalog::builtin();
    for (auto& version : extra) {
        REQUIRE(catalog.add(std::move(version)).is_ok());
    }
    return catalog;
}

void exec(sqlite3* db, const std::string& sql) {
    char* error = nullptr;
    auto rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &error);
    std::string message = error ? error : "";
    sqlite3_free(error);
    INFO(message);
    REQUIRE(rc == SQLITE_OK);
}

auto table_exists(sqlite3* db, const std::string& name) -> bool {
    sqlite3_stmt* stmt = nullptr;
    sqlite3_prepare_v2(db, "SELECT 1 FROM sqlite_master WHERE name = ?;", -1, &stmt, nullptr);
    sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);
    bool found = sqlite3_step(stmt) == SQLITE_ROW;
    sqlite3_finalize(stmt);
    return found;
}

auto count_rows(sqlite3* db, const std::string& table) -> std::int64_t {
    sqlite3_stmt* stmt = nullptr;
    auto sql = "SELECT COUNT(*) FROM " + table + ";";
    sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr);
    std::int64_t n = sqlite3_step(stmt) == SQLITE_ROW ? sqlite3_column_int64(stmt, 0) : -1;
    sqlite3_finalize(stmt);
    return n;
}

auto status_of(const migration_manager& manager, const std::string& id)
    -> std::optional<version_status> {
    auto history = manager.history();
    REQUIRE(history.is_ok());
    for (const auto& record : history.value()) {
        if (record.version_id == id) {
            return record.status;
        }
    }
    return std::nullopt;
}

auto open_store() -> std::unique_ptr<sqlite_canonical_store> {
    auto opened = sqlite_canonical_store::open(":memory:");
    REQUIRE(opened.is_ok());
    return std::move(opened.value());
}

}  // namespace

// =============================================================================
// Ordering
// =============================================================================

TEST_CASE("built-in versions apply in dependency order", "[migration]") {
    temp_directory dir{"vigil_migration_builtin"};
    auto config = make_config(dir.path());
    auto store = open_store();
    migration_manager manager{store->native_handle(), config, schema_catalog::builtin()};

    auto pending = manager.pending_versions();
    REQUIRE(pending.is_ok());
    CHECK(pending.value() ==
          std::vector<std::string>{"001_initial_schema", "002_archive_path_columns",
                                   "003_natural_key_indexes", "004_recovery_checkpoints",
                                   "005_placeholder_flags", "006_role_system"});
    CHECK_FALSE(manager.current_version().has_value());

    auto applied = manager.apply_pending();
    REQUIRE(applied.is_ok());
    CHECK(applied.value() == pending.value());
    CHECK(manager.current_version() == "006_role_system");
    CHECK(manager.pending_versions().value().empty());
    CHECK(manager.validate_schema_integrity().is_ok());

    auto history = manager.history();
    REQUIRE(history.is_ok());
    REQUIRE(history.value().size() == 6);
    for (std::size_t i = 0; i < history.value().size(); ++i) {
        const auto& record = history.value()[i];
        CHECK(record.status == version_status::applied);
        CHECK(record.applied_seq == static_cast<std::int64_t>(i + 1));
        CHECK(record.checksum == manager.catalog().find(record.version_id)->checksum());
    }

    SECTION("Applying again is a state error") {
        auto again = manager.apply("001_initial_schema");
        REQUIRE(again.is_err());
        CHECK(again.error().code == vigil::error_codes::invalid_version_state);
    }

    SECTION("Unknown ids are rejected") {
        auto unknown = manager.apply("999_missing");
        REQUIRE(unknown.is_err());
        CHECK(unknown.error().code == vigil::error_codes::unknown_version);
    }
}

TEST_CASE("pending order follows dependencies, then catalog order", "[migration]") {
    temp_directory dir{"vigil_migration_order"};
    auto config = make_config(dir.path());
    auto store = open_store();

    auto make = [](std::string id, std::vector<std::string> deps) {
        schema_version v;
        v.id = std::move(id);
        v.dependencies = std::move(deps);
        v.forward_script = "SELECT 1;";
        return v;
    };

    SECTION("A dependency registered later still runs first") {
        schema_catalog catalog;
        REQUIRE(catalog.add(make("b", {"a"})).is_ok());
        REQUIRE(catalog.add(make("c", {})).is_ok());
        REQUIRE(catalog.add(make("a", {})).is_ok());
        migration_manager manager{store->native_handle(), config, std::move(catalog)};

        auto pending = manager.pending_versions();
        REQUIRE(pending.is_ok());
        CHECK(pending.value() == std::vector<std::string>{"c", "a", "b"});

        auto early = manager.apply("b");
        REQUIRE(early.is_err());
        CHECK(early.error().code == vigil::error_codes::dependency_error);
    }

    SECTION("Unknown dependencies and cycles are dependency errors") {
        schema_catalog unknown;
        REQUIRE(unknown.add(make("a", {"zz"})).is_ok());
        migration_manager with_unknown{store->native_handle(), config, std::move(unknown)};
        auto missing = with_unknown.pending_versions();
        REQUIRE(missing.is_err());
        CHECK(missing.error().code == vigil::error_codes::dependency_error);

        schema_catalog cycle;
        REQUIRE(cycle.add(make("a", {"b"})).is_ok());
        REQUIRE(cycle.add(make("b", {"a"})).is_ok());
        migration_manager with_cycle{store->native_handle(), config, std::move(cycle)};
        auto cyclic = with_cycle.apply_pending();
        REQUIRE(cyclic.is_err());
        CHECK(cyclic.error().code == vigil::error_codes::dependency_error);
    }

    SECTION("Duplicate ids cannot be registered") {
        schema_catalog catalog;
        REQUIRE(catalog.add(make("a", {})).is_ok());
        CHECK(catalog.add(make("a", {})).is_err());
        CHECK(catalog.add(make("", {})).is_err());
    }
}

// =============================================================================
// Rollback
// =============================================================================

TEST_CASE("rollback runs the reverse script", "[migration][rollback]") {
    temp_directory dir{"vigil_migration_rollback"};
    auto config = make_config(dir.path());
    auto store = open_store();
    auto* db = store->native_handle();
    migration_manager manager{db, config, catalog_with({tags_version()})};

    REQUIRE(manager.apply_pending().is_ok());
    CHECK(manager.current_version() == "007_prayer_tags");
    REQUIRE(table_exists(db, "prayer_tags"));

    SECTION("The version returns to pending and its objects disappear") {
        REQUIRE(manager.rollback("007_prayer_tags").is_ok());
        CHECK_FALSE(table_exists(db, "prayer_tags"));
        CHECK_FALSE(table_exists(db, "idx_prayer_tags_tag"));
        CHECK(status_of(manager, "007_prayer_tags") == version_status::pending);
        CHECK(manager.current_version() == "006_role_system");
        CHECK(manager.pending_versions().value() ==
              std::vector<std::string>{"007_prayer_tags"});

        // And it can be applied again
        REQUIRE(manager.apply("007_prayer_tags").is_ok());
        CHECK(table_exists(db, "prayer_tags"));
    }

    SECTION("A version others depend on stays applied") {
        auto blocked = manager.rollback("001_initial_schema");
        REQUIRE(blocked.is_err());
        CHECK(blocked.error().code == vigil::error_codes::dependency_error);
        CHECK(table_exists(db, "users"));
    }

    SECTION("Only applied versions can be rolled back") {
        REQUIRE(manager.rollback("007_prayer_tags").is_ok());
        auto twice = manager.rollback("007_prayer_tags");
        REQUIRE(twice.is_err());
        CHECK(twice.error().code == vigil::error_codes::invalid_version_state);
    }
}

TEST_CASE("a failing forward script leaves nothing behind", "[migration]") {
    temp_directory dir{"vigil_migration_failure"};
    auto config = make_config(dir.path());
    auto store = open_store();
    auto* db = store->native_handle();

    schema_version broken;
    broken.id = "007_broken";
    broken.dependencies = {"001_initial_schema"};
    broken.forward_script = "CREATE TABLE half_done (x TEXT);\nCREATE TABLE oops (;";
    broken.reverse_script = "DROP TABLE half_done;";
    broken.probes = {schema_probe{probe_kind::table, "half_done", {}}};

    schema_version renames;
    renames.id = "008_rename_users";
    renames.dependencies = {"001_initial_schema"};
    renames.forward_script = "ALTER TABLE users RENAME TO members;";
    renames.reverse_script = "ALTER TABLE members RENAME TO users;";
    renames.probes = {schema_probe{probe_kind::table, "members", {}}};

    migration_manager manager{db, config, catalog_with({broken, renames})};
    for (const auto* id : {"001_initial_schema", "002_archive_path_columns",
                           "003_natural_key_indexes", "004_recovery_checkpoints",
                           "005_placeholder_flags", "006_role_system"}) {
        REQUIRE(manager.apply(id).is_ok());
    }

    SECTION("SQL errors roll the transaction back") {
        auto result = manager.apply("007_broken");
        REQUIRE(result.is_err());
        CHECK(result.error().code == vigil::error_codes::migration_failed);
        CHECK_FALSE(table_exists(db, "half_done"));
        CHECK(status_of(manager, "007_broken") == version_status::rolled_back);
        CHECK_FALSE(manager.is_fail_closed());

        auto pending = manager.pending_versions().value();
        CHECK(std::find(pending.begin(), pending.end(), "007_broken") != pending.end());
    }

    SECTION("A vanished table counts as row loss") {
        auto result = manager.apply("008_rename_users");
        REQUIRE(result.is_err());
        CHECK(result.error().code == vigil::error_codes::migration_failed);
        CHECK(table_exists(db, "users"));
        CHECK_FALSE(table_exists(db, "members"));
    }
}

// =============================================================================
// Validation
// =============================================================================

TEST_CASE("forward scripts may not destroy data", "[migration][validation]") {
    auto rejected = [](std::string_view script) {
        auto result = migration_manager::validate_forward_script(script);
        return result.is_err() &&
               result.error().code == vigil::error_codes::migration_validation_failed;
    };

    CHECK(rejected("DELETE FROM users;"));
    CHECK(rejected("delete from users where 1;"));
    CHECK(rejected("DROP TABLE users;"));
    CHECK(rejected("TRUNCATE users;"));
    CHECK(rejected("INSERT OR REPLACE INTO users (display_name) VALUES ('x');"));
    CHECK(rejected("REPLACE INTO users (display_name) VALUES ('x');"));
    CHECK(rejected("BEGIN; CREATE TABLE t (a TEXT); COMMIT;"));

    CHECK(migration_manager::validate_forward_script(
              "CREATE TABLE t (a TEXT REFERENCES users(display_name) ON DELETE CASCADE);")
              .is_ok());
    CHECK(migration_manager::validate_forward_script("DROP INDEX idx_old;").is_ok());
    CHECK(migration_manager::validate_forward_script(
              "UPDATE prayers SET text = replace(text, 'teh', 'the');")
              .is_ok());
    CHECK(migration_manager::validate_forward_script(
              "-- DELETE nothing here\nCREATE TABLE notes (body TEXT DEFAULT 'DROP TABLE x');")
              .is_ok());
}

TEST_CASE("a rejected script never runs", "[migration][validation]") {
    temp_directory dir{"vigil_migration_rejected"};
    auto config = make_config(dir.path());
    auto store = open_store();
    auto* db = store->native_handle();

    schema_version purge;
    purge.id = "007_purge_users";
    purge.dependencies = {"001_initial_schema"};
    purge.forward_script = "DELETE FROM users;";

    migration_manager manager{db, config, catalog_with({purge})};
    REQUIRE(manager.apply("001_initial_schema").is_ok());
    exec(db, "INSERT INTO users (display_name, created_at) VALUES ('alice', '2024-06-01 08:30:00');");

    auto result = manager.apply("007_purge_users");
    REQUIRE(result.is_err());
    CHECK(result.error().code == vigil::error_codes::migration_validation_failed);
    CHECK(count_rows(db, "users") == 1);
    CHECK(status_of(manager, "007_purge_users") == version_status::pending);
}

// =============================================================================
// Startup
// =============================================================================

TEST_CASE("startup applies small pending work", "[migration][startup]") {
    temp_directory dir{"vigil_migration_startup"};
    auto config = make_config(dir.path());
    auto store = open_store();
    migration_manager manager{store->native_handle(), config, schema_catalog::builtin()};

    SECTION("Under the threshold everything is applied") {
        auto report = manager.startup();
        REQUIRE(report.is_ok());
        CHECK(report.value().decision == startup_decision::ready);
        CHECK(report.value().applied.size() == 6);
        CHECK(report.value().pending.empty());
        CHECK(report.value().estimated_duration == std::chrono::seconds{18});
    }

    SECTION("Over the threshold nothing is applied") {
        config.maintenance_threshold = std::chrono::seconds{10};
        migration_manager strict{store->native_handle(), config, schema_catalog::builtin()};
        auto report = strict.startup();
        REQUIRE(report.is_ok());
        CHECK(report.value().decision == startup_decision::maintenance_required);
        CHECK(report.value().applied.empty());
        CHECK(report.value().pending.size() == 6);
        CHECK_FALSE(strict.current_version().has_value());
    }

    SECTION("Auto-migration can be switched off") {
        config.auto_migrate_on_startup = false;
        migration_manager manual{store->native_handle(), config, schema_catalog::builtin()};
        auto report = manual.startup();
        REQUIRE(report.is_ok());
        CHECK(report.value().decision == startup_decision::degraded);
        CHECK(report.value().applied.empty());
    }

    SECTION("A flagged version always waits for maintenance") {
        REQUIRE(manager.apply_pending().is_ok());
        auto flagged = tags_version();
        flagged.requires_maintenance_mode = true;
        migration_manager with_flagged{store->native_handle(), config,
                                       catalog_with({flagged})};
        auto report = with_flagged.startup();
        REQUIRE(report.is_ok());
        CHECK(report.value().decision == startup_decision::maintenance_required);
        CHECK(report.value().pending == std::vector<std::string>{"007_prayer_tags"});
        CHECK_FALSE(table_exists(store->native_handle(), "prayer_tags"));
    }
}

TEST_CASE("startup resolves versions interrupted mid-apply", "[migration][startup][crash]") {
    temp_directory dir{"vigil_migration_crash"};
    auto config = make_config(dir.path());
    auto store = open_store();
    auto* db = store->native_handle();

    {
        migration_manager base{db, config, schema_catalog::builtin()};
        REQUIRE(base.apply_pending().is_ok());
    }

    SECTION("All effects visible: marked applied without re-running") {
        migration_manager manager{db, config, catalog_with({tags_version()})};
        REQUIRE(manager.apply("007_prayer_tags").is_ok());
        exec(db, "UPDATE schema_migrations SET status = 'applying' "
                 "WHERE version_id = '007_prayer_tags';");

        auto report = manager.startup();
        REQUIRE(report.is_ok());
        CHECK(report.value().decision == startup_decision::ready);
        REQUIRE(report.value().resolved.size() == 1);
        CHECK(report.value().resolved[0] == "007_prayer_tags: effects present, marked applied");
        CHECK(report.value().applied.empty());
        CHECK(status_of(manager, "007_prayer_tags") == version_status::applied);
    }

    SECTION("No effects visible: reset and applied normally") {
        migration_manager manager{db, config, catalog_with({tags_version()})};
        exec(db, "INSERT INTO schema_migrations (version_id, status) "
                 "VALUES ('007_prayer_tags', 'applying');");

        auto report = manager.startup();
        REQUIRE(report.is_ok());
        CHECK(report.value().resolved ==
              std::vector<std::string>{"007_prayer_tags: no effects, reset to pending"});
        CHECK(report.value().applied == std::vector<std::string>{"007_prayer_tags"});
        CHECK(table_exists(db, "prayer_tags"));
    }

    SECTION("Partial effects are reversed first") {
        auto version = tags_version(
            "DROP INDEX IF EXISTS idx_prayer_tags_tag;\nDROP TABLE IF EXISTS prayer_tags;\n");
        migration_manager manager{db, config, catalog_with({version})};
        exec(db, "CREATE TABLE prayer_tags (prayer_id TEXT, tag TEXT);");
        exec(db, "INSERT INTO schema_migrations (version_id, status) "
                 "VALUES ('007_prayer_tags', 'applying');");

        auto report = manager.startup();
        REQUIRE(report.is_ok());
        CHECK(report.value().resolved ==
              std::vector<std::string>{
                  "007_prayer_tags: partial effects reversed, reset to pending"});
        CHECK(report.value().decision == startup_decision::ready);
        CHECK(table_exists(db, "idx_prayer_tags_tag"));
    }

    SECTION("Interrupted validation is simply reset") {
        migration_manager manager{db, config, catalog_with({tags_version()})};
        exec(db, "INSERT INTO schema_migrations (version_id, status) "
                 "VALUES ('007_prayer_tags', 'validating');");
        auto report = manager.startup();
        REQUIRE(report.is_ok());
        CHECK(report.value().resolved.size() == 1);
        CHECK(status_of(manager, "007_prayer_tags") == version_status::applied);
    }
}

TEST_CASE("an irreversible partial apply fails closed", "[migration][startup][crash]") {
    temp_directory dir{"vigil_migration_fail_closed"};
    auto config = make_config(dir.path());
    auto store = open_store();
    auto* db = store->native_handle();

    {
        migration_manager base{db, config, schema_catalog::builtin()};
        REQUIRE(base.apply_pending().is_ok());
    }

    // Only the table exists, so the reverse script's DROP INDEX fails
    exec(db, "CREATE TABLE prayer_tags (prayer_id TEXT, tag TEXT);");
    exec(db, "INSERT INTO schema_migrations (version_id, status) "
             "VALUES ('007_prayer_tags', 'applying');");

    migration_manager manager{db, config, catalog_with({tags_version()})};
    auto report = manager.startup();
    REQUIRE(report.is_ok());
    CHECK(report.value().decision == startup_decision::fail_closed);
    CHECK(manager.is_fail_closed());
    CHECK(status_of(manager, "007_prayer_tags") == version_status::fail_closed);

    auto refused = manager.apply("007_prayer_tags");
    REQUIRE(refused.is_err());
    CHECK(refused.error().code == vigil::error_codes::migration_fail_closed);

    SECTION("The state survives a restart") {
        migration_manager restarted{db, config, catalog_with({tags_version()})};
        auto again = restarted.startup();
        REQUIRE(again.is_ok());
        CHECK(again.value().decision == startup_decision::fail_closed);

        auto status = restarted.status();
        REQUIRE(status.is_ok());
        CHECK(status.value().fail_closed);
        CHECK_FALSE(status.value().fail_closed_reason.empty());
    }
}

// =============================================================================
// Locking, checksums and data migrations
// =============================================================================

TEST_CASE("migrations wait for the migration lock", "[migration][lock]") {
    temp_directory dir{"vigil_migration_lock"};
    auto config = make_config(dir.path());
    config.lock_timeout = std::chrono::milliseconds{50};
    auto store = open_store();
    migration_manager manager{store->native_handle(), config, schema_catalog::builtin()};

    auto held = vigil::core::file_lock::acquire(config.migration_lock_path,
                                                 vigil::core::lock_options{});
    REQUIRE(held.is_ok());

    auto blocked = manager.apply("001_initial_schema");
    REQUIRE(blocked.is_err());
    CHECK(blocked.error().code == vigil::error_codes::lock_timeout_error);
    CHECK_FALSE(table_exists(store->native_handle(), "users"));

    held.value().release();
    CHECK(manager.apply("001_initial_schema").is_ok());
}

TEST_CASE("startup leaves a running migration to its lock holder", "[migration][lock]") {
    temp_directory dir{"vigil_migration_startup_lock"};
    auto config = make_config(dir.path());
    config.lock_timeout = std::chrono::milliseconds{50};
    auto store = open_store();
    auto* db = store->native_handle();
    {
        migration_manager base{db, config, schema_catalog::builtin()};
        REQUIRE(base.apply_pending().is_ok());
    }

    // Another process is mid-apply and still holds the lock
    exec(db, "INSERT INTO schema_migrations (version_id, status) "
             "VALUES ('007_prayer_tags', 'applying');");
    auto held = vigil::core::file_lock::acquire(config.migration_lock_path,
                                                 vigil::core::lock_options{});
    REQUIRE(held.is_ok());

    migration_manager manager{db, config, catalog_with({tags_version()})};
    auto blocked = manager.startup();
    REQUIRE(blocked.is_err());
    CHECK(blocked.error().code == vigil::error_codes::lock_timeout_error);
    CHECK(status_of(manager, "007_prayer_tags") == version_status::applying);
    CHECK_FALSE(table_exists(db, "prayer_tags"));

    held.value().release();
    auto report = manager.startup();
    REQUIRE(report.is_ok());
    CHECK(report.value().applied == std::vector<std::string>{"007_prayer_tags"});
}

TEST_CASE("changed scripts under an applied id are reported", "[migration]") {
    temp_directory dir{"vigil_migration_checksum"};
    auto config = make_config(dir.path());
    auto store = open_store();

    {
        migration_manager first_run{store->native_handle(), config,
                                   catalog_with({tags_version()})};
        REQUIRE(first_run.apply_pending().is_ok());
    }

    auto edited = tags_version();
    edited.forward_script += "CREATE INDEX idx_prayer_tags_prayer ON prayer_tags(prayer_id);\n";
    CHECK(edited.checksum() != tags_version().checksum());

    migration_manager manager{store->native_handle(), config, catalog_with({edited})};
    auto status = manager.status();
    REQUIRE(status.is_ok());
    for (const auto& state : status.value().versions) {
        INFO(state.id);
        CHECK(state.checksum_mismatch == (state.id == "007_prayer_tags"));
    }
}

TEST_CASE("data migrations keep sessions alive", "[migration][data]") {
    temp_directory dir{"vigil_migration_data"};
    auto config = make_config(dir.path());
    auto store = open_store();
    auto* db = store->native_handle();
    migration_manager manager{db, config, schema_catalog::builtin()};
    REQUIRE(manager.apply_pending().is_ok());

    exec(db, "INSERT INTO sessions (subject_id, action, occurred_at) VALUES "
             "('s-1', 'active', '2024-06-14 08:00:00'), "
             "('s-2', 'active', '2024-06-14 09:00:00');");

    SECTION("Dropping a session aborts the migration") {
        auto result = manager.run_data_migration(
            "prune_sessions", "Remove stale sessions", [](sqlite3* conn) -> vigil::VoidResult {
                sqlite3_exec(conn, "DELETE FROM sessions WHERE subject_id = 's-2';", nullptr,
                             nullptr, nullptr);
                return kcenon::common::ok();
            });
        REQUIRE(result.is_err());
        CHECK(result.error().code == vigil::error_codes::session_continuity_error);
        CHECK(count_rows(db, "sessions") == 2);
    }

    SECTION("Rewriting sessions in place is fine, once") {
        auto normalize = [](sqlite3* conn) -> vigil::VoidResult {
            if (sqlite3_exec(conn, "UPDATE sessions SET detail = 'normalized';", nullptr,
                             nullptr, nullptr) != SQLITE_OK) {
                return vigil::vigil_void_error(vigil::error_codes::store_error,
                                               "update failed", "test");
            }
            return kcenon::common::ok();
        };
        REQUIRE(manager.run_data_migration("normalize_sessions", "Normalize", normalize)
                    .is_ok());

        auto again = manager.run_data_migration("normalize_sessions", "Normalize", normalize);
        REQUIRE(again.is_err());
        CHECK(again.error().code == vigil::error_codes::invalid_version_state);
    }

    SECTION("A failing migration is rolled back and may be retried") {
        auto failing = manager.run_data_migration(
            "backfill", "Backfill", [](sqlite3* conn) -> vigil::VoidResult {
                sqlite3_exec(conn, "UPDATE sessions SET detail = 'half';", nullptr, nullptr,
                             nullptr);
                return vigil::vigil_void_error(vigil::error_codes::store_error, "boom", "test");
            });
        REQUIRE(failing.is_err());
        CHECK(failing.error().message == "boom");

        auto retried = manager.run_data_migration(
            "backfill", "Backfill", [](sqlite3*) -> vigil::VoidResult { return kcenon::common::ok(); });
        CHECK(retried.is_ok());
    }
}
