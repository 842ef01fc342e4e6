/**
 * @file schema_catalog.cpp
 * @brief Schema catalog and the built-in canonical store schema
 */

#include <vigil/storage/schema_catalog.hpp>

#include <vigil/compat/format.hpp>
#include <vigil/storage/canonical_records.hpp>

#include <string>

namespace vigil::storage {

using kcenon::common::make_error;
using kcenon::common::ok;

namespace {

/// Entity tables of the initial schema in creation order
constexpr const char* kEntityTables[] = {"users", "invite_tokens", "prayers"};

auto event_table_ddl(event_stream stream) -> std::string {
    auto subject = references_prayer(stream)
                       ? "subject_id      TEXT NOT NULL REFERENCES prayers(prayer_id)"
                       : "subject_id      TEXT NOT NULL";
    return vigil::compat::format(R"(
        CREATE TABLE {} (
            event_pk        INTEGER PRIMARY KEY AUTOINCREMENT,
            {},
            action          TEXT NOT NULL,
            actor           TEXT REFERENCES users(display_name),
            detail          TEXT NOT NULL DEFAULT '',
            occurred_at     TEXT NOT NULL,
            time_precision  TEXT NOT NULL DEFAULT 'second'
                            CHECK (time_precision IN ('minute', 'second'))
        );
    )", table_name(stream), subject);
}

auto all_tables() -> std::vector<std::string> {
    std::vector<std::string> tables(std::begin(kEntityTables), std::end(kEntityTables));
    for (auto stream : initial_event_streams) {
        tables.emplace_back(table_name(stream));
    }
    return tables;
}

// ============================================================================
// 001: entity and event tables
// ============================================================================

auto initial_schema() -> schema_version {
    schema_version v;
    v.id = "001_initial_schema";
    v.description = "Create entity and event tables";

    v.forward_script = R"(
        CREATE TABLE users (
            user_pk         INTEGER PRIMARY KEY AUTOINCREMENT,
            display_name    TEXT NOT NULL UNIQUE,
            invited_by      TEXT,
            created_at      TEXT NOT NULL,
            time_precision  TEXT NOT NULL DEFAULT 'second'
                            CHECK (time_precision IN ('minute', 'second'))
        );

        CREATE TABLE invite_tokens (
            token_pk        INTEGER PRIMARY KEY AUTOINCREMENT,
            token           TEXT NOT NULL UNIQUE,
            created_by      TEXT REFERENCES users(display_name),
            expires_at      TEXT NOT NULL DEFAULT '',
            used            INTEGER NOT NULL DEFAULT 0,
            used_by         TEXT REFERENCES users(display_name),
            created_at      TEXT NOT NULL DEFAULT ''
        );

        CREATE TABLE prayers (
            prayer_pk       INTEGER PRIMARY KEY AUTOINCREMENT,
            prayer_id       TEXT NOT NULL UNIQUE,
            author          TEXT REFERENCES users(display_name),
            text            TEXT NOT NULL DEFAULT '',
            generated_prayer TEXT NOT NULL DEFAULT '',
            project_tag     TEXT NOT NULL DEFAULT '',
            target_audience TEXT NOT NULL DEFAULT '',
            submitted_at    TEXT NOT NULL,
            time_precision  TEXT NOT NULL DEFAULT 'second'
                            CHECK (time_precision IN ('minute', 'second'))
        );
    )";
    for (auto stream : initial_event_streams) {
        v.forward_script += event_table_ddl(stream);
    }

    // Dependent tables first
    for (auto it = initial_event_streams.rbegin(); it != initial_event_streams.rend(); ++it) {
        v.reverse_script += vigil::compat::format("DROP TABLE {};\n", table_name(*it));
    }
    v.reverse_script += "DROP TABLE prayers;\nDROP TABLE invite_tokens;\nDROP TABLE users;\n";

    for (const auto& table : all_tables()) {
        v.probes.push_back(schema_probe{probe_kind::table, table, {}});
        v.created_tables.push_back(table);
    }
    v.estimated_duration = std::chrono::seconds{1};
    return v;
}

// ============================================================================
// 002: archive back references
// ============================================================================

auto archive_path_columns() -> schema_version {
    schema_version v;
    v.id = "002_archive_path_columns";
    v.description = "Add archive_path back reference to every canonical table";
    v.dependencies = {"001_initial_schema"};

    for (const auto& table : all_tables()) {
        v.forward_script += vigil::compat::format(
            "ALTER TABLE {} ADD COLUMN archive_path TEXT NOT NULL DEFAULT '';\n", table);
        v.reverse_script +=
            vigil::compat::format("ALTER TABLE {} DROP COLUMN archive_path;\n", table);
        v.probes.push_back(schema_probe{probe_kind::column, table, "archive_path"});
        v.affected_tables.push_back(table);
    }
    return v;
}

// ============================================================================
// 003: natural key lookups
// ============================================================================

auto natural_key_indexes() -> schema_version {
    schema_version v;
    v.id = "003_natural_key_indexes";
    v.description = "Index event tables by natural key";
    v.dependencies = {"001_initial_schema"};

    for (auto stream : initial_event_streams) {
        auto table = table_name(stream);
        auto index = vigil::compat::format("idx_{}_natural", table);
        v.forward_script += vigil::compat::format(
            "CREATE INDEX {} ON {}(subject_id, action, occurred_at);\n", index, table);
        v.reverse_script += vigil::compat::format("DROP INDEX {};\n", index);
        v.probes.push_back(schema_probe{probe_kind::index, std::string(table), index});
        v.affected_tables.emplace_back(table);
    }
    return v;
}

// ============================================================================
// 004: recovery progress
// ============================================================================

auto recovery_checkpoints() -> schema_version {
    schema_version v;
    v.id = "004_recovery_checkpoints";
    v.description = "Create recovery checkpoint table";
    v.dependencies = {"001_initial_schema"};
    v.forward_script = R"(
        CREATE TABLE recovery_checkpoints (
            entity_type     TEXT NOT NULL,
            partition_path  TEXT NOT NULL,
            completed_at    TEXT NOT NULL,
            PRIMARY KEY (entity_type, partition_path)
        );
    )";
    v.reverse_script = "DROP TABLE recovery_checkpoints;\n";
    v.probes = {schema_probe{probe_kind::table, "recovery_checkpoints", {}}};
    v.created_tables = {"recovery_checkpoints"};
    v.estimated_duration = std::chrono::seconds{1};
    return v;
}

// ============================================================================
// 005: placeholders for forward references
// ============================================================================

auto placeholder_flags() -> schema_version {
    schema_version v;
    v.id = "005_placeholder_flags";
    v.description = "Flag users and prayers created as recovery placeholders";
    v.dependencies = {"002_archive_path_columns"};
    v.forward_script = R"(
        ALTER TABLE users ADD COLUMN is_placeholder INTEGER NOT NULL DEFAULT 0;
        ALTER TABLE prayers ADD COLUMN is_placeholder INTEGER NOT NULL DEFAULT 0;
    )";
    v.reverse_script = R"(
        ALTER TABLE prayers DROP COLUMN is_placeholder;
        ALTER TABLE users DROP COLUMN is_placeholder;
    )";
    v.probes = {schema_probe{probe_kind::column, "users", "is_placeholder"},
                schema_probe{probe_kind::column, "prayers", "is_placeholder"}};
    v.affected_tables = {"users", "prayers"};
    return v;
}

// ============================================================================
// 006: roles and their assignments
// ============================================================================

auto role_system() -> schema_version {
    schema_version v;
    v.id = "006_role_system";
    v.description = "Create role definitions and the role assignment log";
    v.dependencies = {"005_placeholder_flags"};

    auto assignments = table_name(event_stream::role_assignment);
    auto index = vigil::compat::format("idx_{}_natural", assignments);
    v.forward_script = vigil::compat::format(R"(
        CREATE TABLE roles (
            role_pk         INTEGER PRIMARY KEY AUTOINCREMENT,
            name            TEXT NOT NULL UNIQUE,
            description     TEXT NOT NULL DEFAULT '',
            permissions     TEXT NOT NULL DEFAULT '[]',
            is_system_role  INTEGER NOT NULL DEFAULT 0,
            created_by      TEXT REFERENCES users(display_name),
            archive_path    TEXT NOT NULL DEFAULT '',
            is_placeholder  INTEGER NOT NULL DEFAULT 0
        );

        CREATE TABLE {0} (
            event_pk        INTEGER PRIMARY KEY AUTOINCREMENT,
            subject_id      TEXT NOT NULL REFERENCES users(display_name),
            action          TEXT NOT NULL,
            actor           TEXT REFERENCES users(display_name),
            detail          TEXT NOT NULL DEFAULT '',
            occurred_at     TEXT NOT NULL,
            time_precision  TEXT NOT NULL DEFAULT 'second'
                            CHECK (time_precision IN ('minute', 'second')),
            archive_path    TEXT NOT NULL DEFAULT ''
        );

        CREATE INDEX {1} ON {0}(subject_id, action, occurred_at);

        -- The role is the first detail field; it must name a known role
        CREATE TRIGGER trg_{0}_known_role BEFORE INSERT ON {0}
        WHEN NOT EXISTS (
            SELECT 1 FROM roles
            WHERE name = substr(NEW.detail, 1, instr(NEW.detail || '|', '|') - 1)
        )
        BEGIN
            SELECT RAISE(ABORT, 'FOREIGN KEY constraint failed: unknown role');
        END;
    )", assignments, index);
    v.reverse_script = vigil::compat::format(
        "DROP TRIGGER trg_{0}_known_role;\nDROP INDEX {1};\nDROP TABLE {0};\nDROP TABLE roles;\n",
        assignments, index);

    v.probes = {schema_probe{probe_kind::table, "roles", {}},
                schema_probe{probe_kind::table, std::string(assignments), {}},
                schema_probe{probe_kind::index, std::string(assignments), index}};
    v.created_tables = {"roles", std::string(assignments)};
    v.estimated_duration = std::chrono::seconds{1};
    return v;
}

}  // namespace

// ============================================================================
// Registry
// ============================================================================

auto schema_catalog::add(schema_version version) -> VoidResult {
    if (version.id.empty()) {
        return make_error<std::monostate>(error_codes::invalid_argument,
                                          "Schema version id must not be empty", "migration");
    }
    if (find(version.id) != nullptr) {
        return make_error<std::monostate>(
            error_codes::invalid_argument,
            vigil::compat::format("Schema version {} is already registered", version.id),
            "migration");
    }
    versions_.push_back(std::move(version));
    return ok();
}

auto schema_catalog::find(std::string_view id) const -> const schema_version* {
    for (const auto& version : versions_) {
        if (version.id == id) {
            return &version;
        }
    }
    return nullptr;
}

auto schema_catalog::builtin() -> schema_catalog {
    schema_catalog catalog;
    for (auto&& version : {initial_schema(), archive_path_columns(), natural_key_indexes(),
                           recovery_checkpoints(), placeholder_flags(), role_system()}) {
        // Built-in ids are distinct, so registration cannot fail
        (void)catalog.add(version);
    }
    return catalog;
}

}  // namespace vigil::storage
