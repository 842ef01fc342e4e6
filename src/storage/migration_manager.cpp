/**
 * @file migration_manager.cpp
 * @brief Implementation of the schema migration manager
 */

#include <vigil/storage/migration_manager.hpp>

#include <vigil/archive/archive_time.hpp>
#include <vigil/compat/format.hpp>
#include <vigil/integration/logger_adapter.hpp>

#include <sqlite3.h>

#include <algorithm>
#include <cctype>
#include <memory>
#include <set>

#include <unistd.h>

namespace vigil::storage {

using kcenon::common::make_error;
using kcenon::common::ok;
using integration::logger_adapter;

namespace {

struct stmt_deleter {
    void operator()(sqlite3_stmt* stmt) const {
        if (stmt) sqlite3_finalize(stmt);
    }
};

using stmt_ptr = std::unique_ptr<sqlite3_stmt, stmt_deleter>;
using record_map = std::map<std::string, migration_record, std::less<>>;

auto prepare(sqlite3* db, const std::string& sql) -> Result<stmt_ptr> {
    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return make_error<stmt_ptr>(
            error_codes::store_error,
            vigil::compat::format("Failed to prepare statement: {}", sqlite3_errmsg(db)),
            "migration");
    }
    return stmt_ptr{stmt};
}

void bind_text(sqlite3_stmt* stmt, int index, std::string_view value) {
    sqlite3_bind_text(stmt, index, value.empty() ? "" : value.data(),
                      static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

auto get_text(sqlite3_stmt* stmt, int col) -> std::string {
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? std::string(text) : std::string{};
}

auto failure(int code, const std::string& message) -> VoidResult {
    return make_error<std::monostate>(code, message, "migration");
}

auto table_exists(sqlite3* db, std::string_view table) -> bool {
    auto stmt = prepare(db, "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?;");
    if (stmt.is_err()) {
        return false;
    }
    bind_text(stmt.value().get(), 1, table);
    return sqlite3_step(stmt.value().get()) == SQLITE_ROW;
}

auto is_pending(version_status status) -> bool {
    return status == version_status::pending || status == version_status::rolled_back;
}

auto status_of(const record_map& records, std::string_view id) -> version_status {
    auto it = records.find(id);
    return it == records.end() ? version_status::pending : it->second.status;
}

auto contains(const std::vector<std::string>& values, std::string_view value) -> bool {
    return std::find(values.begin(), values.end(), value) != values.end();
}

auto join(const std::vector<std::string>& values) -> std::string {
    std::string joined;
    for (const auto& value : values) {
        if (!joined.empty()) joined += ", ";
        joined += value;
    }
    return joined;
}

/**
 * @brief Split SQL into upper-cased words and ; ( ) punctuation
 *
 * Comments are dropped; string literals and quoted identifiers become a
 * single opaque token.
 */
auto tokenize_sql(std::string_view script) -> std::vector<std::string> {
    std::vector<std::string> tokens;
    std::size_t i = 0;
    const auto n = script.size();

    while (i < n) {
        char c = script[i];
        if (c == '-' && i + 1 < n && script[i + 1] == '-') {
            auto end = script.find('\n', i);
            i = end == std::string_view::npos ? n : end + 1;
            continue;
        }
        if (c == '/' && i + 1 < n && script[i + 1] == '*') {
            auto end = script.find("*/", i + 2);
            i = end == std::string_view::npos ? n : end + 2;
            continue;
        }
        if (c == '\'' || c == '"' || c == '`' || c == '[') {
            char close = c == '[' ? ']' : c;
            ++i;
            while (i < n) {
                if (script[i] == close) {
                    if (close != ']' && i + 1 < n && script[i + 1] == close) {
                        i += 2;
                        continue;
                    }
                    ++i;
                    break;
                }
                ++i;
            }
            tokens.emplace_back("<quoted>");
            continue;
        }
        auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '_') {
            std::string word;
            while (i < n && (std::isalnum(static_cast<unsigned char>(script[i])) ||
                             script[i] == '_')) {
                word.push_back(
                    static_cast<char>(std::toupper(static_cast<unsigned char>(script[i]))));
                ++i;
            }
            tokens.push_back(std::move(word));
            continue;
        }
        if (c == ';' || c == '(' || c == ')') {
            tokens.emplace_back(1, c);
        }
        ++i;
    }
    return tokens;
}

auto collect_session_ids(sqlite3* db) -> Result<std::vector<std::string>> {
    std::vector<std::string> ids;
    if (!table_exists(db, "sessions")) {
        return ids;
    }
    auto stmt = prepare(db, "SELECT DISTINCT subject_id FROM sessions;");
    if (stmt.is_err()) {
        return Result<std::vector<std::string>>(stmt.error());
    }
    while (sqlite3_step(stmt.value().get()) == SQLITE_ROW) {
        ids.push_back(get_text(stmt.value().get(), 0));
    }
    return ids;
}

auto session_exists(sqlite3* db, std::string_view id) -> bool {
    auto stmt = prepare(db, "SELECT 1 FROM sessions WHERE subject_id = ? LIMIT 1;");
    if (stmt.is_err()) {
        return false;
    }
    bind_text(stmt.value().get(), 1, id);
    return sqlite3_step(stmt.value().get()) == SQLITE_ROW;
}

}  // namespace

// ============================================================================
// Status Names
// ============================================================================

auto to_string(version_status status) -> std::string_view {
    switch (status) {
        case version_status::pending:
            return "pending";
        case version_status::validating:
            return "validating";
        case version_status::applying:
            return "applying";
        case version_status::applied:
            return "applied";
        case version_status::rolling_back:
            return "rolling_back";
        case version_status::rolled_back:
            return "rolled_back";
        case version_status::fail_closed:
            return "fail_closed";
    }
    return "pending";
}

auto version_status_from_string(std::string_view text) -> std::optional<version_status> {
    for (auto status : {version_status::pending, version_status::validating,
                        version_status::applying, version_status::applied,
                        version_status::rolling_back, version_status::rolled_back,
                        version_status::fail_closed}) {
        if (to_string(status) == text) {
            return status;
        }
    }
    return std::nullopt;
}

auto to_string(startup_decision decision) -> std::string_view {
    switch (decision) {
        case startup_decision::ready:
            return "ready";
        case startup_decision::maintenance_required:
            return "maintenance_required";
        case startup_decision::degraded:
            return "degraded";
        case startup_decision::fail_closed:
            return "fail_closed";
    }
    return "ready";
}

// ============================================================================
// Construction
// ============================================================================

migration_manager::migration_manager(sqlite3* db,
                                     const core::durability_config& config,
                                     schema_catalog catalog,
                                     const core::clock_source& clock)
    : db_(db), config_(config), catalog_(std::move(catalog)), clock_(clock) {}

// ============================================================================
// Version Operations
// ============================================================================

auto migration_manager::pending_versions() const -> Result<std::vector<std::string>> {
    using list = std::vector<std::string>;

    for (const auto& version : catalog_.versions()) {
        for (const auto& dep : version.dependencies) {
            if (catalog_.find(dep) == nullptr) {
                return make_error<list>(
                    error_codes::dependency_error,
                    vigil::compat::format("Version {} depends on unknown version {}",
                                          version.id, dep),
                    "migration");
            }
        }
    }

    auto records = load_records();
    if (records.is_err()) {
        return Result<list>(records.error());
    }

    std::vector<const schema_version*> remaining;
    for (const auto& version : catalog_.versions()) {
        if (is_pending(status_of(records.value(), version.id))) {
            remaining.push_back(&version);
        }
    }

    auto is_remaining = [&](const std::string& id) {
        return std::any_of(remaining.begin(), remaining.end(),
                           [&](const schema_version* v) { return v->id == id; });
    };

    // Kahn's algorithm; the first ready version in catalog order goes next
    list ordered;
    while (!remaining.empty()) {
        auto ready = std::find_if(remaining.begin(), remaining.end(),
                                  [&](const schema_version* v) {
                                      return std::none_of(v->dependencies.begin(),
                                                          v->dependencies.end(),
                                                          is_remaining);
                                  });
        if (ready == remaining.end()) {
            list stuck;
            for (const auto* v : remaining) stuck.push_back(v->id);
            return make_error<list>(
                error_codes::dependency_error,
                vigil::compat::format("Dependency cycle among versions: {}", join(stuck)),
                "migration");
        }
        ordered.push_back((*ready)->id);
        remaining.erase(ready);
    }
    return ordered;
}

auto migration_manager::apply(std::string_view id) -> VoidResult {
    if (fail_closed_) {
        return fail_closed_error();
    }
    auto prepared = ensure_bookkeeping();
    if (prepared.is_err()) {
        return prepared;
    }
    if (fail_closed_) {
        return fail_closed_error();
    }

    const auto* version = catalog_.find(id);
    if (version == nullptr) {
        return failure(error_codes::unknown_version,
                       vigil::compat::format("Unknown schema version {}", id));
    }

    auto check_ready = [&]() -> VoidResult {
        auto records = load_records();
        if (records.is_err()) {
            return VoidResult(records.error());
        }
        auto current = status_of(records.value(), id);
        if (!is_pending(current)) {
            return failure(error_codes::invalid_version_state,
                           vigil::compat::format("Version {} is {}, not pending", id,
                                                 to_string(current)));
        }
        for (const auto& dep : version->dependencies) {
            if (catalog_.find(dep) == nullptr) {
                return failure(error_codes::dependency_error,
                               vigil::compat::format("Version {} depends on unknown version {}",
                                                     id, dep));
            }
            if (status_of(records.value(), dep) != version_status::applied) {
                return failure(error_codes::dependency_error,
                               vigil::compat::format("Version {} requires {} to be applied first",
                                                     id, dep));
            }
        }
        return ok();
    };

    auto ready = check_ready();
    if (ready.is_err()) {
        return ready;
    }

    auto lock = acquire_lock();
    if (lock.is_err()) {
        return VoidResult(lock.error());
    }

    // Another process may have moved the version while we waited for the lock
    auto still_ready = check_ready();
    if (still_ready.is_err()) {
        return still_ready;
    }

    auto marked = set_status(id, version_status::validating);
    if (marked.is_err()) {
        return marked;
    }
    auto valid = validate_forward_script(version->forward_script);
    if (valid.is_err()) {
        auto reset = set_status(id, version_status::pending, valid.error().message);
        if (reset.is_err()) {
            logger_adapter::error("Could not reset {} after failed validation: {}", id,
                                  reset.error().message);
        }
        logger_adapter::log_migration_event(integration::migration_event::apply_failed,
                                            std::string(id), valid.error().message);
        return valid;
    }

    marked = set_status(id, version_status::applying);
    if (marked.is_err()) {
        return marked;
    }

    logger_adapter::info("Applying schema version {}: {}", id, version->description);
    auto started = std::chrono::steady_clock::now();
    bool rollback_failed = false;

    auto applied = in_transaction(
        [&]() -> VoidResult {
            auto before = count_table_rows();
            if (before.is_err()) {
                return VoidResult(before.error());
            }
            auto forward = execute(version->forward_script);
            if (forward.is_err()) {
                return forward;
            }
            auto verified = verify_no_row_loss(before.value(), {});
            if (verified.is_err()) {
                return verified;
            }
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started);
            return mark_applied(*version, elapsed);
        },
        rollback_failed);

    if (applied.is_ok()) {
        logger_adapter::log_migration_event(integration::migration_event::applied,
                                            std::string(id), version->description);
        return ok();
    }

    const auto cause = applied.error().message;
    if (rollback_failed) {
        enter_fail_closed(id, "rollback after failed apply did not complete: " + cause);
        return fail_closed_error();
    }

    // The transaction is gone; anything still visible must be reversed explicitly
    if (effects_of(*version) != effect_state::none) {
        auto reversed = run_reverse(*version);
        if (reversed.is_err()) {
            enter_fail_closed(id, "reverse script failed after failed apply: " +
                                      reversed.error().message);
            return fail_closed_error();
        }
    }

    auto recorded = set_status(id, version_status::rolled_back, cause);
    if (recorded.is_err()) {
        logger_adapter::error("Could not record rollback of {}: {}", id,
                              recorded.error().message);
    }
    logger_adapter::log_migration_event(integration::migration_event::apply_failed,
                                        std::string(id), cause);
    return failure(error_codes::migration_failed,
                   vigil::compat::format("Migration {} failed and was rolled back: {}", id,
                                         cause));
}

auto migration_manager::apply_pending() -> Result<std::vector<std::string>> {
    auto pending = pending_versions();
    if (pending.is_err()) {
        return pending;
    }
    std::vector<std::string> applied;
    for (const auto& id : pending.value()) {
        auto result = apply(id);
        if (result.is_err()) {
            return Result<std::vector<std::string>>(result.error());
        }
        applied.push_back(id);
    }
    return applied;
}

auto migration_manager::rollback(std::string_view id) -> VoidResult {
    if (fail_closed_) {
        return fail_closed_error();
    }
    auto prepared = ensure_bookkeeping();
    if (prepared.is_err()) {
        return prepared;
    }
    if (fail_closed_) {
        return fail_closed_error();
    }

    const auto* version = catalog_.find(id);
    if (version == nullptr) {
        return failure(error_codes::unknown_version,
                       vigil::compat::format("Unknown schema version {}", id));
    }

    auto check_ready = [&]() -> VoidResult {
        auto records = load_records();
        if (records.is_err()) {
            return VoidResult(records.error());
        }
        auto current = status_of(records.value(), id);
        if (current != version_status::applied) {
            return failure(error_codes::invalid_version_state,
                           vigil::compat::format("Version {} is {}, not applied", id,
                                                 to_string(current)));
        }
        for (const auto& other : catalog_.versions()) {
            if (contains(other.dependencies, id) &&
                status_of(records.value(), other.id) == version_status::applied) {
                return failure(error_codes::dependency_error,
                               vigil::compat::format("Version {} is required by applied version {}",
                                                     id, other.id));
            }
        }
        return ok();
    };

    auto ready = check_ready();
    if (ready.is_err()) {
        return ready;
    }

    auto lock = acquire_lock();
    if (lock.is_err()) {
        return VoidResult(lock.error());
    }

    auto still_ready = check_ready();
    if (still_ready.is_err()) {
        return still_ready;
    }

    auto marked = set_status(id, version_status::rolling_back);
    if (marked.is_err()) {
        return marked;
    }

    logger_adapter::info("Rolling back schema version {}", id);
    bool rollback_failed = false;
    auto reversed = in_transaction(
        [&]() -> VoidResult {
            auto before = count_table_rows();
            if (before.is_err()) {
                return VoidResult(before.error());
            }
            auto reverse = execute(version->reverse_script);
            if (reverse.is_err()) {
                return reverse;
            }
            auto verified = verify_no_row_loss(before.value(), version->created_tables);
            if (verified.is_err()) {
                return verified;
            }
            return set_status(id, version_status::pending);
        },
        rollback_failed);

    if (reversed.is_ok()) {
        logger_adapter::log_migration_event(integration::migration_event::rolled_back,
                                            std::string(id));
        return ok();
    }

    const auto cause = reversed.error().message;
    if (rollback_failed) {
        enter_fail_closed(id, "failed rollback could not be undone: " + cause);
        return fail_closed_error();
    }

    auto restored = set_status(id, version_status::applied, cause);
    if (restored.is_err()) {
        enter_fail_closed(id, "could not restore applied state: " + restored.error().message);
        return fail_closed_error();
    }
    return failure(error_codes::migration_failed,
                   vigil::compat::format("Rollback of {} failed; version left applied: {}", id,
                                         cause));
}

auto migration_manager::current_version() const -> std::optional<std::string> {
    if (!table_exists(db_, "schema_migrations")) {
        return std::nullopt;
    }
    auto stmt = prepare(db_, R"(
        SELECT version_id FROM schema_migrations
        WHERE status = 'applied' AND applied_seq IS NOT NULL
        ORDER BY applied_seq DESC
        LIMIT 1;
    )");
    if (stmt.is_err() || sqlite3_step(stmt.value().get()) != SQLITE_ROW) {
        return std::nullopt;
    }
    return get_text(stmt.value().get(), 0);
}

auto migration_manager::status() const -> Result<migration_status> {
    auto records = load_records();
    if (records.is_err()) {
        return Result<migration_status>(records.error());
    }

    migration_status result;
    result.current_version = current_version();
    result.fail_closed = fail_closed_;
    result.fail_closed_reason = fail_closed_reason_;

    for (const auto& version : catalog_.versions()) {
        version_state state;
        state.id = version.id;
        state.description = version.description;
        state.status = status_of(records.value(), version.id);

        auto it = records.value().find(version.id);
        if (it != records.value().end()) {
            const auto& record = it->second;
            state.checksum_mismatch = state.status == version_status::applied &&
                                      !record.checksum.empty() &&
                                      record.checksum != version.checksum();
            if (state.checksum_mismatch) {
                logger_adapter::warn("Schema version {} changed after it was applied", version.id);
            }
            if (record.status == version_status::fail_closed && !result.fail_closed) {
                result.fail_closed = true;
                result.fail_closed_reason =
                    vigil::compat::format("{}: {}", record.version_id, record.error);
            }
        }
        result.versions.push_back(std::move(state));
    }

    auto pending = pending_versions();
    if (pending.is_err()) {
        return Result<migration_status>(pending.error());
    }
    result.pending = pending.value();
    return result;
}

auto migration_manager::history() const -> Result<std::vector<migration_record>> {
    using list = std::vector<migration_record>;
    list history;
    if (!table_exists(db_, "schema_migrations")) {
        return history;
    }

    auto stmt = prepare(db_, R"(
        SELECT version_id, status, checksum, applied_seq, applied_at, duration_ms, error
        FROM schema_migrations
        ORDER BY applied_seq IS NULL, applied_seq, version_id;
    )");
    if (stmt.is_err()) {
        return Result<list>(stmt.error());
    }

    auto* s = stmt.value().get();
    while (sqlite3_step(s) == SQLITE_ROW) {
        migration_record record;
        record.version_id = get_text(s, 0);
        record.status =
            version_status_from_string(get_text(s, 1)).value_or(version_status::fail_closed);
        record.checksum = get_text(s, 2);
        record.applied_seq = sqlite3_column_int64(s, 3);
        record.applied_at = get_text(s, 4);
        record.duration = std::chrono::milliseconds{sqlite3_column_int64(s, 5)};
        record.error = get_text(s, 6);
        history.push_back(std::move(record));
    }
    return history;
}

// ============================================================================
// Startup
// ============================================================================

auto migration_manager::startup() -> Result<startup_report> {
    startup_report report;

    auto prepared = ensure_bookkeeping();
    if (prepared.is_err()) {
        return Result<startup_report>(prepared.error());
    }

    auto refuse = [&]() {
        report.decision = startup_decision::fail_closed;
        report.message = fail_closed_reason_;
        logger_adapter::fatal("Schema is fail-closed: {}", fail_closed_reason_);
        return report;
    };

    if (fail_closed_) {
        return refuse();
    }

    {
        // A live migration in another process looks interrupted; wait it out
        auto lock = acquire_lock();
        if (lock.is_err()) {
            return Result<startup_report>(lock.error());
        }
        auto resolved = resolve_interrupted(report);
        if (resolved.is_err()) {
            if (fail_closed_) {
                return refuse();
            }
            return Result<startup_report>(resolved.error());
        }
    }

    auto pending = pending_versions();
    if (pending.is_err()) {
        return Result<startup_report>(pending.error());
    }
    report.pending = pending.value();
    if (report.pending.empty()) {
        logger_adapter::info("Schema is current at {}", current_version().value_or("<empty>"));
        return report;
    }

    bool flagged = false;
    std::chrono::seconds total{0};
    for (const auto& id : report.pending) {
        auto estimate = estimate_duration(id);
        if (estimate.is_err()) {
            return Result<startup_report>(estimate.error());
        }
        total += estimate.value();
        flagged = flagged || catalog_.find(id)->requires_maintenance_mode;
    }
    report.estimated_duration = total;

    if (flagged || total > config_.maintenance_threshold) {
        report.decision = startup_decision::maintenance_required;
        report.message = vigil::compat::format(
            "{} pending version(s) need about {}s (threshold {}s){}", report.pending.size(),
            total.count(), config_.maintenance_threshold.count(),
            flagged ? " and are flagged for maintenance" : "");
        logger_adapter::warn("Maintenance required: {}", report.message);
        return report;
    }

    if (!config_.auto_migrate_on_startup) {
        report.decision = startup_decision::degraded;
        report.message = vigil::compat::format("{} pending version(s) not applied",
                                               report.pending.size());
        logger_adapter::warn("Starting degraded: {}", report.message);
        return report;
    }

    for (const auto& id : pending.value()) {
        auto applied = apply(id);
        if (applied.is_err()) {
            report.decision =
                fail_closed_ ? startup_decision::fail_closed : startup_decision::degraded;
            report.message = applied.error().message;
            break;
        }
        report.applied.push_back(id);
    }

    auto remaining = pending_versions();
    if (remaining.is_ok()) {
        report.pending = remaining.value();
    }
    return report;
}

auto migration_manager::estimate_duration(std::string_view id) const
    -> Result<std::chrono::seconds> {
    const auto* version = catalog_.find(id);
    if (version == nullptr) {
        return make_error<std::chrono::seconds>(
            error_codes::unknown_version,
            vigil::compat::format("Unknown schema version {}", id), "migration");
    }

    std::int64_t rows = 0;
    for (const auto& table : version->affected_tables) {
        if (!table_exists(db_, table)) {
            continue;
        }
        auto stmt = prepare(db_, vigil::compat::format("SELECT COUNT(*) FROM \"{}\";", table));
        if (stmt.is_err()) {
            return Result<std::chrono::seconds>(stmt.error());
        }
        if (sqlite3_step(stmt.value().get()) == SQLITE_ROW) {
            rows += sqlite3_column_int64(stmt.value().get(), 0);
        }
    }

    int factor = rows > 100000 ? 3 : rows > 10000 ? 2 : 1;
    return version->estimated_duration * factor;
}

auto migration_manager::resolve_interrupted(startup_report& report) -> VoidResult {
    auto records = load_records();
    if (records.is_err()) {
        return VoidResult(records.error());
    }

    for (const auto& [id, record] : records.value()) {
        if (record.status == version_status::validating) {
            auto reset = set_status(id, version_status::pending);
            if (reset.is_err()) {
                return reset;
            }
            report.resolved.push_back(id + ": validation interrupted, reset to pending");
            continue;
        }
        if (record.status != version_status::applying &&
            record.status != version_status::rolling_back) {
            continue;
        }

        const auto* version = catalog_.find(id);
        if (version == nullptr) {
            enter_fail_closed(id, "interrupted version is not in the catalog");
            return fail_closed_error();
        }

        bool was_applying = record.status == version_status::applying;
        auto effects = effects_of(*version);

        if (effects == effect_state::all) {
            auto done = was_applying ? mark_applied(*version, std::chrono::milliseconds{0})
                                     : set_status(id, version_status::applied);
            if (done.is_err()) {
                return done;
            }
            logger_adapter::log_migration_event(
                integration::migration_event::completed_after_crash, id,
                was_applying ? "forward effects present" : "reverse never took effect");
            report.resolved.push_back(id + ": effects present, marked applied");
            continue;
        }

        if (effects == effect_state::partial) {
            auto reversed = run_reverse(*version);
            if (reversed.is_err()) {
                enter_fail_closed(id, "partial effects could not be reversed: " +
                                          reversed.error().message);
                return fail_closed_error();
            }
        }

        auto reset = set_status(id, version_status::pending);
        if (reset.is_err()) {
            return reset;
        }
        logger_adapter::log_migration_event(
            integration::migration_event::reset_after_crash, id,
            effects == effect_state::partial ? "partial effects reversed" : "no effects");
        report.resolved.push_back(id + (effects == effect_state::partial
                                            ? ": partial effects reversed, reset to pending"
                                            : ": no effects, reset to pending"));
    }
    return ok();
}

// ============================================================================
// Validation
// ============================================================================

auto migration_manager::validate_forward_script(std::string_view script) -> VoidResult {
    auto tokens = tokenize_sql(script);

    auto reject = [](std::string_view what) {
        return failure(error_codes::migration_validation_failed,
                       vigil::compat::format("Forward script contains {}", what));
    };

    for (std::size_t i = 0; i < tokens.size(); ++i) {
        const auto& token = tokens[i];
        const std::string prev = i > 0 ? tokens[i - 1] : ";";
        const std::string next = i + 1 < tokens.size() ? tokens[i + 1] : ";";
        bool statement_start = prev == ";";

        if (token == "DELETE" && prev != "ON") {
            return reject("DELETE");
        }
        if (token == "TRUNCATE") {
            return reject("TRUNCATE");
        }
        if (token == "DROP" && next == "TABLE") {
            return reject("DROP TABLE");
        }
        // replace() the string function is harmless
        if (token == "REPLACE" && next != "(") {
            return reject(prev == "OR" ? "OR REPLACE" : "REPLACE");
        }
        if (statement_start && (token == "BEGIN" || token == "COMMIT" || token == "ROLLBACK")) {
            return reject("transaction control (" + token + ")");
        }
    }
    return ok();
}

auto migration_manager::validate_schema_integrity() const -> VoidResult {
    auto integrity = prepare(db_, "PRAGMA integrity_check;");
    if (integrity.is_err()) {
        return VoidResult(integrity.error());
    }
    std::vector<std::string> problems;
    while (sqlite3_step(integrity.value().get()) == SQLITE_ROW) {
        auto line = get_text(integrity.value().get(), 0);
        if (line != "ok") {
            problems.push_back(std::move(line));
        }
    }
    if (!problems.empty()) {
        return failure(error_codes::store_error,
                       "Integrity check failed: " + join(problems));
    }

    auto foreign_keys = prepare(db_, "PRAGMA foreign_key_check;");
    if (foreign_keys.is_err()) {
        return VoidResult(foreign_keys.error());
    }
    if (sqlite3_step(foreign_keys.value().get()) == SQLITE_ROW) {
        return failure(error_codes::store_error,
                       vigil::compat::format("Foreign key violation in table {} (rowid {})",
                                             get_text(foreign_keys.value().get(), 0),
                                             sqlite3_column_int64(foreign_keys.value().get(), 1)));
    }
    return ok();
}

// ============================================================================
// Data Migrations
// ============================================================================

auto migration_manager::run_data_migration(std::string_view id,
                                           std::string_view description,
                                           const data_migration_function& migration)
    -> VoidResult {
    if (fail_closed_) {
        return fail_closed_error();
    }
    if (id.empty() || !migration) {
        return failure(error_codes::invalid_argument,
                       "Data migration needs an id and a function");
    }
    auto prepared = ensure_bookkeeping();
    if (prepared.is_err()) {
        return prepared;
    }

    auto already_run = [&]() {
        auto stmt = prepare(db_, "SELECT 1 FROM data_migrations WHERE migration_id = ?;");
        if (stmt.is_err()) {
            return false;
        }
        bind_text(stmt.value().get(), 1, id);
        return sqlite3_step(stmt.value().get()) == SQLITE_ROW;
    };
    if (already_run()) {
        return failure(error_codes::invalid_version_state,
                       vigil::compat::format("Data migration {} has already run", id));
    }

    auto lock = acquire_lock();
    if (lock.is_err()) {
        return VoidResult(lock.error());
    }

    bool rollback_failed = false;
    auto result = in_transaction(
        [&]() -> VoidResult {
            auto sessions = collect_session_ids(db_);
            if (sessions.is_err()) {
                return VoidResult(sessions.error());
            }

            auto migrated = migration(db_);
            if (migrated.is_err()) {
                return migrated;
            }

            std::vector<std::string> lost;
            for (const auto& session : sessions.value()) {
                if (!session_exists(db_, session)) {
                    lost.push_back(session);
                }
            }
            if (!lost.empty()) {
                return failure(error_codes::session_continuity_error,
                               vigil::compat::format(
                                   "Data migration {} would end {} active session(s): {}", id,
                                   lost.size(), join(lost)));
            }

            auto stmt = prepare(db_, R"(
                INSERT INTO data_migrations (migration_id, description, applied_at)
                VALUES (?, ?, ?);
            )");
            if (stmt.is_err()) {
                return VoidResult(stmt.error());
            }
            auto now = archive::format_sql(archive::to_second_time(clock_.now()));
            bind_text(stmt.value().get(), 1, id);
            bind_text(stmt.value().get(), 2, description);
            bind_text(stmt.value().get(), 3, now);
            if (sqlite3_step(stmt.value().get()) != SQLITE_DONE) {
                return failure(error_codes::store_error,
                               vigil::compat::format("Failed to record data migration: {}",
                                                     sqlite3_errmsg(db_)));
            }
            return ok();
        },
        rollback_failed);

    if (result.is_ok()) {
        logger_adapter::log_migration_event(integration::migration_event::data_migration,
                                            std::string(id), std::string(description));
        return result;
    }
    if (rollback_failed) {
        enter_fail_closed(id, "data migration could not be rolled back: " +
                                  result.error().message);
        return fail_closed_error();
    }
    logger_adapter::warn("Data migration {} rolled back: {}", id, result.error().message);
    return result;
}

// ============================================================================
// Internal Implementation
// ============================================================================

auto migration_manager::execute(std::string_view sql) -> VoidResult {
    char* errmsg = nullptr;
    auto rc = sqlite3_exec(db_, std::string(sql).c_str(), nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        auto error_str = errmsg ? std::string(errmsg) : std::string(sqlite3_errmsg(db_));
        sqlite3_free(errmsg);
        return failure(error_codes::store_error,
                       vigil::compat::format("SQL execution failed: {}", error_str));
    }
    return ok();
}

auto migration_manager::in_transaction(const std::function<VoidResult()>& body,
                                       bool& rollback_failed) -> VoidResult {
    auto begun = execute("BEGIN IMMEDIATE;");
    if (begun.is_err()) {
        return begun;
    }

    auto undo = [&]() {
        // Some errors make SQLite roll back on its own
        if (sqlite3_get_autocommit(db_) != 0) {
            return;
        }
        auto rolled = execute("ROLLBACK;");
        if (rolled.is_err()) {
            logger_adapter::error("ROLLBACK failed: {}", rolled.error().message);
            rollback_failed = true;
        }
    };

    auto result = body();
    if (result.is_err()) {
        undo();
        return result;
    }

    auto committed = execute("COMMIT;");
    if (committed.is_err()) {
        undo();
    }
    return committed;
}

auto migration_manager::ensure_bookkeeping() -> VoidResult {
    auto created = execute(R"(
        CREATE TABLE IF NOT EXISTS schema_migrations (
            version_id   TEXT PRIMARY KEY,
            status       TEXT NOT NULL,
            checksum     TEXT NOT NULL DEFAULT '',
            applied_seq  INTEGER,
            applied_at   TEXT NOT NULL DEFAULT '',
            duration_ms  INTEGER NOT NULL DEFAULT 0,
            error        TEXT NOT NULL DEFAULT ''
        );

        CREATE TABLE IF NOT EXISTS data_migrations (
            migration_id TEXT PRIMARY KEY,
            description  TEXT NOT NULL DEFAULT '',
            applied_at   TEXT NOT NULL
        );
    )");
    if (created.is_err()) {
        return created;
    }

    auto stmt = prepare(db_, R"(
        SELECT version_id, error FROM schema_migrations
        WHERE status = 'fail_closed'
        LIMIT 1;
    )");
    if (stmt.is_err()) {
        return VoidResult(stmt.error());
    }
    if (sqlite3_step(stmt.value().get()) == SQLITE_ROW) {
        fail_closed_ = true;
        fail_closed_reason_ = vigil::compat::format("{}: {}", get_text(stmt.value().get(), 0),
                                                    get_text(stmt.value().get(), 1));
    }
    return ok();
}

auto migration_manager::load_records() const -> Result<record_map> {
    record_map records;
    if (!table_exists(db_, "schema_migrations")) {
        return records;
    }

    auto stmt = prepare(db_, R"(
        SELECT version_id, status, checksum, applied_seq, applied_at, duration_ms, error
        FROM schema_migrations;
    )");
    if (stmt.is_err()) {
        return Result<record_map>(stmt.error());
    }

    auto* s = stmt.value().get();
    int rc;
    while ((rc = sqlite3_step(s)) == SQLITE_ROW) {
        migration_record record;
        record.version_id = get_text(s, 0);
        auto status = version_status_from_string(get_text(s, 1));
        if (!status) {
            return make_error<record_map>(
                error_codes::invalid_version_state,
                vigil::compat::format("Version {} has unknown status '{}'", record.version_id,
                                      get_text(s, 1)),
                "migration");
        }
        record.status = *status;
        record.checksum = get_text(s, 2);
        record.applied_seq = sqlite3_column_int64(s, 3);
        record.applied_at = get_text(s, 4);
        record.duration = std::chrono::milliseconds{sqlite3_column_int64(s, 5)};
        record.error = get_text(s, 6);
        auto key = record.version_id;
        records.emplace(std::move(key), std::move(record));
    }
    if (rc != SQLITE_DONE) {
        return make_error<record_map>(
            error_codes::store_error,
            vigil::compat::format("Failed to read schema_migrations: {}", sqlite3_errmsg(db_)),
            "migration");
    }
    return records;
}

auto migration_manager::set_status(std::string_view id, version_status status,
                                   std::string_view error) -> VoidResult {
    auto stmt = prepare(db_, R"(
        INSERT INTO schema_migrations (version_id, status, error)
        VALUES (?1, ?2, ?3)
        ON CONFLICT(version_id) DO UPDATE SET
            status = excluded.status,
            error = excluded.error,
            applied_seq = CASE WHEN excluded.status IN ('pending', 'rolled_back')
                               THEN NULL ELSE schema_migrations.applied_seq END;
    )");
    if (stmt.is_err()) {
        return VoidResult(stmt.error());
    }
    auto* s = stmt.value().get();
    bind_text(s, 1, id);
    bind_text(s, 2, to_string(status));
    bind_text(s, 3, error);
    if (sqlite3_step(s) != SQLITE_DONE) {
        return failure(error_codes::store_error,
                       vigil::compat::format("Failed to record status of {}: {}", id,
                                             sqlite3_errmsg(db_)));
    }
    return ok();
}

auto migration_manager::mark_applied(const schema_version& version,
                                     std::chrono::milliseconds duration) -> VoidResult {
    auto stmt = prepare(db_, R"(
        INSERT INTO schema_migrations
            (version_id, status, checksum, applied_seq, applied_at, duration_ms, error)
        VALUES (?1, 'applied', ?2,
                (SELECT COALESCE(MAX(applied_seq), 0) + 1 FROM schema_migrations),
                ?3, ?4, '')
        ON CONFLICT(version_id) DO UPDATE SET
            status = 'applied',
            checksum = excluded.checksum,
            applied_seq = excluded.applied_seq,
            applied_at = excluded.applied_at,
            duration_ms = excluded.duration_ms,
            error = '';
    )");
    if (stmt.is_err()) {
        return VoidResult(stmt.error());
    }
    auto* s = stmt.value().get();
    auto now = archive::format_sql(archive::to_second_time(clock_.now()));
    bind_text(s, 1, version.id);
    bind_text(s, 2, version.checksum());
    bind_text(s, 3, now);
    sqlite3_bind_int64(s, 4, duration.count());
    if (sqlite3_step(s) != SQLITE_DONE) {
        return failure(error_codes::store_error,
                       vigil::compat::format("Failed to record {} as applied: {}", version.id,
                                             sqlite3_errmsg(db_)));
    }
    return ok();
}

auto migration_manager::acquire_lock() -> Result<core::file_lock> {
    auto lock = core::file_lock::acquire(
        config_.migration_lock_path,
        core::lock_options{config_.lock_timeout, config_.lock_poll_interval});
    if (lock.is_err()) {
        logger_adapter::warn("Migration lock {} unavailable: {}",
                             config_.migration_lock_path.string(), lock.error().message);
        return lock;
    }

    // Record the holder for operators inspecting a stuck lock
    auto owner = vigil::compat::format("{}\n{}\n", ::getpid(),
                                       archive::format_iso(archive::to_second_time(clock_.now())));
    int fd = lock.value().fd();
    if (::ftruncate(fd, 0) != 0 ||
        ::pwrite(fd, owner.data(), owner.size(), 0) != static_cast<ssize_t>(owner.size())) {
        logger_adapter::warn("Could not record lock owner in {}",
                             config_.migration_lock_path.string());
    }
    return lock;
}

auto migration_manager::count_table_rows() const
    -> Result<std::map<std::string, std::int64_t>> {
    using counts = std::map<std::string, std::int64_t>;

    auto tables = prepare(db_, R"(
        SELECT name FROM sqlite_master
        WHERE type = 'table'
          AND name NOT LIKE 'sqlite_%'
          AND name NOT IN ('schema_migrations', 'data_migrations');
    )");
    if (tables.is_err()) {
        return Result<counts>(tables.error());
    }

    std::vector<std::string> names;
    while (sqlite3_step(tables.value().get()) == SQLITE_ROW) {
        names.push_back(get_text(tables.value().get(), 0));
    }

    counts result;
    for (const auto& name : names) {
        auto stmt = prepare(db_, vigil::compat::format("SELECT COUNT(*) FROM \"{}\";", name));
        if (stmt.is_err()) {
            return Result<counts>(stmt.error());
        }
        if (sqlite3_step(stmt.value().get()) != SQLITE_ROW) {
            return make_error<counts>(
                error_codes::store_error,
                vigil::compat::format("Failed to count rows of {}: {}", name,
                                      sqlite3_errmsg(db_)),
                "migration");
        }
        result[name] = sqlite3_column_int64(stmt.value().get(), 0);
    }
    return result;
}

auto migration_manager::verify_no_row_loss(const std::map<std::string, std::int64_t>& before,
                                           const std::vector<std::string>& may_vanish) const
    -> VoidResult {
    auto after = count_table_rows();
    if (after.is_err()) {
        return VoidResult(after.error());
    }
    for (const auto& [table, count] : before) {
        auto it = after.value().find(table);
        if (it == after.value().end()) {
            if (contains(may_vanish, table)) {
                continue;
            }
            return failure(error_codes::migration_failed,
                           vigil::compat::format("Table {} disappeared", table));
        }
        if (it->second < count) {
            return failure(error_codes::migration_failed,
                           vigil::compat::format("Table {} lost {} row(s)", table,
                                                 count - it->second));
        }
    }
    return ok();
}

auto migration_manager::probe(const schema_probe& target) const -> bool {
    switch (target.kind) {
        case probe_kind::table:
            return table_exists(db_, target.table);
        case probe_kind::column: {
            auto stmt = prepare(db_, "SELECT 1 FROM pragma_table_info(?) WHERE name = ?;");
            if (stmt.is_err()) {
                return false;
            }
            bind_text(stmt.value().get(), 1, target.table);
            bind_text(stmt.value().get(), 2, target.name);
            return sqlite3_step(stmt.value().get()) == SQLITE_ROW;
        }
        case probe_kind::index: {
            auto stmt =
                prepare(db_, "SELECT 1 FROM sqlite_master WHERE type = 'index' AND name = ?;");
            if (stmt.is_err()) {
                return false;
            }
            bind_text(stmt.value().get(), 1, target.name);
            return sqlite3_step(stmt.value().get()) == SQLITE_ROW;
        }
    }
    return false;
}

auto migration_manager::effects_of(const schema_version& version) const -> effect_state {
    auto visible = static_cast<std::size_t>(
        std::count_if(version.probes.begin(), version.probes.end(),
                      [this](const schema_probe& p) { return probe(p); }));
    if (visible == 0) {
        return effect_state::none;
    }
    return visible == version.probes.size() ? effect_state::all : effect_state::partial;
}

auto migration_manager::run_reverse(const schema_version& version) -> VoidResult {
    bool rollback_failed = false;
    auto reversed = in_transaction(
        [&]() -> VoidResult {
            auto before = count_table_rows();
            if (before.is_err()) {
                return VoidResult(before.error());
            }
            auto reverse = execute(version.reverse_script);
            if (reverse.is_err()) {
                return reverse;
            }
            return verify_no_row_loss(before.value(), version.created_tables);
        },
        rollback_failed);
    if (reversed.is_ok()) {
        logger_adapter::log_migration_event(integration::migration_event::rolled_back,
                                            version.id, "reverse script after interruption");
    }
    return reversed;
}

auto migration_manager::fail_closed_error() const -> VoidResult {
    return failure(error_codes::migration_fail_closed,
                   vigil::compat::format("Schema migrations are fail-closed ({}); manual "
                                         "intervention required",
                                         fail_closed_reason_));
}

void migration_manager::enter_fail_closed(std::string_view id, const std::string& reason) {
    fail_closed_ = true;
    fail_closed_reason_ = vigil::compat::format("{}: {}", id, reason);
    logger_adapter::log_migration_event(integration::migration_event::fail_closed,
                                        std::string(id), reason);

    auto persisted = set_status(id, version_status::fail_closed, reason);
    if (persisted.is_err()) {
        logger_adapter::fatal("Could not persist fail-closed state for {}: {}", id,
                              persisted.error().message);
    }
}

}  // namespace vigil::storage
