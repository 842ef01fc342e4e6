/**
 * @file sqlite_canonical_store.cpp
 * @brief Implementation of the SQLite canonical store
 */

#include <vigil/storage/sqlite_canonical_store.hpp>

#include <vigil/compat/format.hpp>
#include <vigil/integration/logger_adapter.hpp>

#include <sqlite3.h>

namespace vigil::storage {

using archive::archive_time;
using archive::time_precision;
using integration::logger_adapter;
using kcenon::common::make_error;
using kcenon::common::ok;

namespace {

struct stmt_deleter {
    void operator()(sqlite3_stmt* stmt) const {
        if (stmt) sqlite3_finalize(stmt);
    }
};

using stmt_ptr = std::unique_ptr<sqlite3_stmt, stmt_deleter>;

/**
 * @brief Map a SQLite failure to a store error, keeping constraint failures distinct
 */
auto store_failure(sqlite3* db, int rc, std::string_view what) -> error_info {
    int code = (rc & 0xff) == SQLITE_CONSTRAINT ? error_codes::constraint_violation
                                                : error_codes::store_error;
    return error_info{code, vigil::compat::format("{}: {}", what, sqlite3_errmsg(db)),
                      "storage"};
}

auto prepare(sqlite3* db, const std::string& sql) -> Result<stmt_ptr> {
    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<stmt_ptr>(store_failure(db, rc, "Failed to prepare statement"));
    }
    return stmt_ptr{stmt};
}

void bind_text(sqlite3_stmt* stmt, int index, std::string_view value) {
    // An empty view may carry a null data pointer, which SQLite would bind as NULL
    sqlite3_bind_text(stmt, index, value.empty() ? "" : value.data(),
                      static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

/// Bind NULL for empty values (nullable foreign keys)
void bind_optional_text(sqlite3_stmt* stmt, int index, std::string_view value) {
    if (value.empty()) {
        sqlite3_bind_null(stmt, index);
    } else {
        bind_text(stmt, index, value);
    }
}

/**
 * @brief Get text from statement column, returning empty string for NULL
 */
auto get_text(sqlite3_stmt* stmt, int col) -> std::string {
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? std::string(text) : std::string{};
}

auto precision_text(const archive_time& t) -> std::string_view {
    return archive::precision_of(t) == time_precision::minute ? "minute" : "second";
}

void bind_time(sqlite3_stmt* stmt, int time_index, int precision_index,
               const archive_time& t) {
    bind_text(stmt, time_index, archive::format_sql(t));
    bind_text(stmt, precision_index, precision_text(t));
}

auto read_time(sqlite3_stmt* stmt, int time_col, int precision_col) -> archive_time {
    auto parsed = archive::parse_time(get_text(stmt, time_col),
                                      archive::time_format::sql_datetime);
    archive_time value = parsed ? *parsed : archive_time{archive::second_time{}};
    if (get_text(stmt, precision_col) == "minute") {
        return archive::as_minutes(value);
    }
    return archive::as_seconds(value);
}

/// Incoming time, unless it is a coarser reading of the stored instant
auto merge_time(const archive_time& existing, const archive_time& incoming) -> archive_time {
    if (archive::same_instant(existing, incoming) &&
        archive::precision_of(incoming) == time_precision::minute) {
        return existing;
    }
    return incoming;
}

auto identical_time(const archive_time& a, const archive_time& b) -> bool {
    return archive::precision_of(a) == archive::precision_of(b) &&
           archive::as_seconds(a) == archive::as_seconds(b);
}

auto step_done(sqlite3* db, sqlite3_stmt* stmt, std::string_view what) -> VoidResult {
    auto rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE && rc != SQLITE_ROW) {
        return VoidResult(store_failure(db, rc, what));
    }
    return ok();
}

auto step_returning_pk(sqlite3* db, sqlite3_stmt* stmt, std::string_view what)
    -> Result<std::int64_t> {
    auto rc = sqlite3_step(stmt);
    if (rc != SQLITE_ROW) {
        return Result<std::int64_t>(store_failure(db, rc, what));
    }
    return static_cast<std::int64_t>(sqlite3_column_int64(stmt, 0));
}

/// At most one row; a failed step is an error, not a miss
template <typename Row, typename Parse>
auto fetch_one(sqlite3* db, sqlite3_stmt* stmt, Parse parse, std::string_view what)
    -> Result<std::optional<Row>> {
    auto rc = sqlite3_step(stmt);
    if (rc == SQLITE_DONE) {
        return std::optional<Row>{};
    }
    if (rc != SQLITE_ROW) {
        return Result<std::optional<Row>>(store_failure(db, rc, what));
    }
    return std::optional<Row>{parse(stmt)};
}

template <typename Row>
auto found_or_logged(Result<std::optional<Row>> found) -> std::optional<Row> {
    if (found.is_err()) {
        logger_adapter::error("Lookup failed: {}", found.error().message);
        return std::nullopt;
    }
    return found.value();
}

auto parse_user_row(sqlite3_stmt* stmt) -> user_record {
    user_record record;
    record.pk = sqlite3_column_int64(stmt, 0);
    record.display_name = get_text(stmt, 1);
    record.invited_by = get_text(stmt, 2);
    record.created_at = read_time(stmt, 3, 4);
    record.archive_path = get_text(stmt, 5);
    record.is_placeholder = sqlite3_column_int(stmt, 6) != 0;
    return record;
}

auto parse_prayer_row(sqlite3_stmt* stmt) -> prayer_record {
    prayer_record record;
    record.pk = sqlite3_column_int64(stmt, 0);
    record.prayer_id = get_text(stmt, 1);
    record.author = get_text(stmt, 2);
    record.text = get_text(stmt, 3);
    record.generated_prayer = get_text(stmt, 4);
    record.project_tag = get_text(stmt, 5);
    record.target_audience = get_text(stmt, 6);
    record.submitted_at = read_time(stmt, 7, 8);
    record.archive_path = get_text(stmt, 9);
    record.is_placeholder = sqlite3_column_int(stmt, 10) != 0;
    return record;
}

auto parse_event_row(sqlite3_stmt* stmt) -> event_record {
    event_record record;
    record.pk = sqlite3_column_int64(stmt, 0);
    record.subject_id = get_text(stmt, 1);
    record.action = get_text(stmt, 2);
    record.actor = get_text(stmt, 3);
    record.detail = get_text(stmt, 4);
    record.occurred_at = read_time(stmt, 5, 6);
    record.archive_path = get_text(stmt, 7);
    return record;
}

auto parse_token_row(sqlite3_stmt* stmt) -> invite_token_record {
    invite_token_record record;
    record.pk = sqlite3_column_int64(stmt, 0);
    record.token = get_text(stmt, 1);
    record.created_by = get_text(stmt, 2);
    record.expires_at = get_text(stmt, 3);
    record.used = sqlite3_column_int(stmt, 4) != 0;
    record.used_by = get_text(stmt, 5);
    record.created_at = get_text(stmt, 6);
    record.archive_path = get_text(stmt, 7);
    return record;
}

auto parse_role_row(sqlite3_stmt* stmt) -> role_record {
    role_record record;
    record.pk = sqlite3_column_int64(stmt, 0);
    record.name = get_text(stmt, 1);
    record.description = get_text(stmt, 2);
    record.permissions = get_text(stmt, 3);
    record.is_system_role = sqlite3_column_int(stmt, 4) != 0;
    record.created_by = get_text(stmt, 5);
    record.archive_path = get_text(stmt, 6);
    record.is_placeholder = sqlite3_column_int(stmt, 7) != 0;
    return record;
}

constexpr const char* kUserColumns =
    "user_pk, display_name, invited_by, created_at, time_precision, archive_path, "
    "is_placeholder";

constexpr const char* kPrayerColumns =
    "prayer_pk, prayer_id, author, text, generated_prayer, project_tag, target_audience, "
    "submitted_at, time_precision, archive_path, is_placeholder";

constexpr const char* kEventColumns =
    "event_pk, subject_id, action, actor, detail, occurred_at, time_precision, archive_path";

constexpr const char* kTokenColumns =
    "token_pk, token, created_by, expires_at, used, used_by, created_at, archive_path";

constexpr const char* kRoleColumns =
    "role_pk, name, description, permissions, is_system_role, created_by, archive_path, "
    "is_placeholder";

}  // namespace

// ============================================================================
// Construction / Destruction
// ============================================================================

auto sqlite_canonical_store::open(std::string_view db_path)
    -> Result<std::unique_ptr<sqlite_canonical_store>> {
    return open(db_path, sqlite_store_config{});
}

auto sqlite_canonical_store::open(std::string_view db_path,
                                  const sqlite_store_config& config,
                                  const core::clock_source& clock)
    -> Result<std::unique_ptr<sqlite_canonical_store>> {
    using store_ptr = std::unique_ptr<sqlite_canonical_store>;
    sqlite3* db = nullptr;

    auto rc = sqlite3_open(std::string(db_path).c_str(), &db);
    if (rc != SQLITE_OK) {
        std::string error_msg = db ? sqlite3_errmsg(db) : "Failed to allocate memory";
        if (db) {
            sqlite3_close(db);
        }
        return make_error<store_ptr>(
            error_codes::store_open_error,
            vigil::compat::format("Failed to open database: {}", error_msg), "storage");
    }

    auto fail = [&](std::string_view what) {
        std::string message = vigil::compat::format("{}: {}", what, sqlite3_errmsg(db));
        sqlite3_close(db);
        return make_error<store_ptr>(error_codes::store_open_error, message, "storage");
    };

    // Enable foreign keys
    if (sqlite3_exec(db, "PRAGMA foreign_keys = ON;", nullptr, nullptr, nullptr) !=
        SQLITE_OK) {
        return fail("Failed to enable foreign keys");
    }

    // Configure WAL mode for better concurrency (except for in-memory DB)
    if (config.wal_mode && db_path != ":memory:") {
        if (sqlite3_exec(db, "PRAGMA journal_mode = WAL;", nullptr, nullptr, nullptr) !=
            SQLITE_OK) {
            return fail("Failed to enable WAL mode");
        }
    }

    // Configure cache size (negative value means KB)
    auto cache_sql =
        vigil::compat::format("PRAGMA cache_size = -{};", config.cache_size_mb * 1024);
    if (sqlite3_exec(db, cache_sql.c_str(), nullptr, nullptr, nullptr) != SQLITE_OK) {
        return fail("Failed to set cache size");
    }

    sqlite3_busy_timeout(db, config.busy_timeout_ms);

    return store_ptr(new sqlite_canonical_store(db, std::string(db_path), clock));
}

sqlite_canonical_store::sqlite_canonical_store(sqlite3* db, std::string path,
                                               const core::clock_source& clock)
    : db_(db), path_(std::move(path)), clock_(clock) {}

sqlite_canonical_store::~sqlite_canonical_store() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

// ============================================================================
// Transactions
// ============================================================================

auto sqlite_canonical_store::execute(std::string_view sql) -> VoidResult {
    char* error_msg = nullptr;
    auto rc = sqlite3_exec(db_, std::string(sql).c_str(), nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        std::string message = error_msg ? error_msg : sqlite3_errmsg(db_);
        sqlite3_free(error_msg);
        int code = (rc & 0xff) == SQLITE_CONSTRAINT ? error_codes::constraint_violation
                                                    : error_codes::transaction_error;
        return make_error<std::monostate>(
            code, vigil::compat::format("{} failed: {}", sql, message), "storage");
    }
    return ok();
}

auto sqlite_canonical_store::begin_transaction() -> VoidResult {
    return execute("BEGIN IMMEDIATE;");
}

auto sqlite_canonical_store::commit() -> VoidResult { return execute("COMMIT;"); }

auto sqlite_canonical_store::rollback() -> VoidResult { return execute("ROLLBACK;"); }

auto sqlite_canonical_store::savepoint(std::string_view name) -> VoidResult {
    return execute(vigil::compat::format("SAVEPOINT \"{}\";", name));
}

auto sqlite_canonical_store::release_savepoint(std::string_view name) -> VoidResult {
    return execute(vigil::compat::format("RELEASE \"{}\";", name));
}

// The savepoint stays open after ROLLBACK TO and must still be released
auto sqlite_canonical_store::rollback_to_savepoint(std::string_view name) -> VoidResult {
    return execute(vigil::compat::format("ROLLBACK TO \"{}\";", name));
}

auto sqlite_canonical_store::count_rows(std::string_view table) const
    -> Result<std::size_t> {
    auto stmt = prepare(db_, vigil::compat::format("SELECT COUNT(*) FROM {};", table));
    if (stmt.is_err()) {
        return Result<std::size_t>(stmt.error());
    }
    auto rc = sqlite3_step(stmt.value().get());
    if (rc != SQLITE_ROW) {
        return Result<std::size_t>(store_failure(db_, rc, "Failed to count rows"));
    }
    return static_cast<std::size_t>(sqlite3_column_int64(stmt.value().get(), 0));
}

auto sqlite_canonical_store::backfill_path(std::string_view table,
                                           std::string_view pk_column, std::int64_t pk,
                                           std::string_view archive_path) -> VoidResult {
    auto stmt = prepare(db_, vigil::compat::format(
                                 "UPDATE {} SET archive_path = ? WHERE {} = ?;", table,
                                 pk_column));
    if (stmt.is_err()) {
        return VoidResult(stmt.error());
    }
    bind_text(stmt.value().get(), 1, archive_path);
    sqlite3_bind_int64(stmt.value().get(), 2, pk);
    return step_done(db_, stmt.value().get(), "Failed to backfill archive path");
}

// ============================================================================
// Users
// ============================================================================

auto sqlite_canonical_store::insert_user(const user_record& record) -> Result<std::int64_t> {
    auto stmt = prepare(db_, R"(
        INSERT INTO users (display_name, invited_by, created_at, time_precision,
                           archive_path, is_placeholder)
        VALUES (?, ?, ?, ?, ?, ?)
        RETURNING user_pk;
    )");
    if (stmt.is_err()) {
        return Result<std::int64_t>(stmt.error());
    }
    auto* s = stmt.value().get();
    bind_text(s, 1, record.display_name);
    bind_optional_text(s, 2, record.invited_by);
    bind_time(s, 3, 4, record.created_at);
    bind_text(s, 5, record.archive_path);
    sqlite3_bind_int(s, 6, record.is_placeholder ? 1 : 0);
    return step_returning_pk(db_, s, "Failed to insert user");
}

auto sqlite_canonical_store::update_user(std::int64_t pk, const user_record& record)
    -> VoidResult {
    auto stmt = prepare(db_, R"(
        UPDATE users
        SET invited_by = ?, created_at = ?, time_precision = ?, archive_path = ?,
            is_placeholder = ?
        WHERE user_pk = ?;
    )");
    if (stmt.is_err()) {
        return VoidResult(stmt.error());
    }
    auto* s = stmt.value().get();
    bind_optional_text(s, 1, record.invited_by);
    bind_time(s, 2, 3, record.created_at);
    bind_text(s, 4, record.archive_path);
    sqlite3_bind_int(s, 5, record.is_placeholder ? 1 : 0);
    sqlite3_bind_int64(s, 6, pk);
    return step_done(db_, s, "Failed to update user");
}

auto sqlite_canonical_store::upsert_user(const user_record& record, upsert_mode mode)
    -> Result<upsert_result> {
    auto found = lookup_user(record.display_name);
    if (found.is_err()) {
        return Result<upsert_result>(found.error());
    }
    const auto& existing = found.value();
    if (!existing) {
        auto pk = insert_user(record);
        if (pk.is_err()) {
            return Result<upsert_result>(pk.error());
        }
        return upsert_result{pk.value(), upsert_outcome::inserted};
    }

    user_record merged = record;
    if (merged.archive_path.empty()) {
        merged.archive_path = existing->archive_path;
    }

    bool replaces_placeholder = existing->is_placeholder && !record.is_placeholder;
    if (replaces_placeholder || mode == upsert_mode::update_existing) {
        if (!replaces_placeholder) {
            merged.created_at = merge_time(existing->created_at, record.created_at);
            merged.is_placeholder = existing->is_placeholder;
        }
        if (!replaces_placeholder && merged.invited_by == existing->invited_by &&
            identical_time(merged.created_at, existing->created_at) &&
            merged.archive_path == existing->archive_path) {
            return upsert_result{existing->pk, upsert_outcome::unchanged};
        }
        auto updated = update_user(existing->pk, merged);
        if (updated.is_err()) {
            return Result<upsert_result>(updated.error());
        }
        return upsert_result{existing->pk, upsert_outcome::updated};
    }

    if (existing->archive_path.empty() && !record.archive_path.empty()) {
        auto backfilled = backfill_path("users", "user_pk", existing->pk, record.archive_path);
        if (backfilled.is_err()) {
            return Result<upsert_result>(backfilled.error());
        }
        return upsert_result{existing->pk, upsert_outcome::path_backfilled};
    }
    return upsert_result{existing->pk, upsert_outcome::unchanged};
}

auto sqlite_canonical_store::find_user(std::string_view display_name) const
    -> std::optional<user_record> {
    return found_or_logged(lookup_user(display_name));
}

auto sqlite_canonical_store::lookup_user(std::string_view display_name) const
    -> Result<std::optional<user_record>> {
    auto stmt = prepare(
        db_, vigil::compat::format("SELECT {} FROM users WHERE display_name = ?;",
                                   kUserColumns));
    if (stmt.is_err()) {
        return Result<std::optional<user_record>>(stmt.error());
    }
    bind_text(stmt.value().get(), 1, display_name);
    return fetch_one<user_record>(db_, stmt.value().get(), parse_user_row,
                                  "Failed to look up user");
}

auto sqlite_canonical_store::list_users() const -> Result<std::vector<user_record>> {
    auto stmt = prepare(
        db_, vigil::compat::format("SELECT {} FROM users ORDER BY user_pk;", kUserColumns));
    if (stmt.is_err()) {
        return Result<std::vector<user_record>>(stmt.error());
    }
    std::vector<user_record> results;
    int rc;
    while ((rc = sqlite3_step(stmt.value().get())) == SQLITE_ROW) {
        results.push_back(parse_user_row(stmt.value().get()));
    }
    if (rc != SQLITE_DONE) {
        return Result<std::vector<user_record>>(
            store_failure(db_, rc, "Failed to list users"));
    }
    return results;
}

auto sqlite_canonical_store::user_count() const -> Result<std::size_t> {
    return count_rows("users");
}

auto sqlite_canonical_store::ensure_placeholder_user(std::string_view display_name,
                                                     const archive_time& seen_at)
    -> Result<bool> {
    auto stmt = prepare(db_, R"(
        INSERT INTO users (display_name, invited_by, created_at, time_precision,
                           archive_path, is_placeholder)
        VALUES (?, NULL, ?, ?, '', 1)
        ON CONFLICT(display_name) DO NOTHING;
    )");
    if (stmt.is_err()) {
        return Result<bool>(stmt.error());
    }
    auto* s = stmt.value().get();
    bind_text(s, 1, display_name);
    bind_time(s, 2, 3, seen_at);
    auto done = step_done(db_, s, "Failed to insert placeholder user");
    if (done.is_err()) {
        return Result<bool>(done.error());
    }
    return sqlite3_changes(db_) > 0;
}

// ============================================================================
// Prayers
// ============================================================================

auto sqlite_canonical_store::insert_prayer(const prayer_record& record)
    -> Result<std::int64_t> {
    auto stmt = prepare(db_, R"(
        INSERT INTO prayers (prayer_id, author, text, generated_prayer, project_tag,
                             target_audience, submitted_at, time_precision,
                             archive_path, is_placeholder)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
        RETURNING prayer_pk;
    )");
    if (stmt.is_err()) {
        return Result<std::int64_t>(stmt.error());
    }
    auto* s = stmt.value().get();
    bind_text(s, 1, record.prayer_id);
    bind_optional_text(s, 2, record.author);
    bind_text(s, 3, record.text);
    bind_text(s, 4, record.generated_prayer);
    bind_text(s, 5, record.project_tag);
    bind_text(s, 6, record.target_audience);
    bind_time(s, 7, 8, record.submitted_at);
    bind_text(s, 9, record.archive_path);
    sqlite3_bind_int(s, 10, record.is_placeholder ? 1 : 0);
    return step_returning_pk(db_, s, "Failed to insert prayer");
}

auto sqlite_canonical_store::update_prayer(std::int64_t pk, const prayer_record& record)
    -> VoidResult {
    auto stmt = prepare(db_, R"(
        UPDATE prayers
        SET author = ?, text = ?, generated_prayer = ?, project_tag = ?,
            target_audience = ?, submitted_at = ?, time_precision = ?,
            archive_path = ?, is_placeholder = ?
        WHERE prayer_pk = ?;
    )");
    if (stmt.is_err()) {
        return VoidResult(stmt.error());
    }
    auto* s = stmt.value().get();
    bind_optional_text(s, 1, record.author);
    bind_text(s, 2, record.text);
    bind_text(s, 3, record.generated_prayer);
    bind_text(s, 4, record.project_tag);
    bind_text(s, 5, record.target_audience);
    bind_time(s, 6, 7, record.submitted_at);
    bind_text(s, 8, record.archive_path);
    sqlite3_bind_int(s, 9, record.is_placeholder ? 1 : 0);
    sqlite3_bind_int64(s, 10, pk);
    return step_done(db_, s, "Failed to update prayer");
}

auto sqlite_canonical_store::upsert_prayer(const prayer_record& record, upsert_mode mode)
    -> Result<upsert_result> {
    auto found = lookup_prayer(record.prayer_id);
    if (found.is_err()) {
        return Result<upsert_result>(found.error());
    }
    const auto& existing = found.value();
    if (!existing) {
        auto pk = insert_prayer(record);
        if (pk.is_err()) {
            return Result<upsert_result>(pk.error());
        }
        return upsert_result{pk.value(), upsert_outcome::inserted};
    }

    prayer_record merged = record;
    if (merged.archive_path.empty()) {
        merged.archive_path = existing->archive_path;
    }

    bool replaces_placeholder = existing->is_placeholder && !record.is_placeholder;
    if (replaces_placeholder || mode == upsert_mode::update_existing) {
        if (!replaces_placeholder) {
            merged.submitted_at = merge_time(existing->submitted_at, record.submitted_at);
            merged.is_placeholder = existing->is_placeholder;
        }
        if (!replaces_placeholder && merged.author == existing->author &&
            merged.text == existing->text &&
            merged.generated_prayer == existing->generated_prayer &&
            merged.project_tag == existing->project_tag &&
            merged.target_audience == existing->target_audience &&
            identical_time(merged.submitted_at, existing->submitted_at) &&
            merged.archive_path == existing->archive_path) {
            return upsert_result{existing->pk, upsert_outcome::unchanged};
        }
        auto updated = update_prayer(existing->pk, merged);
        if (updated.is_err()) {
            return Result<upsert_result>(updated.error());
        }
        return upsert_result{existing->pk, upsert_outcome::updated};
    }

    if (existing->archive_path.empty() && !record.archive_path.empty()) {
        auto backfilled =
            backfill_path("prayers", "prayer_pk", existing->pk, record.archive_path);
        if (backfilled.is_err()) {
            return Result<upsert_result>(backfilled.error());
        }
        return upsert_result{existing->pk, upsert_outcome::path_backfilled};
    }
    return upsert_result{existing->pk, upsert_outcome::unchanged};
}

auto sqlite_canonical_store::find_prayer(std::string_view prayer_id) const
    -> std::optional<prayer_record> {
    return found_or_logged(lookup_prayer(prayer_id));
}

auto sqlite_canonical_store::lookup_prayer(std::string_view prayer_id) const
    -> Result<std::optional<prayer_record>> {
    auto stmt = prepare(
        db_, vigil::compat::format("SELECT {} FROM prayers WHERE prayer_id = ?;",
                                   kPrayerColumns));
    if (stmt.is_err()) {
        return Result<std::optional<prayer_record>>(stmt.error());
    }
    bind_text(stmt.value().get(), 1, prayer_id);
    return fetch_one<prayer_record>(db_, stmt.value().get(), parse_prayer_row,
                                    "Failed to look up prayer");
}

auto sqlite_canonical_store::list_prayers() const -> Result<std::vector<prayer_record>> {
    auto stmt = prepare(db_, vigil::compat::format(
                                 "SELECT {} FROM prayers ORDER BY prayer_pk;", kPrayerColumns));
    if (stmt.is_err()) {
        return Result<std::vector<prayer_record>>(stmt.error());
    }
    std::vector<prayer_record> results;
    int rc;
    while ((rc = sqlite3_step(stmt.value().get())) == SQLITE_ROW) {
        results.push_back(parse_prayer_row(stmt.value().get()));
    }
    if (rc != SQLITE_DONE) {
        return Result<std::vector<prayer_record>>(
            store_failure(db_, rc, "Failed to list prayers"));
    }
    return results;
}

auto sqlite_canonical_store::prayer_count() const -> Result<std::size_t> {
    return count_rows("prayers");
}

auto sqlite_canonical_store::ensure_placeholder_prayer(std::string_view prayer_id,
                                                       const archive_time& seen_at)
    -> Result<bool> {
    auto stmt = prepare(db_, R"(
        INSERT INTO prayers (prayer_id, author, text, submitted_at, time_precision,
                             archive_path, is_placeholder)
        VALUES (?, NULL, '', ?, ?, '', 1)
        ON CONFLICT(prayer_id) DO NOTHING;
    )");
    if (stmt.is_err()) {
        return Result<bool>(stmt.error());
    }
    auto* s = stmt.value().get();
    bind_text(s, 1, prayer_id);
    bind_time(s, 2, 3, seen_at);
    auto done = step_done(db_, s, "Failed to insert placeholder prayer");
    if (done.is_err()) {
        return Result<bool>(done.error());
    }
    return sqlite3_changes(db_) > 0;
}

// ============================================================================
// Events
// ============================================================================

auto sqlite_canonical_store::upsert_event(event_stream stream, const event_record& record,
                                          upsert_mode mode) -> Result<upsert_result> {
    auto table = table_name(stream);
    auto found = lookup_event(stream, record);
    if (found.is_err()) {
        return Result<upsert_result>(found.error());
    }
    const auto& existing = found.value();

    if (!existing) {
        auto stmt = prepare(db_, vigil::compat::format(R"(
            INSERT INTO {} (subject_id, action, actor, detail, occurred_at,
                            time_precision, archive_path)
            VALUES (?, ?, ?, ?, ?, ?, ?)
            RETURNING event_pk;
        )", table));
        if (stmt.is_err()) {
            return Result<upsert_result>(stmt.error());
        }
        auto* s = stmt.value().get();
        bind_text(s, 1, record.subject_id);
        bind_text(s, 2, record.action);
        bind_optional_text(s, 3, record.actor);
        bind_text(s, 4, record.detail);
        bind_time(s, 5, 6, record.occurred_at);
        bind_text(s, 7, record.archive_path);
        auto pk = step_returning_pk(
            db_, s, vigil::compat::format("Failed to insert into {}", table));
        if (pk.is_err()) {
            return Result<upsert_result>(pk.error());
        }
        return upsert_result{pk.value(), upsert_outcome::inserted};
    }

    if (mode == upsert_mode::update_existing) {
        auto occurred = merge_time(existing->occurred_at, record.occurred_at);
        auto path = record.archive_path.empty() ? existing->archive_path : record.archive_path;
        if (record.detail == existing->detail && identical_time(occurred, existing->occurred_at) &&
            path == existing->archive_path) {
            return upsert_result{existing->pk, upsert_outcome::unchanged};
        }

        auto stmt = prepare(db_, vigil::compat::format(R"(
            UPDATE {}
            SET detail = ?, occurred_at = ?, time_precision = ?, archive_path = ?
            WHERE event_pk = ?;
        )", table));
        if (stmt.is_err()) {
            return Result<upsert_result>(stmt.error());
        }
        auto* s = stmt.value().get();
        bind_text(s, 1, record.detail);
        bind_time(s, 2, 3, occurred);
        bind_text(s, 4, path);
        sqlite3_bind_int64(s, 5, existing->pk);
        auto done = step_done(db_, s, vigil::compat::format("Failed to update {}", table));
        if (done.is_err()) {
            return Result<upsert_result>(done.error());
        }
        return upsert_result{existing->pk, upsert_outcome::updated};
    }

    if (existing->archive_path.empty() && !record.archive_path.empty()) {
        auto backfilled = backfill_path(table, "event_pk", existing->pk, record.archive_path);
        if (backfilled.is_err()) {
            return Result<upsert_result>(backfilled.error());
        }
        return upsert_result{existing->pk, upsert_outcome::path_backfilled};
    }
    return upsert_result{existing->pk, upsert_outcome::unchanged};
}

auto sqlite_canonical_store::find_event(event_stream stream, const event_record& key) const
    -> std::optional<event_record> {
    return found_or_logged(lookup_event(stream, key));
}

auto sqlite_canonical_store::lookup_event(event_stream stream, const event_record& key) const
    -> Result<std::optional<event_record>> {
    // Same minute always; same second unless either side only knows the minute
    auto stmt = prepare(db_, vigil::compat::format(R"(
        SELECT {} FROM {}
        WHERE subject_id = ?1 AND action = ?2 AND actor IS ?3
          AND occurred_at >= ?4 AND occurred_at < ?5
          AND (time_precision = 'minute' OR ?6 = 'minute' OR occurred_at = ?7)
        ORDER BY event_pk
        LIMIT 1;
    )", kEventColumns, table_name(stream)));
    if (stmt.is_err()) {
        return Result<std::optional<event_record>>(stmt.error());
    }

    auto minute_start = archive::as_minutes(key.occurred_at);
    archive_time window_begin = archive::as_seconds(minute_start);
    archive_time window_end = archive::as_seconds(minute_start + std::chrono::minutes{1});

    auto* s = stmt.value().get();
    bind_text(s, 1, key.subject_id);
    bind_text(s, 2, key.action);
    bind_optional_text(s, 3, key.actor);
    bind_text(s, 4, archive::format_sql(window_begin));
    bind_text(s, 5, archive::format_sql(window_end));
    bind_text(s, 6, precision_text(key.occurred_at));
    bind_text(s, 7, archive::format_sql(key.occurred_at));

    return fetch_one<event_record>(
        db_, s, parse_event_row,
        vigil::compat::format("Failed to look up {} event", table_name(stream)));
}

auto sqlite_canonical_store::list_events(event_stream stream) const
    -> Result<std::vector<event_record>> {
    auto stmt = prepare(db_, vigil::compat::format(
                                 "SELECT {} FROM {} ORDER BY occurred_at, event_pk;",
                                 kEventColumns, table_name(stream)));
    if (stmt.is_err()) {
        return Result<std::vector<event_record>>(stmt.error());
    }
    std::vector<event_record> results;
    int rc;
    while ((rc = sqlite3_step(stmt.value().get())) == SQLITE_ROW) {
        results.push_back(parse_event_row(stmt.value().get()));
    }
    if (rc != SQLITE_DONE) {
        return Result<std::vector<event_record>>(
            store_failure(db_, rc, "Failed to list events"));
    }
    return results;
}

auto sqlite_canonical_store::event_count(event_stream stream) const -> Result<std::size_t> {
    return count_rows(table_name(stream));
}

// ============================================================================
// Invite Tokens
// ============================================================================

auto sqlite_canonical_store::upsert_invite_token(const invite_token_record& record,
                                                 upsert_mode mode) -> Result<upsert_result> {
    auto found = lookup_invite_token(record.token);
    if (found.is_err()) {
        return Result<upsert_result>(found.error());
    }
    const auto& existing = found.value();

    auto write = [&](bool insert, std::int64_t pk,
                     const invite_token_record& values) -> Result<std::int64_t> {
        auto stmt = prepare(db_, insert ? R"(
            INSERT INTO invite_tokens (created_by, expires_at, used, used_by, created_at,
                                       archive_path, token)
            VALUES (?, ?, ?, ?, ?, ?, ?)
            RETURNING token_pk;
        )" : R"(
            UPDATE invite_tokens
            SET created_by = ?, expires_at = ?, used = ?, used_by = ?, created_at = ?,
                archive_path = ?
            WHERE token_pk = ?
            RETURNING token_pk;
        )");
        if (stmt.is_err()) {
            return Result<std::int64_t>(stmt.error());
        }
        auto* s = stmt.value().get();
        bind_optional_text(s, 1, values.created_by);
        bind_text(s, 2, values.expires_at);
        sqlite3_bind_int(s, 3, values.used ? 1 : 0);
        bind_optional_text(s, 4, values.used_by);
        bind_text(s, 5, values.created_at);
        bind_text(s, 6, values.archive_path);
        if (insert) {
            bind_text(s, 7, values.token);
        } else {
            sqlite3_bind_int64(s, 7, pk);
        }
        return step_returning_pk(db_, s, "Failed to write invite token");
    };

    if (!existing) {
        auto pk = write(true, 0, record);
        if (pk.is_err()) {
            return Result<upsert_result>(pk.error());
        }
        return upsert_result{pk.value(), upsert_outcome::inserted};
    }

    if (mode == upsert_mode::update_existing) {
        invite_token_record merged = record;
        if (merged.archive_path.empty()) {
            merged.archive_path = existing->archive_path;
        }
        if (merged.created_by == existing->created_by &&
            merged.expires_at == existing->expires_at && merged.used == existing->used &&
            merged.used_by == existing->used_by && merged.created_at == existing->created_at &&
            merged.archive_path == existing->archive_path) {
            return upsert_result{existing->pk, upsert_outcome::unchanged};
        }
        auto pk = write(false, existing->pk, merged);
        if (pk.is_err()) {
            return Result<upsert_result>(pk.error());
        }
        return upsert_result{existing->pk, upsert_outcome::updated};
    }

    if (existing->archive_path.empty() && !record.archive_path.empty()) {
        auto backfilled =
            backfill_path("invite_tokens", "token_pk", existing->pk, record.archive_path);
        if (backfilled.is_err()) {
            return Result<upsert_result>(backfilled.error());
        }
        return upsert_result{existing->pk, upsert_outcome::path_backfilled};
    }
    return upsert_result{existing->pk, upsert_outcome::unchanged};
}

auto sqlite_canonical_store::find_invite_token(std::string_view token) const
    -> std::optional<invite_token_record> {
    return found_or_logged(lookup_invite_token(token));
}

auto sqlite_canonical_store::lookup_invite_token(std::string_view token) const
    -> Result<std::optional<invite_token_record>> {
    auto stmt = prepare(
        db_, vigil::compat::format("SELECT {} FROM invite_tokens WHERE token = ?;",
                                   kTokenColumns));
    if (stmt.is_err()) {
        return Result<std::optional<invite_token_record>>(stmt.error());
    }
    bind_text(stmt.value().get(), 1, token);
    return fetch_one<invite_token_record>(db_, stmt.value().get(), parse_token_row,
                                          "Failed to look up invite token");
}

auto sqlite_canonical_store::list_invite_tokens() const
    -> Result<std::vector<invite_token_record>> {
    auto stmt = prepare(db_, vigil::compat::format(
                                 "SELECT {} FROM invite_tokens ORDER BY token_pk;",
                                 kTokenColumns));
    if (stmt.is_err()) {
        return Result<std::vector<invite_token_record>>(stmt.error());
    }
    std::vector<invite_token_record> results;
    int rc;
    while ((rc = sqlite3_step(stmt.value().get())) == SQLITE_ROW) {
        results.push_back(parse_token_row(stmt.value().get()));
    }
    if (rc != SQLITE_DONE) {
        return Result<std::vector<invite_token_record>>(
            store_failure(db_, rc, "Failed to list invite tokens"));
    }
    return results;
}

auto sqlite_canonical_store::invite_token_count() const -> Result<std::size_t> {
    return count_rows("invite_tokens");
}

// ============================================================================
// Roles
// ============================================================================

auto sqlite_canonical_store::upsert_role(const role_record& record, upsert_mode mode)
    -> Result<upsert_result> {
    auto found = lookup_role(record.name);
    if (found.is_err()) {
        return Result<upsert_result>(found.error());
    }
    const auto& existing = found.value();

    auto write = [&](bool insert, std::int64_t pk,
                     const role_record& values) -> Result<std::int64_t> {
        auto stmt = prepare(db_, insert ? R"(
            INSERT INTO roles (description, permissions, is_system_role, created_by,
                               archive_path, is_placeholder, name)
            VALUES (?, ?, ?, ?, ?, ?, ?)
            RETURNING role_pk;
        )" : R"(
            UPDATE roles
            SET description = ?, permissions = ?, is_system_role = ?, created_by = ?,
                archive_path = ?, is_placeholder = ?
            WHERE role_pk = ?
            RETURNING role_pk;
        )");
        if (stmt.is_err()) {
            return Result<std::int64_t>(stmt.error());
        }
        auto* s = stmt.value().get();
        bind_text(s, 1, values.description);
        bind_text(s, 2, values.permissions);
        sqlite3_bind_int(s, 3, values.is_system_role ? 1 : 0);
        bind_optional_text(s, 4, values.created_by);
        bind_text(s, 5, values.archive_path);
        sqlite3_bind_int(s, 6, values.is_placeholder ? 1 : 0);
        if (insert) {
            bind_text(s, 7, values.name);
        } else {
            sqlite3_bind_int64(s, 7, pk);
        }
        return step_returning_pk(db_, s, "Failed to write role");
    };

    if (!existing) {
        auto pk = write(true, 0, record);
        if (pk.is_err()) {
            return Result<upsert_result>(pk.error());
        }
        return upsert_result{pk.value(), upsert_outcome::inserted};
    }

    bool replaces_placeholder = existing->is_placeholder && !record.is_placeholder;
    if (replaces_placeholder || mode == upsert_mode::update_existing) {
        role_record merged = record;
        if (merged.archive_path.empty()) {
            merged.archive_path = existing->archive_path;
        }
        if (!replaces_placeholder) {
            merged.is_placeholder = existing->is_placeholder;
        }
        if (!replaces_placeholder && merged.description == existing->description &&
            merged.permissions == existing->permissions &&
            merged.is_system_role == existing->is_system_role &&
            merged.created_by == existing->created_by &&
            merged.archive_path == existing->archive_path) {
            return upsert_result{existing->pk, upsert_outcome::unchanged};
        }
        auto pk = write(false, existing->pk, merged);
        if (pk.is_err()) {
            return Result<upsert_result>(pk.error());
        }
        return upsert_result{existing->pk, upsert_outcome::updated};
    }

    if (existing->archive_path.empty() && !record.archive_path.empty()) {
        auto backfilled = backfill_path("roles", "role_pk", existing->pk, record.archive_path);
        if (backfilled.is_err()) {
            return Result<upsert_result>(backfilled.error());
        }
        return upsert_result{existing->pk, upsert_outcome::path_backfilled};
    }
    return upsert_result{existing->pk, upsert_outcome::unchanged};
}

auto sqlite_canonical_store::find_role(std::string_view name) const
    -> std::optional<role_record> {
    return found_or_logged(lookup_role(name));
}

auto sqlite_canonical_store::lookup_role(std::string_view name) const
    -> Result<std::optional<role_record>> {
    auto stmt = prepare(
        db_, vigil::compat::format("SELECT {} FROM roles WHERE name = ?;", kRoleColumns));
    if (stmt.is_err()) {
        return Result<std::optional<role_record>>(stmt.error());
    }
    bind_text(stmt.value().get(), 1, name);
    return fetch_one<role_record>(db_, stmt.value().get(), parse_role_row,
                                  "Failed to look up role");
}

auto sqlite_canonical_store::list_roles() const -> Result<std::vector<role_record>> {
    auto stmt = prepare(
        db_, vigil::compat::format("SELECT {} FROM roles ORDER BY role_pk;", kRoleColumns));
    if (stmt.is_err()) {
        return Result<std::vector<role_record>>(stmt.error());
    }
    std::vector<role_record> results;
    int rc;
    while ((rc = sqlite3_step(stmt.value().get())) == SQLITE_ROW) {
        results.push_back(parse_role_row(stmt.value().get()));
    }
    if (rc != SQLITE_DONE) {
        return Result<std::vector<role_record>>(
            store_failure(db_, rc, "Failed to list roles"));
    }
    return results;
}

auto sqlite_canonical_store::role_count() const -> Result<std::size_t> {
    return count_rows("roles");
}

auto sqlite_canonical_store::ensure_placeholder_role(std::string_view name) -> Result<bool> {
    auto stmt = prepare(db_, R"(
        INSERT INTO roles (name, archive_path, is_placeholder)
        VALUES (?, '', 1)
        ON CONFLICT(name) DO NOTHING;
    )");
    if (stmt.is_err()) {
        return Result<bool>(stmt.error());
    }
    bind_text(stmt.value().get(), 1, name);
    auto done = step_done(db_, stmt.value().get(), "Failed to insert placeholder role");
    if (done.is_err()) {
        return Result<bool>(done.error());
    }
    return sqlite3_changes(db_) > 0;
}

// ============================================================================
// Recovery Checkpoints
// ============================================================================

auto sqlite_canonical_store::load_checkpoint() const
    -> Result<std::vector<checkpoint_entry>> {
    auto stmt = prepare(db_, R"(
        SELECT entity_type, partition_path, completed_at
        FROM recovery_checkpoints
        ORDER BY rowid;
    )");
    if (stmt.is_err()) {
        return Result<std::vector<checkpoint_entry>>(stmt.error());
    }
    std::vector<checkpoint_entry> entries;
    int rc;
    while ((rc = sqlite3_step(stmt.value().get())) == SQLITE_ROW) {
        auto* s = stmt.value().get();
        entries.push_back(checkpoint_entry{get_text(s, 0), get_text(s, 1), get_text(s, 2)});
    }
    if (rc != SQLITE_DONE) {
        return Result<std::vector<checkpoint_entry>>(
            store_failure(db_, rc, "Failed to load recovery checkpoint"));
    }
    return entries;
}

auto sqlite_canonical_store::mark_partition_complete(std::string_view entity_type,
                                                     std::string_view partition_path)
    -> VoidResult {
    auto stmt = prepare(db_, R"(
        INSERT INTO recovery_checkpoints (entity_type, partition_path, completed_at)
        VALUES (?, ?, ?)
        ON CONFLICT(entity_type, partition_path)
        DO UPDATE SET completed_at = excluded.completed_at;
    )");
    if (stmt.is_err()) {
        return VoidResult(stmt.error());
    }
    archive_time now = archive::to_second_time(clock_.now());
    auto* s = stmt.value().get();
    bind_text(s, 1, entity_type);
    bind_text(s, 2, partition_path);
    bind_text(s, 3, archive::format_sql(now));
    return step_done(db_, s, "Failed to record checkpoint");
}

auto sqlite_canonical_store::clear_checkpoint() -> VoidResult {
    return execute("DELETE FROM recovery_checkpoints;");
}

}  // namespace vigil::storage
