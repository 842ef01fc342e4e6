/**
 * @file logger_adapter.cpp
 * @brief logger_system writers plus the JSON-lines durability audit trail
 */

#include <vigil/integration/logger_adapter.hpp>

#include <vigil/compat/time.hpp>

#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/interfaces/logger_types.h>
#include <kcenon/logger/writers/console_writer.h>
#include <kcenon/logger/writers/rotating_file_writer.h>

#include <atomic>
#include <chrono>
#include <fstream>
#include <mutex>
#include <utility>
#include <vector>

namespace vigil::integration {

namespace {

using audit_fields = std::vector<std::pair<std::string, std::string>>;

auto to_logger_level(log_level level) -> kcenon::logger::log_level {
    switch (level) {
        case log_level::debug:
            return kcenon::logger::log_level::debug;
        case log_level::info:
            return kcenon::logger::log_level::info;
        case log_level::warn:
            return kcenon::logger::log_level::warn;
        case log_level::error:
            return kcenon::logger::log_level::error;
        case log_level::fatal:
            return kcenon::logger::log_level::fatal;
        case log_level::off:
            break;
    }
    return kcenon::logger::log_level::off;
}

auto to_string(archive_operation op) -> std::string_view {
    return op == archive_operation::append ? "append" : "create_or_replace";
}

auto to_string(recovery_outcome outcome) -> std::string_view {
    switch (outcome) {
        case recovery_outcome::completed:
            return "completed";
        case recovery_outcome::failed:
            return "failed";
        case recovery_outcome::cancelled:
            return "cancelled";
    }
    return "unknown";
}

auto to_string(migration_event event) -> std::string_view {
    switch (event) {
        case migration_event::applied:
            return "APPLIED";
        case migration_event::rolled_back:
            return "ROLLED_BACK";
        case migration_event::apply_failed:
            return "APPLY_FAILED";
        case migration_event::completed_after_crash:
            return "COMPLETED_AFTER_CRASH";
        case migration_event::reset_after_crash:
            return "RESET_AFTER_CRASH";
        case migration_event::fail_closed:
            return "FAIL_CLOSED";
        case migration_event::data_migration:
            return "DATA_MIGRATION";
    }
    return "UNKNOWN";
}

auto json_string(std::string_view value) -> std::string {
    std::string out{"\""};
    for (char c : value) {
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += vigil::compat::format("\\u{:04x}", static_cast<int>(c));
                } else {
                    out += c;
                }
        }
    }
    out += '"';
    return out;
}

/// UTC with milliseconds, the same clock the archive stamps use
auto audit_timestamp() -> std::string {
    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()).count() % 1000;
    std::tm utc{};
    vigil::compat::gmtime_safe(&seconds, &utc);
    return vigil::compat::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
                                 utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                                 utc.tm_hour, utc.tm_min, utc.tm_sec, millis);
}

/**
 * @brief Process-wide logging state behind the static facade
 */
struct logging_state {
    std::mutex mutex;
    std::mutex audit_mutex;
    std::atomic<bool> initialized{false};
    std::atomic<log_level> min_level{log_level::info};
    logger_config config;
    std::unique_ptr<kcenon::logger::logger> logger;
    std::filesystem::path audit_path;
};

auto state() -> logging_state& {
    static logging_state instance;
    return instance;
}

void write_audit(std::string_view event_type, std::string_view outcome,
                 const audit_fields& fields) {
    auto& s = state();
    if (!s.initialized.load() || s.audit_path.empty()) {
        return;
    }

    auto line = vigil::compat::format("{{\"timestamp\":{},\"event_type\":{},\"outcome\":{}",
                                      json_string(audit_timestamp()), json_string(event_type),
                                      json_string(outcome));
    for (const auto& [key, value] : fields) {
        line += vigil::compat::format(",{}:{}", json_string(key), json_string(value));
    }
    line += "}\n";

    std::lock_guard lock(s.audit_mutex);
    std::ofstream file(s.audit_path, std::ios::app);
    if (file) {
        file << line;
    }
}

}  // namespace

// =============================================================================
// Lifecycle
// =============================================================================

void logger_adapter::initialize(const logger_config& config) {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    if (s.initialized.load()) {
        return;
    }

    s.config = config;
    s.min_level.store(config.min_level);

    bool need_directory = config.enable_file || config.enable_audit_log;
    std::error_code ec;
    if (need_directory) {
        std::filesystem::create_directories(config.log_directory, ec);
    }
    // Without a directory only the console writer can work
    bool files_usable = need_directory && !ec;

    s.logger = std::make_unique<kcenon::logger::logger>(config.async_mode, config.buffer_size);
    s.logger->set_min_level(to_logger_level(config.min_level));
    if (config.enable_console) {
        s.logger->add_writer(std::make_unique<kcenon::logger::console_writer>());
    }
    if (config.enable_file && files_usable) {
        s.logger->add_writer(std::make_unique<kcenon::logger::rotating_file_writer>(
            (config.log_directory / "vigil.log").string(),
            config.max_file_size_mb * 1024 * 1024, config.max_files));
    }
    s.logger->start();

    s.audit_path = config.enable_audit_log && files_usable
                       ? config.log_directory / "audit.json"
                       : std::filesystem::path{};
    s.initialized.store(true);
}

void logger_adapter::shutdown() {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    if (!s.initialized.load()) {
        return;
    }
    s.initialized.store(false);
    if (s.logger) {
        s.logger->flush();
        s.logger->stop();
        s.logger.reset();
    }
    s.audit_path.clear();
}

auto logger_adapter::is_initialized() noexcept -> bool {
    return state().initialized.load();
}

// =============================================================================
// Leveled Logging
// =============================================================================

void logger_adapter::log(log_level level, const std::string& message) {
    auto& s = state();
    if (!is_level_enabled(level)) {
        return;
    }
    std::lock_guard lock(s.mutex);
    if (s.logger) {
        s.logger->log(to_logger_level(level), message);
    }
}

auto logger_adapter::is_level_enabled(log_level level) noexcept -> bool {
    auto& s = state();
    return s.initialized.load() &&
           static_cast<int>(level) >= static_cast<int>(s.min_level.load());
}

void logger_adapter::set_min_level(log_level level) {
    auto& s = state();
    s.min_level.store(level);
    std::lock_guard lock(s.mutex);
    if (s.logger) {
        s.logger->set_min_level(to_logger_level(level));
    }
}

auto logger_adapter::get_min_level() noexcept -> log_level {
    return state().min_level.load();
}

// =============================================================================
// Durability Audit Trail
// =============================================================================

void logger_adapter::log_archive_write(const std::string& entity_type,
                                       const std::filesystem::path& path,
                                       archive_operation operation, bool success,
                                       const std::string& detail) {
    auto op = to_string(operation);
    if (success) {
        debug("Archive {} ({}): {}", op, entity_type, path.string());
    } else {
        error("Archive {} failed ({}): {} - {}", op, entity_type, path.string(), detail);
    }

    audit_fields fields{{"entity_type", entity_type},
                        {"operation", std::string{op}},
                        {"path", path.string()}};
    if (!detail.empty()) {
        fields.emplace_back("detail", detail);
    }
    write_audit("ARCHIVE_WRITE", success ? "success" : "failure", fields);
}

void logger_adapter::log_recovery_finished(recovery_outcome outcome,
                                           std::uint64_t rows_upserted,
                                           std::uint64_t unparsed_lines,
                                           const std::string& detail) {
    if (outcome == recovery_outcome::completed) {
        info("Recovery completed: rows={} unparsed={}", rows_upserted, unparsed_lines);
    } else {
        warn("Recovery {}: rows={} unparsed={} {}", to_string(outcome), rows_upserted,
             unparsed_lines, detail);
    }

    audit_fields fields{{"rows_upserted", std::to_string(rows_upserted)},
                        {"unparsed_lines", std::to_string(unparsed_lines)}};
    if (!detail.empty()) {
        fields.emplace_back("detail", detail);
    }
    write_audit("RECOVERY", to_string(outcome), fields);
}

void logger_adapter::log_migration_event(migration_event event, const std::string& version_id,
                                         const std::string& detail) {
    auto name = to_string(event);
    bool failed = event == migration_event::apply_failed || event == migration_event::fail_closed;
    if (event == migration_event::fail_closed) {
        fatal("Migration {}: {} {}", name, version_id, detail);
    } else if (failed) {
        warn("Migration {}: {} {}", name, version_id, detail);
    } else {
        info("Migration {}: {} {}", name, version_id, detail);
    }

    audit_fields fields{{"version_id", version_id}};
    if (!detail.empty()) {
        fields.emplace_back("detail", detail);
    }
    write_audit(vigil::compat::format("MIGRATION_{}", name), failed ? "failure" : "success",
                fields);
}

}  // namespace vigil::integration
