/**
 * @file logger_adapter.hpp
 * @brief Leveled logging through logger_system and the durability audit trail
 *
 * Archive writes, recovery runs and schema changes are also appended to
 * audit.json, one JSON object per line.
 */

#pragma once

#include <vigil/compat/format.hpp>

#include <cstdint>
#include <filesystem>
#include <string>

namespace vigil::integration {

// ─────────────────────────────────────────────────────
// Enumerations
// ─────────────────────────────────────────────────────

/**
 * @enum log_level
 * @brief Log severity levels
 */
enum class log_level {
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5,
    off = 6
};

/**
 * @enum archive_operation
 * @brief Kind of durable archive write
 */
enum class archive_operation {
    append,
    create_or_replace
};

/**
 * @enum recovery_outcome
 * @brief Final state of a recovery run
 */
enum class recovery_outcome {
    completed,
    failed,
    cancelled
};

/**
 * @enum migration_event
 * @brief Schema migration state changes recorded in the audit trail
 */
enum class migration_event {
    applied,
    rolled_back,
    apply_failed,
    completed_after_crash,
    reset_after_crash,
    fail_closed,
    data_migration
};

// ─────────────────────────────────────────────────────
// Configuration
// ─────────────────────────────────────────────────────

/**
 * @struct logger_config
 * @brief Configuration options for the logger adapter
 */
struct logger_config {
    /// Directory for log files
    std::filesystem::path log_directory{"logs"};

    /// Minimum log level to output
    log_level min_level{log_level::info};

    /// Enable console output
    bool enable_console{true};

    /// Enable file output
    bool enable_file{true};

    /// Enable the durability audit trail (audit.json)
    bool enable_audit_log{true};

    /// Maximum log file size in megabytes before rotation
    std::size_t max_file_size_mb{100};

    /// Maximum number of rotated log files to keep
    std::size_t max_files{10};

    /// Use asynchronous logging
    bool async_mode{true};

    /// Buffer size for async logging
    std::size_t buffer_size{8192};
};

// ─────────────────────────────────────────────────────
// Logger Adapter Class
// ─────────────────────────────────────────────────────

/**
 * @class logger_adapter
 * @brief Static logging facade for the durability core
 *
 * Calls made before initialize() are dropped, so library code can log
 * unconditionally and tests need not set up writers.
 *
 * Thread Safety: All methods are thread-safe.
 *
 * @example
 * @code
 * logger_config config;
 * config.log_directory = "/var/log/vigil";
 * logger_adapter::initialize(config);
 *
 * logger_adapter::info("Recovered {} partitions", count);
 * logger_adapter::log_archive_write("user", path, archive_operation::append, true);
 *
 * logger_adapter::shutdown();
 * @endcode
 */
class logger_adapter {
public:
    // ─────────────────────────────────────────────────────
    // Initialization
    // ─────────────────────────────────────────────────────

    /**
     * @brief Start the writers; later calls are ignored until shutdown()
     */
    static void initialize(const logger_config& config);

    /**
     * @brief Flush pending messages and release the logger
     */
    static void shutdown();

    [[nodiscard]] static auto is_initialized() noexcept -> bool;

    // ─────────────────────────────────────────────────────
    // Standard Logging
    // ─────────────────────────────────────────────────────

    template <typename... Args>
    static void debug(vigil::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_level_enabled(log_level::debug)) {
            log(log_level::debug, vigil::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    static void info(vigil::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::info, vigil::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void warn(vigil::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::warn, vigil::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void error(vigil::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::error, vigil::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void fatal(vigil::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::fatal, vigil::compat::format(fmt, std::forward<Args>(args)...));
    }

    /**
     * @brief Log a message at the specified level
     * @param level Log severity level
     * @param message The message to log
     */
    static void log(log_level level, const std::string& message);

    /**
     * @brief Check if a log level is enabled
     * @param level The level to check
     * @return true if the logger is initialized and the level passes the filter
     */
    [[nodiscard]] static auto is_level_enabled(log_level level) noexcept -> bool;

    // ─────────────────────────────────────────────────────
    // Durability Audit Trail
    // ─────────────────────────────────────────────────────

    /**
     * @brief Record a durable archive write
     *
     * Failures are logged at error level since they abort the paired
     * relational write.
     *
     * @param entity_type Name of the archived entity type
     * @param path Resolved archive file
     * @param operation Append or full replacement
     * @param success Whether the write reached disk
     * @param detail Failure description when success is false
     */
    static void log_archive_write(const std::string& entity_type,
                                  const std::filesystem::path& path,
                                  archive_operation operation,
                                  bool success,
                                  const std::string& detail = "");

    /**
     * @brief Record the end of a recovery run
     * @param outcome Final state
     * @param rows_upserted Rows written to the canonical store
     * @param unparsed_lines Lines that could not be parsed
     * @param detail Failure position or cause
     */
    static void log_recovery_finished(recovery_outcome outcome,
                                      std::uint64_t rows_upserted,
                                      std::uint64_t unparsed_lines,
                                      const std::string& detail = "");

    /**
     * @brief Record a schema migration state change
     * @param event What happened
     * @param version_id Schema version identifier
     * @param detail Optional description or error message
     */
    static void log_migration_event(migration_event event,
                                    const std::string& version_id,
                                    const std::string& detail = "");

    // ─────────────────────────────────────────────────────
    // Configuration
    // ─────────────────────────────────────────────────────

    static void set_min_level(log_level level);

    [[nodiscard]] static auto get_min_level() noexcept -> log_level;
};

}  // namespace vigil::integration
