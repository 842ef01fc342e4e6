/**
 * @file durability_config.hpp
 * @brief Explicit configuration for archive, recovery and migration components
 *
 * The configuration is constructed once at process start (usually through
 * from_environment()) and passed by reference to every component.
 */

#pragma once

#include <vigil/core/result.hpp>

#include <chrono>
#include <filesystem>
#include <string>

namespace vigil::core {

/**
 * @struct durability_config
 * @brief Settings shared by the archive writer, reader and migration manager
 */
struct durability_config {
    /// Root directory of the text archive tree
    std::filesystem::path archive_root{"text_archives"};

    /// When false every archive write is a no-op returning an empty path
    bool archiving_enabled{true};

    /// Lock file guarding schema migrations
    std::filesystem::path migration_lock_path{"migration.lock"};

    /// Upper bound on any advisory lock acquisition
    std::chrono::milliseconds lock_timeout{5000};

    /// Interval between non-blocking lock attempts
    std::chrono::milliseconds lock_poll_interval{10};

    /// Estimated migration duration above which maintenance mode is required
    std::chrono::seconds maintenance_threshold{30};

    /// Apply pending migrations from migration_manager::startup()
    bool auto_migrate_on_startup{true};

    /**
     * @brief Build a configuration from the process environment
     *
     * Reads TEXT_ARCHIVE_BASE_DIR, TEXT_ARCHIVE_ENABLED, MIGRATION_LOCK_PATH,
     * VIGIL_LOCK_TIMEOUT_MS, VIGIL_MAINTENANCE_THRESHOLD_SECONDS and
     * AUTO_MIGRATE_ON_STARTUP. Unset variables keep their defaults.
     *
     * @return The configuration, or invalid_configuration for malformed values
     */
    [[nodiscard]] static auto from_environment() -> Result<durability_config>;

    /**
     * @brief Check the settings for internal consistency
     */
    [[nodiscard]] auto validate() const -> VoidResult;
};

}  // namespace vigil::core
