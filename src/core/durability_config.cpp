/**
 * @file durability_config.cpp
 * @brief Environment loading and validation of durability_config
 */

#include <vigil/core/durability_config.hpp>

#include <vigil/compat/format.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <optional>

namespace vigil::core {

using kcenon::common::make_error;
using kcenon::common::ok;

namespace {

auto read_env(const char* name) -> std::optional<std::string> {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string{value};
}

auto parse_flag(std::string value) -> bool {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value == "true" || value == "1" || value == "yes" || value == "on";
}

auto parse_count(const std::string& value) -> std::optional<long long> {
    long long parsed = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (ec != std::errc{} || ptr != value.data() + value.size() || parsed < 0) {
        return std::nullopt;
    }
    return parsed;
}

}  // namespace

auto durability_config::from_environment() -> Result<durability_config> {
    durability_config config;

    if (auto root = read_env("TEXT_ARCHIVE_BASE_DIR")) {
        config.archive_root = *root;
    }
    if (auto enabled = read_env("TEXT_ARCHIVE_ENABLED")) {
        config.archiving_enabled = parse_flag(*enabled);
    }
    if (auto lock_path = read_env("MIGRATION_LOCK_PATH")) {
        config.migration_lock_path = *lock_path;
    }
    if (auto auto_migrate = read_env("AUTO_MIGRATE_ON_STARTUP")) {
        config.auto_migrate_on_startup = parse_flag(*auto_migrate);
    }

    if (auto timeout = read_env("VIGIL_LOCK_TIMEOUT_MS")) {
        auto parsed = parse_count(*timeout);
        if (!parsed) {
            return make_error<durability_config>(
                error_codes::invalid_configuration,
                vigil::compat::format("VIGIL_LOCK_TIMEOUT_MS is not a valid duration: {}",
                                      *timeout),
                "config");
        }
        config.lock_timeout = std::chrono::milliseconds{*parsed};
    }

    if (auto threshold = read_env("VIGIL_MAINTENANCE_THRESHOLD_SECONDS")) {
        auto parsed = parse_count(*threshold);
        if (!parsed) {
            return make_error<durability_config>(
                error_codes::invalid_configuration,
                vigil::compat::format(
                    "VIGIL_MAINTENANCE_THRESHOLD_SECONDS is not a valid duration: {}",
                    *threshold),
                "config");
        }
        config.maintenance_threshold = std::chrono::seconds{*parsed};
    }

    auto valid = config.validate();
    if (valid.is_err()) {
        return make_error<durability_config>(valid.error().code,
                                             valid.error().message, "config");
    }
    return config;
}

auto durability_config::validate() const -> VoidResult {
    if (archiving_enabled && archive_root.empty()) {
        return make_error<std::monostate>(error_codes::invalid_configuration,
                                          "Archive root must be set when archiving is enabled",
                                          "config");
    }
    if (migration_lock_path.empty()) {
        return make_error<std::monostate>(error_codes::invalid_configuration,
                                          "Migration lock path must not be empty", "config");
    }
    if (lock_poll_interval.count() <= 0) {
        return make_error<std::monostate>(error_codes::invalid_configuration,
                                          "Lock poll interval must be positive", "config");
    }
    return ok();
}

}  // namespace vigil::core
