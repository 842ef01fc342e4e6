/**
 * @file durability_config_test.cpp
 * @brief Unit tests for durability_config defaults, validation and environment loading
 */

#include <vigil/core/durability_config.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <string>
#include <vector>

using namespace vigil::core;

namespace {

/// Sets environment variables for one scope and unsets them afterwards
class scoped_env {
public:
    void set(const std::string& name, const std::string& value) {
        ::setenv(name.c_str(), value.c_str(), 1);
        names_.push_back(name);
    }

    ~scoped_env() {
        for (const auto& name : names_) {
            ::unsetenv(name.c_str());
        }
    }

private:
    std::vector<std::string> names_;
};

}  // namespace

TEST_CASE("durability_config defaults", "[config]") {
    durability_config config;

    CHECK(config.archive_root == "text_archives");
    CHECK(config.archiving_enabled);
    CHECK(config.migration_lock_path == "migration.lock");
    CHECK(config.lock_timeout == std::chrono::milliseconds{5000});
    CHECK(config.maintenance_threshold == std::chrono::seconds{30});
    CHECK(config.auto_migrate_on_startup);
    CHECK(config.validate().is_ok());
}

TEST_CASE("durability_config validation", "[config]") {
    durability_config config;

    SECTION("Empty archive root is rejected while archiving is on") {
        config.archive_root.clear();
        auto result = config.validate();
        REQUIRE(result.is_err());
        CHECK(result.error().code == vigil::error_codes::invalid_configuration);
    }

    SECTION("Empty archive root is fine when archiving is off") {
        config.archive_root.clear();
        config.archiving_enabled = false;
        CHECK(config.validate().is_ok());
    }

    SECTION("Lock path is required") {
        config.migration_lock_path.clear();
        CHECK(config.validate().is_err());
    }

    SECTION("Poll interval must be positive") {
        config.lock_poll_interval = std::chrono::milliseconds{0};
        CHECK(config.validate().is_err());
    }
}

TEST_CASE("durability_config from environment", "[config][env]") {
    scoped_env env;

    SECTION("Recognized variables override defaults") {
        env.set("TEXT_ARCHIVE_BASE_DIR", "/var/lib/vigil/archives");
        env.set("TEXT_ARCHIVE_ENABLED", "false");
        env.set("MIGRATION_LOCK_PATH", "/run/vigil/migrate.lock");
        env.set("VIGIL_LOCK_TIMEOUT_MS", "250");
        env.set("VIGIL_MAINTENANCE_THRESHOLD_SECONDS", "120");
        env.set("AUTO_MIGRATE_ON_STARTUP", "no");

        auto loaded = durability_config::from_environment();
        REQUIRE(loaded.is_ok());
        const auto& config = loaded.value();
        CHECK(config.archive_root == "/var/lib/vigil/archives");
        CHECK_FALSE(config.archiving_enabled);
        CHECK(config.migration_lock_path == "/run/vigil/migrate.lock");
        CHECK(config.lock_timeout == std::chrono::milliseconds{250});
        CHECK(config.maintenance_threshold == std::chrono::seconds{120});
        CHECK_FALSE(config.auto_migrate_on_startup);
    }

    SECTION("Flags accept common spellings") {
        env.set("TEXT_ARCHIVE_ENABLED", "TRUE");
        auto loaded = durability_config::from_environment();
        REQUIRE(loaded.is_ok());
        CHECK(loaded.value().archiving_enabled);
    }

    SECTION("Malformed durations are configuration errors") {
        env.set("VIGIL_LOCK_TIMEOUT_MS", "soon");
        auto loaded = durability_config::from_environment();
        REQUIRE(loaded.is_err());
        CHECK(loaded.error().code == vigil::error_codes::invalid_configuration);
    }

    SECTION("Negative thresholds are rejected") {
        env.set("VIGIL_MAINTENANCE_THRESHOLD_SECONDS", "-5");
        CHECK(durability_config::from_environment().is_err());
    }
}
