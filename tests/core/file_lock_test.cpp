/**
 * @file file_lock_test.cpp
 * @brief Unit tests for the flock based file_lock
 */

#include <vigil/core/file_lock.hpp>

#include "../support/test_fixtures.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <thread>

#include <fcntl.h>
#include <unistd.h>

using namespace vigil::core;
using vigil::test::temp_directory;

namespace {

const lock_options kQuickTimeout{std::chrono::milliseconds{50}, std::chrono::milliseconds{5}};

}  // namespace

TEST_CASE("file_lock acquisition and release", "[file_lock]") {
    temp_directory dir{"vigil_lock"};
    auto lock_path = dir.path() / "nested" / "test.lock";

    SECTION("Lock file and parent directories are created") {
        auto lock = file_lock::acquire(lock_path, kQuickTimeout);
        REQUIRE(lock.is_ok());
        CHECK(lock.value().held());
        CHECK(std::filesystem::exists(lock_path));
    }

    SECTION("A second holder times out while the first is held") {
        auto first = file_lock::acquire(lock_path, kQuickTimeout);
        REQUIRE(first.is_ok());

        auto started = std::chrono::steady_clock::now();
        auto second = file_lock::acquire(lock_path, kQuickTimeout);
        auto waited = std::chrono::steady_clock::now() - started;

        REQUIRE(second.is_err());
        CHECK(second.error().code == vigil::error_codes::lock_timeout_error);
        CHECK(waited >= std::chrono::milliseconds{50});
    }

    SECTION("Release lets the next holder in") {
        auto first = file_lock::acquire(lock_path, kQuickTimeout);
        REQUIRE(first.is_ok());
        first.value().release();
        CHECK_FALSE(first.value().held());

        auto second = file_lock::acquire(lock_path, kQuickTimeout);
        CHECK(second.is_ok());
    }

    SECTION("A waiter succeeds once the holder lets go") {
        auto first = file_lock::acquire(lock_path, kQuickTimeout);
        REQUIRE(first.is_ok());

        std::thread releaser([&] {
            std::this_thread::sleep_for(std::chrono::milliseconds{30});
            first.value().release();
        });

        auto second = file_lock::acquire(
            lock_path, lock_options{std::chrono::milliseconds{2000},
                                    std::chrono::milliseconds{5}});
        releaser.join();
        CHECK(second.is_ok());
    }
}

TEST_CASE("file_lock on a caller-owned descriptor", "[file_lock]") {
    temp_directory dir{"vigil_lock_fd"};
    auto path = dir.path() / "data.txt";

    int fd = ::open(path.c_str(), O_RDWR | O_CREAT, 0644);
    REQUIRE(fd >= 0);

    {
        auto lock = file_lock::acquire(fd, kQuickTimeout);
        REQUIRE(lock.is_ok());
        CHECK(lock.value().fd() == fd);

        // Moving transfers the lock without releasing it
        file_lock moved = std::move(lock.value());
        CHECK(moved.held());
        CHECK_FALSE(lock.value().held());

        auto contender = file_lock::acquire(path, kQuickTimeout);
        CHECK(contender.is_err());
    }

    // The descriptor stays open after the lock goes away
    CHECK(::write(fd, "x", 1) == 1);
    ::close(fd);
}
