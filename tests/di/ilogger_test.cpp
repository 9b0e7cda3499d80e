/**
 * @file ilogger_test.cpp
 * @brief Unit tests for the ILogger interface and its implementations
 */

#include <dbmigrate/di/ilogger.hpp>
#include <dbmigrate/engine/migration_runner.hpp>
#include <dbmigrate/storage/sqlite_connection.hpp>

#include "mocks/mock_logger.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace dbmigrate;
using namespace dbmigrate::di;
using dbmigrate::test::mock_logger;

// =============================================================================
// NullLogger
// =============================================================================

TEST_CASE("NullLogger discards everything", "[di][ilogger]") {
    NullLogger logger;

    logger.trace("trace");
    logger.info("info");
    logger.error("error");
    logger.info_fmt("formatted {}", 42);

    for (auto level : {integration::log_level::trace, integration::log_level::info,
                       integration::log_level::fatal}) {
        CHECK_FALSE(logger.is_enabled(level));
    }
}

TEST_CASE("null_logger returns a shared instance", "[di][ilogger]") {
    auto first = null_logger();
    auto second = null_logger();
    REQUIRE(first != nullptr);
    CHECK(first == second);
}

// =============================================================================
// Formatted Logging
// =============================================================================

TEST_CASE("formatted helpers respect the enabled level", "[di][ilogger]") {
    mock_logger logger;

    logger.info_fmt("Ran: {}", "2024_01_01_000000_create_users");
    logger.error_fmt("{} failed with {}", "migrate", -960);
    CHECK(logger.contains(integration::log_level::info,
                          "Ran: 2024_01_01_000000_create_users"));
    CHECK(logger.contains(integration::log_level::error, "migrate failed with -960"));

    logger.clear();
    logger.set_enabled_level(integration::log_level::warn);
    logger.debug_fmt("hidden {}", 1);
    logger.info_fmt("hidden {}", 2);
    logger.warn_fmt("shown {}", 3);

    auto entries = logger.entries();
    REQUIRE(entries.size() == 1);
    CHECK(entries[0].level == integration::log_level::warn);
    CHECK(entries[0].message == "shown 3");
}

// =============================================================================
// LoggerService
// =============================================================================

TEST_CASE("LoggerService follows the adapter level", "[di][ilogger]") {
    LoggerService service;

    const auto previous = integration::logger_adapter::get_min_level();
    integration::logger_adapter::set_min_level(integration::log_level::error);

    CHECK_FALSE(service.is_enabled(integration::log_level::info));
    CHECK(service.is_enabled(integration::log_level::error));

    // Forwarding to an uninitialized adapter is a no-op
    service.error("not initialized");

    integration::logger_adapter::set_min_level(previous);
}

// =============================================================================
// Injection
// =============================================================================

TEST_CASE("components log through the injected logger", "[di][ilogger]") {
    auto logger = std::make_shared<mock_logger>();
    auto db = std::make_shared<storage::sqlite_connection>(
        ":memory:", storage::sqlite_options{}, logger);
    REQUIRE(db->connect().is_ok());

    engine::migration_runner runner(db, {}, logger);
    REQUIRE(runner.register_migration(std::make_shared<engine::callback_migration>(
                    "2024_01_01_000000_noop", nullptr, nullptr))
                .is_ok());
    REQUIRE(runner.migrate().is_ok());

    CHECK(logger->contains(integration::log_level::info,
                           "Ran: 2024_01_01_000000_noop"));
    CHECK_FALSE(logger->messages(integration::log_level::trace).empty());
}
