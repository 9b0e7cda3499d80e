/**
 * @file logger_adapter_test.cpp
 * @brief Unit tests for logger_adapter and the migration audit trail
 */

#include <dbmigrate/integration/logger_adapter.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace dbmigrate::integration;

// =============================================================================
// Test Helpers
// =============================================================================

namespace {

auto create_temp_log_directory() -> std::filesystem::path {
    auto temp_dir = std::filesystem::temp_directory_path() / "dbmigrate_logger_test";
    std::filesystem::remove_all(temp_dir);
    std::filesystem::create_directories(temp_dir);
    return temp_dir;
}

auto read_file_contents(const std::filesystem::path& path) -> std::string {
    std::ifstream file(path);
    if (!file) {
        return "";
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

/**
 * @brief RAII wrapper for logger initialization/shutdown
 */
class logger_test_fixture {
public:
    explicit logger_test_fixture(const logger_config& config)
        : log_dir_(config.log_directory) {
        logger_adapter::initialize(config);
    }

    ~logger_test_fixture() {
        logger_adapter::shutdown();
        std::error_code ec;
        std::filesystem::remove_all(log_dir_, ec);
    }

    logger_test_fixture(const logger_test_fixture&) = delete;
    logger_test_fixture& operator=(const logger_test_fixture&) = delete;

private:
    std::filesystem::path log_dir_;
};

auto audit_config() -> logger_config {
    logger_config config;
    config.log_directory = create_temp_log_directory();
    config.enable_console = false;
    config.enable_audit_log = true;
    return config;
}

}  // namespace

// =============================================================================
// Initialization Tests
// =============================================================================

TEST_CASE("logger_adapter initialization and shutdown", "[logger_adapter][init]") {
    SECTION("Basic initialization") {
        logger_test_fixture fixture(audit_config());
        REQUIRE(logger_adapter::is_initialized());
        CHECK(logger_adapter::audit_log_path().filename() == "migrations_audit.json");
    }

    SECTION("Multiple initialization calls are safe") {
        auto config = audit_config();
        logger_test_fixture fixture(config);
        logger_adapter::initialize(config);
        REQUIRE(logger_adapter::is_initialized());
    }

    SECTION("Shutdown without initialization is safe") {
        logger_adapter::shutdown();
        REQUIRE_FALSE(logger_adapter::is_initialized());
    }

    REQUIRE_FALSE(logger_adapter::is_initialized());
}

// =============================================================================
// Level Tests
// =============================================================================

TEST_CASE("logger_adapter level filtering", "[logger_adapter][level]") {
    auto config = audit_config();
    config.min_level = log_level::warn;
    logger_test_fixture fixture(config);

    CHECK(logger_adapter::get_min_level() == log_level::warn);
    CHECK_FALSE(logger_adapter::is_level_enabled(log_level::info));
    CHECK(logger_adapter::is_level_enabled(log_level::error));

    logger_adapter::set_min_level(log_level::debug);
    CHECK(logger_adapter::is_level_enabled(log_level::debug));

    CHECK(logger_adapter::log_level_to_string(log_level::warn) == "WARN");
    CHECK(logger_adapter::log_level_to_string(log_level::off) == "OFF");

    logger_adapter::set_min_level(log_level::info);
}

// =============================================================================
// Audit Trail Tests
// =============================================================================

TEST_CASE("migration audit events are appended as JSON lines", "[logger_adapter][audit]") {
    logger_test_fixture fixture(audit_config());
    const auto path = logger_adapter::audit_log_path();

    logger_adapter::log_migration_applied("2024_01_01_000000_create_users", 1);
    logger_adapter::log_migration_rolled_back("2024_01_01_000000_create_users");
    logger_adapter::log_migration_failed("2024_01_02_000000_add_\"quoted\"", "up",
                                         "no such table: users");

    const auto content = read_file_contents(path);
    std::istringstream lines(content);
    std::string applied;
    std::string rolled_back;
    std::string failed;
    REQUIRE(static_cast<bool>(std::getline(lines, applied)));
    REQUIRE(static_cast<bool>(std::getline(lines, rolled_back)));
    REQUIRE(static_cast<bool>(std::getline(lines, failed)));

    CHECK(applied.front() == '{');
    CHECK(applied.back() == '}');
    CHECK(applied.find("\"event_type\":\"MIGRATION_APPLIED\"") != std::string::npos);
    CHECK(applied.find("\"outcome\":\"success\"") != std::string::npos);
    CHECK(applied.find("\"batch\":\"1\"") != std::string::npos);
    CHECK(applied.find("\"timestamp\":\"") != std::string::npos);

    CHECK(rolled_back.find("MIGRATION_ROLLED_BACK") != std::string::npos);

    CHECK(failed.find("\"outcome\":\"failure\"") != std::string::npos);
    CHECK(failed.find("\"operation\":\"up\"") != std::string::npos);
    CHECK(failed.find("add_\\\"quoted\\\"") != std::string::npos);
}

TEST_CASE("audit events are dropped when the trail is disabled",
          "[logger_adapter][audit]") {
    auto config = audit_config();
    config.enable_audit_log = false;
    const auto directory = config.log_directory;
    logger_test_fixture fixture(config);

    logger_adapter::log_migration_applied("2024_01_01_000000_create_users", 1);

    CHECK(logger_adapter::audit_log_path().empty());
    CHECK_FALSE(std::filesystem::exists(directory / "migrations_audit.json"));
}
