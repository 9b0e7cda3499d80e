/**
 * @file config_loader_test.cpp
 * @brief Unit tests for YAML configuration loading
 */

#include <dbmigrate/config/config_loader.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>

using namespace dbmigrate;
using namespace dbmigrate::config;

TEST_CASE("default configuration", "[config]") {
    auto config = config_loader::create_default();

    CHECK(config.database.path == "./dbmigrate.db");
    CHECK(config.database.table_prefix.empty());
    CHECK(config.database.busy_timeout == std::chrono::milliseconds(5000));
    CHECK(config.database.foreign_keys);
    CHECK(config.migrations.path == std::filesystem::path("./migrations"));
    CHECK_FALSE(config.migrations.advisory_lock);
    CHECK(config.logging.level == integration::log_level::info);
    CHECK(config.logging.console);
    CHECK_FALSE(config.logging.file);

    CHECK(config_loader::validate(config).is_ok());
}

TEST_CASE("load_from_string reads every section", "[config]") {
    const char* yaml = R"(
# dbmigrate configuration
database:
  path: "/var/lib/app/app.db"
  table_prefix: app_
  busy_timeout_ms: 250
  foreign_keys: false

migrations:
  path: db/migrations   # relative to the working directory
  advisory_lock: yes

logging:
  level: Warning
  directory: /var/log/app
  console: off
  file: true
  audit: true
)";

    auto loaded = config_loader::load_from_string(yaml);
    REQUIRE(loaded.is_ok());
    const auto& config = loaded.value();

    CHECK(config.database.path == "/var/lib/app/app.db");
    CHECK(config.database.table_prefix == "app_");
    CHECK(config.database.busy_timeout == std::chrono::milliseconds(250));
    CHECK_FALSE(config.database.foreign_keys);
    CHECK(config.migrations.path == std::filesystem::path("db/migrations"));
    CHECK(config.migrations.advisory_lock);
    CHECK(config.logging.level == integration::log_level::warn);
    CHECK(config.logging.directory == std::filesystem::path("/var/log/app"));
    CHECK_FALSE(config.logging.console);
    CHECK(config.logging.file);
    CHECK(config.logging.audit);

    SECTION("derived logger and connection settings") {
        auto logger = config_loader::to_logger_config(config);
        CHECK(logger.min_level == integration::log_level::warn);
        CHECK(logger.enable_file);
        CHECK(logger.enable_audit_log);
        CHECK_FALSE(logger.enable_console);

        auto options = config_loader::to_sqlite_options(config);
        CHECK(options.table_prefix == "app_");
        CHECK(options.busy_timeout == std::chrono::milliseconds(250));
        CHECK_FALSE(options.foreign_keys);
    }
}

TEST_CASE("partial files keep defaults", "[config]") {
    auto loaded = config_loader::load_from_string("database:\n  path: other.db\n");
    REQUIRE(loaded.is_ok());
    CHECK(loaded.value().database.path == "other.db");
    CHECK(loaded.value().migrations.path == std::filesystem::path("./migrations"));
    CHECK(loaded.value().logging.level == integration::log_level::info);
}

TEST_CASE("invalid values are reported", "[config][error]") {
    SECTION("non-numeric timeout") {
        auto loaded = config_loader::load_from_string(
            "database:\n  busy_timeout_ms: soon\n");
        REQUIRE(loaded.is_err());
        CHECK(loaded.error().code == error_codes::config_invalid_value);
        CHECK(loaded.error().module == "config");
        CHECK(loaded.error().message ==
              "Invalid value 'soon' for database.busy_timeout_ms: expected an integer");
    }

    SECTION("non-boolean flag") {
        auto loaded = config_loader::load_from_string(
            "migrations:\n  advisory_lock: maybe\n");
        REQUIRE(loaded.is_err());
        CHECK(loaded.error().code == error_codes::config_invalid_value);
    }

    SECTION("unknown log level") {
        auto loaded = config_loader::load_from_string("logging:\n  level: loud\n");
        REQUIRE(loaded.is_err());
        CHECK(loaded.error().message.find("logging.level") != std::string::npos);
    }

    SECTION("prefix with punctuation") {
        auto loaded = config_loader::load_from_string(
            "database:\n  table_prefix: \"app; DROP\"\n");
        REQUIRE(loaded.is_err());
        CHECK(loaded.error().message.find("Invalid table prefix") != std::string::npos);
    }

    SECTION("negative timeout") {
        auto loaded = config_loader::load_from_string(
            "database:\n  busy_timeout_ms: -1\n");
        REQUIRE(loaded.is_err());
        CHECK(loaded.error().message == "Busy timeout cannot be negative");
    }
}

TEST_CASE("parse_log_level", "[config]") {
    CHECK(config_loader::parse_log_level("trace") == integration::log_level::trace);
    CHECK(config_loader::parse_log_level(" DEBUG ") == integration::log_level::debug);
    CHECK(config_loader::parse_log_level("critical") == integration::log_level::fatal);
    CHECK(config_loader::parse_log_level("off") == integration::log_level::off);
    CHECK_FALSE(config_loader::parse_log_level("verbose").has_value());
}

TEST_CASE("load reads files from disk", "[config]") {
    SECTION("missing file") {
        auto loaded = config_loader::load("/nonexistent/dbmigrate.yaml");
        REQUIRE(loaded.is_err());
        CHECK(loaded.error().code == error_codes::config_file_not_found);
    }

    SECTION("existing file") {
        auto path = std::filesystem::temp_directory_path() / "dbmigrate_config_test.yaml";
        {
            std::ofstream out(path);
            out << "database:\n  path: from_file.db\n";
        }

        auto loaded = config_loader::load(path);
        std::filesystem::remove(path);

        REQUIRE(loaded.is_ok());
        CHECK(loaded.value().database.path == "from_file.db");
    }
}
