/**
 * @file command_line_test.cpp
 * @brief Tests for argument parsing and command execution
 */

#include <dbmigrate/cli/command_line.hpp>
#include <dbmigrate/config/config_loader.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

using namespace dbmigrate;
using namespace dbmigrate::cli;

namespace {

auto parse(std::vector<const char*> args) -> Result<command_options> {
    args.insert(args.begin(), "dbmigrate");
    return parse_arguments(static_cast<int>(args.size()), args.data());
}

class create_widgets final : public engine::migration {
public:
    create_widgets(std::string name, std::string version)
        : migration(std::move(name), std::move(version)) {}

    auto up(storage::database_connection& db) -> VoidResult override {
        return db.schema().create_table("widgets", "id INTEGER PRIMARY KEY");
    }
    auto down(storage::database_connection& db) -> VoidResult override {
        return db.schema().drop_table("widgets");
    }
};

class create_gadgets final : public engine::migration {
public:
    create_gadgets(std::string name, std::string version)
        : migration(std::move(name), std::move(version)) {}

    auto up(storage::database_connection& db) -> VoidResult override {
        return db.schema().create_table("gadgets", "id INTEGER PRIMARY KEY");
    }
    auto down(storage::database_connection& db) -> VoidResult override {
        return db.schema().drop_table("gadgets");
    }
};

/// Temporary project directory with a database file and two migrations
class cli_project {
public:
    cli_project()
        : root_(std::filesystem::temp_directory_path() / "dbmigrate_cli_test") {
        std::filesystem::remove_all(root_);
        std::filesystem::create_directories(root_ / "migrations");

        write_source("2024_01_01_000000_create_widgets.cpp", "CreateWidgets");
        write_source("2024_01_02_000000_create_gadgets.cpp", "CreateGadgets");

        catalog_.add<create_widgets>("migrations::CreateWidgets");
        catalog_.add<create_gadgets>("migrations::CreateGadgets");

        config_ = config::config_loader::create_default();
        config_.database.path = (root_ / "app.db").string();
        config_.migrations.path = root_ / "migrations";
        config_.logging.console = false;
    }

    ~cli_project() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    cli_project(const cli_project&) = delete;
    auto operator=(const cli_project&) -> cli_project& = delete;

    /// Run a command line; returns the exit code
    auto run(std::vector<const char*> args) -> int {
        out.str({});
        err.str({});
        auto options = parse(std::move(args));
        REQUIRE(options.is_ok());
        return execute(options.value(), config_, catalog_, out, err);
    }

    std::ostringstream out;
    std::ostringstream err;

private:
    void write_source(const std::string& file, const std::string& class_name) {
        std::ofstream source(root_ / "migrations" / file);
        source << "namespace migrations {\n"
               << "class " << class_name
               << " final : public dbmigrate::engine::migration {};\n"
               << "}\n";
    }

    std::filesystem::path root_;
    engine::migration_catalog catalog_;
    config::migrator_config config_;
};

}  // namespace

// ============================================================================
// Argument Parsing
// ============================================================================

TEST_CASE("parse_arguments recognises commands and options", "[cli]") {
    SECTION("global options before the command") {
        auto parsed = parse({"--database", "app.db", "--path=db/migrations", "-v",
                             "migrate", "--pretend"});
        REQUIRE(parsed.is_ok());
        CHECK(parsed.value().command == command_type::migrate);
        CHECK(parsed.value().database_path == "app.db");
        CHECK(parsed.value().migrations_path == "db/migrations");
        CHECK(parsed.value().verbose);
        CHECK(parsed.value().pretend);
    }

    SECTION("rollback steps") {
        auto parsed = parse({"rollback", "--steps=3"});
        REQUIRE(parsed.is_ok());
        CHECK(parsed.value().command == command_type::rollback);
        CHECK(parsed.value().steps == 3);
    }

    SECTION("generate with table") {
        auto parsed = parse({"make", "create_users", "--table", "users", "--create"});
        REQUIRE(parsed.is_ok());
        CHECK(parsed.value().command == command_type::generate);
        CHECK(parsed.value().name == "create_users");
        CHECK(parsed.value().table == "users");
        CHECK(parsed.value().create);
    }

    SECTION("help") {
        auto parsed = parse({"--help"});
        REQUIRE(parsed.is_ok());
        CHECK(parsed.value().command == command_type::help);
    }
}

TEST_CASE("parse_arguments rejects bad input", "[cli][error]") {
    auto message_of = [](std::vector<const char*> args) {
        auto parsed = parse(std::move(args));
        REQUIRE(parsed.is_err());
        CHECK(parsed.error().module == "cli");
        return parsed.error().message;
    };

    CHECK(message_of({}) == "No command given");
    CHECK(message_of({"explode"}) == "Unknown command 'explode'");
    CHECK(message_of({"migrate", "--force"}) == "Unknown option '--force'");
    CHECK(message_of({"revert"}) == "Missing migration name");
    CHECK(message_of({"migrate", "extra"}) == "Unexpected argument 'extra'");
    CHECK(message_of({"rollback", "--steps=0"}).find("positive integer") !=
          std::string::npos);
    CHECK(message_of({"rollback", "--steps"}).find("requires a value") !=
          std::string::npos);
}

TEST_CASE("resolve_config applies command line overrides", "[cli]") {
    command_options options;
    options.command = command_type::status;
    options.database_path = "override.db";
    options.migrations_path = "elsewhere";
    options.verbose = true;

    auto config = resolve_config(options);
    REQUIRE(config.is_ok());
    CHECK(config.value().database.path == "override.db");
    CHECK(config.value().migrations.path == std::filesystem::path("elsewhere"));
    CHECK(config.value().logging.level == integration::log_level::debug);

    SECTION("missing configuration file") {
        options.config_path = "/nonexistent/dbmigrate.yaml";
        auto missing = resolve_config(options);
        REQUIRE(missing.is_err());
        CHECK(missing.error().code == error_codes::config_file_not_found);
    }
}

// ============================================================================
// Execution
// ============================================================================

TEST_CASE("execute drives the runner end to end", "[cli][integration]") {
    cli_project project;

    SECTION("status before migrating") {
        CHECK(project.run({"status"}) == exit_codes::success);
        CHECK(project.out.str().find("No    -      2024_01_01_000000_create_widgets") !=
              std::string::npos);
    }

    SECTION("pretend, migrate, rollback") {
        CHECK(project.run({"migrate", "--pretend"}) == exit_codes::success);
        CHECK(project.out.str() ==
              "Would migrate: 2024_01_01_000000_create_widgets\n"
              "Would migrate: 2024_01_02_000000_create_gadgets\n");

        CHECK(project.run({"migrate"}) == exit_codes::success);
        CHECK(project.out.str() ==
              "Migrated: 2024_01_01_000000_create_widgets\n"
              "Migrated: 2024_01_02_000000_create_gadgets\n");

        CHECK(project.run({"migrate"}) == exit_codes::success);
        CHECK(project.out.str() == "Nothing to migrate.\n");

        CHECK(project.run({"status"}) == exit_codes::success);
        CHECK(project.out.str().find("Yes   1      2024_01_02_000000_create_gadgets") !=
              std::string::npos);

        CHECK(project.run({"rollback"}) == exit_codes::success);
        CHECK(project.out.str() ==
              "Rolled back: 2024_01_02_000000_create_gadgets\n"
              "Rolled back: 2024_01_01_000000_create_widgets\n");

        CHECK(project.run({"reset"}) == exit_codes::success);
        CHECK(project.out.str() == "Nothing to reset.\n");
    }

    SECTION("revert errors are reported on stderr") {
        CHECK(project.run({"revert", "2024_01_01_000000_create_widgets"}) ==
              exit_codes::migration_error);
        CHECK(project.out.str().empty());
        CHECK(project.err.str().find("Error: ") == 0);
        CHECK(project.err.str().find("  Migration: 2024_01_01_000000_create_widgets") !=
              std::string::npos);
    }

    SECTION("generate writes into the migrations directory") {
        CHECK(project.run({"generate", "add_owner", "--table=owners"}) ==
              exit_codes::success);
        CHECK(project.out.str().find("Created migration: ") == 0);
        CHECK(project.out.str().find("_add_owner.cpp") != std::string::npos);
    }

    SECTION("help prints usage") {
        CHECK(project.run({"help"}) == exit_codes::success);
        CHECK(project.out.str().find("Usage: dbmigrate") != std::string::npos);
    }
}
