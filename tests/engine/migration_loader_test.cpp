/**
 * @file migration_loader_test.cpp
 * @brief Unit tests for directory discovery of migrations
 */

#include <dbmigrate/engine/migration_loader.hpp>
#include <dbmigrate/engine/migration_runner.hpp>

#include "fixtures/memory_connection.hpp"
#include "mocks/mock_logger.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>

using namespace dbmigrate;
using namespace dbmigrate::engine;

namespace {

class noop_migration final : public migration {
public:
    noop_migration(std::string name, std::string version)
        : migration(std::move(name), std::move(version)) {}

    auto up(storage::database_connection&) -> VoidResult override { return ok(); }
    auto down(storage::database_connection&) -> VoidResult override { return ok(); }
};

class temp_directory {
public:
    temp_directory()
        : path_(std::filesystem::temp_directory_path() /
                ("dbmigrate_loader_test_" +
                 std::to_string(reinterpret_cast<std::uintptr_t>(this)))) {
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }

    ~temp_directory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    temp_directory(const temp_directory&) = delete;
    auto operator=(const temp_directory&) -> temp_directory& = delete;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

    void write(const std::string& file, const std::string& content) const {
        std::ofstream out(path_ / file);
        out << content;
    }

private:
    std::filesystem::path path_;
};

auto source_for(const std::string& class_name) -> std::string {
    return "#include <dbmigrate/engine/migration.hpp>\n"
           "namespace migrations {\n"
           "class " + class_name + " final : public dbmigrate::engine::migration {\n"
           "};\n"
           "}  // namespace migrations\n";
}

}  // namespace

TEST_CASE("declared_type finds the qualified class name", "[engine][loader]") {
    CHECK(migration_loader::declared_type(source_for("CreateUsers")) ==
          "migrations::CreateUsers");

    CHECK(migration_loader::declared_type("class Plain : public migration {};") ==
          "Plain");

    CHECK(migration_loader::declared_type(
              "namespace app { namespace db {\nclass AddIndex final {};\n} }") ==
          "app::db::AddIndex");

    CHECK(migration_loader::declared_type(
              "namespace app::db {\nclass Nested {\n};\n}") == "app::db::Nested");

    CHECK_FALSE(migration_loader::declared_type("int main() { return 0; }").has_value());

    // Namespaces opened after the class do not qualify it
    CHECK(migration_loader::declared_type(
              "class First {};\nnamespace later {\nclass Second {};\n}") == "First");
}

TEST_CASE("migration_loader loads catalogued files in name order",
          "[engine][loader]") {
    temp_directory dir;
    migration_catalog catalog;
    catalog.add<noop_migration>("migrations::CreateUsers");
    catalog.add<noop_migration>("migrations::CreatePosts");

    dir.write("2024_02_01_000000_create_posts.cpp", source_for("CreatePosts"));
    dir.write("2024_01_01_000000_create_users.cpp", source_for("CreateUsers"));
    dir.write("2024_03_01_000000_unknown.cpp", source_for("Unknown"));
    dir.write("2024_04_01_000000_empty.cpp", "// nothing here\n");
    dir.write("README.md", source_for("CreateUsers"));

    auto logger = std::make_shared<dbmigrate::test::mock_logger>();
    migration_loader loader(catalog, logger);

    auto loaded = loader.load(dir.path());
    REQUIRE(loaded.is_ok());
    REQUIRE(loaded.value().size() == 2);

    CHECK(loaded.value()[0]->name() == "2024_01_01_000000_create_users");
    CHECK(loaded.value()[0]->version() == "2024_01_01_000000");
    CHECK(loaded.value()[1]->name() == "2024_02_01_000000_create_posts");

    CHECK(logger->contains(integration::log_level::debug, "not in the catalog"));
    CHECK(logger->contains(integration::log_level::debug, "no class declaration"));
}

TEST_CASE("migration_loader tolerates a missing directory", "[engine][loader]") {
    migration_catalog catalog;
    migration_loader loader(catalog);

    auto missing = loader.load(std::filesystem::temp_directory_path() /
                               "dbmigrate_no_such_directory");
    REQUIRE(missing.is_ok());
    CHECK(missing.value().empty());

    auto empty = loader.load({});
    REQUIRE(empty.is_ok());
    CHECK(empty.value().empty());
}

TEST_CASE("load_migrations registers all files or none", "[engine][loader][error]") {
    temp_directory dir;
    dir.write("2024_01_01_000000_create_widgets.cpp", source_for("CreateWidgets"));
    dir.write("seed_widgets.cpp", source_for("SeedWidgets"));

    migration_catalog catalog;
    catalog.add<noop_migration>("migrations::CreateWidgets");
    catalog.add<noop_migration>("migrations::SeedWidgets");

    migration_runner runner(dbmigrate::test::make_memory_connection());
    auto loaded = runner.load_migrations(dir.path(), catalog);

    REQUIRE(loaded.is_err());
    CHECK(loaded.error().code == error_codes::migration_load_failed);
    CHECK(loaded.error().message.find("seed_widgets") != std::string::npos);
    CHECK(runner.migrations().empty());
    REQUIRE(runner.last_error().has_value());
    CHECK(runner.last_error()->code() == error_codes::migration_load_failed);
}
