/**
 * @file migration_loader.hpp
 * @brief Directory discovery of migrations through a catalog
 */

#pragma once

#include <dbmigrate/core/result.hpp>
#include <dbmigrate/di/ilogger.hpp>
#include <dbmigrate/engine/migration.hpp>
#include <dbmigrate/engine/migration_catalog.hpp>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dbmigrate::engine {

/**
 * @brief Turns a directory of migration sources into migration instances
 *
 * Every "*.cpp" file in the directory (not recursive), in file name order,
 * is scanned for its namespace and first class declaration. The resulting
 * type name is looked up in the catalog; the file stem becomes the
 * migration name and its timestamp prefix the version. Files that declare
 * no class or an uncatalogued type are skipped.
 */
class migration_loader {
public:
    explicit migration_loader(const migration_catalog& catalog,
                              std::shared_ptr<di::ILogger> logger = nullptr);

    /**
     * @brief Load the migrations found under a directory
     *
     * @param directory Directory to scan; empty or missing loads nothing
     * @return Created migrations, or load_failed if the directory or a file
     *         cannot be read
     */
    [[nodiscard]] auto load(const std::filesystem::path& directory) const
        -> Result<std::vector<std::shared_ptr<migration>>>;

    /**
     * @brief Fully qualified type name declared by a migration source
     *
     * @param source File contents
     * @return "ns::Type", "Type" without namespace, or std::nullopt when no
     *         class is declared
     */
    [[nodiscard]] static auto declared_type(std::string_view source)
        -> std::optional<std::string>;

private:
    const migration_catalog& catalog_;
    std::shared_ptr<di::ILogger> logger_;
};

}  // namespace dbmigrate::engine
