/**
 * @file config_loader.hpp
 * @brief YAML configuration loader for dbmigrate
 *
 * Loads migrator_config from a YAML file. A simple parser is used that
 * supports the subset of YAML needed for configuration files: nested
 * sections by indentation, scalar values, comments and quoted strings.
 */

#pragma once

#include <dbmigrate/config/migrator_config.hpp>
#include <dbmigrate/core/result.hpp>
#include <dbmigrate/storage/sqlite_connection.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace dbmigrate::config {

/**
 * @brief YAML configuration file loader
 *
 * Keys missing from the file keep their default value. Unknown keys are
 * ignored.
 *
 * @example
 * @code
 * auto result = config_loader::load("dbmigrate.yaml");
 * if (result.is_ok()) {
 *     auto config = result.value();
 *     std::cout << "Database: " << config.database.path << "\n";
 * } else {
 *     std::cerr << "Error: " << result.error().message << "\n";
 * }
 * @endcode
 */
class config_loader {
public:
    /**
     * @brief Load configuration from a YAML file
     * @param path Path to the YAML configuration file
     * @return config_file_not_found, config_read_error or config_invalid_value
     *         on failure
     */
    [[nodiscard]] static auto load(const std::filesystem::path& path)
        -> Result<migrator_config>;

    /**
     * @brief Load configuration from a YAML string
     */
    [[nodiscard]] static auto load_from_string(std::string_view yaml_content)
        -> Result<migrator_config>;

    [[nodiscard]] static auto create_default() -> migrator_config;

    /**
     * @brief Validate a configuration
     * @return config_invalid_value describing the first problem found
     */
    [[nodiscard]] static auto validate(const migrator_config& config) -> VoidResult;

    /**
     * @brief Parse a log level name
     *
     * Accepts trace, debug, info, warn (or warning), error, fatal and off,
     * case-insensitively.
     */
    [[nodiscard]] static auto parse_log_level(std::string_view value)
        -> std::optional<integration::log_level>;

    /// Logger settings derived from the logging section
    [[nodiscard]] static auto to_logger_config(const migrator_config& config)
        -> integration::logger_config;

    /// Connection options derived from the database section
    [[nodiscard]] static auto to_sqlite_options(const migrator_config& config)
        -> storage::sqlite_options;

private:
    static auto trim(std::string_view str) -> std::string;
};

}  // namespace dbmigrate::config
