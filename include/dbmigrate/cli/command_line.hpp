/**
 * @file command_line.hpp
 * @brief Command line front end of the migration runner
 *
 * Host applications compile their migration classes into the program,
 * register them in a migration_catalog and forward main() here:
 *
 * @code
 * int main(int argc, char* argv[]) {
 *     dbmigrate::engine::migration_catalog catalog;
 *     catalog.add<migrations::CreateUsersTable>("migrations::CreateUsersTable");
 *     return dbmigrate::cli::run_command_line(argc, argv, catalog);
 * }
 * @endcode
 */

#pragma once

#include <dbmigrate/config/migrator_config.hpp>
#include <dbmigrate/core/result.hpp>
#include <dbmigrate/engine/migration_catalog.hpp>

#include <iosfwd>
#include <optional>
#include <string>

namespace dbmigrate::cli {

/// Process exit codes
namespace exit_codes {
constexpr int success = 0;
constexpr int invalid_arguments = 1;
constexpr int migration_error = 2;
}  // namespace exit_codes

enum class command_type {
    migrate,
    rollback,
    revert,
    reset,
    refresh,
    status,
    generate,
    help
};

/**
 * @brief Parsed command line
 *
 * Optional fields override the corresponding configuration value when set.
 */
struct command_options {
    command_type command{command_type::help};

    std::optional<std::string> config_path;
    std::optional<std::string> database_path;
    std::optional<std::string> migrations_path;
    bool verbose{false};

    bool pretend{false};
    int steps{1};

    /// Migration name for revert and generate
    std::string name;

    /// generate --table
    std::optional<std::string> table;

    /// generate --create
    bool create{false};
};

/**
 * @brief Parse arguments (argv[0] excluded from inspection)
 * @return config_invalid_value describing the offending argument
 */
[[nodiscard]] auto parse_arguments(int argc, const char* const argv[])
    -> Result<command_options>;

/**
 * @brief Load the configuration file (or defaults) and apply flag overrides
 */
[[nodiscard]] auto resolve_config(const command_options& options)
    -> Result<config::migrator_config>;

/**
 * @brief Run one command against the configured database
 *
 * Prints progress to @p out and failures to @p err.
 *
 * @return One of exit_codes
 */
auto execute(const command_options& options,
             const config::migrator_config& config,
             const engine::migration_catalog& catalog, std::ostream& out,
             std::ostream& err) -> int;

/**
 * @brief Parse, configure logging and execute
 * @return One of exit_codes
 */
auto run_command_line(int argc, const char* const argv[],
                      const engine::migration_catalog& catalog) -> int;

void print_usage(const char* program_name, std::ostream& out);

}  // namespace dbmigrate::cli
