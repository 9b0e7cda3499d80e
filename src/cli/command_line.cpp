/**
 * @file command_line.cpp
 * @brief Implementation of the dbmigrate command line
 */

#include <dbmigrate/cli/command_line.hpp>

#include <dbmigrate/compat/format.hpp>
#include <dbmigrate/config/config_loader.hpp>
#include <dbmigrate/di/ilogger.hpp>
#include <dbmigrate/engine/migration_runner.hpp>
#include <dbmigrate/errors/migration_error.hpp>
#include <dbmigrate/integration/logger_adapter.hpp>
#include <dbmigrate/storage/sqlite_connection.hpp>

#include <charconv>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string_view>
#include <vector>

namespace dbmigrate::cli {

namespace {

auto usage_error(const std::string& message) -> error_info {
    return error_info{error_codes::config_invalid_value, message, "cli"};
}

auto parse_command(std::string_view cmd) -> std::optional<command_type> {
    if (cmd == "migrate") return command_type::migrate;
    if (cmd == "rollback") return command_type::rollback;
    if (cmd == "revert") return command_type::revert;
    if (cmd == "reset") return command_type::reset;
    if (cmd == "refresh") return command_type::refresh;
    if (cmd == "status") return command_type::status;
    if (cmd == "generate" || cmd == "make") return command_type::generate;
    if (cmd == "help") return command_type::help;
    return std::nullopt;
}

/**
 * @brief Match "--name=value" or "--name value"
 *
 * Advances @p index past a separate value argument.
 */
auto option_value(std::string_view arg, std::string_view name, int& index,
                  int argc, const char* const argv[])
    -> std::optional<Result<std::string>> {
    if (arg == name) {
        if (index + 1 >= argc) {
            return Result<std::string>(
                usage_error(compat::format("Option {} requires a value", name)));
        }
        return ok(std::string(argv[++index]));
    }
    if (arg.size() > name.size() && arg.substr(0, name.size()) == name &&
        arg[name.size()] == '=') {
        return ok(std::string(arg.substr(name.size() + 1)));
    }
    return std::nullopt;
}

auto parse_steps(const std::string& value) -> Result<int> {
    int steps = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), steps);
    if (ec != std::errc() || ptr != value.data() + value.size() || steps < 1) {
        return usage_error("--steps expects a positive integer, got '" + value + "'");
    }
    return ok(steps);
}

/**
 * @brief Print a failed operation with its migration and retry hint
 */
void report_failure(const engine::migration_runner& runner,
                    const error_info& error, std::ostream& err) {
    err << "Error: " << error.message << "\n";

    const auto& typed = runner.last_error();
    if (typed && typed->migration_name()) {
        err << "  Migration: " << *typed->migration_name() << "\n";
    }
    if (typed && typed->cause()) {
        err << "  Cause: " << typed->cause()->message << "\n";
    }

    const bool retryable = typed ? typed->is_retryable() : errors::is_retryable(error);
    if (retryable) {
        err << "  Hint: the database reported a deadlock or lock timeout; "
               "retrying the command may succeed.\n";
    }
}

void print_names(const std::vector<std::string>& names, std::string_view verb,
                 std::string_view nothing, std::ostream& out) {
    if (names.empty()) {
        out << nothing << "\n";
        return;
    }
    for (const auto& name : names) {
        out << verb << ": " << name << "\n";
    }
}

auto print_status(engine::migration_runner& runner, std::ostream& out,
                  std::ostream& err) -> int {
    auto statuses = runner.status();
    if (statuses.is_err()) {
        report_failure(runner, statuses.error(), err);
        return exit_codes::migration_error;
    }

    if (statuses.value().empty()) {
        out << "No migrations found.\n";
        return exit_codes::success;
    }

    out << std::left << std::setw(6) << "Ran?" << std::setw(7) << "Batch"
        << "Migration\n";
    out << std::string(60, '-') << "\n";
    for (const auto& status : statuses.value()) {
        out << std::left << std::setw(6) << (status.ran ? "Yes" : "No")
            << std::setw(7)
            << (status.batch ? std::to_string(*status.batch) : std::string("-"))
            << status.name << "\n";
    }
    return exit_codes::success;
}

}  // namespace

// =============================================================================
// Argument Parsing
// =============================================================================

auto parse_arguments(int argc, const char* const argv[])
    -> Result<command_options> {
    command_options opts;
    bool have_command = false;
    std::vector<std::string> positionals;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            opts.command = command_type::help;
            return ok(std::move(opts));
        }
        if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
            continue;
        }
        if (arg == "--pretend") {
            opts.pretend = true;
            continue;
        }
        if (arg == "--create") {
            opts.create = true;
            continue;
        }

        if (auto value = option_value(arg, "--config", i, argc, argv)) {
            if (value->is_err()) return value->error();
            opts.config_path = value->value();
            continue;
        }
        if (auto value = option_value(arg, "--database", i, argc, argv)) {
            if (value->is_err()) return value->error();
            opts.database_path = value->value();
            continue;
        }
        if (auto value = option_value(arg, "--path", i, argc, argv)) {
            if (value->is_err()) return value->error();
            opts.migrations_path = value->value();
            continue;
        }
        if (auto value = option_value(arg, "--table", i, argc, argv)) {
            if (value->is_err()) return value->error();
            opts.table = value->value();
            continue;
        }
        if (auto value = option_value(arg, "--steps", i, argc, argv)) {
            if (value->is_err()) return value->error();
            auto steps = parse_steps(value->value());
            if (steps.is_err()) return steps.error();
            opts.steps = steps.value();
            continue;
        }

        if (!arg.empty() && arg[0] == '-') {
            return usage_error(compat::format("Unknown option '{}'", arg));
        }

        if (!have_command) {
            auto command = parse_command(arg);
            if (!command) {
                return usage_error(compat::format("Unknown command '{}'", arg));
            }
            opts.command = *command;
            have_command = true;
        } else {
            positionals.emplace_back(arg);
        }
    }

    if (!have_command) {
        return usage_error("No command given");
    }

    const bool takes_name = opts.command == command_type::revert ||
                            opts.command == command_type::generate;
    if (takes_name) {
        if (positionals.empty()) {
            return usage_error("Missing migration name");
        }
        opts.name = positionals.front();
        positionals.erase(positionals.begin());
    }
    if (!positionals.empty()) {
        return usage_error(
            compat::format("Unexpected argument '{}'", positionals.front()));
    }

    return ok(std::move(opts));
}

// =============================================================================
// Configuration
// =============================================================================

auto resolve_config(const command_options& options)
    -> Result<config::migrator_config> {
    auto config = config::config_loader::create_default();

    if (options.config_path) {
        auto loaded = config::config_loader::load(*options.config_path);
        if (loaded.is_err()) {
            return loaded.error();
        }
        config = loaded.value();
    }

    if (options.database_path) {
        config.database.path = *options.database_path;
    }
    if (options.migrations_path) {
        config.migrations.path = *options.migrations_path;
    }
    if (options.verbose) {
        config.logging.level = integration::log_level::debug;
        config.logging.console = true;
    }

    auto validation = config::config_loader::validate(config);
    if (validation.is_err()) {
        return validation.error();
    }
    return ok(std::move(config));
}

// =============================================================================
// Execution
// =============================================================================

auto execute(const command_options& options,
             const config::migrator_config& config,
             const engine::migration_catalog& catalog, std::ostream& out,
             std::ostream& err) -> int {
    if (options.command == command_type::help) {
        print_usage("dbmigrate", out);
        return exit_codes::success;
    }

    auto logger = std::make_shared<di::LoggerService>();
    auto db = std::make_shared<storage::sqlite_connection>(
        config.database.path, config::config_loader::to_sqlite_options(config),
        logger);

    engine::runner_options runner_opts;
    runner_opts.migrations_path = config.migrations.path;
    runner_opts.use_advisory_lock = config.migrations.advisory_lock;
    engine::migration_runner runner(db, runner_opts, logger);

    // Scaffolding needs no database
    if (options.command == command_type::generate) {
        auto path = runner.generate(options.name, options.table,
                                    options.create || options.table.has_value());
        if (path.is_err()) {
            report_failure(runner, path.error(), err);
            return exit_codes::migration_error;
        }
        out << "Created migration: " << path.value().string() << "\n";
        return exit_codes::success;
    }

    auto connected = db->connect();
    if (connected.is_err()) {
        err << "Error: Failed to open database: " << connected.error().message
            << "\n";
        return exit_codes::migration_error;
    }

    auto loaded = runner.load_migrations(catalog);
    if (loaded.is_err()) {
        report_failure(runner, loaded.error(), err);
        return exit_codes::migration_error;
    }

    const std::string prefix = options.pretend ? "Would " : "";
    auto names_or_fail = [&](const Result<std::vector<std::string>>& result,
                             std::string_view verb,
                             std::string_view nothing) -> int {
        if (result.is_err()) {
            report_failure(runner, result.error(), err);
            return exit_codes::migration_error;
        }
        print_names(result.value(), prefix + std::string(verb), nothing, out);
        return exit_codes::success;
    };

    switch (options.command) {
        case command_type::migrate:
            return names_or_fail(runner.migrate(options.pretend),
                                 options.pretend ? "migrate" : "Migrated",
                                 "Nothing to migrate.");

        case command_type::rollback:
            return names_or_fail(runner.rollback(options.steps, options.pretend),
                                 options.pretend ? "roll back" : "Rolled back",
                                 "Nothing to rollback.");

        case command_type::revert: {
            auto reverted = runner.revert(options.name, options.pretend);
            if (reverted.is_err()) {
                report_failure(runner, reverted.error(), err);
                return exit_codes::migration_error;
            }
            out << (options.pretend ? "Would revert: " : "Reverted: ")
                << options.name << "\n";
            return exit_codes::success;
        }

        case command_type::reset:
            return names_or_fail(runner.reset(options.pretend),
                                 options.pretend ? "roll back" : "Rolled back",
                                 "Nothing to reset.");

        case command_type::refresh:
            return names_or_fail(runner.refresh(options.pretend),
                                 options.pretend ? "migrate" : "Migrated",
                                 "Nothing to migrate.");

        case command_type::status:
            return print_status(runner, out, err);

        case command_type::generate:
        case command_type::help:
            break;
    }

    return exit_codes::success;
}

auto run_command_line(int argc, const char* const argv[],
                      const engine::migration_catalog& catalog) -> int {
    const char* program = argc > 0 ? argv[0] : "dbmigrate";

    auto parsed = parse_arguments(argc, argv);
    if (parsed.is_err()) {
        std::cerr << "Error: " << parsed.error().message << "\n";
        print_usage(program, std::cerr);
        return exit_codes::invalid_arguments;
    }

    const auto& options = parsed.value();
    if (options.command == command_type::help) {
        print_usage(program, std::cout);
        return exit_codes::success;
    }

    auto config = resolve_config(options);
    if (config.is_err()) {
        std::cerr << "Error: " << config.error().message << "\n";
        return exit_codes::invalid_arguments;
    }

    integration::logger_adapter::initialize(
        config::config_loader::to_logger_config(config.value()));

    const int code = execute(options, config.value(), catalog, std::cout, std::cerr);

    integration::logger_adapter::shutdown();
    return code;
}

void print_usage(const char* program_name, std::ostream& out) {
    out << R"(
dbmigrate - Schema Migration Tool

Usage: )" << program_name
        << R"( [global options] <command> [options]

Commands:
  migrate                   Apply all pending migrations as a new batch
  rollback                  Undo the most recent batch
  revert <name>             Undo one applied migration
  reset                     Undo every applied migration
  refresh                   Reset, then migrate again
  status                    Show which migrations have run
  generate <name>           Create a new migration source file

Global Options:
  --config <file>           YAML configuration file
  --database <path>         SQLite database file (overrides configuration)
  --path <dir>              Migrations directory (overrides configuration)
  --verbose, -v             Enable debug logging
  --help, -h                Show this help message

Command Options:
  --pretend                 Show what would run without changing the database
  --steps=<n>               Number of batches to roll back (default: 1)
  --table=<name>            Table created by the generated migration
  --create                  Scaffold create/drop of the table

Examples:
  )" << program_name
        << R"( --database app.db migrate
  )" << program_name
        << R"( --config dbmigrate.yaml rollback --steps=2
  )" << program_name
        << R"( generate create_users_table --table=users --create

Exit Codes:
  0  Success
  1  Invalid arguments or configuration
  2  Migration error
)";
}

}  // namespace dbmigrate::cli
