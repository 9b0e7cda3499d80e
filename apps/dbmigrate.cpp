/**
 * @file dbmigrate.cpp
 * @brief dbmigrate command line tool
 *
 * Ships without compiled-in migrations; it manages the bookkeeping table
 * (status, rollback of registered migrations) and scaffolds new migration
 * files. Applications link their migrations through
 * dbmigrate::cli::run_command_line with a populated catalog.
 *
 * Usage:
 *   dbmigrate [global options] <command> [options]
 *
 * Example:
 *   dbmigrate --database app.db status
 *   dbmigrate --path ./migrations generate create_users_table --table=users
 */

#include <dbmigrate/cli/command_line.hpp>
#include <dbmigrate/engine/migration_catalog.hpp>

int main(int argc, char* argv[]) {
    const dbmigrate::engine::migration_catalog catalog;
    return dbmigrate::cli::run_command_line(argc, argv, catalog);
}
