/**
 * @file migrator_config.hpp
 * @brief Configuration structures for the dbmigrate tool
 *
 * Mirrors the sections of a dbmigrate.yaml file:
 *
 * @code
 * database:
 *   path: ./data/app.db
 *   table_prefix: ""
 *   busy_timeout_ms: 5000
 *   foreign_keys: true
 * migrations:
 *   path: ./migrations
 *   advisory_lock: false
 * logging:
 *   level: info
 *   directory: ./logs
 *   console: true
 *   file: false
 *   audit: true
 * @endcode
 */

#pragma once

#include <dbmigrate/integration/logger_adapter.hpp>

#include <chrono>
#include <filesystem>
#include <string>

namespace dbmigrate::config {

// =============================================================================
// Database Configuration
// =============================================================================

/**
 * @brief Connection settings for the SQLite database
 */
struct database_config {
    /// Path to the SQLite database file (":memory:" for an in-memory database)
    std::string path{"./dbmigrate.db"};

    /// Prefix prepended to every table name, including the bookkeeping table
    std::string table_prefix;

    /// Busy timeout before a locked database fails the statement
    std::chrono::milliseconds busy_timeout{5000};

    /// Enforce foreign key constraints
    bool foreign_keys{true};
};

// =============================================================================
// Migrations Configuration
// =============================================================================

struct migrations_config {
    /// Directory holding migration source files
    std::filesystem::path path{"./migrations"};

    /// Serialize runners through the migrations_lock table
    bool advisory_lock{false};
};

// =============================================================================
// Logging Configuration
// =============================================================================

struct logging_config {
    integration::log_level level{integration::log_level::info};

    std::filesystem::path directory{"logs"};

    bool console{true};

    bool file{false};

    /// Write the migration audit trail (migrations_audit.json)
    bool audit{false};
};

// =============================================================================
// Migrator Configuration
// =============================================================================

/**
 * @brief Complete dbmigrate configuration
 */
struct migrator_config {
    database_config database;
    migrations_config migrations;
    logging_config logging;
};

}  // namespace dbmigrate::config
