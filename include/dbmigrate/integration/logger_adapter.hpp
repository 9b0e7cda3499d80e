/**
 * @file logger_adapter.hpp
 * @brief Adapter for application and migration audit logging using logger_system
 *
 * This file provides the logger_adapter class for integrating logger_system
 * with dbmigrate. It supports standard leveled logging and a JSON-lines audit
 * trail of every schema change applied or reverted by the runner.
 */

#pragma once

#include <dbmigrate/compat/format.hpp>

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <string>

namespace dbmigrate::integration {

/**
 * @enum log_level
 * @brief Log severity levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5,
    off = 6
};

// ─────────────────────────────────────────────────────
// Configuration
// ─────────────────────────────────────────────────────

/**
 * @struct logger_config
 * @brief Configuration options for the logger adapter
 */
struct logger_config {
    /// Directory for log files
    std::filesystem::path log_directory{"logs"};

    /// Minimum log level to output
    log_level min_level{log_level::info};

    /// Enable console output
    bool enable_console{true};

    /// Enable file output (dbmigrate.log, rotated)
    bool enable_file{false};

    /// Enable the migrations_audit.json trail
    bool enable_audit_log{false};

    /// Maximum log file size in megabytes before rotation
    std::size_t max_file_size_mb{10};

    /// Maximum number of rotated log files to keep
    std::size_t max_files{5};

    /// Use asynchronous logging
    bool async_mode{false};

    /// Buffer size for async logging
    std::size_t buffer_size{8192};
};

// ─────────────────────────────────────────────────────
// Logger Adapter Class
// ─────────────────────────────────────────────────────

/**
 * @class logger_adapter
 * @brief Process-wide logging facade over logger_system
 *
 * Messages logged before initialize() or after shutdown() are dropped.
 * The audit trail is written synchronously so that an entry exists as soon
 * as the corresponding bookkeeping row has been committed.
 *
 * Thread Safety: All methods are thread-safe.
 *
 * @example
 * @code
 * logger_config config;
 * config.log_directory = "/var/log/dbmigrate";
 * config.enable_audit_log = true;
 * logger_adapter::initialize(config);
 *
 * logger_adapter::info("Applying {} migrations", pending.size());
 * logger_adapter::log_migration_applied("2024_01_01_000000_create_users", 1);
 *
 * logger_adapter::shutdown();
 * @endcode
 */
class logger_adapter {
public:
    // ─────────────────────────────────────────────────────
    // Initialization
    // ─────────────────────────────────────────────────────

    /**
     * @brief Initialize the logger with configuration
     *
     * Sets up console and file writers and the audit trail path. If the log
     * directory cannot be created, file output and the audit trail are
     * disabled and a warning is logged to the remaining writers.
     *
     * @param config Configuration options
     */
    static void initialize(const logger_config& config);

    /**
     * @brief Flush pending messages and release the writers
     */
    static void shutdown();

    [[nodiscard]] static auto is_initialized() noexcept -> bool;

    // ─────────────────────────────────────────────────────
    // Standard Logging
    // ─────────────────────────────────────────────────────

    template <typename... Args>
    static void trace(compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::trace, compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void debug(compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::debug, compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void info(compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::info, compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void warn(compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::warn, compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void error(compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::error, compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void fatal(compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::fatal, compat::format(fmt, std::forward<Args>(args)...));
    }

    /**
     * @brief Log a message at the specified level
     * @param level Log severity level
     * @param message The message to log
     */
    static void log(log_level level, const std::string& message);

    [[nodiscard]] static auto is_level_enabled(log_level level) noexcept -> bool;

    static void flush();

    // ─────────────────────────────────────────────────────
    // Migration Audit Logging
    // ─────────────────────────────────────────────────────

    /**
     * @brief Record a migration whose up() was committed
     * @param migration Migration name
     * @param batch Batch number the migration was recorded under
     */
    static void log_migration_applied(const std::string& migration, int batch);

    /**
     * @brief Record a migration whose down() was committed
     * @param migration Migration name
     */
    static void log_migration_rolled_back(const std::string& migration);

    /**
     * @brief Record a failed migration operation
     *
     * @param migration Migration name
     * @param operation "up" or "down"
     * @param reason Error message of the failure
     */
    static void log_migration_failed(const std::string& migration,
                                     const std::string& operation,
                                     const std::string& reason);

    // ─────────────────────────────────────────────────────
    // Configuration
    // ─────────────────────────────────────────────────────

    static void set_min_level(log_level level);

    [[nodiscard]] static auto get_min_level() noexcept -> log_level;

    [[nodiscard]] static auto get_config() -> const logger_config&;

    /**
     * @brief Path of the audit trail file
     * @return Empty path when the audit trail is disabled
     */
    [[nodiscard]] static auto audit_log_path() -> std::filesystem::path;

    [[nodiscard]] static auto log_level_to_string(log_level level) -> std::string;

private:
    static void write_audit_log(const std::string& event_type,
                                const std::string& outcome,
                                const std::map<std::string, std::string>& fields);

    class impl;
    static std::unique_ptr<impl> pimpl_;
};

}  // namespace dbmigrate::integration
