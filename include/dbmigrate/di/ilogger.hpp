/**
 * @file ilogger.hpp
 * @brief Logger interface for dependency injection
 *
 * This file provides the ILogger interface and implementations (NullLogger,
 * LoggerService). The migration runner and the database adapters receive an
 * ILogger through their constructors so tests can observe what they log.
 */

#pragma once

#include <dbmigrate/compat/format.hpp>
#include <dbmigrate/integration/logger_adapter.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace dbmigrate::di {

// =============================================================================
// Logger Interface
// =============================================================================

/**
 * @brief Abstract logger interface for dependency injection
 *
 * Components log statement traces at trace level, connection and bookkeeping
 * events at debug level, and one info line per applied or rolled back
 * migration ("Ran: <name>", "Rolled back: <name>"). Failures are logged at
 * error level before they are returned.
 *
 * Thread Safety:
 * - Concrete implementations must be thread-safe
 */
class ILogger {
public:
    virtual ~ILogger() = default;

    // =========================================================================
    // Log Level Methods
    // =========================================================================

    /**
     * @brief Log SQL text and other per-statement detail
     * @param message The message to log
     */
    virtual void trace(std::string_view message) = 0;

    /**
     * @brief Log connection, transaction and bookkeeping events
     * @param message The message to log
     */
    virtual void debug(std::string_view message) = 0;

    /**
     * @brief Log a completed migration step
     * @param message The message to log
     */
    virtual void info(std::string_view message) = 0;

    /**
     * @brief Log a recoverable anomaly, e.g. a recorded migration that is
     *        no longer registered
     * @param message The message to log
     */
    virtual void warn(std::string_view message) = 0;

    /**
     * @brief Log a failed operation
     * @param message The message to log
     */
    virtual void error(std::string_view message) = 0;

    /**
     * @brief Log a failure that leaves the process unable to continue
     * @param message The message to log
     */
    virtual void fatal(std::string_view message) = 0;

    /**
     * @brief Check if a log level is enabled
     * @param level The level to check
     * @return true if messages at this level will be logged
     */
    [[nodiscard]] virtual bool is_enabled(integration::log_level level) const noexcept = 0;

    // =========================================================================
    // Formatted Logging (Convenience Templates)
    // =========================================================================
    // The message is only formatted when its level is enabled.

    template <typename... Args>
    void trace_fmt(compat::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(integration::log_level::trace)) {
            trace(compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void debug_fmt(compat::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(integration::log_level::debug)) {
            debug(compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void info_fmt(compat::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(integration::log_level::info)) {
            info(compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void warn_fmt(compat::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(integration::log_level::warn)) {
            warn(compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void error_fmt(compat::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(integration::log_level::error)) {
            error(compat::format(fmt, std::forward<Args>(args)...));
        }
    }

protected:
    ILogger() = default;
    ILogger(const ILogger&) = default;
    ILogger& operator=(const ILogger&) = default;
    ILogger(ILogger&&) = default;
    ILogger& operator=(ILogger&&) = default;
};

// =============================================================================
// Null Logger Implementation
// =============================================================================

/**
 * @brief No-op logger used when no logger is injected
 *
 * Every level reports disabled, so the *_fmt helpers never format.
 */
class NullLogger final : public ILogger {
public:
    NullLogger() = default;
    ~NullLogger() override = default;

    void trace(std::string_view /*message*/) override {}
    void debug(std::string_view /*message*/) override {}
    void info(std::string_view /*message*/) override {}
    void warn(std::string_view /*message*/) override {}
    void error(std::string_view /*message*/) override {}
    void fatal(std::string_view /*message*/) override {}

    [[nodiscard]] bool is_enabled(integration::log_level /*level*/) const noexcept override {
        return false;
    }
};

// =============================================================================
// Logger Service Implementation
// =============================================================================

/**
 * @brief ILogger that forwards to the process-wide logger_adapter
 *
 * The dbmigrate executable injects this after logger_adapter::initialize().
 * Level filtering follows logger_adapter::set_min_level(); messages sent
 * before initialization are dropped by the adapter.
 */
class LoggerService final : public ILogger {
public:
    LoggerService() = default;
    ~LoggerService() override = default;

    void trace(std::string_view message) override {
        forward(integration::log_level::trace, message);
    }
    void debug(std::string_view message) override {
        forward(integration::log_level::debug, message);
    }
    void info(std::string_view message) override {
        forward(integration::log_level::info, message);
    }
    void warn(std::string_view message) override {
        forward(integration::log_level::warn, message);
    }
    void error(std::string_view message) override {
        forward(integration::log_level::error, message);
    }
    void fatal(std::string_view message) override {
        forward(integration::log_level::fatal, message);
    }

    [[nodiscard]] bool is_enabled(integration::log_level level) const noexcept override {
        return integration::logger_adapter::is_level_enabled(level);
    }

private:
    static void forward(integration::log_level level, std::string_view message) {
        integration::logger_adapter::log(level, std::string{message});
    }
};

/**
 * @brief Shared NullLogger instance used as the default dependency
 *
 * Constructors that accept an optional logger fall back to this instance,
 * so components never check their logger for null.
 */
[[nodiscard]] inline std::shared_ptr<ILogger> null_logger() {
    static auto instance = std::make_shared<NullLogger>();
    return instance;
}

}  // namespace dbmigrate::di
