/**
 * @file logger_adapter.cpp
 * @brief Implementation of the logging facade and migration audit trail
 */

#include <dbmigrate/integration/logger_adapter.hpp>

#include <dbmigrate/compat/time.hpp>

#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/interfaces/logger_types.h>
#include <kcenon/logger/writers/console_writer.h>
#include <kcenon/logger/writers/rotating_file_writer.h>

#include <atomic>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <system_error>

namespace dbmigrate::integration {

// =============================================================================
// Implementation Class
// =============================================================================

class logger_adapter::impl {
public:
    impl() = default;
    ~impl() { shutdown(); }

    void initialize(const logger_config& config) {
        std::string directory_warning;
        {
            std::lock_guard lock(mutex_);

            if (initialized_) {
                return;
            }

            config_ = config;
            min_level_.store(config.min_level);

            if (config_.enable_file || config_.enable_audit_log) {
                std::error_code ec;
                std::filesystem::create_directories(config_.log_directory, ec);
                if (ec) {
                    directory_warning = "Cannot create log directory " +
                                        config_.log_directory.string() + ": " +
                                        ec.message();
                    config_.enable_file = false;
                    config_.enable_audit_log = false;
                }
            }

            logger_ = std::make_unique<kcenon::logger::logger>(
                config_.async_mode, config_.buffer_size);

            logger_->set_min_level(convert_log_level(config_.min_level));

            if (config_.enable_console) {
                logger_->add_writer(
                    std::make_unique<kcenon::logger::console_writer>());
            }

            if (config_.enable_file) {
                auto log_path = config_.log_directory / "dbmigrate.log";
                auto writer =
                    std::make_unique<kcenon::logger::rotating_file_writer>(
                        log_path.string(),
                        config_.max_file_size_mb * 1024 * 1024,
                        config_.max_files);
                logger_->add_writer(std::move(writer));
            }

            logger_->start();

            audit_log_path_.clear();
            if (config_.enable_audit_log) {
                audit_log_path_ =
                    config_.log_directory / "migrations_audit.json";
            }

            initialized_ = true;
        }

        if (!directory_warning.empty()) {
            log(log_level::warn, directory_warning);
        }
    }

    void shutdown() {
        std::lock_guard lock(mutex_);

        if (!initialized_) {
            return;
        }

        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }

        audit_log_path_.clear();
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const noexcept -> bool {
        return initialized_.load();
    }

    void log(log_level level, const std::string& message) {
        if (!initialized_ || !logger_) {
            return;
        }

        if (!is_level_enabled(level)) {
            return;
        }

        logger_->log(convert_log_level(level), message);
    }

    [[nodiscard]] auto is_level_enabled(log_level level) const noexcept -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void flush() {
        if (logger_) {
            logger_->flush();
        }
    }

    void set_min_level(log_level level) {
        min_level_.store(level);
        if (logger_) {
            logger_->set_min_level(convert_log_level(level));
        }
    }

    [[nodiscard]] auto get_min_level() const noexcept -> log_level {
        return min_level_.load();
    }

    [[nodiscard]] auto get_config() const -> const logger_config& {
        return config_;
    }

    [[nodiscard]] auto audit_log_path() const -> std::filesystem::path {
        std::lock_guard lock(audit_mutex_);
        return audit_log_path_;
    }

    void write_audit_log(const std::string& event_type,
                         const std::string& outcome,
                         const std::map<std::string, std::string>& fields) {
        std::lock_guard lock(audit_mutex_);

        if (!initialized_ || audit_log_path_.empty()) {
            return;
        }

        std::ofstream file(audit_log_path_, std::ios::app);
        if (!file) {
            return;
        }

        std::ostringstream json;
        json << "{";
        json << "\"timestamp\":\"" << format_iso8601() << "\",";
        json << "\"event_type\":\"" << escape_json(event_type) << "\",";
        json << "\"outcome\":\"" << escape_json(outcome) << "\"";

        for (const auto& [key, value] : fields) {
            json << ",\"" << escape_json(key) << "\":\"" << escape_json(value)
                 << "\"";
        }

        json << "}\n";

        file << json.str();
        file.flush();
    }

private:
    [[nodiscard]] static auto convert_log_level(log_level level)
        -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace:
                return kcenon::logger::log_level::trace;
            case log_level::debug:
                return kcenon::logger::log_level::debug;
            case log_level::info:
                return kcenon::logger::log_level::info;
            case log_level::warn:
                return kcenon::logger::log_level::warn;
            case log_level::error:
                return kcenon::logger::log_level::error;
            case log_level::fatal:
                return kcenon::logger::log_level::fatal;
            case log_level::off:
            default:
                return kcenon::logger::log_level::off;
        }
    }

    [[nodiscard]] static auto format_iso8601() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) %
                  1000;

        std::tm tm_val{};
        compat::localtime_safe(&time_t_val, &tm_val);

        std::ostringstream oss;
        oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S");
        oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
        oss << std::put_time(&tm_val, "%z");
        return oss.str();
    }

    [[nodiscard]] static auto escape_json(const std::string& str) -> std::string {
        std::ostringstream oss;
        for (char c : str) {
            switch (c) {
                case '"':
                    oss << "\\\"";
                    break;
                case '\\':
                    oss << "\\\\";
                    break;
                case '\n':
                    oss << "\\n";
                    break;
                case '\r':
                    oss << "\\r";
                    break;
                case '\t':
                    oss << "\\t";
                    break;
                default:
                    if (static_cast<unsigned char>(c) < 32) {
                        oss << "\\u" << std::hex << std::setw(4)
                            << std::setfill('0') << static_cast<int>(c)
                            << std::dec;
                    } else {
                        oss << c;
                    }
                    break;
            }
        }
        return oss.str();
    }

    mutable std::mutex mutex_;
    mutable std::mutex audit_mutex_;
    std::atomic<bool> initialized_{false};
    std::atomic<log_level> min_level_{log_level::info};
    logger_config config_;
    std::unique_ptr<kcenon::logger::logger> logger_;
    std::filesystem::path audit_log_path_;
};

// =============================================================================
// Static Member Initialization
// =============================================================================

std::unique_ptr<logger_adapter::impl> logger_adapter::pimpl_ =
    std::make_unique<logger_adapter::impl>();

// =============================================================================
// Initialization
// =============================================================================

void logger_adapter::initialize(const logger_config& config) {
    pimpl_->initialize(config);
}

void logger_adapter::shutdown() { pimpl_->shutdown(); }

auto logger_adapter::is_initialized() noexcept -> bool {
    return pimpl_->is_initialized();
}

// =============================================================================
// Standard Logging
// =============================================================================

void logger_adapter::log(log_level level, const std::string& message) {
    pimpl_->log(level, message);
}

auto logger_adapter::is_level_enabled(log_level level) noexcept -> bool {
    return pimpl_->is_level_enabled(level);
}

void logger_adapter::flush() { pimpl_->flush(); }

// =============================================================================
// Migration Audit Logging
// =============================================================================

void logger_adapter::log_migration_applied(const std::string& migration,
                                           int batch) {
    write_audit_log("MIGRATION_APPLIED", "success",
                    {{"migration", migration},
                     {"batch", std::to_string(batch)}});
}

void logger_adapter::log_migration_rolled_back(const std::string& migration) {
    write_audit_log("MIGRATION_ROLLED_BACK", "success",
                    {{"migration", migration}});
}

void logger_adapter::log_migration_failed(const std::string& migration,
                                          const std::string& operation,
                                          const std::string& reason) {
    write_audit_log("MIGRATION_FAILED", "failure",
                    {{"migration", migration},
                     {"operation", operation},
                     {"reason", reason}});
}

// =============================================================================
// Configuration
// =============================================================================

void logger_adapter::set_min_level(log_level level) {
    pimpl_->set_min_level(level);
}

auto logger_adapter::get_min_level() noexcept -> log_level {
    return pimpl_->get_min_level();
}

auto logger_adapter::get_config() -> const logger_config& {
    return pimpl_->get_config();
}

auto logger_adapter::audit_log_path() -> std::filesystem::path {
    return pimpl_->audit_log_path();
}

auto logger_adapter::log_level_to_string(log_level level) -> std::string {
    switch (level) {
        case log_level::trace:
            return "TRACE";
        case log_level::debug:
            return "DEBUG";
        case log_level::info:
            return "INFO";
        case log_level::warn:
            return "WARN";
        case log_level::error:
            return "ERROR";
        case log_level::fatal:
            return "FATAL";
        case log_level::off:
        default:
            return "OFF";
    }
}

// =============================================================================
// Private Helpers
// =============================================================================

void logger_adapter::write_audit_log(
    const std::string& event_type,
    const std::string& outcome,
    const std::map<std::string, std::string>& fields) {
    pimpl_->write_audit_log(event_type, outcome, fields);
}

}  // namespace dbmigrate::integration
