/**
 * @file migration_error.hpp
 * @brief Errors raised by the migration runner and its discovery helpers
 *
 * A migration_error names the migration it concerns and keeps the
 * underlying port failure (query, schema or transaction) as its cause.
 */

#pragma once

#include <dbmigrate/core/result.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace dbmigrate::errors {

class migration_error {
public:
    migration_error(int code, std::string message,
                    std::optional<std::string> migration_name = std::nullopt,
                    std::optional<error_info> cause = std::nullopt);

    // ========================================================================
    // Named constructors
    // ========================================================================

    /// "Migration [name] failed: <cause message>"
    [[nodiscard]] static auto migration_failed(std::string_view name,
                                               const error_info& cause)
        -> migration_error;

    /// "Rollback of migration [name] failed: <cause message>"
    [[nodiscard]] static auto rollback_failed(std::string_view name,
                                              const error_info& cause)
        -> migration_error;

    [[nodiscard]] static auto migration_not_found(std::string_view name)
        -> migration_error;
    [[nodiscard]] static auto migration_already_ran(std::string_view name)
        -> migration_error;
    [[nodiscard]] static auto migration_not_ran(std::string_view name)
        -> migration_error;
    [[nodiscard]] static auto invalid_migration(std::string_view name,
                                                std::string_view reason)
        -> migration_error;
    [[nodiscard]] static auto load_failed(std::string_view path,
                                          std::string_view reason)
        -> migration_error;
    [[nodiscard]] static auto generate_failed(std::string_view name,
                                              std::string_view reason)
        -> migration_error;

    /// Advisory lock already held by another runner
    [[nodiscard]] static auto lock_unavailable(std::string_view lock,
                                               std::string_view holder)
        -> migration_error;

    /// Attach the statement that was executing when the error occurred
    auto with_sql(std::string sql) -> migration_error&;

    // ========================================================================
    // Accessors
    // ========================================================================

    [[nodiscard]] auto code() const noexcept -> int { return code_; }
    [[nodiscard]] auto message() const noexcept -> const std::string& {
        return message_;
    }
    [[nodiscard]] auto migration_name() const noexcept
        -> const std::optional<std::string>& {
        return migration_name_;
    }
    [[nodiscard]] auto cause() const noexcept
        -> const std::optional<error_info>& {
        return cause_;
    }
    [[nodiscard]] auto sql() const noexcept
        -> const std::optional<std::string>& {
        return sql_;
    }

    /// True when the cause is a deadlock or lock timeout
    [[nodiscard]] auto is_retryable() const -> bool;

    /// module is "migration"; details holds the migration name when known
    [[nodiscard]] auto to_error_info() const -> error_info;

    static constexpr std::string_view module_name = "migration";

private:
    int code_;
    std::string message_;
    std::optional<std::string> migration_name_;
    std::optional<error_info> cause_;
    std::optional<std::string> sql_;
};

/**
 * @brief Classify any transported error as retryable
 *
 * Query errors are retryable when their vendor code denotes a deadlock or
 * lock timeout; transaction errors when they are deadlock_detected or
 * lock_timeout. Every other error is not retryable.
 */
[[nodiscard]] auto is_retryable(const error_info& info) -> bool;

}  // namespace dbmigrate::errors
