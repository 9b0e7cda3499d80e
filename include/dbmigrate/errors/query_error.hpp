/**
 * @file query_error.hpp
 * @brief Error carrier for failed read/write statements
 *
 * A query_error records what went wrong with a statement in a form that is
 * safe to log (truncated SQL, redacted bindings) and rich enough to decide
 * whether the failure is worth retrying.
 */

#pragma once

#include <dbmigrate/core/result.hpp>
#include <dbmigrate/storage/database_types.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace dbmigrate::errors {

/**
 * @namespace vendor_codes
 * @brief Driver error codes recognised by the classification predicates
 */
namespace vendor_codes {
    // MySQL / MariaDB
    constexpr int mysql_duplicate_entry = 1062;
    constexpr int mysql_row_is_referenced = 1451;
    constexpr int mysql_no_referenced_row = 1452;
    constexpr int mysql_deadlock = 1213;
    constexpr int mysql_lock_wait_timeout = 1205;
    constexpr int mysql_syntax_error = 1064;
    constexpr int mysql_table_not_found = 1146;
    constexpr int mysql_column_not_found = 1054;

    // SQLite extended result codes
    constexpr int sqlite_busy = 5;
    constexpr int sqlite_locked = 6;
    constexpr int sqlite_busy_snapshot = 517;
    constexpr int sqlite_busy_timeout = 773;
    constexpr int sqlite_constraint_foreignkey = 787;
    constexpr int sqlite_constraint_primarykey = 1555;
    constexpr int sqlite_constraint_unique = 2067;
}  // namespace vendor_codes

/**
 * @brief Failed statement with sanitized context
 *
 * SQL longer than max_sql_length is cut and suffixed with truncation_marker.
 * Bindings whose name contains "password", "secret", "token", "key" or
 * "auth" (case-insensitive) are replaced with redaction_marker, and values
 * longer than max_binding_length are truncated.
 */
class query_error {
public:
    static constexpr std::size_t max_sql_length = 500;
    static constexpr std::size_t max_binding_length = 100;
    static constexpr std::string_view truncation_marker = "... [TRUNCATED]";
    static constexpr std::string_view redaction_marker = "[REDACTED]";

    /**
     * @brief Construct a query error
     *
     * @param message Human readable description
     * @param sql The failing statement (sanitized on construction)
     * @param bindings Parameter bindings (sanitized on construction)
     * @param sql_state SQL state code, if known
     * @param driver_code Vendor specific error code, if known
     */
    explicit query_error(std::string message, std::string_view sql = {},
                         const storage::binding_list& bindings = {},
                         std::optional<std::string> sql_state = std::nullopt,
                         std::optional<int> driver_code = std::nullopt);

    // ========================================================================
    // Named constructors
    // ========================================================================

    [[nodiscard]] static auto syntax_error(std::string_view sql,
                                           std::string_view error)
        -> query_error;
    [[nodiscard]] static auto table_not_found(std::string_view table)
        -> query_error;
    [[nodiscard]] static auto column_not_found(std::string_view column)
        -> query_error;
    [[nodiscard]] static auto duplicate_key(std::string_view sql,
                                            std::string_view key)
        -> query_error;
    [[nodiscard]] static auto foreign_key_violation(std::string_view sql,
                                                    bool on_delete)
        -> query_error;
    [[nodiscard]] static auto deadlock(std::string_view sql) -> query_error;
    [[nodiscard]] static auto lock_wait_timeout(std::string_view sql)
        -> query_error;

    /**
     * @brief Rebuild a query_error from a transported error_info
     *
     * Only error_info values produced by to_error_info() (module "query")
     * are accepted. The SQL state is derived again from the vendor code.
     *
     * @return The query error, or std::nullopt for other modules
     */
    [[nodiscard]] static auto from_error_info(const error_info& info)
        -> std::optional<query_error>;

    // ========================================================================
    // Accessors
    // ========================================================================

    [[nodiscard]] auto message() const noexcept -> const std::string& {
        return message_;
    }
    [[nodiscard]] auto sql() const noexcept -> const std::string& {
        return sql_;
    }
    [[nodiscard]] auto bindings() const noexcept
        -> const storage::binding_list& {
        return bindings_;
    }
    [[nodiscard]] auto sql_state() const noexcept
        -> const std::optional<std::string>& {
        return sql_state_;
    }
    [[nodiscard]] auto driver_code() const noexcept -> std::optional<int> {
        return driver_code_;
    }

    // ========================================================================
    // Classification
    // ========================================================================

    [[nodiscard]] auto is_duplicate_key() const noexcept -> bool;
    [[nodiscard]] auto is_foreign_key_violation() const noexcept -> bool;
    [[nodiscard]] auto is_deadlock() const noexcept -> bool;
    [[nodiscard]] auto is_lock_timeout() const noexcept -> bool;

    /// Deadlocks and lock timeouts are expected to succeed on retry
    [[nodiscard]] auto is_retryable() const noexcept -> bool {
        return is_deadlock() || is_lock_timeout();
    }

    /**
     * @brief Convert to error_info for transport through Result<T>
     *
     * code is the driver code when known, error_codes::query_failed
     * otherwise; module is "query"; details holds the SQL state.
     */
    [[nodiscard]] auto to_error_info() const -> error_info;

    /**
     * @brief SQL state conventionally associated with a vendor code
     * @return "HY000" for unknown codes
     */
    [[nodiscard]] static auto sql_state_for(int driver_code) -> std::string;

    static constexpr std::string_view module_name = "query";

private:
    [[nodiscard]] static auto sanitize_sql(std::string_view sql)
        -> std::string;
    [[nodiscard]] static auto sanitize_bindings(
        const storage::binding_list& bindings) -> storage::binding_list;

    std::string message_;
    std::string sql_;
    storage::binding_list bindings_;
    std::optional<std::string> sql_state_;
    std::optional<int> driver_code_;
};

}  // namespace dbmigrate::errors
