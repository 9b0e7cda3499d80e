/**
 * @file query_error.cpp
 * @brief Implementation of the query error carrier
 */

#include <dbmigrate/errors/query_error.hpp>

#include <dbmigrate/compat/format.hpp>

#include <algorithm>
#include <array>
#include <cctype>

namespace dbmigrate::errors {

namespace {

constexpr std::array<std::string_view, 5> sensitive_keys = {
    "password", "secret", "token", "key", "auth"};

auto to_lower(std::string_view value) -> std::string {
    std::string lowered(value);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return lowered;
}

auto is_sensitive(std::string_view name) -> bool {
    const auto lowered = to_lower(name);
    return std::any_of(sensitive_keys.begin(), sensitive_keys.end(),
                       [&lowered](std::string_view key) {
                           return lowered.find(key) != std::string::npos;
                       });
}

}  // namespace

// ============================================================================
// Construction
// ============================================================================

query_error::query_error(std::string message, std::string_view sql,
                         const storage::binding_list& bindings,
                         std::optional<std::string> sql_state,
                         std::optional<int> driver_code)
    : message_(std::move(message)),
      sql_(sanitize_sql(sql)),
      bindings_(sanitize_bindings(bindings)),
      sql_state_(std::move(sql_state)),
      driver_code_(driver_code) {}

auto query_error::syntax_error(std::string_view sql, std::string_view error)
    -> query_error {
    return query_error(compat::format("SQL syntax error: {}", error), sql, {},
                       "42000", vendor_codes::mysql_syntax_error);
}

auto query_error::table_not_found(std::string_view table) -> query_error {
    return query_error(compat::format("Table '{}' doesn't exist", table), {},
                       {}, "42S02", vendor_codes::mysql_table_not_found);
}

auto query_error::column_not_found(std::string_view column) -> query_error {
    return query_error(compat::format("Unknown column '{}'", column), {}, {},
                       "42S22", vendor_codes::mysql_column_not_found);
}

auto query_error::duplicate_key(std::string_view sql, std::string_view key)
    -> query_error {
    return query_error(compat::format("Duplicate entry for key '{}'", key),
                       sql, {}, "23000", vendor_codes::mysql_duplicate_entry);
}

auto query_error::foreign_key_violation(std::string_view sql, bool on_delete)
    -> query_error {
    if (on_delete) {
        return query_error(
            "Cannot delete or update a parent row: a foreign key constraint fails",
            sql, {}, "23000", vendor_codes::mysql_row_is_referenced);
    }
    return query_error(
        "Cannot add or update a child row: a foreign key constraint fails",
        sql, {}, "23000", vendor_codes::mysql_no_referenced_row);
}

auto query_error::deadlock(std::string_view sql) -> query_error {
    return query_error(
        "Deadlock found when trying to get lock; try restarting transaction",
        sql, {}, "40001", vendor_codes::mysql_deadlock);
}

auto query_error::lock_wait_timeout(std::string_view sql) -> query_error {
    return query_error(
        "Lock wait timeout exceeded; try restarting transaction", sql, {},
        "HY000", vendor_codes::mysql_lock_wait_timeout);
}

auto query_error::from_error_info(const error_info& info)
    -> std::optional<query_error> {
    if (info.module != module_name) {
        return std::nullopt;
    }

    if (info.code > 0) {
        return query_error(info.message, {}, {}, sql_state_for(info.code),
                           info.code);
    }
    return query_error(info.message);
}

// ============================================================================
// Classification
// ============================================================================

auto query_error::is_duplicate_key() const noexcept -> bool {
    if (driver_code_) {
        switch (*driver_code_) {
            case vendor_codes::mysql_duplicate_entry:
            case vendor_codes::sqlite_constraint_unique:
            case vendor_codes::sqlite_constraint_primarykey:
                return true;
            default:
                break;
        }
    }
    return sql_state_ && sql_state_->rfind("23", 0) == 0;
}

auto query_error::is_foreign_key_violation() const noexcept -> bool {
    if (!driver_code_) {
        return false;
    }
    return *driver_code_ == vendor_codes::mysql_row_is_referenced ||
           *driver_code_ == vendor_codes::mysql_no_referenced_row ||
           *driver_code_ == vendor_codes::sqlite_constraint_foreignkey;
}

auto query_error::is_deadlock() const noexcept -> bool {
    if (driver_code_) {
        switch (*driver_code_) {
            case vendor_codes::mysql_deadlock:
            case vendor_codes::sqlite_locked:
            case vendor_codes::sqlite_busy_snapshot:
                return true;
            default:
                break;
        }
    }
    return sql_state_ && *sql_state_ == "40001";
}

auto query_error::is_lock_timeout() const noexcept -> bool {
    if (!driver_code_) {
        return false;
    }
    return *driver_code_ == vendor_codes::mysql_lock_wait_timeout ||
           *driver_code_ == vendor_codes::sqlite_busy ||
           *driver_code_ == vendor_codes::sqlite_busy_timeout;
}

// ============================================================================
// Transport
// ============================================================================

auto query_error::to_error_info() const -> error_info {
    const int code = driver_code_.value_or(error_codes::query_failed);
    return error_info{code, message_, std::string(module_name),
                      sql_state_.value_or("")};
}

auto query_error::sql_state_for(int driver_code) -> std::string {
    switch (driver_code) {
        case vendor_codes::mysql_duplicate_entry:
        case vendor_codes::mysql_row_is_referenced:
        case vendor_codes::mysql_no_referenced_row:
        case vendor_codes::sqlite_constraint_unique:
        case vendor_codes::sqlite_constraint_primarykey:
        case vendor_codes::sqlite_constraint_foreignkey:
            return "23000";
        case vendor_codes::mysql_deadlock:
        case vendor_codes::sqlite_locked:
        case vendor_codes::sqlite_busy_snapshot:
            return "40001";
        case vendor_codes::mysql_syntax_error:
            return "42000";
        case vendor_codes::mysql_table_not_found:
            return "42S02";
        case vendor_codes::mysql_column_not_found:
            return "42S22";
        default:
            return "HY000";
    }
}

// ============================================================================
// Sanitization
// ============================================================================

auto query_error::sanitize_sql(std::string_view sql) -> std::string {
    if (sql.size() > max_sql_length) {
        return std::string(sql.substr(0, max_sql_length)) +
               std::string(truncation_marker);
    }
    return std::string(sql);
}

auto query_error::sanitize_bindings(const storage::binding_list& bindings)
    -> storage::binding_list {
    storage::binding_list sanitized;
    sanitized.reserve(bindings.size());

    for (const auto& [name, value] : bindings) {
        if (is_sensitive(name)) {
            sanitized.emplace_back(name, std::string(redaction_marker));
        } else if (value.size() > max_binding_length) {
            sanitized.emplace_back(name, value.substr(0, max_binding_length) +
                                             std::string(truncation_marker));
        } else {
            sanitized.emplace_back(name, value);
        }
    }

    return sanitized;
}

}  // namespace dbmigrate::errors
