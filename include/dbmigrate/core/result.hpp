/**
 * @file result.hpp
 * @brief Result<T> type aliases and error codes for dbmigrate
 *
 * This file provides the standardized Result<T> types used by every fallible
 * operation in dbmigrate, integrating with common_system's Result pattern,
 * and the project-specific error code ranges.
 *
 * @see common_system/include/kcenon/common/patterns/result.h
 */

#pragma once

#include <kcenon/common/patterns/result.h>
#include <kcenon/common/error/error_codes.h>

#include <string>

namespace dbmigrate {

/**
 * @brief Result type alias for dbmigrate operations
 * @tparam T The success value type
 */
template <typename T>
using Result = kcenon::common::Result<T>;

/**
 * @brief Result type for void operations
 */
using VoidResult = kcenon::common::VoidResult;

/**
 * @brief Error information type
 */
using error_info = kcenon::common::error_info;

/**
 * @namespace error_codes
 * @brief dbmigrate error codes
 *
 * Error code range: -900 to -999.
 *
 * Query errors travel with the vendor (driver) error code when one is known,
 * which is always positive; query_failed is used otherwise.
 */
namespace error_codes {
    // Import common error codes
    using namespace kcenon::common::error::codes::common_errors;

    constexpr int dbmigrate_base = -900;

    // Query errors (-900 to -919)
    constexpr int query_failed = dbmigrate_base - 0;
    constexpr int query_syntax_error = dbmigrate_base - 1;
    constexpr int query_invalid_operator = dbmigrate_base - 2;
    constexpr int query_not_connected = dbmigrate_base - 3;

    // Schema errors (-920 to -939)
    constexpr int schema_table_creation_failed = dbmigrate_base - 20;
    constexpr int schema_table_already_exists = dbmigrate_base - 21;
    constexpr int schema_table_not_found = dbmigrate_base - 22;
    constexpr int schema_column_add_failed = dbmigrate_base - 23;
    constexpr int schema_column_already_exists = dbmigrate_base - 24;
    constexpr int schema_column_not_found = dbmigrate_base - 25;
    constexpr int schema_index_creation_failed = dbmigrate_base - 26;
    constexpr int schema_index_not_found = dbmigrate_base - 27;
    constexpr int schema_foreign_key_failed = dbmigrate_base - 28;
    constexpr int schema_invalid_version = dbmigrate_base - 29;
    constexpr int schema_operation_failed = dbmigrate_base - 30;

    // Transaction errors (-940 to -959)
    constexpr int transaction_nested_unsupported = dbmigrate_base - 40;
    constexpr int transaction_begin_failed = dbmigrate_base - 41;
    constexpr int transaction_commit_failed = dbmigrate_base - 42;
    constexpr int transaction_rollback_failed = dbmigrate_base - 43;
    constexpr int transaction_not_active = dbmigrate_base - 44;
    constexpr int transaction_savepoint_failed = dbmigrate_base - 45;
    constexpr int transaction_savepoint_not_found = dbmigrate_base - 46;
    constexpr int transaction_deadlock = dbmigrate_base - 47;
    constexpr int transaction_lock_timeout = dbmigrate_base - 48;
    constexpr int transaction_callback_failed = dbmigrate_base - 49;

    // Migration orchestration errors (-960 to -979)
    constexpr int migration_failed = dbmigrate_base - 60;
    constexpr int migration_rollback_failed = dbmigrate_base - 61;
    constexpr int migration_not_found = dbmigrate_base - 62;
    constexpr int migration_already_ran = dbmigrate_base - 63;
    constexpr int migration_not_ran = dbmigrate_base - 64;
    constexpr int migration_invalid = dbmigrate_base - 65;
    constexpr int migration_load_failed = dbmigrate_base - 66;
    constexpr int migration_generate_failed = dbmigrate_base - 67;
    constexpr int migration_lock_unavailable = dbmigrate_base - 68;

    // Configuration and connection errors (-980 to -999)
    constexpr int config_file_not_found = dbmigrate_base - 80;
    constexpr int config_read_error = dbmigrate_base - 81;
    constexpr int config_invalid_value = dbmigrate_base - 82;
    constexpr int database_open_error = dbmigrate_base - 83;
} // namespace error_codes

// Re-export common utility functions
using kcenon::common::ok;
using kcenon::common::make_error;

/**
 * @brief Create a dbmigrate void error result
 * @param code Error code from dbmigrate::error_codes
 * @param message Error message
 * @param module Originating module
 * @return VoidResult containing the error
 */
inline VoidResult void_error(int code, const std::string& message,
                             const std::string& module = "dbmigrate") {
    return VoidResult(error_info{code, message, module});
}

} // namespace dbmigrate
