/**
 * @file transaction_error.cpp
 * @brief Implementation of transaction error constructors
 */

#include <dbmigrate/errors/transaction_error.hpp>

#include <dbmigrate/compat/format.hpp>

namespace dbmigrate::errors {

transaction_error::transaction_error(int code, std::string message, int level,
                                     std::optional<std::string> savepoint)
    : code_(code),
      message_(std::move(message)),
      level_(level),
      savepoint_(std::move(savepoint)) {}

auto transaction_error::nested_not_supported() -> transaction_error {
    return {error_codes::transaction_nested_unsupported,
            "Nested transactions are not supported by this database driver"};
}

auto transaction_error::begin_failed(std::string_view reason, int level)
    -> transaction_error {
    return {error_codes::transaction_begin_failed,
            compat::format("Failed to begin transaction: {}", reason), level};
}

auto transaction_error::commit_failed(std::string_view reason, int level)
    -> transaction_error {
    return {error_codes::transaction_commit_failed,
            compat::format("Failed to commit transaction: {}", reason), level};
}

auto transaction_error::rollback_failed(std::string_view reason, int level)
    -> transaction_error {
    return {error_codes::transaction_rollback_failed,
            compat::format("Failed to rollback transaction: {}", reason),
            level};
}

auto transaction_error::no_active_transaction(std::string_view operation)
    -> transaction_error {
    return {error_codes::transaction_not_active,
            compat::format("Cannot {}: no active transaction", operation)};
}

auto transaction_error::savepoint_failed(std::string_view name,
                                         std::string_view operation)
    -> transaction_error {
    return {error_codes::transaction_savepoint_failed,
            compat::format("Savepoint \"{}\" {} failed", name, operation), 0,
            std::string(name)};
}

auto transaction_error::savepoint_not_found(std::string_view name)
    -> transaction_error {
    return {error_codes::transaction_savepoint_not_found,
            compat::format("Savepoint \"{}\" does not exist", name), 0,
            std::string(name)};
}

auto transaction_error::deadlock_detected() -> transaction_error {
    return {error_codes::transaction_deadlock,
            "Deadlock detected, transaction rolled back"};
}

auto transaction_error::lock_timeout() -> transaction_error {
    return {error_codes::transaction_lock_timeout,
            "Lock wait timeout exceeded"};
}

auto transaction_error::from_error_info(const error_info& info)
    -> std::optional<transaction_error> {
    if (info.module != module_name) {
        return std::nullopt;
    }
    return transaction_error(info.code, info.message);
}

auto transaction_error::to_error_info() const -> error_info {
    if (savepoint_) {
        return error_info{code_, message_, std::string(module_name),
                          *savepoint_};
    }
    return error_info{code_, message_, std::string(module_name)};
}

}  // namespace dbmigrate::errors
