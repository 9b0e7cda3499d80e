/**
 * @file migration_error.cpp
 * @brief Implementation of migration errors and retry classification
 */

#include <dbmigrate/errors/migration_error.hpp>

#include <dbmigrate/compat/format.hpp>
#include <dbmigrate/errors/query_error.hpp>
#include <dbmigrate/errors/transaction_error.hpp>

namespace dbmigrate::errors {

migration_error::migration_error(int code, std::string message,
                                 std::optional<std::string> migration_name,
                                 std::optional<error_info> cause)
    : code_(code),
      message_(std::move(message)),
      migration_name_(std::move(migration_name)),
      cause_(std::move(cause)) {}

auto migration_error::migration_failed(std::string_view name,
                                       const error_info& cause)
    -> migration_error {
    return {error_codes::migration_failed,
            compat::format("Migration [{}] failed: {}", name, cause.message),
            std::string(name), cause};
}

auto migration_error::rollback_failed(std::string_view name,
                                      const error_info& cause)
    -> migration_error {
    return {error_codes::migration_rollback_failed,
            compat::format("Rollback of migration [{}] failed: {}", name,
                           cause.message),
            std::string(name), cause};
}

auto migration_error::migration_not_found(std::string_view name)
    -> migration_error {
    return {error_codes::migration_not_found,
            compat::format("Migration [{}] not found", name),
            std::string(name)};
}

auto migration_error::migration_already_ran(std::string_view name)
    -> migration_error {
    return {error_codes::migration_already_ran,
            compat::format("Migration [{}] has already been executed", name),
            std::string(name)};
}

auto migration_error::migration_not_ran(std::string_view name)
    -> migration_error {
    return {error_codes::migration_not_ran,
            compat::format(
                "Migration [{}] has not been executed and cannot be rolled back",
                name),
            std::string(name)};
}

auto migration_error::invalid_migration(std::string_view name,
                                        std::string_view reason)
    -> migration_error {
    return {error_codes::migration_invalid,
            compat::format("Invalid migration [{}]: {}", name, reason),
            std::string(name)};
}

auto migration_error::load_failed(std::string_view path,
                                  std::string_view reason) -> migration_error {
    return {error_codes::migration_load_failed,
            compat::format("Failed to load migrations from [{}]: {}", path,
                           reason)};
}

auto migration_error::generate_failed(std::string_view name,
                                      std::string_view reason)
    -> migration_error {
    return {error_codes::migration_generate_failed,
            compat::format("Failed to generate migration [{}]: {}", name,
                           reason),
            std::string(name)};
}

auto migration_error::lock_unavailable(std::string_view lock,
                                       std::string_view holder)
    -> migration_error {
    return {error_codes::migration_lock_unavailable,
            compat::format("Migration lock [{}] is held by {}", lock, holder)};
}

auto migration_error::with_sql(std::string sql) -> migration_error& {
    sql_ = std::move(sql);
    return *this;
}

auto migration_error::is_retryable() const -> bool {
    return cause_ && errors::is_retryable(*cause_);
}

auto migration_error::to_error_info() const -> error_info {
    if (migration_name_) {
        return error_info{code_, message_, std::string(module_name),
                          *migration_name_};
    }
    return error_info{code_, message_, std::string(module_name)};
}

// ============================================================================
// Classification
// ============================================================================

auto is_retryable(const error_info& info) -> bool {
    if (auto query = query_error::from_error_info(info)) {
        return query->is_retryable();
    }
    if (auto transaction = transaction_error::from_error_info(info)) {
        return transaction->is_retryable();
    }
    return false;
}

}  // namespace dbmigrate::errors
