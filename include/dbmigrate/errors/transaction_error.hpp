/**
 * @file transaction_error.hpp
 * @brief Errors raised by transaction and savepoint control
 */

#pragma once

#include <dbmigrate/core/result.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace dbmigrate::errors {

/**
 * @brief Failed transaction control statement
 *
 * Carries the nesting level at which the failure happened and, for
 * savepoint operations, the savepoint name.
 */
class transaction_error {
public:
    transaction_error(int code, std::string message, int level = 0,
                      std::optional<std::string> savepoint = std::nullopt);

    [[nodiscard]] static auto nested_not_supported() -> transaction_error;
    [[nodiscard]] static auto begin_failed(std::string_view reason, int level)
        -> transaction_error;
    [[nodiscard]] static auto commit_failed(std::string_view reason, int level)
        -> transaction_error;
    [[nodiscard]] static auto rollback_failed(std::string_view reason,
                                              int level) -> transaction_error;

    /// @param operation The attempted operation, e.g. "commit"
    [[nodiscard]] static auto no_active_transaction(std::string_view operation)
        -> transaction_error;
    [[nodiscard]] static auto savepoint_failed(std::string_view name,
                                               std::string_view operation)
        -> transaction_error;
    [[nodiscard]] static auto savepoint_not_found(std::string_view name)
        -> transaction_error;
    [[nodiscard]] static auto deadlock_detected() -> transaction_error;
    [[nodiscard]] static auto lock_timeout() -> transaction_error;

    /**
     * @brief Rebuild from a transported error_info
     * @return The transaction error, or std::nullopt for other modules
     */
    [[nodiscard]] static auto from_error_info(const error_info& info)
        -> std::optional<transaction_error>;

    [[nodiscard]] auto code() const noexcept -> int { return code_; }
    [[nodiscard]] auto message() const noexcept -> const std::string& {
        return message_;
    }
    [[nodiscard]] auto level() const noexcept -> int { return level_; }
    [[nodiscard]] auto savepoint() const noexcept
        -> const std::optional<std::string>& {
        return savepoint_;
    }

    [[nodiscard]] auto is_retryable() const noexcept -> bool {
        return code_ == error_codes::transaction_deadlock ||
               code_ == error_codes::transaction_lock_timeout;
    }

    /// module is "transaction"; details holds the savepoint name when known
    [[nodiscard]] auto to_error_info() const -> error_info;

    static constexpr std::string_view module_name = "transaction";

private:
    int code_;
    std::string message_;
    int level_;
    std::optional<std::string> savepoint_;
};

}  // namespace dbmigrate::errors
