/**
 * @file transaction_manager.hpp
 * @brief Transaction and savepoint control of the schema port
 */

#pragma once

#include <dbmigrate/core/result.hpp>
#include <dbmigrate/di/ilogger.hpp>

#include <exception>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace dbmigrate::storage {

/**
 * @brief Abstract transaction controller owned by a database_connection
 *
 * Levels start at 0 (no transaction). begin() at level 0 opens the outer
 * transaction; adapters that support nesting map deeper levels onto
 * savepoints. Failures are reported as transaction_error values.
 *
 * **Thread Safety:** Not thread-safe, like the connection that owns it.
 */
class transaction_manager {
public:
    virtual ~transaction_manager() = default;

    transaction_manager(const transaction_manager&) = delete;
    auto operator=(const transaction_manager&) -> transaction_manager& = delete;
    transaction_manager(transaction_manager&&) = delete;
    auto operator=(transaction_manager&&) -> transaction_manager& = delete;

    [[nodiscard]] virtual auto begin() -> VoidResult = 0;
    [[nodiscard]] virtual auto commit() -> VoidResult = 0;
    [[nodiscard]] virtual auto rollback() -> VoidResult = 0;

    [[nodiscard]] virtual auto is_active() const noexcept -> bool = 0;

    /// Current nesting level, 0 when no transaction is open
    [[nodiscard]] virtual auto level() const noexcept -> int = 0;

    // ========================================================================
    // Savepoints
    // ========================================================================

    [[nodiscard]] virtual auto savepoint(std::string_view name) -> VoidResult = 0;
    [[nodiscard]] virtual auto rollback_to(std::string_view name) -> VoidResult = 0;
    [[nodiscard]] virtual auto release_savepoint(std::string_view name)
        -> VoidResult = 0;

    /**
     * @brief Execute a function within a transaction
     *
     * Begins a transaction, executes the function and commits. If the
     * function returns an error or throws, the transaction is rolled back
     * and the function's error is returned. A failed commit is rolled back
     * as well and its error returned. A failing rollback is logged and does
     * not replace the original error.
     *
     * @param func Callable returning VoidResult
     * @return Success if the function succeeds and the commit succeeds
     *
     * @example
     * @code
     * auto result = db.transaction().run([&]() -> VoidResult {
     *     return db.schema().create_table("users", "id INTEGER PRIMARY KEY");
     * });
     * @endcode
     */
    template <typename Func>
    [[nodiscard]] auto run(Func&& func) -> VoidResult {
        auto begin_result = begin();
        if (begin_result.is_err()) {
            return begin_result;
        }

        try {
            auto result = std::forward<Func>(func)();
            if (result.is_err()) {
                rollback_after_failure(result.error().message);
                return result;
            }

            auto committed = commit();
            if (committed.is_err() && is_active()) {
                rollback_after_failure(committed.error().message);
            }
            return committed;
        } catch (const std::exception& e) {
            rollback_after_failure(e.what());
            return VoidResult(error_info{
                error_codes::transaction_callback_failed,
                std::string("Transaction failed: ") + e.what(), "transaction"});
        }
    }

protected:
    explicit transaction_manager(std::shared_ptr<di::ILogger> logger)
        : logger_(logger ? std::move(logger) : di::null_logger()) {}

    [[nodiscard]] auto logger() const noexcept -> di::ILogger& { return *logger_; }

private:
    void rollback_after_failure(const std::string& reason) {
        auto rollback_result = rollback();
        if (rollback_result.is_err()) {
            logger_->error_fmt("Rollback after failure ({}) failed: {}", reason,
                               rollback_result.error().message);
        }
    }

    std::shared_ptr<di::ILogger> logger_;
};

}  // namespace dbmigrate::storage
