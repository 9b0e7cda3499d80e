/**
 * @file sqlite_transaction_manager.cpp
 * @brief Implementation of SQLite transaction control
 */

#include <dbmigrate/storage/sqlite_transaction_manager.hpp>

#include <dbmigrate/compat/format.hpp>
#include <dbmigrate/errors/query_error.hpp>
#include <dbmigrate/errors/transaction_error.hpp>
#include <dbmigrate/storage/sqlite_connection.hpp>

#include <algorithm>
#include <iterator>

namespace dbmigrate::storage {

namespace {

/// Lock contention on COMMIT is reported with the retryable errors
auto classify_commit_failure(const error_info& cause, int level)
    -> errors::transaction_error {
    if (auto query = errors::query_error::from_error_info(cause)) {
        if (query->is_deadlock()) {
            return errors::transaction_error::deadlock_detected();
        }
        if (query->is_lock_timeout()) {
            return errors::transaction_error::lock_timeout();
        }
    }
    return errors::transaction_error::commit_failed(cause.message, level);
}

}  // namespace

sqlite_transaction_manager::sqlite_transaction_manager(
    sqlite_connection& db, std::shared_ptr<di::ILogger> logger)
    : transaction_manager(std::move(logger)), db_(db) {}

// ============================================================================
// Transactions
// ============================================================================

auto sqlite_transaction_manager::begin() -> VoidResult {
    if (level_ == 0) {
        auto result = db_.execute("BEGIN IMMEDIATE");
        if (result.is_err()) {
            if (auto query =
                    errors::query_error::from_error_info(result.error());
                query && query->is_lock_timeout()) {
                return errors::transaction_error::lock_timeout().to_error_info();
            }
            return errors::transaction_error::begin_failed(
                       result.error().message, level_ + 1)
                .to_error_info();
        }
        level_ = 1;
        logger().debug("Transaction started");
        return ok();
    }

    if (!db_.options().allow_nested_transactions) {
        return errors::transaction_error::nested_not_supported().to_error_info();
    }

    auto name = nested_savepoint_name(level_ + 1);
    auto result = db_.execute("SAVEPOINT " + name);
    if (result.is_err()) {
        return errors::transaction_error::begin_failed(result.error().message,
                                                       level_ + 1)
            .to_error_info();
    }

    ++level_;
    logger().debug_fmt("Nested transaction started at level {}", level_);
    return ok();
}

auto sqlite_transaction_manager::commit() -> VoidResult {
    if (level_ == 0) {
        return errors::transaction_error::no_active_transaction("commit")
            .to_error_info();
    }

    if (level_ == 1) {
        auto result = db_.execute("COMMIT");
        if (result.is_err()) {
            // A failed COMMIT (deferred constraint, SQLITE_BUSY) leaves the
            // transaction open; nothing of it may survive
            if (db_.in_transaction()) {
                auto rolled_back = db_.execute("ROLLBACK");
                if (rolled_back.is_err()) {
                    logger().error_fmt("Rollback after failed commit failed: {}",
                                       rolled_back.error().message);
                }
            }
            level_ = 0;
            savepoints_.clear();
            return classify_commit_failure(result.error(), 1).to_error_info();
        }
        level_ = 0;
        savepoints_.clear();
        logger().debug("Transaction committed");
        return ok();
    }

    auto result = db_.execute("RELEASE SAVEPOINT " + nested_savepoint_name(level_));
    if (result.is_err()) {
        return classify_commit_failure(result.error(), level_).to_error_info();
    }

    --level_;
    return ok();
}

auto sqlite_transaction_manager::rollback() -> VoidResult {
    if (level_ == 0) {
        return errors::transaction_error::no_active_transaction("rollback")
            .to_error_info();
    }

    if (level_ == 1) {
        auto result = db_.execute("ROLLBACK");
        // No transaction is open afterwards, even if ROLLBACK itself failed
        level_ = 0;
        savepoints_.clear();
        if (result.is_err()) {
            return errors::transaction_error::rollback_failed(
                       result.error().message, 1)
                .to_error_info();
        }
        logger().debug("Transaction rolled back");
        return ok();
    }

    auto name = nested_savepoint_name(level_);
    auto result = db_.execute_script(compat::format(
        "ROLLBACK TO SAVEPOINT {0}; RELEASE SAVEPOINT {0}", name));
    if (result.is_err()) {
        return errors::transaction_error::rollback_failed(
                   result.error().message, level_)
            .to_error_info();
    }

    --level_;
    return ok();
}

auto sqlite_transaction_manager::is_active() const noexcept -> bool {
    return level_ > 0;
}

auto sqlite_transaction_manager::level() const noexcept -> int {
    return level_;
}

// ============================================================================
// Savepoints
// ============================================================================

auto sqlite_transaction_manager::savepoint(std::string_view name) -> VoidResult {
    if (level_ == 0) {
        return errors::transaction_error::no_active_transaction("create savepoint")
            .to_error_info();
    }

    auto result = db_.execute("SAVEPOINT " + db_.quote_identifier(name));
    if (result.is_err()) {
        return errors::transaction_error::savepoint_failed(name, "create")
            .to_error_info();
    }

    savepoints_.emplace_back(name);
    return ok();
}

auto sqlite_transaction_manager::rollback_to(std::string_view name)
    -> VoidResult {
    if (!has_savepoint(name)) {
        return errors::transaction_error::savepoint_not_found(name)
            .to_error_info();
    }

    auto result =
        db_.execute("ROLLBACK TO SAVEPOINT " + db_.quote_identifier(name));
    if (result.is_err()) {
        return errors::transaction_error::savepoint_failed(name, "rollback")
            .to_error_info();
    }

    // Savepoints created after this one no longer exist
    auto it = std::find(savepoints_.rbegin(), savepoints_.rend(), name);
    savepoints_.erase(it.base(), savepoints_.end());
    return ok();
}

auto sqlite_transaction_manager::release_savepoint(std::string_view name)
    -> VoidResult {
    if (!has_savepoint(name)) {
        return errors::transaction_error::savepoint_not_found(name)
            .to_error_info();
    }

    auto result = db_.execute("RELEASE SAVEPOINT " + db_.quote_identifier(name));
    if (result.is_err()) {
        return errors::transaction_error::savepoint_failed(name, "release")
            .to_error_info();
    }

    auto it = std::find(savepoints_.rbegin(), savepoints_.rend(), name);
    savepoints_.erase(std::prev(it.base()), savepoints_.end());
    return ok();
}

void sqlite_transaction_manager::reset() noexcept {
    level_ = 0;
    savepoints_.clear();
}

// ============================================================================
// Private Helpers
// ============================================================================

auto sqlite_transaction_manager::has_savepoint(std::string_view name) const
    -> bool {
    return std::find(savepoints_.begin(), savepoints_.end(), name) !=
           savepoints_.end();
}

auto sqlite_transaction_manager::nested_savepoint_name(int level)
    -> std::string {
    return "trans" + std::to_string(level);
}

}  // namespace dbmigrate::storage
