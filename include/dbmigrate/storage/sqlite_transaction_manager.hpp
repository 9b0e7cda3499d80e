/**
 * @file sqlite_transaction_manager.hpp
 * @brief SQLite implementation of transaction_manager
 */

#pragma once

#include <dbmigrate/storage/transaction_manager.hpp>

#include <string>
#include <vector>

namespace dbmigrate::storage {

class sqlite_connection;

/**
 * @brief Transaction control for sqlite_connection
 *
 * The outer transaction is opened with BEGIN IMMEDIATE so that the write
 * lock is taken up front. Nested levels use savepoints named trans2,
 * trans3, ... when nesting is allowed by the connection options.
 */
class sqlite_transaction_manager final : public transaction_manager {
public:
    sqlite_transaction_manager(sqlite_connection& db,
                               std::shared_ptr<di::ILogger> logger);

    [[nodiscard]] auto begin() -> VoidResult override;
    [[nodiscard]] auto commit() -> VoidResult override;
    [[nodiscard]] auto rollback() -> VoidResult override;
    [[nodiscard]] auto is_active() const noexcept -> bool override;
    [[nodiscard]] auto level() const noexcept -> int override;

    [[nodiscard]] auto savepoint(std::string_view name) -> VoidResult override;
    [[nodiscard]] auto rollback_to(std::string_view name) -> VoidResult override;
    [[nodiscard]] auto release_savepoint(std::string_view name)
        -> VoidResult override;

    /// Forget all state after the connection was closed
    void reset() noexcept;

private:
    [[nodiscard]] auto has_savepoint(std::string_view name) const -> bool;
    [[nodiscard]] static auto nested_savepoint_name(int level) -> std::string;

    sqlite_connection& db_;
    int level_{0};
    std::vector<std::string> savepoints_;
};

}  // namespace dbmigrate::storage
