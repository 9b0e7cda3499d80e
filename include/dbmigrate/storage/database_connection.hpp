/**
 * @file database_connection.hpp
 * @brief Schema/connection port consumed by the migration engine
 *
 * The engine never talks to a driver directly. It sees a database through
 * this interface: parameterized statements, a query builder, transaction
 * control and DDL. Adapters (see sqlite_connection.hpp) implement it.
 */

#pragma once

#include <dbmigrate/core/result.hpp>
#include <dbmigrate/storage/database_types.hpp>
#include <dbmigrate/storage/query_builder.hpp>
#include <dbmigrate/storage/schema_manager.hpp>
#include <dbmigrate/storage/transaction_manager.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace dbmigrate::storage {

/**
 * @brief Abstract database connection
 *
 * **Thread Safety:** Not thread-safe. Callers serialize access.
 */
class database_connection {
public:
    virtual ~database_connection() = default;

    database_connection(const database_connection&) = delete;
    auto operator=(const database_connection&) -> database_connection& = delete;
    database_connection(database_connection&&) = delete;
    auto operator=(database_connection&&) -> database_connection& = delete;

    // ========================================================================
    // Connection Management
    // ========================================================================

    [[nodiscard]] virtual auto connect() -> VoidResult = 0;
    virtual void disconnect() = 0;
    [[nodiscard]] virtual auto is_connected() const noexcept -> bool = 0;

    /// Short driver identifier, e.g. "sqlite"
    [[nodiscard]] virtual auto driver_name() const -> std::string = 0;

    [[nodiscard]] virtual auto table_prefix() const -> const std::string& = 0;

    /// Table name with the connection's prefix applied
    [[nodiscard]] auto full_table_name(std::string_view table) const
        -> std::string;

    [[nodiscard]] virtual auto quote_identifier(std::string_view identifier) const
        -> std::string = 0;

    // ========================================================================
    // Statements
    // ========================================================================

    /**
     * @brief Run a query returning rows
     *
     * @param sql Statement with '?' placeholders
     * @param bindings Values for the placeholders, in order
     * @return Rows on success, a query_error on failure
     */
    [[nodiscard]] virtual auto select(const std::string& sql,
                                      const binding_list& bindings = {})
        -> Result<database_result> = 0;

    /**
     * @brief Run a statement that does not return rows
     * @return Number of affected rows on success, a query_error on failure
     */
    [[nodiscard]] virtual auto execute(const std::string& sql,
                                       const binding_list& bindings = {})
        -> Result<std::uint64_t> = 0;

    [[nodiscard]] virtual auto last_insert_id() const -> std::int64_t = 0;

    // ========================================================================
    // Sub-interfaces
    // ========================================================================

    /// New query builder bound to this connection
    [[nodiscard]] auto query() -> query_builder;

    [[nodiscard]] virtual auto transaction() -> transaction_manager& = 0;

    [[nodiscard]] virtual auto schema() -> schema_manager& = 0;

protected:
    database_connection() = default;
};

}  // namespace dbmigrate::storage
