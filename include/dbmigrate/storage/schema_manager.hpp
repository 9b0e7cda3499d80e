/**
 * @file schema_manager.hpp
 * @brief DDL operations of the schema port
 */

#pragma once

#include <dbmigrate/core/result.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace dbmigrate::storage {

/**
 * @brief Abstract DDL interface owned by a database_connection
 *
 * Table names are given without the connection's table prefix; the
 * implementation applies it. Failures are reported as schema_error values,
 * except driver lock contention (deadlock, lock timeout), which keeps its
 * original query_error so that callers can tell it is worth retrying.
 */
class schema_manager {
public:
    virtual ~schema_manager() = default;

    // ========================================================================
    // Tables
    // ========================================================================

    /**
     * @brief Create a table
     *
     * @param table Table name (unprefixed)
     * @param definition Column and constraint list, without parentheses
     * @return table_already_exists if present, table_creation_failed on
     *         driver error
     */
    [[nodiscard]] virtual auto create_table(std::string_view table,
                                            std::string_view definition)
        -> VoidResult = 0;

    /// @return table_not_found if the table is absent
    [[nodiscard]] virtual auto drop_table(std::string_view table) -> VoidResult = 0;

    [[nodiscard]] virtual auto drop_table_if_exists(std::string_view table)
        -> VoidResult = 0;

    /// Convenience check; a failed catalog lookup is logged and reads as absent
    [[nodiscard]] virtual auto table_exists(std::string_view table) -> bool = 0;

    /**
     * @brief Check for a table without hiding lookup failures
     *
     * @return false when the table is absent, the driver error when the
     *         catalog cannot be read
     */
    [[nodiscard]] virtual auto has_table(std::string_view table) -> Result<bool> = 0;

    // ========================================================================
    // Columns
    // ========================================================================

    [[nodiscard]] virtual auto add_column(std::string_view table,
                                          std::string_view column,
                                          std::string_view definition)
        -> VoidResult = 0;

    [[nodiscard]] virtual auto drop_column(std::string_view table,
                                           std::string_view column)
        -> VoidResult = 0;

    [[nodiscard]] virtual auto column_exists(std::string_view table,
                                             std::string_view column)
        -> bool = 0;

    // ========================================================================
    // Indexes and constraints
    // ========================================================================

    [[nodiscard]] virtual auto add_index(std::string_view table,
                                         std::string_view index,
                                         const std::vector<std::string>& columns,
                                         bool unique = false) -> VoidResult = 0;

    [[nodiscard]] virtual auto drop_index(std::string_view table,
                                          std::string_view index)
        -> VoidResult = 0;

    [[nodiscard]] virtual auto index_exists(std::string_view table,
                                            std::string_view index)
        -> bool = 0;

    /**
     * @brief Add a foreign key constraint to an existing table
     *
     * @param on_delete Referential action, e.g. "CASCADE"; empty for none
     */
    [[nodiscard]] virtual auto add_foreign_key(std::string_view table,
                                               std::string_view constraint,
                                               std::string_view column,
                                               std::string_view referenced_table,
                                               std::string_view referenced_column,
                                               std::string_view on_delete = {})
        -> VoidResult = 0;

    /**
     * @brief Execute arbitrary DDL
     *
     * The statement may contain several semicolon separated statements.
     */
    [[nodiscard]] virtual auto raw(std::string_view sql) -> VoidResult = 0;

protected:
    schema_manager() = default;
    schema_manager(const schema_manager&) = default;
    auto operator=(const schema_manager&) -> schema_manager& = default;
};

}  // namespace dbmigrate::storage
