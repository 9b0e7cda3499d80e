/**
 * @file query_builder.hpp
 * @brief Minimal fluent query builder over a database_connection
 *
 * Produces vendor-neutral SQL with positional '?' placeholders. Only the
 * subset needed for bookkeeping is supported: single-table SELECT with
 * AND-ed conditions, ordering and limit, INSERT of one row, and DELETE.
 */

#pragma once

#include <dbmigrate/core/result.hpp>
#include <dbmigrate/errors/query_error.hpp>
#include <dbmigrate/storage/database_types.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dbmigrate::storage {

class database_connection;

/**
 * @brief Fluent builder bound to a connection
 *
 * Builders are cheap value objects; create one per statement through
 * database_connection::query(). An unsupported comparison operator is
 * remembered and reported as a query_error by the terminal call.
 *
 * @example
 * @code
 * auto rows = db.query()
 *                 .from("migrations")
 *                 .where("batch", ">=", "2")
 *                 .order_by("batch", sort_direction::descending)
 *                 .get();
 * @endcode
 */
class query_builder {
public:
    explicit query_builder(database_connection& db);

    // ========================================================================
    // Clauses
    // ========================================================================

    auto from(std::string_view table) -> query_builder&;

    /// Alias of from()
    auto table(std::string_view table) -> query_builder&;

    /// Columns to select; all columns when never called
    auto select(std::vector<std::string> columns) -> query_builder&;

    /**
     * @brief Add an AND-ed condition
     *
     * @param op One of = != <> < <= > >= LIKE
     */
    auto where(std::string_view column, std::string_view op, std::string value)
        -> query_builder&;

    /// Equality shorthand
    auto where(std::string_view column, std::string value) -> query_builder&;

    auto order_by(std::string_view column,
                  sort_direction direction = sort_direction::ascending)
        -> query_builder&;

    auto limit(std::size_t count) -> query_builder&;

    // ========================================================================
    // Terminals
    // ========================================================================

    [[nodiscard]] auto get() const -> Result<database_result>;

    /// First matching row, std::nullopt when nothing matches
    [[nodiscard]] auto first() const -> Result<std::optional<database_row>>;

    /// Values of one column; NULL values are skipped
    [[nodiscard]] auto pluck(std::string_view column) const
        -> Result<std::vector<std::string>>;

    /// Maximum of a column, std::nullopt for an empty match set
    [[nodiscard]] auto max(std::string_view column) const
        -> Result<std::optional<std::string>>;

    [[nodiscard]] auto count() const -> Result<std::uint64_t>;

    /**
     * @brief Insert one row into the target table
     * @return Identifier of the inserted row
     */
    [[nodiscard]] auto insert(const database_row& row) const
        -> Result<std::int64_t>;

    /**
     * @brief Delete the rows matching the conditions
     * @return Number of rows deleted
     */
    [[nodiscard]] auto remove() const -> Result<std::uint64_t>;

    // ========================================================================
    // Inspection
    // ========================================================================

    /// SELECT statement for the current clauses
    [[nodiscard]] auto to_sql() const -> std::string;

    /// Bindings of the current conditions, in placeholder order
    [[nodiscard]] auto bindings() const -> binding_list;

private:
    struct condition {
        std::string column;
        std::string op;
        std::string value;
    };

    struct ordering {
        std::string column;
        sort_direction direction;
    };

    [[nodiscard]] auto build_select(std::string_view projection) const
        -> std::string;
    [[nodiscard]] auto build_where() const -> std::string;
    [[nodiscard]] auto target_table() const -> std::string;
    [[nodiscard]] auto validate() const -> VoidResult;

    database_connection* db_;
    std::string table_;
    std::vector<std::string> columns_;
    std::vector<condition> conditions_;
    std::vector<ordering> orderings_;
    std::optional<std::size_t> limit_;
    std::optional<errors::query_error> error_;
};

}  // namespace dbmigrate::storage
