/**
 * @file database_types.hpp
 * @brief Row, result set and binding types shared by the schema port
 *
 * These are plain value types with no dependency on a database driver, so
 * they can be used by the error taxonomy as well as by adapters.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace dbmigrate::storage {

/**
 * @brief Database row type alias
 *
 * Represents a single row from query results as key-value pairs where keys
 * are column names and values are string representations. Columns holding
 * SQL NULL are absent from the row.
 */
using database_row = std::map<std::string, std::string>;

/**
 * @brief Ordered parameter bindings
 *
 * Each entry pairs the column (or parameter) name with the bound value. The
 * name is kept so that sensitive values can be redacted from error reports.
 */
using binding_list = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Query result structure
 *
 * Contains the rows of a SELECT and the affected row count of a write.
 */
struct database_result {
    /// Result rows from SELECT queries
    std::vector<database_row> rows;

    /// Number of rows affected by INSERT/UPDATE/DELETE
    std::size_t affected_rows{0};

    /// Query execution time
    std::chrono::microseconds execution_time{0};

    /// Check if result is empty
    [[nodiscard]] auto empty() const noexcept -> bool { return rows.empty(); }

    /// Get number of rows
    [[nodiscard]] auto size() const noexcept -> std::size_t {
        return rows.size();
    }

    /// Row access operator
    [[nodiscard]] auto operator[](std::size_t index) const
        -> const database_row& {
        return rows.at(index);
    }

    // Iterator support
    auto begin() { return rows.begin(); }
    auto end() { return rows.end(); }
    [[nodiscard]] auto begin() const { return rows.begin(); }
    [[nodiscard]] auto end() const { return rows.end(); }
};

/**
 * @brief Sort direction for ORDER BY clauses
 */
enum class sort_direction { ascending, descending };

}  // namespace dbmigrate::storage
