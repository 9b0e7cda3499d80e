/**
 * @file database_connection.cpp
 * @brief Non-virtual helpers of the connection port
 */

#include <dbmigrate/storage/database_connection.hpp>

namespace dbmigrate::storage {

auto database_connection::full_table_name(std::string_view table) const
    -> std::string {
    return table_prefix() + std::string(table);
}

auto database_connection::query() -> query_builder {
    return query_builder(*this);
}

}  // namespace dbmigrate::storage
