/**
 * @file memory_connection.hpp
 * @brief In-memory SQLite connection shared by the storage and engine tests
 */

#pragma once

#include <dbmigrate/di/ilogger.hpp>
#include <dbmigrate/storage/sqlite_connection.hpp>

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <string>

namespace dbmigrate::test {

/// Connected in-memory database; fails the current test if it cannot open
inline auto make_memory_connection(storage::sqlite_options options = {},
                                   std::shared_ptr<di::ILogger> logger = nullptr)
    -> std::shared_ptr<storage::sqlite_connection> {
    auto db = std::make_shared<storage::sqlite_connection>(
        ":memory:", std::move(options), std::move(logger));
    auto connected = db->connect();
    REQUIRE(connected.is_ok());
    return db;
}

/// Number of rows in a table, addressed by its unprefixed name
inline auto row_count(storage::database_connection& db, const std::string& table)
    -> std::uint64_t {
    auto count = db.query().from(table).count();
    REQUIRE(count.is_ok());
    return count.value();
}

}  // namespace dbmigrate::test
