/**
 * @file migration.hpp
 * @brief Base class for reversible schema migrations
 *
 * A migration is a named, versioned unit of schema change with an up()
 * step and a down() step that undoes it. The runner orders migrations by
 * version and records applied ones by name.
 */

#pragma once

#include <dbmigrate/core/result.hpp>
#include <dbmigrate/storage/database_connection.hpp>

#include <functional>
#include <string>
#include <string_view>

namespace dbmigrate::engine {

/**
 * @brief Abstract migration
 *
 * Names are conventionally "<YYYY_MM_DD_HHMMSS>_<snake_case_title>". When no
 * version is passed explicitly it is taken from that timestamp prefix.
 *
 * @example
 * @code
 * class create_users_table final : public migration {
 * public:
 *     create_users_table()
 *         : migration("2024_01_15_093000_create_users_table") {}
 *
 *     auto up(storage::database_connection& db) -> VoidResult override {
 *         return db.schema().create_table(
 *             "users", "id INTEGER PRIMARY KEY AUTOINCREMENT, email TEXT");
 *     }
 *
 *     auto down(storage::database_connection& db) -> VoidResult override {
 *         return db.schema().drop_table("users");
 *     }
 * };
 * @endcode
 */
class migration {
public:
    /**
     * @brief Construct a migration
     *
     * @param name Unique migration name
     * @param version Sortable version; extracted from the name when empty
     */
    explicit migration(std::string name, std::string version = {});

    virtual ~migration() = default;

    migration(const migration&) = delete;
    auto operator=(const migration&) -> migration& = delete;

    [[nodiscard]] auto name() const noexcept -> const std::string& {
        return name_;
    }

    /// Empty when neither given nor derivable from the name
    [[nodiscard]] auto version() const noexcept -> const std::string& {
        return version_;
    }

    /// Human readable summary; the name without its timestamp by default
    [[nodiscard]] virtual auto description() const -> std::string;

    /// Apply the schema change
    [[nodiscard]] virtual auto up(storage::database_connection& db)
        -> VoidResult = 0;

    /// Undo the structural effect of up()
    [[nodiscard]] virtual auto down(storage::database_connection& db)
        -> VoidResult = 0;

    /**
     * @brief Extract a leading YYYY_MM_DD_HHMMSS token
     * @return The token, or an empty string if the name has none
     */
    [[nodiscard]] static auto extract_version(std::string_view name)
        -> std::string;

private:
    std::string name_;
    std::string version_;
};

/**
 * @brief Migration built from two callables
 *
 * Convenient for migrations defined inline and for tests.
 */
class callback_migration final : public migration {
public:
    using step_function = std::function<VoidResult(storage::database_connection&)>;

    callback_migration(std::string name, step_function up, step_function down,
                       std::string version = {});

    [[nodiscard]] auto up(storage::database_connection& db) -> VoidResult override;
    [[nodiscard]] auto down(storage::database_connection& db) -> VoidResult override;

private:
    step_function up_;
    step_function down_;
};

}  // namespace dbmigrate::engine
