/**
 * @file migration_runner.hpp
 * @brief Orchestration of schema migrations with batch bookkeeping
 *
 * This file provides the migration_runner class which applies registered
 * migrations in version order, records each applied migration in the
 * "migrations" bookkeeping table under a batch number, and undoes them by
 * batch, by name, or all at once.
 *
 * @see migration.hpp, migration_loader.hpp
 */

#pragma once

#include <dbmigrate/core/result.hpp>
#include <dbmigrate/di/ilogger.hpp>
#include <dbmigrate/engine/migration.hpp>
#include <dbmigrate/engine/migration_catalog.hpp>
#include <dbmigrate/engine/migration_record.hpp>
#include <dbmigrate/errors/migration_error.hpp>
#include <dbmigrate/storage/database_connection.hpp>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dbmigrate::engine {

/**
 * @brief Runner options
 */
struct runner_options {
    /// Directory scanned by load_migrations() and written by generate()
    std::filesystem::path migrations_path;

    /// Hold a row lock in migrations_lock while changing the schema
    bool use_advisory_lock{false};

    /// Identity recorded in the lock row; generated when empty
    std::string lock_owner;
};

/**
 * @brief Applies and reverts migrations against one connection
 *
 * Each migration runs in its own transaction together with the insert (or
 * delete) of its bookkeeping row, so the table always reflects exactly the
 * migrations whose schema changes are committed. A failure stops the
 * operation; migrations committed before it stay committed.
 *
 * Registry order is version ascending. Rollback and reset follow the
 * bookkeeping order (batch DESC, id DESC), i.e. reverse insertion order.
 *
 * Errors are returned as migration errors (module "migration"); the typed
 * error including its cause is available from last_error().
 *
 * **Thread Safety:** This class is NOT thread-safe.
 *
 * @example
 * @code
 * auto db = std::make_shared<storage::sqlite_connection>("app.db");
 * (void)db->connect();
 *
 * migration_runner runner(db);
 * (void)runner.register_migration(std::make_shared<create_users_table>());
 *
 * auto ran = runner.migrate();
 * if (ran.is_err()) {
 *     std::cerr << ran.error().message << "\n";
 * }
 * @endcode
 */
class migration_runner {
public:
    /// Name of the bookkeeping table, before the connection's table prefix
    static constexpr std::string_view migrations_table = "migrations";

    /// Name of the advisory lock table, before the connection's table prefix
    static constexpr std::string_view lock_table = "migrations_lock";

    /// Key of the advisory lock row
    static constexpr std::string_view lock_name = "dbmigrate";

    explicit migration_runner(std::shared_ptr<storage::database_connection> db,
                              runner_options options = {},
                              std::shared_ptr<di::ILogger> logger = nullptr);

    ~migration_runner() = default;

    migration_runner(const migration_runner&) = delete;
    auto operator=(const migration_runner&) -> migration_runner& = delete;
    migration_runner(migration_runner&&) = delete;
    auto operator=(migration_runner&&) -> migration_runner& = delete;

    // ========================================================================
    // Registry
    // ========================================================================

    /**
     * @brief Add a migration to the registry
     *
     * A migration with the same name replaces the registered one.
     *
     * @return invalid_migration for a null pointer, an empty name or an
     *         empty version
     */
    [[nodiscard]] auto register_migration(std::shared_ptr<migration> m)
        -> VoidResult;

    /// Register each migration in turn, stopping at the first invalid one
    [[nodiscard]] auto register_all(
        const std::vector<std::shared_ptr<migration>>& migrations) -> VoidResult;

    /**
     * @brief Discover and register migrations from the configured path
     *
     * Every discovered migration is validated before any is registered, so
     * a bad file leaves the registry untouched. Failures are load_failed.
     *
     * @return Number of migrations registered
     */
    [[nodiscard]] auto load_migrations(const migration_catalog& catalog)
        -> Result<std::size_t>;

    /// Discover and register migrations from a directory
    [[nodiscard]] auto load_migrations(const std::filesystem::path& path,
                                       const migration_catalog& catalog)
        -> Result<std::size_t>;

    /// Registered migrations in version order
    [[nodiscard]] auto migrations() const
        -> const std::vector<std::shared_ptr<migration>>& {
        return registry_;
    }

    // ========================================================================
    // Schema Changes
    // ========================================================================

    /**
     * @brief Apply all pending migrations under one new batch
     *
     * @param pretend Report what would run without touching the database
     * @return Names of the migrations applied, possibly empty
     */
    [[nodiscard]] auto migrate(bool pretend = false)
        -> Result<std::vector<std::string>>;

    /**
     * @brief Apply one migration under the next batch number
     *
     * The migration is added to the registry so that it can be rolled back.
     *
     * @return migration_already_ran if it has a bookkeeping row
     */
    [[nodiscard]] auto run(std::shared_ptr<migration> m, bool pretend = false)
        -> VoidResult;

    /**
     * @brief Undo the migrations of the most recent batches
     *
     * @param steps Number of batches to undo
     * @param pretend Report what would be undone without executing
     * @return Names in the order undone; migration_not_found if a recorded
     *         migration is no longer registered
     */
    [[nodiscard]] auto rollback(int steps = 1, bool pretend = false)
        -> Result<std::vector<std::string>>;

    /**
     * @brief Undo one applied migration by name
     * @return migration_not_ran if it has no bookkeeping row
     */
    [[nodiscard]] auto revert(std::string_view name, bool pretend = false)
        -> VoidResult;

    /**
     * @brief Undo every applied migration
     *
     * Recorded migrations that are no longer registered are skipped.
     */
    [[nodiscard]] auto reset(bool pretend = false)
        -> Result<std::vector<std::string>>;

    /**
     * @brief reset() followed by migrate()
     * @return Names applied by the migrate phase
     */
    [[nodiscard]] auto refresh(bool pretend = false)
        -> Result<std::vector<std::string>>;

    // ========================================================================
    // Inspection
    // ========================================================================

    /// State of every registered migration; never creates the table
    [[nodiscard]] auto status() -> Result<std::vector<migration_status>>;

    /// Registered migrations without a bookkeeping row, in version order
    [[nodiscard]] auto get_pending()
        -> Result<std::vector<std::shared_ptr<migration>>>;

    /// Names with a bookkeeping row; empty when the table does not exist
    [[nodiscard]] auto get_completed() -> Result<std::vector<std::string>>;

    [[nodiscard]] auto has_pending() -> Result<bool>;

    /// Version of the most recently applied migration, "0" if unknown
    [[nodiscard]] auto get_current_version() -> Result<std::string>;

    /// Version of the last registered migration, "0" if none
    [[nodiscard]] auto get_latest_version() const -> std::string;

    /// max(batch) + 1, or 1 when nothing is recorded
    [[nodiscard]] auto get_next_batch_number() -> Result<int>;

    /// Pending migrations with their descriptions
    [[nodiscard]] auto preview() -> Result<std::vector<migration_preview>>;

    // ========================================================================
    // Bookkeeping Table
    // ========================================================================

    [[nodiscard]] auto create_migrations_table() -> VoidResult;

    [[nodiscard]] auto has_migrations_table() -> bool;

    // ========================================================================
    // Scaffolding
    // ========================================================================

    void set_migrations_path(std::filesystem::path path);

    [[nodiscard]] auto migrations_path() const noexcept
        -> const std::filesystem::path& {
        return options_.migrations_path;
    }

    /**
     * @brief Write a new migration source file
     *
     * Creates "<path>/<YYYY_MM_DD_HHMMSS>_<name>.cpp" declaring a class in
     * namespace "migrations". With a table and create set, up() creates the
     * table and down() drops it; otherwise both are empty stubs.
     *
     * @param name snake_case migration title
     * @param table Table to create
     * @param create Whether to scaffold create/drop of the table
     * @return Path of the written file
     */
    [[nodiscard]] auto generate(std::string_view name,
                                std::optional<std::string> table = std::nullopt,
                                bool create = true)
        -> Result<std::filesystem::path>;

    /// StudlyCase class name used by generate()
    [[nodiscard]] static auto class_name_for(std::string_view name)
        -> std::string;

    // ========================================================================
    // Errors
    // ========================================================================

    /// Typed error of the most recent failed operation
    [[nodiscard]] auto last_error() const noexcept
        -> const std::optional<errors::migration_error>& {
        return last_error_;
    }

private:
    [[nodiscard]] auto do_migrate(bool pretend) -> Result<std::vector<std::string>>;
    [[nodiscard]] auto do_reset(bool pretend) -> Result<std::vector<std::string>>;

    [[nodiscard]] auto apply(migration& m, int batch) -> VoidResult;
    [[nodiscard]] auto revert_applied(migration& m, const std::string& name)
        -> VoidResult;

    [[nodiscard]] auto ensure_migrations_table() -> VoidResult;

    /// Like has_migrations_table(), but a failed lookup is an error
    [[nodiscard]] auto migrations_table_exists() -> Result<bool>;
    [[nodiscard]] auto has_run(const std::string& name) -> Result<bool>;
    [[nodiscard]] auto find_migration(std::string_view name) const
        -> std::shared_ptr<migration>;
    [[nodiscard]] auto applied_in_reverse(std::optional<int> min_batch)
        -> Result<storage::database_result>;

    [[nodiscard]] auto acquire_lock() -> VoidResult;
    void release_lock();

    template <typename Func>
    auto locked(bool pretend, Func&& func) -> decltype(func());

    /// Record, log and convert a failure
    auto fail(errors::migration_error error) -> error_info;

    /// Wrap a bookkeeping (non per-migration) failure
    auto bookkeeping_failed(const error_info& cause) -> error_info;

    std::shared_ptr<storage::database_connection> db_;
    runner_options options_;
    std::shared_ptr<di::ILogger> logger_;
    std::vector<std::shared_ptr<migration>> registry_;
    std::optional<errors::migration_error> last_error_;
};

}  // namespace dbmigrate::engine
