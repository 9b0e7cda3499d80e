/**
 * @file sqlite_connection.cpp
 * @brief Implementation of the SQLite adapter
 */

#include <dbmigrate/storage/sqlite_connection.hpp>

#include <dbmigrate/compat/format.hpp>
#include <dbmigrate/errors/query_error.hpp>
#include <dbmigrate/storage/sqlite_schema_manager.hpp>
#include <dbmigrate/storage/sqlite_transaction_manager.hpp>

#include <sqlite3.h>

#include <chrono>

namespace dbmigrate::storage {

namespace {

/// SQL state for a SQLite failure, following the PDO SQLite driver
auto derive_sql_state(int extended_code, std::string_view message)
    -> std::string {
    switch (extended_code & 0xff) {
        case SQLITE_CONSTRAINT:
            return "23000";
        case SQLITE_BUSY:
            return "HYT00";
        case SQLITE_LOCKED:
            return "40001";
        default:
            break;
    }

    if (message.find("syntax error") != std::string_view::npos) {
        return "42000";
    }
    if (message.find("no such table") != std::string_view::npos) {
        return "42S02";
    }
    if (message.find("no such column") != std::string_view::npos) {
        return "42S22";
    }
    return "HY000";
}

}  // namespace

// ============================================================================
// Implementation Class
// ============================================================================

class sqlite_connection::impl {
public:
    impl(std::string path, sqlite_options options,
         std::shared_ptr<di::ILogger> logger)
        : path_(std::move(path)),
          options_(std::move(options)),
          logger_(logger ? std::move(logger) : di::null_logger()) {}

    ~impl() { close(); }

    impl(const impl&) = delete;
    auto operator=(const impl&) -> impl& = delete;

    void close() noexcept {
        if (db_ != nullptr) {
            sqlite3_close_v2(db_);
            db_ = nullptr;
        }
    }

    /// query_error for the last failure on the handle
    [[nodiscard]] auto last_error(const std::string& sql,
                                  const binding_list& bindings) const
        -> error_info {
        const int code = db_ ? sqlite3_extended_errcode(db_) : SQLITE_MISUSE;
        const std::string message =
            db_ ? sqlite3_errmsg(db_) : "database is not open";
        return errors::query_error(message, sql, bindings,
                                   derive_sql_state(code, message), code)
            .to_error_info();
    }

    [[nodiscard]] auto not_connected(const std::string& sql) const
        -> error_info {
        return errors::query_error(
                   compat::format("Not connected to database '{}'", path_), sql)
            .to_error_info();
    }

    /**
     * @brief Prepare a statement and bind all values as text
     * @return Prepared statement; the caller finalizes it
     */
    [[nodiscard]] auto prepare(const std::string& sql,
                               const binding_list& bindings)
        -> Result<sqlite3_stmt*> {
        sqlite3_stmt* stmt = nullptr;
        auto rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            auto error = last_error(sql, bindings);
            sqlite3_finalize(stmt);
            return error;
        }

        int index = 1;
        for (const auto& [name, value] : bindings) {
            rc = sqlite3_bind_text(stmt, index++, value.c_str(),
                                   static_cast<int>(value.size()),
                                   SQLITE_TRANSIENT);
            if (rc != SQLITE_OK) {
                auto error = last_error(sql, bindings);
                sqlite3_finalize(stmt);
                return error;
            }
        }

        return ok(stmt);
    }

    std::string path_;
    sqlite_options options_;
    std::shared_ptr<di::ILogger> logger_;
    sqlite3* db_{nullptr};
    std::unique_ptr<sqlite_transaction_manager> transactions_;
    std::unique_ptr<sqlite_schema_manager> schema_;
};

// ============================================================================
// Construction
// ============================================================================

sqlite_connection::sqlite_connection(std::string path, sqlite_options options,
                                     std::shared_ptr<di::ILogger> logger)
    : impl_(std::make_unique<impl>(std::move(path), std::move(options),
                                   std::move(logger))) {
    impl_->transactions_ =
        std::make_unique<sqlite_transaction_manager>(*this, impl_->logger_);
    impl_->schema_ =
        std::make_unique<sqlite_schema_manager>(*this, impl_->logger_);
}

sqlite_connection::~sqlite_connection() = default;

// ============================================================================
// Connection Management
// ============================================================================

auto sqlite_connection::connect() -> VoidResult {
    if (impl_->db_ != nullptr) {
        return ok();
    }

    auto rc = sqlite3_open_v2(impl_->path_.c_str(), &impl_->db_,
                              SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE,
                              nullptr);
    if (rc != SQLITE_OK) {
        std::string message = impl_->db_ ? sqlite3_errmsg(impl_->db_)
                                         : sqlite3_errstr(rc);
        impl_->close();
        return void_error(error_codes::database_open_error,
                          compat::format("Failed to open database '{}': {}",
                                         impl_->path_, message),
                          "storage");
    }

    sqlite3_extended_result_codes(impl_->db_, 1);
    sqlite3_busy_timeout(impl_->db_,
                         static_cast<int>(impl_->options_.busy_timeout.count()));

    if (impl_->options_.foreign_keys) {
        auto pragma = execute_script("PRAGMA foreign_keys = ON");
        if (pragma.is_err()) {
            impl_->close();
            return pragma;
        }
    }

    impl_->logger_->debug_fmt("Opened SQLite database '{}'", impl_->path_);
    return ok();
}

void sqlite_connection::disconnect() {
    if (impl_->db_ == nullptr) {
        return;
    }
    impl_->transactions_->reset();
    impl_->close();
    impl_->logger_->debug_fmt("Closed SQLite database '{}'", impl_->path_);
}

auto sqlite_connection::is_connected() const noexcept -> bool {
    return impl_->db_ != nullptr;
}

auto sqlite_connection::driver_name() const -> std::string { return "sqlite"; }

auto sqlite_connection::table_prefix() const -> const std::string& {
    return impl_->options_.table_prefix;
}

auto sqlite_connection::quote_identifier(std::string_view identifier) const
    -> std::string {
    std::string quoted = "\"";
    for (char c : identifier) {
        if (c == '"') {
            quoted += "\"\"";
        } else {
            quoted += c;
        }
    }
    quoted += '"';
    return quoted;
}

// ============================================================================
// Statements
// ============================================================================

auto sqlite_connection::select(const std::string& sql,
                               const binding_list& bindings)
    -> Result<database_result> {
    if (impl_->db_ == nullptr) {
        return impl_->not_connected(sql);
    }

    impl_->logger_->trace_fmt("SQL: {}", sql);
    auto start = std::chrono::steady_clock::now();

    auto prepared = impl_->prepare(sql, bindings);
    if (prepared.is_err()) {
        return prepared.error();
    }
    auto* stmt = prepared.value();

    database_result result;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        database_row row;
        const int columns = sqlite3_column_count(stmt);
        for (int i = 0; i < columns; ++i) {
            if (sqlite3_column_type(stmt, i) == SQLITE_NULL) {
                continue;
            }
            const auto* text = reinterpret_cast<const char*>(
                sqlite3_column_text(stmt, i));
            row[sqlite3_column_name(stmt, i)] = text ? text : "";
        }
        result.rows.push_back(std::move(row));
    }

    if (rc != SQLITE_DONE) {
        auto error = impl_->last_error(sql, bindings);
        sqlite3_finalize(stmt);
        return error;
    }

    sqlite3_finalize(stmt);
    result.execution_time = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);
    return ok(std::move(result));
}

auto sqlite_connection::execute(const std::string& sql,
                                const binding_list& bindings)
    -> Result<std::uint64_t> {
    if (impl_->db_ == nullptr) {
        return impl_->not_connected(sql);
    }

    impl_->logger_->trace_fmt("SQL: {}", sql);

    auto prepared = impl_->prepare(sql, bindings);
    if (prepared.is_err()) {
        return prepared.error();
    }
    auto* stmt = prepared.value();

    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    }

    if (rc != SQLITE_DONE) {
        auto error = impl_->last_error(sql, bindings);
        sqlite3_finalize(stmt);
        return error;
    }

    sqlite3_finalize(stmt);
    return ok(static_cast<std::uint64_t>(sqlite3_changes(impl_->db_)));
}

auto sqlite_connection::last_insert_id() const -> std::int64_t {
    if (impl_->db_ == nullptr) {
        return 0;
    }
    return static_cast<std::int64_t>(sqlite3_last_insert_rowid(impl_->db_));
}

auto sqlite_connection::execute_script(const std::string& sql) -> VoidResult {
    if (impl_->db_ == nullptr) {
        return impl_->not_connected(sql);
    }

    impl_->logger_->trace_fmt("SQL: {}", sql);

    char* err_msg = nullptr;
    auto rc = sqlite3_exec(impl_->db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        sqlite3_free(err_msg);
        return impl_->last_error(sql, {});
    }
    return ok();
}

// ============================================================================
// Sub-interfaces
// ============================================================================

auto sqlite_connection::transaction() -> transaction_manager& {
    return *impl_->transactions_;
}

auto sqlite_connection::schema() -> schema_manager& { return *impl_->schema_; }

auto sqlite_connection::in_transaction() const noexcept -> bool {
    return impl_->db_ != nullptr && sqlite3_get_autocommit(impl_->db_) == 0;
}

auto sqlite_connection::path() const -> const std::string& {
    return impl_->path_;
}

auto sqlite_connection::options() const -> const sqlite_options& {
    return impl_->options_;
}

}  // namespace dbmigrate::storage
