/**
 * @file migration_runner.cpp
 * @brief Implementation of the migration runner
 */

#include <dbmigrate/engine/migration_runner.hpp>

#include <dbmigrate/compat/format.hpp>
#include <dbmigrate/compat/time.hpp>
#include <dbmigrate/engine/migration_loader.hpp>
#include <dbmigrate/errors/query_error.hpp>
#include <dbmigrate/integration/logger_adapter.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <ctime>
#include <fstream>
#include <functional>
#include <map>
#include <random>
#include <sstream>
#include <system_error>

namespace dbmigrate::engine {

namespace {

constexpr const char* migrations_table_definition =
    "id INTEGER PRIMARY KEY AUTOINCREMENT, "
    "migration VARCHAR(255) NOT NULL UNIQUE, "
    "batch INTEGER NOT NULL CHECK (batch > 0), "
    "created_at TIMESTAMP NOT NULL DEFAULT CURRENT_TIMESTAMP";

constexpr const char* lock_table_definition =
    "name VARCHAR(255) PRIMARY KEY, "
    "owner VARCHAR(255) NOT NULL, "
    "acquired_at TIMESTAMP NOT NULL DEFAULT CURRENT_TIMESTAMP";

auto parse_int(const std::string& text) -> std::optional<int> {
    int value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

auto column_value(const storage::database_row& row, const std::string& column)
    -> std::optional<std::string> {
    auto it = row.find(column);
    if (it == row.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto generate_owner() -> std::string {
    std::random_device device;
    std::uniform_int_distribution<unsigned int> distribution;
    return compat::format("runner-{:08x}", distribution(device));
}

auto timestamp_prefix() -> std::string {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_val{};
    compat::localtime_safe(&now, &tm_val);

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y_%m_%d_%H%M%S", &tm_val);
    return buffer;
}

auto is_valid_migration_title(std::string_view name) -> bool {
    return !name.empty() &&
           std::all_of(name.begin(), name.end(), [](unsigned char c) {
               return std::isalnum(c) || c == '_';
           });
}

auto migration_source(const std::string& file_name,
                      const std::string& class_name,
                      const std::optional<std::string>& table, bool create)
    -> std::string {
    const bool scaffold_table = create && table && !table->empty();

    std::ostringstream out;
    out << "/**\n"
        << " * @file " << file_name << "\n"
        << " * @brief " << class_name << " migration\n"
        << " *\n"
        << " * Register with:\n"
        << " *   catalog.add<migrations::" << class_name << ">(\"migrations::"
        << class_name << "\");\n"
        << " */\n"
        << "\n"
        << "#include <dbmigrate/engine/migration.hpp>\n"
        << "\n"
        << "#include <string>\n"
        << "#include <utility>\n"
        << "\n"
        << "namespace migrations {\n"
        << "\n"
        << "class " << class_name
        << " final : public dbmigrate::engine::migration {\n"
        << "public:\n"
        << "    " << class_name << "(std::string name, std::string version)\n"
        << "        : migration(std::move(name), std::move(version)) {}\n"
        << "\n";

    if (scaffold_table) {
        out << "    auto up(dbmigrate::storage::database_connection& db)\n"
            << "        -> dbmigrate::VoidResult override {\n"
            << "        return db.schema().create_table(\n"
            << "            \"" << *table
            << "\", \"id INTEGER PRIMARY KEY AUTOINCREMENT\");\n"
            << "    }\n"
            << "\n"
            << "    auto down(dbmigrate::storage::database_connection& db)\n"
            << "        -> dbmigrate::VoidResult override {\n"
            << "        return db.schema().drop_table(\"" << *table << "\");\n"
            << "    }\n";
    } else {
        out << "    auto up([[maybe_unused]] dbmigrate::storage::database_connection& db)\n"
            << "        -> dbmigrate::VoidResult override {\n"
            << "        // Add migration logic here\n"
            << "        return dbmigrate::ok();\n"
            << "    }\n"
            << "\n"
            << "    auto down([[maybe_unused]] dbmigrate::storage::database_connection& db)\n"
            << "        -> dbmigrate::VoidResult override {\n"
            << "        // Revert migration logic here\n"
            << "        return dbmigrate::ok();\n"
            << "    }\n";
    }

    out << "\n"
        << "    auto description() const -> std::string override {\n"
        << "        return \"" << class_name << "\";\n"
        << "    }\n"
        << "};\n"
        << "\n"
        << "}  // namespace migrations\n";

    return out.str();
}

}  // namespace

// ============================================================================
// Construction
// ============================================================================

migration_runner::migration_runner(std::shared_ptr<storage::database_connection> db,
                                   runner_options options,
                                   std::shared_ptr<di::ILogger> logger)
    : db_(std::move(db)),
      options_(std::move(options)),
      logger_(logger ? std::move(logger) : di::null_logger()) {
    if (options_.lock_owner.empty()) {
        options_.lock_owner = generate_owner();
    }
}

// ============================================================================
// Registry
// ============================================================================

namespace {

auto validate(const migration* m) -> std::optional<errors::migration_error> {
    if (m == nullptr) {
        return errors::migration_error::invalid_migration(
            "<null>", "migration pointer is null");
    }
    if (m->name().empty()) {
        return errors::migration_error::invalid_migration(
            "<unnamed>", "migration name is empty");
    }
    if (m->version().empty()) {
        return errors::migration_error::invalid_migration(
            m->name(),
            "version is empty and the name has no YYYY_MM_DD_HHMMSS prefix");
    }
    return std::nullopt;
}

}  // namespace

auto migration_runner::register_migration(std::shared_ptr<migration> m)
    -> VoidResult {
    if (auto invalid = validate(m.get())) {
        return fail(std::move(*invalid));
    }

    auto existing = std::find_if(registry_.begin(), registry_.end(),
                                 [&m](const auto& registered) {
                                     return registered->name() == m->name();
                                 });
    if (existing != registry_.end()) {
        *existing = std::move(m);
    } else {
        registry_.push_back(std::move(m));
    }

    std::stable_sort(registry_.begin(), registry_.end(),
                     [](const auto& a, const auto& b) {
                         return a->version() < b->version();
                     });
    return ok();
}

auto migration_runner::register_all(
    const std::vector<std::shared_ptr<migration>>& migrations) -> VoidResult {
    for (const auto& m : migrations) {
        auto result = register_migration(m);
        if (result.is_err()) {
            return result;
        }
    }
    return ok();
}

auto migration_runner::load_migrations(const migration_catalog& catalog)
    -> Result<std::size_t> {
    return load_migrations(options_.migrations_path, catalog);
}

auto migration_runner::load_migrations(const std::filesystem::path& path,
                                       const migration_catalog& catalog)
    -> Result<std::size_t> {
    migration_loader loader(catalog, logger_);
    auto loaded = loader.load(path);
    if (loaded.is_err()) {
        return fail(errors::migration_error::load_failed(
            path.string(), loaded.error().message));
    }

    // All or nothing: a bad file must not leave its predecessors registered
    for (const auto& m : loaded.value()) {
        if (auto invalid = validate(m.get())) {
            return fail(errors::migration_error::load_failed(path.string(),
                                                             invalid->message()));
        }
    }

    auto registered = register_all(loaded.value());
    if (registered.is_err()) {
        return fail(errors::migration_error::load_failed(
            path.string(), registered.error().message));
    }

    logger_->debug_fmt("Loaded {} migrations from '{}'", loaded.value().size(),
                       path.string());
    return ok(loaded.value().size());
}

// ============================================================================
// Advisory Lock
// ============================================================================

namespace {

/// Releases the advisory lock on every exit path
class lock_release_guard {
public:
    explicit lock_release_guard(std::function<void()> release)
        : release_(std::move(release)) {}
    ~lock_release_guard() { release_(); }

    lock_release_guard(const lock_release_guard&) = delete;
    auto operator=(const lock_release_guard&) -> lock_release_guard& = delete;

private:
    std::function<void()> release_;
};

}  // namespace

template <typename Func>
auto migration_runner::locked(bool pretend, Func&& func) -> decltype(func()) {
    if (!options_.use_advisory_lock || pretend) {
        return func();
    }

    auto acquired = acquire_lock();
    if (acquired.is_err()) {
        return acquired.error();
    }

    lock_release_guard guard([this]() { release_lock(); });
    return func();
}

auto migration_runner::acquire_lock() -> VoidResult {
    if (!db_->schema().table_exists(lock_table)) {
        auto created = db_->schema().create_table(lock_table, lock_table_definition);
        // Another runner may have created it in the meantime
        if (created.is_err() &&
            created.error().code != error_codes::schema_table_already_exists) {
            return bookkeeping_failed(created.error());
        }
    }

    auto inserted = db_->query().table(lock_table).insert(
        {{"name", std::string(lock_name)}, {"owner", options_.lock_owner}});
    if (inserted.is_ok()) {
        logger_->debug_fmt("Acquired migration lock as {}", options_.lock_owner);
        return ok();
    }

    auto query = errors::query_error::from_error_info(inserted.error());
    if (!query || !query->is_duplicate_key()) {
        return bookkeeping_failed(inserted.error());
    }

    std::string holder = "another runner";
    auto row = db_->query()
                   .from(lock_table)
                   .where("name", std::string(lock_name))
                   .first();
    if (row.is_ok() && row.value()) {
        if (auto owner = column_value(*row.value(), "owner")) {
            holder = *owner;
        }
    }

    return fail(errors::migration_error::lock_unavailable(lock_name, holder));
}

void migration_runner::release_lock() {
    auto removed = db_->query()
                       .from(lock_table)
                       .where("name", std::string(lock_name))
                       .where("owner", options_.lock_owner)
                       .remove();
    if (removed.is_err()) {
        logger_->error_fmt("Failed to release migration lock: {}",
                           removed.error().message);
        return;
    }
    logger_->debug_fmt("Released migration lock as {}", options_.lock_owner);
}

// ============================================================================
// Schema Changes
// ============================================================================

auto migration_runner::migrate(bool pretend) -> Result<std::vector<std::string>> {
    last_error_.reset();
    return locked(pretend, [&]() { return do_migrate(pretend); });
}

auto migration_runner::do_migrate(bool pretend)
    -> Result<std::vector<std::string>> {
    if (!pretend) {
        auto ensured = ensure_migrations_table();
        if (ensured.is_err()) {
            return ensured.error();
        }
    }

    auto pending = get_pending();
    if (pending.is_err()) {
        return pending.error();
    }

    auto batch = get_next_batch_number();
    if (batch.is_err()) {
        return batch.error();
    }

    std::vector<std::string> ran;
    for (const auto& m : pending.value()) {
        if (!pretend) {
            auto applied = apply(*m, batch.value());
            if (applied.is_err()) {
                return fail(errors::migration_error::migration_failed(
                    m->name(), applied.error()));
            }
        }
        ran.push_back(m->name());
    }

    if (ran.empty()) {
        logger_->debug("Nothing to migrate");
    }
    return ok(std::move(ran));
}

auto migration_runner::run(std::shared_ptr<migration> m, bool pretend)
    -> VoidResult {
    last_error_.reset();

    if (!m || m->name().empty() || m->version().empty()) {
        return register_migration(std::move(m));
    }

    return locked(pretend, [&]() -> VoidResult {
        auto ran = has_run(m->name());
        if (ran.is_err()) {
            return ran.error();
        }
        if (ran.value()) {
            return fail(errors::migration_error::migration_already_ran(m->name()));
        }

        if (pretend) {
            return ok();
        }

        auto ensured = ensure_migrations_table();
        if (ensured.is_err()) {
            return ensured;
        }

        auto batch = get_next_batch_number();
        if (batch.is_err()) {
            return batch.error();
        }

        auto registered = register_migration(m);
        if (registered.is_err()) {
            return registered;
        }

        auto applied = apply(*m, batch.value());
        if (applied.is_err()) {
            return fail(errors::migration_error::migration_failed(
                m->name(), applied.error()));
        }
        return ok();
    });
}

auto migration_runner::rollback(int steps, bool pretend)
    -> Result<std::vector<std::string>> {
    last_error_.reset();

    return locked(pretend, [&]() -> Result<std::vector<std::string>> {
        std::vector<std::string> rolled_back;

        auto exists = migrations_table_exists();
        if (exists.is_err()) {
            return exists.error();
        }
        if (!exists.value()) {
            if (!pretend) {
                auto ensured = ensure_migrations_table();
                if (ensured.is_err()) {
                    return ensured.error();
                }
            }
            return ok(std::move(rolled_back));
        }

        auto max_batch = db_->query().from(migrations_table).max("batch");
        if (max_batch.is_err()) {
            return bookkeeping_failed(max_batch.error());
        }
        if (!max_batch.value()) {
            return ok(std::move(rolled_back));
        }

        const int latest = parse_int(*max_batch.value()).value_or(0);
        const int min_batch = std::max(1, latest - steps + 1);

        auto records = applied_in_reverse(min_batch);
        if (records.is_err()) {
            return records.error();
        }

        for (const auto& record : records.value()) {
            auto name = column_value(record, "migration").value_or("");
            auto m = find_migration(name);
            if (!m) {
                return fail(errors::migration_error::migration_not_found(name));
            }

            if (!pretend) {
                auto reverted = revert_applied(*m, name);
                if (reverted.is_err()) {
                    return fail(errors::migration_error::rollback_failed(
                        name, reverted.error()));
                }
            }
            rolled_back.push_back(m->name());
        }

        if (rolled_back.empty()) {
            logger_->debug("Nothing to rollback");
        }
        return ok(std::move(rolled_back));
    });
}

auto migration_runner::revert(std::string_view name, bool pretend) -> VoidResult {
    last_error_.reset();
    const std::string key(name);

    return locked(pretend, [&]() -> VoidResult {
        auto ran = has_run(key);
        if (ran.is_err()) {
            return ran.error();
        }
        if (!ran.value()) {
            return fail(errors::migration_error::migration_not_ran(key));
        }

        auto m = find_migration(key);
        if (!m) {
            return fail(errors::migration_error::migration_not_found(key));
        }

        if (pretend) {
            return ok();
        }

        auto reverted = revert_applied(*m, key);
        if (reverted.is_err()) {
            return fail(errors::migration_error::rollback_failed(key, reverted.error()));
        }
        return ok();
    });
}

auto migration_runner::reset(bool pretend) -> Result<std::vector<std::string>> {
    last_error_.reset();
    return locked(pretend, [&]() { return do_reset(pretend); });
}

auto migration_runner::do_reset(bool pretend) -> Result<std::vector<std::string>> {
    std::vector<std::string> rolled_back;

    auto exists = migrations_table_exists();
    if (exists.is_err()) {
        return exists.error();
    }
    if (!exists.value()) {
        if (!pretend) {
            auto ensured = ensure_migrations_table();
            if (ensured.is_err()) {
                return ensured.error();
            }
        }
        return ok(std::move(rolled_back));
    }

    auto records = applied_in_reverse(std::nullopt);
    if (records.is_err()) {
        return records.error();
    }

    for (const auto& record : records.value()) {
        auto name = column_value(record, "migration").value_or("");
        auto m = find_migration(name);
        if (!m) {
            logger_->warn_fmt("Skipping unregistered migration {}", name);
            continue;
        }

        if (!pretend) {
            auto reverted = revert_applied(*m, name);
            if (reverted.is_err()) {
                return fail(errors::migration_error::rollback_failed(
                    name, reverted.error()));
            }
        }
        rolled_back.push_back(m->name());
    }

    return ok(std::move(rolled_back));
}

auto migration_runner::refresh(bool pretend) -> Result<std::vector<std::string>> {
    last_error_.reset();

    return locked(pretend, [&]() -> Result<std::vector<std::string>> {
        auto reset_result = do_reset(pretend);
        if (reset_result.is_err()) {
            return reset_result.error();
        }
        return do_migrate(pretend);
    });
}

// ============================================================================
// Inspection
// ============================================================================

auto migration_runner::status() -> Result<std::vector<migration_status>> {
    std::map<std::string, storage::database_row> applied;

    auto exists = migrations_table_exists();
    if (exists.is_err()) {
        return exists.error();
    }
    if (exists.value()) {
        auto records = db_->query().from(migrations_table).get();
        if (records.is_err()) {
            return bookkeeping_failed(records.error());
        }
        for (const auto& record : records.value()) {
            if (auto name = column_value(record, "migration")) {
                applied[*name] = record;
            }
        }
    }

    std::vector<migration_status> statuses;
    statuses.reserve(registry_.size());

    for (const auto& m : registry_) {
        migration_status entry;
        entry.name = m->name();

        auto it = applied.find(m->name());
        if (it != applied.end()) {
            entry.ran = true;
            if (auto batch = column_value(it->second, "batch")) {
                entry.batch = parse_int(*batch);
            }
            entry.ran_at = column_value(it->second, "created_at");
        }
        statuses.push_back(std::move(entry));
    }

    return ok(std::move(statuses));
}

auto migration_runner::get_pending()
    -> Result<std::vector<std::shared_ptr<migration>>> {
    auto completed = get_completed();
    if (completed.is_err()) {
        return completed.error();
    }

    const auto& names = completed.value();
    std::vector<std::shared_ptr<migration>> pending;
    for (const auto& m : registry_) {
        if (std::find(names.begin(), names.end(), m->name()) == names.end()) {
            pending.push_back(m);
        }
    }
    return ok(std::move(pending));
}

auto migration_runner::get_completed() -> Result<std::vector<std::string>> {
    auto exists = migrations_table_exists();
    if (exists.is_err()) {
        return exists.error();
    }
    if (!exists.value()) {
        return ok(std::vector<std::string>{});
    }

    auto names = db_->query().from(migrations_table).pluck("migration");
    if (names.is_err()) {
        return bookkeeping_failed(names.error());
    }
    return names;
}

auto migration_runner::has_pending() -> Result<bool> {
    auto pending = get_pending();
    if (pending.is_err()) {
        return pending.error();
    }
    return ok(!pending.value().empty());
}

auto migration_runner::get_current_version() -> Result<std::string> {
    auto exists = migrations_table_exists();
    if (exists.is_err()) {
        return exists.error();
    }
    if (!exists.value()) {
        return ok(std::string("0"));
    }

    auto last = db_->query()
                    .from(migrations_table)
                    .order_by("batch", storage::sort_direction::descending)
                    .order_by("id", storage::sort_direction::descending)
                    .first();
    if (last.is_err()) {
        return bookkeeping_failed(last.error());
    }
    if (!last.value()) {
        return ok(std::string("0"));
    }

    auto m = find_migration(column_value(*last.value(), "migration").value_or(""));
    if (!m) {
        return ok(std::string("0"));
    }
    return ok(m->version());
}

auto migration_runner::get_latest_version() const -> std::string {
    if (registry_.empty()) {
        return "0";
    }
    return registry_.back()->version();
}

auto migration_runner::get_next_batch_number() -> Result<int> {
    auto exists = migrations_table_exists();
    if (exists.is_err()) {
        return exists.error();
    }
    if (!exists.value()) {
        return ok(1);
    }

    auto max_batch = db_->query().from(migrations_table).max("batch");
    if (max_batch.is_err()) {
        return bookkeeping_failed(max_batch.error());
    }
    if (!max_batch.value()) {
        return ok(1);
    }
    return ok(parse_int(*max_batch.value()).value_or(0) + 1);
}

auto migration_runner::preview() -> Result<std::vector<migration_preview>> {
    auto pending = get_pending();
    if (pending.is_err()) {
        return pending.error();
    }

    std::vector<migration_preview> previews;
    previews.reserve(pending.value().size());
    for (const auto& m : pending.value()) {
        previews.push_back({m->name(), m->description()});
    }
    return ok(std::move(previews));
}

// ============================================================================
// Bookkeeping Table
// ============================================================================

auto migration_runner::create_migrations_table() -> VoidResult {
    auto exists = migrations_table_exists();
    if (exists.is_err()) {
        return exists.error();
    }
    if (exists.value()) {
        return ok();
    }

    auto created = db_->schema().create_table(migrations_table,
                                              migrations_table_definition);
    if (created.is_err()) {
        return bookkeeping_failed(created.error());
    }

    logger_->debug_fmt("Created bookkeeping table {}",
                       db_->full_table_name(migrations_table));
    return ok();
}

auto migration_runner::has_migrations_table() -> bool {
    return db_->schema().table_exists(migrations_table);
}

// ============================================================================
// Scaffolding
// ============================================================================

void migration_runner::set_migrations_path(std::filesystem::path path) {
    options_.migrations_path = std::move(path);
}

auto migration_runner::generate(std::string_view name,
                                std::optional<std::string> table, bool create)
    -> Result<std::filesystem::path> {
    last_error_.reset();

    if (options_.migrations_path.empty()) {
        return fail(errors::migration_error::generate_failed(
            name, "Migrations path not set"));
    }
    if (!is_valid_migration_title(name)) {
        return fail(errors::migration_error::generate_failed(
            name, "name may only contain letters, digits and underscores"));
    }

    std::error_code ec;
    std::filesystem::create_directories(options_.migrations_path, ec);
    if (ec) {
        return fail(errors::migration_error::generate_failed(
            name, compat::format("cannot create directory '{}': {}",
                                 options_.migrations_path.string(),
                                 ec.message())));
    }

    const auto file_name = compat::format("{}_{}.cpp", timestamp_prefix(), name);
    const auto file_path = options_.migrations_path / file_name;
    if (std::filesystem::exists(file_path, ec)) {
        return fail(errors::migration_error::generate_failed(
            name, compat::format("file '{}' already exists", file_path.string())));
    }

    std::ofstream file(file_path);
    if (!file) {
        return fail(errors::migration_error::generate_failed(
            name, "Failed to write file"));
    }

    file << migration_source(file_name, class_name_for(name), table, create);
    file.close();
    if (!file) {
        return fail(errors::migration_error::generate_failed(
            name, "Failed to write file"));
    }

    logger_->info_fmt("Created migration: {}", file_path.string());
    return ok(file_path);
}

auto migration_runner::class_name_for(std::string_view name) -> std::string {
    std::string class_name;
    bool upper_next = true;
    for (char c : name) {
        if (c == '_' || c == ' ') {
            upper_next = true;
            continue;
        }
        if (upper_next) {
            class_name += static_cast<char>(
                std::toupper(static_cast<unsigned char>(c)));
            upper_next = false;
        } else {
            class_name += c;
        }
    }

    // Identifiers cannot start with a digit
    if (!class_name.empty() &&
        std::isdigit(static_cast<unsigned char>(class_name.front()))) {
        class_name.insert(0, "Migration");
    }
    return class_name;
}

// ============================================================================
// Private Helpers
// ============================================================================

auto migration_runner::apply(migration& m, int batch) -> VoidResult {
    const auto& name = m.name();

    auto result = db_->transaction().run([&]() -> VoidResult {
        auto up = m.up(*db_);
        if (up.is_err()) {
            return up;
        }

        auto inserted = db_->query().table(migrations_table).insert(
            {{"migration", name}, {"batch", std::to_string(batch)}});
        if (inserted.is_err()) {
            return inserted.error();
        }
        return ok();
    });

    if (result.is_err()) {
        integration::logger_adapter::log_migration_failed(
            name, "up", result.error().message);
        return result;
    }

    logger_->info_fmt("Ran: {}", name);
    integration::logger_adapter::log_migration_applied(name, batch);
    return ok();
}

auto migration_runner::revert_applied(migration& m, const std::string& name)
    -> VoidResult {
    auto result = db_->transaction().run([&]() -> VoidResult {
        auto down = m.down(*db_);
        if (down.is_err()) {
            return down;
        }

        auto removed = db_->query()
                           .from(migrations_table)
                           .where("migration", name)
                           .remove();
        if (removed.is_err()) {
            return removed.error();
        }
        return ok();
    });

    if (result.is_err()) {
        integration::logger_adapter::log_migration_failed(
            name, "down", result.error().message);
        return result;
    }

    logger_->info_fmt("Rolled back: {}", m.name());
    integration::logger_adapter::log_migration_rolled_back(name);
    return ok();
}

auto migration_runner::ensure_migrations_table() -> VoidResult {
    return create_migrations_table();
}

auto migration_runner::migrations_table_exists() -> Result<bool> {
    auto exists = db_->schema().has_table(migrations_table);
    if (exists.is_err()) {
        return bookkeeping_failed(exists.error());
    }
    return exists;
}

auto migration_runner::has_run(const std::string& name) -> Result<bool> {
    auto exists = migrations_table_exists();
    if (exists.is_err()) {
        return exists.error();
    }
    if (!exists.value()) {
        return ok(false);
    }

    auto count = db_->query()
                     .from(migrations_table)
                     .where("migration", name)
                     .count();
    if (count.is_err()) {
        return bookkeeping_failed(count.error());
    }
    return ok(count.value() > 0);
}

auto migration_runner::find_migration(std::string_view name) const
    -> std::shared_ptr<migration> {
    auto it = std::find_if(registry_.begin(), registry_.end(),
                           [name](const auto& m) { return m->name() == name; });
    return it == registry_.end() ? nullptr : *it;
}

auto migration_runner::applied_in_reverse(std::optional<int> min_batch)
    -> Result<storage::database_result> {
    auto query = db_->query().from(migrations_table);
    if (min_batch) {
        query.where("batch", ">=", std::to_string(*min_batch));
    }
    query.order_by("batch", storage::sort_direction::descending)
        .order_by("id", storage::sort_direction::descending);

    auto records = query.get();
    if (records.is_err()) {
        return bookkeeping_failed(records.error());
    }
    return records;
}

auto migration_runner::fail(errors::migration_error error) -> error_info {
    logger_->error(error.message());
    auto info = error.to_error_info();
    last_error_ = std::move(error);
    return info;
}

auto migration_runner::bookkeeping_failed(const error_info& cause) -> error_info {
    return fail(errors::migration_error(
        error_codes::migration_failed,
        compat::format("Migration bookkeeping failed: {}", cause.message),
        std::nullopt, cause));
}

}  // namespace dbmigrate::engine
