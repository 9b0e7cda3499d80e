/**
 * @file query_builder.cpp
 * @brief Implementation of the fluent query builder
 */

#include <dbmigrate/storage/query_builder.hpp>

#include <dbmigrate/compat/format.hpp>
#include <dbmigrate/storage/database_connection.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>

namespace dbmigrate::storage {

namespace {

constexpr std::array<std::string_view, 8> allowed_operators = {
    "=", "!=", "<>", "<", "<=", ">", ">=", "LIKE"};

auto normalize_operator(std::string_view op) -> std::string {
    std::string upper(op);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return upper;
}

}  // namespace

query_builder::query_builder(database_connection& db) : db_(&db) {}

// ============================================================================
// Clauses
// ============================================================================

auto query_builder::from(std::string_view table) -> query_builder& {
    table_ = std::string(table);
    return *this;
}

auto query_builder::table(std::string_view table) -> query_builder& {
    return from(table);
}

auto query_builder::select(std::vector<std::string> columns) -> query_builder& {
    columns_ = std::move(columns);
    return *this;
}

auto query_builder::where(std::string_view column, std::string_view op,
                          std::string value) -> query_builder& {
    auto normalized = normalize_operator(op);
    if (std::find(allowed_operators.begin(), allowed_operators.end(),
                  normalized) == allowed_operators.end()) {
        if (!error_) {
            error_ = errors::query_error(
                compat::format("Unsupported operator '{}' for column '{}'", op,
                               column));
        }
        return *this;
    }

    conditions_.push_back({std::string(column), normalized, std::move(value)});
    return *this;
}

auto query_builder::where(std::string_view column, std::string value)
    -> query_builder& {
    return where(column, "=", std::move(value));
}

auto query_builder::order_by(std::string_view column, sort_direction direction)
    -> query_builder& {
    orderings_.push_back({std::string(column), direction});
    return *this;
}

auto query_builder::limit(std::size_t count) -> query_builder& {
    limit_ = count;
    return *this;
}

// ============================================================================
// Terminals
// ============================================================================

auto query_builder::get() const -> Result<database_result> {
    auto valid = validate();
    if (valid.is_err()) {
        return valid.error();
    }
    return db_->select(to_sql(), bindings());
}

auto query_builder::first() const -> Result<std::optional<database_row>> {
    auto copy = *this;
    copy.limit(1);

    auto result = copy.get();
    if (result.is_err()) {
        return result.error();
    }

    if (result.value().empty()) {
        return ok(std::optional<database_row>(std::nullopt));
    }
    return ok(std::optional<database_row>(result.value()[0]));
}

auto query_builder::pluck(std::string_view column) const
    -> Result<std::vector<std::string>> {
    auto copy = *this;
    copy.select({std::string(column)});

    auto result = copy.get();
    if (result.is_err()) {
        return result.error();
    }

    std::vector<std::string> values;
    values.reserve(result.value().size());
    for (const auto& row : result.value()) {
        auto it = row.find(std::string(column));
        if (it != row.end()) {
            values.push_back(it->second);
        }
    }
    return ok(std::move(values));
}

auto query_builder::max(std::string_view column) const
    -> Result<std::optional<std::string>> {
    auto valid = validate();
    if (valid.is_err()) {
        return valid.error();
    }

    auto sql = build_select(compat::format(
        "MAX({}) AS aggregate", db_->quote_identifier(column)));
    auto result = db_->select(sql, bindings());
    if (result.is_err()) {
        return result.error();
    }

    if (result.value().empty()) {
        return ok(std::optional<std::string>(std::nullopt));
    }

    const auto& row = result.value()[0];
    auto it = row.find("aggregate");
    if (it == row.end()) {
        return ok(std::optional<std::string>(std::nullopt));
    }
    return ok(std::optional<std::string>(it->second));
}

auto query_builder::count() const -> Result<std::uint64_t> {
    auto valid = validate();
    if (valid.is_err()) {
        return valid.error();
    }

    auto result = db_->select(build_select("COUNT(*) AS aggregate"), bindings());
    if (result.is_err()) {
        return result.error();
    }

    if (result.value().empty()) {
        return ok(std::uint64_t{0});
    }

    const auto& row = result.value()[0];
    auto it = row.find("aggregate");
    if (it == row.end()) {
        return ok(std::uint64_t{0});
    }
    std::uint64_t value = 0;
    const auto& text = it->second;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc()) {
        return errors::query_error(
                   compat::format("Non-numeric count result '{}'", text))
            .to_error_info();
    }
    return ok(value);
}

auto query_builder::insert(const database_row& row) const
    -> Result<std::int64_t> {
    auto valid = validate();
    if (valid.is_err()) {
        return valid.error();
    }

    if (row.empty()) {
        return errors::query_error("Cannot insert an empty row")
            .to_error_info();
    }

    std::string columns;
    std::string placeholders;
    binding_list values;
    values.reserve(row.size());

    for (const auto& [column, value] : row) {
        if (!columns.empty()) {
            columns += ", ";
            placeholders += ", ";
        }
        columns += db_->quote_identifier(column);
        placeholders += "?";
        values.emplace_back(column, value);
    }

    auto sql = compat::format("INSERT INTO {} ({}) VALUES ({})", target_table(),
                              columns, placeholders);
    auto result = db_->execute(sql, values);
    if (result.is_err()) {
        return result.error();
    }
    return ok(db_->last_insert_id());
}

auto query_builder::remove() const -> Result<std::uint64_t> {
    auto valid = validate();
    if (valid.is_err()) {
        return valid.error();
    }

    auto sql = compat::format("DELETE FROM {}{}", target_table(), build_where());
    return db_->execute(sql, bindings());
}

// ============================================================================
// Inspection
// ============================================================================

auto query_builder::to_sql() const -> std::string {
    std::string projection;
    if (columns_.empty()) {
        projection = "*";
    } else {
        for (const auto& column : columns_) {
            if (!projection.empty()) {
                projection += ", ";
            }
            projection += db_->quote_identifier(column);
        }
    }

    auto sql = build_select(projection);

    if (!orderings_.empty()) {
        sql += " ORDER BY ";
        for (std::size_t i = 0; i < orderings_.size(); ++i) {
            if (i > 0) {
                sql += ", ";
            }
            sql += db_->quote_identifier(orderings_[i].column);
            sql += orderings_[i].direction == sort_direction::descending
                       ? " DESC"
                       : " ASC";
        }
    }

    if (limit_) {
        sql += compat::format(" LIMIT {}", *limit_);
    }

    return sql;
}

auto query_builder::bindings() const -> binding_list {
    binding_list result;
    result.reserve(conditions_.size());
    for (const auto& cond : conditions_) {
        result.emplace_back(cond.column, cond.value);
    }
    return result;
}

// ============================================================================
// Private Helpers
// ============================================================================

auto query_builder::build_select(std::string_view projection) const
    -> std::string {
    return compat::format("SELECT {} FROM {}{}", projection, target_table(),
                          build_where());
}

auto query_builder::build_where() const -> std::string {
    if (conditions_.empty()) {
        return {};
    }

    std::string clause = " WHERE ";
    for (std::size_t i = 0; i < conditions_.size(); ++i) {
        if (i > 0) {
            clause += " AND ";
        }
        clause += compat::format("{} {} ?",
                                 db_->quote_identifier(conditions_[i].column),
                                 conditions_[i].op);
    }
    return clause;
}

auto query_builder::target_table() const -> std::string {
    return db_->quote_identifier(db_->full_table_name(table_));
}

auto query_builder::validate() const -> VoidResult {
    if (error_) {
        return error_->to_error_info();
    }
    if (table_.empty()) {
        return errors::query_error("No table specified for query")
            .to_error_info();
    }
    return ok();
}

}  // namespace dbmigrate::storage
