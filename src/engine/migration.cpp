/**
 * @file migration.cpp
 * @brief Implementation of the migration base class
 */

#include <dbmigrate/engine/migration.hpp>

#include <cctype>
#include <regex>

namespace dbmigrate::engine {

namespace {

auto version_pattern() -> const std::regex& {
    static const std::regex pattern(R"(^(\d{4}_\d{2}_\d{2}_\d{6})(_|$))");
    return pattern;
}

}  // namespace

migration::migration(std::string name, std::string version)
    : name_(std::move(name)), version_(std::move(version)) {
    if (version_.empty()) {
        version_ = extract_version(name_);
    }
}

auto migration::description() const -> std::string {
    std::string title = name_;
    if (!version_.empty() && title.rfind(version_, 0) == 0) {
        title.erase(0, version_.size());
        if (!title.empty() && title.front() == '_') {
            title.erase(0, 1);
        }
    }

    for (auto& c : title) {
        if (c == '_') {
            c = ' ';
        }
    }
    if (title.empty()) {
        return name_;
    }
    title.front() = static_cast<char>(
        std::toupper(static_cast<unsigned char>(title.front())));
    return title;
}

auto migration::extract_version(std::string_view name) -> std::string {
    std::match_results<std::string_view::const_iterator> match;
    if (std::regex_search(name.begin(), name.end(), match, version_pattern())) {
        return match[1].str();
    }
    return {};
}

// ============================================================================
// callback_migration
// ============================================================================

callback_migration::callback_migration(std::string name, step_function up,
                                       step_function down, std::string version)
    : migration(std::move(name), std::move(version)),
      up_(std::move(up)),
      down_(std::move(down)) {}

auto callback_migration::up(storage::database_connection& db) -> VoidResult {
    if (!up_) {
        return ok();
    }
    return up_(db);
}

auto callback_migration::down(storage::database_connection& db) -> VoidResult {
    if (!down_) {
        return ok();
    }
    return down_(db);
}

}  // namespace dbmigrate::engine
