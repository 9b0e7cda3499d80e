/**
 * @file config_loader.cpp
 * @brief Implementation of YAML configuration loader
 */

#include <dbmigrate/config/config_loader.hpp>

#include <dbmigrate/compat/format.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <map>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>

namespace dbmigrate::config {

namespace {

constexpr const char* config_module = "config";

auto invalid_value(const std::string& key, const std::string& value,
                   std::string_view expected) -> error_info {
    return error_info{error_codes::config_invalid_value,
                      compat::format("Invalid value '{}' for {}: expected {}",
                                     value, key, expected),
                      config_module};
}

auto to_lower(std::string value) -> std::string {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

/**
 * @brief Simple YAML parser for configuration files
 *
 * Handles:
 * - Key-value pairs
 * - Nested sections (with indentation)
 * - Comments (# lines and trailing " #" comments on unquoted values)
 * - Quoted strings
 */
class simple_yaml_parser {
public:
    explicit simple_yaml_parser(std::string_view content) { parse(content); }

    [[nodiscard]] auto get_string(const std::string& path) const
        -> std::optional<std::string> {
        auto it = values_.find(path);
        if (it == values_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    [[nodiscard]] auto get_int(const std::string& path) const
        -> Result<std::optional<long long>> {
        auto value = get_string(path);
        if (!value) {
            return ok(std::optional<long long>{});
        }

        long long parsed = 0;
        auto [ptr, ec] = std::from_chars(value->data(),
                                         value->data() + value->size(), parsed);
        if (ec != std::errc() || ptr != value->data() + value->size()) {
            return invalid_value(path, *value, "an integer");
        }
        return ok(std::optional<long long>(parsed));
    }

    [[nodiscard]] auto get_bool(const std::string& path) const
        -> Result<std::optional<bool>> {
        auto value = get_string(path);
        if (!value) {
            return ok(std::optional<bool>{});
        }

        auto lowered = to_lower(*value);
        if (lowered == "true" || lowered == "yes" || lowered == "on" || lowered == "1") {
            return ok(std::optional<bool>(true));
        }
        if (lowered == "false" || lowered == "no" || lowered == "off" || lowered == "0") {
            return ok(std::optional<bool>(false));
        }
        return invalid_value(path, *value, "a boolean");
    }

private:
    void parse(std::string_view content) {
        std::istringstream stream{std::string(content)};
        std::string line;
        std::vector<std::pair<int, std::string>> path_stack;

        while (std::getline(stream, line)) {
            // Skip empty lines
            if (line.find_first_not_of(" \t\r\n") == std::string::npos) {
                continue;
            }

            // Skip comments
            auto non_ws = line.find_first_not_of(" \t");
            if (line[non_ws] == '#') {
                continue;
            }

            // Calculate indentation level
            int indent = 0;
            for (char c : line) {
                if (c == ' ') indent++;
                else if (c == '\t') indent += 2;
                else break;
            }

            auto trimmed = trim_view(line);

            auto colon_pos = trimmed.find(':');
            if (colon_pos == std::string::npos) continue;

            std::string key = trim_view(trimmed.substr(0, colon_pos));
            std::string value = (colon_pos + 1 < trimmed.size())
                                    ? trim_view(trimmed.substr(colon_pos + 1))
                                    : "";

            // Pop path stack to appropriate level
            while (!path_stack.empty() && path_stack.back().first >= indent) {
                path_stack.pop_back();
            }

            std::string full_path;
            for (const auto& [_, segment] : path_stack) {
                full_path += segment + ".";
            }
            full_path += key;

            if (value.empty()) {
                // Section header
                path_stack.emplace_back(indent, key);
            } else {
                values_[full_path] = scalar(value);
            }
        }
    }

    [[nodiscard]] static auto trim_view(std::string_view str) -> std::string {
        auto start = str.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) return "";
        auto end = str.find_last_not_of(" \t\r\n");
        return std::string(str.substr(start, end - start + 1));
    }

    [[nodiscard]] static auto scalar(const std::string& value) -> std::string {
        if (value.length() >= 2 &&
            (value.front() == '"' || value.front() == '\'')) {
            auto closing = value.find(value.front(), 1);
            if (closing != std::string::npos) {
                return value.substr(1, closing - 1);
            }
        }

        auto comment = value.find(" #");
        if (comment != std::string::npos) {
            return trim_view(std::string_view(value).substr(0, comment));
        }
        return value;
    }

    std::map<std::string, std::string> values_;
};

}  // namespace

auto config_loader::load(const std::filesystem::path& path)
    -> Result<migrator_config> {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return error_info{error_codes::config_file_not_found,
                          "Configuration file not found: " + path.string(),
                          config_module};
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return error_info{error_codes::config_read_error,
                          "Failed to open configuration file: " + path.string(),
                          config_module};
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return error_info{error_codes::config_read_error,
                          "Failed to read configuration file: " + path.string(),
                          config_module};
    }
    return load_from_string(buffer.str());
}

auto config_loader::load_from_string(std::string_view yaml_content)
    -> Result<migrator_config> {
    simple_yaml_parser parser(yaml_content);
    migrator_config config = create_default();

    // Database configuration
    if (auto path = parser.get_string("database.path")) {
        config.database.path = *path;
    }
    if (auto prefix = parser.get_string("database.table_prefix")) {
        config.database.table_prefix = *prefix;
    }

    auto busy_timeout = parser.get_int("database.busy_timeout_ms");
    if (busy_timeout.is_err()) {
        return busy_timeout.error();
    }
    if (busy_timeout.value()) {
        config.database.busy_timeout = std::chrono::milliseconds(*busy_timeout.value());
    }

    auto foreign_keys = parser.get_bool("database.foreign_keys");
    if (foreign_keys.is_err()) {
        return foreign_keys.error();
    }
    config.database.foreign_keys =
        foreign_keys.value().value_or(config.database.foreign_keys);

    // Migrations configuration
    if (auto path = parser.get_string("migrations.path")) {
        config.migrations.path = *path;
    }

    auto advisory_lock = parser.get_bool("migrations.advisory_lock");
    if (advisory_lock.is_err()) {
        return advisory_lock.error();
    }
    config.migrations.advisory_lock =
        advisory_lock.value().value_or(config.migrations.advisory_lock);

    // Logging configuration
    if (auto level = parser.get_string("logging.level")) {
        auto parsed = parse_log_level(*level);
        if (!parsed) {
            return invalid_value("logging.level", *level,
                                 "one of trace, debug, info, warn, error, fatal, off");
        }
        config.logging.level = *parsed;
    }
    if (auto directory = parser.get_string("logging.directory")) {
        config.logging.directory = *directory;
    }

    for (auto [key, target] :
         {std::pair{"logging.console", &config.logging.console},
          std::pair{"logging.file", &config.logging.file},
          std::pair{"logging.audit", &config.logging.audit}}) {
        auto flag = parser.get_bool(key);
        if (flag.is_err()) {
            return flag.error();
        }
        *target = flag.value().value_or(*target);
    }

    auto validation = validate(config);
    if (validation.is_err()) {
        return validation.error();
    }

    return ok(std::move(config));
}

auto config_loader::create_default() -> migrator_config {
    migrator_config config;

    // Database defaults
    config.database.path = "./dbmigrate.db";
    config.database.busy_timeout = std::chrono::milliseconds{5000};
    config.database.foreign_keys = true;

    // Migrations defaults
    config.migrations.path = "./migrations";
    config.migrations.advisory_lock = false;

    // Logging defaults
    config.logging.level = integration::log_level::info;
    config.logging.directory = "logs";
    config.logging.console = true;

    return config;
}

auto config_loader::validate(const migrator_config& config) -> VoidResult {
    if (config.database.path.empty()) {
        return void_error(error_codes::config_invalid_value,
                          "Database path cannot be empty", config_module);
    }

    if (config.database.busy_timeout.count() < 0) {
        return void_error(error_codes::config_invalid_value,
                          "Busy timeout cannot be negative", config_module);
    }

    // Identifier characters only; the prefix becomes part of every table name
    const auto& prefix = config.database.table_prefix;
    if (!std::all_of(prefix.begin(), prefix.end(), [](unsigned char c) {
            return std::isalnum(c) || c == '_';
        })) {
        return void_error(error_codes::config_invalid_value,
                          "Invalid table prefix: " + prefix, config_module);
    }

    if ((config.logging.file || config.logging.audit) &&
        config.logging.directory.empty()) {
        return void_error(error_codes::config_invalid_value,
                          "Log directory required for file or audit logging",
                          config_module);
    }

    return ok();
}

auto config_loader::parse_log_level(std::string_view value)
    -> std::optional<integration::log_level> {
    auto v = to_lower(trim(value));

    if (v == "trace") return integration::log_level::trace;
    if (v == "debug") return integration::log_level::debug;
    if (v == "info") return integration::log_level::info;
    if (v == "warn" || v == "warning") return integration::log_level::warn;
    if (v == "error") return integration::log_level::error;
    if (v == "fatal" || v == "critical") return integration::log_level::fatal;
    if (v == "off") return integration::log_level::off;
    return std::nullopt;
}

auto config_loader::to_logger_config(const migrator_config& config)
    -> integration::logger_config {
    integration::logger_config logger;
    logger.log_directory = config.logging.directory;
    logger.min_level = config.logging.level;
    logger.enable_console = config.logging.console;
    logger.enable_file = config.logging.file;
    logger.enable_audit_log = config.logging.audit;
    return logger;
}

auto config_loader::to_sqlite_options(const migrator_config& config)
    -> storage::sqlite_options {
    storage::sqlite_options options;
    options.table_prefix = config.database.table_prefix;
    options.busy_timeout = config.database.busy_timeout;
    options.foreign_keys = config.database.foreign_keys;
    return options;
}

auto config_loader::trim(std::string_view str) -> std::string {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return std::string(str.substr(start, end - start + 1));
}

}  // namespace dbmigrate::config
