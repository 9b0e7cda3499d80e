/**
 * @file migration_loader.cpp
 * @brief Implementation of directory discovery
 */

#include <dbmigrate/engine/migration_loader.hpp>

#include <dbmigrate/errors/migration_error.hpp>

#include <algorithm>
#include <fstream>
#include <regex>
#include <sstream>
#include <system_error>

namespace dbmigrate::engine {

namespace {

auto read_file(const std::filesystem::path& path) -> Result<std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return errors::migration_error::load_failed(
                   path.string(), "cannot open file for reading")
            .to_error_info();
    }

    std::ostringstream content;
    content << file.rdbuf();
    if (file.bad()) {
        return errors::migration_error::load_failed(path.string(),
                                                    "error while reading file")
            .to_error_info();
    }
    return ok(content.str());
}

}  // namespace

migration_loader::migration_loader(const migration_catalog& catalog,
                                   std::shared_ptr<di::ILogger> logger)
    : catalog_(catalog),
      logger_(logger ? std::move(logger) : di::null_logger()) {}

auto migration_loader::load(const std::filesystem::path& directory) const
    -> Result<std::vector<std::shared_ptr<migration>>> {
    std::vector<std::shared_ptr<migration>> loaded;

    std::error_code ec;
    if (directory.empty() || !std::filesystem::is_directory(directory, ec)) {
        logger_->debug_fmt("No migrations directory at '{}'", directory.string());
        return ok(std::move(loaded));
    }

    std::vector<std::filesystem::path> files;
    std::filesystem::directory_iterator it(directory, ec);
    if (ec) {
        return errors::migration_error::load_failed(directory.string(),
                                                    ec.message())
            .to_error_info();
    }

    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        const auto& entry = *it;
        if (entry.is_regular_file(ec) && entry.path().extension() == ".cpp") {
            files.push_back(entry.path());
        }
    }
    if (ec) {
        return errors::migration_error::load_failed(directory.string(),
                                                    ec.message())
            .to_error_info();
    }

    std::sort(files.begin(), files.end(),
              [](const auto& a, const auto& b) {
                  return a.filename() < b.filename();
              });

    for (const auto& file : files) {
        auto content = read_file(file);
        if (content.is_err()) {
            return content.error();
        }

        auto type_name = declared_type(content.value());
        if (!type_name) {
            logger_->debug_fmt("Skipping {}: no class declaration",
                               file.filename().string());
            continue;
        }

        const auto name = file.stem().string();
        const auto version = migration::extract_version(name);

        auto instance = catalog_.create(*type_name, name, version);
        if (!instance) {
            logger_->debug_fmt("Skipping {}: type {} is not in the catalog",
                               file.filename().string(), *type_name);
            continue;
        }

        logger_->debug_fmt("Loaded migration {} ({})", name, *type_name);
        loaded.push_back(std::move(instance));
    }

    return ok(std::move(loaded));
}

auto migration_loader::declared_type(std::string_view source)
    -> std::optional<std::string> {
    static const std::regex class_pattern(
        R"((?:^|[^\w])class\s+([A-Za-z_]\w*)\s*(?:final\s*)?[:{])");
    static const std::regex namespace_pattern(
        R"(namespace\s+([A-Za-z_][\w:]*)\s*\{)");

    const std::string text(source);

    std::smatch class_match;
    if (!std::regex_search(text, class_match, class_pattern)) {
        return std::nullopt;
    }
    const auto class_position = class_match.position(0);

    // Namespaces opened before the class declaration enclose it
    std::string qualified;
    for (auto ns = std::sregex_iterator(text.begin(), text.end(),
                                        namespace_pattern);
         ns != std::sregex_iterator(); ++ns) {
        if (ns->position(0) > class_position) {
            break;
        }
        if (!qualified.empty()) {
            qualified += "::";
        }
        qualified += (*ns)[1].str();
    }

    if (!qualified.empty()) {
        qualified += "::";
    }
    qualified += class_match[1].str();
    return qualified;
}

}  // namespace dbmigrate::engine
