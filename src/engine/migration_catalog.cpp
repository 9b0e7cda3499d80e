/**
 * @file migration_catalog.cpp
 * @brief Implementation of the migration type registry
 */

#include <dbmigrate/engine/migration_catalog.hpp>

namespace dbmigrate::engine {

auto migration_catalog::add(std::string type_name, factory make)
    -> migration_catalog& {
    factories_[std::move(type_name)] = std::move(make);
    return *this;
}

auto migration_catalog::contains(std::string_view type_name) const -> bool {
    return factories_.find(type_name) != factories_.end();
}

auto migration_catalog::create(std::string_view type_name,
                               const std::string& name,
                               const std::string& version) const
    -> std::shared_ptr<migration> {
    auto it = factories_.find(type_name);
    if (it == factories_.end() || !it->second) {
        return nullptr;
    }
    return it->second(name, version);
}

auto migration_catalog::type_names() const -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(factories_.size());
    for (const auto& [type_name, make] : factories_) {
        names.push_back(type_name);
    }
    return names;
}

}  // namespace dbmigrate::engine
