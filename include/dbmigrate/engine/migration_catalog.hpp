/**
 * @file migration_catalog.hpp
 * @brief Registry of compiled-in migration types
 *
 * Migration source files are compiled into the host program. The catalog
 * maps the fully qualified C++ type name declared in each file to a
 * factory, so that migration_loader can turn a directory listing into
 * migration instances.
 */

#pragma once

#include <dbmigrate/engine/migration.hpp>

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace dbmigrate::engine {

class migration_catalog {
public:
    /**
     * @brief Factory creating a migration from its file-derived name and version
     *
     * May return nullptr to decline creation.
     */
    using factory = std::function<std::shared_ptr<migration>(
        const std::string& name, const std::string& version)>;

    /**
     * @brief Register a factory under a type name
     *
     * A later registration under the same type name replaces the earlier one.
     *
     * @param type_name Fully qualified type name, e.g. "migrations::CreateUsers"
     */
    auto add(std::string type_name, factory make) -> migration_catalog&;

    /**
     * @brief Register a type constructible from (name, version)
     */
    template <typename T>
    auto add(std::string type_name) -> migration_catalog& {
        static_assert(std::is_base_of_v<migration, T>,
                      "catalog entries must derive from engine::migration");
        return add(std::move(type_name),
                   [](const std::string& name, const std::string& version)
                       -> std::shared_ptr<migration> {
                       return std::make_shared<T>(name, version);
                   });
    }

    [[nodiscard]] auto contains(std::string_view type_name) const -> bool;

    /**
     * @brief Instantiate a catalogued type
     * @return nullptr when the type is unknown or its factory declines
     */
    [[nodiscard]] auto create(std::string_view type_name,
                              const std::string& name,
                              const std::string& version) const
        -> std::shared_ptr<migration>;

    [[nodiscard]] auto type_names() const -> std::vector<std::string>;

    [[nodiscard]] auto size() const noexcept -> std::size_t {
        return factories_.size();
    }

private:
    std::map<std::string, factory, std::less<>> factories_;
};

}  // namespace dbmigrate::engine
