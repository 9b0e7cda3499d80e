/**
 * @file migration_record.hpp
 * @brief Status and preview records reported by the migration runner
 */

#pragma once

#include <optional>
#include <string>

namespace dbmigrate::engine {

/**
 * @brief Applied/pending state of one registered migration
 */
struct migration_status {
    std::string name;                  ///< Migration name
    std::optional<int> batch;          ///< Batch number, empty when pending
    bool ran{false};                   ///< Whether a bookkeeping row exists
    std::optional<std::string> ran_at; ///< created_at of the bookkeeping row
};

/**
 * @brief Pending migration as shown by preview()
 */
struct migration_preview {
    std::string name;         ///< Migration name
    std::string description;  ///< migration::description()
};

}  // namespace dbmigrate::engine
