#include "table_registry.hpp"
#include "holdem/errors.hpp"
#include <functional>
#include <utility>

namespace holdem {
namespace service {

TableRegistry::TableRegistry(std::size_t max_tables, std::optional<std::uint64_t> shuffle_seed)
    : max_tables_(max_tables), shuffle_seed_(shuffle_seed) {}

std::string TableRegistry::create(Table table) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Guard
    if (tables_.size() >= max_tables_) {
        throw CommandRejectedError::resource_exhausted(
            "Table limit of " + std::to_string(max_tables_) + " reached.");
    }

    std::string table_id = table.config.table_id;
    if (table_id.empty()) {
        do {
            table_id = "table_" + std::to_string(next_id_++);
        } while (tables_.count(table_id) > 0);
    } else if (tables_.count(table_id) > 0) {
        throw CommandRejectedError::already_exists("Table " + table_id + " already exists.");
    }

    // Compute
    auto entry = std::make_shared<Entry>();
    table.config.table_id = table_id;
    entry->table = std::move(table);
    entry->rng = make_rng(table_id);
    tables_.emplace(table_id, std::move(entry));
    return table_id;
}

bool TableRegistry::close(const std::string& table_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return tables_.erase(table_id) > 0;
}

std::size_t TableRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tables_.size();
}

std::shared_ptr<TableRegistry::Entry> TableRegistry::find(const std::string& table_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tables_.find(table_id);
    if (it == tables_.end()) {
        throw CommandRejectedError::not_found("Table " + table_id + " not found.");
    }
    return it->second;
}

std::unique_ptr<RandomSource> TableRegistry::make_rng(const std::string& table_id) const {
    if (shuffle_seed_) {
        return std::make_unique<MersenneRandomSource>(
            *shuffle_seed_ ^ static_cast<std::uint64_t>(std::hash<std::string>{}(table_id)));
    }
    return std::make_unique<MersenneRandomSource>();
}

} // namespace service
} // namespace holdem
