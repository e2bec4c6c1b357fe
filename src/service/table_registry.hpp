#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "holdem/random_source.hpp"
#include "holdem/table_state.hpp"

namespace holdem {
namespace service {

/**
 * Live tables keyed by id.
 *
 * Each table has its own mutex: calls against one table run one at a time,
 * calls against different tables run in parallel. The registry lock is held
 * only to look an entry up.
 */
class TableRegistry {
public:
    explicit TableRegistry(std::size_t max_tables,
                           std::optional<std::uint64_t> shuffle_seed = std::nullopt);

    /**
     * Register a new table. An empty table id is replaced by a generated one.
     * Throws ALREADY_EXISTS for a duplicate id and RESOURCE_EXHAUSTED when full.
     * Returns the id actually used.
     */
    std::string create(Table table);

    /**
     * Run `fn(table, rng)` under the table's lock and return its result.
     * Throws NOT_FOUND for an unknown id.
     */
    template<typename Fn>
    auto with_table(const std::string& table_id, Fn&& fn) {
        auto entry = find(table_id);
        std::lock_guard<std::mutex> lock(entry->mutex);
        return fn(entry->table, *entry->rng);
    }

    /// Remove a table. Returns false when the id is unknown.
    bool close(const std::string& table_id);

    std::size_t size() const;
    std::size_t capacity() const { return max_tables_; }

private:
    struct Entry {
        std::mutex mutex;
        Table table;
        std::unique_ptr<RandomSource> rng;
    };

    std::shared_ptr<Entry> find(const std::string& table_id) const;
    std::unique_ptr<RandomSource> make_rng(const std::string& table_id) const;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Entry>> tables_;
    std::size_t max_tables_;
    std::optional<std::uint64_t> shuffle_seed_;
    std::uint64_t next_id_ = 1;
};

} // namespace service
} // namespace holdem
