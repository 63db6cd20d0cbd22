#pragma once

#include <model/entities.hpp>
#include <unordered_map>
#include <vector>

namespace Slowosiec {

/**
 * @brief Id-keyed collection that remembers insertion order.
 *
 * Records live in a dense vector (iteration follows document order) and an
 * id index gives O(1) lookup. The key of every record is its own `id` field.
 */
template <typename Record>
class IndexedTable {
public:
    using const_iterator = typename std::vector<Record>::const_iterator;

    /**
     * @brief Insert a record, or replace the one with the same id in place.
     * @return true if the id was new
     */
    bool insert_or_replace(Record record) {
        auto [it, inserted] = index_.try_emplace(record.id, records_.size());
        if (inserted) {
            records_.push_back(std::move(record));
        } else {
            records_[it->second] = std::move(record);
        }
        return inserted;
    }

    const Record* find(Id id) const {
        auto it = index_.find(id);
        return it == index_.end() ? nullptr : &records_[it->second];
    }

    Record* find(Id id) {
        auto it = index_.find(id);
        return it == index_.end() ? nullptr : &records_[it->second];
    }

    bool contains(Id id) const { return index_.count(id) > 0; }
    size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }

    const_iterator begin() const { return records_.begin(); }
    const_iterator end() const { return records_.end(); }

private:
    std::vector<Record> records_;
    std::unordered_map<Id, size_t> index_;
};

} // namespace Slowosiec
