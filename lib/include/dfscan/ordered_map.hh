//
// Insertion-ordered map: entries in a vector, key -> index in a std::map.
// Re-assigning an existing key keeps its first-seen position.
//

#pragma once

#include <cstddef>
#include <map>
#include <utility>
#include <vector>

namespace dfscan {

template <typename K, typename V>
class ordered_map {
public:
    using value_type = std::pair<K, V>;
    using const_iterator = typename std::vector<value_type>::const_iterator;

    void insert_or_assign(const K& key, V value) {
        auto it = index_.find(key);
        if (it != index_.end()) {
            entries_[it->second].second = std::move(value);
            return;
        }
        index_.emplace(key, entries_.size());
        entries_.emplace_back(key, std::move(value));
    }

    [[nodiscard]] bool contains(const K& key) const {
        return index_.contains(key);
    }

    /// Pointer to the mapped value or nullptr if absent.
    [[nodiscard]] const V* find(const K& key) const {
        auto it = index_.find(key);
        return it == index_.end() ? nullptr : &entries_[it->second].second;
    }

    /// Throws std::out_of_range if absent.
    [[nodiscard]] const V& at(const K& key) const {
        return entries_[index_.at(key)].second;
    }

    [[nodiscard]] std::size_t size() const { return entries_.size(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }

    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

    bool operator==(const ordered_map& other) const {
        return entries_ == other.entries_;
    }

private:
    std::vector<value_type> entries_;
    std::map<K, std::size_t> index_;
};

} // namespace dfscan
