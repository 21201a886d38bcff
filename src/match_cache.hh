#ifndef HERALD_MATCH_CACHE_HH
#define HERALD_MATCH_CACHE_HH

#include <cstddef>
#include <iterator>
#include <list>
#include <unordered_map>
#include <utility>

namespace herald {
// least recently used cache, keyed by channel name. the registry keeps the
// pattern scan result per channel here and clears it whenever patterns change
template <typename key_t, typename value_t>
class lru_cache {
public:
    using key_value_pair_t = typename std::pair<key_t, value_t>;
    using list_iterator_t = typename std::list<key_value_pair_t>::iterator;

    explicit lru_cache(size_t max_size) : max_size_(max_size) {}

    void put(const key_t &key, value_t value) {
        if (max_size_ == 0) return;
        auto it = items_map_.find(key);
        if (it != items_map_.end()) {
            items_list_.erase(it->second);
            items_map_.erase(it);
        }
        items_list_.emplace_front(key, std::move(value));
        items_map_[key] = items_list_.begin();

        if (items_map_.size() > max_size_) {
            auto last = std::prev(items_list_.end());
            items_map_.erase(last->first);
            items_list_.pop_back();
        }
    }

    // nullptr on a miss. the pointer is valid until the next put or clear
    const value_t *find(const key_t &key) {
        auto it = items_map_.find(key);
        if (it == items_map_.end()) return nullptr;
        items_list_.splice(items_list_.begin(), items_list_, it->second);
        return &it->second->second;
    }

    void clear() noexcept {
        items_map_.clear();
        items_list_.clear();
    }

    [[nodiscard]] size_t size() const noexcept { return items_map_.size(); }

private:
    std::list<key_value_pair_t> items_list_;
    std::unordered_map<key_t, list_iterator_t> items_map_;
    size_t max_size_;
};

}  // namespace herald

#endif  // HERALD_MATCH_CACHE_HH
