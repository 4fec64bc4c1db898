#pragma once

#include <cstdint>
#include <list>
#include <optional>
#include <unordered_map>
#include <utility>

namespace caproute {

// LruTtlCache
// - Bounded by entry count, least recently used evicted first
// - Per-entry expiry; expired entries stay readable through get_any() until evicted
// - Not thread-safe; callers hold their own lock
// - Time is passed in (ms) so callers control the clock
template <typename K, typename V>
class LruTtlCache {
public:
    struct Entry {
        V value;
        int64_t stored_ms{0};
        int64_t expires_ms{0};
    };

    LruTtlCache(size_t max_entries, int64_t ttl_ms)
        : max_entries_(max_entries == 0 ? 1 : max_entries), ttl_ms_(ttl_ms) {}

    // Non-expired value, refreshed to most recently used.
    std::optional<V> get_fresh(const K& key, int64_t now_ms) {
        auto it = index_.find(key);
        if (it == index_.end()) return std::nullopt;
        if (it->second->second.expires_ms <= now_ms) return std::nullopt;
        order_.splice(order_.begin(), order_, it->second);
        return it->second->second.value;
    }

    // Value regardless of expiry (last-known-good).
    std::optional<Entry> get_any(const K& key) const {
        auto it = index_.find(key);
        if (it == index_.end()) return std::nullopt;
        return it->second->second;
    }

    void put(const K& key, V value, int64_t now_ms) {
        auto it = index_.find(key);
        if (it != index_.end()) {
            it->second->second = Entry{std::move(value), now_ms, now_ms + ttl_ms_};
            order_.splice(order_.begin(), order_, it->second);
            return;
        }
        order_.emplace_front(key, Entry{std::move(value), now_ms, now_ms + ttl_ms_});
        index_[key] = order_.begin();
        while (order_.size() > max_entries_) {
            index_.erase(order_.back().first);
            order_.pop_back();
            evictions_++;
        }
    }

    void erase(const K& key) {
        auto it = index_.find(key);
        if (it == index_.end()) return;
        order_.erase(it->second);
        index_.erase(it);
    }

    void clear() {
        order_.clear();
        index_.clear();
    }

    size_t size() const { return order_.size(); }
    size_t capacity() const { return max_entries_; }
    uint64_t evictions() const { return evictions_; }
    int64_t ttl_ms() const { return ttl_ms_; }

private:
    using Node = std::pair<K, Entry>;
    size_t max_entries_;
    int64_t ttl_ms_;
    std::list<Node> order_;
    std::unordered_map<K, typename std::list<Node>::iterator> index_;
    uint64_t evictions_{0};
};

} // namespace caproute
