#pragma once
#ifndef LFU_CACHE_H
#define LFU_CACHE_H

#include <map>
#include <unordered_map>
#include <utility>

#include "cache.h"

/**
 * Least Frequently Used cache.
 * - Frequency starts at 1 on insert and grows by 1 on every hit and every update
 * - Victim = lowest frequency; ties go to the key inserted earliest
 * - Eviction order is kept in a map keyed by (frequency, insertion sequence),
 *   so picking the victim and bumping a frequency are O(log n)
 * - displayCache() lists entries in eviction order, next victim first
 */
template <typename K, typename V, typename Hash = std::hash<K>>
class LFUCache : public Cache<K, V, Hash> {
    using Base = Cache<K, V, Hash>;

public:
    using Entries = typename Base::Entries;

    explicit LFUCache(int64_t capacity) : Base(capacity) {}

    GetResult<V> get(const K& key) override {
        auto it = map_.find(key);
        if (it == map_.end()) {
            return this->record_miss(key);
        }
        bump(it);
        return this->record_hit(key, it->second.value);
    }

    PutResult<K> put(const K& key, const V& value) override {
        if (this->capacity() == 0) {
            return this->record_ignored(key);
        }

        auto it = map_.find(key);
        if (it != map_.end()) {
            it->second.value = value;
            bump(it);
            return this->record_update(key, value);
        }

        std::optional<K> evicted;
        if (map_.size() >= this->capacity()) {
            evicted = evict_least_frequent();
        }

        uint64_t sequence = next_sequence_++;
        map_.emplace(key, Slot{value, 1, sequence});
        order_.emplace(OrderKey{1, sequence}, key);
        return this->record_insert(key, value, std::move(evicted));
    }

    Entries displayCache() const override {
        Entries result;
        result.reserve(order_.size());
        for (const auto& [rank, key] : order_) {
            const Slot& slot = map_.at(key);
            result.push_back({key, slot.value, slot.frequency});
        }
        return result;
    }

    bool erase(const K& key) override {
        auto it = map_.find(key);
        if (it == map_.end()) return false;
        order_.erase(OrderKey{it->second.frequency, it->second.sequence});
        map_.erase(it);
        this->notify(EventType::Erased, key);
        return true;
    }

    bool contains(const K& key) const override {
        return map_.find(key) != map_.end();
    }

    size_t size() const override { return map_.size(); }

    void clear() override {
        map_.clear();
        order_.clear();
    }

    CachePolicy policy() const override { return CachePolicy::LFU; }

    /**
     * @return Current access frequency of key, or std::nullopt if not cached
     */
    std::optional<uint64_t> frequency(const K& key) const {
        auto it = map_.find(key);
        if (it == map_.end()) return std::nullopt;
        return it->second.frequency;
    }

private:
    struct Slot {
        V value;
        uint64_t frequency;   ///< >= 1
        uint64_t sequence;    ///< Insertion order, breaks frequency ties
    };

    using OrderKey = std::pair<uint64_t, uint64_t>;   ///< (frequency, sequence)
    using SlotMap = std::unordered_map<K, Slot, Hash>;

    void bump(typename SlotMap::iterator it) {
        Slot& slot = it->second;
        order_.erase(OrderKey{slot.frequency, slot.sequence});
        ++slot.frequency;
        order_.emplace(OrderKey{slot.frequency, slot.sequence}, it->first);
    }

    /// Caller guarantees the cache is not empty.
    K evict_least_frequent() {
        auto victim = order_.begin();
        K key = std::move(victim->second);
        order_.erase(victim);
        map_.erase(key);
        return key;
    }

    SlotMap map_;                       ///< key -> value + frequency bookkeeping
    std::map<OrderKey, K> order_;       ///< Eviction order, victim at begin()
    uint64_t next_sequence_ = 0;
};

#endif // LFU_CACHE_H
