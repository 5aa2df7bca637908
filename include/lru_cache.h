#pragma once
#ifndef LRU_CACHE_H
#define LRU_CACHE_H

#include <list>
#include <unordered_map>

#include "cache.h"

/**
 * Least Recently Used cache.
 * - Entries live in a list ordered MRU -> LRU; the map holds an iterator per key
 * - get/put hits splice the node to the front in O(1), keeping node identity
 * - A full cache evicts the back of the list
 * - displayCache() lists entries most-recent first
 */
template <typename K, typename V, typename Hash = std::hash<K>>
class LRUCache : public Cache<K, V, Hash> {
    using Base = Cache<K, V, Hash>;

public:
    using Entries = typename Base::Entries;

    explicit LRUCache(int64_t capacity) : Base(capacity) {}

    GetResult<V> get(const K& key) override {
        auto it = map_.find(key);
        if (it == map_.end()) {
            return this->record_miss(key);
        }
        touch_to_front(it->second);
        return this->record_hit(key, it->second->value);
    }

    PutResult<K> put(const K& key, const V& value) override {
        if (this->capacity() == 0) {
            return this->record_ignored(key);
        }

        auto it = map_.find(key);
        if (it != map_.end()) {
            it->second->value = value;
            touch_to_front(it->second);
            return this->record_update(key, value);
        }

        std::optional<K> evicted;
        if (map_.size() >= this->capacity()) {
            evicted = evict_lru();
        }

        // Insert new key at front of LRU list
        lru_list_.push_front(Node{key, value});
        map_.emplace(key, lru_list_.begin());
        return this->record_insert(key, value, std::move(evicted));
    }

    Entries displayCache() const override {
        Entries result;
        result.reserve(lru_list_.size());
        for (const auto& node : lru_list_) {
            result.push_back({node.key, node.value, std::nullopt});
        }
        return result;
    }

    bool erase(const K& key) override {
        auto it = map_.find(key);
        if (it == map_.end()) return false;
        lru_list_.erase(it->second);
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
        lru_list_.clear();
    }

    CachePolicy policy() const override { return CachePolicy::LRU; }

private:
    struct Node {
        K key;
        V value;
    };

    using NodeList = std::list<Node>;

    /// Move accessed/updated node to front of LRU list.
    void touch_to_front(typename NodeList::iterator node) {
        lru_list_.splice(lru_list_.begin(), lru_list_, node);
    }

    /// Remove the least recently used entry. Caller guarantees the cache is not empty.
    K evict_lru() {
        K victim = std::move(lru_list_.back().key);
        lru_list_.pop_back();
        map_.erase(victim);
        return victim;
    }

    NodeList lru_list_;                                             ///< Nodes in MRU -> LRU order
    std::unordered_map<K, typename NodeList::iterator, Hash> map_;  ///< key -> node
};

#endif // LRU_CACHE_H
