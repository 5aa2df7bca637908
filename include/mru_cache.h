#pragma once
#ifndef MRU_CACHE_H
#define MRU_CACHE_H

#include <deque>
#include <unordered_map>
#include <unordered_set>

#include "cache.h"

/**
 * Most Recently Used cache.
 * - Every put pushes its key on a recency stack (front = top); get does not
 * - A full cache evicts the key on top of the stack, i.e. the last key put
 * - The stack is never pruned: updates leave duplicate keys behind and
 *   erase() leaves stale ones. Popping a key that is no longer stored is a
 *   no-op and popping continues until a live key has been evicted.
 * - displayCache() walks the stack top-down, listing each live key once
 */
template <typename K, typename V, typename Hash = std::hash<K>>
class MRUCache : public Cache<K, V, Hash> {
    using Base = Cache<K, V, Hash>;

public:
    using Entries = typename Base::Entries;

    explicit MRUCache(int64_t capacity) : Base(capacity) {}

    GetResult<V> get(const K& key) override {
        auto it = map_.find(key);
        if (it == map_.end()) {
            return this->record_miss(key);
        }
        return this->record_hit(key, it->second);
    }

    PutResult<K> put(const K& key, const V& value) override {
        if (this->capacity() == 0) {
            return this->record_ignored(key);
        }

        auto it = map_.find(key);
        if (it != map_.end()) {
            it->second = value;
            stack_.push_front(key);
            return this->record_update(key, value);
        }

        std::optional<K> evicted;
        if (map_.size() >= this->capacity()) {
            evicted = evict_most_recent();
        }

        map_.emplace(key, value);
        stack_.push_front(key);
        return this->record_insert(key, value, std::move(evicted));
    }

    Entries displayCache() const override {
        Entries result;
        result.reserve(map_.size());
        std::unordered_set<K, Hash> listed;
        for (const auto& key : stack_) {
            auto it = map_.find(key);
            if (it == map_.end() || !listed.insert(key).second) {
                continue;
            }
            result.push_back({key, it->second, std::nullopt});
        }
        return result;
    }

    bool erase(const K& key) override {
        if (map_.erase(key) == 0) return false;
        this->notify(EventType::Erased, key);
        return true;
    }

    bool contains(const K& key) const override {
        return map_.find(key) != map_.end();
    }

    size_t size() const override { return map_.size(); }

    void clear() override {
        map_.clear();
        stack_.clear();
    }

    CachePolicy policy() const override { return CachePolicy::MRU; }

    /**
     * @return Number of keys on the recency stack, stale and duplicate entries included
     */
    size_t stack_depth() const { return stack_.size(); }

private:
    /**
     * Pop until a key that is still stored comes off the stack, and evict it.
     * Only called on a full cache, where the top is always the last key put and
     * therefore live: the first pop evicts. The loop guards the stale-top case
     * that erase() would produce, which leaves the cache below capacity and so
     * never reaches here.
     */
    std::optional<K> evict_most_recent() {
        while (!stack_.empty()) {
            K top = std::move(stack_.front());
            stack_.pop_front();
            if (map_.erase(top) > 0) {
                return top;
            }
        }
        return std::nullopt;
    }

    std::unordered_map<K, V, Hash> map_;    ///< key -> value
    std::deque<K> stack_;                   ///< Keys passed to put, most recent at front
};

#endif // MRU_CACHE_H
