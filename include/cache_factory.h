#pragma once
#ifndef CACHE_FACTORY_H
#define CACHE_FACTORY_H

#include <memory>
#include <stdexcept>

#include "cache.h"
#include "lfu_cache.h"
#include "lru_cache.h"
#include "mru_cache.h"

/**
 * Build the cache variant for a policy. Callers only see the Cache interface.
 * @param policy   Eviction policy
 * @param capacity Maximum number of entries
 * @throws ConfigError if capacity is negative
 */
template <typename K, typename V, typename Hash = std::hash<K>>
std::unique_ptr<Cache<K, V, Hash>> make_cache(CachePolicy policy, int64_t capacity) {
    switch (policy) {
        case CachePolicy::LRU: return std::make_unique<LRUCache<K, V, Hash>>(capacity);
        case CachePolicy::MRU: return std::make_unique<MRUCache<K, V, Hash>>(capacity);
        case CachePolicy::LFU: return std::make_unique<LFUCache<K, V, Hash>>(capacity);
    }
    throw std::invalid_argument("unknown cache policy");
}

#endif // CACHE_FACTORY_H
