#pragma once
#ifndef CACHE_H
#define CACHE_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "policy.h"

/**
 * Raised when a cache or the simulator is configured with invalid values
 * (negative capacity, unknown policy in a config file, malformed JSON...).
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

enum class AccessKind { Hit, Miss };

enum class WriteKind {
    Inserted,   ///< Key was absent and is now stored
    Updated,    ///< Key was present, value replaced
    Ignored     ///< Capacity 0, nothing stored
};

enum class EventType { Hit, Miss, Inserted, Updated, Evicted, Erased, Ignored };

/**
 * Outcome of Cache::get.
 */
template <typename V>
struct GetResult {
    AccessKind kind;
    std::optional<V> value;   ///< Set only on a hit

    bool hit() const { return kind == AccessKind::Hit; }
};

/**
 * Outcome of Cache::put.
 */
template <typename K>
struct PutResult {
    WriteKind kind;
    std::optional<K> evicted; ///< Victim removed to make room, if any
};

/**
 * One line of a displayCache() snapshot.
 */
template <typename K, typename V>
struct CacheEntry {
    K key;
    V value;
    std::optional<uint64_t> frequency; ///< LFU only
};

/**
 * Emitted to the listener on every get/put/erase.
 * `value` is empty for Miss, Evicted, Erased and Ignored.
 */
template <typename K, typename V>
struct CacheEvent {
    EventType type;
    K key;
    std::optional<V> value;
};

/**
 * Fixed-capacity key/value cache with a pluggable eviction policy.
 * - Capacity is counted in entries; 0 is valid and stores nothing
 * - size() <= capacity() after every public call
 * - A full cache evicts exactly one victim before inserting a new key
 * - Not thread-safe: get() mutates recency/frequency state, so callers
 *   sharing an instance must guard the whole object with one mutex
 */
template <typename K, typename V, typename Hash = std::hash<K>>
class Cache {
public:
    using Listener = std::function<void(const CacheEvent<K, V>&)>;
    using Entries = std::vector<CacheEntry<K, V>>;

    /**
     * Constructor
     * @param capacity Maximum number of entries, must be >= 0
     * @throws ConfigError if capacity is negative
     */
    explicit Cache(int64_t capacity) : capacity_(checked_capacity(capacity)) {}

    virtual ~Cache() = default;

    Cache(const Cache&) = delete;
    Cache& operator=(const Cache&) = delete;

    // ---------------- Public API ----------------

    /**
     * Look up a key. A hit runs the policy's bookkeeping, a miss changes nothing.
     * @param key Key to fetch
     * @return Hit with the value, or Miss with an empty value
     */
    virtual GetResult<V> get(const K& key) = 0;

    /**
     * Insert or update a key-value pair, evicting one victim if the cache is full
     * and the key is new.
     * @param key   Key to store
     * @param value Value to store
     * @return What happened and which key (if any) was evicted
     */
    virtual PutResult<K> put(const K& key, const V& value) = 0;

    /**
     * Snapshot of all live entries in the policy's display order.
     */
    virtual Entries displayCache() const = 0;

    /**
     * Remove a key from cache.
     * @return true if key was removed, false if not found
     */
    virtual bool erase(const K& key) = 0;

    /**
     * Raw presence check, does not count as an access.
     */
    virtual bool contains(const K& key) const = 0;

    /**
     * @return Current number of entries in the cache
     */
    virtual size_t size() const = 0;

    /**
     * Drop every entry and all policy state. Hit/miss counters are kept.
     */
    virtual void clear() = 0;

    virtual CachePolicy policy() const = 0;

    size_t capacity() const { return capacity_; }

    /**
     * @return Number of successful cache hits
     */
    size_t hits() const { return hits_; }

    /**
     * @return Number of cache misses
     */
    size_t misses() const { return misses_; }

    /**
     * Subscribe to cache events. Replaces any previous listener; pass an
     * empty function to unsubscribe.
     */
    void set_listener(Listener listener) { listener_ = std::move(listener); }

protected:
    // ---------------- Helpers for policies ----------------

    void notify(EventType type, const K& key, std::optional<V> value = std::nullopt) const {
        if (listener_) {
            listener_(CacheEvent<K, V>{type, key, std::move(value)});
        }
    }

    GetResult<V> record_hit(const K& key, const V& value) {
        ++hits_;
        notify(EventType::Hit, key, value);
        return GetResult<V>{AccessKind::Hit, value};
    }

    GetResult<V> record_miss(const K& key) {
        ++misses_;
        notify(EventType::Miss, key);
        return GetResult<V>{AccessKind::Miss, std::nullopt};
    }

    PutResult<K> record_insert(const K& key, const V& value, std::optional<K> evicted) {
        if (evicted) {
            notify(EventType::Evicted, *evicted);
        }
        notify(EventType::Inserted, key, value);
        return PutResult<K>{WriteKind::Inserted, std::move(evicted)};
    }

    PutResult<K> record_update(const K& key, const V& value) {
        notify(EventType::Updated, key, value);
        return PutResult<K>{WriteKind::Updated, std::nullopt};
    }

    PutResult<K> record_ignored(const K& key) {
        notify(EventType::Ignored, key);
        return PutResult<K>{WriteKind::Ignored, std::nullopt};
    }

private:
    static size_t checked_capacity(int64_t capacity) {
        if (capacity < 0) {
            throw ConfigError("cache capacity must be non-negative, got " + std::to_string(capacity));
        }
        return static_cast<size_t>(capacity);
    }

    // ---------------- Data members ----------------
    size_t capacity_;           ///< Max allowed entries
    size_t hits_ = 0;           ///< Count of cache hits
    size_t misses_ = 0;         ///< Count of cache misses
    Listener listener_;         ///< Event sink, may be empty
};

#endif // CACHE_H
