#pragma once
#ifndef CACHE_FORMAT_H
#define CACHE_FORMAT_H

#include <sstream>
#include <string>
#include <vector>

#include "cache.h"

/**
 * Render a cache event as the one-line message shown to the user, e.g.
 * "Cache Hit: 1 -> one" or "Cache Miss for key: 7".
 * K and V must be streamable.
 */
template <typename K, typename V>
std::string format_event(const CacheEvent<K, V>& event) {
    std::ostringstream ss;
    switch (event.type) {
        case EventType::Hit:
            ss << "Cache Hit: " << event.key << " -> " << *event.value;
            break;
        case EventType::Miss:
            ss << "Cache Miss for key: " << event.key;
            break;
        case EventType::Inserted:
        case EventType::Updated:
            ss << "Inserted/Updated: " << event.key << " -> " << *event.value;
            break;
        case EventType::Evicted:
            ss << "Evicted: " << event.key;
            break;
        case EventType::Erased:
            ss << "Erased: " << event.key;
            break;
        case EventType::Ignored:
            ss << "Not stored (capacity 0): " << event.key;
            break;
    }
    return ss.str();
}

/**
 * Render a displayCache() snapshot: "Cache State: 1:one 2:two".
 * Entries carrying a frequency render as "1:one(f=3)".
 */
template <typename K, typename V>
std::string format_state(const std::vector<CacheEntry<K, V>>& entries) {
    std::ostringstream ss;
    ss << "Cache State:";
    for (const auto& entry : entries) {
        ss << ' ' << entry.key << ':' << entry.value;
        if (entry.frequency) {
            ss << "(f=" << *entry.frequency << ')';
        }
    }
    return ss.str();
}

#endif // CACHE_FORMAT_H
