#pragma once
#ifndef POLICY_H
#define POLICY_H

#include <optional>
#include <string>

enum class CachePolicy { LRU, MRU, LFU };

/**
 * Parse a policy selection.
 * Accepts the menu numbers "1" (LRU), "2" (MRU), "3" (LFU) and the names
 * "lru", "mru", "lfu" in any case.
 * @return The policy, or std::nullopt if the text names none
 */
std::optional<CachePolicy> parse_policy(const std::string& text);

/**
 * @return "LRU", "MRU" or "LFU"
 */
std::string to_string(CachePolicy policy);

/**
 * @return Long human-readable name, e.g. "Least Recently Used"
 */
std::string describe(CachePolicy policy);

#endif // POLICY_H
