#include "policy.h"
#include <algorithm>
#include <cctype>

std::optional<CachePolicy> parse_policy(const std::string& text) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "1" || lowered == "lru") return CachePolicy::LRU;
    if (lowered == "2" || lowered == "mru") return CachePolicy::MRU;
    if (lowered == "3" || lowered == "lfu") return CachePolicy::LFU;
    return std::nullopt;
}

std::string to_string(CachePolicy policy) {
    switch (policy) {
        case CachePolicy::LRU: return "LRU";
        case CachePolicy::MRU: return "MRU";
        case CachePolicy::LFU: return "LFU";
    }
    return "UNKNOWN";
}

std::string describe(CachePolicy policy) {
    switch (policy) {
        case CachePolicy::LRU: return "Least Recently Used";
        case CachePolicy::MRU: return "Most Recently Used";
        case CachePolicy::LFU: return "Least Frequently Used";
    }
    return "Unknown";
}
