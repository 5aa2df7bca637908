#include "cache_factory.h"
#include "cache_format.h"
#include <iostream>
#include <string>

// Walks the same sequence of operations through each policy and prints the
// resulting state, so the eviction rules can be compared side by side.
int main() {
    for (auto policy : {CachePolicy::LRU, CachePolicy::MRU, CachePolicy::LFU}) {
        auto cache = make_cache<std::string, std::string>(policy, 3); // capacity = 3
        cache->set_listener([](const CacheEvent<std::string, std::string>& event) {
            std::cout << "  " << format_event(event) << "\n";
        });

        std::cout << "=== " << to_string(policy) << " (" << describe(policy) << ") ===\n";
        cache->put("A", "Apple");
        cache->put("B", "Banana");
        cache->put("C", "Cherry");
        std::cout << format_state(cache->displayCache()) << "\n";

        cache->get("A");
        cache->get("A");
        cache->get("C");
        std::cout << format_state(cache->displayCache()) << "\n";

        std::cout << "--- insert D into a full cache ---\n";
        cache->put("D", "Dates");
        std::cout << format_state(cache->displayCache()) << "\n";

        std::cout << "hits=" << cache->hits() << " misses=" << cache->misses() << "\n\n";
    }

    return 0;
}
