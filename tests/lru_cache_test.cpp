#include "lru_cache.h"
#include <gtest/gtest.h>
#include <string>
#include <vector>

using StringLRU = LRUCache<std::string, std::string>;

static std::vector<std::string> keys_of(const StringLRU& cache) {
    std::vector<std::string> keys;
    for (const auto& entry : cache.displayCache()) {
        keys.push_back(entry.key);
    }
    return keys;
}

TEST(LRUCacheTest, BasicPutGet) {
    StringLRU cache(3);
    cache.put("A", "Apple");
    cache.put("B", "Banana");
    cache.put("C", "Cherry");

    EXPECT_EQ(cache.get("A").value.value(), "Apple");
    EXPECT_EQ(cache.get("B").value.value(), "Banana");
    EXPECT_EQ(cache.get("C").value.value(), "Cherry");
    EXPECT_EQ(cache.hits(), 3u);
    EXPECT_EQ(cache.misses(), 0u);
}

TEST(LRUCacheTest, EvictsFirstInsertedWhenUntouched) {
    StringLRU cache(3);
    cache.put("A", "Apple");
    cache.put("B", "Banana");
    cache.put("C", "Cherry");
    auto result = cache.put("D", "Durian");

    EXPECT_EQ(result.kind, WriteKind::Inserted);
    ASSERT_TRUE(result.evicted.has_value());
    EXPECT_EQ(*result.evicted, "A");
    EXPECT_FALSE(cache.contains("A"));
    EXPECT_EQ(cache.size(), 3u);
}

TEST(LRUCacheTest, GetRefreshesRecency) {
    StringLRU cache(2);
    cache.put("A", "Apple");
    cache.put("B", "Banana");
    cache.get("A"); // Access A so B becomes LRU
    auto result = cache.put("C", "Cherry"); // Evicts B

    ASSERT_TRUE(result.evicted.has_value());
    EXPECT_EQ(*result.evicted, "B");
    EXPECT_FALSE(cache.get("B").hit());
    EXPECT_TRUE(cache.get("A").hit());
    EXPECT_TRUE(cache.get("C").hit());
}

TEST(LRUCacheTest, UpdateRefreshesRecency) {
    StringLRU cache(2);
    cache.put("A", "Apple");
    cache.put("B", "Banana");
    auto update = cache.put("A", "Apricot");
    EXPECT_EQ(update.kind, WriteKind::Updated);
    EXPECT_FALSE(update.evicted.has_value());

    cache.put("C", "Cherry");
    EXPECT_FALSE(cache.contains("B"));
    EXPECT_EQ(cache.get("A").value.value(), "Apricot");
}

TEST(LRUCacheTest, DisplayIsMostRecentFirst) {
    StringLRU cache(3);
    cache.put("A", "Apple");
    cache.put("B", "Banana");
    cache.put("C", "Cherry");
    cache.get("A");

    EXPECT_EQ(keys_of(cache), (std::vector<std::string>{"A", "C", "B"}));
}

TEST(LRUCacheTest, ReinsertAfterEvictionHasSingleNode) {
    StringLRU cache(2);
    cache.put("A", "Apple");
    cache.put("B", "Banana");
    cache.put("C", "Cherry");  // Evicts A
    cache.put("A", "Avocado"); // Evicts B
    cache.put("A", "Apricot");

    EXPECT_EQ(keys_of(cache), (std::vector<std::string>{"A", "C"}));
    EXPECT_EQ(cache.size(), 2u);
}

TEST(LRUCacheTest, EraseKey) {
    StringLRU cache(3);
    cache.put("A", "Apple");
    cache.put("B", "Banana");
    EXPECT_TRUE(cache.erase("A"));
    EXPECT_FALSE(cache.get("A").hit());
    EXPECT_EQ(keys_of(cache), (std::vector<std::string>{"B"}));
}

TEST(LRUCacheTest, EraseNonExistentKey) {
    StringLRU cache(3);
    EXPECT_FALSE(cache.erase("NotThere")); // Should not crash
}

TEST(LRUCacheTest, ClearEmptiesListAndIndex) {
    StringLRU cache(2);
    cache.put("A", "Apple");
    cache.put("B", "Banana");
    cache.clear();

    EXPECT_EQ(cache.size(), 0u);
    EXPECT_TRUE(cache.displayCache().empty());

    cache.put("C", "Cherry");
    cache.put("D", "Durian");
    EXPECT_EQ(keys_of(cache), (std::vector<std::string>{"D", "C"}));
}

TEST(LRUCacheTest, GetFromEmptyCache) {
    StringLRU cache(3);
    auto result = cache.get("A");
    EXPECT_EQ(result.kind, AccessKind::Miss);
    EXPECT_FALSE(result.value.has_value());
    EXPECT_EQ(cache.misses(), 1u);
}
