#include "lfu_cache.h"
#include <gtest/gtest.h>
#include <string>
#include <vector>

using StringLFU = LFUCache<std::string, std::string>;

TEST(LFUCacheTest, EvictsLeastFrequent) {
    StringLFU cache(2);
    cache.put("A", "Apple");
    cache.put("B", "Banana");
    cache.get("A");
    cache.get("A");
    EXPECT_EQ(cache.frequency("A"), 3u);
    EXPECT_EQ(cache.frequency("B"), 1u);

    auto result = cache.put("C", "Cherry");
    ASSERT_TRUE(result.evicted.has_value());
    EXPECT_EQ(*result.evicted, "B");
    EXPECT_TRUE(cache.contains("A"));
    EXPECT_TRUE(cache.contains("C"));
    EXPECT_EQ(cache.frequency("C"), 1u);
}

TEST(LFUCacheTest, TieGoesToEarliestInserted) {
    StringLFU cache(3);
    cache.put("A", "Apple");
    cache.put("B", "Banana");
    cache.put("C", "Cherry");

    auto result = cache.put("D", "Durian");
    ASSERT_TRUE(result.evicted.has_value());
    EXPECT_EQ(*result.evicted, "A");
}

TEST(LFUCacheTest, TieBreakIgnoresAccessOrder) {
    StringLFU cache(2);
    cache.put("A", "Apple");
    cache.put("B", "Banana");
    cache.get("B");
    cache.get("A");   // Both at frequency 2, A inserted first

    auto result = cache.put("C", "Cherry");
    ASSERT_TRUE(result.evicted.has_value());
    EXPECT_EQ(*result.evicted, "A");
}

TEST(LFUCacheTest, UpdateIncrementsFrequency) {
    StringLFU cache(2);
    cache.put("A", "Apple");
    auto update = cache.put("A", "Apricot");

    EXPECT_EQ(update.kind, WriteKind::Updated);
    EXPECT_EQ(cache.frequency("A"), 2u);
    EXPECT_EQ(cache.get("A").value.value(), "Apricot");
    EXPECT_EQ(cache.frequency("A"), 3u);
}

TEST(LFUCacheTest, MissLeavesFrequenciesUntouched) {
    StringLFU cache(2);
    cache.put("A", "Apple");
    EXPECT_FALSE(cache.get("Z").hit());
    EXPECT_EQ(cache.frequency("A"), 1u);
    EXPECT_FALSE(cache.frequency("Z").has_value());
}

TEST(LFUCacheTest, DisplayListsFrequencyInEvictionOrder) {
    StringLFU cache(3);
    cache.put("A", "Apple");
    cache.put("B", "Banana");
    cache.put("C", "Cherry");
    cache.get("A");
    cache.get("A");
    cache.get("C");

    auto entries = cache.displayCache();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].key, "B");
    EXPECT_EQ(entries[0].frequency, 1u);
    EXPECT_EQ(entries[1].key, "C");
    EXPECT_EQ(entries[1].frequency, 2u);
    EXPECT_EQ(entries[2].key, "A");
    EXPECT_EQ(entries[2].frequency, 3u);
}

TEST(LFUCacheTest, ReinsertedKeyStartsAtOne) {
    StringLFU cache(1);
    cache.put("A", "Apple");
    cache.get("A");
    cache.put("B", "Banana");   // Evicts A
    cache.put("A", "Apricot");  // Evicts B

    EXPECT_EQ(cache.frequency("A"), 1u);
    EXPECT_EQ(cache.size(), 1u);
}

TEST(LFUCacheTest, EraseRemovesFromEvictionOrder) {
    StringLFU cache(2);
    cache.put("A", "Apple");
    cache.put("B", "Banana");
    cache.get("B");
    EXPECT_TRUE(cache.erase("A"));

    cache.put("C", "Cherry");
    auto result = cache.put("D", "Durian");
    ASSERT_TRUE(result.evicted.has_value());
    EXPECT_EQ(*result.evicted, "C");
    EXPECT_TRUE(cache.contains("B"));
}
