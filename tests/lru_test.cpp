#include "audiocache/lru.hpp"

#include <gtest/gtest.h>

using namespace audiocache;

TEST(LRUTrackerTest, EvictsLeastRecentlyTouched) {
    LRUTracker lru;
    lru.Touch("a");
    lru.Touch("b");
    lru.Touch("c");
    lru.Touch("a");

    EXPECT_EQ(lru.Evict(), "b");
    EXPECT_EQ(lru.Evict(), "c");
    EXPECT_EQ(lru.Evict(), "a");
    EXPECT_FALSE(lru.Evict().has_value());
    EXPECT_TRUE(lru.IsEmpty());
}

TEST(LRUTrackerTest, TouchDoesNotDuplicate) {
    LRUTracker lru;
    lru.Touch("a");
    lru.Touch("a");
    lru.Touch("a");
    EXPECT_EQ(lru.Size(), 1u);
}

TEST(LRUTrackerTest, RemoveForgetsKey) {
    LRUTracker lru;
    lru.Touch("a");
    lru.Touch("b");
    lru.Remove("a");
    lru.Remove("unknown");

    EXPECT_FALSE(lru.Contains("a"));
    EXPECT_TRUE(lru.Contains("b"));
    EXPECT_EQ(lru.Size(), 1u);
    EXPECT_EQ(lru.Evict(), "b");
}

TEST(LRUTrackerTest, EvictOnEmpty) {
    LRUTracker lru;
    EXPECT_FALSE(lru.Evict().has_value());
    EXPECT_TRUE(lru.IsEmpty());
    EXPECT_EQ(lru.Size(), 0u);
}
