/**
 * @file in_memory_cache_test.cpp
 * @brief Unit tests for InMemoryCache
 */

#include "cache/in_memory_cache.h"

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

namespace snapkeep::cache {

TEST(InMemoryCacheTest, GetOrDefaultOnMiss) {
  InMemoryCache<int> cache(10);
  EXPECT_EQ(cache.GetOrDefault("camera-1", 0), 0);
  EXPECT_FALSE(cache.Get("camera-1").has_value());
  EXPECT_EQ(cache.Size(), 0U);
}

TEST(InMemoryCacheTest, PutGetDelete) {
  InMemoryCache<std::string> cache(10);
  cache.Put("camera-1", "online");
  cache.Put("camera-2", "offline");

  ASSERT_TRUE(cache.Get("camera-1").has_value());
  EXPECT_EQ(*cache.Get("camera-1"), "online");
  EXPECT_EQ(cache.GetOrDefault("camera-2", ""), "offline");

  cache.Put("camera-1", "offline");
  EXPECT_EQ(*cache.Get("camera-1"), "offline");
  EXPECT_EQ(cache.Size(), 2U);

  cache.Delete("camera-1");
  EXPECT_FALSE(cache.Get("camera-1").has_value());
  EXPECT_EQ(cache.Size(), 1U);

  // Deleting an absent key is a no-op
  cache.Delete("camera-1");
  EXPECT_EQ(cache.Size(), 1U);
}

TEST(InMemoryCacheTest, UpdateAccumulates) {
  InMemoryCache<int> cache(10);
  auto add = [](int weight) { return [weight](const int& current) { return current + weight; }; };

  EXPECT_EQ(cache.Update("camera-1", 0, add(40)), 40);
  EXPECT_EQ(cache.Update("camera-1", 0, add(59)), 99);
  EXPECT_EQ(cache.GetOrDefault("camera-1", 0), 99);
}

TEST(InMemoryCacheTest, EvictsWhenFull) {
  InMemoryCache<int> cache(3);
  cache.Put("a", 1);
  cache.Put("b", 2);
  cache.Put("c", 3);
  EXPECT_EQ(cache.Size(), 3U);

  cache.Put("d", 4);
  EXPECT_EQ(cache.Size(), 3U);
  EXPECT_EQ(*cache.Get("d"), 4);
  EXPECT_EQ(cache.GetStatistics().evictions, 1U);

  // Overwriting an existing key never evicts
  cache.Put("d", 5);
  EXPECT_EQ(cache.Size(), 3U);
  EXPECT_EQ(cache.GetStatistics().evictions, 1U);
}

TEST(InMemoryCacheTest, Statistics) {
  InMemoryCache<int> cache(10);
  cache.Put("camera-1", 1);

  cache.Get("camera-1");
  cache.GetOrDefault("camera-1", 0);
  cache.Get("camera-2");

  auto stats = cache.GetStatistics();
  EXPECT_EQ(stats.size, 1U);
  EXPECT_EQ(stats.max_size, 10U);
  EXPECT_EQ(stats.total_hits, 2U);
  EXPECT_EQ(stats.total_misses, 1U);

  cache.Clear();
  stats = cache.GetStatistics();
  EXPECT_EQ(stats.size, 0U);
  EXPECT_EQ(stats.total_hits, 0U);
}

TEST(InMemoryCacheTest, EntriesExpireAfterTtl) {
  InMemoryCache<int> cache(10, std::chrono::milliseconds(50));
  cache.Put("camera-1", 7);
  cache.Update("camera-2", 0, [](const int& current) { return current + 10; });
  EXPECT_EQ(cache.Get("camera-1").value_or(-1), 7);

  std::this_thread::sleep_for(std::chrono::milliseconds(80));
  EXPECT_FALSE(cache.Get("camera-1").has_value());
  EXPECT_EQ(cache.GetOrDefault("camera-1", -1), -1);

  // an expired value is not carried into an update
  EXPECT_EQ(cache.Update("camera-2", 0, [](const int& current) { return current + 10; }), 10);

  cache.Put("camera-1", 8);
  EXPECT_EQ(cache.Get("camera-1").value_or(-1), 8);
}

TEST(InMemoryCacheTest, ZeroTtlNeverExpires) {
  InMemoryCache<int> cache(10);
  cache.Put("camera-1", 7);
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_EQ(cache.Get("camera-1").value_or(-1), 7);
}

TEST(InMemoryCacheTest, ConcurrentUpdatesPerKey) {
  InMemoryCache<int> cache(100);
  const int num_threads = 8;
  const int updates_per_thread = 1000;

  std::vector<std::thread> threads;
  for (int t = 0; t < num_threads; ++t) {
    threads.emplace_back([&cache, t]() {
      const std::string key = "camera-" + std::to_string(t % 2);
      for (int i = 0; i < updates_per_thread; ++i) {
        cache.Update(key, 0, [](const int& current) { return current + 1; });
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(cache.GetOrDefault("camera-0", 0) + cache.GetOrDefault("camera-1", 0), num_threads * updates_per_thread);
}

}  // namespace snapkeep::cache
