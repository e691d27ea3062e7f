/**
 * @file http_client_pool_test.cpp
 * @brief Unit tests for HttpClientPool leasing
 */

#include "storage/http_client_pool.h"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

using namespace snapkeep::storage;

TEST(HttpClientPoolTest, LeaseAndReturn) {
  auto pool = std::make_shared<HttpClientPool>("http://127.0.0.1:1", 2, HttpTimeouts{});
  EXPECT_EQ(pool->MaxClients(), 2U);
  EXPECT_EQ(pool->LeasedCount(), 0U);

  httplib::Client* first_raw = nullptr;
  {
    auto first = pool->Acquire();
    auto second = pool->Acquire();
    ASSERT_NE(first, nullptr);
    ASSERT_NE(second, nullptr);
    EXPECT_NE(first.get(), second.get());
    EXPECT_EQ(pool->LeasedCount(), 2U);
    first_raw = first.get();
  }
  EXPECT_EQ(pool->LeasedCount(), 0U);

  // Released clients are reused rather than recreated
  auto again = pool->Acquire();
  auto other = pool->Acquire();
  EXPECT_TRUE(again.get() == first_raw || other.get() == first_raw);
}

TEST(HttpClientPoolTest, ZeroSizeMeansOne) {
  auto pool = std::make_shared<HttpClientPool>("http://127.0.0.1:1", 0, HttpTimeouts{});
  EXPECT_EQ(pool->MaxClients(), 1U);
}

TEST(HttpClientPoolTest, AcquireBlocksWhileExhausted) {
  auto pool = std::make_shared<HttpClientPool>("http://127.0.0.1:1", 1, HttpTimeouts{});
  auto held = pool->Acquire();

  std::atomic<bool> acquired{false};
  std::thread waiter([&pool, &acquired]() {
    auto client = pool->Acquire();
    acquired = true;
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  EXPECT_FALSE(acquired);

  held.reset();
  waiter.join();
  EXPECT_TRUE(acquired);
  EXPECT_EQ(pool->LeasedCount(), 0U);
}

TEST(HttpClientPoolTest, LeaseOutlivesPool) {
  auto pool = std::make_shared<HttpClientPool>("http://127.0.0.1:1", 1, HttpTimeouts{});
  auto client = pool->Acquire();
  pool.reset();
  // Releasing after the pool is gone deletes the client instead of returning it
  client.reset();
  SUCCEED();
}
