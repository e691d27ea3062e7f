/**
 * @file in_memory_cache.h
 * @brief Bounded in-process KeyValueCache
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <utility>

#include "cache/kv_cache.h"

namespace snapkeep::cache {

/**
 * @brief Thread-safe in-memory cache bounded by entry count
 *
 * When full, inserting a new key evicts an arbitrary existing entry.
 * With a non-zero TTL an entry older than the TTL reads as absent and is
 * replaced on the next write.
 *
 * Example:
 * @code
 * InMemoryCache<int> errors(100000);
 * int total = errors.Update("camera-1", 0, [](const int& current) { return current + 10; });
 * errors.Put("camera-1", 0);
 * @endcode
 */
template <typename V>
class InMemoryCache : public KeyValueCache<V> {
 public:
  /**
   * @brief Cache statistics
   */
  struct Statistics {
    size_t size;            ///< Current number of entries
    size_t max_size;        ///< Maximum number of entries
    uint64_t total_hits;    ///< Lookups that found an entry
    uint64_t total_misses;  ///< Lookups that did not
    uint64_t evictions;     ///< Entries dropped to make room
  };

  /**
   * @param max_size Maximum number of entries (0 is treated as 1)
   * @param ttl Entry lifetime (0 = no expiry)
   */
  explicit InMemoryCache(size_t max_size, std::chrono::milliseconds ttl = std::chrono::milliseconds(0))
      : max_size_(max_size == 0 ? 1 : max_size), ttl_(ttl) {}

  V GetOrDefault(const std::string& key, const V& default_value) const override {
    std::shared_lock lock(mutex_);
    auto iter = entries_.find(key);
    if (iter == entries_.end() || Expired(iter->second)) {
      total_misses_.fetch_add(1, std::memory_order_relaxed);
      return default_value;
    }
    total_hits_.fetch_add(1, std::memory_order_relaxed);
    return iter->second.value;
  }

  std::optional<V> Get(const std::string& key) const override {
    std::shared_lock lock(mutex_);
    auto iter = entries_.find(key);
    if (iter == entries_.end() || Expired(iter->second)) {
      total_misses_.fetch_add(1, std::memory_order_relaxed);
      return std::nullopt;
    }
    total_hits_.fetch_add(1, std::memory_order_relaxed);
    return iter->second.value;
  }

  void Put(const std::string& key, V value) override {
    std::unique_lock lock(mutex_);
    auto iter = entries_.find(key);
    if (iter != entries_.end()) {
      iter->second = Entry{std::move(value), Now()};
      return;
    }
    EvictIfFull();
    entries_.emplace(key, Entry{std::move(value), Now()});
  }

  V Update(const std::string& key, const V& default_value, const std::function<V(const V&)>& func) override {
    std::unique_lock lock(mutex_);
    auto iter = entries_.find(key);
    if (iter != entries_.end()) {
      const V& current = Expired(iter->second) ? default_value : iter->second.value;
      iter->second = Entry{func(current), Now()};
      return iter->second.value;
    }
    EvictIfFull();
    auto inserted = entries_.emplace(key, Entry{func(default_value), Now()});
    return inserted.first->second.value;
  }

  void Delete(const std::string& key) override {
    std::unique_lock lock(mutex_);
    entries_.erase(key);
  }

  size_t Size() const override {
    std::shared_lock lock(mutex_);
    return entries_.size();
  }

  /**
   * @brief Remove all entries and reset statistics
   */
  void Clear() {
    std::unique_lock lock(mutex_);
    entries_.clear();
    total_hits_.store(0, std::memory_order_relaxed);
    total_misses_.store(0, std::memory_order_relaxed);
    evictions_.store(0, std::memory_order_relaxed);
  }

  Statistics GetStatistics() const {
    std::shared_lock lock(mutex_);
    return Statistics{
        .size = entries_.size(),
        .max_size = max_size_,
        .total_hits = total_hits_.load(std::memory_order_relaxed),
        .total_misses = total_misses_.load(std::memory_order_relaxed),
        .evictions = evictions_.load(std::memory_order_relaxed),
    };
  }

 private:
  using Clock = std::chrono::steady_clock;

  struct Entry {
    V value;
    Clock::time_point stored_at;
  };

  static Clock::time_point Now() { return Clock::now(); }

  bool Expired(const Entry& entry) const { return ttl_.count() > 0 && Now() - entry.stored_at >= ttl_; }

  /**
   * @brief Drop one entry if the cache is full
   * @pre mutex_ is locked for writing
   */
  void EvictIfFull() {
    if (entries_.size() >= max_size_ && !entries_.empty()) {
      entries_.erase(entries_.begin());
      evictions_.fetch_add(1, std::memory_order_relaxed);
    }
  }

  size_t max_size_;
  std::chrono::milliseconds ttl_;

  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, Entry> entries_;

  mutable std::atomic<uint64_t> total_hits_{0};
  mutable std::atomic<uint64_t> total_misses_{0};
  std::atomic<uint64_t> evictions_{0};
};

}  // namespace snapkeep::cache
