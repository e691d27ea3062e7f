/**
 * @file kv_cache.h
 * @brief Keyed ephemeral cache interface
 *
 * Process-wide ephemeral state (error accumulators, cached camera views,
 * last images) is kept behind this interface so it can be injected and
 * substituted in tests.
 */

#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>

namespace snapkeep::cache {

/**
 * @brief String-keyed cache of values of type V
 *
 * Entries may be evicted at any time; nothing is persisted.
 */
template <typename V>
class KeyValueCache {
 public:
  virtual ~KeyValueCache() = default;

  /**
   * @brief Value for `key`, or `default_value` when absent
   */
  virtual V GetOrDefault(const std::string& key, const V& default_value) const = 0;

  virtual std::optional<V> Get(const std::string& key) const = 0;

  virtual void Put(const std::string& key, V value) = 0;

  /**
   * @brief Atomically replace the value for `key` with `func(current)`
   *
   * `current` is `default_value` when the key is absent.
   *
   * @return The stored value
   */
  virtual V Update(const std::string& key, const V& default_value, const std::function<V(const V&)>& func) = 0;

  virtual void Delete(const std::string& key) = 0;

  virtual size_t Size() const = 0;
};

}  // namespace snapkeep::cache
