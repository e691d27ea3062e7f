/**
 * @file http_client_pool.h
 * @brief Bounded pool of HTTP clients for one remote endpoint
 */

#pragma once

// Fix for httplib missing NI_MAXHOST on some platforms
#include <netdb.h>
#ifndef NI_MAXHOST
#define NI_MAXHOST 1025
#endif

#include <httplib.h>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace snapkeep::storage {

/**
 * @brief Client timeouts applied to every pooled connection
 */
struct HttpTimeouts {
  std::chrono::milliseconds connect{3000};
  std::chrono::milliseconds read{10000};
  std::chrono::milliseconds write{10000};
};

/**
 * @brief Pool of keep-alive httplib clients
 *
 * httplib::Client is not safe for concurrent requests, so each request
 * leases a client for its duration. At most `max_clients` clients exist;
 * Acquire() blocks while all of them are leased. A leased client returns
 * to the pool when the last copy of its shared_ptr is released.
 *
 * Must be owned by a shared_ptr (leases hold a weak reference back).
 */
class HttpClientPool : public std::enable_shared_from_this<HttpClientPool> {
 public:
  HttpClientPool(std::string base_url, size_t max_clients, HttpTimeouts timeouts);

  HttpClientPool(const HttpClientPool&) = delete;
  HttpClientPool& operator=(const HttpClientPool&) = delete;
  HttpClientPool(HttpClientPool&&) = delete;
  HttpClientPool& operator=(HttpClientPool&&) = delete;
  ~HttpClientPool() = default;

  /**
   * @brief Lease a client, blocking until one is available
   */
  std::shared_ptr<httplib::Client> Acquire();

  size_t MaxClients() const { return max_clients_; }

  /**
   * @brief Number of clients currently leased
   */
  size_t LeasedCount() const;

 private:
  std::unique_ptr<httplib::Client> MakeClient() const;
  std::shared_ptr<httplib::Client> Wrap(httplib::Client* client);
  void Release(httplib::Client* client);

  std::string base_url_;
  size_t max_clients_;
  HttpTimeouts timeouts_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<std::unique_ptr<httplib::Client>> idle_;
  size_t live_clients_ = 0;
};

}  // namespace snapkeep::storage
