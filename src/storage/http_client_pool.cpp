/**
 * @file http_client_pool.cpp
 * @brief HTTP client pool implementation
 */

#include "storage/http_client_pool.h"

namespace snapkeep::storage {

namespace {

void ApplyTimeout(const std::chrono::milliseconds& timeout, time_t& sec, time_t& usec) {
  sec = static_cast<time_t>(timeout.count() / 1000);
  usec = static_cast<time_t>((timeout.count() % 1000) * 1000);
}

}  // namespace

HttpClientPool::HttpClientPool(std::string base_url, size_t max_clients, HttpTimeouts timeouts)
    : base_url_(std::move(base_url)), max_clients_(max_clients == 0 ? 1 : max_clients), timeouts_(timeouts) {}

std::shared_ptr<httplib::Client> HttpClientPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || live_clients_ < max_clients_; });

  if (!idle_.empty()) {
    auto client = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(client.release());
  }

  ++live_clients_;
  lock.unlock();
  return Wrap(MakeClient().release());
}

size_t HttpClientPool::LeasedCount() const {
  std::lock_guard lock(mutex_);
  return live_clients_ - idle_.size();
}

std::unique_ptr<httplib::Client> HttpClientPool::MakeClient() const {
  auto client = std::make_unique<httplib::Client>(base_url_);
  time_t sec = 0;
  time_t usec = 0;
  ApplyTimeout(timeouts_.connect, sec, usec);
  client->set_connection_timeout(sec, usec);
  ApplyTimeout(timeouts_.read, sec, usec);
  client->set_read_timeout(sec, usec);
  ApplyTimeout(timeouts_.write, sec, usec);
  client->set_write_timeout(sec, usec);
  client->set_keep_alive(true);
  return client;
}

std::shared_ptr<httplib::Client> HttpClientPool::Wrap(httplib::Client* client) {
  std::weak_ptr<HttpClientPool> weak_self = shared_from_this();
  return std::shared_ptr<httplib::Client>(client, [weak_self](httplib::Client* released) {
    if (auto self = weak_self.lock()) {
      self->Release(released);
      return;
    }
    delete released;  // NOLINT(cppcoreguidelines-owning-memory)
  });
}

void HttpClientPool::Release(httplib::Client* client) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(client);
  }
  cv_.notify_one();
}

}  // namespace snapkeep::storage
