/**
 * @file task_runner.h
 * @brief Worker pool for fire-and-forget and time-bounded tasks
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include "utils/error.h"
#include "utils/expected.h"

namespace snapkeep::utils {

/**
 * @brief Fixed worker pool with a bounded queue
 *
 * Features:
 * - Post(): fire-and-forget submission, rejected when the queue is full
 * - RunWithTimeout(): wait for a task's result at most `timeout`
 * - Graceful shutdown draining pending tasks
 */
class TaskRunner {
 public:
  using Task = std::function<void()>;
  using BoundedTask = std::function<Expected<void, Error>()>;

  /**
   * @brief Construct task runner
   * @param num_threads Number of worker threads (0 = CPU count)
   * @param queue_size Maximum queue size (0 = unbounded)
   */
  explicit TaskRunner(size_t num_threads = 0, size_t queue_size = 0);

  /**
   * @brief Destructor - drains pending tasks
   */
  ~TaskRunner();

  TaskRunner(const TaskRunner&) = delete;
  TaskRunner& operator=(const TaskRunner&) = delete;
  TaskRunner(TaskRunner&&) = delete;
  TaskRunner& operator=(TaskRunner&&) = delete;

  /**
   * @brief Queue a task without waiting for it
   * @return false if the queue is full or the runner is shut down
   */
  bool Post(Task task);

  /**
   * @brief Run `task` on a worker and wait at most `timeout` for its result
   *
   * On timeout the task keeps running to completion; its result is discarded.
   *
   * @return The task's result, kTimeout if it did not finish in time,
   *         kInternalError if it threw, kUnavailable if it could not be queued
   */
  Expected<void, Error> RunWithTimeout(BoundedTask task, std::chrono::milliseconds timeout);

  size_t GetThreadCount() const { return workers_.size(); }

  /**
   * @brief Number of queued (not yet started) tasks
   */
  size_t GetQueueSize() const;

  bool IsShutdown() const { return shutdown_; }

  /**
   * @brief Block until the queue is empty and no task is executing
   */
  void WaitIdle();

  /**
   * @brief Stop accepting tasks and join the workers
   * @param graceful If true, run pending tasks first. If false, drop them.
   */
  void Shutdown(bool graceful = true);

 private:
  void WorkerThread();

  std::vector<std::thread> workers_;
  std::queue<Task> tasks_;

  mutable std::mutex queue_mutex_;
  std::condition_variable condition_;
  std::condition_variable idle_condition_;
  std::atomic<bool> shutdown_{false};
  size_t active_workers_ = 0;  // Guarded by queue_mutex_

  size_t max_queue_size_;
};

}  // namespace snapkeep::utils
