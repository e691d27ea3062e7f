/**
 * @file task_runner.cpp
 * @brief Task runner implementation
 */

#include "utils/task_runner.h"

#include <spdlog/spdlog.h>

#include <exception>
#include <future>
#include <memory>
#include <string>

#include "utils/structured_log.h"

namespace snapkeep::utils {

TaskRunner::TaskRunner(size_t num_threads, size_t queue_size) : max_queue_size_(queue_size) {
  if (num_threads == 0) {
    num_threads = std::thread::hardware_concurrency();
    if (num_threads == 0) {
      num_threads = 4;  // Fallback
    }
  }

  spdlog::debug("Creating task runner with {} workers, queue size: {}", num_threads,
                queue_size == 0 ? "unbounded" : std::to_string(queue_size));

  workers_.reserve(num_threads);
  for (size_t i = 0; i < num_threads; ++i) {
    workers_.emplace_back(&TaskRunner::WorkerThread, this);
  }
}

TaskRunner::~TaskRunner() {
  Shutdown();
}

bool TaskRunner::Post(Task task) {
  {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    if (shutdown_) {
      return false;
    }
    if (max_queue_size_ > 0 && tasks_.size() >= max_queue_size_) {
      return false;
    }
    tasks_.push(std::move(task));
  }

  condition_.notify_one();
  return true;
}

Expected<void, Error> TaskRunner::RunWithTimeout(BoundedTask task, std::chrono::milliseconds timeout) {
  // Shared so an abandoned (timed out) task can still publish its result
  auto promise = std::make_shared<std::promise<Expected<void, Error>>>();
  auto future = promise->get_future();

  const bool queued = Post([promise, task = std::move(task)]() {
    try {
      promise->set_value(task());
    } catch (const std::exception& e) {
      promise->set_value(MakeUnexpected(MakeError(ErrorCode::kInternalError, e.what())));
    }
  });
  if (!queued) {
    return MakeUnexpected(MakeError(ErrorCode::kUnavailable, "Task queue is full or shut down"));
  }

  if (future.wait_for(timeout) != std::future_status::ready) {
    return MakeUnexpected(
        MakeError(ErrorCode::kTimeout, "Task did not finish within " + std::to_string(timeout.count()) + "ms"));
  }
  return future.get();
}

void TaskRunner::WaitIdle() {
  std::unique_lock<std::mutex> lock(queue_mutex_);
  idle_condition_.wait(lock, [this] { return tasks_.empty() && active_workers_ == 0; });
}

size_t TaskRunner::GetQueueSize() const {
  std::scoped_lock lock(queue_mutex_);
  return tasks_.size();
}

void TaskRunner::Shutdown(bool graceful) {
  {
    std::scoped_lock lock(queue_mutex_);
    if (shutdown_) {
      return;
    }

    if (!graceful && !tasks_.empty()) {
      StructuredLog()
          .Event("task_runner_warning")
          .Field("type", "non_graceful_shutdown")
          .Field("pending_tasks", static_cast<uint64_t>(tasks_.size()))
          .Warn();
      while (!tasks_.empty()) {
        tasks_.pop();
      }
      idle_condition_.notify_all();
    }

    shutdown_ = true;
  }

  condition_.notify_all();

  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  spdlog::debug("Task runner shut down");
}

void TaskRunner::WorkerThread() {
  while (true) {
    Task task;

    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      condition_.wait(lock, [this] { return shutdown_ || !tasks_.empty(); });

      // Exit if shutting down and no more tasks
      if (shutdown_ && tasks_.empty()) {
        return;
      }

      task = std::move(tasks_.front());
      tasks_.pop();
      ++active_workers_;
    }

    try {
      task();
    } catch (const std::exception& e) {
      StructuredLog().Event("task_runner_error").Field("type", "task_exception").Field("error", e.what()).Error();
    }

    {
      std::scoped_lock lock(queue_mutex_);
      --active_workers_;
    }
    idle_condition_.notify_all();
  }
}

}  // namespace snapkeep::utils
