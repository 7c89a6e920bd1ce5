#pragma once

#include <chrono>
#include <memory>
#include <vector>

#include "docchat_core/async/worker.hpp"

namespace docchat_core::async {

/**
 * @class WorkerPool
 * @brief Owns a fixed set of Workers polling the same task queue.
 *
 * Tasks for different documents run in parallel, one per worker. The
 * destructor stops and joins every worker.
 */
class WorkerPool {
 public:
  /**
   * @param num_threads Number of workers; must be at least one.
   * @param services Shared service provider handed to every worker.
   * @param poll_interval Sleep between polls of an empty queue.
   */
  WorkerPool(size_t num_threads,
             std::shared_ptr<ServiceProvider> services,
             std::chrono::milliseconds poll_interval = std::chrono::milliseconds(1000));

  ~WorkerPool();

  void start();

  // Signals every worker and waits for each to finish its current task.
  void stop();

  bool is_running() const {
    return is_running_;
  }
  size_t size() const {
    return workers_.size();
  }

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;
  WorkerPool(WorkerPool&&) = delete;
  WorkerPool& operator=(WorkerPool&&) = delete;

 private:
  std::vector<std::unique_ptr<Worker>> workers_;
  bool is_running_ = false;
};

}  // namespace docchat_core::async
