#include "docchat_core/async/worker_pool.hpp"

#include <iostream>
#include <stdexcept>

namespace docchat_core::async {

WorkerPool::WorkerPool(size_t num_threads,
                       std::shared_ptr<ServiceProvider> services,
                       std::chrono::milliseconds poll_interval) {
  if (num_threads == 0) {
    throw std::invalid_argument("WorkerPool must have at least one thread.");
  }

  workers_.reserve(num_threads);
  for (size_t i = 0; i < num_threads; ++i) {
    workers_.emplace_back(
        std::make_unique<Worker>(static_cast<int>(i), services, poll_interval));
  }
  std::cout << "WorkerPool created with " << num_threads << " workers." << std::endl;
}

WorkerPool::~WorkerPool() {
  if (is_running_) {
    stop();
  }
}

void WorkerPool::start() {
  if (is_running_) {
    std::cerr << "Warning: WorkerPool is already running." << std::endl;
    return;
  }
  std::cout << "Starting all workers in the pool..." << std::endl;
  for (const auto& worker : workers_) {
    worker->start();
  }
  is_running_ = true;
}

void WorkerPool::stop() {
  if (!is_running_) {
    return;
  }
  std::cout << "Stopping all workers in the pool..." << std::endl;
  for (const auto& worker : workers_) {
    worker->stop();
  }
  for (const auto& worker : workers_) {
    worker->join();
  }
  is_running_ = false;
}

}  // namespace docchat_core::async
