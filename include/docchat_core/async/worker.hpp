#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace docchat_core {
class ServiceProvider;
struct TaskDTO;
}  // namespace docchat_core

namespace docchat_core::async {

/**
 * @class Worker
 * @brief A single background thread that claims and runs tasks from the queue.
 *
 * The worker polls TaskQueueRepo for pending tasks, runs each through the
 * TaskFactory, and records COMPLETED or FAILED. When the queue is empty it
 * sleeps for the poll interval; stop() cuts the sleep short.
 *
 * Non-copyable and non-movable so the thread has one clear owner.
 */
class Worker {
 public:
  /**
   * @param worker_id Identifier used in log lines.
   * @param services Shared service provider.
   * @param poll_interval Sleep between polls of an empty queue.
   */
  Worker(int worker_id,
         std::shared_ptr<ServiceProvider> services,
         std::chrono::milliseconds poll_interval = std::chrono::milliseconds(1000));

  // Stops and joins the thread.
  ~Worker();

  // Throws std::runtime_error if the worker is already running.
  void start();

  // Signals the loop to exit after the current task. Does not block.
  void stop();

  // Waits for the thread to exit.
  void join();

  // Claims and runs at most one task on the calling thread. Returns false if the queue was empty.
  bool run_one_task();

  Worker(const Worker&) = delete;
  Worker& operator=(const Worker&) = delete;
  Worker(Worker&&) = delete;
  Worker& operator=(Worker&&) = delete;

 private:
  void run_loop();
  void execute_task(const TaskDTO& task_dto);

  int worker_id_;
  std::shared_ptr<ServiceProvider> services_;
  std::chrono::milliseconds poll_interval_;
  std::atomic<bool> should_stop_{false};
  std::mutex wake_mutex_;
  std::condition_variable wake_cv_;
  std::thread thread_;
};

}  // namespace docchat_core::async
