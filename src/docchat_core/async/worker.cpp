#include "docchat_core/async/worker.hpp"

#include <iostream>
#include <stdexcept>

#include "docchat_core/async/ITask.hpp"
#include "docchat_core/async/service_provider.hpp"
#include "docchat_core/async/task_factory.hpp"
#include "docchat_core/db/task_queue_repo.hpp"

namespace docchat_core::async {

Worker::Worker(int worker_id,
               std::shared_ptr<ServiceProvider> services,
               std::chrono::milliseconds poll_interval)
    : worker_id_(worker_id), services_(std::move(services)), poll_interval_(poll_interval) {
  std::cout << "Worker [" << worker_id_ << "] created." << std::endl;
}

Worker::~Worker() {
  stop();
  join();
  std::cout << "Worker [" << worker_id_ << "] shut down." << std::endl;
}

void Worker::start() {
  if (thread_.joinable()) {
    throw std::runtime_error("Worker is already running.");
  }
  should_stop_.store(false);
  thread_ = std::thread(&Worker::run_loop, this);
}

void Worker::stop() {
  {
    std::lock_guard<std::mutex> lock(wake_mutex_);
    should_stop_.store(true);
  }
  wake_cv_.notify_all();
}

void Worker::join() {
  if (thread_.joinable()) {
    thread_.join();
  }
}

void Worker::run_loop() {
  std::cout << "Worker [" << worker_id_ << "] starting run loop." << std::endl;

  while (!should_stop_.load()) {
    bool found = false;
    try {
      found = run_one_task();
    } catch (const std::exception& e) {
      // The queue itself is unreachable; back off and poll again.
      std::cerr << "Worker [" << worker_id_ << "] ERROR polling task queue: " << e.what()
                << std::endl;
    }

    if (!found) {
      std::unique_lock<std::mutex> lock(wake_mutex_);
      wake_cv_.wait_for(lock, poll_interval_, [this] { return should_stop_.load(); });
    }
  }
  std::cout << "Worker [" << worker_id_ << "] run loop terminated." << std::endl;
}

bool Worker::run_one_task() {
  std::optional<TaskDTO> task_dto = services_->get_task_queue_repo().fetch_and_claim_next_task();
  if (!task_dto) {
    return false;
  }
  execute_task(*task_dto);
  return true;
}

void Worker::execute_task(const TaskDTO& task_dto) {
  TaskQueueRepo& task_repo = services_->get_task_queue_repo();
  std::cout << "Worker [" << worker_id_ << "] claimed task " << task_dto.id << " ("
            << task_dto.task_type << ")" << std::endl;

  try {
    ITaskPtr task = TaskFactory::create_task(task_dto);

    ProgressUpdater on_progress = [&](float p, const std::string& msg) {
      task_repo.upsert_task_progress(task_dto.id, p, msg);
    };

    task->execute(*services_, on_progress);
    task_repo.update_task_status(task_dto.id, TaskStatus::COMPLETED);
    std::cout << "Worker [" << worker_id_ << "] completed task " << task_dto.id << std::endl;
  } catch (const std::exception& e) {
    std::cerr << "Worker [" << worker_id_ << "] ERROR processing task " << task_dto.id << ": "
              << e.what() << std::endl;
    task_repo.mark_task_as_failed(task_dto.id, e.what());
  }
}

}  // namespace docchat_core::async
