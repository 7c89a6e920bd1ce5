#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <thread>
#include <vector>

#include "docchat_core/async/worker_pool.hpp"
#include "services_test.hpp"

namespace docchat_tests {

using namespace docchat_core;
using namespace docchat_core::async;

class WorkerPoolTest : public ServiceProviderTestBase {};

TEST_F(WorkerPoolTest, ConstructorThrowsOnZeroThreads) {
  EXPECT_THROW({ WorkerPool pool(0, services_); }, std::invalid_argument);
}

TEST_F(WorkerPoolTest, StopWithoutStartIsNoOp) {
  WorkerPool pool(2, services_);
  EXPECT_EQ(pool.size(), 2u);
  EXPECT_NO_THROW(pool.stop());
  EXPECT_FALSE(pool.is_running());
}

TEST_F(WorkerPoolTest, StartTwiceIsNoOp) {
  WorkerPool pool(1, services_, std::chrono::milliseconds(10));
  pool.start();
  EXPECT_NO_THROW(pool.start());
  EXPECT_TRUE(pool.is_running());
  pool.stop();
  EXPECT_FALSE(pool.is_running());
}

TEST_F(WorkerPoolTest, WorkersIngestDocumentsInParallel) {
  std::vector<std::pair<long long, long long>> queued;
  for (int i = 0; i < 6; ++i) {
    queued.push_back(queue_document("doc" + std::to_string(i) + ".txt",
                                    "Document number " + std::to_string(i) + " text."));
  }

  WorkerPool pool(3, services_, std::chrono::milliseconds(10));
  pool.start();
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
  while (std::chrono::steady_clock::now() < deadline &&
         task_queue_repo_->get_tasks_by_status(TaskStatus::COMPLETED).size() < queued.size()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  pool.stop();

  EXPECT_EQ(task_queue_repo_->get_tasks_by_status(TaskStatus::COMPLETED).size(), queued.size());
  for (const auto& [document_id, task_id] : queued) {
    EXPECT_EQ(document_store_->get_status(document_id), DocumentStatus::INDEXED);
    EXPECT_GT(index_->count_for_document(document_id), 0u);
  }
}

}  // namespace docchat_tests
