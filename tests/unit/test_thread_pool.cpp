#include "core/ThreadPool.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <vector>

using sguard::core::ThreadPool;

TEST(ThreadPoolTest, SingleWorkerRunsTasksInSubmissionOrder) {
  ThreadPool tp("ordered", 1);
  std::mutex mtx;
  std::vector<int> vSeen;

  for (int i = 0; i < 200; ++i) {
    ASSERT_TRUE(tp.post([&, i]() {
      std::lock_guard<std::mutex> lock(mtx);
      vSeen.push_back(i);
    }));
  }
  tp.waitIdle();

  ASSERT_EQ(vSeen.size(), 200u);
  for (int i = 0; i < 200; ++i) {
    EXPECT_EQ(vSeen[static_cast<size_t>(i)], i);
  }
}

TEST(ThreadPoolTest, ThrowingTaskDoesNotKillWorker) {
  ThreadPool tp("throwing", 1);
  std::atomic<int> iRan{0};

  tp.post([]() { throw std::runtime_error("boom"); });
  tp.post([&]() { iRan.fetch_add(1); });
  tp.waitIdle();

  EXPECT_EQ(iRan.load(), 1);
}

TEST(ThreadPoolTest, NonStandardExceptionDoesNotKillWorker) {
  ThreadPool tp("throwing-int", 1);
  std::atomic<int> iRan{0};

  tp.post([]() { throw 42; });
  tp.post([&]() { iRan.fetch_add(1); });
  tp.waitIdle();

  EXPECT_EQ(iRan.load(), 1);
}

TEST(ThreadPoolTest, ShutdownDrainsQueueAndRejectsLatePosts) {
  std::atomic<int> iRan{0};
  ThreadPool tp("draining", 2);
  for (int i = 0; i < 50; ++i) {
    tp.post([&]() { iRan.fetch_add(1); });
  }
  tp.shutdown();

  EXPECT_EQ(iRan.load(), 50);
  EXPECT_FALSE(tp.post([&]() { iRan.fetch_add(1); }));
  tp.shutdown();  // idempotent
  EXPECT_EQ(iRan.load(), 50);
}

TEST(ThreadPoolTest, RejectsEmptyPool) {
  EXPECT_THROW(ThreadPool("empty", 0), std::invalid_argument);
}
