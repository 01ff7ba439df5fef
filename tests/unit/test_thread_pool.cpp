#include "core/ThreadPool.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

using ddns::core::ThreadPool;
using namespace std::chrono_literals;

TEST(ThreadPoolTest, UsesRequestedSize) {
  ThreadPool tp(3);
  EXPECT_EQ(tp.size(), 3);
}

TEST(ThreadPoolTest, ZeroMeansAtLeastOneWorker) {
  ThreadPool tp(0);
  EXPECT_GE(tp.size(), 1);
}

TEST(ThreadPoolTest, SubmitReturnsResult) {
  ThreadPool tp(2);
  auto fut = tp.submit([](int a, int b) { return a + b; }, 20, 22);
  EXPECT_EQ(fut.get(), 42);
}

TEST(ThreadPoolTest, ExceptionTravelsThroughFuture) {
  ThreadPool tp(1);
  auto fut = tp.submit([]() -> std::string { throw std::runtime_error("ledger down"); });
  EXPECT_THROW(fut.get(), std::runtime_error);
}

TEST(ThreadPoolTest, RunsManyTasks) {
  ThreadPool tp(4);
  std::atomic<int> iSum{0};
  std::vector<std::future<void>> vFutures;
  for (int i = 1; i <= 100; ++i) {
    vFutures.push_back(tp.submit([&iSum, i]() { iSum.fetch_add(i); }));
  }
  for (auto& fut : vFutures) fut.get();
  EXPECT_EQ(iSum.load(), 5050);
}

TEST(ThreadPoolTest, WaitForTimesOutOnSlowTask) {
  ThreadPool tp(1);
  auto fut = tp.submit([]() {
    std::this_thread::sleep_for(300ms);
    return 1;
  });
  EXPECT_EQ(fut.wait_for(20ms), std::future_status::timeout);
  EXPECT_EQ(fut.get(), 1);
}

TEST(ThreadPoolTest, SubmitAfterShutdownThrows) {
  ThreadPool tp(1);
  tp.shutdown();
  tp.shutdown();
  EXPECT_THROW(tp.submit([]() { return 0; }), std::runtime_error);
}
