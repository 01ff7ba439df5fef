#include "core/WorkQueue.hpp"

#include "common/Errors.hpp"

#include <gtest/gtest.h>

#include <thread>
#include <vector>

using ddns::common::SyncTask;
using ddns::common::SyncTaskKind;
using ddns::core::WorkQueue;

namespace {

SyncTask makeTask(const std::string& sDomainKey, uint64_t uHeight) {
  SyncTask st;
  st.kind = SyncTaskKind::Update;
  st.sDomainKey = sDomainKey;
  st.sContentRef = "0xe301";
  st.uSourceHeight = uHeight;
  return st;
}

}  // namespace

TEST(WorkQueueTest, StartsEmpty) {
  WorkQueue wq;
  EXPECT_TRUE(wq.empty());
  EXPECT_EQ(wq.size(), 0u);
  EXPECT_FALSE(wq.tryDequeue().has_value());
}

TEST(WorkQueueTest, DequeueOnEmptyThrows) {
  WorkQueue wq;
  EXPECT_THROW(wq.dequeue(), ddns::common::EmptyQueueError);
}

TEST(WorkQueueTest, PreservesFifoOrder) {
  WorkQueue wq;
  wq.enqueue(makeTask("a", 1));
  wq.enqueue(makeTask("b", 2));
  wq.enqueue(makeTask("c", 3));

  EXPECT_EQ(wq.dequeue().sDomainKey, "a");
  EXPECT_EQ(wq.dequeue().sDomainKey, "b");
  EXPECT_EQ(wq.tryDequeue()->sDomainKey, "c");
  EXPECT_TRUE(wq.empty());
}

TEST(WorkQueueTest, KeepsDuplicates) {
  WorkQueue wq;
  wq.enqueue(makeTask("same", 1));
  wq.enqueue(makeTask("same", 1));
  EXPECT_EQ(wq.size(), 2u);
}

TEST(WorkQueueTest, EnqueueAllAppendsInOrder) {
  WorkQueue wq;
  wq.enqueue(makeTask("first", 1));
  wq.enqueueAll({makeTask("second", 2), makeTask("third", 3)});

  auto vTasks = wq.drain();
  ASSERT_EQ(vTasks.size(), 3u);
  EXPECT_EQ(vTasks[0].sDomainKey, "first");
  EXPECT_EQ(vTasks[2].sDomainKey, "third");
  EXPECT_TRUE(wq.empty());
}

TEST(WorkQueueTest, RequeuedTaskGoesToBack) {
  WorkQueue wq;
  wq.enqueue(makeTask("a", 1));
  wq.enqueue(makeTask("b", 2));

  auto st = wq.dequeue();
  st.iRetryCount = 1;
  wq.enqueue(st);

  EXPECT_EQ(wq.dequeue().sDomainKey, "b");
  auto stRetried = wq.dequeue();
  EXPECT_EQ(stRetried.sDomainKey, "a");
  EXPECT_EQ(stRetried.iRetryCount, 1);
}

TEST(WorkQueueTest, ConcurrentProducersLoseNothing) {
  WorkQueue wq;
  std::vector<std::thread> vThreads;
  for (int t = 0; t < 4; ++t) {
    vThreads.emplace_back([&wq, t]() {
      for (int i = 0; i < 250; ++i) {
        wq.enqueue(makeTask("d" + std::to_string(t), static_cast<uint64_t>(i)));
      }
    });
  }
  for (auto& th : vThreads) th.join();
  EXPECT_EQ(wq.size(), 1000u);
}
