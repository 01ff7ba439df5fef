#include "dal/ConnectionPool.hpp"

#include "common/Logger.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using ddns::dal::ConnectionGuard;
using ddns::dal::ConnectionPool;

namespace {

std::string getDbUrl() {
  const char* pUrl = std::getenv("DDNS_DB_URL");
  return pUrl ? std::string(pUrl) : std::string{};
}

int selectOne(ConnectionGuard& cg) {
  pqxx::nontransaction ntx(*cg);
  return ntx.exec("SELECT 1 AS val").one_row()[0].as<int>();
}

}  // namespace

class ConnectionPoolTest : public ::testing::Test {
 protected:
  void SetUp() override {
    _sDbUrl = getDbUrl();
    if (_sDbUrl.empty()) {
      GTEST_SKIP() << "DDNS_DB_URL not set, skipping integration test";
    }
  }

  std::string _sDbUrl;
};

TEST_F(ConnectionPoolTest, OpensRequestedNumberOfConnections) {
  ConnectionPool cpPool(_sDbUrl, 3);
  EXPECT_EQ(cpPool.size(), 3);
  EXPECT_EQ(cpPool.available(), 3);
}

TEST_F(ConnectionPoolTest, RejectsEmptyPool) {
  EXPECT_THROW(ConnectionPool(_sDbUrl, 0), std::runtime_error);
}

TEST_F(ConnectionPoolTest, GuardReturnsConnectionOnScopeExit) {
  ConnectionPool cpPool(_sDbUrl, 2);
  {
    auto cg1 = cpPool.checkout();
    auto cg2 = cpPool.checkout();
    EXPECT_EQ(cpPool.available(), 0);
    EXPECT_EQ(selectOne(cg1), 1);
  }
  EXPECT_EQ(cpPool.available(), 2);

  auto cg3 = cpPool.checkout();
  EXPECT_EQ(selectOne(cg3), 1);
}

TEST_F(ConnectionPoolTest, MovedGuardReturnsOnce) {
  ConnectionPool cpPool(_sDbUrl, 1);
  {
    auto cg1 = cpPool.checkout();
    ConnectionGuard cg2(std::move(cg1));
    EXPECT_EQ(selectOne(cg2), 1);
  }
  EXPECT_EQ(cpPool.available(), 1);
}

TEST_F(ConnectionPoolTest, CheckoutTimesOutWhenExhausted) {
  ConnectionPool cpPool(_sDbUrl, 1, std::chrono::seconds(1));
  auto cgHeld = cpPool.checkout();
  EXPECT_THROW(cpPool.checkout(), std::runtime_error);
}

TEST_F(ConnectionPoolTest, ConcurrentCheckoutsShareThePool) {
  const int iThreadCount = 8;
  ConnectionPool cpPool(_sDbUrl, 4);

  std::vector<std::thread> vThreads;
  std::atomic<int> iSuccessCount{0};
  for (int i = 0; i < iThreadCount; ++i) {
    vThreads.emplace_back([&cpPool, &iSuccessCount]() {
      auto cg = cpPool.checkout();
      if (selectOne(cg) == 1) {
        iSuccessCount.fetch_add(1);
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    });
  }
  for (auto& th : vThreads) {
    th.join();
  }

  EXPECT_EQ(iSuccessCount.load(), iThreadCount);
  EXPECT_EQ(cpPool.available(), 4);
}
