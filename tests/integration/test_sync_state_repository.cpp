#include "dal/SyncStateRepository.hpp"

#include "core/ContentResolver.hpp"
#include "core/SyncEngine.hpp"
#include "core/WorkQueue.hpp"
#include "dal/ConnectionPool.hpp"
#include "providers/ContentHashDecoder.hpp"
#include "providers/InMemoryAuthoritativeLedger.hpp"
#include "providers/InMemoryContentStore.hpp"
#include "providers/InMemoryFastLedger.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <memory>
#include <string>

using ddns::common::SyncTask;
using ddns::common::SyncTaskKind;
using ddns::dal::ConnectionPool;
using ddns::dal::SyncStateRepository;

namespace {

std::string getDbUrl() {
  const char* pUrl = std::getenv("DDNS_DB_URL");
  return pUrl ? std::string(pUrl) : std::string{};
}

SyncTask makeTask(const std::string& sKey, SyncTaskKind kind, uint64_t uHeight,
                  int iRetries = 0) {
  SyncTask st;
  st.kind = kind;
  st.sDomainKey = sKey;
  st.sContentRef = "Qm" + std::string(44, 'A');
  st.uSourceHeight = uHeight;
  st.iRetryCount = iRetries;
  return st;
}

}  // namespace

class SyncStateRepositoryTest : public ::testing::Test {
 protected:
  void SetUp() override {
    _sDbUrl = getDbUrl();
    if (_sDbUrl.empty()) {
      GTEST_SKIP() << "DDNS_DB_URL not set, skipping integration test";
    }
    _upPool = std::make_unique<ConnectionPool>(_sDbUrl, 2);
    _upRepo = std::make_unique<SyncStateRepository>(*_upPool);
    _upRepo->ensureSchema();

    auto cg = _upPool->checkout();
    pqxx::work txn(*cg);
    txn.exec("TRUNCATE sync_checkpoint, sync_pending_tasks, sync_dead_letters RESTART IDENTITY");
    txn.commit();
  }

  std::string _sDbUrl;
  std::unique_ptr<ConnectionPool> _upPool;
  std::unique_ptr<SyncStateRepository> _upRepo;
};

TEST_F(SyncStateRepositoryTest, EnsureSchemaIsRepeatable) {
  EXPECT_NO_THROW(_upRepo->ensureSchema());
}

TEST_F(SyncStateRepositoryTest, CheckpointRoundTrip) {
  EXPECT_FALSE(_upRepo->loadCheckpoint().has_value());

  _upRepo->saveCheckpoint(42);
  EXPECT_EQ(_upRepo->loadCheckpoint().value_or(0), 42u);

  _upRepo->saveCheckpoint(43);
  EXPECT_EQ(_upRepo->loadCheckpoint().value_or(0), 43u);
}

TEST_F(SyncStateRepositoryTest, PendingTasksComeBackInOrderOnce) {
  _upRepo->savePending({makeTask("0xa", SyncTaskKind::Register, 5),
                        makeTask("0xb", SyncTaskKind::Update, 6, 2)});

  auto vTasks = _upRepo->takePending();
  ASSERT_EQ(vTasks.size(), 2u);
  EXPECT_EQ(vTasks[0].sDomainKey, "0xa");
  EXPECT_EQ(vTasks[0].kind, SyncTaskKind::Register);
  EXPECT_EQ(vTasks[0].uSourceHeight, 5u);
  EXPECT_EQ(vTasks[1].sDomainKey, "0xb");
  EXPECT_EQ(vTasks[1].kind, SyncTaskKind::Update);
  EXPECT_EQ(vTasks[1].iRetryCount, 2);

  EXPECT_TRUE(_upRepo->takePending().empty());
}

TEST_F(SyncStateRepositoryTest, DeadLettersNewestFirst) {
  _upRepo->recordAbandoned(makeTask("0xa", SyncTaskKind::Update, 1, 5), "resolver unreachable");
  _upRepo->recordAbandoned(makeTask("0xb", SyncTaskKind::Update, 2), "rejected");

  auto vRows = _upRepo->listAbandoned(10);
  ASSERT_EQ(vRows.size(), 2u);
  EXPECT_EQ(vRows[0].stTask.sDomainKey, "0xb");
  EXPECT_EQ(vRows[0].sReason, "rejected");
  EXPECT_FALSE(vRows[0].sAbandonedAt.empty());
  EXPECT_EQ(vRows[1].stTask.iRetryCount, 5);

  EXPECT_EQ(_upRepo->listAbandoned(1).size(), 1u);
}

TEST_F(SyncStateRepositoryTest, EngineRestoresQueueAcrossRestart) {
  ddns::providers::InMemoryAuthoritativeLedger imal;
  ddns::providers::InMemoryFastLedger imfl;
  ddns::providers::InMemoryContentStore imcs;
  ddns::providers::ContentHashDecoder chd;
  ddns::core::ContentResolver cr(imcs, chd);

  ddns::core::SyncEngine::Options opts;
  opts.durPollInterval = std::chrono::milliseconds(3600000);
  opts.durApplyInterval = std::chrono::milliseconds(3600000);

  {
    ddns::core::WorkQueue wq;
    ddns::core::SyncEngine se(imal, imfl, cr, wq, opts, _upRepo.get());
    ASSERT_TRUE(se.start());
    wq.enqueue(makeTask("0xa", SyncTaskKind::Update, 1));
    EXPECT_TRUE(se.stop());
    EXPECT_TRUE(wq.empty());
  }

  ddns::core::WorkQueue wq;
  ddns::core::SyncEngine se(imal, imfl, cr, wq, opts, _upRepo.get());
  ASSERT_TRUE(se.initialize());
  ASSERT_EQ(wq.size(), 1u);
  EXPECT_EQ(wq.tryDequeue()->sDomainKey, "0xa");
}
