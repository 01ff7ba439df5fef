#include "core/SyncEngine.hpp"

#include "common/DomainHash.hpp"
#include "common/Errors.hpp"
#include "core/ContentResolver.hpp"
#include "core/WorkQueue.hpp"
#include "providers/ContentHashDecoder.hpp"
#include "providers/InMemoryAuthoritativeLedger.hpp"
#include "providers/InMemoryContentStore.hpp"
#include "providers/InMemoryFastLedger.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>

using ddns::common::DomainHash;
using ddns::common::SyncTask;
using ddns::common::SyncTaskKind;
using ddns::core::ContentResolver;
using ddns::core::SyncEngine;
using ddns::core::WorkQueue;
using ddns::providers::ContentHashDecoder;
using ddns::providers::InMemoryAuthoritativeLedger;
using ddns::providers::InMemoryContentStore;
using ddns::providers::InMemoryFastLedger;

namespace {

const std::string kOwner = "0x1111111111111111111111111111111111111111";

/// Textual CIDv0 locators pass through the decoder unchanged.
std::string makeCid(char c) { return "Qm" + std::string(44, c); }

class FlakyRegistry : public InMemoryAuthoritativeLedger {
 public:
  std::atomic<bool> bFailEvents{false};
  std::atomic<bool> bFailHeight{false};

  uint64_t currentHeight() override {
    if (bFailHeight) throw ddns::common::LedgerError("rpc_transport", "registry unreachable");
    return InMemoryAuthoritativeLedger::currentHeight();
  }

  std::vector<ddns::common::RegisterEvent> queryRegisterEvents(uint64_t uFrom,
                                                               uint64_t uTo) override {
    if (bFailEvents) throw ddns::common::LedgerError("rpc_transport", "registry unreachable");
    return InMemoryAuthoritativeLedger::queryRegisterEvents(uFrom, uTo);
  }
};

class FailingResolver : public InMemoryFastLedger {
 public:
  std::atomic<int> iAttempts{0};

  std::string submitBatchWrite(const std::string&, const std::vector<std::string>&,
                               const std::vector<std::string>&,
                               const std::vector<uint32_t>&) override {
    ++iAttempts;
    throw ddns::common::LedgerError("rpc_transport", "resolver unreachable");
  }
};

SyncEngine::Options fastOptions() {
  SyncEngine::Options opts;
  opts.durPollInterval = std::chrono::milliseconds(3600000);
  opts.durApplyInterval = std::chrono::milliseconds(3600000);
  opts.iApplyBatchSize = 10;
  opts.iMaxRetries = 2;
  opts.iRetryBackoffMs = 0;
  opts.uSafetyWindow = 10000;
  opts.uFallbackTtlSeconds = 300;
  return opts;
}

}  // namespace

class SyncEngineTest : public ::testing::Test {
 protected:
  void SetUp() override { _sKey = DomainHash::compute("example.eth"); }

  std::unique_ptr<SyncEngine> makeEngine(ddns::providers::IFastLedger& flLedger,
                                         SyncEngine::Options opts = fastOptions()) {
    auto upEngine = std::make_unique<SyncEngine>(_frRegistry, flLedger, _cr, _wq, opts);
    EXPECT_TRUE(upEngine->initialize());
    return upEngine;
  }

  FlakyRegistry _frRegistry;
  InMemoryFastLedger _imfl;
  InMemoryContentStore _imcs;
  ContentHashDecoder _chd;
  ContentResolver _cr{_imcs, _chd};
  WorkQueue _wq;
  std::string _sKey;
};

TEST_F(SyncEngineTest, RegisterThenUpdateReachesFastLedger) {
  auto upEngine = makeEngine(_imfl);

  _frRegistry.registerDomain(_sKey, kOwner);
  ASSERT_TRUE(upEngine->pollOnce());
  // Registration without content queues nothing
  EXPECT_TRUE(_wq.empty());
  EXPECT_EQ(upEngine->lastProcessedHeight(), 1u);

  _imcs.put(makeCid('A'),
            R"({"domain":"example.eth","records":{"A":["1.2.3.4"],"TXT":["hi"]},"ttl":120})");
  _frRegistry.updateDomain(_sKey, kOwner, makeCid('A'));
  ASSERT_TRUE(upEngine->pollOnce());
  EXPECT_EQ(_wq.size(), 1u);
  EXPECT_EQ(upEngine->lastProcessedHeight(), 2u);

  EXPECT_EQ(upEngine->applyOnce(), 1u);
  auto fr = _imfl.getRecord(_sKey, "A");
  EXPECT_EQ(fr.sValue, "1.2.3.4");
  EXPECT_EQ(fr.uTtl, 120u);
  EXPECT_EQ(_imfl.getRecord(_sKey, "TXT").sValue, "hi");

  auto bs = upEngine->stats();
  EXPECT_EQ(bs.uEventsProcessed, 1u);
  EXPECT_EQ(bs.uUpdatesSynced, 1u);
  EXPECT_EQ(bs.uErrors, 0u);
  EXPECT_EQ(bs.nQueueSize, 0u);
}

TEST_F(SyncEngineTest, RegisterWithContentInSameRangeIsQueued) {
  auto upEngine = makeEngine(_imfl);

  _imcs.put(makeCid('A'), R"({"records":{"A":["1.2.3.4"]}})");
  _frRegistry.registerDomain(_sKey, kOwner);
  _frRegistry.updateDomain(_sKey, kOwner, makeCid('A'));

  ASSERT_TRUE(upEngine->pollOnce());
  auto vTasks = _wq.drain();
  ASSERT_EQ(vTasks.size(), 2u);
  EXPECT_EQ(vTasks[0].kind, SyncTaskKind::Register);
  EXPECT_EQ(vTasks[0].uSourceHeight, 1u);
  EXPECT_EQ(vTasks[0].sContentRef, makeCid('A'));
  EXPECT_EQ(vTasks[1].kind, SyncTaskKind::Update);
  EXPECT_EQ(vTasks[1].uSourceHeight, 2u);
}

TEST_F(SyncEngineTest, TasksAreOrderedBySourceHeight) {
  auto upEngine = makeEngine(_imfl);
  const auto sOther = DomainHash::compute("other.eth");

  _frRegistry.registerDomain(_sKey, kOwner);                 // 1
  _frRegistry.registerDomain(sOther, kOwner);                // 2
  _frRegistry.updateDomain(sOther, kOwner, makeCid('B'));    // 3
  _frRegistry.updateDomain(_sKey, kOwner, makeCid('A'));     // 4

  ASSERT_TRUE(upEngine->pollOnce());
  auto vTasks = _wq.drain();
  ASSERT_EQ(vTasks.size(), 4u);
  for (size_t i = 1; i < vTasks.size(); ++i) {
    EXPECT_LE(vTasks[i - 1].uSourceHeight, vTasks[i].uSourceHeight);
  }
}

TEST_F(SyncEngineTest, PollWithoutNewBlocksIsNoOp) {
  auto upEngine = makeEngine(_imfl);
  EXPECT_TRUE(upEngine->pollOnce());
  EXPECT_TRUE(upEngine->pollOnce());
  EXPECT_EQ(upEngine->lastProcessedHeight(), 0u);
  EXPECT_EQ(upEngine->stats().uEventsProcessed, 0u);
}

TEST_F(SyncEngineTest, FailedPollLeavesCursorAndQueueUntouched) {
  auto upEngine = makeEngine(_imfl);
  _frRegistry.registerDomain(_sKey, kOwner);
  _frRegistry.updateDomain(_sKey, kOwner, makeCid('A'));

  _frRegistry.bFailEvents = true;
  EXPECT_FALSE(upEngine->pollOnce());
  EXPECT_EQ(upEngine->lastProcessedHeight(), 0u);
  EXPECT_TRUE(_wq.empty());
  EXPECT_EQ(upEngine->stats().uPollErrors, 1u);

  _frRegistry.bFailEvents = false;
  EXPECT_TRUE(upEngine->pollOnce());
  EXPECT_EQ(upEngine->lastProcessedHeight(), 2u);
  EXPECT_EQ(_wq.size(), 2u);
}

TEST_F(SyncEngineTest, ApplyingTheSameTaskTwiceIsIdempotent) {
  auto upEngine = makeEngine(_imfl);
  _imcs.put(makeCid('A'), R"({"records":{"A":["1.2.3.4"],"MX":[{"priority":10,"exchange":"mx"}]}})");

  SyncTask st;
  st.sDomainKey = _sKey;
  st.sContentRef = makeCid('A');
  st.uSourceHeight = 7;
  _wq.enqueue(st);
  _wq.enqueue(st);

  EXPECT_EQ(upEngine->applyOnce(), 2u);
  EXPECT_EQ(_imfl.getAllRecordTypes(_sKey), (std::vector<std::string>{"A", "MX"}));
  EXPECT_EQ(_imfl.getRecord(_sKey, "A").sValue, "1.2.3.4");
  EXPECT_EQ(_imfl.getRecord(_sKey, "MX").sValue, R"({"exchange":"mx","priority":10})");
}

TEST_F(SyncEngineTest, RetriesThenAbandonsAfterBudget) {
  FailingResolver frResolver;
  auto upEngine = makeEngine(frResolver);
  _imcs.put(makeCid('A'), R"({"records":{"A":["1.2.3.4"]}})");

  SyncTask st;
  st.sDomainKey = _sKey;
  st.sContentRef = makeCid('A');
  _wq.enqueue(st);

  // iMaxRetries = 2: the first attempt plus two retries
  for (int i = 0; i < 3; ++i) {
    EXPECT_EQ(upEngine->applyOnce(), 0u);
  }
  EXPECT_EQ(frResolver.iAttempts.load(), 3);
  EXPECT_TRUE(_wq.empty());

  auto bs = upEngine->stats();
  EXPECT_EQ(bs.uFastSubmissionErrors, 3u);
  EXPECT_EQ(bs.uRetries, 2u);
  EXPECT_EQ(bs.uAbandonedTasks, 1u);
  EXPECT_EQ(bs.uErrors, 1u);
  EXPECT_EQ(bs.uUpdatesSynced, 0u);
}

TEST_F(SyncEngineTest, BackingOffTaskIsNotAttemptedEarly) {
  FailingResolver frResolver;
  auto opts = fastOptions();
  opts.iRetryBackoffMs = 60000;
  auto upEngine = makeEngine(frResolver, opts);
  _imcs.put(makeCid('A'), R"({"records":{"A":["1.2.3.4"]}})");

  SyncTask st;
  st.sDomainKey = _sKey;
  st.sContentRef = makeCid('A');
  _wq.enqueue(st);

  EXPECT_EQ(upEngine->applyOnce(), 0u);
  EXPECT_EQ(upEngine->applyOnce(), 0u);
  EXPECT_EQ(frResolver.iAttempts.load(), 1);
  ASSERT_EQ(_wq.size(), 1u);
  EXPECT_EQ(_wq.tryDequeue()->iRetryCount, 1);
}

TEST_F(SyncEngineTest, RejectedBatchIsAbandonedWithoutRetry) {
  auto upEngine = makeEngine(_imfl);
  // An empty record type fails batch validation
  _imcs.put(makeCid('A'), R"({"records":{"":["x"]}})");

  SyncTask st;
  st.sDomainKey = _sKey;
  st.sContentRef = makeCid('A');
  _wq.enqueue(st);

  EXPECT_EQ(upEngine->applyOnce(), 0u);
  EXPECT_TRUE(_wq.empty());
  auto bs = upEngine->stats();
  EXPECT_EQ(bs.uRetries, 0u);
  EXPECT_EQ(bs.uAbandonedTasks, 1u);
  EXPECT_EQ(_imfl.writeCount(), 0u);
}

TEST_F(SyncEngineTest, EmptyRecordSetWritesNothing) {
  auto upEngine = makeEngine(_imfl);
  _imcs.put(makeCid('A'), R"({"records":{}})");

  SyncTask st;
  st.sDomainKey = _sKey;
  st.sContentRef = makeCid('A');
  _wq.enqueue(st);

  EXPECT_EQ(upEngine->applyOnce(), 0u);
  EXPECT_EQ(_imfl.writeCount(), 0u);
  EXPECT_EQ(upEngine->stats().uUpdatesSynced, 0u);
  EXPECT_EQ(upEngine->stats().uErrors, 0u);
}

TEST_F(SyncEngineTest, UnavailableContentWritesFallbackMarkerThenVerified) {
  auto upEngine = makeEngine(_imfl);
  _frRegistry.registerDomain(_sKey, kOwner);
  _frRegistry.updateDomain(_sKey, kOwner, makeCid('A'));
  ASSERT_TRUE(upEngine->pollOnce());
  _wq.drain();

  SyncTask st;
  st.sDomainKey = _sKey;
  st.sContentRef = makeCid('A');
  _wq.enqueue(st);
  EXPECT_EQ(upEngine->applyOnce(), 1u);

  auto frMarker = _imfl.getRecord(_sKey, ContentResolver::kSourceMarkerType);
  EXPECT_EQ(frMarker.sValue, ContentResolver::kSourceFallback);
  EXPECT_EQ(frMarker.uTtl, 300u);
  EXPECT_EQ(upEngine->stats().uContentRetrievalErrors, 1u);
  EXPECT_EQ(upEngine->stats().uUpdatesSynced, 1u);

  _imcs.put(makeCid('A'), R"({"records":{"A":["1.2.3.4"]},"ttl":60})");
  _wq.enqueue(st);
  EXPECT_EQ(upEngine->applyOnce(), 1u);

  EXPECT_EQ(_imfl.getRecord(_sKey, "A").sValue, "1.2.3.4");
  frMarker = _imfl.getRecord(_sKey, ContentResolver::kSourceMarkerType);
  EXPECT_EQ(frMarker.sValue, ContentResolver::kSourceVerified);
  EXPECT_EQ(frMarker.uTtl, 60u);
}

TEST_F(SyncEngineTest, StartupCursorHonoursSafetyWindow) {
  _frRegistry.advanceHeight(20000);
  auto upEngine = makeEngine(_imfl);
  EXPECT_EQ(upEngine->lastProcessedHeight(), 10000u);
}

TEST_F(SyncEngineTest, StartupCursorClampsAtZero) {
  _frRegistry.advanceHeight(50);
  auto upEngine = makeEngine(_imfl);
  EXPECT_EQ(upEngine->lastProcessedHeight(), 0u);
}

TEST_F(SyncEngineTest, ReinitializeNeverMovesCursorBackwards) {
  _frRegistry.advanceHeight(20000);
  auto upEngine = makeEngine(_imfl);
  ASSERT_EQ(upEngine->lastProcessedHeight(), 10000u);

  ASSERT_TRUE(upEngine->pollOnce());
  ASSERT_EQ(upEngine->lastProcessedHeight(), 20000u);

  ASSERT_TRUE(upEngine->initialize());
  EXPECT_EQ(upEngine->lastProcessedHeight(), 20000u);

  // A later head still lets the window start pull the cursor forward
  _frRegistry.advanceHeight(20000);
  ASSERT_TRUE(upEngine->initialize());
  EXPECT_EQ(upEngine->lastProcessedHeight(), 30000u);
}

TEST_F(SyncEngineTest, StartFailsWhenHeightUnavailable) {
  _frRegistry.bFailHeight = true;
  SyncEngine se(_frRegistry, _imfl, _cr, _wq, fastOptions());
  EXPECT_FALSE(se.start());
  EXPECT_FALSE(se.isRunning());
}

TEST_F(SyncEngineTest, StopIsIdempotent) {
  SyncEngine se(_frRegistry, _imfl, _cr, _wq, fastOptions());
  EXPECT_TRUE(se.stop());

  ASSERT_TRUE(se.start());
  EXPECT_TRUE(se.isRunning());
  EXPECT_TRUE(se.stats().bRunning);

  EXPECT_TRUE(se.stop());
  EXPECT_TRUE(se.stop());
  EXPECT_FALSE(se.isRunning());
}

TEST(SyncEngineFlattenTest, OneEntryPerValueInDocumentOrder) {
  ddns::common::RecordSet rs;
  rs.uTtl = 0;
  rs.vRecords.emplace_back("TXT", std::vector<std::string>{"a", "b"});
  rs.vRecords.emplace_back("A", std::vector<std::string>{"1.2.3.4"});

  auto bw = SyncEngine::flatten(rs);
  EXPECT_EQ(bw.vTypes, (std::vector<std::string>{"TXT", "TXT", "A"}));
  EXPECT_EQ(bw.vValues, (std::vector<std::string>{"a", "b", "1.2.3.4"}));
  EXPECT_EQ(bw.vTtls, (std::vector<uint32_t>{3600, 3600, 3600}));
}
