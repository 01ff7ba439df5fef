#include "core/SyncEngine.hpp"

#include <algorithm>

#include "common/DomainHash.hpp"
#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "core/ContentResolver.hpp"
#include "core/WorkQueue.hpp"
#include "dal/SyncStateRepository.hpp"
#include "providers/IAuthoritativeLedger.hpp"
#include "providers/IFastLedger.hpp"

namespace ddns::core {

namespace {

// Caps the backoff shift so the delay cannot overflow
constexpr int kMaxBackoffShift = 20;

}  // anonymous namespace

SyncEngine::SyncEngine(providers::IAuthoritativeLedger& alLedger,
                       providers::IFastLedger& flLedger, ContentResolver& crResolver,
                       WorkQueue& wqQueue, Options opts, dal::SyncStateRepository* pRepo)
    : _alLedger(alLedger),
      _flLedger(flLedger),
      _crResolver(crResolver),
      _wqQueue(wqQueue),
      _opts(opts),
      _pRepo(pRepo) {
  _opts.iApplyBatchSize = std::max(1, _opts.iApplyBatchSize);
  _opts.iMaxRetries = std::max(0, _opts.iMaxRetries);
}

SyncEngine::~SyncEngine() { stop(); }

// ── Lifecycle ──────────────────────────────────────────────────────────────

bool SyncEngine::initialize() {
  auto spLog = common::Logger::get();
  try {
    const uint64_t uHeight = _alLedger.currentHeight();
    uint64_t uStart = uHeight > _opts.uSafetyWindow ? uHeight - _opts.uSafetyWindow : 0;

    if (_pRepo) {
      const auto oCheckpoint = _pRepo->loadCheckpoint();
      if (oCheckpoint && *oCheckpoint < uStart) {
        spLog->info("Checkpoint {} is below the safety window start {}, resuming from it",
                    *oCheckpoint, uStart);
        uStart = *oCheckpoint;
      }
      auto vPending = _pRepo->takePending();
      if (!vPending.empty()) {
        spLog->info("Restored {} pending sync tasks", vPending.size());
        _wqQueue.enqueueAll(std::move(vPending));
      }
    }

    // A restart within this process keeps the cursor it already reached
    if (_bCursorSeeded) {
      _scCursor.advanceTo(uStart);
    } else {
      _scCursor.reset(uStart);
      _bCursorSeeded = true;
    }
    _tpStarted = std::chrono::steady_clock::now();
    spLog->info("Sync engine initialized: {} height={} cursor={}", _alLedger.name(), uHeight,
                _scCursor.get());
    return true;
  } catch (const std::exception& ex) {
    spLog->error("Sync engine startup failed: {}", ex.what());
    return false;
  }
}

bool SyncEngine::start() {
  if (_bRunning.load()) return true;
  if (!initialize()) return false;

  _tsScheduler.schedule("sync-poll", _opts.durPollInterval, [this] { pollOnce(); }, true);
  _tsScheduler.schedule("sync-apply", _opts.durApplyInterval, [this] { applyOnce(); });
  _tsScheduler.start();
  _bRunning.store(true);

  common::Logger::get()->info("Sync engine started: poll every {}ms, apply every {}ms",
                              _opts.durPollInterval.count(), _opts.durApplyInterval.count());
  return true;
}

bool SyncEngine::stop() {
  if (!_bRunning.exchange(false)) return true;

  auto spLog = common::Logger::get();
  // Joins both workers; a task dequeued by an in-flight apply is either
  // written or back in the queue once this returns
  _tsScheduler.cancel("sync-poll");
  _tsScheduler.cancel("sync-apply");
  _tsScheduler.stop();

  if (_pRepo) {
    auto vRemaining = _wqQueue.drain();
    const size_t nRemaining = vRemaining.size();
    try {
      _pRepo->savePending(vRemaining);
      spLog->info("Persisted {} pending sync tasks", nRemaining);
    } catch (const std::exception& ex) {
      spLog->error("Failed to persist {} pending sync tasks: {}", nRemaining, ex.what());
      _wqQueue.enqueueAll(std::move(vRemaining));
    }
  }

  spLog->info("Sync engine stopped at height {}", _scCursor.get());
  return true;
}

// ── Poll ───────────────────────────────────────────────────────────────────

bool SyncEngine::pollOnce() {
  auto spLog = common::Logger::get();
  try {
    const uint64_t uHeight = _alLedger.currentHeight();
    const uint64_t uLast = _scCursor.get();
    if (uHeight <= uLast) {
      return true;
    }

    const uint64_t uFrom = uLast + 1;
    spLog->debug("Polling events in [{}, {}]", uFrom, uHeight);
    const auto vUpdates = _alLedger.queryUpdateEvents(uFrom, uHeight);
    const auto vRegisters = _alLedger.queryRegisterEvents(uFrom, uHeight);

    std::vector<common::SyncTask> vTasks;
    vTasks.reserve(vUpdates.size() + vRegisters.size());
    for (const auto& ue : vUpdates) {
      common::SyncTask st;
      st.kind = common::SyncTaskKind::Update;
      st.sDomainKey = ue.sDomainKey;
      st.sContentRef = ue.sContentRef;
      st.uSourceHeight = ue.uHeight;
      vTasks.push_back(std::move(st));
    }
    for (const auto& re : vRegisters) {
      // Registrations only matter once content is attached
      const auto drs = _alLedger.getDomainRecord(re.sDomainKey);
      if (common::DomainHash::isZero(drs.sContentRef)) {
        continue;
      }
      common::SyncTask st;
      st.kind = common::SyncTaskKind::Register;
      st.sDomainKey = re.sDomainKey;
      st.sContentRef = drs.sContentRef;
      st.uSourceHeight = re.uHeight;
      vTasks.push_back(std::move(st));
    }

    std::stable_sort(vTasks.begin(), vTasks.end(),
                     [](const common::SyncTask& a, const common::SyncTask& b) {
                       return a.uSourceHeight < b.uSourceHeight;
                     });

    const size_t nTasks = vTasks.size();
    _wqQueue.enqueueAll(std::move(vTasks));
    _scCursor.advanceTo(uHeight);
    {
      std::lock_guard<std::mutex> lock(_mtxStats);
      _bsStats.uEventsProcessed += nTasks;
    }

    if (nTasks > 0) {
      spLog->info("Enqueued {} sync tasks from heights [{}, {}]", nTasks, uFrom, uHeight);
    }

    if (_pRepo) {
      try {
        _pRepo->saveCheckpoint(_scCursor.get());
      } catch (const std::exception& ex) {
        spLog->warn("Checkpoint at height {} not saved: {}", uHeight, ex.what());
      }
    }
    return true;
  } catch (const std::exception& ex) {
    {
      std::lock_guard<std::mutex> lock(_mtxStats);
      ++_bsStats.uPollErrors;
    }
    spLog->error("Poll cycle failed, cursor stays at {}: {}", _scCursor.get(), ex.what());
    return false;
  }
}

// ── Apply ──────────────────────────────────────────────────────────────────

size_t SyncEngine::applyOnce() {
  size_t nApplied = 0;
  for (int i = 0; i < _opts.iApplyBatchSize; ++i) {
    auto oTask = _wqQueue.tryDequeue();
    if (!oTask) break;

    if (oTask->tpNotBefore > std::chrono::system_clock::now()) {
      // Still backing off; keep FIFO order for the rest and end the tick
      _wqQueue.enqueue(std::move(*oTask));
      break;
    }

    if (applyTask(*oTask) == ApplyOutcome::Applied) {
      ++nApplied;
    }
  }
  return nApplied;
}

SyncEngine::ApplyOutcome SyncEngine::applyTask(common::SyncTask& stTask) {
  auto spLog = common::Logger::get();
  spLog->debug("Applying {} task for {} (height {}, attempt {})",
               stTask.kind == common::SyncTaskKind::Register ? "register" : "update",
               stTask.sDomainKey, stTask.uSourceHeight, stTask.iRetryCount + 1);

  common::RecordSet rs;
  try {
    rs = _crResolver.fetch(stTask.sContentRef);
  } catch (const std::exception& ex) {
    {
      std::lock_guard<std::mutex> lock(_mtxStats);
      ++_bsStats.uContentRetrievalErrors;
    }
    spLog->warn("Content {} for {} unavailable, writing fallback marker: {}",
                stTask.sContentRef, stTask.sDomainKey, ex.what());
    rs = ContentResolver::degraded(stTask.sDomainKey, _opts.uFallbackTtlSeconds);
  }

  auto bw = flatten(rs);
  bool bClearsMarker = false;
  if (!rs.bDegraded) {
    std::lock_guard<std::mutex> lock(_mtxDegraded);
    if (_setDegraded.count(stTask.sDomainKey) > 0 &&
        ContentResolver::findType(rs, ContentResolver::kSourceMarkerType) == nullptr) {
      bw.vTypes.emplace_back(ContentResolver::kSourceMarkerType);
      bw.vValues.emplace_back(ContentResolver::kSourceVerified);
      bw.vTtls.push_back(rs.uTtl);
      bClearsMarker = true;
    }
  }

  if (bw.vTypes.empty()) {
    spLog->info("Record set for {} is empty, nothing to write", stTask.sDomainKey);
    return ApplyOutcome::Skipped;
  }

  try {
    const auto sConfirmationId =
        _flLedger.submitBatchWrite(stTask.sDomainKey, bw.vTypes, bw.vValues, bw.vTtls);
    _flLedger.awaitConfirmations(sConfirmationId, _opts.iConfirmations);
  } catch (const common::ValidationError& ex) {
    return retryOrAbandon(stTask, ex.what(), false);
  } catch (const std::exception& ex) {
    return retryOrAbandon(stTask, ex.what(), true);
  }

  {
    std::lock_guard<std::mutex> lock(_mtxDegraded);
    if (rs.bDegraded) {
      _setDegraded.insert(stTask.sDomainKey);
    } else if (bClearsMarker) {
      _setDegraded.erase(stTask.sDomainKey);
    }
  }
  {
    std::lock_guard<std::mutex> lock(_mtxStats);
    ++_bsStats.uUpdatesSynced;
  }
  spLog->info("Synced {} records for {}{}", bw.vTypes.size(), stTask.sDomainKey,
              rs.bDegraded ? " (fallback)" : "");
  return ApplyOutcome::Applied;
}

SyncEngine::ApplyOutcome SyncEngine::retryOrAbandon(common::SyncTask& stTask,
                                                    const std::string& sReason,
                                                    bool bRetryable) {
  auto spLog = common::Logger::get();
  {
    std::lock_guard<std::mutex> lock(_mtxStats);
    ++_bsStats.uFastSubmissionErrors;
  }

  if (!bRetryable) {
    abandon(stTask, "rejected by fast ledger: " + sReason);
    return ApplyOutcome::Abandoned;
  }
  if (stTask.iRetryCount >= _opts.iMaxRetries) {
    abandon(stTask, sReason);
    return ApplyOutcome::Abandoned;
  }

  ++stTask.iRetryCount;
  const auto durBackoff = backoffFor(stTask.iRetryCount);
  stTask.tpNotBefore = std::chrono::system_clock::now() + durBackoff;
  {
    std::lock_guard<std::mutex> lock(_mtxStats);
    ++_bsStats.uRetries;
  }
  spLog->warn("Write for {} failed, retry {}/{} in {}ms: {}", stTask.sDomainKey,
              stTask.iRetryCount, _opts.iMaxRetries, durBackoff.count(), sReason);
  _wqQueue.enqueue(stTask);
  return ApplyOutcome::Retried;
}

void SyncEngine::abandon(const common::SyncTask& stTask, const std::string& sReason) {
  auto spLog = common::Logger::get();
  {
    std::lock_guard<std::mutex> lock(_mtxStats);
    ++_bsStats.uErrors;
    ++_bsStats.uAbandonedTasks;
  }
  spLog->error("Abandoning sync of {} (content {}, height {}) after {} retries: {}",
               stTask.sDomainKey, stTask.sContentRef, stTask.uSourceHeight,
               stTask.iRetryCount, sReason);

  if (_pRepo) {
    try {
      _pRepo->recordAbandoned(stTask, sReason);
    } catch (const std::exception& ex) {
      spLog->error("Dead letter for {} not recorded: {}", stTask.sDomainKey, ex.what());
    }
  }
}

std::chrono::milliseconds SyncEngine::backoffFor(int iRetryCount) const {
  if (_opts.iRetryBackoffMs <= 0 || iRetryCount <= 0) {
    return std::chrono::milliseconds(0);
  }
  const int iShift = std::min(iRetryCount - 1, kMaxBackoffShift);
  return std::chrono::milliseconds(static_cast<int64_t>(_opts.iRetryBackoffMs) << iShift);
}

// ── Helpers ────────────────────────────────────────────────────────────────

common::BatchWrite SyncEngine::flatten(const common::RecordSet& rs) {
  common::BatchWrite bw;
  const uint32_t uTtl = rs.uTtl == 0 ? common::kDefaultTtlSeconds : rs.uTtl;
  for (const auto& [sType, vValues] : rs.vRecords) {
    for (const auto& sValue : vValues) {
      bw.vTypes.push_back(sType);
      bw.vValues.push_back(sValue);
      bw.vTtls.push_back(uTtl);
    }
  }
  return bw;
}

common::BridgeStats SyncEngine::stats() const {
  common::BridgeStats bs;
  {
    std::lock_guard<std::mutex> lock(_mtxStats);
    bs = _bsStats;
  }
  bs.uLastProcessedHeight = _scCursor.get();
  bs.nQueueSize = _wqQueue.size();
  bs.bRunning = _bRunning.load();
  if (_tpStarted != std::chrono::steady_clock::time_point{}) {
    bs.iUptimeSeconds = std::chrono::duration_cast<std::chrono::seconds>(
                            std::chrono::steady_clock::now() - _tpStarted)
                            .count();
  }
  return bs;
}

}  // namespace ddns::core
