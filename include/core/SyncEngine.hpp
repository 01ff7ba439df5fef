#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <set>
#include <string>

#include "common/Types.hpp"
#include "core/SyncCursor.hpp"
#include "core/TaskScheduler.hpp"

namespace ddns::providers {
class IAuthoritativeLedger;
class IFastLedger;
}  // namespace ddns::providers

namespace ddns::dal {
class SyncStateRepository;
}

namespace ddns::core {

class ContentResolver;
class WorkQueue;

/// Bridge from the authoritative ledger to the fast ledger.
///
/// Two repeating tasks share the work queue and the cursor:
///   poll  - reads change events above the cursor and enqueues sync tasks
///   apply - drains a bounded batch, fetches content and writes it to L2
///
/// Failed applies are retried with exponential backoff and abandoned once
/// the retry budget is spent. Public methods never throw.
/// Class abbreviation: se
class SyncEngine {
 public:
  struct Options {
    std::chrono::milliseconds durPollInterval{30000};
    std::chrono::milliseconds durApplyInterval{1000};
    int iApplyBatchSize = 1;
    int iMaxRetries = 5;
    int iRetryBackoffMs = 1000;
    int iConfirmations = 3;
    uint64_t uSafetyWindow = 10000;
    uint32_t uFallbackTtlSeconds = 300;
  };

  /// pRepo may be nullptr, in which case nothing is persisted.
  SyncEngine(providers::IAuthoritativeLedger& alLedger, providers::IFastLedger& flLedger,
             ContentResolver& crResolver, WorkQueue& wqQueue, Options opts,
             dal::SyncStateRepository* pRepo = nullptr);
  ~SyncEngine();

  SyncEngine(const SyncEngine&) = delete;
  SyncEngine& operator=(const SyncEngine&) = delete;

  /// Derive the starting cursor and restore persisted tasks without
  /// scheduling anything. The first call seeds the cursor; later calls
  /// only move it forward. Returns false if the height read fails.
  bool initialize();

  /// initialize() and schedule the poll and apply tasks.
  bool start();

  /// One poll cycle. Returns false if any read failed; the queue and the
  /// cursor are then left untouched.
  bool pollOnce();

  /// One apply cycle. Returns the number of tasks written to the fast ledger.
  size_t applyOnce();

  /// Cancel both tasks, wait for in-flight work and persist the queue.
  /// Idempotent; always returns true.
  bool stop();

  common::BridgeStats stats() const;
  uint64_t lastProcessedHeight() const { return _scCursor.get(); }
  bool isRunning() const { return _bRunning.load(); }

  /// Expand a record set into parallel (type, value, ttl) arrays, one entry
  /// per value, in document order.
  static common::BatchWrite flatten(const common::RecordSet& rs);

 private:
  enum class ApplyOutcome { Applied, Skipped, Retried, Abandoned };

  ApplyOutcome applyTask(common::SyncTask& stTask);
  ApplyOutcome retryOrAbandon(common::SyncTask& stTask, const std::string& sReason,
                              bool bRetryable);
  void abandon(const common::SyncTask& stTask, const std::string& sReason);
  std::chrono::milliseconds backoffFor(int iRetryCount) const;

  providers::IAuthoritativeLedger& _alLedger;
  providers::IFastLedger& _flLedger;
  ContentResolver& _crResolver;
  WorkQueue& _wqQueue;
  Options _opts;
  dal::SyncStateRepository* _pRepo;

  SyncCursor _scCursor;
  bool _bCursorSeeded = false;
  TaskScheduler _tsScheduler;
  std::atomic<bool> _bRunning{false};
  std::chrono::steady_clock::time_point _tpStarted{};

  // Domains this process wrote the fallback marker for
  std::mutex _mtxDegraded;
  std::set<std::string> _setDegraded;

  mutable std::mutex _mtxStats;
  common::BridgeStats _bsStats;
};

}  // namespace ddns::core
