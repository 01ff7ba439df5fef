#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "common/Types.hpp"

namespace ddns::dal {

class ConnectionPool;

/// Row type returned from dead-letter queries.
struct DeadLetterRow {
  int64_t iId = 0;
  common::SyncTask stTask;
  std::string sReason;
  std::string sAbandonedAt;  // ISO-8601, UTC
};

/// Durable bridge state: the cursor checkpoint, tasks still queued at
/// shutdown, and tasks abandoned after exhausting their retries.
/// Tables: sync_checkpoint, sync_pending_tasks, sync_dead_letters.
/// Class abbreviation: ssr
class SyncStateRepository {
 public:
  explicit SyncStateRepository(ConnectionPool& cpPool);
  ~SyncStateRepository();

  /// Create the tables if they do not exist yet.
  void ensureSchema();

  /// Last checkpointed height, or nullopt if never saved.
  std::optional<uint64_t> loadCheckpoint();

  /// Upsert the single checkpoint row.
  void saveCheckpoint(uint64_t uHeight);

  /// Append tasks in queue order. Retry counts are kept; backoff deadlines are not.
  void savePending(const std::vector<common::SyncTask>& vTasks);

  /// Remove and return every persisted pending task in original order.
  std::vector<common::SyncTask> takePending();

  void recordAbandoned(const common::SyncTask& stTask, const std::string& sReason);

  /// Most recent dead letters first.
  std::vector<DeadLetterRow> listAbandoned(int iLimit = 100);

 private:
  static std::string kindToString(common::SyncTaskKind kind);
  static common::SyncTaskKind kindFromString(const std::string& sKind);

  ConnectionPool& _cpPool;
};

}  // namespace ddns::dal
