#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

#include "common/Types.hpp"

namespace ddns::core {

/// FIFO buffer of pending sync tasks shared by the poll and apply cycles.
/// No priority and no deduplication: duplicates for one domain may coexist.
/// Thread-safe via a single mutex.
/// Class abbreviation: wq
class WorkQueue {
 public:
  WorkQueue();
  ~WorkQueue();

  /// Append a task at the back.
  void enqueue(common::SyncTask stTask);

  /// Append several tasks in order under one lock.
  void enqueueAll(std::vector<common::SyncTask> vTasks);

  /// Remove and return the front task. Throws EmptyQueueError if empty.
  common::SyncTask dequeue();

  /// Remove and return the front task, or nullopt if empty.
  std::optional<common::SyncTask> tryDequeue();

  /// Remove and return every queued task, front first.
  std::vector<common::SyncTask> drain();

  size_t size() const;
  bool empty() const;

 private:
  std::deque<common::SyncTask> _dqTasks;
  mutable std::mutex _mtx;
};

}  // namespace ddns::core
