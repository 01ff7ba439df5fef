#include "core/WorkQueue.hpp"

#include "common/Errors.hpp"

#include <iterator>

namespace ddns::core {

WorkQueue::WorkQueue() = default;
WorkQueue::~WorkQueue() = default;

void WorkQueue::enqueue(common::SyncTask stTask) {
  std::lock_guard<std::mutex> lock(_mtx);
  _dqTasks.push_back(std::move(stTask));
}

void WorkQueue::enqueueAll(std::vector<common::SyncTask> vTasks) {
  std::lock_guard<std::mutex> lock(_mtx);
  _dqTasks.insert(_dqTasks.end(), std::make_move_iterator(vTasks.begin()),
                  std::make_move_iterator(vTasks.end()));
}

common::SyncTask WorkQueue::dequeue() {
  std::lock_guard<std::mutex> lock(_mtx);
  if (_dqTasks.empty()) {
    throw common::EmptyQueueError("empty_queue", "Work queue is empty");
  }
  common::SyncTask stTask = std::move(_dqTasks.front());
  _dqTasks.pop_front();
  return stTask;
}

std::optional<common::SyncTask> WorkQueue::tryDequeue() {
  std::lock_guard<std::mutex> lock(_mtx);
  if (_dqTasks.empty()) {
    return std::nullopt;
  }
  common::SyncTask stTask = std::move(_dqTasks.front());
  _dqTasks.pop_front();
  return stTask;
}

std::vector<common::SyncTask> WorkQueue::drain() {
  std::lock_guard<std::mutex> lock(_mtx);
  std::vector<common::SyncTask> vTasks(std::make_move_iterator(_dqTasks.begin()),
                                       std::make_move_iterator(_dqTasks.end()));
  _dqTasks.clear();
  return vTasks;
}

size_t WorkQueue::size() const {
  std::lock_guard<std::mutex> lock(_mtx);
  return _dqTasks.size();
}

bool WorkQueue::empty() const {
  std::lock_guard<std::mutex> lock(_mtx);
  return _dqTasks.empty();
}

}  // namespace ddns::core
