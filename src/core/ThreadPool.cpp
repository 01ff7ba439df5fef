#include "core/ThreadPool.hpp"

#include "common/Logger.hpp"

namespace ddns::core {

ThreadPool::ThreadPool(int iSize) {
  int iWorkers = iSize > 0 ? iSize : static_cast<int>(std::thread::hardware_concurrency());
  if (iWorkers <= 0) {
    iWorkers = 2;
  }

  _vWorkers.reserve(static_cast<size_t>(iWorkers));
  for (int i = 0; i < iWorkers; ++i) {
    _vWorkers.emplace_back([this]() { workerLoop(); });
  }
  ddns::common::Logger::get()->debug("ThreadPool started with {} workers", iWorkers);
}

ThreadPool::~ThreadPool() {
  shutdown();
}

void ThreadPool::workerLoop() {
  while (true) {
    std::packaged_task<void()> task;
    {
      std::unique_lock<std::mutex> lock(_mtx);
      _cv.wait(lock, [this]() { return _bStopping || !_qTasks.empty(); });
      if (_bStopping && _qTasks.empty()) {
        return;
      }
      task = std::move(_qTasks.front());
      _qTasks.pop();
    }
    // Exceptions are captured in the task's future
    task();
  }
}

void ThreadPool::shutdown() {
  {
    std::lock_guard<std::mutex> lock(_mtx);
    if (_bStopping) return;
    _bStopping = true;
  }
  _cv.notify_all();

  for (auto& thWorker : _vWorkers) {
    if (thWorker.joinable()) {
      thWorker.join();
    }
  }
}

}  // namespace ddns::core
