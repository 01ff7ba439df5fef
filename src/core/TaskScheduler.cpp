#include "core/TaskScheduler.hpp"

#include "common/Logger.hpp"

#include <algorithm>
#include <stop_token>

namespace ddns::core {

TaskScheduler::TaskScheduler() = default;

TaskScheduler::~TaskScheduler() {
  stop();
}

void TaskScheduler::schedule(const std::string& sName,
                             std::chrono::milliseconds durInterval,
                             std::function<void()> fnTask,
                             bool bRunImmediately) {
  auto upTask = std::make_unique<Task>();
  upTask->sName = sName;
  upTask->durInterval = durInterval;
  upTask->fn = std::move(fnTask);
  upTask->bRunImmediately = bRunImmediately;

  std::lock_guard<std::mutex> lock(_mtx);
  _vTasks.push_back(std::move(upTask));
  if (_bRunning) {
    launch(*_vTasks.back());
  }
}

void TaskScheduler::start() {
  std::lock_guard<std::mutex> lock(_mtx);
  if (_bRunning) return;
  _bRunning = true;

  for (auto& upTask : _vTasks) {
    launch(*upTask);
  }
}

void TaskScheduler::launch(Task& task) {
  task.thread = std::jthread([&task](std::stop_token stToken) { runLoop(task, stToken); });
}

void TaskScheduler::runLoop(Task& task, std::stop_token stToken) {
  auto spLog = ddns::common::Logger::get();
  bool bSkipWait = task.bRunImmediately;

  while (!stToken.stop_requested()) {
    if (!bSkipWait) {
      // Sleep one interval; a stop request wakes the wait early
      std::unique_lock<std::mutex> ulock(task.mtx);
      task.cv.wait_for(ulock, stToken, task.durInterval, [] { return false; });
      if (stToken.stop_requested()) break;
    }
    bSkipWait = false;

    try {
      task.fn();
    } catch (const std::exception& ex) {
      spLog->error("TaskScheduler: task '{}' failed: {}", task.sName, ex.what());
    }
  }
}

bool TaskScheduler::cancel(const std::string& sName) {
  std::unique_ptr<Task> upTask;
  {
    std::lock_guard<std::mutex> lock(_mtx);
    auto it = std::find_if(_vTasks.begin(), _vTasks.end(),
                           [&sName](const auto& up) { return up->sName == sName; });
    if (it == _vTasks.end()) return false;
    upTask = std::move(*it);
    _vTasks.erase(it);
  }

  // Join outside the lock so the task body may itself touch the scheduler
  if (upTask->thread.joinable()) {
    upTask->thread.request_stop();
    upTask->thread.join();
    return true;
  }
  return false;
}

void TaskScheduler::stop() {
  std::vector<Task*> vStopping;
  {
    std::lock_guard<std::mutex> lock(_mtx);
    if (!_bRunning) return;
    _bRunning = false;
    for (auto& upTask : _vTasks) {
      upTask->thread.request_stop();
      vStopping.push_back(upTask.get());
    }
  }

  for (Task* pTask : vStopping) {
    if (pTask->thread.joinable()) {
      pTask->thread.join();
    }
  }
}

bool TaskScheduler::isRunning() const {
  std::lock_guard<std::mutex> lock(_mtx);
  return _bRunning;
}

}  // namespace ddns::core
