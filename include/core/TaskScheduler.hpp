#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace ddns::core {

/// Runs named repeating tasks, each on its own std::jthread, so a slow task
/// never delays the ticks of another. Each task can be cancelled on its own.
/// Class abbreviation: ts
class TaskScheduler {
 public:
  TaskScheduler();
  ~TaskScheduler();

  TaskScheduler(const TaskScheduler&) = delete;
  TaskScheduler& operator=(const TaskScheduler&) = delete;

  /// Register a task. When bRunImmediately is false the first run happens one
  /// interval after start(). Tasks added after start() begin right away.
  void schedule(const std::string& sName, std::chrono::milliseconds durInterval,
                std::function<void()> fnTask, bool bRunImmediately = false);

  void start();

  /// Stop one task and wait for its current run to finish.
  /// Returns false if no running task has that name.
  bool cancel(const std::string& sName);

  /// Stop every task. Blocks until in-flight runs complete. Idempotent.
  void stop();

  bool isRunning() const;

 private:
  struct Task {
    std::string sName;
    std::chrono::milliseconds durInterval;
    std::function<void()> fn;
    bool bRunImmediately = false;
    std::mutex mtx;
    std::condition_variable_any cv;
    std::jthread thread;
  };

  void launch(Task& task);
  static void runLoop(Task& task, std::stop_token stToken);

  std::vector<std::unique_ptr<Task>> _vTasks;
  mutable std::mutex _mtx;
  bool _bRunning = false;
};

}  // namespace ddns::core
