// Repository: Reprise
// Component: Serial Executor
// Purpose: Single ordered task queue with cancellable delayed tasks.
// Copyright (c) 2026 Reprise

#ifndef REPRISE_RUNTIME_SERIAL_EXECUTOR_HPP_
#define REPRISE_RUNTIME_SERIAL_EXECUTOR_HPP_

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

namespace reprise::runtime {

using Task = std::function<void()>;
using TaskId = uint64_t;
inline constexpr TaskId kInvalidTaskId = 0;

// ISerialExecutor runs tasks one at a time in due-time order (FIFO among
// equal due times). Cancel() is best effort: a task already dequeued may
// still run, so task bodies must check their own liveness flag.
class ISerialExecutor {
 public:
  virtual ~ISerialExecutor() = default;

  virtual void Post(Task task) = 0;
  virtual TaskId PostDelayed(int64_t delay_ms, Task task) = 0;
  virtual void Cancel(TaskId id) = 0;

  // Monotonic milliseconds on the executor's clock.
  [[nodiscard]] virtual int64_t NowMs() const = 0;
};

// ThreadSerialExecutor: one worker thread over a time-ordered queue.
// Destruction drops tasks that have not started and joins the worker.
class ThreadSerialExecutor : public ISerialExecutor {
 public:
  explicit ThreadSerialExecutor(std::string name = "serial");
  ~ThreadSerialExecutor() override;

  ThreadSerialExecutor(const ThreadSerialExecutor&) = delete;
  ThreadSerialExecutor& operator=(const ThreadSerialExecutor&) = delete;

  void Post(Task task) override;
  TaskId PostDelayed(int64_t delay_ms, Task task) override;
  void Cancel(TaskId id) override;
  [[nodiscard]] int64_t NowMs() const override;

  // Stops accepting work and joins the worker. Idempotent.
  void Shutdown();

  [[nodiscard]] bool RunsTasksOnCurrentThread() const;

 private:
  // Key orders by due time, then by id (post order).
  using QueueKey = std::pair<int64_t, TaskId>;

  void WorkerLoop();

  std::string name_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::map<QueueKey, Task> queue_;
  std::map<TaskId, int64_t> due_by_id_;
  TaskId next_id_ = 1;
  bool shutdown_ = false;
  std::thread worker_;
};

}  // namespace reprise::runtime

#endif  // REPRISE_RUNTIME_SERIAL_EXECUTOR_HPP_
