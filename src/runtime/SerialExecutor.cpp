// Repository: Reprise
// Component: Serial Executor
// Purpose: Single ordered task queue with cancellable delayed tasks.
// Copyright (c) 2026 Reprise

#include "reprise/runtime/SerialExecutor.hpp"

#include <chrono>
#include <exception>

#include "reprise/util/Logger.hpp"

namespace reprise::runtime {

namespace {

int64_t SteadyNowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now().time_since_epoch())
      .count();
}

}  // namespace

ThreadSerialExecutor::ThreadSerialExecutor(std::string name)
    : name_(std::move(name)) {
  worker_ = std::thread(&ThreadSerialExecutor::WorkerLoop, this);
}

ThreadSerialExecutor::~ThreadSerialExecutor() {
  Shutdown();
}

void ThreadSerialExecutor::Shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_ && !worker_.joinable()) return;
    shutdown_ = true;
    queue_.clear();
    due_by_id_.clear();
  }
  cv_.notify_all();
  if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
    worker_.join();
  }
}

void ThreadSerialExecutor::Post(Task task) {
  PostDelayed(0, std::move(task));
}

TaskId ThreadSerialExecutor::PostDelayed(int64_t delay_ms, Task task) {
  if (!task) return kInvalidTaskId;
  const int64_t due = SteadyNowMs() + (delay_ms > 0 ? delay_ms : 0);
  TaskId id = kInvalidTaskId;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_) {
      util::Logger::Debug("[SerialExecutor:" + name_ + "] task rejected after shutdown");
      return kInvalidTaskId;
    }
    id = next_id_++;
    queue_.emplace(QueueKey{due, id}, std::move(task));
    due_by_id_.emplace(id, due);
  }
  cv_.notify_one();
  return id;
}

void ThreadSerialExecutor::Cancel(TaskId id) {
  if (id == kInvalidTaskId) return;
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = due_by_id_.find(id);
  if (it == due_by_id_.end()) return;
  queue_.erase(QueueKey{it->second, id});
  due_by_id_.erase(it);
}

int64_t ThreadSerialExecutor::NowMs() const {
  return SteadyNowMs();
}

bool ThreadSerialExecutor::RunsTasksOnCurrentThread() const {
  return worker_.get_id() == std::this_thread::get_id();
}

void ThreadSerialExecutor::WorkerLoop() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (!shutdown_) {
    if (queue_.empty()) {
      cv_.wait(lock, [this] { return shutdown_ || !queue_.empty(); });
      continue;
    }
    auto head = queue_.begin();
    const int64_t now = SteadyNowMs();
    if (head->first.first > now) {
      cv_.wait_for(lock, std::chrono::milliseconds(head->first.first - now));
      continue;
    }
    Task task = std::move(head->second);
    due_by_id_.erase(head->first.second);
    queue_.erase(head);
    lock.unlock();
    try {
      task();
    } catch (const std::exception& e) {
      util::Logger::Error("[SerialExecutor:" + name_ + "] task threw: " + e.what());
    }
    lock.lock();
  }
}

}  // namespace reprise::runtime
