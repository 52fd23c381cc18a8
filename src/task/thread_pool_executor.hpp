#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <thread>
#include <unordered_map>
#include <vector>

#include "cachekit/task/iexecutor.hpp"

namespace cachekit {
namespace task {

class ThreadPoolExecutor : public IExecutor {
 public:
  explicit ThreadPoolExecutor(std::size_t worker_count = 0);
  explicit ThreadPoolExecutor(const ExecutorOptions& options);
  ~ThreadPoolExecutor() override;

  const char* Name() const override;
  std::uint32_t ApiVersion() const override;
  void Release() override;

  api::Status Submit(void (*fn)(void*), void* user_data) override;
  api::Result<TaskId> Post(const std::function<void()>& work) override;
  api::Status Wait(TaskId id, std::uint32_t timeout_ms) override;
  api::Status TryCancel(TaskId id) override;
  api::Status WaitAll() override;
  api::Result<ExecutorStats> QueryStats() const override;

  std::size_t WorkerCount() const { return workers_.size(); }

 private:
  struct TaskState {
    bool started = false;
    bool done = false;
    bool canceled = false;
    std::condition_variable cv;
  };

  std::size_t NormalizeWorkerCount(std::size_t worker_count) const;
  api::Status Enqueue(const std::function<void()>& fn);
  TaskId NextTaskIdLocked();
  void MarkTaskDone(TaskId id, bool executed, bool failed);
  void WorkerLoop();

  std::vector<std::thread> workers_;
  std::deque<std::function<void()> > tasks_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  bool stopping_;
  std::size_t active_workers_;
  std::size_t pending_tasks_;
  TaskId next_task_id_;
  std::size_t max_retained_states_;
  ExecutorStats stats_;
  ExecutorOptions options_;
  std::unordered_map<TaskId, std::shared_ptr<TaskState> > states_;
  std::set<TaskId> pending_ids_;
  std::deque<TaskId> done_ids_;
};

}  // namespace task
}  // namespace cachekit
