#include "task/thread_pool_executor.hpp"

#include <glog/logging.h>

#include <chrono>
#include <exception>

#include "cachekit/api/version.hpp"

namespace cachekit {
namespace task {

#define CK_STATUS(code, message) api::Status::FromModule((code), (message), api::ErrorModule::kTask)

ThreadPoolExecutor::ThreadPoolExecutor(std::size_t worker_count)
    : stopping_(false),
      active_workers_(0),
      pending_tasks_(0),
      next_task_id_(1),
      max_retained_states_(65536) {
  options_.worker_count = NormalizeWorkerCount(worker_count);
  workers_.reserve(options_.worker_count);
  for (std::size_t i = 0; i < options_.worker_count; ++i) {
    workers_.push_back(std::thread(&ThreadPoolExecutor::WorkerLoop, this));
  }
}

ThreadPoolExecutor::ThreadPoolExecutor(const ExecutorOptions& options)
    : ThreadPoolExecutor(options.worker_count) {
  options_.queue_capacity = options.queue_capacity;
}

ThreadPoolExecutor::~ThreadPoolExecutor() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    stopping_ = true;
  }
  cv_.notify_all();
  for (std::size_t i = 0; i < workers_.size(); ++i) {
    if (workers_[i].joinable()) workers_[i].join();
  }
}

const char* ThreadPoolExecutor::Name() const { return "cachekit.task.thread_pool_executor"; }
std::uint32_t ThreadPoolExecutor::ApiVersion() const { return api::kApiVersion; }
void ThreadPoolExecutor::Release() { delete this; }

std::size_t ThreadPoolExecutor::NormalizeWorkerCount(std::size_t worker_count) const {
  if (worker_count > 0) return worker_count;
  std::size_t count = static_cast<std::size_t>(std::thread::hardware_concurrency());
  return count == 0 ? 1 : count;
}

api::Status ThreadPoolExecutor::Enqueue(const std::function<void()>& fn) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (stopping_) {
      return CK_STATUS(api::StatusCode::kInternalError,
                       "executor is stopping, cannot accept new tasks");
    }
    if (options_.queue_capacity > 0 && tasks_.size() >= options_.queue_capacity) {
      ++stats_.rejected;
      return api::Status::FromModule(api::StatusCode::kWouldBlock, "executor queue is full",
                                     api::ErrorModule::kTask, 0x0001);
    }
    tasks_.push_back(fn);
    ++pending_tasks_;
    ++stats_.submitted;
    stats_.queue_depth = tasks_.size();
    if (stats_.queue_depth > stats_.queue_high_watermark) {
      stats_.queue_high_watermark = stats_.queue_depth;
    }
  }
  cv_.notify_one();
  return api::Status::Ok();
}

api::Status ThreadPoolExecutor::Submit(void (*fn)(void*), void* user_data) {
  if (fn == NULL) {
    return api::Status::FromModule(api::StatusCode::kInvalidArgument, "fn is null",
                                   api::ErrorModule::kTask, 0x0001);
  }
  api::Result<TaskId> r = Post([fn, user_data]() { fn(user_data); });
  return r.ok() ? api::Status::Ok() : r.status();
}

api::Result<TaskId> ThreadPoolExecutor::Post(const std::function<void()>& work) {
  if (!work) {
    return api::Result<TaskId>(api::Status::FromModule(
        api::StatusCode::kInvalidArgument, "work is empty", api::ErrorModule::kTask, 0x0001));
  }

  TaskId id = 0;
  std::shared_ptr<TaskState> state(new TaskState());
  {
    std::lock_guard<std::mutex> lock(mu_);
    id = NextTaskIdLocked();
    states_[id] = state;
    pending_ids_.insert(id);
  }

  api::Status st = Enqueue([this, id, work, state]() {
    bool canceled = false;
    {
      std::lock_guard<std::mutex> lock(mu_);
      state->started = true;
      canceled = state->canceled;
    }

    if (canceled) {
      MarkTaskDone(id, false, false);
      return;
    }

    try {
      work();
      MarkTaskDone(id, true, false);
    } catch (const std::exception& ex) {
      LOG(ERROR) << "task " << id << " threw: " << ex.what();
      MarkTaskDone(id, false, true);
    } catch (...) {
      LOG(ERROR) << "task " << id << " threw a non-standard exception";
      MarkTaskDone(id, false, true);
    }
  });

  if (!st.ok()) {
    std::lock_guard<std::mutex> lock(mu_);
    states_.erase(id);
    pending_ids_.erase(id);
    return api::Result<TaskId>(st);
  }

  return api::Result<TaskId>(id);
}

api::Status ThreadPoolExecutor::Wait(TaskId id, std::uint32_t timeout_ms) {
  std::shared_ptr<TaskState> state;
  {
    std::lock_guard<std::mutex> lock(mu_);
    typename std::unordered_map<TaskId, std::shared_ptr<TaskState> >::iterator it = states_.find(id);
    if (it == states_.end()) return CK_STATUS(api::StatusCode::kNotFound, "task id not found");
    state = it->second;
  }

  std::unique_lock<std::mutex> lock(mu_);
  if (timeout_ms == 0) {
    state->cv.wait(lock, [state]() { return state->done; });
    return api::Status::Ok();
  }
  const bool done = state->cv.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                                       [state]() { return state->done; });
  return done ? api::Status::Ok() : CK_STATUS(api::StatusCode::kWouldBlock, "wait timeout");
}

api::Status ThreadPoolExecutor::TryCancel(TaskId id) {
  std::lock_guard<std::mutex> lock(mu_);
  typename std::unordered_map<TaskId, std::shared_ptr<TaskState> >::iterator it = states_.find(id);
  if (it == states_.end()) return CK_STATUS(api::StatusCode::kNotFound, "task id not found");
  if (it->second->started || it->second->done) {
    return CK_STATUS(api::StatusCode::kWouldBlock, "task already running or done");
  }
  it->second->canceled = true;
  ++stats_.canceled;
  return api::Status::Ok();
}

api::Status ThreadPoolExecutor::WaitAll() {
  std::unique_lock<std::mutex> lock(mu_);
  idle_cv_.wait(lock, [this]() { return pending_tasks_ == 0 && active_workers_ == 0; });
  return api::Status::Ok();
}

api::Result<ExecutorStats> ThreadPoolExecutor::QueryStats() const {
  std::lock_guard<std::mutex> lock(mu_);
  ExecutorStats out = stats_;
  out.queue_depth = tasks_.size();
  return api::Result<ExecutorStats>(out);
}

TaskId ThreadPoolExecutor::NextTaskIdLocked() { return next_task_id_++; }

void ThreadPoolExecutor::MarkTaskDone(TaskId id, bool executed, bool failed) {
  std::lock_guard<std::mutex> lock(mu_);
  typename std::unordered_map<TaskId, std::shared_ptr<TaskState> >::iterator it = states_.find(id);
  if (it == states_.end()) return;

  it->second->done = true;
  it->second->cv.notify_all();
  pending_ids_.erase(id);
  const bool canceled = it->second->canceled;

  done_ids_.push_back(id);
  while (done_ids_.size() > max_retained_states_) {
    const TaskId old_id = done_ids_.front();
    done_ids_.pop_front();
    typename std::unordered_map<TaskId, std::shared_ptr<TaskState> >::iterator old =
        states_.find(old_id);
    if (old != states_.end() && old->second->done) {
      states_.erase(old);
    }
  }

  if (canceled) return;
  if (failed) {
    ++stats_.failed;
  } else if (executed) {
    ++stats_.completed;
  }
}

void ThreadPoolExecutor::WorkerLoop() {
  for (;;) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lock(mu_);
      cv_.wait(lock, [this]() { return stopping_ || !tasks_.empty(); });
      if (stopping_ && tasks_.empty()) return;
      task = tasks_.front();
      tasks_.pop_front();
      ++active_workers_;
    }

    // Exceptions are already handled by the wrapper built in Post.
    task();

    {
      std::lock_guard<std::mutex> lock(mu_);
      --active_workers_;
      if (pending_tasks_ > 0) --pending_tasks_;
      stats_.queue_depth = tasks_.size();
      idle_cv_.notify_all();
    }
  }
}

#undef CK_STATUS

}  // namespace task
}  // namespace cachekit
