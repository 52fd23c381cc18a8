#include "cachekit/task/serial_executor.hpp"

#include <glog/logging.h>

#include <exception>

namespace cachekit {
namespace task {

SerialExecutor::SerialExecutor(IExecutor* target) : target_(target), draining_(false) {}

api::Status SerialExecutor::Post(const std::function<void()>& work) {
  if (!work) {
    return api::Status::FromModule(api::StatusCode::kInvalidArgument, "work is empty",
                                   api::ErrorModule::kTask, 0x0001);
  }
  {
    std::lock_guard<std::mutex> lock(mu_);
    queue_.push_back(work);
    if (draining_) return api::Status::Ok();
    draining_ = true;
  }

  if (target_ == NULL) {
    Drain();
    return api::Status::Ok();
  }

  std::shared_ptr<SerialExecutor> self = shared_from_this();
  api::Result<TaskId> posted = target_->Post([self]() { self->Drain(); });
  if (!posted.ok()) {
    // Target refused (stopping or full); drain on this thread so nothing is lost.
    LOG(WARNING) << "serial executor fallback to inline drain: " << posted.status().ToString();
    Drain();
  }
  return api::Status::Ok();
}

std::size_t SerialExecutor::PendingCount() const {
  std::lock_guard<std::mutex> lock(mu_);
  return queue_.size();
}

void SerialExecutor::Drain() {
  for (;;) {
    std::function<void()> work;
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (queue_.empty()) {
        draining_ = false;
        return;
      }
      work = queue_.front();
      queue_.pop_front();
    }
    try {
      work();
    } catch (const std::exception& ex) {
      LOG(ERROR) << "serial executor work threw: " << ex.what();
    }
  }
}

}  // namespace task
}  // namespace cachekit
