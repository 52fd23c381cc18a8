#pragma once

#include <concurrentqueue.h>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <string>
#include <utility>

#include "cachekit/api/version.hpp"
#include "cachekit/concurrent/i_queue.hpp"

namespace cachekit {
namespace concurrent {

#define CK_STATUS(code, message) api::Status::FromModule((code), (message), api::ErrorModule::kMemory)

// Lock-free MPMC queue over moodycamel::ConcurrentQueue with an explicit size counter.
template <typename T>
class MoodycamelQueue : public IQueue<T> {
 public:
  explicit MoodycamelQueue(std::size_t initial_capacity = 0)
      : queue_(initial_capacity == 0 ? 32 : initial_capacity), size_(0) {}

  virtual ~MoodycamelQueue() {}

  virtual const char* Name() const { return "cachekit.concurrent.moodycamel_queue"; }
  virtual std::uint32_t ApiVersion() const { return api::kApiVersion; }

  virtual api::Status TryPush(const T& value) {
    try {
      if (!queue_.enqueue(value)) {
        return CK_STATUS(api::StatusCode::kWouldBlock, "queue is unavailable");
      }
      size_.fetch_add(1, std::memory_order_acq_rel);
      return api::Status::Ok();
    } catch (const std::exception& ex) {
      return CK_STATUS(api::StatusCode::kInternalError, std::string("queue push failed: ") + ex.what());
    }
  }

  virtual api::Status TryPushMove(T&& value) {
    try {
      if (!queue_.enqueue(std::move(value))) {
        return CK_STATUS(api::StatusCode::kWouldBlock, "queue is unavailable");
      }
      size_.fetch_add(1, std::memory_order_acq_rel);
      return api::Status::Ok();
    } catch (const std::exception& ex) {
      return CK_STATUS(api::StatusCode::kInternalError, std::string("queue push failed: ") + ex.what());
    }
  }

  virtual api::Result<T> TryPop() {
    try {
      T value;
      if (!queue_.try_dequeue(value)) {
        return api::Result<T>(CK_STATUS(api::StatusCode::kWouldBlock, "queue is empty"));
      }
      size_.fetch_sub(1, std::memory_order_acq_rel);
      return api::Result<T>(std::move(value));
    } catch (const std::exception& ex) {
      return api::Result<T>(
          CK_STATUS(api::StatusCode::kInternalError, std::string("queue pop failed: ") + ex.what()));
    }
  }

  virtual std::size_t ApproxSize() const {
    const std::int64_t size = size_.load(std::memory_order_acquire);
    return size < 0 ? 0 : static_cast<std::size_t>(size);
  }

  virtual bool IsEmpty() const { return ApproxSize() == 0; }

  virtual api::Result<std::size_t> Clear() {
    try {
      std::size_t dropped = 0;
      T value;
      while (queue_.try_dequeue(value)) {
        size_.fetch_sub(1, std::memory_order_acq_rel);
        value = T();
        ++dropped;
      }
      return api::Result<std::size_t>(dropped);
    } catch (const std::exception& ex) {
      return api::Result<std::size_t>(
          CK_STATUS(api::StatusCode::kInternalError, std::string("queue clear failed: ") + ex.what()));
    }
  }

 private:
  moodycamel::ConcurrentQueue<T> queue_;
  std::atomic<std::int64_t> size_;
};

#undef CK_STATUS

}  // namespace concurrent
}  // namespace cachekit
