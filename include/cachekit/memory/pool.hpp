#pragma once

#include <glog/logging.h>

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "cachekit/api/cancellation.hpp"
#include "cachekit/api/lifecycle.hpp"
#include "cachekit/api/status.hpp"
#include "cachekit/concurrent/moodycamel_queue.hpp"
#include "cachekit/task/iexecutor.hpp"

namespace cachekit {
namespace memory {

#define CK_STATUS(code, message, detail) \
  api::Status::FromModule((code), (message), api::ErrorModule::kMemory, (detail))

enum class PooledValueAcquisitionMode : std::uint8_t {
  // Empty pool yields an ok result holding a null ticket.
  kAvailableInstanceOrDefaultValue = 0,
  // Empty pool parks the acquisition until an instance is released or added. Parked
  // acquisitions are served oldest first and hold no executor thread.
  kAvailableInstanceOrWaitForNextOne = 1,
  // Empty pool builds a new instance, growing the pool by one.
  kAvailableInstanceOrCreateNewOne = 2
};

namespace detail {
template <typename T>
class PoolCore;
}  // namespace detail

// Ticket for a value checked out of a Pool. Exactly one of ReleaseBackToPool and
// DetachFromPool may succeed; afterwards Value() is no longer accessible.
// A ticket destroyed while still active hands its value back to the pool if the pool is
// still active, otherwise the value is destroyed with the ticket.
template <typename T>
class Pooled {
 public:
  ~Pooled();

  std::uint64_t id() const { return id_; }

  api::Result<T*> Value() {
    const int state = state_.load(std::memory_order_acquire);
    if (state != kActive) return api::Result<T*>(TerminalStateStatus(state));
    return api::Result<T*>(&value_);
  }

  bool HasBeenReleasedBackToPool() const {
    return state_.load(std::memory_order_acquire) == kReleased;
  }
  bool HasBeenDetachedFromPool() const {
    return state_.load(std::memory_order_acquire) == kDetached;
  }

  api::Status ReleaseBackToPool();
  api::Result<T> DetachFromPool();

 private:
  friend class detail::PoolCore<T>;

  enum State { kActive = 0, kReleased = 1, kDetached = 2 };

  Pooled(std::uint64_t id, T&& value, const std::weak_ptr<detail::PoolCore<T> >& owner)
      : id_(id), value_(std::move(value)), owner_(owner), state_(kActive) {}
  Pooled(const Pooled&);
  Pooled& operator=(const Pooled&);

  static api::Status TerminalStateStatus(int state) {
    if (state == kReleased) {
      return CK_STATUS(api::StatusCode::kOutOfRange, "pooled value has already been released",
                       api::kDetailPoolTicketReleased);
    }
    return CK_STATUS(api::StatusCode::kOutOfRange, "pooled value has already been detached",
                     api::kDetailPoolTicketDetached);
  }

  // Active -> target. Returns the previous state.
  int TryTransition(int target) {
    int expected = kActive;
    if (state_.compare_exchange_strong(expected, target, std::memory_order_acq_rel)) {
      return kActive;
    }
    return expected;
  }

  std::uint64_t id_;
  T value_;
  std::weak_ptr<detail::PoolCore<T> > owner_;
  std::atomic<int> state_;
};

namespace detail {

template <typename T>
class PoolCore : public std::enable_shared_from_this<PoolCore<T> > {
 public:
  typedef std::function<T(const api::CancellationToken&)> Builder;
  typedef std::shared_ptr<Pooled<T> > PooledPtr;

  explicit PoolCore(const Builder& builder) : builder_(builder), total_(0), next_ticket_id_(1) {}

  api::Status Build(std::size_t count, const api::CancellationToken& token) {
    if (!builder_) {
      return api::Status::FromModule(api::StatusCode::kInvalidArgument, "pool builder is empty",
                                     api::ErrorModule::kMemory);
    }
    for (std::size_t i = 0; i < count; ++i) {
      api::Status st = CheckUsable(token);
      if (!st.ok()) return st;
      api::Result<T> built = Invoke(token);
      if (!built.ok()) return built.status();
      st = AddIdle(std::move(built.value()));
      if (!st.ok()) return st;
      total_.fetch_add(1, std::memory_order_acq_rel);
    }
    return api::Status::Ok();
  }

  // Hands the value to the oldest parked acquisition, or queues it as idle.
  api::Status AddIdle(T&& value) {
    WaiterPtr waiter;
    std::uint64_t registration = 0;
    {
      std::lock_guard<std::mutex> lock(wait_mu_);
      if (waiters_.empty()) return instances_.TryPushMove(std::move(value));
      waiter = waiters_.front();
      waiters_.pop_front();
      waiter->queued = false;
      registration = waiter->registration;
    }
    waiter->token.Unregister(registration);
    waiter->promise.set_value(api::Result<PooledPtr>(MakeTicket(std::move(value))));
    return api::Status::Ok();
  }

  api::Status Adopt(T&& value) {
    api::Status st = AddIdle(std::move(value));
    if (st.ok()) total_.fetch_add(1, std::memory_order_acq_rel);
    return st;
  }

  api::Status Shrink(int count) {
    if (!lifecycle_.IsActive()) return DisposedStatus();
    if (count < 0) {
      return CK_STATUS(api::StatusCode::kOutOfRange, "count must not be negative",
                       api::kDetailPoolNegativeCount);
    }
    if (static_cast<std::size_t>(count) > instances_.ApproxSize()) {
      return CK_STATUS(api::StatusCode::kOutOfRange,
                       "cannot remove more instances than are currently available",
                       api::kDetailPoolCountExceedsAvailable);
    }
    for (int i = 0; i < count; ++i) {
      api::Result<T> popped = instances_.TryPop();
      if (!popped.ok()) {
        // Another caller acquired concurrently; report what could not be removed.
        return CK_STATUS(api::StatusCode::kOutOfRange,
                         "available instances were taken while shrinking",
                         api::kDetailPoolCountExceedsAvailable);
      }
      total_.fetch_sub(1, std::memory_order_acq_rel);
    }
    return api::Status::Ok();
  }

  // Non-waiting modes only; kAvailableInstanceOrWaitForNextOne goes through WaitForNext.
  api::Result<PooledPtr> Acquire(PooledValueAcquisitionMode mode,
                                 const api::CancellationToken& token) {
    api::Status st = CheckUsable(token);
    if (!st.ok()) return api::Result<PooledPtr>(st);

    api::Result<T> popped = instances_.TryPop();
    if (popped.ok()) return api::Result<PooledPtr>(MakeTicket(std::move(popped.value())));
    if (mode != PooledValueAcquisitionMode::kAvailableInstanceOrCreateNewOne) {
      return api::Result<PooledPtr>(PooledPtr());
    }
    if (!builder_) {
      return api::Result<PooledPtr>(api::Status::FromModule(
          api::StatusCode::kInvalidArgument, "pool builder is empty", api::ErrorModule::kMemory));
    }
    api::Result<T> built = Invoke(token);
    if (!built.ok()) return api::Result<PooledPtr>(built.status());
    total_.fetch_add(1, std::memory_order_acq_rel);
    return api::Result<PooledPtr>(MakeTicket(std::move(built.value())));
  }

  // Resolves at once when an idle instance exists, otherwise parks a waiter that is
  // completed by the next AddIdle, by cancellation (kCanceled) or by Dispose (kDisposed).
  std::future<api::Result<PooledPtr> > WaitForNext(const api::CancellationToken& token) {
    WaiterPtr waiter(new Waiter(token));
    std::future<api::Result<PooledPtr> > future = waiter->promise.get_future();
    api::Status st = CheckUsable(token);
    if (!st.ok()) {
      waiter->promise.set_value(api::Result<PooledPtr>(st));
      return future;
    }
    {
      std::lock_guard<std::mutex> lock(wait_mu_);
      if (!lifecycle_.IsActive()) {
        waiter->promise.set_value(api::Result<PooledPtr>(DisposedStatus()));
        return future;
      }
      api::Result<T> popped = instances_.TryPop();
      if (popped.ok()) {
        waiter->promise.set_value(
            api::Result<PooledPtr>(MakeTicket(std::move(popped.value()))));
        return future;
      }
      waiter->queued = true;
      waiters_.push_back(waiter);
    }

    std::weak_ptr<PoolCore<T> > weak_core = this->shared_from_this();
    std::weak_ptr<Waiter> weak_waiter = waiter;
    const std::uint64_t registration = token.Register([weak_core, weak_waiter]() {
      std::shared_ptr<PoolCore<T> > core = weak_core.lock();
      WaiterPtr parked = weak_waiter.lock();
      if (core && parked) core->CancelWaiter(parked);
    });
    bool still_queued = false;
    {
      std::lock_guard<std::mutex> lock(wait_mu_);
      still_queued = waiter->queued;
      if (still_queued) waiter->registration = registration;
    }
    if (!still_queued) token.Unregister(registration);
    return future;
  }

  std::size_t WaitingCount() const {
    std::lock_guard<std::mutex> lock(wait_mu_);
    return waiters_.size();
  }

  api::Status Release(Pooled<T>& ticket) {
    api::Status st = CheckOwnership(ticket);
    if (!st.ok()) return st;
    const int previous = ticket.TryTransition(Pooled<T>::kReleased);
    if (previous != Pooled<T>::kActive) return Pooled<T>::TerminalStateStatus(previous);
    return AddIdle(std::move(ticket.value_));
  }

  api::Result<T> Detach(Pooled<T>& ticket) {
    api::Status st = CheckOwnership(ticket);
    if (!st.ok()) return api::Result<T>(st);
    const int previous = ticket.TryTransition(Pooled<T>::kDetached);
    if (previous != Pooled<T>::kActive) {
      return api::Result<T>(Pooled<T>::TerminalStateStatus(previous));
    }
    total_.fetch_sub(1, std::memory_order_acq_rel);
    return api::Result<T>(std::move(ticket.value_));
  }

  // Called from the ticket destructor; the ticket is already marked released.
  void Reclaim(T&& value) {
    if (!lifecycle_.IsActive()) return;
    api::Status st = AddIdle(std::move(value));
    if (!st.ok()) {
      LOG(WARNING) << "pooled value could not be returned: " << st.ToString();
      total_.fetch_sub(1, std::memory_order_acq_rel);
    }
  }

  void Dispose() {
    if (!lifecycle_.BeginDispose()) return;
    std::deque<WaiterPtr> parked;
    {
      std::lock_guard<std::mutex> lock(wait_mu_);
      parked.swap(waiters_);
      for (std::size_t i = 0; i < parked.size(); ++i) parked[i]->queued = false;
    }
    for (std::size_t i = 0; i < parked.size(); ++i) {
      parked[i]->token.Unregister(parked[i]->registration);
      parked[i]->promise.set_value(api::Result<PooledPtr>(DisposedStatus()));
    }
    api::Result<std::size_t> dropped = instances_.Clear();
    if (!dropped.ok()) {
      LOG(WARNING) << "pool drain failed: " << dropped.status().ToString();
    } else {
      VLOG(1) << "pool disposed, destroyed " << dropped.value() << " idle instances";
    }
    lifecycle_.FinishDispose();
  }

  bool IsActive() const { return lifecycle_.IsActive(); }
  bool IsDisposed() const { return lifecycle_.IsDisposed(); }
  std::size_t Available() const { return instances_.ApproxSize(); }
  std::size_t Total() const {
    const std::int64_t total = total_.load(std::memory_order_acquire);
    return total < 0 ? 0 : static_cast<std::size_t>(total);
  }

  static api::Status DisposedStatus() {
    return api::Status::FromModule(api::StatusCode::kDisposed, "pool has been disposed",
                                   api::ErrorModule::kMemory);
  }

 private:
  api::Status CheckUsable(const api::CancellationToken& token) const {
    if (!lifecycle_.IsActive()) return DisposedStatus();
    if (token.IsCancellationRequested()) {
      return api::Status::FromModule(api::StatusCode::kCanceled, "pool operation canceled",
                                     api::ErrorModule::kMemory);
    }
    return api::Status::Ok();
  }

  api::Status CheckOwnership(const Pooled<T>& ticket) const {
    if (!lifecycle_.IsActive()) return DisposedStatus();
    std::shared_ptr<PoolCore<T> > owner = ticket.owner_.lock();
    if (owner.get() != this) {
      return CK_STATUS(api::StatusCode::kOutOfRange, "pooled value belongs to another pool",
                       api::kDetailPoolForeignTicket);
    }
    return api::Status::Ok();
  }

  api::Result<T> Invoke(const api::CancellationToken& token) {
    try {
      return api::Result<T>(builder_(token));
    } catch (const std::exception& ex) {
      return api::Result<T>(api::Status::FromModule(
          api::StatusCode::kInternalError, std::string("pool builder threw: ") + ex.what(),
          api::ErrorModule::kMemory));
    } catch (...) {
      return api::Result<T>(api::Status::FromModule(api::StatusCode::kInternalError,
                                                    "pool builder threw a non-standard exception",
                                                    api::ErrorModule::kMemory));
    }
  }

  PooledPtr MakeTicket(T&& value) {
    const std::uint64_t id = next_ticket_id_.fetch_add(1, std::memory_order_relaxed);
    return PooledPtr(new Pooled<T>(id, std::move(value), this->shared_from_this()));
  }

  struct Waiter {
    explicit Waiter(const api::CancellationToken& t) : token(t), registration(0), queued(false) {}
    std::promise<api::Result<PooledPtr> > promise;
    api::CancellationToken token;
    // Both guarded by wait_mu_.
    std::uint64_t registration;
    bool queued;
  };
  typedef std::shared_ptr<Waiter> WaiterPtr;

  void CancelWaiter(const WaiterPtr& waiter) {
    {
      std::lock_guard<std::mutex> lock(wait_mu_);
      if (!waiter->queued) return;
      waiters_.erase(std::find(waiters_.begin(), waiters_.end(), waiter));
      waiter->queued = false;
    }
    waiter->promise.set_value(api::Result<PooledPtr>(api::Status::FromModule(
        api::StatusCode::kCanceled, "pool operation canceled", api::ErrorModule::kMemory)));
  }

  Builder builder_;
  concurrent::MoodycamelQueue<T> instances_;
  std::atomic<std::int64_t> total_;
  std::atomic<std::uint64_t> next_ticket_id_;
  api::Lifecycle lifecycle_;
  mutable std::mutex wait_mu_;
  std::deque<WaiterPtr> waiters_;
};

}  // namespace detail

template <typename T>
Pooled<T>::~Pooled() {
  if (TryTransition(kReleased) != kActive) return;
  std::shared_ptr<detail::PoolCore<T> > owner = owner_.lock();
  if (owner) owner->Reclaim(std::move(value_));
}

template <typename T>
api::Status Pooled<T>::ReleaseBackToPool() {
  std::shared_ptr<detail::PoolCore<T> > owner = owner_.lock();
  if (!owner) return detail::PoolCore<T>::DisposedStatus();
  return owner->Release(*this);
}

template <typename T>
api::Result<T> Pooled<T>::DetachFromPool() {
  std::shared_ptr<detail::PoolCore<T> > owner = owner_.lock();
  if (!owner) return api::Result<T>(detail::PoolCore<T>::DisposedStatus());
  return owner->Detach(*this);
}

// Generic object pool. Idle instances live in a lock-free queue; checked-out instances are
// represented by Pooled<T> tickets. T must be default constructible and movable.
// Asynchronous operations run on the injected executor (DefaultExecutor() when NULL).
template <typename T>
class Pool {
 public:
  typedef typename detail::PoolCore<T>::Builder Builder;
  typedef std::shared_ptr<Pooled<T> > PooledPtr;

  Pool(const Builder& builder, std::size_t initial_count, task::IExecutor* executor = NULL)
      : core_(new detail::PoolCore<T>(builder)),
        executor_(executor != NULL ? executor : task::DefaultExecutor()) {
    construction_status_ = core_->Build(initial_count, api::CancellationToken::None());
    if (!construction_status_.ok()) {
      LOG(WARNING) << "pool prefill stopped at " << core_->Total() << "/" << initial_count
                   << ": " << construction_status_.ToString();
    }
  }

  Pool(const Builder& builder, std::vector<T> initial_instances, task::IExecutor* executor = NULL)
      : core_(new detail::PoolCore<T>(builder)),
        executor_(executor != NULL ? executor : task::DefaultExecutor()) {
    for (std::size_t i = 0; i < initial_instances.size(); ++i) {
      api::Status st = core_->Adopt(std::move(initial_instances[i]));
      if (!st.ok()) {
        construction_status_ = st;
        break;
      }
    }
  }

  ~Pool() { Dispose(); }

  // Status of the initial fill performed by the constructor.
  const api::Status& construction_status() const { return construction_status_; }

  std::future<api::Status> IncreasePoolSizeAsync(
      int count, const api::CancellationToken& token = api::CancellationToken()) {
    if (count < 0) {
      return Ready(CK_STATUS(api::StatusCode::kOutOfRange, "count must not be negative",
                             api::kDetailPoolNegativeCount));
    }
    std::shared_ptr<detail::PoolCore<T> > core = core_;
    return Run<api::Status>([core, count, token]() {
      return core->Build(static_cast<std::size_t>(count), token);
    });
  }

  std::future<api::Status> DecreaseAvailablePoolSizeAsync(
      int count, const api::CancellationToken& token = api::CancellationToken()) {
    std::shared_ptr<detail::PoolCore<T> > core = core_;
    return Run<api::Status>([core, count, token]() {
      if (token.IsCancellationRequested()) {
        return api::Status::FromModule(api::StatusCode::kCanceled, "pool operation canceled",
                                       api::ErrorModule::kMemory);
      }
      return core->Shrink(count);
    });
  }

  std::future<api::Result<PooledPtr> > AcquirePooledValueAsync(
      PooledValueAcquisitionMode mode = PooledValueAcquisitionMode::kAvailableInstanceOrDefaultValue,
      const api::CancellationToken& token = api::CancellationToken()) {
    if (mode == PooledValueAcquisitionMode::kAvailableInstanceOrWaitForNextOne) {
      return core_->WaitForNext(token);
    }
    std::shared_ptr<detail::PoolCore<T> > core = core_;
    return Run<api::Result<PooledPtr> >([core, mode, token]() {
      return core->Acquire(mode, token);
    });
  }

  api::Status ReleasePooledValue(const PooledPtr& pooled) {
    if (!pooled) {
      return api::Status::FromModule(api::StatusCode::kInvalidArgument, "pooled value is null",
                                     api::ErrorModule::kMemory);
    }
    return core_->Release(*pooled);
  }

  api::Result<T> DetachPooledValue(const PooledPtr& pooled) {
    if (!pooled) {
      return api::Result<T>(api::Status::FromModule(
          api::StatusCode::kInvalidArgument, "pooled value is null", api::ErrorModule::kMemory));
    }
    return core_->Detach(*pooled);
  }

  api::Result<std::size_t> AvailableInstancesCount() const {
    if (!core_->IsActive()) return api::Result<std::size_t>(detail::PoolCore<T>::DisposedStatus());
    return api::Result<std::size_t>(core_->Available());
  }

  api::Result<std::size_t> TotalInstancesCount() const {
    if (!core_->IsActive()) return api::Result<std::size_t>(detail::PoolCore<T>::DisposedStatus());
    return api::Result<std::size_t>(core_->Total());
  }

  // Acquisitions parked in kAvailableInstanceOrWaitForNextOne mode.
  std::size_t PendingAcquisitionsCount() const { return core_->WaitingCount(); }

  bool IsDisposed() const { return core_->IsDisposed(); }

  void Dispose() { core_->Dispose(); }

 private:
  Pool(const Pool&);
  Pool& operator=(const Pool&);

  template <typename R>
  static std::future<R> Ready(const R& value) {
    std::promise<R> promise;
    promise.set_value(value);
    return promise.get_future();
  }

  template <typename R>
  std::future<R> Run(const std::function<R()>& work) {
    std::shared_ptr<std::promise<R> > promise(new std::promise<R>());
    std::future<R> future = promise->get_future();
    api::Result<task::TaskId> posted = executor_->Post([promise, work]() {
      promise->set_value(work());
    });
    if (!posted.ok()) promise->set_value(R(posted.status()));
    return future;
  }

  std::shared_ptr<detail::PoolCore<T> > core_;
  task::IExecutor* executor_;
  api::Status construction_status_;
};

#undef CK_STATUS

}  // namespace memory
}  // namespace cachekit
