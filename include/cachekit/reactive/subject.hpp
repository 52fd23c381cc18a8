#pragma once

#include <glog/logging.h>

#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "cachekit/api/status.hpp"
#include "cachekit/task/iexecutor.hpp"
#include "cachekit/task/serial_executor.hpp"

namespace cachekit {
namespace reactive {

template <typename T>
struct Observer {
  std::function<void(const T&)> on_next;
  std::function<void(const api::Status&)> on_error;
  std::function<void()> on_completed;
};

template <typename T>
Observer<T> MakeObserver(const std::function<void(const T&)>& on_next,
                         const std::function<void(const api::Status&)>& on_error =
                             std::function<void(const api::Status&)>(),
                         const std::function<void()>& on_completed = std::function<void()>()) {
  Observer<T> observer;
  observer.on_next = on_next;
  observer.on_error = on_error;
  observer.on_completed = on_completed;
  return observer;
}

// Move-only handle; destroying it unsubscribes.
class Subscription {
 public:
  Subscription() {}
  explicit Subscription(const std::function<void()>& unsubscribe) : unsubscribe_(unsubscribe) {}
  Subscription(Subscription&& other) : unsubscribe_(std::move(other.unsubscribe_)) {
    other.unsubscribe_ = std::function<void()>();
  }
  Subscription& operator=(Subscription&& other) {
    if (this != &other) {
      Unsubscribe();
      unsubscribe_ = std::move(other.unsubscribe_);
      other.unsubscribe_ = std::function<void()>();
    }
    return *this;
  }
  ~Subscription() { Unsubscribe(); }

  void Unsubscribe() {
    if (unsubscribe_) {
      std::function<void()> fn = unsubscribe_;
      unsubscribe_ = std::function<void()>();
      fn();
    }
  }

  bool active() const { return static_cast<bool>(unsubscribe_); }

 private:
  Subscription(const Subscription&);
  Subscription& operator=(const Subscription&);

  std::function<void()> unsubscribe_;
};

// Hot multicast subject: observers only see values emitted after they subscribed.
// With a delivery executor every observer gets its own SerialExecutor, so per-observer
// order matches emission order. Without one, delivery runs on the emitting thread.
template <typename T>
class Subject : public std::enable_shared_from_this<Subject<T> > {
 public:
  typedef std::function<void(const api::Status&)> ErrorHandler;

  static std::shared_ptr<Subject<T> > Create(task::IExecutor* delivery_executor = NULL) {
    return std::shared_ptr<Subject<T> >(new Subject<T>(delivery_executor));
  }

  // Invoked when an observer callback throws.
  void SetUnhandledErrorHandler(const ErrorHandler& handler) {
    std::lock_guard<std::mutex> lock(mu_);
    unhandled_ = handler;
  }

  Subscription Subscribe(const Observer<T>& observer) {
    std::shared_ptr<Slot> slot(new Slot());
    slot->observer = observer;
    slot->active.store(true);
    if (executor_ != NULL) {
      slot->strand.reset(new task::SerialExecutor(executor_));
    }

    bool terminated = false;
    api::Status terminal;
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (stopped_) {
        terminated = true;
        terminal = terminal_;
      } else {
        slot->id = next_id_++;
        slots_.push_back(slot);
      }
    }
    if (terminated) {
      if (terminal.ok()) {
        Deliver(slot, [slot]() {
          if (slot->observer.on_completed) slot->observer.on_completed();
        });
      } else {
        Deliver(slot, [slot, terminal]() {
          if (slot->observer.on_error) slot->observer.on_error(terminal);
        });
      }
      return Subscription();
    }

    std::weak_ptr<Subject<T> > weak = this->shared_from_this();
    const std::uint64_t id = slot->id;
    return Subscription([weak, id]() {
      std::shared_ptr<Subject<T> > self = weak.lock();
      if (self) self->Remove(id);
    });
  }

  void OnNext(const T& value) {
    std::vector<std::shared_ptr<Slot> > snapshot = Snapshot();
    for (std::size_t i = 0; i < snapshot.size(); ++i) {
      std::shared_ptr<Slot> slot = snapshot[i];
      Deliver(slot, [slot, value]() {
        if (slot->observer.on_next) slot->observer.on_next(value);
      });
    }
  }

  void OnError(const api::Status& error) {
    std::vector<std::shared_ptr<Slot> > snapshot = Stop(error);
    for (std::size_t i = 0; i < snapshot.size(); ++i) {
      std::shared_ptr<Slot> slot = snapshot[i];
      Deliver(slot, [slot, error]() {
        if (slot->observer.on_error) slot->observer.on_error(error);
      });
    }
  }

  void OnCompleted() {
    std::vector<std::shared_ptr<Slot> > snapshot = Stop(api::Status::Ok());
    for (std::size_t i = 0; i < snapshot.size(); ++i) {
      std::shared_ptr<Slot> slot = snapshot[i];
      Deliver(slot, [slot]() {
        if (slot->observer.on_completed) slot->observer.on_completed();
      });
    }
  }

  std::size_t ObserverCount() const {
    std::lock_guard<std::mutex> lock(mu_);
    return slots_.size();
  }

  bool IsStopped() const {
    std::lock_guard<std::mutex> lock(mu_);
    return stopped_;
  }

 private:
  struct Slot {
    Slot() : id(0), active(false) {}
    std::uint64_t id;
    Observer<T> observer;
    std::shared_ptr<task::SerialExecutor> strand;
    std::atomic<bool> active;
  };

  explicit Subject(task::IExecutor* delivery_executor)
      : executor_(delivery_executor), next_id_(1), stopped_(false) {}

  std::vector<std::shared_ptr<Slot> > Snapshot() const {
    std::lock_guard<std::mutex> lock(mu_);
    return slots_;
  }

  std::vector<std::shared_ptr<Slot> > Stop(const api::Status& terminal) {
    std::lock_guard<std::mutex> lock(mu_);
    if (stopped_) return std::vector<std::shared_ptr<Slot> >();
    stopped_ = true;
    terminal_ = terminal;
    std::vector<std::shared_ptr<Slot> > out;
    out.swap(slots_);
    return out;
  }

  void Remove(std::uint64_t id) {
    std::lock_guard<std::mutex> lock(mu_);
    for (typename std::vector<std::shared_ptr<Slot> >::iterator it = slots_.begin();
         it != slots_.end(); ++it) {
      if ((*it)->id == id) {
        (*it)->active.store(false);
        slots_.erase(it);
        return;
      }
    }
  }

  void Deliver(const std::shared_ptr<Slot>& slot, const std::function<void()>& call) {
    std::shared_ptr<Subject<T> > self = this->shared_from_this();
    std::function<void()> guarded = [self, slot, call]() { self->Invoke(slot, call); };
    if (slot->strand) {
      api::Status st = slot->strand->Post(guarded);
      if (!st.ok()) LOG(ERROR) << "notification dropped: " << st.ToString();
      return;
    }
    guarded();
  }

  void Invoke(const std::shared_ptr<Slot>& slot, const std::function<void()>& call) {
    // Removed observers stop receiving values that were still queued for them.
    if (slot->id != 0 && !slot->active.load()) return;
    try {
      call();
    } catch (const std::exception& ex) {
      ReportObserverFailure(std::string("observer threw: ") + ex.what());
    } catch (...) {
      ReportObserverFailure("observer threw a non-standard exception");
    }
  }

  void ReportObserverFailure(const std::string& message) {
    LOG(ERROR) << message;
    ErrorHandler handler;
    {
      std::lock_guard<std::mutex> lock(mu_);
      handler = unhandled_;
    }
    if (handler) {
      handler(api::Status::FromModule(api::StatusCode::kInternalError, message,
                                      api::ErrorModule::kReactive));
    }
  }

  task::IExecutor* executor_;
  mutable std::mutex mu_;
  std::vector<std::shared_ptr<Slot> > slots_;
  std::uint64_t next_id_;
  bool stopped_;
  api::Status terminal_;
  ErrorHandler unhandled_;
};

}  // namespace reactive
}  // namespace cachekit
