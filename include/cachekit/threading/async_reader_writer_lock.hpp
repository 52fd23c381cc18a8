#pragma once

#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <utility>

#include "cachekit/api/cancellation.hpp"
#include "cachekit/api/export.hpp"
#include "cachekit/api/status.hpp"
#include "cachekit/task/iexecutor.hpp"

namespace cachekit {
namespace threading {

enum class LockLane : std::uint8_t {
  // Any number of holders, never together with an exclusive holder.
  kConcurrent = 0,
  // A single holder, never together with anyone else.
  kExclusive = 1
};

struct LockState;

// Proof of lock admission. Releasing it (explicitly or by destruction) is the only way the
// lock is freed. Move-only; releasing twice is a no-op.
class CACHEKIT_API LockTicket {
 public:
  LockTicket() : id_(0), exclusive_(false) {}
  LockTicket(LockTicket&& other);
  LockTicket& operator=(LockTicket&& other);
  ~LockTicket();

  std::uint64_t id() const { return id_; }
  bool exclusive() const { return exclusive_; }
  bool valid() const { return state_ != NULL; }

  void Release();

 private:
  friend struct LockGrant;
  LockTicket(const std::shared_ptr<LockState>& state, std::uint64_t id, bool exclusive)
      : state_(state), id_(id), exclusive_(exclusive) {}
  LockTicket(const LockTicket&);
  LockTicket& operator=(const LockTicket&);

  std::shared_ptr<LockState> state_;
  std::uint64_t id_;
  bool exclusive_;
};

// Asynchronous multiple-reader / single-writer lock with one FIFO admission queue.
// A queued writer holds back readers queued after it. Grants that become possible when a
// ticket is released are dispatched on the lock's executor; grants available immediately
// run on the acquiring thread.
// Not re-entrant: acquiring again from inside held work can deadlock.
class CACHEKIT_API AsyncReaderWriterLock {
 public:
  typedef std::function<void(api::Result<LockTicket>)> GrantCallback;

  // executor == NULL uses task::DefaultExecutor().
  explicit AsyncReaderWriterLock(task::IExecutor* executor = NULL);

  // Disposes and waits for outstanding tickets to be released.
  ~AsyncReaderWriterLock();

  std::future<api::Result<LockTicket> > AcquireReaderLock(
      const api::CancellationToken& token = api::CancellationToken());
  std::future<api::Result<LockTicket> > AcquireWriterLock(
      const api::CancellationToken& token = api::CancellationToken());

  // Queues a request and invokes callback once it is admitted, or with kCanceled if the token
  // fires first, or with kDisposed if the lock was torn down before admission.
  // Returns kDisposed / kCanceled without queuing (and without calling callback) when the
  // request is rejected up front.
  api::Status AcquireAsync(LockLane lane, const api::CancellationToken& token,
                           const GrantCallback& callback);

  // Performs one final exclusive acquisition, then marks the lock disposed. New requests are
  // rejected as soon as disposal starts.
  std::shared_future<api::Status> DisposeAsync();
  api::Status Dispose();

  bool IsDisposed() const;
  std::size_t ActiveReaderCount() const;
  bool IsWriterActive() const;
  std::size_t PendingCount() const;

 private:
  AsyncReaderWriterLock(const AsyncReaderWriterLock&);
  AsyncReaderWriterLock& operator=(const AsyncReaderWriterLock&);

  std::shared_ptr<LockState> state_;
};

CACHEKIT_API api::Status LockCanceledStatus();

template <typename R>
R InvokeGuarded(const std::function<R()>& work) {
  try {
    return work();
  } catch (const std::exception& ex) {
    return R(api::Status::FromModule(api::StatusCode::kInternalError,
                                     std::string("work threw: ") + ex.what(),
                                     api::ErrorModule::kThreading));
  } catch (...) {
    return R(api::Status::FromModule(api::StatusCode::kInternalError,
                                     "work threw a non-standard exception",
                                     api::ErrorModule::kThreading));
  }
}

// Runs work while holding the given lane. R must be constructible from api::Status.
// executor == NULL runs work on whichever thread the grant arrives on.
// The token is checked before queuing, while queued and once more before work starts.
template <typename R>
std::future<R> RunUnderLock(AsyncReaderWriterLock& lock, LockLane lane,
                            const std::function<R()>& work,
                            const api::CancellationToken& token = api::CancellationToken(),
                            task::IExecutor* executor = NULL) {
  std::shared_ptr<std::promise<R> > promise(new std::promise<R>());
  std::future<R> future = promise->get_future();
  api::Status st = lock.AcquireAsync(
      lane, token, [promise, work, token, executor](api::Result<LockTicket> granted) {
        if (!granted.ok()) {
          promise->set_value(R(granted.status()));
          return;
        }
        std::shared_ptr<LockTicket> ticket(new LockTicket(std::move(granted.value())));
        std::function<void()> body = [promise, work, token, ticket]() {
          if (token.IsCancellationRequested()) {
            ticket->Release();
            promise->set_value(R(LockCanceledStatus()));
            return;
          }
          R result = InvokeGuarded<R>(work);
          ticket->Release();
          promise->set_value(std::move(result));
        };
        if (executor == NULL) {
          body();
          return;
        }
        api::Result<task::TaskId> posted = executor->Post(body);
        if (!posted.ok()) body();
      });
  if (!st.ok()) promise->set_value(R(st));
  return future;
}

CACHEKIT_API std::future<api::Status> AddExclusiveWork(
    AsyncReaderWriterLock& lock, const std::function<api::Status()>& work,
    const api::CancellationToken& token = api::CancellationToken());

CACHEKIT_API std::future<api::Status> AddConcurrentWork(
    AsyncReaderWriterLock& lock, const std::function<api::Status()>& work,
    const api::CancellationToken& token = api::CancellationToken());

}  // namespace threading
}  // namespace cachekit
