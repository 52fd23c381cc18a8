#include "cachekit/threading/async_reader_writer_lock.hpp"

#include <glog/logging.h>

#include <deque>
#include <mutex>
#include <vector>

#include "cachekit/api/lifecycle.hpp"

namespace cachekit {
namespace threading {

#define CK_STATUS(code, message, detail) \
  api::Status::FromModule((code), (message), api::ErrorModule::kThreading, (detail))

struct PendingRequest {
  std::uint64_t request_id = 0;
  bool exclusive = false;
  AsyncReaderWriterLock::GrantCallback callback;
  api::CancellationToken token;
  std::uint64_t registration = 0;
};

struct Grant {
  std::uint64_t ticket_id = 0;
  PendingRequest request;
};

struct LockState {
  LockState()
      : active_readers(0),
        writer_active(false),
        next_ticket_id(1),
        next_request_id(1),
        executor(NULL),
        dispose_promise(new std::promise<api::Status>()) {
    dispose_future = dispose_promise->get_future().share();
  }

  mutable std::mutex mu;
  std::deque<PendingRequest> pending;
  std::size_t active_readers;
  bool writer_active;
  std::uint64_t next_ticket_id;
  std::uint64_t next_request_id;
  task::IExecutor* executor;
  api::Lifecycle lifecycle;
  std::shared_ptr<std::promise<api::Status> > dispose_promise;
  std::shared_future<api::Status> dispose_future;
};

struct LockGrant {
  static LockTicket Make(const std::shared_ptr<LockState>& state, std::uint64_t id,
                         bool exclusive) {
    return LockTicket(state, id, exclusive);
  }
};

namespace {

api::Status DisposedStatus() {
  return CK_STATUS(api::StatusCode::kDisposed, "reader/writer lock has been disposed",
                   api::kDetailLockDisposed);
}

// Admits requests from the head of the queue. A writer at the head stops the scan.
void PumpLocked(LockState* state, std::vector<Grant>* grants) {
  while (!state->pending.empty()) {
    PendingRequest& head = state->pending.front();
    if (head.exclusive) {
      if (state->writer_active || state->active_readers > 0) return;
      state->writer_active = true;
    } else {
      if (state->writer_active) return;
      ++state->active_readers;
    }
    Grant grant;
    grant.ticket_id = state->next_ticket_id++;
    grant.request = head;
    state->pending.pop_front();
    grants->push_back(grant);
    if (grant.request.exclusive) return;
  }
}

void Invoke(const AsyncReaderWriterLock::GrantCallback& callback, api::Result<LockTicket> result) {
  try {
    callback(std::move(result));
  } catch (const std::exception& ex) {
    LOG(ERROR) << "lock grant callback threw: " << ex.what();
  }
}

void RunGrant(const std::shared_ptr<LockState>& state, const Grant& grant) {
  grant.request.token.Unregister(grant.request.registration);
  Invoke(grant.request.callback,
         api::Result<LockTicket>(
             LockGrant::Make(state, grant.ticket_id, grant.request.exclusive)));
}

// Grants made while releasing go through the executor so chains of waiting work do not
// recurse on the releasing thread.
void Dispatch(const std::shared_ptr<LockState>& state, const std::vector<Grant>& grants,
              bool from_release) {
  for (std::size_t i = 0; i < grants.size(); ++i) {
    const Grant grant = grants[i];
    if (!from_release || state->executor == NULL) {
      RunGrant(state, grant);
      continue;
    }
    api::Result<task::TaskId> posted = state->executor->Post([state, grant]() {
      RunGrant(state, grant);
    });
    if (!posted.ok()) {
      VLOG(1) << "lock grant runs inline: " << posted.status().ToString();
      RunGrant(state, grant);
    }
  }
}

void ReleaseTicket(const std::shared_ptr<LockState>& state, std::uint64_t id, bool exclusive) {
  std::vector<Grant> grants;
  {
    std::lock_guard<std::mutex> lock(state->mu);
    if (exclusive) {
      state->writer_active = false;
    } else if (state->active_readers > 0) {
      --state->active_readers;
    }
    PumpLocked(state.get(), &grants);
  }
  VLOG(2) << "lock ticket " << id << (exclusive ? " (exclusive)" : " (concurrent)")
          << " released";
  Dispatch(state, grants, true);
}

void CancelRequest(const std::shared_ptr<LockState>& state, std::uint64_t request_id) {
  std::vector<Grant> grants;
  PendingRequest canceled;
  bool found = false;
  {
    std::lock_guard<std::mutex> lock(state->mu);
    for (std::deque<PendingRequest>::iterator it = state->pending.begin();
         it != state->pending.end(); ++it) {
      if (it->request_id == request_id) {
        canceled = *it;
        state->pending.erase(it);
        found = true;
        break;
      }
    }
    if (!found) return;
    // A canceled writer may have been holding readers back.
    PumpLocked(state.get(), &grants);
  }
  Invoke(canceled.callback, api::Result<LockTicket>(LockCanceledStatus()));
  Dispatch(state, grants, true);
}

api::Status Enqueue(const std::shared_ptr<LockState>& state, bool exclusive,
                    const api::CancellationToken& token,
                    const AsyncReaderWriterLock::GrantCallback& callback) {
  std::vector<Grant> grants;
  std::uint64_t request_id = 0;
  bool still_pending = false;
  {
    std::lock_guard<std::mutex> lock(state->mu);
    PendingRequest request;
    request.request_id = state->next_request_id++;
    request.exclusive = exclusive;
    request.callback = callback;
    request.token = token;
    request_id = request.request_id;
    state->pending.push_back(request);
    PumpLocked(state.get(), &grants);
    still_pending = !state->pending.empty() && state->pending.back().request_id == request_id;
  }
  Dispatch(state, grants, false);

  if (!still_pending || !token.CanBeCanceled()) return api::Status::Ok();

  std::weak_ptr<LockState> weak = state;
  const std::uint64_t registration = token.Register([weak, request_id]() {
    std::shared_ptr<LockState> locked = weak.lock();
    if (locked) CancelRequest(locked, request_id);
  });
  bool keep = false;
  {
    std::lock_guard<std::mutex> lock(state->mu);
    for (std::deque<PendingRequest>::iterator it = state->pending.begin();
         it != state->pending.end(); ++it) {
      if (it->request_id == request_id) {
        it->registration = registration;
        keep = true;
        break;
      }
    }
  }
  if (!keep) token.Unregister(registration);
  return api::Status::Ok();
}

}  // namespace

api::Status LockCanceledStatus() {
  return CK_STATUS(api::StatusCode::kCanceled, "lock acquisition canceled",
                   api::kDetailLockCanceled);
}

LockTicket::LockTicket(LockTicket&& other)
    : state_(std::move(other.state_)), id_(other.id_), exclusive_(other.exclusive_) {
  other.state_.reset();
}

LockTicket& LockTicket::operator=(LockTicket&& other) {
  if (this != &other) {
    Release();
    state_ = std::move(other.state_);
    id_ = other.id_;
    exclusive_ = other.exclusive_;
    other.state_.reset();
  }
  return *this;
}

LockTicket::~LockTicket() { Release(); }

void LockTicket::Release() {
  if (state_ == NULL) return;
  std::shared_ptr<LockState> state;
  state.swap(state_);
  ReleaseTicket(state, id_, exclusive_);
}

AsyncReaderWriterLock::AsyncReaderWriterLock(task::IExecutor* executor)
    : state_(new LockState()) {
  state_->executor = executor != NULL ? executor : task::DefaultExecutor();
}

AsyncReaderWriterLock::~AsyncReaderWriterLock() {
  api::Status st = Dispose();
  if (!st.ok()) LOG(WARNING) << "reader/writer lock dispose: " << st.ToString();
}

std::future<api::Result<LockTicket> > AsyncReaderWriterLock::AcquireReaderLock(
    const api::CancellationToken& token) {
  std::shared_ptr<std::promise<api::Result<LockTicket> > > promise(
      new std::promise<api::Result<LockTicket> >());
  std::future<api::Result<LockTicket> > future = promise->get_future();
  api::Status st = AcquireAsync(LockLane::kConcurrent, token,
                                [promise](api::Result<LockTicket> granted) {
                                  promise->set_value(std::move(granted));
                                });
  if (!st.ok()) promise->set_value(api::Result<LockTicket>(st));
  return future;
}

std::future<api::Result<LockTicket> > AsyncReaderWriterLock::AcquireWriterLock(
    const api::CancellationToken& token) {
  std::shared_ptr<std::promise<api::Result<LockTicket> > > promise(
      new std::promise<api::Result<LockTicket> >());
  std::future<api::Result<LockTicket> > future = promise->get_future();
  api::Status st = AcquireAsync(LockLane::kExclusive, token,
                                [promise](api::Result<LockTicket> granted) {
                                  promise->set_value(std::move(granted));
                                });
  if (!st.ok()) promise->set_value(api::Result<LockTicket>(st));
  return future;
}

api::Status AsyncReaderWriterLock::AcquireAsync(LockLane lane, const api::CancellationToken& token,
                                                const GrantCallback& callback) {
  if (!callback) {
    return api::Status::FromModule(api::StatusCode::kInvalidArgument, "callback is empty",
                                   api::ErrorModule::kThreading);
  }
  if (!state_->lifecycle.IsActive()) return DisposedStatus();
  if (token.IsCancellationRequested()) return LockCanceledStatus();
  return Enqueue(state_, lane == LockLane::kExclusive, token, callback);
}

std::shared_future<api::Status> AsyncReaderWriterLock::DisposeAsync() {
  if (!state_->lifecycle.BeginDispose()) return state_->dispose_future;

  std::shared_ptr<LockState> state = state_;
  api::Status st = Enqueue(state, true, api::CancellationToken(),
                           [state](api::Result<LockTicket> granted) {
                             if (granted.ok()) granted.value().Release();
                             state->lifecycle.FinishDispose();
                             VLOG(1) << "reader/writer lock disposed";
                             state->dispose_promise->set_value(granted.status());
                           });
  if (!st.ok()) {
    state->lifecycle.FinishDispose();
    state->dispose_promise->set_value(st);
  }
  return state_->dispose_future;
}

api::Status AsyncReaderWriterLock::Dispose() { return DisposeAsync().get(); }

bool AsyncReaderWriterLock::IsDisposed() const { return state_->lifecycle.IsDisposed(); }

std::size_t AsyncReaderWriterLock::ActiveReaderCount() const {
  std::lock_guard<std::mutex> lock(state_->mu);
  return state_->active_readers;
}

bool AsyncReaderWriterLock::IsWriterActive() const {
  std::lock_guard<std::mutex> lock(state_->mu);
  return state_->writer_active;
}

std::size_t AsyncReaderWriterLock::PendingCount() const {
  std::lock_guard<std::mutex> lock(state_->mu);
  return state_->pending.size();
}

std::future<api::Status> AddExclusiveWork(AsyncReaderWriterLock& lock,
                                          const std::function<api::Status()>& work,
                                          const api::CancellationToken& token) {
  return RunUnderLock<api::Status>(lock, LockLane::kExclusive, work, token);
}

std::future<api::Status> AddConcurrentWork(AsyncReaderWriterLock& lock,
                                           const std::function<api::Status()>& work,
                                           const api::CancellationToken& token) {
  return RunUnderLock<api::Status>(lock, LockLane::kConcurrent, work, token);
}

#undef CK_STATUS

}  // namespace threading
}  // namespace cachekit
