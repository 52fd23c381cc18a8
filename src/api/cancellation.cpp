#include "cachekit/api/cancellation.hpp"

#include <atomic>
#include <map>
#include <mutex>
#include <vector>

namespace cachekit {
namespace api {

struct CancellationState {
  CancellationState() : canceled(false), next_id(1) {}

  std::atomic<bool> canceled;
  std::mutex mu;
  std::uint64_t next_id;
  std::map<std::uint64_t, std::function<void()> > callbacks;
};

bool CancellationToken::IsCancellationRequested() const {
  return state_ != NULL && state_->canceled.load(std::memory_order_acquire);
}

std::uint64_t CancellationToken::Register(const std::function<void()>& callback) const {
  if (state_ == NULL || !callback) return 0;
  {
    std::lock_guard<std::mutex> lock(state_->mu);
    if (!state_->canceled.load(std::memory_order_acquire)) {
      const std::uint64_t id = state_->next_id++;
      state_->callbacks[id] = callback;
      return id;
    }
  }
  callback();
  return 0;
}

void CancellationToken::Unregister(std::uint64_t registration_id) const {
  if (state_ == NULL || registration_id == 0) return;
  std::lock_guard<std::mutex> lock(state_->mu);
  state_->callbacks.erase(registration_id);
}

CancellationSource::CancellationSource() : state_(new CancellationState()) {}

void CancellationSource::Cancel() {
  std::vector<std::function<void()> > to_run;
  {
    std::lock_guard<std::mutex> lock(state_->mu);
    if (state_->canceled.load(std::memory_order_acquire)) return;
    state_->canceled.store(true, std::memory_order_release);
    for (std::map<std::uint64_t, std::function<void()> >::iterator it =
             state_->callbacks.begin();
         it != state_->callbacks.end(); ++it) {
      to_run.push_back(it->second);
    }
    state_->callbacks.clear();
  }
  for (std::size_t i = 0; i < to_run.size(); ++i) {
    to_run[i]();
  }
}

bool CancellationSource::IsCancellationRequested() const {
  return state_->canceled.load(std::memory_order_acquire);
}

CancellationToken CancellationSource::Token() const { return CancellationToken(state_); }

}  // namespace api
}  // namespace cachekit
