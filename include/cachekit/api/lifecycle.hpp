#pragma once

#include <atomic>
#include <cstdint>

namespace cachekit {
namespace api {

enum class LifecycleState : std::uint8_t { kActive = 0, kDisposing = 1, kDisposed = 2 };

// One-way Active -> Disposing -> Disposed state shared by pools, locks and caches.
class Lifecycle {
 public:
  Lifecycle() : state_(LifecycleState::kActive) {}

  LifecycleState state() const { return state_.load(std::memory_order_acquire); }
  bool IsActive() const { return state() == LifecycleState::kActive; }
  bool IsDisposed() const { return state() == LifecycleState::kDisposed; }

  // Returns true for exactly one caller: the one that moved the state out of kActive.
  bool BeginDispose() {
    LifecycleState expected = LifecycleState::kActive;
    return state_.compare_exchange_strong(expected, LifecycleState::kDisposing,
                                          std::memory_order_acq_rel);
  }

  void FinishDispose() { state_.store(LifecycleState::kDisposed, std::memory_order_release); }

 private:
  Lifecycle(const Lifecycle&);
  Lifecycle& operator=(const Lifecycle&);

  std::atomic<LifecycleState> state_;
};

}  // namespace api
}  // namespace cachekit
