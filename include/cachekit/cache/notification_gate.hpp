#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>

#include "cachekit/cache/cache_change.hpp"
#include "cachekit/reactive/subject.hpp"

namespace cachekit {
namespace cache {

enum class SuppressionKind : std::uint8_t {
  // Holds back everything published on Changes().
  kChanges = 0,
  // Holds back Resets() only.
  kResets = 1
};

// Scope returned by the Suppress* calls. Move-only. Ending it, explicitly or by destruction,
// resumes delivery once no other scope of the same kind is alive.
class NotificationSuppression {
 public:
  NotificationSuppression() {}
  NotificationSuppression(NotificationSuppression&& other) : end_(std::move(other.end_)) {
    other.end_ = nullptr;
  }
  NotificationSuppression& operator=(NotificationSuppression&& other) {
    if (this != &other) {
      End();
      end_ = std::move(other.end_);
      other.end_ = nullptr;
    }
    return *this;
  }
  ~NotificationSuppression() { End(); }

  bool active() const { return static_cast<bool>(end_); }

  void End() {
    if (!end_) return;
    std::function<void()> end;
    end.swap(end_);
    end();
  }

 private:
  template <typename K, typename V>
  friend class NotificationGate;

  explicit NotificationSuppression(const std::function<void()>& end) : end_(end) {}
  NotificationSuppression(const NotificationSuppression&);
  NotificationSuppression& operator=(const NotificationSuppression&);

  std::function<void()> end_;
};

// Sits between the cache's store and its public change and reset streams. Thread-safe.
// Records are published outside the gate mutex, so a reset that closes a suppression may
// interleave with records from a concurrent writer.
template <typename K, typename V>
class NotificationGate : public std::enable_shared_from_this<NotificationGate<K, V> > {
 public:
  typedef CacheChange<K, V> Change;

  NotificationGate(const std::shared_ptr<reactive::Subject<Change> >& changes,
                   const std::shared_ptr<reactive::Subject<Change> >& resets)
      : changes_(changes), resets_(resets) {}

  void Publish(const Change& change) {
    if (Admit(&changes_state_)) changes_->OnNext(change);
    if (change.type() == CacheChangeType::kReset) PublishReset();
  }

  NotificationSuppression Suppress(SuppressionKind kind, bool signal_reset_when_finished) {
    State* state = StateOf(kind);
    {
      std::lock_guard<std::mutex> lock(mu_);
      ++state->depth;
      if (signal_reset_when_finished) state->signal_reset = true;
    }
    std::shared_ptr<NotificationGate> self = this->shared_from_this();
    return NotificationSuppression([self, kind]() { self->EndSuppression(kind); });
  }

  bool IsTracking(SuppressionKind kind) const {
    std::lock_guard<std::mutex> lock(mu_);
    return StateOf(kind)->depth == 0;
  }

 private:
  struct State {
    State() : depth(0), signal_reset(false), dropped(false) {}
    std::size_t depth;
    bool signal_reset;
    bool dropped;
  };

  NotificationGate(const NotificationGate&);
  NotificationGate& operator=(const NotificationGate&);

  State* StateOf(SuppressionKind kind) {
    return kind == SuppressionKind::kChanges ? &changes_state_ : &resets_state_;
  }
  const State* StateOf(SuppressionKind kind) const {
    return kind == SuppressionKind::kChanges ? &changes_state_ : &resets_state_;
  }

  bool Admit(State* state) {
    std::lock_guard<std::mutex> lock(mu_);
    if (state->depth == 0) return true;
    state->dropped = true;
    return false;
  }

  void PublishReset() {
    if (Admit(&resets_state_)) resets_->OnNext(Change::Reset());
  }

  void EndSuppression(SuppressionKind kind) {
    State* state = StateOf(kind);
    bool emit_reset = false;
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (state->depth == 0 || --state->depth > 0) return;
      emit_reset = state->signal_reset && state->dropped;
      state->signal_reset = false;
      state->dropped = false;
    }
    if (!emit_reset) return;
    if (kind == SuppressionKind::kChanges) {
      Publish(Change::Reset());
    } else {
      PublishReset();
    }
  }

  std::shared_ptr<reactive::Subject<Change> > changes_;
  std::shared_ptr<reactive::Subject<Change> > resets_;
  mutable std::mutex mu_;
  State changes_state_;
  State resets_state_;
};

}  // namespace cache
}  // namespace cachekit
