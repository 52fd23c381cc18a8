#pragma once

#include <functional>
#include <memory>

#include "cachekit/reactive/subject.hpp"

namespace cachekit {
namespace reactive {

// Read-only view over a Subject, optionally filtered and optionally prefixed with a
// snapshot value computed at subscription time.
template <typename T>
class Observable {
 public:
  typedef std::function<bool(const T&)> Predicate;
  typedef std::function<T()> Snapshot;

  Observable() {}
  explicit Observable(const std::shared_ptr<Subject<T> >& subject) : subject_(subject) {}

  Subscription Subscribe(const Observer<T>& observer) const {
    if (!subject_) return Subscription();
    Observer<T> effective = observer;
    if (predicate_) {
      const Predicate predicate = predicate_;
      const std::function<void(const T&)> next = observer.on_next;
      effective.on_next = [predicate, next](const T& value) {
        if (next && predicate(value)) next(value);
      };
    }
    if (snapshot_ && effective.on_next) {
      effective.on_next(snapshot_());
    }
    return subject_->Subscribe(effective);
  }

  Subscription Subscribe(const std::function<void(const T&)>& on_next) const {
    return Subscribe(MakeObserver<T>(on_next));
  }

  Observable<T> Where(const Predicate& predicate) const {
    Observable<T> out(*this);
    if (!predicate_) {
      out.predicate_ = predicate;
    } else {
      const Predicate first = predicate_;
      out.predicate_ = [first, predicate](const T& value) {
        return first(value) && predicate(value);
      };
    }
    return out;
  }

  Observable<T> StartWith(const Snapshot& snapshot) const {
    Observable<T> out(*this);
    out.snapshot_ = snapshot;
    return out;
  }

  bool valid() const { return static_cast<bool>(subject_); }

 private:
  std::shared_ptr<Subject<T> > subject_;
  Predicate predicate_;
  Snapshot snapshot_;
};

}  // namespace reactive
}  // namespace cachekit
