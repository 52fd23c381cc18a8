#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <unordered_map>
#include <utility>
#include <vector>

#include "cachekit/api/cancellation.hpp"
#include "cachekit/api/status.hpp"
#include "cachekit/reactive/observable.hpp"
#include "cachekit/reactive/subject.hpp"

namespace cachekit {
namespace cache {

enum class DictionaryChangeType : std::uint8_t {
  kItemAdded = 0,
  kItemReplaced = 1,
  kItemRemoved = 2,
  kReset = 3
};

template <typename K, typename V>
struct DictionaryChange {
  DictionaryChangeType type = DictionaryChangeType::kReset;
  K key = K();
  V value = V();
  V old_value = V();
};

// Keyed store that reports every mutation on a change stream.
// Not internally synchronized: the owner must serialize mutations against each other and
// against reads. Count() alone may be read from any thread.
template <typename K, typename V, typename Hash = std::hash<K>, typename KeyEqual = std::equal_to<K> >
class ObservableDictionary {
 public:
  typedef DictionaryChange<K, V> Change;
  typedef std::unordered_map<K, V, Hash, KeyEqual> Map;

  // Scoped batch mode. While at least one guard is alive no change records are emitted.
  // When the last guard goes away the previous mode is restored and, if any guard asked
  // for it and something changed, a single kReset is emitted.
  class NotificationSuppression {
   public:
    NotificationSuppression() : owner_(NULL) {}
    NotificationSuppression(NotificationSuppression&& other) : owner_(other.owner_) {
      other.owner_ = NULL;
    }
    NotificationSuppression& operator=(NotificationSuppression&& other) {
      if (this != &other) {
        End();
        owner_ = other.owner_;
        other.owner_ = NULL;
      }
      return *this;
    }
    ~NotificationSuppression() { End(); }

    void End() {
      if (owner_ == NULL) return;
      ObservableDictionary* owner = owner_;
      owner_ = NULL;
      owner->EndSuppression();
    }

   private:
    friend class ObservableDictionary;
    explicit NotificationSuppression(ObservableDictionary* owner) : owner_(owner) {}
    NotificationSuppression(const NotificationSuppression&);
    NotificationSuppression& operator=(const NotificationSuppression&);

    ObservableDictionary* owner_;
  };

  explicit ObservableDictionary(task::IExecutor* notification_executor = NULL)
      : changes_(reactive::Subject<Change>::Create(notification_executor)),
        counts_(reactive::Subject<std::size_t>::Create(notification_executor)),
        count_(new std::atomic<std::size_t>(0)),
        reset_threshold_(0),
        suppress_depth_(0),
        signal_reset_(false),
        suppressed_changes_(false) {}

  ~ObservableDictionary() { Complete(); }

  api::Status Add(const K& key, const V& value) {
    if (map_.find(key) != map_.end()) return KeyExistsStatus();
    map_.insert(std::make_pair(key, value));
    Emit(DictionaryChangeType::kItemAdded, key, value, V());
    return api::Status::Ok();
  }

  // Stops at the first failure or cancellation; items added before that stay added.
  // More items than ResetThreshold() are reported as a single kReset.
  api::Status AddRange(const std::vector<std::pair<K, V> >& items,
                       const api::CancellationToken& token, std::size_t* added) {
    if (added != NULL) *added = 0;
    NotificationSuppression batch;
    if (reset_threshold_ > 0 && items.size() > reset_threshold_) {
      batch = SuppressChangeNotifications(true);
    }
    for (std::size_t i = 0; i < items.size(); ++i) {
      if (token.IsCancellationRequested()) return CanceledStatus();
      api::Status st = Add(items[i].first, items[i].second);
      if (!st.ok()) return st;
      if (added != NULL) ++*added;
    }
    return api::Status::Ok();
  }

  api::Status Replace(const K& key, const V& value, V* old_value) {
    typename Map::iterator it = map_.find(key);
    if (it == map_.end()) return KeyNotFoundStatus();
    V previous = it->second;
    it->second = value;
    if (old_value != NULL) *old_value = previous;
    Emit(DictionaryChangeType::kItemReplaced, key, value, previous);
    return api::Status::Ok();
  }

  // Returns true when the key was added, false when an existing value was replaced.
  bool AddOrReplace(const K& key, const V& value) {
    typename Map::iterator it = map_.find(key);
    if (it == map_.end()) {
      map_.insert(std::make_pair(key, value));
      Emit(DictionaryChangeType::kItemAdded, key, value, V());
      return true;
    }
    V previous = it->second;
    it->second = value;
    Emit(DictionaryChangeType::kItemReplaced, key, value, previous);
    return false;
  }

  api::Status Remove(const K& key, V* removed) {
    typename Map::iterator it = map_.find(key);
    if (it == map_.end()) return KeyNotFoundStatus();
    V previous = it->second;
    map_.erase(it);
    if (removed != NULL) *removed = previous;
    Emit(DictionaryChangeType::kItemRemoved, key, previous, V());
    return api::Status::Ok();
  }

  // Same partial-failure and threshold rules as AddRange.
  api::Status RemoveRange(const std::vector<K>& keys, const api::CancellationToken& token,
                          std::size_t* removed) {
    if (removed != NULL) *removed = 0;
    NotificationSuppression batch;
    if (reset_threshold_ > 0 && keys.size() > reset_threshold_) {
      batch = SuppressChangeNotifications(true);
    }
    for (std::size_t i = 0; i < keys.size(); ++i) {
      if (token.IsCancellationRequested()) return CanceledStatus();
      api::Status st = Remove(keys[i], NULL);
      if (!st.ok()) return st;
      if (removed != NULL) ++*removed;
    }
    return api::Status::Ok();
  }

  // Always reported as exactly one kReset.
  void Clear() {
    map_.clear();
    Emit(DictionaryChangeType::kReset, K(), V(), V());
  }

  const V* Find(const K& key) const {
    typename Map::const_iterator it = map_.find(key);
    return it == map_.end() ? NULL : &it->second;
  }

  bool ContainsKey(const K& key) const { return map_.find(key) != map_.end(); }

  std::size_t Count() const { return count_->load(std::memory_order_acquire); }

  std::vector<K> Keys() const {
    std::vector<K> keys;
    keys.reserve(map_.size());
    for (typename Map::const_iterator it = map_.begin(); it != map_.end(); ++it) {
      keys.push_back(it->first);
    }
    return keys;
  }

  NotificationSuppression SuppressChangeNotifications(bool signal_reset_when_finished = true) {
    ++suppress_depth_;
    if (signal_reset_when_finished) signal_reset_ = true;
    return NotificationSuppression(this);
  }

  bool IsTrackingChanges() const { return suppress_depth_ == 0; }

  // 0 disables the threshold.
  void SetResetThreshold(std::size_t threshold) { reset_threshold_ = threshold; }
  std::size_t ResetThreshold() const { return reset_threshold_; }

  reactive::Observable<Change> Changes() const { return reactive::Observable<Change>(changes_); }

  // Emits the current count on subscription, then every count change.
  reactive::Observable<std::size_t> CountChanges() const {
    std::shared_ptr<std::atomic<std::size_t> > count = count_;
    return reactive::Observable<std::size_t>(counts_).StartWith(
        [count]() { return count->load(std::memory_order_acquire); });
  }

  void Complete() {
    changes_->OnCompleted();
    counts_->OnCompleted();
  }

 private:
  ObservableDictionary(const ObservableDictionary&);
  ObservableDictionary& operator=(const ObservableDictionary&);

  static api::Status KeyExistsStatus() {
    return api::Status::FromModule(api::StatusCode::kAlreadyExists, "key already exists",
                                   api::ErrorModule::kCache, api::kDetailCacheKeyExists);
  }

  static api::Status KeyNotFoundStatus() {
    return api::Status::FromModule(api::StatusCode::kNotFound, "key not found",
                                   api::ErrorModule::kCache, api::kDetailCacheKeyNotFound);
  }

  static api::Status CanceledStatus() {
    return api::Status::FromModule(api::StatusCode::kCanceled, "range operation canceled",
                                   api::ErrorModule::kCache);
  }

  void Emit(DictionaryChangeType type, const K& key, const V& value, const V& old_value) {
    const std::size_t previous_count = count_->exchange(map_.size(), std::memory_order_acq_rel);
    if (suppress_depth_ > 0) {
      suppressed_changes_ = true;
      return;
    }
    Change change;
    change.type = type;
    change.key = key;
    change.value = value;
    change.old_value = old_value;
    changes_->OnNext(change);
    if (previous_count != map_.size()) counts_->OnNext(map_.size());
  }

  void EndSuppression() {
    if (suppress_depth_ == 0) return;
    if (--suppress_depth_ > 0) return;
    const bool emit_reset = signal_reset_ && suppressed_changes_;
    const bool changed = suppressed_changes_;
    signal_reset_ = false;
    suppressed_changes_ = false;
    if (emit_reset) changes_->OnNext(Change());
    if (changed) counts_->OnNext(map_.size());
  }

  Map map_;
  std::shared_ptr<reactive::Subject<Change> > changes_;
  std::shared_ptr<reactive::Subject<std::size_t> > counts_;
  std::shared_ptr<std::atomic<std::size_t> > count_;
  std::size_t reset_threshold_;
  std::size_t suppress_depth_;
  bool signal_reset_;
  bool suppressed_changes_;
};

}  // namespace cache
}  // namespace cachekit
