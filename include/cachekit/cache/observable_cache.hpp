#pragma once

#include <glog/logging.h>

#include <atomic>
#include <cstddef>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "cachekit/api/cancellation.hpp"
#include "cachekit/api/lifecycle.hpp"
#include "cachekit/api/status.hpp"
#include "cachekit/cache/cache_change.hpp"
#include "cachekit/cache/cache_types.hpp"
#include "cachekit/cache/cached_element.hpp"
#include "cachekit/cache/expiration_scheduler.hpp"
#include "cachekit/cache/notification_gate.hpp"
#include "cachekit/cache/observable_dictionary.hpp"
#include "cachekit/config/cache_config.hpp"
#include "cachekit/reactive/observable.hpp"
#include "cachekit/reactive/subject.hpp"
#include "cachekit/task/iexecutor.hpp"
#include "cachekit/threading/async_reader_writer_lock.hpp"

namespace cachekit {
namespace cache {

#define CK_STATUS(code, message, detail) \
  api::Status::FromModule((code), (message), api::ErrorModule::kCache, (detail))

// In-memory key/value cache with per-entry expiration and a change stream.
//
// Mutations run on the exclusive lane of an AsyncReaderWriterLock, reads on the concurrent
// lane, so readers proceed in parallel and writers are serialized in arrival order.
// Expired entries are handled by a background scheduler that goes through the same
// exclusive lane.
//
// Every operation returns a future and accepts an optional cancellation token and an
// optional executor that runs the work once the lock is granted (NULL uses the worker
// executor given at construction, and if that is NULL too the work runs on the granting
// thread).
//
// Change notifications are published synchronously with the mutation unless a notification
// executor is configured. Observers must not wait on cache operations from inside a
// synchronous notification. Changes() and Resets() can be held back by suppression scopes;
// see SuppressChangeNotifications and SuppressResetNotifications.
template <typename K, typename V, typename Hash = std::hash<K>,
          typename KeyEqual = std::equal_to<K> >
class ObservableCache {
 public:
  typedef CachedElement<K, V> Element;
  typedef CacheChange<K, V> Change;
  typedef std::function<V(const K&)> SingleKeyUpdater;
  typedef std::function<std::vector<std::pair<K, V> >(const std::vector<K>&)>
      MultipleKeysUpdater;
  typedef std::function<V(const K&)> ValueProducer;

  explicit ObservableCache(const config::CacheOptions& options = config::CacheOptions(),
                           const SingleKeyUpdater& single_key_updater = SingleKeyUpdater(),
                           const MultipleKeysUpdater& multiple_keys_updater =
                               MultipleKeysUpdater(),
                           task::IExecutor* worker_executor = NULL,
                           task::IExecutor* notification_executor = NULL)
      : options_(options),
        single_key_updater_(single_key_updater),
        multiple_keys_updater_(multiple_keys_updater),
        worker_executor_(worker_executor),
        notification_executor_(notification_executor != NULL || !options.notify_on_executor
                                   ? notification_executor
                                   : task::DefaultExecutor()),
        store_(new Store()),
        changes_(reactive::Subject<Change>::Create(notification_executor_)),
        resets_(reactive::Subject<Change>::Create(notification_executor_)),
        gate_(new NotificationGate<K, V>(changes_, resets_)),
        reset_threshold_(options.reset_threshold),
        errors_(reactive::Subject<api::Status>::Create(notification_executor_)),
        counts_(reactive::Subject<std::size_t>::Create(notification_executor_)),
        scheduler_([this](const std::vector<ExpiredEntry<K> >& batch) { OnExpired(batch); },
                   options.expiration_batch_window) {
    store_->SetResetThreshold(options_.reset_threshold);

    std::shared_ptr<reactive::Subject<api::Status> > errors = errors_;
    changes_->SetUnhandledErrorHandler([errors](const api::Status& st) { errors->OnNext(st); });
    resets_->SetUnhandledErrorHandler([errors](const api::Status& st) { errors->OnNext(st); });
    counts_->SetUnhandledErrorHandler([errors](const api::Status& st) { errors->OnNext(st); });

    std::shared_ptr<NotificationGate<K, V> > gate = gate_;
    store_subscription_ = store_->Changes().Subscribe(
        [gate](const typename Store::Change& change) { gate->Publish(Translate(change)); });
    std::shared_ptr<reactive::Subject<std::size_t> > counts = counts_;
    count_subscription_ = store_->CountChanges().Subscribe(
        [counts](const std::size_t& count) { counts->OnNext(count); });
  }

  ~ObservableCache() {
    api::Status st = Dispose();
    if (!st.ok()) LOG(WARNING) << "observable cache dispose: " << st.ToString();
  }

  // ---- writer lane ----

  std::future<api::Status> Add(const K& key, const V& value,
                               const api::CancellationToken& token = api::CancellationToken(),
                               task::IExecutor* executor = NULL) {
    return Add(key, value, options_.default_expiry, ExpirationType::kRemove, token, executor);
  }

  std::future<api::Status> Add(const K& key, const V& value, Duration expiry,
                               ExpirationType type = ExpirationType::kRemove,
                               const api::CancellationToken& token = api::CancellationToken(),
                               task::IExecutor* executor = NULL) {
    return RunLocked<api::Status>(threading::LockLane::kExclusive, [this, key, value, expiry,
                                                                    type]() {
      api::Result<Element> created = NewElement(key, value, expiry, type);
      if (!created.ok()) return created.status();
      api::Status st = store_->Add(key, created.value());
      if (st.ok()) ScheduleExpiry(created.value());
      return st;
    }, token, executor);
  }

  // Stops at the first key that is already present or at cancellation. Items added before
  // that stay in the cache.
  std::future<api::Status> AddRange(const std::vector<std::pair<K, V> >& items,
                                    const api::CancellationToken& token =
                                        api::CancellationToken(),
                                    task::IExecutor* executor = NULL) {
    return AddRange(items, options_.default_expiry, ExpirationType::kRemove, token, executor);
  }

  std::future<api::Status> AddRange(const std::vector<std::pair<K, V> >& items, Duration expiry,
                                    ExpirationType type = ExpirationType::kRemove,
                                    const api::CancellationToken& token =
                                        api::CancellationToken(),
                                    task::IExecutor* executor = NULL) {
    return RunLocked<api::Status>(threading::LockLane::kExclusive, [this, items, expiry, type,
                                                                    token]() {
      std::vector<std::pair<K, Element> > elements;
      elements.reserve(items.size());
      for (std::size_t i = 0; i < items.size(); ++i) {
        api::Result<Element> created = NewElement(items[i].first, items[i].second, expiry, type);
        if (!created.ok()) return created.status();
        elements.push_back(std::make_pair(items[i].first, created.value()));
      }
      std::size_t added = 0;
      api::Status st = store_->AddRange(elements, token, &added);
      for (std::size_t i = 0; i < added; ++i) ScheduleExpiry(elements[i].second);
      return st;
    }, token, executor);
  }

  std::future<api::Status> AddOrUpdate(const K& key, const V& value,
                                       const api::CancellationToken& token =
                                           api::CancellationToken(),
                                       task::IExecutor* executor = NULL) {
    return AddOrUpdate(key, value, options_.default_expiry, ExpirationType::kRemove, token,
                       executor);
  }

  // A present key gets a fresh element: new value, new expiry.
  std::future<api::Status> AddOrUpdate(const K& key, const V& value, Duration expiry,
                                       ExpirationType type = ExpirationType::kRemove,
                                       const api::CancellationToken& token =
                                           api::CancellationToken(),
                                       task::IExecutor* executor = NULL) {
    return RunLocked<api::Status>(threading::LockLane::kExclusive, [this, key, value, expiry,
                                                                    type]() {
      api::Result<Element> created = NewElement(key, value, expiry, type);
      if (!created.ok()) return created.status();
      store_->AddOrReplace(key, created.value());
      ScheduleExpiry(created.value());
      return api::Status::Ok();
    }, token, executor);
  }

  std::future<api::Status> Remove(const K& key,
                                  const api::CancellationToken& token = api::CancellationToken(),
                                  task::IExecutor* executor = NULL) {
    return RunLocked<api::Status>(threading::LockLane::kExclusive, [this, key]() {
      api::Status st = store_->Remove(key, NULL);
      if (st.ok()) scheduler_.Unschedule(key);
      return st;
    }, token, executor);
  }

  // Stops at the first missing key or at cancellation. Keys removed before that stay removed.
  std::future<api::Status> RemoveRange(const std::vector<K>& keys,
                                       const api::CancellationToken& token =
                                           api::CancellationToken(),
                                       task::IExecutor* executor = NULL) {
    return RunLocked<api::Status>(threading::LockLane::kExclusive, [this, keys, token]() {
      std::size_t removed = 0;
      api::Status st = store_->RemoveRange(keys, token, &removed);
      for (std::size_t i = 0; i < removed; ++i) scheduler_.Unschedule(keys[i]);
      return st;
    }, token, executor);
  }

  std::future<api::Status> Clear(const api::CancellationToken& token = api::CancellationToken(),
                                 task::IExecutor* executor = NULL) {
    return RunLocked<api::Status>(threading::LockLane::kExclusive, [this]() {
      store_->Clear();
      scheduler_.UnscheduleAll();
      return api::Status::Ok();
    }, token, executor);
  }

  std::future<api::Result<V> > GetOrAdd(const K& key, const ValueProducer& producer,
                                         const api::CancellationToken& token =
                                             api::CancellationToken(),
                                         task::IExecutor* executor = NULL) {
    return GetOrAdd(key, producer, options_.default_expiry, ExpirationType::kRemove, token,
                    executor);
  }

  // The producer runs under the exclusive lane and only when the key is absent.
  std::future<api::Result<V> > GetOrAdd(const K& key, const ValueProducer& producer,
                                         Duration expiry,
                                         ExpirationType type = ExpirationType::kRemove,
                                         const api::CancellationToken& token =
                                             api::CancellationToken(),
                                         task::IExecutor* executor = NULL) {
    if (!producer) return Ready(api::Result<V>(NullArgumentStatus("producer")));
    return RunLocked<api::Result<V> >(threading::LockLane::kExclusive, [this, key, producer,
                                                                        expiry, type]() {
      const Element* existing = store_->Find(key);
      if (existing != NULL) return api::Result<V>(existing->value());
      if (type == ExpirationType::kUpdate && !HasUpdater()) {
        return api::Result<V>(NoUpdaterStatus());
      }
      V produced;
      api::Status st = Produce(producer, key, &produced);
      if (!st.ok()) return api::Result<V>(st);
      api::Result<Element> created = NewElement(key, produced, expiry, type);
      if (!created.ok()) return api::Result<V>(created.status());
      st = store_->Add(key, created.value());
      if (!st.ok()) return api::Result<V>(st);
      ScheduleExpiry(created.value());
      return api::Result<V>(produced);
    }, token, executor);
  }

  std::future<api::Result<bool> > TryAdd(const K& key, const V& value,
                                         const api::CancellationToken& token =
                                             api::CancellationToken(),
                                         task::IExecutor* executor = NULL) {
    return TryAdd(key, value, options_.default_expiry, ExpirationType::kRemove, token, executor);
  }

  // false when the key is already present.
  std::future<api::Result<bool> > TryAdd(const K& key, const V& value, Duration expiry,
                                         ExpirationType type = ExpirationType::kRemove,
                                         const api::CancellationToken& token =
                                             api::CancellationToken(),
                                         task::IExecutor* executor = NULL) {
    return RunLocked<api::Result<bool> >(threading::LockLane::kExclusive, [this, key, value,
                                                                           expiry, type]() {
      if (store_->ContainsKey(key)) return api::Result<bool>(false);
      api::Result<Element> created = NewElement(key, value, expiry, type);
      if (!created.ok()) return api::Result<bool>(created.status());
      api::Status st = store_->Add(key, created.value());
      if (!st.ok()) return api::Result<bool>(st);
      ScheduleExpiry(created.value());
      return api::Result<bool>(true);
    }, token, executor);
  }

  // false when the key is absent.
  std::future<api::Result<bool> > TryRemove(const K& key,
                                            const api::CancellationToken& token =
                                                api::CancellationToken(),
                                            task::IExecutor* executor = NULL) {
    return RunLocked<api::Result<bool> >(threading::LockLane::kExclusive, [this, key]() {
      if (!store_->ContainsKey(key)) return api::Result<bool>(false);
      api::Status st = store_->Remove(key, NULL);
      if (!st.ok()) return api::Result<bool>(st);
      scheduler_.Unschedule(key);
      return api::Result<bool>(true);
    }, token, executor);
  }

  // Replaces the value and keeps the expiry instant. false when the key is absent.
  std::future<api::Result<bool> > TryUpdate(const K& key, const V& value,
                                            const api::CancellationToken& token =
                                                api::CancellationToken(),
                                            task::IExecutor* executor = NULL) {
    return RunLocked<api::Result<bool> >(threading::LockLane::kExclusive, [this, key, value]() {
      const Element* existing = store_->Find(key);
      if (existing == NULL) return api::Result<bool>(false);
      api::Status st = ReplaceValue(*existing, value);
      if (!st.ok()) return api::Result<bool>(st);
      return api::Result<bool>(true);
    }, token, executor);
  }

  // Same as TryUpdate, but an absent key fails with kNotFound.
  std::future<api::Status> Update(const K& key, const V& value,
                                  const api::CancellationToken& token = api::CancellationToken(),
                                  task::IExecutor* executor = NULL) {
    return RunLocked<api::Status>(threading::LockLane::kExclusive, [this, key, value]() {
      const Element* existing = store_->Find(key);
      if (existing == NULL) return KeyNotFoundStatus();
      return ReplaceValue(*existing, value);
    }, token, executor);
  }

  // Restarts the entry's expiry with a new duration. The value and expiration type stay.
  std::future<api::Status> UpdateExpiration(const K& key, Duration expiry,
                                            const api::CancellationToken& token =
                                                api::CancellationToken(),
                                            task::IExecutor* executor = NULL) {
    return RunLocked<api::Status>(threading::LockLane::kExclusive, [this, key, expiry]() {
      return RestartExpiry(key, expiry, false, ExpirationType::kRemove);
    }, token, executor);
  }

  // Same, and the entry expires with the given type from now on.
  std::future<api::Status> UpdateExpiration(const K& key, Duration expiry, ExpirationType type,
                                            const api::CancellationToken& token =
                                                api::CancellationToken(),
                                            task::IExecutor* executor = NULL) {
    return RunLocked<api::Status>(threading::LockLane::kExclusive, [this, key, expiry, type]() {
      return RestartExpiry(key, expiry, true, type);
    }, token, executor);
  }

  // Stops at the first missing key or at cancellation; keys updated before that keep their
  // new expiry. More keys than the reset threshold are reported as a single reset.
  std::future<api::Status> UpdateExpiration(const std::vector<K>& keys, Duration expiry,
                                            const api::CancellationToken& token =
                                                api::CancellationToken(),
                                            task::IExecutor* executor = NULL) {
    return RunLocked<api::Status>(threading::LockLane::kExclusive, [this, keys, expiry, token]() {
      return RestartExpiryRange(keys, expiry, false, ExpirationType::kRemove, token);
    }, token, executor);
  }

  std::future<api::Status> UpdateExpiration(const std::vector<K>& keys, Duration expiry,
                                            ExpirationType type,
                                            const api::CancellationToken& token =
                                                api::CancellationToken(),
                                            task::IExecutor* executor = NULL) {
    return RunLocked<api::Status>(threading::LockLane::kExclusive, [this, keys, expiry, type,
                                                                    token]() {
      return RestartExpiryRange(keys, expiry, true, type, token);
    }, token, executor);
  }

  // Range operations touching more items than this report one reset. 0 disables.
  std::future<api::Status> SetResetThreshold(std::size_t threshold,
                                             const api::CancellationToken& token =
                                                 api::CancellationToken(),
                                             task::IExecutor* executor = NULL) {
    return RunLocked<api::Status>(threading::LockLane::kExclusive, [this, threshold]() {
      store_->SetResetThreshold(threshold);
      reset_threshold_.store(threshold, std::memory_order_release);
      return api::Status::Ok();
    }, token, executor);
  }

  std::size_t ResetThreshold() const { return reset_threshold_.load(std::memory_order_acquire); }

  // ---- reader lane ----

  std::future<api::Result<V> > Get(const K& key,
                                   const api::CancellationToken& token = api::CancellationToken(),
                                   task::IExecutor* executor = NULL) {
    return RunLocked<api::Result<V> >(threading::LockLane::kConcurrent, [this, key]() {
      const Element* existing = store_->Find(key);
      if (existing == NULL) return api::Result<V>(KeyNotFoundStatus());
      return api::Result<V>(existing->value());
    }, token, executor);
  }

  // Pairs in input order. Fails with kNotFound if any key is absent.
  std::future<api::Result<std::vector<std::pair<K, V> > > > Get(
      const std::vector<K>& keys, const api::CancellationToken& token = api::CancellationToken(),
      task::IExecutor* executor = NULL) {
    typedef api::Result<std::vector<std::pair<K, V> > > Out;
    return RunLocked<Out>(threading::LockLane::kConcurrent, [this, keys, token]() {
      std::vector<std::pair<K, V> > found;
      found.reserve(keys.size());
      for (std::size_t i = 0; i < keys.size(); ++i) {
        if (token.IsCancellationRequested()) return Out(threading::LockCanceledStatus());
        const Element* existing = store_->Find(keys[i]);
        if (existing == NULL) return Out(KeyNotFoundStatus());
        found.push_back(std::make_pair(keys[i], existing->value()));
      }
      return Out(found);
    }, token, executor);
  }

  std::future<api::Result<bool> > Contains(const K& key,
                                           const api::CancellationToken& token =
                                               api::CancellationToken(),
                                           task::IExecutor* executor = NULL) {
    return RunLocked<api::Result<bool> >(threading::LockLane::kConcurrent, [this, key]() {
      return api::Result<bool>(store_->ContainsKey(key));
    }, token, executor);
  }

  // An empty key list is trivially contained.
  std::future<api::Result<bool> > ContainsAll(const std::vector<K>& keys,
                                              const api::CancellationToken& token =
                                                  api::CancellationToken(),
                                              task::IExecutor* executor = NULL) {
    return RunLocked<api::Result<bool> >(threading::LockLane::kConcurrent, [this, keys]() {
      for (std::size_t i = 0; i < keys.size(); ++i) {
        if (!store_->ContainsKey(keys[i])) return api::Result<bool>(false);
      }
      return api::Result<bool>(true);
    }, token, executor);
  }

  // The subset of keys that are present, in input order.
  std::future<api::Result<std::vector<K> > > ContainsWhich(
      const std::vector<K>& keys, const api::CancellationToken& token = api::CancellationToken(),
      task::IExecutor* executor = NULL) {
    return RunLocked<api::Result<std::vector<K> > >(threading::LockLane::kConcurrent,
                                                    [this, keys]() {
      std::vector<K> present;
      for (std::size_t i = 0; i < keys.size(); ++i) {
        if (store_->ContainsKey(keys[i])) present.push_back(keys[i]);
      }
      return api::Result<std::vector<K> >(present);
    }, token, executor);
  }

  // TimePoint::max() for entries that never expire.
  std::future<api::Result<TimePoint> > ExpiresAt(const K& key,
                                                 const api::CancellationToken& token =
                                                     api::CancellationToken(),
                                                 task::IExecutor* executor = NULL) {
    return RunLocked<api::Result<TimePoint> >(threading::LockLane::kConcurrent, [this, key]() {
      const Element* existing = store_->Find(key);
      if (existing == NULL) return api::Result<TimePoint>(KeyNotFoundStatus());
      return api::Result<TimePoint>(existing->expires_at());
    }, token, executor);
  }

  // kNoExpiry for entries that never expire, zero once expired.
  std::future<api::Result<Duration> > ExpiresIn(const K& key,
                                                const api::CancellationToken& token =
                                                    api::CancellationToken(),
                                                task::IExecutor* executor = NULL) {
    return RunLocked<api::Result<Duration> >(threading::LockLane::kConcurrent, [this, key]() {
      const Element* existing = store_->Find(key);
      if (existing == NULL) return api::Result<Duration>(KeyNotFoundStatus());
      return api::Result<Duration>(existing->ExpiresIn(Clock::now()));
    }, token, executor);
  }

  std::future<api::Result<std::size_t> > Count(const api::CancellationToken& token =
                                                   api::CancellationToken(),
                                               task::IExecutor* executor = NULL) {
    return RunLocked<api::Result<std::size_t> >(threading::LockLane::kConcurrent, [this]() {
      return api::Result<std::size_t>(store_->Count());
    }, token, executor);
  }

  // Lock-free snapshot of the entry count.
  std::size_t CurrentCount() const { return store_->Count(); }

  // ---- streams ----

  reactive::Observable<Change> Changes() const { return reactive::Observable<Change>(changes_); }

  reactive::Observable<Change> ItemExpirations() const {
    return Changes().Where(
        [](const Change& change) { return change.type() == CacheChangeType::kItemExpired; });
  }

  // Current count on subscription, then every change in count.
  reactive::Observable<std::size_t> CountChanges() const {
    std::weak_ptr<Store> weak = store_;
    return reactive::Observable<std::size_t>(counts_).StartWith([weak]() -> std::size_t {
      std::shared_ptr<Store> store = weak.lock();
      return store ? store->Count() : 0;
    });
  }

  // A record each time consumers must re-read the whole cache.
  reactive::Observable<Change> Resets() const { return reactive::Observable<Change>(resets_); }

  // Holds back Changes() (and ItemExpirations()) until the returned scope ends. Scopes nest.
  // When the last one ends and something was held back, a single reset is published if any
  // scope asked for it. Fails with kDisposed after Dispose.
  api::Result<NotificationSuppression> SuppressChangeNotifications(
      bool signal_reset_when_finished = true) {
    if (!lifecycle_.IsActive()) return api::Result<NotificationSuppression>(DisposedStatus());
    return api::Result<NotificationSuppression>(
        gate_->Suppress(SuppressionKind::kChanges, signal_reset_when_finished));
  }

  bool IsTrackingChanges() const { return gate_->IsTracking(SuppressionKind::kChanges); }

  // Same for Resets() only.
  api::Result<NotificationSuppression> SuppressResetNotifications(
      bool signal_reset_when_finished = true) {
    if (!lifecycle_.IsActive()) return api::Result<NotificationSuppression>(DisposedStatus());
    return api::Result<NotificationSuppression>(
        gate_->Suppress(SuppressionKind::kResets, signal_reset_when_finished));
  }

  bool IsTrackingResets() const { return gate_->IsTracking(SuppressionKind::kResets); }

  // Entries waiting for their expiry to be handled.
  std::size_t PendingExpirationsCount() const { return scheduler_.ScheduledCount(); }

  // Refresh failures and exceptions thrown by observers of the other streams.
  reactive::Observable<api::Status> UnhandledErrors() const {
    return reactive::Observable<api::Status>(errors_);
  }

  // ---- lifecycle ----

  bool IsDisposed() const { return lifecycle_.IsDisposed(); }

  // Rejects new operations, lets already queued ones finish, then completes all streams.
  api::Status Dispose() {
    if (!lifecycle_.BeginDispose()) return api::Status::Ok();
    scheduler_.Stop();
    api::Status st = lock_.Dispose();
    store_subscription_.Unsubscribe();
    count_subscription_.Unsubscribe();
    store_->Complete();
    changes_->OnCompleted();
    resets_->OnCompleted();
    counts_->OnCompleted();
    errors_->OnCompleted();
    lifecycle_.FinishDispose();
    VLOG(1) << "observable cache disposed";
    return st;
  }

 private:
  typedef ObservableDictionary<K, Element, Hash, KeyEqual> Store;

  ObservableCache(const ObservableCache&);
  ObservableCache& operator=(const ObservableCache&);

  static Change Translate(const typename Store::Change& change) {
    switch (change.type) {
      case DictionaryChangeType::kItemAdded:
        return Change::ItemAdded(change.value);
      case DictionaryChangeType::kItemReplaced:
        return Change::ItemValueReplaced(change.old_value, change.value);
      case DictionaryChangeType::kItemRemoved:
        return Change::ItemRemoved(change.value);
      case DictionaryChangeType::kReset:
      default:
        return Change::Reset();
    }
  }

  static api::Status KeyNotFoundStatus() {
    return CK_STATUS(api::StatusCode::kNotFound, "key not found", api::kDetailCacheKeyNotFound);
  }

  static api::Status NoUpdaterStatus() {
    return CK_STATUS(api::StatusCode::kOutOfRange,
                     "expiration type update requires a configured updater",
                     api::kDetailCacheNoUpdater);
  }

  static api::Status NullArgumentStatus(const char* name) {
    return CK_STATUS(api::StatusCode::kInvalidArgument, std::string(name) + " is empty",
                     api::kDetailNone);
  }

  static api::Status DisposedStatus() {
    return CK_STATUS(api::StatusCode::kDisposed, "cache has been disposed", api::kDetailNone);
  }

  template <typename R>
  static std::future<R> Ready(const R& value) {
    std::promise<R> promise;
    promise.set_value(value);
    return promise.get_future();
  }

  template <typename R>
  std::future<R> RunLocked(threading::LockLane lane, const std::function<R()>& work,
                           const api::CancellationToken& token, task::IExecutor* executor) {
    if (!lifecycle_.IsActive()) return Ready(R(DisposedStatus()));
    return threading::RunUnderLock<R>(lock_, lane, work, token,
                                      executor != NULL ? executor : worker_executor_);
  }

  bool HasUpdater() const {
    return static_cast<bool>(single_key_updater_) || static_cast<bool>(multiple_keys_updater_);
  }

  api::Result<Element> NewElement(const K& key, const V& value, Duration expiry,
                                  ExpirationType type) const {
    if (type == ExpirationType::kUpdate && !HasUpdater()) {
      return api::Result<Element>(NoUpdaterStatus());
    }
    return Element::Create(key, value, expiry, type, Clock::now());
  }

  api::Status ReplaceValue(const Element& existing, const V& value) {
    Element replacement = existing.WithValue(value);
    api::Status st = store_->Replace(existing.key(), replacement, NULL);
    if (st.ok()) ScheduleExpiry(replacement);
    return st;
  }

  void ScheduleExpiry(const Element& element) {
    if (!element.has_expiry()) {
      scheduler_.Unschedule(element.key());
      return;
    }
    scheduler_.Schedule(element.key(), element.id(), element.expires_at());
  }

  api::Status RestartExpiry(const K& key, Duration expiry, bool change_type,
                            ExpirationType type) {
    const Element* existing = store_->Find(key);
    if (existing == NULL) return KeyNotFoundStatus();
    const ExpirationType next_type = change_type ? type : existing->expiration_type();
    if (next_type == ExpirationType::kUpdate && !HasUpdater()) return NoUpdaterStatus();
    api::Result<Element> created =
        Element::Create(key, existing->value(), expiry, next_type, Clock::now());
    if (!created.ok()) return created.status();
    api::Status st = store_->Replace(key, created.value(), NULL);
    if (st.ok()) ScheduleExpiry(created.value());
    return st;
  }

  api::Status RestartExpiryRange(const std::vector<K>& keys, Duration expiry, bool change_type,
                                 ExpirationType type, const api::CancellationToken& token) {
    typename Store::NotificationSuppression batch;
    const std::size_t threshold = store_->ResetThreshold();
    if (threshold > 0 && keys.size() > threshold) batch = store_->SuppressChangeNotifications(true);
    for (std::size_t i = 0; i < keys.size(); ++i) {
      if (token.IsCancellationRequested()) return threading::LockCanceledStatus();
      api::Status st = RestartExpiry(keys[i], expiry, change_type, type);
      if (!st.ok()) return st;
    }
    return api::Status::Ok();
  }

  static api::Status Produce(const ValueProducer& producer, const K& key, V* out) {
    try {
      *out = producer(key);
      return api::Status::Ok();
    } catch (const std::exception& ex) {
      return CK_STATUS(api::StatusCode::kInternalError,
                       std::string("value producer threw: ") + ex.what(),
                       api::kDetailCacheProducerFailed);
    } catch (...) {
      return CK_STATUS(api::StatusCode::kInternalError,
                       "value producer threw a non-standard exception",
                       api::kDetailCacheProducerFailed);
    }
  }

  void ReportUnhandled(const api::Status& st) {
    LOG(WARNING) << "cache background failure: " << st.ToString();
    errors_->OnNext(st);
  }

  // Runs on the scheduler thread. The batch is processed once the exclusive lane is granted.
  void OnExpired(const std::vector<ExpiredEntry<K> >& batch) {
    if (!lifecycle_.IsActive()) return;
    std::vector<ExpiredEntry<K> > entries = batch;
    api::Status st = lock_.AcquireAsync(
        threading::LockLane::kExclusive, api::CancellationToken(),
        [this, entries](api::Result<threading::LockTicket> granted) {
          if (!granted.ok()) {
            VLOG(1) << "expiration batch not processed: " << granted.status().ToString();
            return;
          }
          threading::LockTicket ticket(std::move(granted.value()));
          ProcessExpired(entries);
        });
    if (!st.ok()) VLOG(1) << "expiration batch rejected: " << st.ToString();
  }

  // Entries replaced or removed since they were scheduled are skipped by id.
  void ProcessExpired(const std::vector<ExpiredEntry<K> >& entries) {
    std::vector<Element> to_refresh;
    for (std::size_t i = 0; i < entries.size(); ++i) {
      const Element* current = store_->Find(entries[i].key);
      if (current == NULL || current->id() != entries[i].element_id) continue;
      const Element element = *current;
      gate_->Publish(Change::ItemExpired(element));
      switch (element.expiration_type()) {
        case ExpirationType::kDoNothing:
          break;
        case ExpirationType::kRemove: {
          api::Status st = store_->Remove(element.key(), NULL);
          if (!st.ok()) ReportUnhandled(st);
          break;
        }
        case ExpirationType::kUpdate:
          to_refresh.push_back(element);
          break;
      }
    }
    if (!to_refresh.empty()) Refresh(to_refresh);
  }

  void Refresh(const std::vector<Element>& expired) {
    const TimePoint now = Clock::now();
    if (multiple_keys_updater_) {
      std::vector<K> keys;
      std::unordered_map<K, Element, Hash, KeyEqual> by_key;
      for (std::size_t i = 0; i < expired.size(); ++i) {
        keys.push_back(expired[i].key());
        by_key.insert(std::make_pair(expired[i].key(), expired[i]));
      }
      std::vector<std::pair<K, V> > values;
      try {
        values = multiple_keys_updater_(keys);
      } catch (const std::exception& ex) {
        ReportUnhandled(CK_STATUS(api::StatusCode::kInternalError,
                                  std::string("multiple keys updater threw: ") + ex.what(),
                                  api::kDetailCacheProducerFailed));
        return;
      } catch (...) {
        ReportUnhandled(CK_STATUS(api::StatusCode::kInternalError,
                                  "multiple keys updater threw a non-standard exception",
                                  api::kDetailCacheProducerFailed));
        return;
      }
      for (std::size_t i = 0; i < values.size(); ++i) {
        typename std::unordered_map<K, Element, Hash, KeyEqual>::const_iterator it =
            by_key.find(values[i].first);
        if (it == by_key.end()) continue;
        StoreRefreshed(it->second.Refreshed(values[i].second, now));
      }
      return;
    }

    for (std::size_t i = 0; i < expired.size(); ++i) {
      V value;
      api::Status st = Produce(single_key_updater_, expired[i].key(), &value);
      if (!st.ok()) {
        ReportUnhandled(st);
        continue;
      }
      StoreRefreshed(expired[i].Refreshed(value, now));
    }
  }

  void StoreRefreshed(const Element& refreshed) {
    api::Status st = store_->Replace(refreshed.key(), refreshed, NULL);
    if (!st.ok()) {
      ReportUnhandled(st);
      return;
    }
    ScheduleExpiry(refreshed);
  }

  config::CacheOptions options_;
  SingleKeyUpdater single_key_updater_;
  MultipleKeysUpdater multiple_keys_updater_;
  task::IExecutor* worker_executor_;
  task::IExecutor* notification_executor_;
  api::Lifecycle lifecycle_;
  std::shared_ptr<Store> store_;
  std::shared_ptr<reactive::Subject<Change> > changes_;
  std::shared_ptr<reactive::Subject<Change> > resets_;
  std::shared_ptr<NotificationGate<K, V> > gate_;
  std::atomic<std::size_t> reset_threshold_;
  std::shared_ptr<reactive::Subject<api::Status> > errors_;
  std::shared_ptr<reactive::Subject<std::size_t> > counts_;
  threading::AsyncReaderWriterLock lock_;
  ExpirationScheduler<K, Hash, KeyEqual> scheduler_;
  reactive::Subscription store_subscription_;
  reactive::Subscription count_subscription_;
};

#undef CK_STATUS

}  // namespace cache
}  // namespace cachekit
