#pragma once

#include <glog/logging.h>

#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

#include "cachekit/cache/cache_types.hpp"

namespace cachekit {
namespace cache {

template <typename K>
struct ExpiredEntry {
  K key;
  std::uint64_t element_id;
  TimePoint due;
};

// Deadline queue drained by one background thread. Each key has at most one live
// deadline, identified by element id: scheduling a key again supersedes its previous
// deadline, and superseded heap nodes are dropped when they surface or when they
// outnumber the live ones.
template <typename K, typename Hash = std::hash<K>, typename KeyEqual = std::equal_to<K> >
class ExpirationScheduler {
 public:
  typedef std::function<void(const std::vector<ExpiredEntry<K> >&)> Handler;

  ExpirationScheduler(const Handler& handler, Duration batch_window)
      : handler_(handler), batch_window_(batch_window), next_seq_(0), stop_(false),
        started_(false) {}

  ~ExpirationScheduler() { Stop(); }

  // The worker thread starts with the first scheduled entry. Ignored after Stop.
  void Schedule(const K& key, std::uint64_t element_id, TimePoint due) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (stop_) return;
      live_[key] = element_id;
      Entry entry;
      entry.due = due;
      entry.key = key;
      entry.element_id = element_id;
      entry.seq = next_seq_++;
      heap_.push_back(entry);
      std::push_heap(heap_.begin(), heap_.end(), Later());
      CompactLocked();
      if (!started_) {
        started_ = true;
        worker_ = std::thread([this]() { Run(); });
      }
    }
    cv_.notify_one();
  }

  // Drops the key's pending deadline, if any.
  void Unschedule(const K& key) {
    std::lock_guard<std::mutex> lock(mu_);
    if (live_.erase(key) > 0) CompactLocked();
  }

  void UnscheduleAll() {
    std::lock_guard<std::mutex> lock(mu_);
    live_.clear();
    heap_.clear();
  }

  // Stops the worker and drops every pending entry. Safe to call from the handler.
  void Stop() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (stop_ && !worker_.joinable()) return;
      stop_ = true;
      live_.clear();
      heap_.clear();
    }
    cv_.notify_all();
    if (!worker_.joinable()) return;
    if (worker_.get_id() == std::this_thread::get_id()) {
      worker_.detach();
    } else {
      worker_.join();
    }
  }

  // Keys with a pending deadline.
  std::size_t ScheduledCount() const {
    std::lock_guard<std::mutex> lock(mu_);
    return live_.size();
  }

  // Heap nodes held, superseded ones included.
  std::size_t QueuedCount() const {
    std::lock_guard<std::mutex> lock(mu_);
    return heap_.size();
  }

 private:
  struct Entry {
    TimePoint due;
    K key;
    std::uint64_t element_id;
    std::uint64_t seq;
  };

  struct Later {
    bool operator()(const Entry& a, const Entry& b) const {
      if (a.due != b.due) return a.due > b.due;
      return a.seq > b.seq;
    }
  };

  // Heap rebuilds are amortized against the pushes that created the stale nodes.
  static const std::size_t kCompactSlack = 64;

  ExpirationScheduler(const ExpirationScheduler&);
  ExpirationScheduler& operator=(const ExpirationScheduler&);

  bool IsLiveLocked(const Entry& entry) const {
    typename LiveMap::const_iterator it = live_.find(entry.key);
    return it != live_.end() && it->second == entry.element_id;
  }

  void CompactLocked() {
    if (heap_.size() <= 2 * live_.size() + kCompactSlack) return;
    const std::size_t before = heap_.size();
    heap_.erase(std::remove_if(heap_.begin(), heap_.end(),
                               [this](const Entry& entry) { return !IsLiveLocked(entry); }),
                heap_.end());
    std::make_heap(heap_.begin(), heap_.end(), Later());
    VLOG(2) << "expiration queue compacted " << before << " -> " << heap_.size();
  }

  void Run() {
    std::unique_lock<std::mutex> lock(mu_);
    while (!stop_) {
      if (heap_.empty()) {
        cv_.wait(lock);
        continue;
      }
      const TimePoint due = heap_.front().due;
      if (Clock::now() < due) {
        cv_.wait_until(lock, due);
        continue;
      }
      if (batch_window_ > Duration::zero()) {
        cv_.wait_for(lock, batch_window_, [this]() { return stop_; });
        if (stop_) break;
      }

      std::vector<ExpiredEntry<K> > batch;
      const TimePoint now = Clock::now();
      while (!heap_.empty() && heap_.front().due <= now) {
        std::pop_heap(heap_.begin(), heap_.end(), Later());
        const Entry& top = heap_.back();
        if (IsLiveLocked(top)) {
          live_.erase(top.key);
          ExpiredEntry<K> expired;
          expired.key = top.key;
          expired.element_id = top.element_id;
          expired.due = top.due;
          batch.push_back(expired);
        }
        heap_.pop_back();
      }
      if (batch.empty()) continue;

      lock.unlock();
      VLOG(2) << "expiration batch of " << batch.size() << " entries";
      try {
        handler_(batch);
      } catch (const std::exception& ex) {
        LOG(ERROR) << "expiration handler threw: " << ex.what();
      } catch (...) {
        LOG(ERROR) << "expiration handler threw a non-standard exception";
      }
      lock.lock();
    }
  }

  typedef std::unordered_map<K, std::uint64_t, Hash, KeyEqual> LiveMap;

  Handler handler_;
  Duration batch_window_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::vector<Entry> heap_;
  LiveMap live_;
  std::uint64_t next_seq_;
  bool stop_;
  bool started_;
  std::thread worker_;
};

}  // namespace cache
}  // namespace cachekit
