#include "cachekit/cachekit.hpp"
#include "task/thread_pool_executor.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace {

using cachekit::api::Status;
using cachekit::api::StatusCode;
using cachekit::cache::DictionaryChangeType;

typedef cachekit::cache::ObservableDictionary<int, std::string> Dictionary;
typedef Dictionary::Change Change;

#define CHECK_STORE(cond, msg) \
  do { \
    if (!(cond)) { \
      std::printf("[STORE-FAIL] %s\n", msg); \
      return false; \
    } \
  } while (0)

// Collects everything the dictionary reports. Delivery is inline, so no locking needed.
struct Recorder {
  std::vector<Change> changes;
  std::vector<std::size_t> counts;
};

bool TestMutationsAreRecorded() {
  Dictionary dict;
  Recorder rec;
  cachekit::reactive::Subscription sub =
      dict.Changes().Subscribe([&rec](const Change& c) { rec.changes.push_back(c); });

  CHECK_STORE(dict.Add(1, "One").ok(), "add 1");
  CHECK_STORE(dict.Add(2, "Two").ok(), "add 2");
  CHECK_STORE(dict.Add(1, "Uno").code() == StatusCode::kAlreadyExists, "duplicate add");
  std::string old;
  CHECK_STORE(dict.Replace(1, "Uno", &old).ok() && old == "One", "replace");
  CHECK_STORE(dict.Replace(9, "x", NULL).code() == StatusCode::kNotFound, "replace missing");
  CHECK_STORE(!dict.AddOrReplace(2, "Dos"), "add-or-replace replaces");
  CHECK_STORE(dict.AddOrReplace(3, "Tres"), "add-or-replace adds");
  std::string removed;
  CHECK_STORE(dict.Remove(3, &removed).ok() && removed == "Tres", "remove");
  CHECK_STORE(dict.Remove(3, NULL).code() == StatusCode::kNotFound, "remove missing");

  CHECK_STORE(rec.changes.size() == 6, "six records");
  CHECK_STORE(rec.changes[0].type == DictionaryChangeType::kItemAdded &&
                  rec.changes[0].key == 1 && rec.changes[0].value == "One",
              "added one");
  CHECK_STORE(rec.changes[2].type == DictionaryChangeType::kItemReplaced &&
                  rec.changes[2].value == "Uno" && rec.changes[2].old_value == "One",
              "replaced carries old value");
  CHECK_STORE(rec.changes[5].type == DictionaryChangeType::kItemRemoved &&
                  rec.changes[5].value == "Tres",
              "removed carries value");

  CHECK_STORE(dict.Count() == 2 && dict.ContainsKey(1) && !dict.ContainsKey(3), "contents");
  const std::string* found = dict.Find(2);
  CHECK_STORE(found != NULL && *found == "Dos", "find");
  CHECK_STORE(dict.Keys().size() == 2, "keys");

  dict.Clear();
  CHECK_STORE(rec.changes.size() == 7 && rec.changes[6].type == DictionaryChangeType::kReset,
              "clear is one reset");
  CHECK_STORE(dict.Count() == 0, "cleared");
  return true;
}

bool TestSuppressionNestsAndResets() {
  Dictionary dict;
  Recorder rec;
  cachekit::reactive::Subscription sub =
      dict.Changes().Subscribe([&rec](const Change& c) { rec.changes.push_back(c); });

  {
    Dictionary::NotificationSuppression outer = dict.SuppressChangeNotifications(false);
    CHECK_STORE(!dict.IsTrackingChanges(), "suppressed");
    {
      Dictionary::NotificationSuppression inner = dict.SuppressChangeNotifications(true);
      CHECK_STORE(dict.Add(1, "a").ok(), "add under suppression");
    }
    CHECK_STORE(rec.changes.empty(), "nothing until outermost ends");
    CHECK_STORE(dict.Add(2, "b").ok(), "add under outer");
    CHECK_STORE(dict.Count() == 2, "count tracks while suppressed");
  }
  CHECK_STORE(dict.IsTrackingChanges(), "tracking restored");
  CHECK_STORE(rec.changes.size() == 1 && rec.changes[0].type == DictionaryChangeType::kReset,
              "one reset after batch");

  {
    Dictionary::NotificationSuppression quiet = dict.SuppressChangeNotifications(false);
    CHECK_STORE(dict.Add(3, "c").ok(), "silent add");
    quiet.End();
    quiet.End();
  }
  CHECK_STORE(rec.changes.size() == 1, "no reset when not requested");

  {
    Dictionary::NotificationSuppression idle = dict.SuppressChangeNotifications(true);
  }
  CHECK_STORE(rec.changes.size() == 1, "no reset when nothing changed");
  return true;
}

bool TestRangeThreshold() {
  Dictionary dict;
  dict.SetResetThreshold(2);
  Recorder rec;
  cachekit::reactive::Subscription sub =
      dict.Changes().Subscribe([&rec](const Change& c) { rec.changes.push_back(c); });

  std::vector<std::pair<int, std::string> > small;
  small.push_back(std::make_pair(1, std::string("a")));
  small.push_back(std::make_pair(2, std::string("b")));
  std::size_t added = 0;
  CHECK_STORE(dict.AddRange(small, cachekit::api::CancellationToken(), &added).ok() && added == 2,
              "small range");
  CHECK_STORE(rec.changes.size() == 2, "per-item records under threshold");

  std::vector<std::pair<int, std::string> > large;
  for (int i = 10; i < 15; ++i) large.push_back(std::make_pair(i, std::to_string(i)));
  CHECK_STORE(dict.AddRange(large, cachekit::api::CancellationToken(), &added).ok() && added == 5,
              "large range");
  CHECK_STORE(rec.changes.size() == 3 && rec.changes[2].type == DictionaryChangeType::kReset,
              "single reset over threshold");

  std::vector<std::pair<int, std::string> > clash;
  clash.push_back(std::make_pair(20, std::string("x")));
  clash.push_back(std::make_pair(1, std::string("dup")));
  clash.push_back(std::make_pair(21, std::string("y")));
  Status st = dict.AddRange(clash, cachekit::api::CancellationToken(), &added);
  CHECK_STORE(st.code() == StatusCode::kAlreadyExists, "range stops at duplicate");
  CHECK_STORE(added == 1 && dict.ContainsKey(20) && !dict.ContainsKey(21), "partial range kept");

  std::vector<int> keys;
  keys.push_back(10);
  keys.push_back(11);
  keys.push_back(12);
  std::size_t removed = 0;
  const std::size_t before = rec.changes.size();
  CHECK_STORE(dict.RemoveRange(keys, cachekit::api::CancellationToken(), &removed).ok() &&
                  removed == 3,
              "remove range");
  CHECK_STORE(rec.changes.size() == before + 1 &&
                  rec.changes.back().type == DictionaryChangeType::kReset,
              "remove range over threshold resets");

  cachekit::api::CancellationSource source;
  source.Cancel();
  CHECK_STORE(dict.RemoveRange(keys, source.Token(), &removed).code() == StatusCode::kCanceled &&
                  removed == 0,
              "canceled range");
  return true;
}

bool TestCountChangesStartWith() {
  Dictionary dict;
  CHECK_STORE(dict.Add(1, "a").ok(), "seed");
  Recorder rec;
  cachekit::reactive::Subscription sub =
      dict.CountChanges().Subscribe([&rec](const std::size_t& n) { rec.counts.push_back(n); });
  CHECK_STORE(rec.counts.size() == 1 && rec.counts[0] == 1, "current count first");
  CHECK_STORE(dict.Add(2, "b").ok(), "add");
  CHECK_STORE(dict.Replace(2, "c", NULL).ok(), "replace does not change count");
  CHECK_STORE(dict.Remove(1, NULL).ok(), "remove");
  CHECK_STORE(rec.counts.size() == 3 && rec.counts[1] == 2 && rec.counts[2] == 1,
              "count sequence");
  return true;
}

bool TestWhereAndUnsubscribe() {
  std::shared_ptr<cachekit::reactive::Subject<int> > subject =
      cachekit::reactive::Subject<int>::Create();
  cachekit::reactive::Observable<int> evens =
      cachekit::reactive::Observable<int>(subject).Where([](const int& v) { return v % 2 == 0; });

  std::vector<int> seen;
  cachekit::reactive::Subscription sub = evens.Subscribe([&seen](const int& v) { seen.push_back(v); });
  CHECK_STORE(sub.active() && subject->ObserverCount() == 1, "subscribed");
  for (int i = 1; i <= 6; ++i) subject->OnNext(i);
  CHECK_STORE(seen.size() == 3 && seen[0] == 2 && seen[2] == 6, "filtered values");

  sub.Unsubscribe();
  CHECK_STORE(!sub.active() && subject->ObserverCount() == 0, "unsubscribed");
  subject->OnNext(8);
  CHECK_STORE(seen.size() == 3, "no delivery after unsubscribe");
  return true;
}

bool TestObserverFailureIsReported() {
  std::shared_ptr<cachekit::reactive::Subject<int> > subject =
      cachekit::reactive::Subject<int>::Create();
  std::vector<Status> errors;
  subject->SetUnhandledErrorHandler([&errors](const Status& st) { errors.push_back(st); });

  int healthy = 0;
  cachekit::reactive::Subscription bad = subject->Subscribe(
      cachekit::reactive::MakeObserver<int>([](const int&) { throw std::runtime_error("bad"); }));
  cachekit::reactive::Subscription good =
      subject->Subscribe(cachekit::reactive::MakeObserver<int>([&healthy](const int&) { ++healthy; }));
  subject->OnNext(1);
  CHECK_STORE(healthy == 1, "other observers still served");
  CHECK_STORE(errors.size() == 1 && errors[0].code() == StatusCode::kInternalError,
              "failure reported");
  CHECK_STORE(errors[0].message().find("bad") != std::string::npos, "failure message");
  return true;
}

bool TestCompletionAndLateSubscriber() {
  std::shared_ptr<cachekit::reactive::Subject<int> > subject =
      cachekit::reactive::Subject<int>::Create();
  int completed = 0;
  cachekit::reactive::Subscription sub = subject->Subscribe(cachekit::reactive::MakeObserver<int>(
      [](const int&) {}, std::function<void(const Status&)>(), [&completed]() { ++completed; }));
  subject->OnCompleted();
  subject->OnCompleted();
  CHECK_STORE(completed == 1 && subject->IsStopped(), "completed once");

  int late = 0;
  cachekit::reactive::Subscription after = subject->Subscribe(cachekit::reactive::MakeObserver<int>(
      [](const int&) {}, std::function<void(const Status&)>(), [&late]() { ++late; }));
  CHECK_STORE(late == 1 && !after.active(), "late subscriber sees completion");
  return true;
}

bool TestStrandDeliveryKeepsOrder() {
  cachekit::task::ThreadPoolExecutor pool(4);
  std::shared_ptr<cachekit::reactive::Subject<int> > subject =
      cachekit::reactive::Subject<int>::Create(&pool);
  std::mutex mu;
  std::vector<int> seen;
  std::atomic<bool> done(false);
  cachekit::reactive::Subscription sub = subject->Subscribe(cachekit::reactive::MakeObserver<int>(
      [&mu, &seen](const int& v) {
        std::lock_guard<std::mutex> lock(mu);
        seen.push_back(v);
      },
      std::function<void(const Status&)>(), [&done]() { done.store(true); }));
  for (int i = 0; i < 100; ++i) subject->OnNext(i);
  subject->OnCompleted();

  for (int i = 0; i < 200 && !done.load(); ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  CHECK_STORE(done.load(), "completion delivered");
  std::lock_guard<std::mutex> lock(mu);
  CHECK_STORE(seen.size() == 100, "all delivered");
  for (int i = 0; i < 100; ++i) CHECK_STORE(seen[i] == i, "emission order kept");
  return true;
}

#undef CHECK_STORE

}  // namespace

int main() {
  struct TestCase {
    const char* name;
    bool (*fn)();
  };

  const TestCase tests[] = {
      {"mutations_are_recorded", TestMutationsAreRecorded},
      {"suppression_nests_and_resets", TestSuppressionNestsAndResets},
      {"range_threshold", TestRangeThreshold},
      {"count_changes_start_with", TestCountChangesStartWith},
      {"where_and_unsubscribe", TestWhereAndUnsubscribe},
      {"observer_failure_is_reported", TestObserverFailureIsReported},
      {"completion_and_late_subscriber", TestCompletionAndLateSubscriber},
      {"strand_delivery_keeps_order", TestStrandDeliveryKeepsOrder},
  };

  int failed = 0;
  for (std::size_t i = 0; i < sizeof(tests) / sizeof(tests[0]); ++i) {
    std::printf("[RUN ] %s\n", tests[i].name);
    std::fflush(stdout);
    bool ok = tests[i].fn();
    std::cout << (ok ? "[PASS] " : "[FAIL] ") << tests[i].name << "\n";
    std::fflush(stdout);
    if (!ok) ++failed;
  }

  return failed == 0 ? 0 : 1;
}
