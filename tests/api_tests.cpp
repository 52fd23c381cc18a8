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
#include <vector>

namespace {

#define CHECK_API(cond, msg) \
  do { \
    if (!(cond)) { \
      std::printf("[API-FAIL] %s\n", msg); \
      return false; \
    } \
  } while (0)

bool TestApiVersion() { return cachekit_get_api_version() == cachekit::api::kApiVersion; }

bool TestErrorCodeLayout() {
  const std::uint32_t code =
      cachekit::api::MakeErrorCode(cachekit::api::ErrorModule::kCache,
                                   cachekit::api::StatusCode::kNotFound,
                                   cachekit::api::kDetailCacheKeyNotFound);
  CHECK_API((code >> 24) == 0x70, "module byte");
  CHECK_API((code & 0xFFFFF) == cachekit::api::kDetailCacheKeyNotFound, "detail bits");

  const cachekit::api::ErrorCatalogEntry* entry = cachekit::api::FindErrorCatalogEntry(code);
  CHECK_API(entry != NULL, "catalog entry for cache key not found");
  CHECK_API(std::string(entry->symbol).find("CACHE") != std::string::npos, "symbol names cache");
  CHECK_API(cachekit::api::FindErrorCatalogEntry(0xFFFFFFFFu) == NULL, "unknown code");
  CHECK_API(cachekit::api::FormatErrorCodeHex(0x70300002u) == "0x70300002", "hex format");
  return true;
}

bool TestStatusToString() {
  CHECK_API(cachekit::api::Status::Ok().ToString() == "OK", "ok text");
  cachekit::api::Status st = cachekit::api::Status::FromModule(
      cachekit::api::StatusCode::kDisposed, "gone", cachekit::api::ErrorModule::kThreading,
      cachekit::api::kDetailLockDisposed);
  const std::string text = st.ToString();
  CHECK_API(!st.ok(), "not ok");
  CHECK_API(text.find("gone") != std::string::npos, "message in text");
  CHECK_API(text.find(st.hex_code_string()) != std::string::npos, "hex in text");
  return true;
}

bool TestResultValueAndStatus() {
  cachekit::api::Result<int> good(42);
  CHECK_API(good.ok() && good.has_value() && good.value() == 42, "value result");
  cachekit::api::Result<int> bad(
      cachekit::api::Status(cachekit::api::StatusCode::kNotFound, "missing"));
  CHECK_API(!bad.ok() && !bad.has_value(), "error result");
  CHECK_API(bad.status().code() == cachekit::api::StatusCode::kNotFound, "error code");
  return true;
}

bool TestLifecycleTransitions() {
  cachekit::api::Lifecycle lifecycle;
  CHECK_API(lifecycle.IsActive(), "starts active");
  CHECK_API(lifecycle.BeginDispose(), "first dispose wins");
  CHECK_API(!lifecycle.BeginDispose(), "second dispose loses");
  CHECK_API(!lifecycle.IsActive() && !lifecycle.IsDisposed(), "disposing");
  lifecycle.FinishDispose();
  CHECK_API(lifecycle.IsDisposed(), "disposed");
  return true;
}

bool TestCancellationCallbacks() {
  cachekit::api::CancellationSource source;
  cachekit::api::CancellationToken token = source.Token();
  CHECK_API(token.CanBeCanceled(), "source token can be canceled");
  CHECK_API(!cachekit::api::CancellationToken::None().CanBeCanceled(), "none token");

  std::atomic<int> fired(0);
  const std::uint64_t kept = token.Register([&fired]() { fired.fetch_add(1); });
  const std::uint64_t dropped = token.Register([&fired]() { fired.fetch_add(100); });
  CHECK_API(kept != 0 && dropped != 0, "registration ids");
  token.Unregister(dropped);

  source.Cancel();
  source.Cancel();
  CHECK_API(token.IsCancellationRequested(), "canceled");
  CHECK_API(fired.load() == 1, "callback ran once, unregistered one did not");

  std::atomic<int> late(0);
  const std::uint64_t late_id = token.Register([&late]() { late.fetch_add(1); });
  CHECK_API(late_id == 0 && late.load() == 1, "late registration runs immediately");
  return true;
}

void IncCounterTask(void* user_data) {
  std::atomic<int>* c = static_cast<std::atomic<int>*>(user_data);
  c->fetch_add(1, std::memory_order_relaxed);
}

bool TestExecutorSubmitAndWait() {
  cachekit::task::IExecutor* executor = cachekit_create_executor(NULL);
  if (executor == NULL) return false;
  std::atomic<int> counter(0);
  for (int i = 0; i < 100; ++i) {
    cachekit::api::Status st = executor->Submit(&IncCounterTask, &counter);
    if (!st.ok()) return false;
  }
  cachekit::api::Status st_exec = executor->WaitAll();
  cachekit_destroy_executor(executor);
  if (!st_exec.ok()) return false;
  return counter.load(std::memory_order_relaxed) == 100;
}

bool TestExecutorPostWaitAndStats() {
  cachekit::task::ExecutorOptions opt;
  opt.worker_count = 2;
  cachekit::task::IExecutor* executor = cachekit_create_executor(&opt);
  CHECK_API(executor != NULL, "create");
  CHECK_API(executor->ApiVersion() == cachekit::api::kApiVersion, "version");

  std::atomic<int> done(0);
  cachekit::api::Result<cachekit::task::TaskId> id = executor->Post([&done]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    done.fetch_add(1);
  });
  CHECK_API(id.ok(), "post");
  CHECK_API(executor->Wait(id.value(), 0).ok(), "wait");
  CHECK_API(done.load() == 1, "ran");

  cachekit::api::Result<cachekit::task::TaskId> throwing =
      executor->Post([]() { throw std::runtime_error("boom"); });
  CHECK_API(throwing.ok(), "post throwing");
  CHECK_API(executor->WaitAll().ok(), "wait all");
  cachekit::api::Result<cachekit::task::ExecutorStats> stats = executor->QueryStats();
  CHECK_API(stats.ok() && stats.value().failed >= 1, "failure counted");

  CHECK_API(executor->Post(std::function<void()>()).status().code() ==
                cachekit::api::StatusCode::kInvalidArgument,
            "empty work rejected");
  cachekit_destroy_executor(executor);
  return true;
}

bool TestSerialExecutorOrder() {
  cachekit::task::ThreadPoolExecutor pool(4);
  std::shared_ptr<cachekit::task::SerialExecutor> strand(
      new cachekit::task::SerialExecutor(&pool));

  std::mutex mu;
  std::vector<int> seen;
  std::atomic<int> running(0);
  std::atomic<int> max_running(0);
  for (int i = 0; i < 50; ++i) {
    cachekit::api::Status st = strand->Post([i, &mu, &seen, &running, &max_running]() {
      const int now = running.fetch_add(1) + 1;
      int observed = max_running.load();
      while (observed < now && !max_running.compare_exchange_weak(observed, now)) {
      }
      {
        std::lock_guard<std::mutex> lock(mu);
        seen.push_back(i);
      }
      running.fetch_sub(1);
    });
    CHECK_API(st.ok(), "strand post");
  }
  CHECK_API(pool.WaitAll().ok(), "pool drained");
  CHECK_API(strand->PendingCount() == 0, "strand drained");
  std::lock_guard<std::mutex> lock(mu);
  CHECK_API(seen.size() == 50, "all ran");
  for (int i = 0; i < 50; ++i) CHECK_API(seen[i] == i, "posting order kept");
  CHECK_API(max_running.load() == 1, "one at a time");
  return true;
}

bool TestDefaultExecutorIsShared() {
  cachekit::task::IExecutor* a = cachekit::task::DefaultExecutor();
  cachekit::task::IExecutor* b = cachekit::task::DefaultExecutor();
  CHECK_API(a != NULL && a == b, "single default executor");
  std::atomic<bool> ran(false);
  cachekit::api::Result<cachekit::task::TaskId> id = a->Post([&ran]() { ran.store(true); });
  CHECK_API(id.ok() && a->Wait(id.value(), 0).ok() && ran.load(), "default executor runs work");
  return true;
}

bool TestFactoryLogManager() {
  cachekit::log::ILogManager* logger = cachekit_create_log_manager();
  if (logger == NULL) return false;
  const bool ok = logger->ApiVersion() == cachekit::api::kApiVersion &&
                  std::string(logger->Name()) == "cachekit.log.glog";
  cachekit_destroy_log_manager(logger);
  return ok;
}

#undef CHECK_API

}  // namespace

int main() {
  struct TestCase {
    const char* name;
    bool (*fn)();
  };

  const TestCase tests[] = {
      {"api_version", TestApiVersion},
      {"error_code_layout", TestErrorCodeLayout},
      {"status_to_string", TestStatusToString},
      {"result_value_and_status", TestResultValueAndStatus},
      {"lifecycle_transitions", TestLifecycleTransitions},
      {"cancellation_callbacks", TestCancellationCallbacks},
      {"executor_submit_wait", TestExecutorSubmitAndWait},
      {"executor_post_wait_stats", TestExecutorPostWaitAndStats},
      {"serial_executor_order", TestSerialExecutorOrder},
      {"default_executor_shared", TestDefaultExecutorIsShared},
      {"factory_log_manager", TestFactoryLogManager},
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
