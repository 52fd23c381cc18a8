#include "cachekit/cachekit.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <future>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

using cachekit::api::Result;
using cachekit::api::Status;
using cachekit::api::StatusCode;
using cachekit::threading::AsyncReaderWriterLock;
using cachekit::threading::LockLane;
using cachekit::threading::LockTicket;

#define CHECK_LOCK(cond, msg) \
  do { \
    if (!(cond)) { \
      std::printf("[LOCK-FAIL] %s\n", msg); \
      return false; \
    } \
  } while (0)

template <typename T>
bool Ready(std::future<T>& f, int ms) {
  return f.wait_for(std::chrono::milliseconds(ms)) == std::future_status::ready;
}

bool TestReadersShareTheLock() {
  AsyncReaderWriterLock lock;
  std::future<Result<LockTicket> > r1 = lock.AcquireReaderLock();
  std::future<Result<LockTicket> > r2 = lock.AcquireReaderLock();
  CHECK_LOCK(Ready(r1, 1000) && Ready(r2, 1000), "both readers admitted");
  Result<LockTicket> t1 = r1.get();
  Result<LockTicket> t2 = r2.get();
  CHECK_LOCK(t1.ok() && t2.ok(), "reader tickets ok");
  CHECK_LOCK(!t1.value().exclusive() && t1.value().valid(), "concurrent ticket");
  CHECK_LOCK(t1.value().id() != t2.value().id(), "distinct ticket ids");
  CHECK_LOCK(lock.ActiveReaderCount() == 2, "two active readers");
  t1.value().Release();
  t1.value().Release();
  CHECK_LOCK(lock.ActiveReaderCount() == 1, "double release is a no-op");
  t2.value().Release();
  CHECK_LOCK(lock.ActiveReaderCount() == 0, "no readers left");
  return true;
}

bool TestWriterIsExclusive() {
  AsyncReaderWriterLock lock;
  Result<LockTicket> reader = lock.AcquireReaderLock().get();
  CHECK_LOCK(reader.ok(), "reader admitted");

  std::future<Result<LockTicket> > writer = lock.AcquireWriterLock();
  CHECK_LOCK(!Ready(writer, 50), "writer waits for reader");
  reader.value().Release();
  CHECK_LOCK(Ready(writer, 1000), "writer admitted after reader left");
  Result<LockTicket> w = writer.get();
  CHECK_LOCK(w.ok() && w.value().exclusive() && lock.IsWriterActive(), "writer holds lock");

  std::future<Result<LockTicket> > other_writer = lock.AcquireWriterLock();
  std::future<Result<LockTicket> > late_reader = lock.AcquireReaderLock();
  CHECK_LOCK(!Ready(other_writer, 50) && !Ready(late_reader, 1), "everyone waits for writer");
  w.value().Release();
  CHECK_LOCK(Ready(other_writer, 1000), "next writer admitted");
  CHECK_LOCK(!Ready(late_reader, 50), "reader still waits behind writer");
  Result<LockTicket> w2 = other_writer.get();
  w2.value().Release();
  CHECK_LOCK(Ready(late_reader, 1000), "reader admitted last");
  return late_reader.get().ok();
}

bool TestQueuedWriterBlocksLaterReaders() {
  AsyncReaderWriterLock lock;
  Result<LockTicket> first = lock.AcquireReaderLock().get();
  std::future<Result<LockTicket> > writer = lock.AcquireWriterLock();
  std::future<Result<LockTicket> > second = lock.AcquireReaderLock();
  CHECK_LOCK(!Ready(writer, 50), "writer queued");
  CHECK_LOCK(!Ready(second, 1), "reader queued behind writer");
  CHECK_LOCK(lock.PendingCount() == 2, "two pending");
  first.value().Release();
  Result<LockTicket> w = writer.get();
  CHECK_LOCK(w.ok(), "writer admitted first");
  CHECK_LOCK(!Ready(second, 30), "reader still waits");
  w.value().Release();
  CHECK_LOCK(Ready(second, 1000) && second.get().ok(), "reader admitted after writer");
  return true;
}

bool TestExclusiveWorkIsSerialized() {
  AsyncReaderWriterLock lock;
  std::atomic<int> inside(0);
  std::atomic<int> max_inside(0);
  std::vector<std::future<Status> > results;
  for (int i = 0; i < 20; ++i) {
    results.push_back(cachekit::threading::AddExclusiveWork(lock, [&inside, &max_inside]() {
      const int now = inside.fetch_add(1) + 1;
      int observed = max_inside.load();
      while (observed < now && !max_inside.compare_exchange_weak(observed, now)) {
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(2));
      inside.fetch_sub(1);
      return Status::Ok();
    }));
  }
  for (std::size_t i = 0; i < results.size(); ++i) {
    CHECK_LOCK(results[i].get().ok(), "exclusive work ok");
  }
  CHECK_LOCK(max_inside.load() == 1, "never two writers");
  return true;
}

bool TestConcurrentWorkRuns() {
  AsyncReaderWriterLock lock;
  std::atomic<int> inside(0);
  std::atomic<int> max_inside(0);
  std::vector<std::future<Status> > results;
  for (int i = 0; i < 4; ++i) {
    results.push_back(cachekit::threading::AddConcurrentWork(lock, [&inside, &max_inside]() {
      const int now = inside.fetch_add(1) + 1;
      int observed = max_inside.load();
      while (observed < now && !max_inside.compare_exchange_weak(observed, now)) {
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
      inside.fetch_sub(1);
      return Status::Ok();
    }, cachekit::api::CancellationToken()));
  }
  for (std::size_t i = 0; i < results.size(); ++i) {
    CHECK_LOCK(results[i].get().ok(), "concurrent work ok");
  }
  return lock.ActiveReaderCount() == 0;
}

bool TestWorkExceptionBecomesStatus() {
  AsyncReaderWriterLock lock;
  Status st = cachekit::threading::AddExclusiveWork(lock, []() -> Status {
                throw std::runtime_error("work failed");
              }).get();
  CHECK_LOCK(st.code() == StatusCode::kInternalError, "exception mapped");
  CHECK_LOCK(st.message().find("work failed") != std::string::npos, "message kept");
  CHECK_LOCK(!lock.IsWriterActive(), "lock released after failure");

  Result<int> typed = cachekit::threading::RunUnderLock<Result<int> >(
                          lock, LockLane::kConcurrent, []() { return Result<int>(5); })
                          .get();
  CHECK_LOCK(typed.ok() && typed.value() == 5, "typed result");
  return true;
}

bool TestCancelPendingRequest() {
  AsyncReaderWriterLock lock;
  Result<LockTicket> writer = lock.AcquireWriterLock().get();
  cachekit::api::CancellationSource source;
  std::future<Result<LockTicket> > queued = lock.AcquireReaderLock(source.Token());
  CHECK_LOCK(!Ready(queued, 30), "reader queued");
  source.Cancel();
  CHECK_LOCK(Ready(queued, 1000), "cancel resolves request");
  CHECK_LOCK(queued.get().status().code() == StatusCode::kCanceled, "kCanceled");
  CHECK_LOCK(lock.PendingCount() == 0, "request removed from queue");
  writer.value().Release();
  CHECK_LOCK(lock.ActiveReaderCount() == 0, "canceled reader never admitted");

  cachekit::api::CancellationSource pre;
  pre.Cancel();
  CHECK_LOCK(lock.AcquireWriterLock(pre.Token()).get().status().code() == StatusCode::kCanceled,
             "already canceled token");
  return true;
}

bool TestCanceledWriterUnblocksReaders() {
  AsyncReaderWriterLock lock;
  Result<LockTicket> reader = lock.AcquireReaderLock().get();
  cachekit::api::CancellationSource source;
  std::future<Result<LockTicket> > writer = lock.AcquireWriterLock(source.Token());
  std::future<Result<LockTicket> > next_reader = lock.AcquireReaderLock();
  CHECK_LOCK(!Ready(next_reader, 30), "reader blocked by queued writer");
  source.Cancel();
  CHECK_LOCK(writer.get().status().code() == StatusCode::kCanceled, "writer canceled");
  CHECK_LOCK(Ready(next_reader, 1000) && next_reader.get().ok(), "reader admitted");
  return true;
}

bool TestDisposeWaitsAndRejects() {
  AsyncReaderWriterLock lock;
  Result<LockTicket> reader = lock.AcquireReaderLock().get();
  std::shared_future<Status> disposing = lock.DisposeAsync();
  CHECK_LOCK(disposing.wait_for(std::chrono::milliseconds(50)) == std::future_status::timeout,
             "dispose waits for holder");
  CHECK_LOCK(lock.AcquireReaderLock().get().status().code() == StatusCode::kDisposed,
             "new requests rejected while disposing");
  reader.value().Release();
  CHECK_LOCK(disposing.get().ok(), "dispose completed");
  CHECK_LOCK(lock.IsDisposed(), "disposed");
  CHECK_LOCK(lock.Dispose().ok(), "second dispose returns the same result");
  CHECK_LOCK(cachekit::threading::AddExclusiveWork(lock, []() { return Status::Ok(); })
                     .get()
                     .code() == StatusCode::kDisposed,
             "work rejected after dispose");
  return true;
}

#undef CHECK_LOCK

}  // namespace

int main() {
  struct TestCase {
    const char* name;
    bool (*fn)();
  };

  const TestCase tests[] = {
      {"readers_share_the_lock", TestReadersShareTheLock},
      {"writer_is_exclusive", TestWriterIsExclusive},
      {"queued_writer_blocks_later_readers", TestQueuedWriterBlocksLaterReaders},
      {"exclusive_work_is_serialized", TestExclusiveWorkIsSerialized},
      {"concurrent_work_runs", TestConcurrentWorkRuns},
      {"work_exception_becomes_status", TestWorkExceptionBecomesStatus},
      {"cancel_pending_request", TestCancelPendingRequest},
      {"canceled_writer_unblocks_readers", TestCanceledWriterUnblocksReaders},
      {"dispose_waits_and_rejects", TestDisposeWaitsAndRejects},
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
