#include "cachekit/task/iexecutor.hpp"

#include <thread>

#include "task/thread_pool_executor.hpp"

namespace cachekit {
namespace task {

namespace {

std::size_t DefaultWorkerCount() {
  const std::size_t hw = static_cast<std::size_t>(std::thread::hardware_concurrency());
  return hw < 4 ? 4 : hw;
}

}  // namespace

IExecutor* DefaultExecutor() {
  static ThreadPoolExecutor executor(DefaultWorkerCount());
  return &executor;
}

}  // namespace task
}  // namespace cachekit
