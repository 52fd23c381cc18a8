#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

#include "cachekit/api/export.hpp"
#include "cachekit/api/status.hpp"
#include "cachekit/api/version.hpp"

namespace cachekit {
namespace task {

typedef std::uint64_t TaskId;

struct ExecutorOptions {
  std::size_t worker_count = 0;
  std::size_t queue_capacity = 0;
};

struct ExecutorStats {
  std::uint64_t submitted = 0;
  std::uint64_t completed = 0;
  std::uint64_t failed = 0;
  std::uint64_t canceled = 0;
  std::uint64_t rejected = 0;
  std::size_t queue_depth = 0;
  std::size_t queue_high_watermark = 0;
};

class IExecutor {
 public:
  virtual ~IExecutor() {}

  // 返回实现名称，便于定位运行时使用的是哪种调度后端。
  virtual const char* Name() const = 0;

  // 返回当前对象遵循的接口版本。
  virtual std::uint32_t ApiVersion() const = 0;

  // 释放实例对象本身。调用后指针失效。
  virtual void Release() = 0;

  // 提交一个异步任务。
  // 参数：
  // - fn: 任务函数指针，不允许为 nullptr。
  // - user_data: 透传给 fn 的用户上下文。
  // 返回：
  // - kOk：任务已入调度队列。
  // - kInvalidArgument：fn 为空。
  // 线程安全：线程安全。
  virtual api::Status Submit(void (*fn)(void*), void* user_data) = 0;

  // 提交一个闭包任务并返回任务 ID。缓存、对象池与读写锁都通过该入口投递工作。
  // 参数：
  // - work: 任务闭包，不允许为空。
  // 返回：
  // - kOk：value 为任务 ID。
  // - kInvalidArgument：work 为空。
  // - kWouldBlock：队列已满。
  // - kInternalError：执行器正在停止。
  // 线程安全：线程安全。
  virtual api::Result<TaskId> Post(const std::function<void()>& work) = 0;

  // 等待指定任务完成。timeout_ms=0 表示无限等待。
  virtual api::Status Wait(TaskId id, std::uint32_t timeout_ms) = 0;

  // 尝试取消一个尚未运行的任务。
  virtual api::Status TryCancel(TaskId id) = 0;

  // 等待当前执行器中“此前提交”的任务全部结束。
  // 返回：
  // - kOk：全部任务已完成。
  // 线程安全：线程安全；不可在本执行器的工作线程中调用。
  virtual api::Status WaitAll() = 0;

  // 获取执行器运行时统计信息。
  virtual api::Result<ExecutorStats> QueryStats() const = 0;
};

// Process-wide executor used when callers do not inject one.
// Sized from hardware_concurrency with a floor of four workers so that blocking waits
// inside pooled work cannot starve lock grants.
CACHEKIT_API IExecutor* DefaultExecutor();

}  // namespace task
}  // namespace cachekit
