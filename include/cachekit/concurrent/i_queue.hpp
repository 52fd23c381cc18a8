#pragma once

#include <cstddef>
#include <cstdint>

#include "cachekit/api/status.hpp"
#include "cachekit/api/version.hpp"

namespace cachekit {
namespace concurrent {

template <typename T>
class IQueue {
 public:
  virtual ~IQueue() {}

  // 返回实现名称，便于故障定位与性能归因。
  virtual const char* Name() const = 0;

  // 返回当前对象遵循的接口版本。
  virtual std::uint32_t ApiVersion() const = 0;

  // 非阻塞入队。
  // 返回：
  // - kOk：入队成功。
  // - kWouldBlock：队列当前不可写。
  // 线程安全：线程安全。
  virtual api::Status TryPush(const T& value) = 0;

  // 非阻塞移动入队，避免不必要的拷贝。对象池用它归还只可移动的实例。
  // 返回语义与 TryPush(const T&) 一致。
  virtual api::Status TryPushMove(T&& value) = 0;

  // 非阻塞出队，元素以移动方式交出。
  // 返回：
  // - kOk：value 为出队元素。
  // - kWouldBlock：队列当前无可读数据。
  // 线程安全：线程安全。
  virtual api::Result<T> TryPop() = 0;

  // 返回队列近似长度。
  // 说明：入队成功后递增、出队成功后递减，并发场景下只保证最终一致。
  virtual std::size_t ApproxSize() const = 0;

  // 返回当前是否为空（近似语义，适合快速分支判断）。
  virtual bool IsEmpty() const = 0;

  // 清空队列，返回被丢弃的元素数量。被丢弃元素在出队后立即析构。
  virtual api::Result<std::size_t> Clear() = 0;
};

}  // namespace concurrent
}  // namespace cachekit
