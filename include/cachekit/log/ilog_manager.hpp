#pragma once

#include <cstdint>
#include <string>

#include "cachekit/api/status.hpp"
#include "cachekit/api/version.hpp"
#include "cachekit/log/log_types.hpp"

namespace cachekit {
namespace log {

class ILogManager {
 public:
  virtual ~ILogManager() {}

  // 返回实现名称，便于排查“当前到底绑定了哪个实现”。
  virtual const char* Name() const = 0;

  // 返回实现遵循的 API 版本，用于运行期兼容性检查。
  virtual std::uint32_t ApiVersion() const = 0;

  // 释放对象本身。调用后指针失效。
  virtual void Release() = 0;

  // 初始化日志系统（glog）。
  // 参数：
  // - app_name: 应用名，常用 argv[0]。
  // - config_path: key=value 配置文件路径，可为空（使用默认配置）。
  // 返回：
  // - kOk：可开始写日志；已初始化时也返回 kOk。
  // - kInvalidArgument：app_name 为空或配置项取值非法。
  // - kNotFound：配置文件不存在。
  // - kIoError：log_dir 无法创建。
  // 线程安全：线程安全；建议只在主线程调用一次。
  virtual api::Status Init(const std::string& app_name, const std::string& config_path) = 0;

  // 运行期重载配置。失败不会破坏既有已生效配置。
  // 返回：未初始化时返回 kInvalidArgument。
  virtual api::Status Reload(const std::string& config_path) = 0;

  // 写一条日志。
  // 线程安全：线程安全。
  virtual api::Status Log(LogSeverity severity, const std::string& message) = 0;

  // 读取当前已生效的日志配置快照。
  virtual api::Result<LoggingOptions> CurrentOptions() const = 0;

  // 关闭日志系统并释放底层资源。重复调用返回 kOk。
  virtual api::Status Shutdown() = 0;
};

}  // namespace log
}  // namespace cachekit
