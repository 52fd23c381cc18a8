#pragma once

#include <istream>
#include <string>

#include "cachekit/log/ilog_manager.hpp"

namespace cachekit {
namespace log {

// Parses key=value (or key: value) lines. '#' and '//' start comments; unknown keys are
// ignored. Returns kInvalidArgument naming the first line with a malformed value.
api::Status ParseLoggingConfig(std::istream& input, LoggingOptions* options);

// glog-backed manager. glog state is process-wide, so every instance drives the same
// underlying logger.
class GlogLogManager : public ILogManager {
 public:
  GlogLogManager() {}
  ~GlogLogManager() override {}

  const char* Name() const override;
  std::uint32_t ApiVersion() const override;
  void Release() override;

  api::Status Init(const std::string& app_name, const std::string& config_path) override;
  api::Status Reload(const std::string& config_path) override;
  api::Status Log(LogSeverity severity, const std::string& message) override;
  api::Result<LoggingOptions> CurrentOptions() const override;
  api::Status Shutdown() override;
};

}  // namespace log
}  // namespace cachekit
