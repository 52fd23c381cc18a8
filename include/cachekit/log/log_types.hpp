#pragma once

#include <string>

namespace cachekit {
namespace log {

enum class LogSeverity { kInfo = 0, kWarning = 1, kError = 2, kFatal = 3 };

struct LoggingOptions {
  std::string log_dir;
  bool simple_format = false;
  bool json_format = false;
  bool install_failure_signal_handler = true;
  bool glog_file_output = false;
  bool logtostderr = false;
  bool alsologtostderr = false;
  bool colorlogtostderr = true;
  bool log_prefix = true;
  int min_log_level = 0;
  int stderr_threshold = 2;
  int verbosity = 0;
};

}  // namespace log
}  // namespace cachekit
