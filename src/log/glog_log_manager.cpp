#include "log/glog_log_manager.hpp"

#include <glog/logging.h>
#include <sys/stat.h>
#include <sys/types.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <memory>
#include <mutex>
#include <sstream>

namespace cachekit {
namespace log {

#define CK_STATUS(code, message) api::Status::FromModule((code), (message), api::ErrorModule::kLog)

namespace {

struct GlobalState {
  GlobalState() : initialized(false), owns_glog(false), failure_handler_installed(false) {}

  std::mutex mu;
  LoggingOptions options;
  std::string output_dir;
  std::unique_ptr<google::LogSink> sink;
  bool initialized;
  // False when glog was already initialized by the host application.
  bool owns_glog;
  bool failure_handler_installed;
};

GlobalState& State() {
  static GlobalState state;
  return state;
}

std::string BaseName(const std::string& path) {
  std::size_t end = path.size();
  while (end > 0 && path[end - 1] == '/') --end;
  if (end == 0) return std::string();
  const std::size_t pos = path.find_last_of('/', end - 1);
  if (pos == std::string::npos) return path.substr(0, end);
  return path.substr(pos + 1, end - pos - 1);
}

std::string JoinPath(const std::string& left, const std::string& right) {
  if (left.empty()) return right;
  if (left[left.size() - 1] == '/') return left + right;
  return left + "/" + right;
}

bool DirectoryExists(const std::string& path) {
  struct stat info;
  if (stat(path.c_str(), &info) != 0) return false;
  return (info.st_mode & S_IFDIR) != 0;
}

bool CreateDirectories(const std::string& path) {
  if (path.empty()) return false;
  if (DirectoryExists(path)) return true;
  std::string current = path[0] == '/' ? "/" : "";
  std::size_t pos = path[0] == '/' ? 1 : 0;
  while (pos <= path.size()) {
    const std::size_t next = path.find('/', pos);
    const std::string part =
        next == std::string::npos ? path.substr(pos) : path.substr(pos, next - pos);
    if (!part.empty()) {
      current = current.empty() ? part : JoinPath(current, part);
      if (!DirectoryExists(current)) {
        errno = 0;
        if (mkdir(current.c_str(), 0755) != 0 && errno != EEXIST) return false;
      }
    }
    if (next == std::string::npos) break;
    pos = next + 1;
  }
  return DirectoryExists(path);
}

std::string Trim(const std::string& s) {
  const std::size_t start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) return std::string();
  const std::size_t end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

bool ParseBool(const std::string& value, bool* out) {
  const std::string v = ToLower(Trim(value));
  if (v == "1" || v == "true" || v == "yes" || v == "on") {
    *out = true;
    return true;
  }
  if (v == "0" || v == "false" || v == "no" || v == "off") {
    *out = false;
    return true;
  }
  return false;
}

bool ParseInt(const std::string& value, int* out) {
  const std::string v = Trim(value);
  if (v.empty()) return false;
  std::istringstream in(v);
  int parsed = 0;
  in >> parsed;
  if (in.fail() || !in.eof()) return false;
  *out = parsed;
  return true;
}

bool LevelFromText(const std::string& value, int* out) {
  const std::string v = ToLower(Trim(value));
  if (v == "info") {
    *out = google::GLOG_INFO;
  } else if (v == "warning" || v == "warn") {
    *out = google::GLOG_WARNING;
  } else if (v == "error") {
    *out = google::GLOG_ERROR;
  } else if (v == "fatal") {
    *out = google::GLOG_FATAL;
  } else {
    int parsed = 0;
    if (!ParseInt(v, &parsed) || parsed < 0 || parsed > 3) return false;
    *out = parsed;
  }
  return true;
}

void CutComment(std::string* value) {
  const std::size_t hash = value->find('#');
  const std::size_t slash = value->find("//");
  const std::size_t pos = std::min(hash, slash);
  if (pos != std::string::npos) *value = Trim(value->substr(0, pos));
}

std::string TimestampPrefix() {
  const std::chrono::system_clock::time_point now = std::chrono::system_clock::now();
  const std::time_t t = std::chrono::system_clock::to_time_t(now);
  std::tm tm;
  localtime_r(&t, &tm);
  const long long us =
      std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count() %
      1000000LL;
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%04d%02d%02d %02d:%02d:%02d.%06lld", tm.tm_year + 1900,
                tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, us);
  return std::string(buf);
}

std::string JsonEscape(const std::string& input) {
  std::ostringstream out;
  for (std::size_t i = 0; i < input.size(); ++i) {
    const unsigned char c = static_cast<unsigned char>(input[i]);
    switch (c) {
      case '\\':
        out << "\\\\";
        break;
      case '"':
        out << "\\\"";
        break;
      case '\n':
        out << "\\n";
        break;
      case '\t':
        out << "\\t";
        break;
      default:
        if (c < 0x20) {
          out << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c)
              << std::dec;
        } else {
          out << static_cast<char>(c);
        }
        break;
    }
  }
  return out.str();
}

// One line per message, either "<ts> [L] text" or a JSON object per line.
class FormattedSink : public google::LogSink {
 public:
  FormattedSink(const std::string& file_path, bool json)
      : stream_(file_path.c_str(), std::ios::app), json_(json) {}

  void send(google::LogSeverity severity, const char*, const char*, int, const std::tm*,
            const char* message, size_t length) override {
    if (!stream_.is_open()) return;
    std::string msg = message != NULL ? std::string(message, length) : std::string();
    while (!msg.empty() && (msg[msg.size() - 1] == '\n' || msg[msg.size() - 1] == '\r')) {
      msg.erase(msg.size() - 1);
    }
    const char levels[] = {'I', 'W', 'E', 'F'};
    const char level = levels[std::max(0, std::min(3, static_cast<int>(severity)))];
    std::lock_guard<std::mutex> lock(mu_);
    if (json_) {
      stream_ << "{\"ts\":\"" << TimestampPrefix() << "\",\"level\":\"" << level
              << "\",\"message\":\"" << JsonEscape(msg) << "\"}\n";
    } else {
      stream_ << TimestampPrefix() << " [" << level << "] " << msg << '\n';
    }
    stream_.flush();
  }

 private:
  std::mutex mu_;
  std::ofstream stream_;
  bool json_;
};

api::Status LoadFromFile(const std::string& path, LoggingOptions* options) {
  *options = LoggingOptions();
  if (path.empty()) return api::Status::Ok();
  std::ifstream input(path.c_str());
  if (!input.is_open()) {
    return CK_STATUS(api::StatusCode::kNotFound, "logging config not found: " + path);
  }
  return ParseLoggingConfig(input, options);
}

// Caller holds State().mu.
api::Status ApplyOptions(GlobalState* state, const LoggingOptions& options) {
  std::string output_dir;
  if (!options.log_dir.empty()) {
    if (!CreateDirectories(options.log_dir)) {
      return CK_STATUS(api::StatusCode::kIoError, "cannot create log_dir " + options.log_dir);
    }
    output_dir = options.log_dir;
  }

  if (options.glog_file_output && !output_dir.empty()) {
    FLAGS_log_dir = output_dir;
  } else {
    FLAGS_log_dir.clear();
  }

  // Without glog file output everything goes to stderr, so glog never creates files on
  // its own.
  FLAGS_logtostderr = options.glog_file_output ? options.logtostderr : true;
  FLAGS_alsologtostderr = options.glog_file_output ? options.alsologtostderr : false;
  FLAGS_colorlogtostderr = options.colorlogtostderr;
  FLAGS_log_prefix = options.log_prefix;
  FLAGS_minloglevel = options.min_log_level;
  FLAGS_stderrthreshold = options.stderr_threshold;
  FLAGS_v = options.verbosity;
  if (options.install_failure_signal_handler && !state->failure_handler_installed) {
    google::InstallFailureSignalHandler();
    state->failure_handler_installed = true;
  }

  if (state->sink) {
    google::RemoveLogSink(state->sink.get());
    state->sink.reset();
  }
  if (options.simple_format || options.json_format) {
    const std::string base = output_dir.empty() ? "." : output_dir;
    const std::string file = JoinPath(base, options.json_format ? "app.jsonl" : "app.log");
    state->sink.reset(new FormattedSink(file, options.json_format));
    google::AddLogSink(state->sink.get());
    FLAGS_log_prefix = false;
  }

  state->options = options;
  state->output_dir = output_dir;
  return api::Status::Ok();
}

}  // namespace

api::Status ParseLoggingConfig(std::istream& input, LoggingOptions* options) {
  LoggingOptions parsed;
  std::string line;
  int lineno = 0;
  while (std::getline(input, line)) {
    ++lineno;
    const std::string trimmed = Trim(line);
    if (trimmed.empty() || trimmed[0] == '#' || trimmed.compare(0, 2, "//") == 0) continue;
    const std::size_t sep = trimmed.find_first_of("=:");
    if (sep == std::string::npos) continue;

    const std::string key = ToLower(Trim(trimmed.substr(0, sep)));
    std::string value = Trim(trimmed.substr(sep + 1));
    CutComment(&value);

    bool ok = true;
    if (key == "log_dir") {
      parsed.log_dir = value;
    } else if (key == "simple_format") {
      ok = ParseBool(value, &parsed.simple_format);
    } else if (key == "json_format") {
      ok = ParseBool(value, &parsed.json_format);
    } else if (key == "install_failure_signal_handler" || key == "crash_stacktrace") {
      ok = ParseBool(value, &parsed.install_failure_signal_handler);
    } else if (key == "glog_file_output") {
      ok = ParseBool(value, &parsed.glog_file_output);
    } else if (key == "logtostderr") {
      ok = ParseBool(value, &parsed.logtostderr);
    } else if (key == "alsologtostderr") {
      ok = ParseBool(value, &parsed.alsologtostderr);
    } else if (key == "colorlogtostderr") {
      ok = ParseBool(value, &parsed.colorlogtostderr);
    } else if (key == "log_prefix") {
      ok = ParseBool(value, &parsed.log_prefix);
    } else if (key == "minloglevel") {
      ok = LevelFromText(value, &parsed.min_log_level);
    } else if (key == "stderrthreshold") {
      ok = LevelFromText(value, &parsed.stderr_threshold);
    } else if (key == "v" || key == "verbosity") {
      ok = ParseInt(value, &parsed.verbosity);
    }
    if (!ok) {
      std::ostringstream message;
      message << "logging config line " << lineno << ": bad value for " << key;
      return CK_STATUS(api::StatusCode::kInvalidArgument, message.str());
    }
  }
  *options = parsed;
  return api::Status::Ok();
}

const char* GlogLogManager::Name() const { return "cachekit.log.glog"; }

std::uint32_t GlogLogManager::ApiVersion() const { return api::kApiVersion; }

void GlogLogManager::Release() { delete this; }

api::Status GlogLogManager::Init(const std::string& app_name, const std::string& config_path) {
  if (app_name.empty()) {
    return CK_STATUS(api::StatusCode::kInvalidArgument, "app_name is empty");
  }
  GlobalState& state = State();
  std::lock_guard<std::mutex> lock(state.mu);
  if (state.initialized) return api::Status::Ok();

  LoggingOptions options;
  api::Status st = LoadFromFile(config_path, &options);
  if (!st.ok()) return st;

  const std::string name = BaseName(app_name).empty() ? "cachekit" : BaseName(app_name);
  const bool owns_glog = !google::IsGoogleLoggingInitialized();
  if (owns_glog) google::InitGoogleLogging(name.c_str());
  st = ApplyOptions(&state, options);
  if (!st.ok()) {
    if (owns_glog) google::ShutdownGoogleLogging();
    return st;
  }
  state.initialized = true;
  state.owns_glog = owns_glog;
  return api::Status::Ok();
}

api::Status GlogLogManager::Reload(const std::string& config_path) {
  if (config_path.empty()) {
    return CK_STATUS(api::StatusCode::kInvalidArgument, "config_path is empty");
  }
  GlobalState& state = State();
  std::lock_guard<std::mutex> lock(state.mu);
  if (!state.initialized) {
    return CK_STATUS(api::StatusCode::kInvalidArgument, "log manager is not initialized");
  }
  LoggingOptions options;
  api::Status st = LoadFromFile(config_path, &options);
  if (!st.ok()) return st;
  return ApplyOptions(&state, options);
}

api::Status GlogLogManager::Log(LogSeverity severity, const std::string& message) {
  const int level = std::max(0, std::min(3, static_cast<int>(severity)));
  google::LogMessage(__FILE__, __LINE__, static_cast<google::LogSeverity>(level)).stream()
      << message;
  return api::Status::Ok();
}

api::Result<LoggingOptions> GlogLogManager::CurrentOptions() const {
  GlobalState& state = State();
  std::lock_guard<std::mutex> lock(state.mu);
  return api::Result<LoggingOptions>(state.options);
}

api::Status GlogLogManager::Shutdown() {
  GlobalState& state = State();
  std::lock_guard<std::mutex> lock(state.mu);
  if (!state.initialized) return api::Status::Ok();
  if (state.sink) {
    google::RemoveLogSink(state.sink.get());
    state.sink.reset();
  }
  if (state.owns_glog) google::ShutdownGoogleLogging();
  state.output_dir.clear();
  state.initialized = false;
  state.owns_glog = false;
  return api::Status::Ok();
}

#undef CK_STATUS

}  // namespace log
}  // namespace cachekit
