#include "cachekit/cachekit.hpp"
#include "log/glog_log_manager.hpp"

#include <sys/stat.h>
#include <sys/types.h>

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

namespace {

using cachekit::api::Result;
using cachekit::api::Status;
using cachekit::api::StatusCode;
using cachekit::config::CacheConfig;
using cachekit::config::CacheOptions;

#define CHECK_CONFIG(cond, msg) \
  do { \
    if (!(cond)) { \
      std::printf("[CONFIG-FAIL] %s\n", msg); \
      return false; \
    } \
  } while (0)

std::string JoinPath(const std::string& left, const std::string& right) {
  if (left.empty()) return right;
  if (left[left.size() - 1] == '/') return left + right;
  return left + "/" + right;
}

std::string TempDirectory() {
  const char* tmp = std::getenv("TMPDIR");
  if (tmp && *tmp) return tmp;
  return "/tmp";
}

std::string UniqueTestDir(const std::string& name) {
  const long long now =
      static_cast<long long>(std::chrono::steady_clock::now().time_since_epoch().count());
  return JoinPath(TempDirectory(), "cachekit_" + name + "_" + std::to_string(now));
}

bool MakeDir(const std::string& path) {
  errno = 0;
  return mkdir(path.c_str(), 0755) == 0 || errno == EEXIST;
}

void RemoveTree(const std::string& path) {
  const std::string cmd = "rm -rf \"" + path + "\"";
  const int rc = std::system(cmd.c_str());
  if (rc != 0) std::printf("cleanup of %s returned %d\n", path.c_str(), rc);
}

bool WriteTextFile(const std::string& path, const std::string& content) {
  std::ofstream out(path.c_str());
  if (!out.is_open()) return false;
  out << content;
  return out.good();
}

std::string ReadTextFile(const std::string& path) {
  std::ifstream in(path.c_str());
  if (!in.is_open()) return std::string();
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

bool TestCacheSectionParsed() {
  Result<CacheOptions> parsed = CacheConfig::Parse(
      "{\"cache\": {\"default_expiry_ms\": 1500, \"expiration_batch_window_ms\": 25,"
      " \"reset_threshold\": 100, \"notify_on_executor\": true, \"unknown\": 1}}");
  CHECK_CONFIG(parsed.ok(), "parse ok");
  CHECK_CONFIG(parsed.value().default_expiry == cachekit::cache::Duration(1500), "expiry");
  CHECK_CONFIG(parsed.value().expiration_batch_window == cachekit::cache::Duration(25),
               "batch window");
  CHECK_CONFIG(parsed.value().reset_threshold == 100, "threshold");
  CHECK_CONFIG(parsed.value().notify_on_executor, "notify flag");
  return true;
}

bool TestBareObjectAndDefaults() {
  Result<CacheOptions> bare = CacheConfig::Parse("{\"default_expiry_ms\": -1}");
  CHECK_CONFIG(bare.ok(), "bare object");
  CHECK_CONFIG(bare.value().default_expiry == cachekit::cache::kNoExpiry, "negative is never");
  CHECK_CONFIG(bare.value().reset_threshold == 0 && !bare.value().notify_on_executor,
               "missing fields keep defaults");

  Result<CacheOptions> empty = CacheConfig::Parse("{}");
  CHECK_CONFIG(empty.ok() && empty.value().default_expiry == cachekit::cache::kNoExpiry,
               "empty object");
  return true;
}

bool TestBadFieldsRejected() {
  Result<CacheOptions> text = CacheConfig::Parse("{\"cache\": {\"reset_threshold\": \"ten\"}}");
  CHECK_CONFIG(text.status().code() == StatusCode::kInvalidArgument, "string threshold");
  CHECK_CONFIG(text.status().hex_code() ==
                   cachekit::api::MakeErrorCode(cachekit::api::ErrorModule::kConfig,
                                                StatusCode::kInvalidArgument,
                                                cachekit::api::kDetailConfigBadField),
               "bad field detail");

  Result<CacheOptions> negative =
      CacheConfig::Parse("{\"cache\": {\"expiration_batch_window_ms\": -5}}");
  CHECK_CONFIG(negative.status().code() == StatusCode::kOutOfRange, "negative window");

  Result<CacheOptions> flag = CacheConfig::Parse("{\"notify_on_executor\": 1}");
  CHECK_CONFIG(flag.status().code() == StatusCode::kInvalidArgument, "non-boolean flag");

  Result<CacheOptions> fractional = CacheConfig::Parse("{\"default_expiry_ms\": 1.5}");
  CHECK_CONFIG(fractional.status().code() == StatusCode::kInvalidArgument, "fractional expiry");

  CHECK_CONFIG(CacheConfig::Parse("{\"cache\": []}").status().code() ==
                   StatusCode::kInvalidArgument,
               "cache section must be object");
  CHECK_CONFIG(CacheConfig::Parse("[1, 2]").status().code() == StatusCode::kInvalidArgument,
               "root must be object");

  Result<CacheOptions> broken = CacheConfig::Parse("{\"cache\": ");
  CHECK_CONFIG(broken.status().code() == StatusCode::kInvalidArgument, "malformed json");
  CHECK_CONFIG(broken.status().hex_code() ==
                   cachekit::api::MakeErrorCode(cachekit::api::ErrorModule::kConfig,
                                                StatusCode::kInvalidArgument,
                                                cachekit::api::kDetailConfigParseFailed),
               "parse failure detail");
  return true;
}

bool TestMissingFile() {
  Result<CacheOptions> loaded = CacheConfig::LoadFile("/nonexistent/cachekit/cache.json");
  CHECK_CONFIG(loaded.status().code() == StatusCode::kNotFound, "missing file");
  return true;
}

bool TestSaveAndLoad() {
  const std::string root = UniqueTestDir("config_roundtrip");
  CHECK_CONFIG(MakeDir(root), "temp dir");
  const std::string path = JoinPath(root, "cache.json");

  CacheOptions options;
  options.default_expiry = cachekit::cache::Duration(250);
  options.reset_threshold = 7;
  const cachekit::json::Json doc = CacheConfig::ToJson(options);
  CHECK_CONFIG(doc.contains("cache") && doc["cache"]["default_expiry_ms"] == 250, "json shape");
  Status saved = cachekit::json::JsonCodec::SaveFile(path, doc);
  Result<CacheOptions> loaded = CacheConfig::LoadFile(path);
  RemoveTree(root);

  CHECK_CONFIG(saved.ok(), "saved");
  CHECK_CONFIG(loaded.ok(), "loaded");
  CHECK_CONFIG(loaded.value().default_expiry == options.default_expiry, "expiry survives");
  CHECK_CONFIG(loaded.value().reset_threshold == 7, "threshold survives");

  const cachekit::json::Json never = CacheConfig::ToJson(CacheOptions());
  CHECK_CONFIG(never["cache"]["default_expiry_ms"] == -1, "no expiry written as -1");
  CHECK_CONFIG(cachekit::json::JsonCodec::SaveFile("/nonexistent/dir/x.json", never).code() ==
                   StatusCode::kIoError,
               "unwritable path");
  return true;
}

bool TestLoggingConfigParsed() {
  std::istringstream input(
      "# comment\n"
      "log_dir = /var/tmp/cachekit\n"
      "json_format: yes\n"
      "minloglevel = warning  # inline comment\n"
      "stderrthreshold = 3\n"
      "v = 2\n"
      "install_failure_signal_handler = off\n"
      "unknown_key = whatever\n");
  cachekit::log::LoggingOptions options;
  CHECK_CONFIG(cachekit::log::ParseLoggingConfig(input, &options).ok(), "parse ok");
  CHECK_CONFIG(options.log_dir == "/var/tmp/cachekit", "log dir");
  CHECK_CONFIG(options.json_format && !options.simple_format, "json format");
  CHECK_CONFIG(options.min_log_level == 1 && options.stderr_threshold == 3, "levels");
  CHECK_CONFIG(options.verbosity == 2, "verbosity");
  CHECK_CONFIG(!options.install_failure_signal_handler, "signal handler off");

  std::istringstream bad("v = 1\nminloglevel = loud\n");
  cachekit::log::LoggingOptions untouched;
  untouched.verbosity = 9;
  Status st = cachekit::log::ParseLoggingConfig(bad, &untouched);
  CHECK_CONFIG(st.code() == StatusCode::kInvalidArgument, "bad level rejected");
  CHECK_CONFIG(st.message().find("line 2") != std::string::npos, "line number reported");
  CHECK_CONFIG(untouched.verbosity == 9, "options untouched on failure");
  return true;
}

bool TestReloadBeforeInitFails() {
  cachekit::log::GlogLogManager manager;
  CHECK_CONFIG(manager.Reload("not_used.conf").code() == StatusCode::kInvalidArgument,
               "reload before init");
  CHECK_CONFIG(manager.Init("", "").code() == StatusCode::kInvalidArgument, "empty app name");
  CHECK_CONFIG(manager.Init("config_tests", "/nonexistent/logging.conf").code() ==
                   StatusCode::kNotFound,
               "missing config");
  CHECK_CONFIG(manager.Shutdown().ok(), "shutdown without init");
  return true;
}

// glog is process-wide, so this is the only test that initializes it.
bool TestLogManagerLifecycle() {
  const std::string root = UniqueTestDir("log_lifecycle");
  const std::string logs_dir = JoinPath(root, "logs");
  const std::string good_cfg = JoinPath(root, "good.conf");
  const std::string bad_cfg = JoinPath(root, "bad.conf");
  CHECK_CONFIG(MakeDir(root), "temp dir");

  const std::string good = "log_dir = " + logs_dir + "\n" +
                           "simple_format = true\n" +
                           "v = 1\n" +
                           "install_failure_signal_handler = false\n";
  CHECK_CONFIG(WriteTextFile(good_cfg, good) && WriteTextFile(bad_cfg, "v = not_a_number\n"),
               "write configs");

  cachekit::log::GlogLogManager manager;
  Status init = manager.Init("config_tests", good_cfg);
  const Result<cachekit::log::LoggingOptions> before = manager.CurrentOptions();
  Status logged = manager.Log(cachekit::log::LogSeverity::kWarning, "hello-cachekit");
  Status reload = manager.Reload(bad_cfg);
  const Result<cachekit::log::LoggingOptions> after = manager.CurrentOptions();
  Status shutdown = manager.Shutdown();
  Status again = manager.Shutdown();
  const std::string body = ReadTextFile(JoinPath(logs_dir, "app.log"));
  RemoveTree(root);

  CHECK_CONFIG(init.ok(), "init");
  CHECK_CONFIG(before.ok() && before.value().simple_format && before.value().verbosity == 1,
               "options applied");
  CHECK_CONFIG(logged.ok(), "log");
  CHECK_CONFIG(reload.code() == StatusCode::kInvalidArgument, "bad reload rejected");
  CHECK_CONFIG(after.ok() && after.value().verbosity == 1 && after.value().simple_format,
               "reload failure keeps options");
  CHECK_CONFIG(shutdown.ok() && again.ok(), "shutdown idempotent");
  CHECK_CONFIG(body.find("hello-cachekit") != std::string::npos, "message written to file");
  return true;
}

#undef CHECK_CONFIG

}  // namespace

int main() {
  struct TestCase {
    const char* name;
    bool (*fn)();
  };

  const TestCase tests[] = {
      {"cache_section_parsed", TestCacheSectionParsed},
      {"bare_object_and_defaults", TestBareObjectAndDefaults},
      {"bad_fields_rejected", TestBadFieldsRejected},
      {"missing_file", TestMissingFile},
      {"save_and_load", TestSaveAndLoad},
      {"logging_config_parsed", TestLoggingConfigParsed},
      {"reload_before_init", TestReloadBeforeInitFails},
      {"log_manager_lifecycle", TestLogManagerLifecycle},
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
