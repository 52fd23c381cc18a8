#include "cachekit/cachekit.hpp"

#include <chrono>
#include <cstdio>
#include <string>
#include <thread>
#include <vector>

namespace {

typedef cachekit::cache::ObservableCache<std::string, std::string> QuoteCache;

void PrintChange(const QuoteCache::Change& change) {
  if (!change.has_key()) {
    std::printf("change: %s\n", cachekit::cache::CacheChangeTypeName(change.type()));
    return;
  }
  std::printf("change: %-20s %s=%s\n", cachekit::cache::CacheChangeTypeName(change.type()),
              change.key().c_str(), change.value().c_str());
}

}  // namespace

int main(int argc, char* argv[]) {
  const std::string log_config = argc > 1 ? argv[1] : "config/logging.conf";
  const std::string cache_config = argc > 2 ? argv[2] : "config/cache.json";

  cachekit::log::ILogManager* logger = cachekit_create_log_manager();
  if (logger == NULL) {
    std::fprintf(stderr, "create logger failed\n");
    return 1;
  }

  cachekit::api::Status st = logger->Init(argv[0], log_config);
  if (!st.ok()) {
    std::fprintf(stderr, "Init failed: %s\n", st.ToString().c_str());
    cachekit_destroy_log_manager(logger);
    return 1;
  }

  cachekit::config::CacheOptions options;
  cachekit::api::Result<cachekit::config::CacheOptions> loaded =
      cachekit::config::CacheConfig::LoadFile(cache_config);
  if (loaded.ok()) {
    options = loaded.value();
  } else if (loaded.status().code() != cachekit::api::StatusCode::kNotFound) {
    std::fprintf(stderr, "cache config rejected: %s\n", loaded.status().ToString().c_str());
    cachekit_destroy_log_manager(logger);
    return 1;
  }

  int refreshes = 0;
  QuoteCache cache(options, [&refreshes](const std::string& symbol) {
    ++refreshes;
    return symbol + "@" + std::to_string(100 + refreshes);
  });

  cachekit::reactive::Subscription changes = cache.Changes().Subscribe(&PrintChange);
  cachekit::reactive::Subscription errors =
      cache.UnhandledErrors().Subscribe([](const cachekit::api::Status& error) {
        std::printf("background error: %s\n", error.ToString().c_str());
      });

  logger->Log(cachekit::log::LogSeverity::kInfo, "cachekit cache example started");

  std::vector<cachekit::api::Status> added;
  added.push_back(cache.Add("ACME", "ACME@100").get());
  added.push_back(cache.Add("INIT", "INIT@1", cachekit::cache::Duration(50),
                            cachekit::cache::ExpirationType::kUpdate)
                      .get());
  added.push_back(cache.Add("TEMP", "TEMP@1", cachekit::cache::Duration(30),
                            cachekit::cache::ExpirationType::kRemove)
                      .get());
  for (std::size_t i = 0; i < added.size(); ++i) {
    if (!added[i].ok()) std::fprintf(stderr, "add failed: %s\n", added[i].ToString().c_str());
  }

  cachekit::api::Status dup = cache.Add("ACME", "ACME@999").get();
  std::printf("duplicate add: %s\n", dup.ToString().c_str());

  std::this_thread::sleep_for(std::chrono::milliseconds(200));

  cachekit::api::Result<std::string> quote = cache.Get("INIT").get();
  if (quote.ok()) std::printf("INIT now %s\n", quote.value().c_str());
  std::printf("TEMP still cached: %s\n", cache.Contains("TEMP").get().value() ? "yes" : "no");
  std::printf("entries: %zu\n", cache.CurrentCount());

  st = cache.Dispose();
  if (!st.ok()) logger->Log(cachekit::log::LogSeverity::kWarning, st.ToString());

  st = logger->Shutdown();
  if (!st.ok()) std::fprintf(stderr, "Shutdown failed: %s\n", st.ToString().c_str());
  cachekit_destroy_log_manager(logger);
  return 0;
}
