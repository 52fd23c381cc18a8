#include "cachekit/config/cache_config.hpp"

#include <cstdint>

namespace cachekit {
namespace config {

api::Result<CacheOptions> CacheConfig::FromJson(const json::Json& root) {
  api::Result<const json::Json*> located = json::JsonCodec::Section(root, "cache");
  if (!located.ok()) return api::Result<CacheOptions>(located.status());
  const json::Json& section = *located.value();

  CacheOptions options;
  std::int64_t expiry_ms = -1;
  std::int64_t window_ms = 0;
  std::int64_t threshold = 0;
  api::Status st = json::JsonCodec::ReadInt64(section, "cache", "default_expiry_ms", &expiry_ms);
  if (st.ok()) {
    st = json::JsonCodec::ReadInt64(section, "cache", "expiration_batch_window_ms", &window_ms, 0);
  }
  if (st.ok()) st = json::JsonCodec::ReadInt64(section, "cache", "reset_threshold", &threshold, 0);
  if (st.ok()) {
    st = json::JsonCodec::ReadBool(section, "cache", "notify_on_executor",
                                   &options.notify_on_executor);
  }
  if (!st.ok()) return api::Result<CacheOptions>(st);

  // Negative expiry in a file means "never"; operations reject negative durations instead.
  options.default_expiry = expiry_ms < 0 ? cache::kNoExpiry : cache::Duration(expiry_ms);
  options.expiration_batch_window = cache::Duration(window_ms);
  options.reset_threshold = static_cast<std::size_t>(threshold);
  return api::Result<CacheOptions>(options);
}

api::Result<CacheOptions> CacheConfig::Parse(const std::string& text) {
  api::Result<json::Json> parsed = json::JsonCodec::Parse(text);
  if (!parsed.ok()) return api::Result<CacheOptions>(parsed.status());
  return FromJson(parsed.value());
}

api::Result<CacheOptions> CacheConfig::LoadFile(const std::string& path) {
  api::Result<json::Json> loaded = json::JsonCodec::LoadFile(path);
  if (!loaded.ok()) return api::Result<CacheOptions>(loaded.status());
  return FromJson(loaded.value());
}

json::Json CacheConfig::ToJson(const CacheOptions& options) {
  json::Json section = json::Json::object();
  section["default_expiry_ms"] =
      options.default_expiry == cache::kNoExpiry
          ? static_cast<std::int64_t>(-1)
          : static_cast<std::int64_t>(options.default_expiry.count());
  section["expiration_batch_window_ms"] =
      static_cast<std::int64_t>(options.expiration_batch_window.count());
  section["reset_threshold"] = static_cast<std::uint64_t>(options.reset_threshold);
  section["notify_on_executor"] = options.notify_on_executor;
  json::Json root = json::Json::object();
  root["cache"] = section;
  return root;
}

}  // namespace config
}  // namespace cachekit
