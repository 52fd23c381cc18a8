#pragma once

#include <cstddef>
#include <string>

#include "cachekit/api/export.hpp"
#include "cachekit/api/status.hpp"
#include "cachekit/cache/cache_types.hpp"
#include "cachekit/json/i_json.hpp"

namespace cachekit {
namespace config {

struct CacheOptions {
  // Expiry applied by Add/AddRange overloads that take none.
  cache::Duration default_expiry = cache::kNoExpiry;
  // Extra wait after the first due entry so that close deadlines expire in one batch.
  cache::Duration expiration_batch_window = cache::Duration::zero();
  // Range operations above this many items report one reset. 0 disables.
  std::size_t reset_threshold = 0;
  // Deliver change notifications on the default executor instead of the mutating thread.
  bool notify_on_executor = false;
};

class CACHEKIT_API CacheConfig {
 public:
  // Reads {"cache": {...}} or a bare object with the same fields:
  // - default_expiry_ms: integer, negative means never
  // - expiration_batch_window_ms: non-negative integer
  // - reset_threshold: non-negative integer
  // - notify_on_executor: boolean
  // Unknown fields are ignored; missing fields keep their defaults.
  static api::Result<CacheOptions> FromJson(const json::Json& root);
  static api::Result<CacheOptions> Parse(const std::string& text);

  // Returns kNotFound when the file does not exist.
  static api::Result<CacheOptions> LoadFile(const std::string& path);

  static json::Json ToJson(const CacheOptions& options);
};

}  // namespace config
}  // namespace cachekit
