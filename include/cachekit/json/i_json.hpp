#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>
#include <string>

#include "cachekit/api/export.hpp"
#include "cachekit/api/status.hpp"

namespace cachekit {
namespace json {

using Json = nlohmann::json;

// All failures are reported under module kConfig. Unparsable text carries
// kDetailConfigParseFailed, a field of the wrong type or range kDetailConfigBadField.
class CACHEKIT_API JsonCodec {
 public:
  // Parse JSON text into a DOM object.
  // Returns kInvalidArgument when text is not valid JSON.
  static api::Result<Json> Parse(const std::string& text);

  // Returns kNotFound when file does not exist.
  static api::Result<Json> LoadFile(const std::string& path);

  // Returns kIoError on write failures.
  static api::Status SaveFile(const std::string& path, const Json& value, int indent = 2);

  static std::string Dump(const Json& value, int indent = 2);

  // Returns root[name] when present, otherwise root itself.
  // The pointer refers into root and must not outlive it.
  static api::Result<const Json*> Section(const Json& root, const std::string& name);

  // Missing key leaves *out untouched. Non-integer -> kInvalidArgument,
  // below min_value -> kOutOfRange. scope prefixes the field name in messages.
  static api::Status ReadInt64(const Json& section, const std::string& scope, const char* key,
                               std::int64_t* out,
                               std::int64_t min_value = std::numeric_limits<std::int64_t>::min());

  static api::Status ReadBool(const Json& section, const std::string& scope, const char* key,
                              bool* out);
};

}  // namespace json
}  // namespace cachekit
