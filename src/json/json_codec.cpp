#include "cachekit/json/i_json.hpp"

#include <glog/logging.h>

#include <fstream>
#include <sstream>

namespace cachekit {
namespace json {

#define CK_STATUS(code, message, detail) \
  api::Status::FromModule((code), (message), api::ErrorModule::kConfig, (detail))

namespace {

std::string FieldName(const std::string& scope, const char* key) {
  return scope.empty() ? std::string(key) : scope + "." + key;
}

}  // namespace

api::Result<Json> JsonCodec::Parse(const std::string& text) {
  try {
    return api::Result<Json>(Json::parse(text));
  } catch (const Json::parse_error& ex) {
    VLOG(1) << "config text rejected at byte " << ex.byte;
    return api::Result<Json>(CK_STATUS(api::StatusCode::kInvalidArgument,
                                       std::string("json parse failed: ") + ex.what(),
                                       api::kDetailConfigParseFailed));
  }
}

api::Result<Json> JsonCodec::LoadFile(const std::string& path) {
  std::ifstream in(path.c_str(), std::ios::in | std::ios::binary);
  if (!in.is_open()) {
    return api::Result<Json>(CK_STATUS(api::StatusCode::kNotFound,
                                       "config file not found: " + path, api::kDetailNone));
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  api::Result<Json> parsed = Parse(buffer.str());
  if (!parsed.ok()) {
    return api::Result<Json>(CK_STATUS(parsed.status().code(),
                                       path + ": " + parsed.status().message(),
                                       api::kDetailConfigParseFailed));
  }
  return parsed;
}

api::Status JsonCodec::SaveFile(const std::string& path, const Json& value, int indent) {
  std::ofstream out(path.c_str(), std::ios::out | std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    return CK_STATUS(api::StatusCode::kIoError, "cannot open config file for write: " + path,
                     api::kDetailNone);
  }
  out << Dump(value, indent) << "\n";
  out.flush();
  if (!out) {
    return CK_STATUS(api::StatusCode::kIoError, "config write failed: " + path,
                     api::kDetailNone);
  }
  return api::Status::Ok();
}

std::string JsonCodec::Dump(const Json& value, int indent) {
  // Replace invalid UTF-8 instead of throwing; keys and values come from user input.
  return value.dump(indent, ' ', false, Json::error_handler_t::replace);
}

api::Result<const Json*> JsonCodec::Section(const Json& root, const std::string& name) {
  if (!root.is_object()) {
    return api::Result<const Json*>(CK_STATUS(api::StatusCode::kInvalidArgument,
                                              "root must be object",
                                              api::kDetailConfigBadField));
  }
  Json::const_iterator it = root.find(name);
  if (it == root.end()) return api::Result<const Json*>(&root);
  if (!it->is_object()) {
    return api::Result<const Json*>(CK_STATUS(api::StatusCode::kInvalidArgument,
                                              name + " section must be object",
                                              api::kDetailConfigBadField));
  }
  return api::Result<const Json*>(&*it);
}

api::Status JsonCodec::ReadInt64(const Json& section, const std::string& scope, const char* key,
                                 std::int64_t* out, std::int64_t min_value) {
  Json::const_iterator it = section.find(key);
  if (it == section.end()) return api::Status::Ok();
  if (!it->is_number_integer()) {
    return CK_STATUS(api::StatusCode::kInvalidArgument,
                     FieldName(scope, key) + " must be integer", api::kDetailConfigBadField);
  }
  const std::int64_t value = it->get<std::int64_t>();
  if (value < min_value) {
    return CK_STATUS(api::StatusCode::kOutOfRange,
                     FieldName(scope, key) + " must be at least " + std::to_string(min_value),
                     api::kDetailConfigBadField);
  }
  *out = value;
  return api::Status::Ok();
}

api::Status JsonCodec::ReadBool(const Json& section, const std::string& scope, const char* key,
                                bool* out) {
  Json::const_iterator it = section.find(key);
  if (it == section.end()) return api::Status::Ok();
  if (!it->is_boolean()) {
    return CK_STATUS(api::StatusCode::kInvalidArgument,
                     FieldName(scope, key) + " must be boolean", api::kDetailConfigBadField);
  }
  *out = it->get<bool>();
  return api::Status::Ok();
}

#undef CK_STATUS

}  // namespace json
}  // namespace cachekit
