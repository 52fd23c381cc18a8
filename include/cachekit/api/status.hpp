#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include "cachekit/api/export.hpp"

namespace cachekit {
namespace api {

enum class StatusCode {
  kOk = 0,
  kInvalidArgument,
  kOutOfRange,
  kNotFound,
  kAlreadyExists,
  kDisposed,
  kCanceled,
  kWouldBlock,
  kIoError,
  kInternalError,
  kUnsupported
};

enum class ErrorModule : std::uint8_t {
  kCore = 0x00,
  kApi = 0x01,
  kLog = 0x10,
  kConfig = 0x20,
  kMemory = 0x30,
  kThreading = 0x40,
  kTask = 0x50,
  kReactive = 0x60,
  kCache = 0x70,
};

// Module-local detail ids registered in the error catalog.
enum ErrorDetail : std::uint32_t {
  kDetailNone = 0x0000,
  kDetailPoolNegativeCount = 0x0001,
  kDetailPoolCountExceedsAvailable = 0x0002,
  kDetailPoolForeignTicket = 0x0003,
  kDetailPoolTicketReleased = 0x0004,
  kDetailPoolTicketDetached = 0x0005,
  kDetailLockDisposed = 0x0001,
  kDetailLockCanceled = 0x0002,
  kDetailCacheKeyExists = 0x0001,
  kDetailCacheKeyNotFound = 0x0002,
  kDetailCacheNoUpdater = 0x0003,
  kDetailCacheProducerFailed = 0x0004,
  kDetailConfigParseFailed = 0x0001,
  kDetailConfigBadField = 0x0002,
};

struct ErrorCatalogEntry {
  std::uint32_t hex_code;
  const char* symbol;
  const char* description;
};

// Code layout: 0xMMSDDDDD
// - MM: module id
// - S: status code family (4 bits)
// - DDDDD: module-local detail id (20 bits)
CACHEKIT_API std::uint32_t MakeErrorCode(ErrorModule module, StatusCode status_code,
                                         std::uint32_t detail_id = 0);
CACHEKIT_API const char* ErrorModuleName(ErrorModule module);
CACHEKIT_API const char* StatusCodeName(StatusCode status_code);
CACHEKIT_API const ErrorCatalogEntry* FindErrorCatalogEntry(std::uint32_t hex_code);
CACHEKIT_API std::string FormatErrorCodeHex(std::uint32_t hex_code);

class Status {
 public:
  Status() : code_(StatusCode::kOk), hex_code_(MakeErrorCode(ErrorModule::kCore, code_)) {}
  Status(StatusCode code, std::string message)
      : code_(code), message_(std::move(message)),
        hex_code_(MakeErrorCode(ErrorModule::kCore, code_)) {}
  Status(StatusCode code, std::string message, ErrorModule module, std::uint32_t detail_id = 0)
      : code_(code),
        message_(std::move(message)),
        hex_code_(MakeErrorCode(module, code_, detail_id)) {}
  Status(StatusCode code, std::string message, std::uint32_t hex_code)
      : code_(code), message_(std::move(message)), hex_code_(hex_code) {}

  static Status Ok() { return Status(); }
  static Status FromModule(StatusCode code, std::string message, ErrorModule module,
                           std::uint32_t detail_id = 0) {
    return Status(code, std::move(message), module, detail_id);
  }

  bool ok() const { return code_ == StatusCode::kOk; }
  StatusCode code() const { return code_; }
  const std::string& message() const { return message_; }
  std::uint32_t hex_code() const { return hex_code_; }
  std::string hex_code_string() const { return FormatErrorCodeHex(hex_code_); }
  std::string ToString() const;

 private:
  StatusCode code_;
  std::string message_;
  std::uint32_t hex_code_;
};

// T must be default constructible. Move-only T is supported through the rvalue constructor.
template <typename T>
class Result {
 public:
  Result(const Status& status) : status_(status), has_value_(false), value_() {}
  Result(const T& value) : status_(Status::Ok()), has_value_(true), value_(value) {}
  Result(T&& value) : status_(Status::Ok()), has_value_(true), value_(std::move(value)) {}

  bool ok() const { return status_.ok(); }
  bool has_value() const { return has_value_; }
  const Status& status() const { return status_; }
  const T& value() const { return value_; }
  T& value() { return value_; }

 private:
  Status status_;
  bool has_value_;
  T value_;
};

}  // namespace api
}  // namespace cachekit
