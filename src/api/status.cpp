#include "cachekit/api/status.hpp"

#include <cstdio>

namespace cachekit {
namespace api {

namespace {

inline std::uint32_t PackErrorCode(std::uint8_t module, std::uint8_t status, std::uint32_t detail) {
  return (static_cast<std::uint32_t>(module) << 24) |
         ((static_cast<std::uint32_t>(status) & 0x0Fu) << 20) |
         (detail & 0x000FFFFFu);
}

#define CACHEKIT_ECODE(module, status, detail) \
  PackErrorCode(static_cast<std::uint8_t>(module), static_cast<std::uint8_t>(status), detail)

static const ErrorCatalogEntry kErrorCatalog[] = {
    // Core generic status family (detail id = 0)
    {CACHEKIT_ECODE(ErrorModule::kCore, StatusCode::kOk, 0x0000), "CORE_OK",
     "Operation succeeded"},
    {CACHEKIT_ECODE(ErrorModule::kCore, StatusCode::kInvalidArgument, 0x0000),
     "CORE_INVALID_ARGUMENT", "Invalid argument"},
    {CACHEKIT_ECODE(ErrorModule::kCore, StatusCode::kOutOfRange, 0x0000),
     "CORE_OUT_OF_RANGE", "Argument out of range"},
    {CACHEKIT_ECODE(ErrorModule::kCore, StatusCode::kNotFound, 0x0000), "CORE_NOT_FOUND",
     "Resource not found"},
    {CACHEKIT_ECODE(ErrorModule::kCore, StatusCode::kAlreadyExists, 0x0000),
     "CORE_ALREADY_EXISTS", "Resource already exists"},
    {CACHEKIT_ECODE(ErrorModule::kCore, StatusCode::kDisposed, 0x0000), "CORE_DISPOSED",
     "Object has been disposed"},
    {CACHEKIT_ECODE(ErrorModule::kCore, StatusCode::kCanceled, 0x0000), "CORE_CANCELED",
     "Operation canceled"},
    {CACHEKIT_ECODE(ErrorModule::kCore, StatusCode::kWouldBlock, 0x0000), "CORE_WOULD_BLOCK",
     "Operation would block"},
    {CACHEKIT_ECODE(ErrorModule::kCore, StatusCode::kIoError, 0x0000), "CORE_IO_ERROR",
     "I/O error"},
    {CACHEKIT_ECODE(ErrorModule::kCore, StatusCode::kInternalError, 0x0000),
     "CORE_INTERNAL_ERROR", "Internal error"},
    {CACHEKIT_ECODE(ErrorModule::kCore, StatusCode::kUnsupported, 0x0000), "CORE_UNSUPPORTED",
     "Operation unsupported"},

    // Module detail ids; keep appending here as a unified lookup table.
    {CACHEKIT_ECODE(ErrorModule::kTask, StatusCode::kWouldBlock, 0x0001),
     "TASK_QUEUE_FULL", "Task queue is full"},
    {CACHEKIT_ECODE(ErrorModule::kTask, StatusCode::kInvalidArgument, 0x0001),
     "TASK_INVALID_FN", "Task function is null"},
    {CACHEKIT_ECODE(ErrorModule::kMemory, StatusCode::kOutOfRange, kDetailPoolNegativeCount),
     "POOL_NEGATIVE_COUNT", "Pool size adjustment must not be negative"},
    {CACHEKIT_ECODE(ErrorModule::kMemory, StatusCode::kOutOfRange,
                    kDetailPoolCountExceedsAvailable),
     "POOL_COUNT_EXCEEDS_AVAILABLE", "Cannot remove more instances than are available"},
    {CACHEKIT_ECODE(ErrorModule::kMemory, StatusCode::kOutOfRange, kDetailPoolForeignTicket),
     "POOL_FOREIGN_TICKET", "Pooled value belongs to another pool"},
    {CACHEKIT_ECODE(ErrorModule::kMemory, StatusCode::kOutOfRange, kDetailPoolTicketReleased),
     "POOL_TICKET_RELEASED", "Pooled value has already been released"},
    {CACHEKIT_ECODE(ErrorModule::kMemory, StatusCode::kOutOfRange, kDetailPoolTicketDetached),
     "POOL_TICKET_DETACHED", "Pooled value has already been detached"},
    {CACHEKIT_ECODE(ErrorModule::kThreading, StatusCode::kDisposed, kDetailLockDisposed),
     "LOCK_DISPOSED", "Reader/writer lock has been disposed"},
    {CACHEKIT_ECODE(ErrorModule::kThreading, StatusCode::kCanceled, kDetailLockCanceled),
     "LOCK_CANCELED", "Lock acquisition canceled"},
    {CACHEKIT_ECODE(ErrorModule::kCache, StatusCode::kAlreadyExists, kDetailCacheKeyExists),
     "CACHE_KEY_EXISTS", "Key already exists in cache"},
    {CACHEKIT_ECODE(ErrorModule::kCache, StatusCode::kNotFound, kDetailCacheKeyNotFound),
     "CACHE_KEY_NOT_FOUND", "Key not found in cache"},
    {CACHEKIT_ECODE(ErrorModule::kCache, StatusCode::kOutOfRange, kDetailCacheNoUpdater),
     "CACHE_NO_UPDATER", "Update expiration requires a configured updater"},
    {CACHEKIT_ECODE(ErrorModule::kCache, StatusCode::kInternalError,
                    kDetailCacheProducerFailed),
     "CACHE_PRODUCER_FAILED", "Value producer raised an exception"},
    {CACHEKIT_ECODE(ErrorModule::kConfig, StatusCode::kInvalidArgument,
                    kDetailConfigParseFailed),
     "CONFIG_PARSE_FAILED", "JSON parse failed"},
    {CACHEKIT_ECODE(ErrorModule::kConfig, StatusCode::kInvalidArgument, kDetailConfigBadField),
     "CONFIG_BAD_FIELD", "Configuration field has the wrong type"},
};

#undef CACHEKIT_ECODE

}  // namespace

std::uint32_t MakeErrorCode(ErrorModule module, StatusCode status_code, std::uint32_t detail_id) {
  return PackErrorCode(static_cast<std::uint8_t>(module),
                       static_cast<std::uint8_t>(status_code), detail_id);
}

const char* ErrorModuleName(ErrorModule module) {
  switch (module) {
    case ErrorModule::kCore:
      return "core";
    case ErrorModule::kApi:
      return "api";
    case ErrorModule::kLog:
      return "log";
    case ErrorModule::kConfig:
      return "config";
    case ErrorModule::kMemory:
      return "memory";
    case ErrorModule::kThreading:
      return "threading";
    case ErrorModule::kTask:
      return "task";
    case ErrorModule::kReactive:
      return "reactive";
    case ErrorModule::kCache:
      return "cache";
    default:
      return "unknown";
  }
}

const char* StatusCodeName(StatusCode status_code) {
  switch (status_code) {
    case StatusCode::kOk:
      return "kOk";
    case StatusCode::kInvalidArgument:
      return "kInvalidArgument";
    case StatusCode::kOutOfRange:
      return "kOutOfRange";
    case StatusCode::kNotFound:
      return "kNotFound";
    case StatusCode::kAlreadyExists:
      return "kAlreadyExists";
    case StatusCode::kDisposed:
      return "kDisposed";
    case StatusCode::kCanceled:
      return "kCanceled";
    case StatusCode::kWouldBlock:
      return "kWouldBlock";
    case StatusCode::kIoError:
      return "kIoError";
    case StatusCode::kInternalError:
      return "kInternalError";
    case StatusCode::kUnsupported:
      return "kUnsupported";
    default:
      return "kUnknown";
  }
}

const ErrorCatalogEntry* FindErrorCatalogEntry(std::uint32_t hex_code) {
  for (std::size_t i = 0; i < sizeof(kErrorCatalog) / sizeof(kErrorCatalog[0]); ++i) {
    if (kErrorCatalog[i].hex_code == hex_code) {
      return &kErrorCatalog[i];
    }
  }
  return NULL;
}

std::string FormatErrorCodeHex(std::uint32_t hex_code) {
  char buf[11] = {0};  // "0xFFFFFFFF"
  std::snprintf(buf, sizeof(buf), "0x%08X", static_cast<unsigned int>(hex_code));
  return std::string(buf);
}

std::string Status::ToString() const {
  if (ok()) return "OK";
  std::string out = StatusCodeName(code_);
  out += " [";
  out += FormatErrorCodeHex(hex_code_);
  out += "]";
  if (!message_.empty()) {
    out += ": ";
    out += message_;
  }
  return out;
}

}  // namespace api
}  // namespace cachekit
