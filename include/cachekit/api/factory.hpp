#pragma once

#include <cstdint>

#include "cachekit/api/export.hpp"

namespace cachekit {
namespace log {
class ILogManager;
}
namespace task {
class IExecutor;
struct ExecutorOptions;
}
}  // namespace cachekit

extern "C" {

// Return packed API version to allow runtime ABI compatibility checks.
CACHEKIT_API std::uint32_t cachekit_get_api_version();

// Create a glog-backed log manager instance owned by the caller.
CACHEKIT_API cachekit::log::ILogManager* cachekit_create_log_manager();

// Destroy a log manager created by cachekit_create_log_manager.
CACHEKIT_API void cachekit_destroy_log_manager(cachekit::log::ILogManager* manager);

// Create a thread pool executor. options == NULL uses hardware_concurrency workers and an
// unbounded queue.
CACHEKIT_API cachekit::task::IExecutor* cachekit_create_executor(
    const cachekit::task::ExecutorOptions* options);

// Destroy an executor created by cachekit_create_executor.
CACHEKIT_API void cachekit_destroy_executor(cachekit::task::IExecutor* executor);

}
