#include "cachekit/api/factory.hpp"

#include "cachekit/api/version.hpp"
#include "log/glog_log_manager.hpp"
#include "task/thread_pool_executor.hpp"

extern "C" {

std::uint32_t cachekit_get_api_version() { return cachekit::api::kApiVersion; }

cachekit::log::ILogManager* cachekit_create_log_manager() {
  return new cachekit::log::GlogLogManager();
}

void cachekit_destroy_log_manager(cachekit::log::ILogManager* manager) { delete manager; }

cachekit::task::IExecutor* cachekit_create_executor(
    const cachekit::task::ExecutorOptions* options) {
  if (options == NULL) {
    return new cachekit::task::ThreadPoolExecutor();
  }
  return new cachekit::task::ThreadPoolExecutor(*options);
}

void cachekit_destroy_executor(cachekit::task::IExecutor* executor) { delete executor; }

}
