#pragma once

#include <deque>
#include <functional>
#include <memory>
#include <mutex>

#include "cachekit/api/export.hpp"
#include "cachekit/api/status.hpp"
#include "cachekit/task/iexecutor.hpp"

namespace cachekit {
namespace task {

// Runs posted work strictly one at a time and in posting order on top of another
// executor. Used to keep per-subscriber notification order when delivery is offloaded.
// Must be owned by a std::shared_ptr.
class CACHEKIT_API SerialExecutor : public std::enable_shared_from_this<SerialExecutor> {
 public:
  // target == NULL runs work on the posting thread, still one at a time.
  explicit SerialExecutor(IExecutor* target);

  api::Status Post(const std::function<void()>& work);

  std::size_t PendingCount() const;

 private:
  void Drain();

  IExecutor* target_;
  mutable std::mutex mu_;
  std::deque<std::function<void()> > queue_;
  bool draining_;
};

}  // namespace task
}  // namespace cachekit
