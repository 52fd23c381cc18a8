#pragma once

#include <cstdint>
#include <functional>
#include <memory>

#include "cachekit/api/export.hpp"

namespace cachekit {
namespace api {

struct CancellationState;

// Observer side of a cancellation signal. A default constructed token is never canceled.
class CACHEKIT_API CancellationToken {
 public:
  CancellationToken() {}

  bool IsCancellationRequested() const;
  bool CanBeCanceled() const { return state_ != NULL; }

  // Registers a callback invoked once when cancellation is requested.
  // Runs the callback immediately (and returns 0) when already canceled.
  // Returns 0 for tokens that can never be canceled.
  std::uint64_t Register(const std::function<void()>& callback) const;

  // Removes a registration. Unknown ids are ignored.
  void Unregister(std::uint64_t registration_id) const;

  static CancellationToken None() { return CancellationToken(); }

 private:
  friend class CancellationSource;
  explicit CancellationToken(const std::shared_ptr<CancellationState>& state) : state_(state) {}

  std::shared_ptr<CancellationState> state_;
};

class CACHEKIT_API CancellationSource {
 public:
  CancellationSource();

  // Idempotent. Registered callbacks run on the calling thread.
  void Cancel();
  bool IsCancellationRequested() const;
  CancellationToken Token() const;

 private:
  std::shared_ptr<CancellationState> state_;
};

}  // namespace api
}  // namespace cachekit
