#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace cachekit {
namespace cache {

typedef std::chrono::system_clock Clock;
typedef Clock::time_point TimePoint;
typedef std::chrono::milliseconds Duration;

// Expiry value meaning "never expires".
static const Duration kNoExpiry = Duration::max();

enum class ExpirationType : std::uint8_t {
  // Expiry is informational; the entry stays until removed explicitly.
  kDoNothing = 0,
  // The entry is removed once expired.
  kRemove = 1,
  // The entry's value is rebuilt by the configured updater and its expiry restarted.
  kUpdate = 2
};

inline const char* ExpirationTypeName(ExpirationType type) {
  switch (type) {
    case ExpirationType::kDoNothing:
      return "do_nothing";
    case ExpirationType::kRemove:
      return "remove";
    case ExpirationType::kUpdate:
      return "update";
    default:
      return "unknown";
  }
}

// Deadline for an expiry starting at now. Returns false when the deadline is not
// representable by TimePoint; such an expiry means "never".
inline bool ExpiryDeadline(TimePoint now, Duration expiry, TimePoint* deadline) {
  if (expiry == kNoExpiry) return false;
  const Duration headroom = std::chrono::duration_cast<Duration>(TimePoint::max() - now);
  if (expiry >= headroom) return false;
  *deadline = now + std::chrono::duration_cast<Clock::duration>(expiry);
  return true;
}

// Process-unique identity of a cached element instance.
inline std::uint64_t NextElementId() {
  static std::atomic<std::uint64_t> next(1);
  return next.fetch_add(1, std::memory_order_relaxed);
}

}  // namespace cache
}  // namespace cachekit
