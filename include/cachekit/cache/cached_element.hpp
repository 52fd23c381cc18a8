#pragma once

#include <cstdint>

#include "cachekit/api/status.hpp"
#include "cachekit/cache/cache_types.hpp"

namespace cachekit {
namespace cache {

// Value stored in the cache together with its expiration metadata. Immutable: every
// replacement produces a new element with a new id.
template <typename K, typename V>
class CachedElement {
 public:
  CachedElement()
      : key_(),
        value_(),
        expires_at_(),
        original_expiry_(kNoExpiry),
        expiration_type_(ExpirationType::kRemove),
        has_expiry_(false),
        id_(0) {}

  // Fails with kOutOfRange for negative expiry values.
  static api::Result<CachedElement> Create(const K& key, const V& value, Duration expiry,
                                           ExpirationType type, TimePoint now) {
    if (expiry < Duration::zero()) {
      return api::Result<CachedElement>(api::Status::FromModule(
          api::StatusCode::kOutOfRange, "expiry must not be negative", api::ErrorModule::kCache));
    }
    CachedElement element;
    element.key_ = key;
    element.value_ = value;
    element.original_expiry_ = expiry;
    element.expiration_type_ = type;
    element.expires_at_ = TimePoint::max();
    element.has_expiry_ = ExpiryDeadline(now, expiry, &element.expires_at_);
    element.id_ = NextElementId();
    return api::Result<CachedElement>(element);
  }

  // Same expiry instant and type, new value.
  CachedElement WithValue(const V& value) const {
    CachedElement element(*this);
    element.value_ = value;
    element.id_ = NextElementId();
    return element;
  }

  // Same expiry duration and type, new value, expiry restarted from now.
  CachedElement Refreshed(const V& value, TimePoint now) const {
    CachedElement element(*this);
    element.value_ = value;
    element.expires_at_ = TimePoint::max();
    element.has_expiry_ =
        has_expiry_ && ExpiryDeadline(now, original_expiry_, &element.expires_at_);
    element.id_ = NextElementId();
    return element;
  }

  const K& key() const { return key_; }
  const V& value() const { return value_; }
  bool has_expiry() const { return has_expiry_; }
  TimePoint expires_at() const { return expires_at_; }
  Duration original_expiry() const { return original_expiry_; }
  ExpirationType expiration_type() const { return expiration_type_; }
  std::uint64_t id() const { return id_; }

  bool HasExpired(TimePoint now) const { return has_expiry_ && expires_at_ <= now; }

  // Remaining lifetime, zero once expired, kNoExpiry when the element never expires.
  Duration ExpiresIn(TimePoint now) const {
    if (!has_expiry_) return kNoExpiry;
    if (expires_at_ <= now) return Duration::zero();
    return std::chrono::duration_cast<Duration>(expires_at_ - now);
  }

 private:
  K key_;
  V value_;
  TimePoint expires_at_;
  Duration original_expiry_;
  ExpirationType expiration_type_;
  bool has_expiry_;
  std::uint64_t id_;
};

}  // namespace cache
}  // namespace cachekit
