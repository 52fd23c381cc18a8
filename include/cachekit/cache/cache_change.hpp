#pragma once

#include <cstdint>

#include "cachekit/cache/cache_types.hpp"
#include "cachekit/cache/cached_element.hpp"

namespace cachekit {
namespace cache {

enum class CacheChangeType : std::uint8_t {
  kItemAdded = 0,
  kItemValueReplaced = 1,
  kItemExpired = 2,
  kItemRemoved = 3,
  // Consumers must re-read the whole cache.
  kReset = 4
};

inline const char* CacheChangeTypeName(CacheChangeType type) {
  switch (type) {
    case CacheChangeType::kItemAdded:
      return "item_added";
    case CacheChangeType::kItemValueReplaced:
      return "item_value_replaced";
    case CacheChangeType::kItemExpired:
      return "item_expired";
    case CacheChangeType::kItemRemoved:
      return "item_removed";
    case CacheChangeType::kReset:
      return "reset";
    default:
      return "unknown";
  }
}

// Immutable description of one cache mutation. Only kItemValueReplaced carries an old value;
// kReset carries neither key nor value.
template <typename K, typename V>
class CacheChange {
 public:
  typedef CachedElement<K, V> Element;

  CacheChange()
      : type_(CacheChangeType::kReset),
        key_(),
        has_key_(false),
        value_(),
        old_value_(),
        has_old_value_(false),
        has_expiry_(false),
        expires_at_(),
        expiration_type_(ExpirationType::kDoNothing) {}

  static CacheChange Reset() { return CacheChange(); }

  static CacheChange ItemAdded(const Element& element) {
    return FromElement(CacheChangeType::kItemAdded, element);
  }

  static CacheChange ItemRemoved(const Element& element) {
    return FromElement(CacheChangeType::kItemRemoved, element);
  }

  static CacheChange ItemExpired(const Element& element) {
    return FromElement(CacheChangeType::kItemExpired, element);
  }

  static CacheChange ItemValueReplaced(const Element& old_element, const Element& new_element) {
    CacheChange change = FromElement(CacheChangeType::kItemValueReplaced, new_element);
    change.old_value_ = old_element.value();
    change.has_old_value_ = true;
    return change;
  }

  CacheChangeType type() const { return type_; }
  bool has_key() const { return has_key_; }
  const K& key() const { return key_; }
  const V& value() const { return value_; }
  bool has_old_value() const { return has_old_value_; }
  const V& old_value() const { return old_value_; }
  bool has_expiry() const { return has_expiry_; }
  TimePoint expires_at() const { return expires_at_; }
  ExpirationType expiration_type() const { return expiration_type_; }

 private:
  static CacheChange FromElement(CacheChangeType type, const Element& element) {
    CacheChange change;
    change.type_ = type;
    change.key_ = element.key();
    change.has_key_ = true;
    change.value_ = element.value();
    change.has_expiry_ = element.has_expiry();
    change.expires_at_ = element.expires_at();
    change.expiration_type_ = element.expiration_type();
    return change;
  }

  CacheChangeType type_;
  K key_;
  bool has_key_;
  V value_;
  V old_value_;
  bool has_old_value_;
  bool has_expiry_;
  TimePoint expires_at_;
  ExpirationType expiration_type_;
};

}  // namespace cache
}  // namespace cachekit
