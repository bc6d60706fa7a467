#ifndef lh_ttl_key_store_hpp
#define lh_ttl_key_store_hpp

#include <chrono>
#include <string>

namespace lh {

/**
 * A key/value store with native key expiration.
 *
 * This is the minimal subset of a key/value database needed by the TTL-key backend.  Each operation is atomic, but
 * there is no way to combine several of them into a transaction.  Expired keys behave exactly as absent keys.
 * Implementations report transport errors as exceptions.
 */
class ttl_key_store {
public:
  virtual ~ttl_key_store() {}

  /// Set @a key to @a value, expiring after @a ttl, only if the key is absent.  Returns true if the key was set.
  virtual bool set_if_absent(std::string const& key, std::string const& value, std::chrono::milliseconds ttl) = 0;

  /// Read the value of @a key, returns false if the key is absent.
  virtual bool get(std::string const& key, std::string* value) = 0;

  /// Reset the expiration of @a key to @a ttl from now, returns false if the key is absent.
  virtual bool expire(std::string const& key, std::chrono::milliseconds ttl) = 0;

  /// Delete @a key, returns false if the key was absent.
  virtual bool remove(std::string const& key) = 0;
};

} // namespace lh

#endif // lh_ttl_key_store_hpp
