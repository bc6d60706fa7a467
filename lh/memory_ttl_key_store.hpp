#ifndef lh_memory_ttl_key_store_hpp
#define lh_memory_ttl_key_store_hpp

#include <lh/clock.hpp>
#include <lh/ttl_key_store.hpp>

#include <map>
#include <mutex>

namespace lh {

/**
 * An in-process lh::ttl_key_store.
 *
 * Expirations are evaluated lazily against the clock given in the constructor: a key whose expiration is not in the
 * future is absent.
 */
class memory_ttl_key_store : public ttl_key_store {
public:
  explicit memory_ttl_key_store(clock_function clock = system_clock_function());

  bool set_if_absent(std::string const& key, std::string const& value, std::chrono::milliseconds ttl) override;
  bool get(std::string const& key, std::string* value) override;
  bool expire(std::string const& key, std::chrono::milliseconds ttl) override;
  bool remove(std::string const& key) override;

  /// Return the expiration time of @a key, or the epoch if the key is absent.
  clock_type::time_point expiration(std::string const& key);

private:
  struct entry {
    std::string value;
    clock_type::time_point expires_at;
  };

  /// Find a live key, erasing it if it has expired.  Must be called with the lock held.
  std::map<std::string, entry>::iterator find_live(std::string const& key);

private:
  clock_function clock_;
  std::mutex mu_;
  std::map<std::string, entry> entries_;
};

} // namespace lh

#endif // lh_memory_ttl_key_store_hpp
