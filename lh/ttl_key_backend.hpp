#ifndef lh_ttl_key_backend_hpp
#define lh_ttl_key_backend_hpp

#include <lh/storage_backend.hpp>
#include <lh/ttl_key_store.hpp>

#include <atomic>
#include <chrono>
#include <memory>

namespace lh {

/**
 * Arbitrate the lease with a set-if-absent key that expires.
 *
 * The lease is the key "leader", its value is the owner.  Acquiring the lease is a single set-if-absent with a TTL
 * of the lease duration.  Renewing is not atomic: the backend reads the owner, and if it matches, refreshes the TTL
 * in a second operation.  If the key expires and another node acquires it between those two operations, the refresh
 * extends the lease of the new owner, and the renewal reports success to the old owner.
 *
 * The store evaluates expirations with its own clock, the @c now arguments are only used for logging.
 */
class ttl_key_backend : public storage_backend {
public:
  /// The key holding the lease.
  static char const leader_key[];

  ttl_key_backend(std::shared_ptr<ttl_key_store> store, std::chrono::milliseconds lease_duration);

  backend_kind kind() const override {
    return backend_kind::ttl_key;
  }
  bool try_acquire(std::string const& node_id, clock_type::time_point now) override;
  bool renew(std::string const& node_id, clock_type::time_point now) override;
  void release() override;
  void reset() override;
  void close() override;

private:
  std::shared_ptr<ttl_key_store> store() const;

private:
  std::shared_ptr<ttl_key_store> store_;
  std::chrono::milliseconds lease_duration_;
  std::atomic<bool> closed_;
};

} // namespace lh

#endif // lh_ttl_key_backend_hpp
