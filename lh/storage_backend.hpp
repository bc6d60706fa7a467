#ifndef lh_storage_backend_hpp
#define lh_storage_backend_hpp

#include <lh/clock.hpp>

#include <iostream>
#include <string>

namespace lh {

/// The available storage backends.
enum class backend_kind {
  /// A document store with optimistic conditional updates, also known as backend "A".
  conditional_write,
  /// A key/value store with set-if-absent and native TTLs, also known as backend "B".
  ttl_key,
};

/// Stream the name of the backend, "conditional-write" or "ttl-key".
std::ostream& operator<<(std::ostream& os, backend_kind x);

/**
 * Parse a backend name.
 *
 * Accepts "A" and "conditional-write" for backend_kind::conditional_write, and "B" and "ttl-key" for
 * backend_kind::ttl_key.
 *
 * @throws std::invalid_argument if @a name is not recognized.
 */
backend_kind parse_backend_kind(std::string const& name);

/**
 * Arbitrate a single, shared, time-limited lease.
 *
 * All implementations provide the same contract:
 * - try_acquire() succeeds only if there is no lease, or the lease has expired.  Exactly one of several concurrent
 *   callers racing for an absent or expired lease succeeds.
 * - renew() succeeds only if the caller owns the lease.
 * - release() deletes the lease, whoever owns it.
 * - reset() deletes all the backend state.
 *
 * try_acquire(), renew() and release() never raise: errors are logged and reported as a failure to acquire or
 * renew.  reset() raises on errors, it is only called when a new election starts.  After close() the backend is
 * detached from its store, and all the operations fail.
 */
class storage_backend {
public:
  virtual ~storage_backend() {}

  virtual backend_kind kind() const = 0;

  /// Acquire the lease for @a node_id, until @a now plus the lease duration.
  virtual bool try_acquire(std::string const& node_id, clock_type::time_point now) = 0;

  /// Extend the lease for @a node_id, until @a now plus the lease duration.
  virtual bool renew(std::string const& node_id, clock_type::time_point now) = 0;

  virtual void release() = 0;
  virtual void reset() = 0;
  virtual void close() = 0;
};

} // namespace lh

#endif // lh_storage_backend_hpp
