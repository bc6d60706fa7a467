#ifndef lh_detail_lease_guard_hpp
#define lh_detail_lease_guard_hpp

#include <lh/log.hpp>

#include <cstdint>
#include <exception>

namespace lh {
namespace detail {

/**
 * Revoke a freshly granted etcd lease unless a key was attached to it.
 *
 * The etcd TTL store grants a lease before the transaction that attaches the key.  If the transaction fails, or
 * raises, nothing references the lease any more, and it is revoked when the guard goes out of scope.
 *
 * @tparam client_type the etcd client, must provide revoke_lease(std::int64_t).
 */
template <typename client_type>
class lease_guard {
public:
  lease_guard(client_type& client, std::int64_t lease_id)
      : client_(client)
      , lease_id_(lease_id)
      , attached_(false) {
  }

  lease_guard(lease_guard const&) = delete;
  lease_guard& operator=(lease_guard const&) = delete;

  ~lease_guard() {
    if (attached_) {
      return;
    }
    try {
      client_.revoke_lease(lease_id_);
    } catch (std::exception const& ex) {
      LH_LOG(warning) << "cannot revoke unused lease " << std::hex << lease_id_ << ": " << ex.what();
    }
  }

  std::int64_t lease_id() const {
    return lease_id_;
  }

  /// A key now uses the lease, keep it.
  void attached() {
    attached_ = true;
  }

private:
  client_type& client_;
  std::int64_t lease_id_;
  bool attached_;
};

} // namespace detail
} // namespace lh

#endif // lh_detail_lease_guard_hpp
