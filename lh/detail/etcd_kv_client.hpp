#ifndef lh_detail_etcd_kv_client_hpp
#define lh_detail_etcd_kv_client_hpp

#include <etcd/etcdserver/etcdserverpb/rpc.grpc.pb.h>
#include <grpc++/grpc++.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace lh {
namespace detail {

/**
 * Blocking calls to the etcd KV and Lease services.
 *
 * The stores are called from the election engine timers and must return a result before the timer callback
 * returns, so they use the synchronous stubs.  Every call has a deadline, and failures raise std::runtime_error
 * (see lh::detail::check_grpc_status).
 */
class etcd_kv_client {
public:
  etcd_kv_client(std::shared_ptr<grpc::Channel> channel, std::chrono::milliseconds rpc_timeout);

  /// Fetch a single key, returns false if the key does not exist.
  bool get(std::string const& key, mvccpb::KeyValue* kv);

  /// Run a transaction, @a where names the caller in error messages.
  etcdserverpb::TxnResponse commit(etcdserverpb::TxnRequest const& request, char const* where);

  /// Delete a key, or the range [key, range_end) if range_end is not empty.  Returns the number of deleted keys.
  std::int64_t delete_range(std::string const& key, std::string const& range_end);

  /// Create a lease with a TTL of at least @a ttl, rounded up to whole seconds.
  std::int64_t grant_lease(std::chrono::milliseconds ttl);

  /// Revoke a lease, errors are logged and ignored because the lease expires on its own.
  void revoke_lease(std::int64_t lease_id);

private:
  std::unique_ptr<grpc::ClientContext> make_context() const;

private:
  std::shared_ptr<grpc::Channel> channel_;
  std::unique_ptr<etcdserverpb::KV::Stub> kv_;
  std::unique_ptr<etcdserverpb::Lease::Stub> lease_;
  std::chrono::milliseconds rpc_timeout_;
};

} // namespace detail
} // namespace lh

#endif // lh_detail_etcd_kv_client_hpp
