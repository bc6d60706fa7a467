#ifndef lh_etcd_ttl_key_store_hpp
#define lh_etcd_ttl_key_store_hpp

#include <lh/detail/etcd_kv_client.hpp>
#include <lh/ttl_key_store.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace lh {

/**
 * A lh::ttl_key_store on top of etcd.
 *
 * Expirations use etcd leases, so they have a granularity of one second.  Setting a key grants a new lease and
 * creates the key attached to it only if the key does not exist.  Refreshing the expiration grants a new lease and
 * moves the key to it, the previous lease simply expires.
 */
class etcd_ttl_key_store : public ttl_key_store {
public:
  explicit etcd_ttl_key_store(
      std::shared_ptr<grpc::Channel> channel, std::string prefix = "leasehold/keys/",
      std::chrono::milliseconds rpc_timeout = std::chrono::milliseconds(2000));

  bool set_if_absent(std::string const& key, std::string const& value, std::chrono::milliseconds ttl) override;
  bool get(std::string const& key, std::string* value) override;
  bool expire(std::string const& key, std::chrono::milliseconds ttl) override;
  bool remove(std::string const& key) override;

private:
  detail::etcd_kv_client client_;
  std::string prefix_;
};

} // namespace lh

#endif // lh_etcd_ttl_key_store_hpp
