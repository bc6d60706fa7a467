#include "lh/etcd_ttl_key_store.hpp"
#include <lh/detail/lease_guard.hpp>

namespace lh {

etcd_ttl_key_store::etcd_ttl_key_store(
    std::shared_ptr<grpc::Channel> channel, std::string prefix, std::chrono::milliseconds rpc_timeout)
    : client_(std::move(channel), rpc_timeout)
    , prefix_(std::move(prefix)) {
}

bool etcd_ttl_key_store::set_if_absent(
    std::string const& key, std::string const& value, std::chrono::milliseconds ttl) {
  detail::lease_guard<detail::etcd_kv_client> lease(client_, client_.grant_lease(ttl));

  etcdserverpb::TxnRequest req;
  auto& cmp = *req.add_compare();
  cmp.set_key(prefix_ + key);
  cmp.set_result(etcdserverpb::Compare::EQUAL);
  cmp.set_target(etcdserverpb::Compare::CREATE);
  cmp.set_create_revision(0);
  auto& put = *req.add_success()->mutable_request_put();
  put.set_key(prefix_ + key);
  put.set_value(value);
  put.set_lease(lease.lease_id());

  auto resp = client_.commit(req, "etcd_ttl_key_store::set_if_absent()");
  if (resp.succeeded()) {
    lease.attached();
  }
  return resp.succeeded();
}

bool etcd_ttl_key_store::get(std::string const& key, std::string* value) {
  mvccpb::KeyValue kv;
  if (not client_.get(prefix_ + key, &kv)) {
    return false;
  }
  if (value != nullptr) {
    *value = kv.value();
  }
  return true;
}

bool etcd_ttl_key_store::expire(std::string const& key, std::chrono::milliseconds ttl) {
  detail::lease_guard<detail::etcd_kv_client> lease(client_, client_.grant_lease(ttl));

  // ... move the key to the new lease if it exists, whatever its value ...
  etcdserverpb::TxnRequest req;
  auto& cmp = *req.add_compare();
  cmp.set_key(prefix_ + key);
  cmp.set_result(etcdserverpb::Compare::GREATER);
  cmp.set_target(etcdserverpb::Compare::CREATE);
  cmp.set_create_revision(0);
  auto& put = *req.add_success()->mutable_request_put();
  put.set_key(prefix_ + key);
  put.set_ignore_value(true);
  put.set_lease(lease.lease_id());

  auto resp = client_.commit(req, "etcd_ttl_key_store::expire()");
  if (resp.succeeded()) {
    lease.attached();
  }
  return resp.succeeded();
}

bool etcd_ttl_key_store::remove(std::string const& key) {
  return client_.delete_range(prefix_ + key, std::string()) != 0;
}

} // namespace lh
