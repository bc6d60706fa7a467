#include "lh/detail/etcd_kv_client.hpp"
#include <lh/assert_throw.hpp>
#include <lh/detail/grpc_errors.hpp>
#include <lh/log.hpp>

namespace lh {
namespace detail {

etcd_kv_client::etcd_kv_client(std::shared_ptr<grpc::Channel> channel, std::chrono::milliseconds rpc_timeout)
    : channel_(std::move(channel))
    , kv_(etcdserverpb::KV::NewStub(channel_))
    , lease_(etcdserverpb::Lease::NewStub(channel_))
    , rpc_timeout_(rpc_timeout) {
}

bool etcd_kv_client::get(std::string const& key, mvccpb::KeyValue* kv) {
  etcdserverpb::RangeRequest req;
  req.set_key(key);
  etcdserverpb::RangeResponse resp;
  auto context = make_context();
  auto status = kv_->Range(context.get(), req, &resp);
  check_grpc_status(status, "etcd_kv_client::get()", " key=", key);
  if (resp.kvs_size() == 0) {
    return false;
  }
  LH_ASSERT_THROW(resp.kvs_size() == 1);
  if (kv != nullptr) {
    *kv = resp.kvs(0);
  }
  return true;
}

etcdserverpb::TxnResponse etcd_kv_client::commit(etcdserverpb::TxnRequest const& request, char const* where) {
  etcdserverpb::TxnResponse resp;
  auto context = make_context();
  auto status = kv_->Txn(context.get(), request, &resp);
  check_grpc_status(status, where, " request=", print_to_stream(request));
  LH_LOG(trace) << where << " response=" << print_to_stream(resp);
  return resp;
}

std::int64_t etcd_kv_client::delete_range(std::string const& key, std::string const& range_end) {
  etcdserverpb::DeleteRangeRequest req;
  req.set_key(key);
  if (not range_end.empty()) {
    req.set_range_end(range_end);
  }
  etcdserverpb::DeleteRangeResponse resp;
  auto context = make_context();
  auto status = kv_->DeleteRange(context.get(), req, &resp);
  check_grpc_status(status, "etcd_kv_client::delete_range()", " key=", key);
  return resp.deleted();
}

std::int64_t etcd_kv_client::grant_lease(std::chrono::milliseconds ttl) {
  auto seconds = std::chrono::duration_cast<std::chrono::seconds>(ttl + std::chrono::milliseconds(999));
  etcdserverpb::LeaseGrantRequest req;
  req.set_ttl(seconds.count());
  req.set_id(0);
  etcdserverpb::LeaseGrantResponse resp;
  auto context = make_context();
  auto status = lease_->LeaseGrant(context.get(), req, &resp);
  check_grpc_status(status, "etcd_kv_client::grant_lease()", " request=", print_to_stream(req));
  if (not resp.error().empty()) {
    throw std::runtime_error("etcd_kv_client::grant_lease() - " + resp.error());
  }
  return resp.id();
}

void etcd_kv_client::revoke_lease(std::int64_t lease_id) {
  etcdserverpb::LeaseRevokeRequest req;
  req.set_id(lease_id);
  etcdserverpb::LeaseRevokeResponse resp;
  auto context = make_context();
  auto status = lease_->LeaseRevoke(context.get(), req, &resp);
  if (not status.ok()) {
    LH_LOG(warning) << "revoke_lease(" << std::hex << lease_id << ") failed: " << status.error_message();
  }
}

std::unique_ptr<grpc::ClientContext> etcd_kv_client::make_context() const {
  std::unique_ptr<grpc::ClientContext> context(new grpc::ClientContext);
  context->set_deadline(std::chrono::system_clock::now() + rpc_timeout_);
  return context;
}

} // namespace detail
} // namespace lh
