#include "lh/etcd_document_store.hpp"
#include <lh/log.hpp>
#include <lh/prefix_end.hpp>

namespace lh {

etcd_document_store::etcd_document_store(
    std::shared_ptr<grpc::Channel> channel, std::string prefix, std::chrono::milliseconds rpc_timeout)
    : client_(std::move(channel), rpc_timeout)
    , prefix_(std::move(prefix)) {
}

bool etcd_document_store::find_one_and_update(
    document_filter const& filter, proto::lease_record const& update, proto::lease_record* after) {
  // ... optimistic concurrency control: read the record, and write it back only if nobody modified it since.  If
  // somebody did, evaluate the filter again on the new version ...
  for (;;) {
    proto::lease_record current;
    std::int64_t mod_revision = 0;
    if (not read(filter.id, &current, &mod_revision) or not filter.matches(current)) {
      return false;
    }
    if (not update.owner().empty()) {
      current.set_owner(update.owner());
    }
    current.set_expires_at(update.expires_at());
    current.set_updated_at(update.updated_at());

    etcdserverpb::TxnRequest req;
    auto& cmp = *req.add_compare();
    cmp.set_key(key(filter.id));
    cmp.set_result(etcdserverpb::Compare::EQUAL);
    cmp.set_target(etcdserverpb::Compare::MOD);
    cmp.set_mod_revision(mod_revision);
    auto& put = *req.add_success()->mutable_request_put();
    put.set_key(key(filter.id));
    put.set_value(current.SerializeAsString());

    auto resp = client_.commit(req, "etcd_document_store::find_one_and_update()");
    if (resp.succeeded()) {
      if (after != nullptr) {
        *after = std::move(current);
      }
      return true;
    }
    LH_LOG(debug) << "concurrent modification of " << key(filter.id) << ", trying again";
  }
}

void etcd_document_store::insert_one(proto::lease_record const& record) {
  // ... the key does not exist iff its creation revision is 0 ...
  etcdserverpb::TxnRequest req;
  auto& cmp = *req.add_compare();
  cmp.set_key(key(record.id()));
  cmp.set_result(etcdserverpb::Compare::EQUAL);
  cmp.set_target(etcdserverpb::Compare::CREATE);
  cmp.set_create_revision(0);
  auto& put = *req.add_success()->mutable_request_put();
  put.set_key(key(record.id()));
  put.set_value(record.SerializeAsString());

  auto resp = client_.commit(req, "etcd_document_store::insert_one()");
  if (not resp.succeeded()) {
    throw duplicate_key_error("etcd_document_store::insert_one() - duplicate key: " + key(record.id()));
  }
}

bool etcd_document_store::find_one(std::string const& id, proto::lease_record* record) {
  std::int64_t mod_revision = 0;
  return read(id, record, &mod_revision);
}

bool etcd_document_store::delete_one(std::string const& id) {
  return client_.delete_range(key(id), std::string()) != 0;
}

void etcd_document_store::delete_all() {
  client_.delete_range(prefix_, prefix_end(prefix_));
}

bool etcd_document_store::read(std::string const& id, proto::lease_record* record, std::int64_t* mod_revision) {
  mvccpb::KeyValue kv;
  if (not client_.get(key(id), &kv)) {
    return false;
  }
  proto::lease_record tmp;
  if (not tmp.ParseFromString(kv.value())) {
    throw std::runtime_error("etcd_document_store - cannot parse record at " + key(id));
  }
  if (record != nullptr) {
    *record = std::move(tmp);
  }
  *mod_revision = kv.mod_revision();
  return true;
}

} // namespace lh
