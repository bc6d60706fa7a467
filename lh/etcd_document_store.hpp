#ifndef lh_etcd_document_store_hpp
#define lh_etcd_document_store_hpp

#include <lh/detail/etcd_kv_client.hpp>
#include <lh/document_store.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace lh {

/**
 * A lh::document_store on top of etcd.
 *
 * Each record is stored as a serialized lh::proto::lease_record under @c prefix + id.  Conditional updates are
 * compare-and-swap transactions on the key modification revision, inserts are transactions that require the key to
 * not exist.
 */
class etcd_document_store : public document_store {
public:
  explicit etcd_document_store(
      std::shared_ptr<grpc::Channel> channel, std::string prefix = "leasehold/documents/",
      std::chrono::milliseconds rpc_timeout = std::chrono::milliseconds(2000));

  bool find_one_and_update(
      document_filter const& filter, proto::lease_record const& update, proto::lease_record* after) override;
  void insert_one(proto::lease_record const& record) override;
  bool find_one(std::string const& id, proto::lease_record* record) override;
  bool delete_one(std::string const& id) override;
  void delete_all() override;

private:
  std::string key(std::string const& id) const {
    return prefix_ + id;
  }

  /// Read and parse a record, returns false if there is none.
  bool read(std::string const& id, proto::lease_record* record, std::int64_t* mod_revision);

private:
  detail::etcd_kv_client client_;
  std::string prefix_;
};

} // namespace lh

#endif // lh_etcd_document_store_hpp
