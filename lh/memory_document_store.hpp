#ifndef lh_memory_document_store_hpp
#define lh_memory_document_store_hpp

#include <lh/document_store.hpp>

#include <map>
#include <mutex>

namespace lh {

/**
 * An in-process lh::document_store.
 *
 * All operations are serialized by a mutex, which makes each of them atomic.
 */
class memory_document_store : public document_store {
public:
  memory_document_store();

  bool find_one_and_update(
      document_filter const& filter, proto::lease_record const& update, proto::lease_record* after) override;
  void insert_one(proto::lease_record const& record) override;
  bool find_one(std::string const& id, proto::lease_record* record) override;
  bool delete_one(std::string const& id) override;
  void delete_all() override;

  /// The number of records, mostly for tests.
  std::size_t size() const;

private:
  mutable std::mutex mu_;
  std::map<std::string, proto::lease_record> records_;
};

} // namespace lh

#endif // lh_memory_document_store_hpp
