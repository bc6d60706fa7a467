#ifndef lh_conditional_write_backend_hpp
#define lh_conditional_write_backend_hpp

#include <lh/document_store.hpp>
#include <lh/storage_backend.hpp>

#include <atomic>
#include <chrono>
#include <memory>

namespace lh {

/**
 * Arbitrate the lease with conditional updates on a document store.
 *
 * The lease is a single record with id "current-leader".  Acquiring the lease first tries to take over an expired
 * record with a conditional update.  If nothing matches the backend inserts a new record, and a duplicate key on
 * that insert means another node won the race.  Renewing the lease is a conditional update matching the owner.
 */
class conditional_write_backend : public storage_backend {
public:
  /// The id of the lease record.
  static char const record_id[];

  conditional_write_backend(std::shared_ptr<document_store> store, std::chrono::milliseconds lease_duration);

  backend_kind kind() const override {
    return backend_kind::conditional_write;
  }
  bool try_acquire(std::string const& node_id, clock_type::time_point now) override;
  bool renew(std::string const& node_id, clock_type::time_point now) override;
  void release() override;
  void reset() override;
  void close() override;

private:
  /// Return the store, or nullptr after close().
  std::shared_ptr<document_store> store() const;

  /// Create the update to write at @a now.
  proto::lease_record make_update(std::string const& owner, clock_type::time_point now) const;

private:
  std::shared_ptr<document_store> store_;
  std::chrono::milliseconds lease_duration_;
  std::atomic<bool> closed_;
};

} // namespace lh

#endif // lh_conditional_write_backend_hpp
