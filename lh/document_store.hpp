#ifndef lh_document_store_hpp
#define lh_document_store_hpp

#include <lh/clock.hpp>
#include <lh/lease_record.pb.h>

#include <stdexcept>
#include <string>

namespace lh {

/// Raised by document_store::insert_one() when a record with the same id already exists.
class duplicate_key_error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/**
 * Select a record in a document_store.
 *
 * A record matches if its id is @c id, and, when requested, its owner is @c owner, and, when requested, its
 * expiration is before @c expired_before.  A record without an expiration (expires_at == 0) always matches the
 * expiration condition.
 */
struct document_filter {
  std::string id;
  bool match_owner = false;
  std::string owner;
  bool match_expired = false;
  clock_type::time_point expired_before;

  /// Returns true if @a record matches the filter.
  bool matches(proto::lease_record const& record) const;
};

/**
 * A document store with conditional (optimistic) updates.
 *
 * This is the minimal subset of a document database needed by the conditional-write backend.  Every operation must
 * be atomic with respect to concurrent callers.  Implementations report transport errors as exceptions.
 */
class document_store {
public:
  virtual ~document_store() {}

  /**
   * Atomically update the record selected by @a filter.
   *
   * The update overwrites expires_at and updated_at, and also the owner if @c update.owner() is not empty.  The id
   * is never changed.
   *
   * @param after if not null, receives the record after the update.
   * @return true if a record matched and was updated, false if nothing matched.
   */
  virtual bool find_one_and_update(
      document_filter const& filter, proto::lease_record const& update, proto::lease_record* after) = 0;

  /**
   * Insert a new record.
   *
   * @throws duplicate_key_error if a record with the same id exists.
   */
  virtual void insert_one(proto::lease_record const& record) = 0;

  /// Read a record, returns false if it does not exist.
  virtual bool find_one(std::string const& id, proto::lease_record* record) = 0;

  /// Delete a record, returns false if it did not exist.
  virtual bool delete_one(std::string const& id) = 0;

  /// Delete all the records.
  virtual void delete_all() = 0;
};

} // namespace lh

#endif // lh_document_store_hpp
