#include "lh/conditional_write_backend.hpp"
#include <lh/detail/grpc_errors.hpp>
#include <lh/assert_throw.hpp>
#include <lh/log.hpp>

namespace lh {

char const conditional_write_backend::record_id[] = "current-leader";

conditional_write_backend::conditional_write_backend(
    std::shared_ptr<document_store> store, std::chrono::milliseconds lease_duration)
    : store_(std::move(store))
    , lease_duration_(lease_duration)
    , closed_(false) {
}

bool conditional_write_backend::try_acquire(std::string const& node_id, clock_type::time_point now) {
  auto s = store();
  if (not s) {
    return false;
  }
  try {
    document_filter filter;
    filter.id = record_id;
    filter.match_expired = true;
    filter.expired_before = now;
    auto update = make_update(node_id, now);
    proto::lease_record after;
    if (s->find_one_and_update(filter, update, &after)) {
      LH_LOG(debug) << node_id << " took over expired lease " << detail::print_to_stream(after);
      return true;
    }
    // ... nothing expired to take over, either there is no record or it is held by somebody else ...
    update.set_id(record_id);
    try {
      s->insert_one(update);
    } catch (duplicate_key_error const& ex) {
      LH_LOG(debug) << node_id << " lost the race: " << ex.what();
      return false;
    }
    LH_LOG(debug) << node_id << " created lease " << detail::print_to_stream(update);
    return true;
  } catch (std::exception const& ex) {
    LH_LOG(warning) << "try_acquire(" << node_id << ") failed: " << ex.what();
  }
  return false;
}

bool conditional_write_backend::renew(std::string const& node_id, clock_type::time_point now) {
  auto s = store();
  if (not s) {
    return false;
  }
  try {
    document_filter filter;
    filter.id = record_id;
    filter.match_owner = true;
    filter.owner = node_id;
    return s->find_one_and_update(filter, make_update(std::string(), now), nullptr);
  } catch (std::exception const& ex) {
    LH_LOG(warning) << "renew(" << node_id << ") failed: " << ex.what();
  }
  return false;
}

void conditional_write_backend::release() {
  auto s = store();
  if (not s) {
    return;
  }
  try {
    s->delete_one(record_id);
  } catch (std::exception const& ex) {
    LH_LOG(warning) << "release() failed: " << ex.what();
  }
}

void conditional_write_backend::reset() {
  auto s = store();
  LH_ASSERT_THROW(s);
  s->delete_all();
}

void conditional_write_backend::close() {
  closed_.store(true);
}

std::shared_ptr<document_store> conditional_write_backend::store() const {
  if (closed_.load()) {
    return std::shared_ptr<document_store>();
  }
  return store_;
}

proto::lease_record conditional_write_backend::make_update(std::string const& owner, clock_type::time_point now) const {
  proto::lease_record update;
  update.set_owner(owner);
  update.set_expires_at(to_epoch_ms(now + lease_duration_));
  update.set_updated_at(to_epoch_ms(now));
  return update;
}

} // namespace lh
