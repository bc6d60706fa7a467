#include "lh/node_registry.hpp"
#include <lh/assert_throw.hpp>
#include <lh/log.hpp>

#include <stdexcept>

namespace lh {

node::node(std::string id)
    : id_(std::move(id))
    , machine_()
    , has_lease_(false)
    , lease_expiry_()
    , competition_timer_()
    , heartbeat_timer_() {
}

node_info node::info() const {
  return node_info{id_, status(), has_lease_, lease_expiry_};
}

bool node::start_competing(char const* where) {
  if (not machine_.change_state(where, node_status::competing)) {
    return false;
  }
  has_lease_ = false;
  check_invariants();
  return true;
}

bool node::promote(char const* where, clock_type::time_point lease_expiry) {
  if (not machine_.change_state(where, node_status::leader)) {
    return false;
  }
  has_lease_ = true;
  lease_expiry_ = lease_expiry;
  check_invariants();
  return true;
}

bool node::demote(char const* where) {
  if (not machine_.change_state(where, node_status::follower)) {
    return false;
  }
  has_lease_ = false;
  check_invariants();
  return true;
}

bool node::crash(char const* where) {
  if (not machine_.change_state(where, node_status::crashed)) {
    return false;
  }
  has_lease_ = false;
  check_invariants();
  return true;
}

void node::reset() {
  machine_.change_state("node::reset()", node_status::idle);
  has_lease_ = false;
  check_invariants();
}

void node::extend_lease(clock_type::time_point lease_expiry) {
  LH_ASSERT_THROW(status() == node_status::leader);
  lease_expiry_ = lease_expiry;
}

std::vector<std::shared_ptr<detail::deadline_timer>> node::release_timers() {
  std::vector<std::shared_ptr<detail::deadline_timer>> timers;
  if (competition_timer_) {
    timers.push_back(std::move(competition_timer_));
  }
  if (heartbeat_timer_) {
    timers.push_back(std::move(heartbeat_timer_));
  }
  competition_timer_.reset();
  heartbeat_timer_.reset();
  return timers;
}

void node::check_invariants() const {
  LH_ASSERT_THROW(has_lease_ == (status() == node_status::leader));
}

node_registry::node_registry(std::size_t node_count, std::string const& prefix)
    : nodes_() {
  nodes_.reserve(node_count);
  for (std::size_t i = 1; i <= node_count; ++i) {
    nodes_.emplace_back(prefix + std::to_string(i));
  }
}

node& node_registry::get(std::string const& id) {
  node* n = find(id);
  if (n == nullptr) {
    throw std::invalid_argument("unknown node id: " + id);
  }
  return *n;
}

node* node_registry::find(std::string const& id) {
  for (auto& n : nodes_) {
    if (n.id() == id) {
      return &n;
    }
  }
  return nullptr;
}

void node_registry::reset() {
  for (auto& n : nodes_) {
    n.reset();
  }
}

bool node_registry::mark_crashed(std::string const& id) {
  return get(id).crash("node_registry::mark_crashed()");
}

std::vector<node_info> node_registry::snapshot() const {
  std::vector<node_info> r;
  r.reserve(nodes_.size());
  for (auto const& n : nodes_) {
    r.push_back(n.info());
  }
  return r;
}

} // namespace lh
