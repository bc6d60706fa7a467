#ifndef lh_node_registry_hpp
#define lh_node_registry_hpp

#include <lh/clock.hpp>
#include <lh/detail/deadline_timer.hpp>
#include <lh/detail/node_state_machine.hpp>

#include <memory>
#include <string>
#include <vector>

namespace lh {

/// A copy of the observable state of a node.
struct node_info {
  std::string id;
  node_status status;
  /// True iff status == node_status::leader
  bool has_lease;
  clock_type::time_point lease_expiry;
};

/**
 * One simulated participant in the election.
 *
 * A node owns its in-memory status, its lease expiration (present only while it is the leader), and the handles of
 * its pending timers.  The node does not know how to cancel the timers, the election engine takes them with
 * release_timers() and cancels them through the completion queue that created them.
 */
class node {
public:
  explicit node(std::string id);

  std::string const& id() const {
    return id_;
  }
  node_status status() const {
    return machine_.current();
  }
  bool has_lease() const {
    return has_lease_;
  }
  clock_type::time_point lease_expiry() const {
    return lease_expiry_;
  }

  /// Return a copy of the observable state.
  node_info info() const;

  //@{
  /// @name State transitions, each returns false (and changes nothing) if the transition is invalid.
  bool start_competing(char const* where);
  bool promote(char const* where, clock_type::time_point lease_expiry);
  bool demote(char const* where);
  bool crash(char const* where);
  void reset();
  //@}

  /// Extend the lease of a leader, throws if the node is not the leader.
  void extend_lease(clock_type::time_point lease_expiry);

  //@{
  /**
   * @name Pending timers.
   *
   * The competition timer is either the jitter delay before an acquisition attempt, or the backoff delay before a
   * follower competes again.  The heartbeat timer is only set while the node is the leader.
   */
  std::shared_ptr<detail::deadline_timer> const& competition_timer() const {
    return competition_timer_;
  }
  void competition_timer(std::shared_ptr<detail::deadline_timer> t) {
    competition_timer_ = std::move(t);
  }
  std::shared_ptr<detail::deadline_timer> const& heartbeat_timer() const {
    return heartbeat_timer_;
  }
  void heartbeat_timer(std::shared_ptr<detail::deadline_timer> t) {
    heartbeat_timer_ = std::move(t);
  }

  /// Forget all the pending timers and return them, so the caller can cancel them.
  std::vector<std::shared_ptr<detail::deadline_timer>> release_timers();
  //@}

private:
  void check_invariants() const;

private:
  std::string id_;
  detail::node_state_machine machine_;
  bool has_lease_;
  clock_type::time_point lease_expiry_;
  std::shared_ptr<detail::deadline_timer> competition_timer_;
  std::shared_ptr<detail::deadline_timer> heartbeat_timer_;
};

/**
 * Hold the fixed set of simulated nodes.
 *
 * The nodes are created once, named @c prefix followed by 1, 2, ... N, and are never added or removed afterwards.
 * References to the nodes remain valid for the lifetime of the registry.  The registry does no locking, the election
 * engine serializes all access.
 */
class node_registry {
public:
  explicit node_registry(std::size_t node_count, std::string const& prefix = "node-");

  std::vector<node>& list() {
    return nodes_;
  }
  std::vector<node> const& list() const {
    return nodes_;
  }

  /// Return the node called @a id, throws std::invalid_argument if there is no such node.
  node& get(std::string const& id);

  /// Return the node called @a id, or nullptr if there is no such node.
  node* find(std::string const& id);

  /**
   * Move all the nodes back to idle, clearing their leases.
   *
   * Crashed nodes are reset too.  The caller must have canceled the timers already.
   */
  void reset();

  /// Mark a node as crashed, returns false if it was already crashed.
  bool mark_crashed(std::string const& id);

  /// Copy the observable state of all the nodes.
  std::vector<node_info> snapshot() const;

private:
  std::vector<node> nodes_;
};

} // namespace lh

#endif // lh_node_registry_hpp
