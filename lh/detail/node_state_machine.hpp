#ifndef lh_detail_node_state_machine_hpp
#define lh_detail_node_state_machine_hpp

#include <lh/node_status.hpp>

namespace lh {
namespace detail {

/**
 * Implement the state machine for a simulated node.
 *
 * The idea is to have a small place to look at valid vs. invalid transitions and to centralize debug logging.  The
 * election engine serializes all access to the nodes, so this class does no locking of its own.
 *
 * @code
 * idle --start--> competing
 * competing --win--> leader
 * competing --lose--> follower
 * follower --retry after backoff--> competing
 * leader --renewal failure--> follower
 * {any but crashed} --crash--> crashed
 * {any} --reset--> idle
 * @endcode
 *
 * A new election also moves any node that is not crashed into @c competing.
 */
class node_state_machine {
public:
  node_state_machine()
      : state_(node_status::idle) {
  }

  /// Return the current state.
  node_status current() const {
    return state_;
  }

  /// Propose a state change, returns true if accepted.
  bool change_state(char const* where, node_status nstate);

  /// Returns true if the transition from @a from to @a to is valid.
  static bool valid_transition(node_status from, node_status to);

private:
  node_status state_;
};

} // namespace detail
} // namespace lh

#endif // lh_detail_node_state_machine_hpp
