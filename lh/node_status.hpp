#ifndef lh_node_status_hpp
#define lh_node_status_hpp

#include <iostream>

namespace lh {
/**
 * The status of a simulated node in the election.
 *
 * The values are mutually exclusive.  The streaming operator produces the names used in the event wire format.
 */
enum class node_status {
  /// Not participating, the state before the first election and after a reset.
  idle,
  /// Waiting for (or executing) an attempt to acquire the lease.
  competing,
  /// Holds the lease, renews it periodically.
  leader,
  /// Lost the last acquisition attempt, will compete again after a backoff.
  follower,
  /// Explicitly failed, only a reset brings it back.
  crashed,
};

/// The streaming operator for @c node_status.
std::ostream& operator<<(std::ostream& os, node_status x);

} // namespace lh

#endif // lh_node_status_hpp
