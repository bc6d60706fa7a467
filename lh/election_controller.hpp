#ifndef lh_election_controller_hpp
#define lh_election_controller_hpp

#include <lh/node_registry.hpp>
#include <lh/storage_backend.hpp>

#include <string>
#include <vector>

namespace lh {

/**
 * The command and query surface of a leader election simulation.
 *
 * Commands can be called from any thread.  The state transitions they cause, and all the transitions driven by
 * timers, are reported through the lh::event_sink given to the implementation.
 */
class election_controller {
public:
  virtual ~election_controller() {}

  /**
   * Start a new election on a fresh backend.
   *
   * Stops the current election, if any, creates the backend and clears its state, then every node that is not
   * crashed starts competing.
   *
   * @throws std::exception if the backend cannot be created or its state cannot be cleared.  The engine is left
   * stopped in that case.
   */
  virtual void start_election(backend_kind kind) = 0;

  /// Cancel all the pending timers and close the backend, the node statuses are kept.
  virtual void stop_election() = 0;

  /// Stop the election and move every node back to idle.
  virtual void reset_election() = 0;

  /**
   * Crash a node.
   *
   * Crashing a node that is already crashed does nothing.  If the node was the leader its lease is released.
   *
   * @throws std::invalid_argument if there is no node called @a node_id.
   */
  virtual void crash_node(std::string const& node_id) = 0;

  /// True while an election is running.
  virtual bool running() const = 0;

  /**
   * The kind of backend used by the current, or last, election.
   *
   * @throws std::runtime_error if no election was ever started.
   */
  virtual backend_kind active_backend() const = 0;

  /// A snapshot of the nodes.
  virtual std::vector<node_info> nodes() const = 0;

  /// The id of the node holding an unexpired lease, or an empty string if there is none.
  virtual std::string current_leader() const = 0;
};

} // namespace lh

#endif // lh_election_controller_hpp
