#ifndef lh_election_event_hpp
#define lh_election_event_hpp

#include <lh/clock.hpp>
#include <lh/node_registry.hpp>

#include <json/json.h>

#include <iostream>
#include <string>

namespace lh {

/// The kinds of events reported by the election engine.
enum class event_type {
  election_started,
  election_reset,
  node_crashed,
  node_update,
  leader_elected,
  leader_lost,
};

/// Stream the wire name of the event type, e.g. "node-update".
std::ostream& operator<<(std::ostream& os, event_type x);

/**
 * An event reported by the election engine.
 *
 * Only the fields relevant to each event type are meaningful:
 * - election_started: backend
 * - election_reset: none
 * - node_crashed, leader_elected, leader_lost: node_id
 * - node_update: node_id, status, has_lease and lease
 */
struct election_event {
  event_type type;
  std::string node_id;
  node_status status;
  bool has_lease;
  clock_type::time_point lease;
  std::string backend;

  //@{
  /// @name Create each type of event.
  static election_event started(std::string backend);
  static election_event reset();
  static election_event crashed(std::string node_id);
  static election_event update(node_info const& info);
  static election_event elected(std::string node_id);
  static election_event lost(std::string node_id);
  //@}

  /**
   * Convert to the wire format.
   *
   * The keys are "type" and, depending on the type, "nodeId", "status", "lease" (milliseconds since the epoch, or
   * null) and "backend".
   */
  Json::Value to_json() const;
};

bool operator==(election_event const& lhs, election_event const& rhs);
inline bool operator!=(election_event const& lhs, election_event const& rhs) {
  return not(lhs == rhs);
}

/// Stream the event as a single-line JSON object.
std::ostream& operator<<(std::ostream& os, election_event const& x);

} // namespace lh

#endif // lh_election_event_hpp
