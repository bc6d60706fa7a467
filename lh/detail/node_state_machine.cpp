#include "lh/detail/node_state_machine.hpp"
#include <lh/log.hpp>

namespace lh {
namespace detail {

bool node_state_machine::change_state(char const* where, node_status nstate) {
  if (not valid_transition(state_, nstate)) {
    LH_LOG(debug) << where << ": rejected transition " << state_ << " -> " << nstate;
    return false;
  }
  state_ = nstate;
  return true;
}

bool node_state_machine::valid_transition(node_status from, node_status to) {
  using s = node_status;
  if (to == s::idle) {
    return true;
  }
  switch (from) {
  case s::crashed:
    break;
  case s::idle:
    return to == s::competing or to == s::crashed;
  case s::competing:
    return to == s::competing or to == s::leader or to == s::follower or to == s::crashed;
  case s::leader:
    return to == s::follower or to == s::competing or to == s::crashed;
  case s::follower:
    return to == s::competing or to == s::crashed;
  }
  return false;
}

} // namespace detail
} // namespace lh
