#include "lh/node_status.hpp"

namespace lh {

std::ostream& operator<<(std::ostream& os, node_status x) {
  char const* values[] = {"idle", "competing", "leader", "follower", "crashed"};
  return os << values[int(x)];
}

} // namespace lh
