#include "lh/prefix_end.hpp"

#include <cstdint>

namespace lh {

std::string prefix_end(std::string const& prefix) {
  std::string range_end = prefix;
  // ... drop the trailing 0xFF bytes, they cannot be incremented ...
  while (not range_end.empty() and std::uint8_t(range_end.back()) == 0xFF) {
    range_end.pop_back();
  }
  if (range_end.empty()) {
    return std::string(1, '\0');
  }
  range_end.back() = static_cast<char>(std::uint8_t(range_end.back()) + 1);
  return range_end;
}

} // namespace lh
