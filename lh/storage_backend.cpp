#include "lh/storage_backend.hpp"

#include <stdexcept>

namespace lh {

std::ostream& operator<<(std::ostream& os, backend_kind x) {
  char const* values[] = {"conditional-write", "ttl-key"};
  return os << values[int(x)];
}

backend_kind parse_backend_kind(std::string const& name) {
  if (name == "A" or name == "conditional-write") {
    return backend_kind::conditional_write;
  }
  if (name == "B" or name == "ttl-key") {
    return backend_kind::ttl_key;
  }
  throw std::invalid_argument("unknown backend: " + name);
}

} // namespace lh
