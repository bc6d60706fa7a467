#include "lh/assert_throw.hpp"

#include <sstream>

namespace lh {

[[noreturn]] void assert_throw_impl(char const* predicate, char const* function, char const* filename, int lineno) {
  std::ostringstream os;
  os << "invariant (" << predicate << ") violated in " << function << "(" << filename << ":" << lineno << ")";
  throw invariant_error(os.str(), predicate);
}

} // namespace lh
