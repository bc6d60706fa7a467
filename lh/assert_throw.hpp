#ifndef lh_assert_throw_hpp
#define lh_assert_throw_hpp
/**
 * @file
 *
 * Check internal invariants at runtime.
 *
 * The election state has a few invariants that must hold after every transition, for example a node holds a lease
 * iff it is the leader.  A violation is a bug, but the engine reports it as an exception rather than aborting, so a
 * timer callback can log it and the simulation keeps running.
 */

#include <stdexcept>
#include <string>

#ifndef LH_ASSERT_THROW
/**
 * Raise lh::invariant_error if the predicate @a P is false.
 */
#define LH_ASSERT_THROW(P)                                                                                             \
  do {                                                                                                                 \
    if (not(P)) {                                                                                                      \
      lh::assert_throw_impl(#P, __func__, __FILE__, __LINE__);                                                         \
    }                                                                                                                  \
  } while (false)
#endif // LH_ASSERT_THROW

namespace lh {

/// The exception raised by LH_ASSERT_THROW()
class invariant_error : public std::runtime_error {
public:
  invariant_error(std::string const& what, char const* predicate)
      : std::runtime_error(what)
      , predicate_(predicate) {
  }

  /// The text of the predicate that was false.
  std::string const& predicate() const {
    return predicate_;
  }

private:
  std::string predicate_;
};

/// Implement LH_ASSERT_THROW() out of line, always raises lh::invariant_error.
[[noreturn]] void assert_throw_impl(char const* predicate, char const* function, char const* filename, int lineno);
} // namespace lh

#endif // lh_assert_throw_hpp
