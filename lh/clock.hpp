#ifndef lh_clock_hpp
#define lh_clock_hpp

#include <chrono>
#include <cstdint>
#include <functional>

namespace lh {

/// The clock used for lease expirations and timer deadlines.
using clock_type = std::chrono::system_clock;

/**
 * A source of wall-clock time.
 *
 * The stores, the backends and the election engine never call clock_type::now() directly, they get a
 * clock_function instead.  Tests inject a simulated clock that only moves when the test says so.
 */
using clock_function = std::function<clock_type::time_point()>;

/// The default clock_function, simply wraps std::chrono::system_clock::now()
inline clock_function system_clock_function() {
  return []() { return clock_type::now(); };
}

/// Milliseconds since the epoch, the unit used in lease records and events.
inline std::int64_t to_epoch_ms(clock_type::time_point tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

/// Convert milliseconds since the epoch back to a time point.
inline clock_type::time_point from_epoch_ms(std::int64_t ms) {
  return clock_type::time_point(std::chrono::duration_cast<clock_type::duration>(std::chrono::milliseconds(ms)));
}

} // namespace lh

#endif // lh_clock_hpp
