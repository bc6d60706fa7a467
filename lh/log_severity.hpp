#ifndef lh_log_severity_hpp
#define lh_log_severity_hpp
/**
 * @file
 *
 * Define the log severity values and some macros associated with them.
 */

#include <iosfwd>
#include <string>

#ifndef LH_MIN_SEVERITY
/**
 * All log messages below this level are disabled at compile time.
 *
 * Disabled messages become cheap no-op's that the optimizer should eliminate, so the engine can log every node
 * transition at debug level without paying for it in normal builds.
 */
#define LH_MIN_SEVERITY info
#endif // LH_MIN_SEVERITY

namespace lh {
/**
 * Define the severity levels for leasehold logging.
 *
 * These are modelled after the severity level in syslog(1) and many derived tools.
 */
enum class severity {
  /// Use this level for messages that indicate the code is entering and leaving functions.
  trace,
  /// Use this level for debug messages, such as every node state transition.
  debug,
  /// Informational messages, such as elections starting or a node winning the lease.
  info,
  /// Informational messages, such as unusual, but expected conditions.
  notice,
  /// An indication of problems, for example a backend operation that failed and was treated as a lost race.
  warning,
  /// An error has been detected.  Do not use for normal conditions, such as losing a race.
  error,
  /// The system is in a critical state, such as running out of local resources.
  critical,
  /// The system is at risk of immediate failure.
  alert,
  /// The system is about to crash or terminate.
  fatal,
  /// The highest possible severity level.
  HIGHEST = int(fatal),
  /// The lowest possible severity level.
  LOWEST = int(trace),
  /// The lowest level that is enabled at compile-time.
  LOWEST_ENABLED = int(LH_MIN_SEVERITY),
};

/// Streaming operator, writes a human readable representation.
std::ostream& operator<<(std::ostream& os, severity x);

/**
 * Parse a severity name, as produced by the streaming operator.
 *
 * @throws std::invalid_argument if @a name is not a known severity.
 */
severity parse_severity(std::string const& name);

} // namespace lh

#endif // lh_log_severity_hpp
