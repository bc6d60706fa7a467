#ifndef lh_log_hpp
#define lh_log_hpp
/**
 * @file
 *
 * Define macros, types, and functions for logging in leasehold.
 */
#include <lh/detail/null_stream.hpp>
#include <lh/log_severity.hpp>
#include <lh/log_sink.hpp>

#include <memory>
#include <mutex>
#include <sstream>
#include <vector>

/// Concatenate two pre-processor tokens.
#define LH_PP_CAT(a, b) a##b

/**
 * Create a unique, or mostly-likely unique identifier.
 *
 * In LH_LOG() we need an identifier for the logger.  The user may want to log a variable with any name, we make a
 * collision unlikely by using an identifier that depends on the line number.
 */
#define LH_LOGGER_IDENTIFIER LH_PP_CAT(lh_log_, __LINE__)

/**
 * The main entry point for leasehold logging facilities.
 *
 * Typically this used only in tests, applications should use LH_LOG().
 */
#define LH_LOG_I(level, sink)                                                                                          \
  for (auto LH_LOGGER_IDENTIFIER = lh::logger<lh::level_compile_time_disabled(lh::severity::level)>(                   \
           lh::severity::level, __func__, __FILE__, __LINE__, sink);                                                   \
       (bool)LH_LOGGER_IDENTIFIER; LH_LOGGER_IDENTIFIER.write_to(sink))                                                \
  LH_LOGGER_IDENTIFIER.get()

/**
 * Declare a logger named @a name.
 */
#define LH_LOGGER_DECL(level, sink, name)                                                                              \
  lh::logger<lh::level_compile_time_disabled(lh::severity::level)> name(                                               \
      lh::severity::level, __func__, __FILE__, __LINE__, sink)

#ifndef LH_LOG
#define LH_LOG(level) LH_LOG_I(level, lh::log::instance())
#endif // LH_LOG

/**
 * The main namespace for the leasehold library.
 */
namespace lh {
/**
 * The logging framework core.
 *
 * One wants to be able to log from any point in the code, but one also wants to decouple the code from the log
 * sinks, and inject a different logger for testing vs. production.  We compromise by using a log class which is a
 * singleton, with an escape hatch (a public constructor) for tests.
 */
class log {
public:
  /// Normally use @c lh::log::instance(), this is useful in testing.
  log()
      : mu_()
      , min_severity_(severity::LOWEST)
      , sinks_() {
  }

  /// Return the singleton instance
  static log& instance();

  /// Add a new sink to the core.
  void add_sink(std::shared_ptr<log_sink> sink);

  /// Remove a single sink, returns false if the sink was not registered.
  bool remove_sink(std::shared_ptr<log_sink> const& sink);

  /// Remove all the current log sinks from the core.
  void clear_sinks();

  /// Write a new log message
  void write(severity sev, std::string&& msg);

  /// Set the minimum severity for the following messages, notice that each sink can implement its own filtering.
  void min_severity(severity sev) {
    std::lock_guard<std::mutex> guard(mu_);
    min_severity_ = sev;
  }

  /// Return the current run-time minimum severity.
  severity min_severity() const {
    std::lock_guard<std::mutex> guard(mu_);
    return min_severity_;
  }

private:
  /// Protect access to the shared state
  mutable std::mutex mu_;
  /// The minimum run-time severity
  severity min_severity_;
  /// The list of sinks
  std::vector<std::shared_ptr<log_sink>> sinks_;

  /// The single instance used in the program ...
  static std::unique_ptr<log> singleton_;
};

/**
 * A compile-time disabled log message container.
 *
 * The generic version creates a message container that contains nothing.  All streaming operations are
 * no-op's.  See @c detail::null_stream for more information.
 *
 * @tparam disabled if true, use a compile-time-disabled logger, which does not log anything.
 */
template <bool disabled>
class logger {
public:
  logger(severity s, char const* func, char const* file, int lineno, log& sink) {
  }

  explicit operator bool() const {
    return false;
  }

  /// Get the lh::detail::null_stream to consume the iostream expression.
  detail::null_stream& get() {
    return os;
  }

  void write_to(log& sink) {
  }

private:
  detail::null_stream os;
};

/**
 * A simple log message container.
 *
 * This specialization formats the message into a std::ostringstream and then sends it to the configured sinks, if
 * any.
 */
template <>
class logger<false> {
public:
  logger(severity s, char const* func, char const* file, int lineno, log& sink);

  explicit operator bool() const {
    return not closed;
  }

  /// Get the std::ostream where the message will be formatted.
  std::ostream& get() {
    return os;
  }

  /// Save the message to the log sink
  void write_to(lh::log& sink);

private:
  std::ostringstream os;
  severity sev;
  std::string function;
  std::string filename;
  int lineno;
  bool closed;
};

/**
 * Determine if a given severity level is disabled at compile-time.
 *
 * @param lvl the severity level to check.
 * @returns true if @a lvl is disabled at compile-time.
 */
bool constexpr level_compile_time_disabled(severity lvl) {
  return lvl < lh::severity::LH_MIN_SEVERITY;
}
} // namespace lh

#endif // lh_log_hpp
