#ifndef lh_log_sink_hpp
#define lh_log_sink_hpp

#include <lh/log_severity.hpp>

#include <iosfwd>
#include <memory>
#include <string>
#include <utility>

namespace lh {

/**
 * A destination for logging messages.
 *
 * Applications can configure the destination for logging messages by setting one more more instances of lh::log_sink
 * in the global logger.
 */
class log_sink {
public:
  virtual ~log_sink() {}

  /**
   * Log the given message to the sink.
   *
   * @param sev the severity of the message.
   * @param message the message value.
   */
  virtual void log(severity sev, std::string&& message) = 0;
};

/**
 * An adaptor that converts any Functor into a @c lh::log_sink.
 *
 * @tparam Functor the type of the functor to adapt.
 */
template <typename Functor>
class log_to_functor : public log_sink {
public:
  explicit log_to_functor(Functor&& f)
      : functor(std::move(f)) {
  }
  explicit log_to_functor(Functor const& f)
      : functor(f) {
  }

  /// Forward logging to the functor.
  void log(severity sev, std::string&& message) override {
    functor(sev, std::move(message));
  }

private:
  Functor functor;
};

/**
 * Create a @c lh::log_sink shared pointer from a functor.
 *
 * @tparam Functor the type of the functor object @a f.
 * @param f the functor object to forward calls to.
 * @return a log_sink that forwards log() calls to the given functor @a f.
 */
template <typename Functor>
std::shared_ptr<log_sink> make_log_sink(Functor&& f) {
  using functor_type = typename std::decay<Functor>::type;
  return std::make_shared<log_to_functor<functor_type>>(std::forward<Functor>(f));
}

/**
 * Create a sink that writes one line per message to @a os.
 *
 * Messages below @a threshold are discarded.  The stream must outlive the sink, typically this is used with
 * std::cerr in the command-line tools.
 */
std::shared_ptr<log_sink> make_stream_log_sink(std::ostream& os, severity threshold);

} // namespace lh

#endif // lh_log_sink_hpp
