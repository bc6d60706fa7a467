#ifndef lh_event_sink_hpp
#define lh_event_sink_hpp

#include <lh/election_event.hpp>

#include <iosfwd>
#include <memory>
#include <utility>

namespace lh {

/**
 * A destination for election events.
 *
 * The election engine calls emit() for every state transition, in the order the transitions happened for each node.
 * Delivery is fire-and-forget: the engine ignores (but logs) any exception raised by the sink.
 *
 * The engine calls emit() while holding its internal lock, implementations must not call back into the engine.
 */
class event_sink {
public:
  virtual ~event_sink() {}

  /// Report an event.
  virtual void emit(election_event const& event) = 0;
};

/**
 * An adaptor that converts any Functor into a @c lh::event_sink.
 *
 * @tparam Functor the type of the functor to adapt.
 */
template <typename Functor>
class event_sink_functor : public event_sink {
public:
  explicit event_sink_functor(Functor&& f)
      : functor(std::move(f)) {
  }
  explicit event_sink_functor(Functor const& f)
      : functor(f) {
  }

  void emit(election_event const& event) override {
    functor(event);
  }

private:
  Functor functor;
};

/// Create a @c lh::event_sink shared pointer from a functor.
template <typename Functor>
std::shared_ptr<event_sink> make_event_sink(Functor&& f) {
  using functor_type = typename std::decay<Functor>::type;
  return std::make_shared<event_sink_functor<functor_type>>(std::forward<Functor>(f));
}

/**
 * Create a sink that writes each event as a line of JSON to @a os.
 *
 * The stream must outlive the sink.
 */
std::shared_ptr<event_sink> make_stream_event_sink(std::ostream& os);

/// Create a sink that discards all the events.
std::shared_ptr<event_sink> make_null_event_sink();

} // namespace lh

#endif // lh_event_sink_hpp
