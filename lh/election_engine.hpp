#ifndef lh_election_engine_hpp
#define lh_election_engine_hpp

#include <lh/active_completion_queue.hpp>
#include <lh/backend_factory.hpp>
#include <lh/election_controller.hpp>
#include <lh/engine_config.hpp>
#include <lh/event_sink.hpp>

#include <memory>

namespace lh {

/**
 * Run a leader election simulation.
 *
 * The engine drives a fixed set of nodes through the election, all the timers run in the thread of an
 * lh::active_completion_queue.  Commands can be called from any thread, events are delivered to the sink from the
 * thread calling the command or from the queue thread.
 *
 * @code
 * auto documents = std::make_shared<lh::memory_document_store>();
 * auto keys = std::make_shared<lh::memory_ttl_key_store>();
 * lh::engine_config config;
 * lh::election_engine engine(
 *     config, lh::make_backend_factory(documents, keys, config.lease_duration), lh::make_stream_event_sink(std::cout));
 * engine.start_election(lh::backend_kind::ttl_key);
 * @endcode
 */
class election_engine : public election_controller {
public:
  election_engine(
      engine_config config, backend_factory factory, std::shared_ptr<event_sink> sink,
      std::shared_ptr<active_completion_queue> queue = std::make_shared<active_completion_queue>());

  /// Stop the election and release the local resources, the backend state is left as is.
  ~election_engine();

  //@{
  /// @name implement election_controller interface using pimpl idiom.
  void start_election(backend_kind kind) override {
    impl_->start_election(kind);
  }
  void stop_election() override {
    impl_->stop_election();
  }
  void reset_election() override {
    impl_->reset_election();
  }
  void crash_node(std::string const& node_id) override {
    impl_->crash_node(node_id);
  }
  bool running() const override {
    return impl_->running();
  }
  backend_kind active_backend() const override {
    return impl_->active_backend();
  }
  std::vector<node_info> nodes() const override {
    return impl_->nodes();
  }
  std::string current_leader() const override {
    return impl_->current_leader();
  }
  //@}

private:
  std::shared_ptr<active_completion_queue> queue_;
  std::unique_ptr<election_controller> impl_;
};

} // namespace lh

#endif // lh_election_engine_hpp
