#include "lh/election_engine.hpp"
#include <lh/detail/election_engine_impl.hpp>

namespace lh {

election_engine::election_engine(
    engine_config config, backend_factory factory, std::shared_ptr<event_sink> sink,
    std::shared_ptr<active_completion_queue> queue)
    : queue_(std::move(queue))
    , impl_(new detail::election_engine_impl<completion_queue<>>(
          queue_->cq(), std::move(config), std::move(factory), std::move(sink))) {
}

election_engine::~election_engine() {
  // ... the implementation waits for its timers, the queue must still be running ...
  impl_.reset();
}

} // namespace lh
