#include "lh/active_completion_queue.hpp"
#include <lh/log.hpp>

namespace lh {

active_completion_queue::active_completion_queue()
    : queue_(std::make_shared<completion_queue<>>())
    , thread_([q = queue_]() { q->run(); }) {
}

active_completion_queue::~active_completion_queue() {
  LH_LOG(trace) << "shutdown scheduler, pending timers=" << queue_->pending_operations();
  queue_->shutdown();
  if (in_scheduler_thread()) {
    // ... destroyed from one of its own timers, the loop exits once the callback returns ...
    LH_LOG(warning) << "scheduler destroyed from its own thread, detaching";
    thread_.detach();
    return;
  }
  thread_.join();
}

} // namespace lh
