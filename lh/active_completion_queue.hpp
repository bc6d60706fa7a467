#ifndef lh_active_completion_queue_hpp
#define lh_active_completion_queue_hpp

#include <lh/completion_queue.hpp>

#include <memory>
#include <thread>

namespace lh {

/**
 * The scheduler of an election: a completion queue and the thread running its loop.
 *
 * All the deadline timers of an lh::election_engine fire in this thread, one at a time.  The destructor shuts down
 * the queue and then joins the thread, so every object that owns timers in the queue must be destroyed first.
 */
class active_completion_queue {
public:
  active_completion_queue();
  ~active_completion_queue();

  active_completion_queue(active_completion_queue const&) = delete;
  active_completion_queue& operator=(active_completion_queue const&) = delete;

  completion_queue<>& cq() {
    return *queue_;
  }

  /// True if called from the thread running the queue, for example inside a timer callback.
  bool in_scheduler_thread() const {
    return std::this_thread::get_id() == thread_.get_id();
  }

private:
  std::shared_ptr<completion_queue<>> queue_;
  std::thread thread_;
};

} // namespace lh

#endif // lh_active_completion_queue_hpp
