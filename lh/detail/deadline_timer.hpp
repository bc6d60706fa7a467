#ifndef lh_detail_deadline_timer_hpp
#define lh_detail_deadline_timer_hpp

#include <lh/detail/base_async_op.hpp>

#include <grpc++/alarm.h>

#include <chrono>
#include <memory>

namespace lh {
namespace detail {
/**
 * A wrapper for deadline timers.
 *
 * Timers are canceled through the completion queue that created them (see lh::completion_queue::cancel_timer()), so
 * the cancellation goes through the same interceptor as the creation.
 */
struct deadline_timer : public base_async_op {
  /// When the timer is scheduled to fire.
  std::chrono::system_clock::time_point deadline;

private:
  friend struct default_grpc_interceptor;
  std::unique_ptr<grpc::Alarm> alarm_;
};
} // namespace detail
} // namespace lh

#endif // lh_detail_deadline_timer_hpp
