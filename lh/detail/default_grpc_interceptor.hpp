#ifndef lh_detail_default_grpc_interceptor_hpp
#define lh_detail_default_grpc_interceptor_hpp

#include <lh/detail/deadline_timer.hpp>

#include <grpc++/grpc++.h>

#include <memory>

namespace lh {
namespace detail {

/**
 * Provides a dependency injection point to mock the gRPC++ library.
 *
 * The election engine schedules all its work (jitter delays, backoff retries, heartbeats) as gRPC alarms.  In the
 * tests we need to control when those alarms fire.  This class defines a narrow interface where leasehold intercepts
 * all gRPC++ calls.  Please see lh::detail::mocked_grpc_interceptor for a mocked version.
 */
struct default_grpc_interceptor {
  /// Post a timer to the completion queue.
  template <typename op_type>
  void make_deadline_timer(std::shared_ptr<op_type> op, grpc::CompletionQueue* cq, void* tag) {
    op->alarm_.reset(new grpc::Alarm);
    op->alarm_->Set(cq, op->deadline, tag);
  }

  /// Cancel a pending timer, the completion queue calls its functor with ok == false.
  template <typename op_type>
  void cancel_timer(std::shared_ptr<op_type> op) {
    if (op->alarm_) {
      op->alarm_->Cancel();
    }
  }
};

} // namespace detail
} // namespace lh

#endif // lh_detail_default_grpc_interceptor_hpp
