#ifndef lh_detail_mocked_grpc_interceptor_hpp
#define lh_detail_mocked_grpc_interceptor_hpp

#include <lh/detail/base_async_op.hpp>
#include <lh/detail/deadline_timer.hpp>

#include <gmock/gmock.h>
#include <grpc++/grpc++.h>
#include <memory>

namespace lh {
namespace detail {

/**
 * Replace the gRPC++ calls made by lh::completion_queue with mocks.
 *
 * Tests set expectations on @c shared_mock and decide when (and whether) the callbacks of each operation run.
 */
struct mocked_grpc_interceptor {
  mocked_grpc_interceptor()
      : shared_mock(new mocked) {
  }

  /// Post a timer
  template <typename op_type>
  void make_deadline_timer(std::shared_ptr<op_type> op, grpc::CompletionQueue* cq, void* tag) {
    shared_mock->make_deadline_timer(op);
  }

  /// Cancel a timer
  template <typename op_type>
  void cancel_timer(std::shared_ptr<op_type> op) {
    shared_mock->cancel_timer(op);
  }

  struct mocked {
    MOCK_CONST_METHOD1(make_deadline_timer, void(std::shared_ptr<base_async_op> op));
    MOCK_CONST_METHOD1(cancel_timer, void(std::shared_ptr<base_async_op> op));
  };

  std::shared_ptr<mocked> shared_mock;
};

} // namespace detail
} // namespace lh

#endif // lh_detail_mocked_grpc_interceptor_hpp
