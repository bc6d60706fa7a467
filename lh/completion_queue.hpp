#ifndef lh_completion_queue_hpp
#define lh_completion_queue_hpp

#include <lh/detail/base_async_op.hpp>
#include <lh/detail/base_completion_queue.hpp>
#include <lh/detail/deadline_timer.hpp>
#include <lh/detail/default_grpc_interceptor.hpp>

#include <functional>
#include <memory>
#include <string>

namespace lh {

/**
 * Wrap a gRPC completion queue.
 *
 * The grpc::CompletionQueue is not much of an abstraction, nor is it idiomatic C++.  This wrapper makes it easier to
 * schedule asynchronous operations that call functors (lambdas, std::function<>, etc) when the operation completes.
 * The election engine uses the deadline timers as its only scheduler: all callbacks run in the thread that calls
 * run().
 *
 * @tparam grpc_interceptor_t mediate all calls to the gRPC library.  The default inlines all the calls, so it is
 * basically zero overhead.  The main reason to change it is to mock the gRPC++ APIs in tests.
 */
template <typename grpc_interceptor_t = detail::default_grpc_interceptor>
class completion_queue : public detail::base_completion_queue {
public:
  //@{
  /**
   * @name type traits
   */
  using grpc_interceptor_type = grpc_interceptor_t;
  //@}

  explicit completion_queue(grpc_interceptor_type interceptor = grpc_interceptor_type())
      : detail::base_completion_queue()
      , interceptor_(std::move(interceptor)) {
  }

  /**
   * Call the functor when the deadline timer expires.
   *
   * Notice that system_clock is not guaranteed to be monotonic.  The leases stored in the backends are expressed in
   * wall-clock time, so the timers use the same clock.
   */
  template <typename Functor>
  std::shared_ptr<detail::deadline_timer> make_deadline_timer(
      std::chrono::system_clock::time_point deadline, std::string name, Functor&& f) {
    auto op = create_op<detail::deadline_timer>(std::move(name), std::forward<Functor>(f));
    op->deadline = deadline;
    void* tag = register_op("deadline_timer()", op);
    interceptor_.make_deadline_timer(op, cq(), tag);
    return op;
  }

  /**
   * Cancel a timer created by this queue.
   *
   * The functor for the timer is still called, with ok == false, unless it already ran.
   */
  void cancel_timer(std::shared_ptr<detail::deadline_timer> const& op) {
    if (op) {
      interceptor_.cancel_timer(op);
    }
  }

  /// Access the interceptor, mostly used to set expectations in tests.
  grpc_interceptor_type& interceptor() {
    return interceptor_;
  }

private:
  /**
   * Create an operation and perform the common initialization
   *
   * Move the name and functor into a new operation object, and create the callback that (a) downcasts the
   * asynchronous operation object, and (b) calls the user-provided functor.
   *
   * @tparam op_type the type derived from lh::detail::base_async_op to create.
   * @tparam Functor the type of the user-provided functor to call when the operation completes.
   * @param name the name (for debugging purposes) of the operation.
   * @param f the user-provided functor to call when the operation completes.
   * @return a new instance of @c op_type with the name and callback fields filled in.
   */
  template <typename op_type, typename Functor>
  std::shared_ptr<op_type> create_op(std::string name, Functor&& f) const {
    auto op = std::make_shared<op_type>();
    op->callback = [functor = std::forward<Functor>(f)](detail::base_async_op & bop, bool ok) mutable {
      auto const& op = dynamic_cast<op_type const&>(bop);
      functor(op, ok);
    };
    op->name = std::move(name);
    return op;
  }

private:
  /// The interceptor to catch all interactions with the underlying grpc::CompletionQueue.
  grpc_interceptor_type interceptor_;
};

} // namespace lh

#endif // lh_completion_queue_hpp
