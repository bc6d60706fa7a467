#ifndef lh_detail_simulated_scheduler_hpp
#define lh_detail_simulated_scheduler_hpp

#include <lh/clock.hpp>
#include <lh/completion_queue.hpp>
#include <lh/detail/mocked_grpc_interceptor.hpp>

#include <gmock/gmock.h>

#include <algorithm>
#include <memory>
#include <vector>

namespace lh {
namespace detail {

/**
 * Run deadline timers against a simulated clock.
 *
 * Wraps a completion queue with the mocked gRPC interceptor: creating a timer only records it, canceling a timer
 * invokes its callback with ok == false right away, and advance() fires the recorded timers in deadline order,
 * moving the simulated clock to each deadline before firing.  Tests use it to drive the election engine without
 * threads or real time.
 */
class simulated_scheduler {
public:
  using completion_queue_type = completion_queue<mocked_grpc_interceptor>;

  explicit simulated_scheduler(clock_type::time_point start)
      : queue_()
      , state_(std::make_shared<state>()) {
    state_->now = start;
    using namespace ::testing;
    auto s = state_;
    EXPECT_CALL(*queue_.interceptor().shared_mock, make_deadline_timer(_))
        .WillRepeatedly(Invoke([s](std::shared_ptr<base_async_op> op) {
          auto timer = std::dynamic_pointer_cast<deadline_timer>(op);
          ASSERT_TRUE(timer.get() != nullptr);
          s->timers.push_back(std::move(timer));
        }));
    EXPECT_CALL(*queue_.interceptor().shared_mock, cancel_timer(_))
        .WillRepeatedly(Invoke([s](std::shared_ptr<base_async_op> op) {
          auto i = std::find_if(s->timers.begin(), s->timers.end(), [&op](auto const& t) { return t == op; });
          if (i == s->timers.end()) {
            return;
          }
          s->timers.erase(i);
          op->callback(*op, false);
        }));
  }

  completion_queue_type& queue() {
    return queue_;
  }

  /// A clock_function returning the simulated time.
  clock_function clock() const {
    auto s = state_;
    return [s]() { return s->now; };
  }

  clock_type::time_point now() const {
    return state_->now;
  }

  /// The number of timers waiting to fire.
  std::size_t pending() const {
    return state_->timers.size();
  }

  /**
   * Fire all the timers that expire in the next @a d, including the timers created while firing.
   *
   * Timers with the same deadline fire in creation order.  @a on_fire is called after each timer fires.
   */
  template <typename duration_type, typename Functor>
  void advance(duration_type d, Functor&& on_fire) {
    auto target = state_->now + d;
    for (;;) {
      auto& timers = state_->timers;
      auto i = std::min_element(
          timers.begin(), timers.end(), [](auto const& a, auto const& b) { return a->deadline < b->deadline; });
      if (i == timers.end() or (*i)->deadline > target) {
        break;
      }
      std::shared_ptr<deadline_timer> timer = *i;
      timers.erase(i);
      state_->now = std::max(state_->now, timer->deadline);
      timer->callback(*timer, true);
      on_fire();
    }
    state_->now = target;
  }

  template <typename duration_type>
  void advance(duration_type d) {
    advance(d, []() {});
  }

private:
  struct state {
    clock_type::time_point now;
    std::vector<std::shared_ptr<deadline_timer>> timers;
  };

  completion_queue_type queue_;
  std::shared_ptr<state> state_;
};

} // namespace detail
} // namespace lh

#endif // lh_detail_simulated_scheduler_hpp
