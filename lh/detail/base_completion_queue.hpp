#ifndef lh_detail_base_completion_queue_hpp
#define lh_detail_base_completion_queue_hpp

#include <lh/detail/base_async_op.hpp>

#include <grpc++/grpc++.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace lh {
namespace detail {
/// A helper class for testing.
struct base_completion_queue_test_only;

/**
 * The non-template part of lh::completion_queue<>.
 *
 * Keeps the table of pending operations, indexed by the tag given to gRPC, and runs the loop that dispatches their
 * completions.  In leasehold the only operations are deadline timers, a canceled timer completes with ok == false.
 */
class base_completion_queue {
public:
  /// Stop the loop periodically to check if we should shutdown.
  static std::chrono::milliseconds constexpr loop_timeout{50};

  base_completion_queue();
  virtual ~base_completion_queue();

  /// Run the loop until shutdown() is called, exceptions raised by callbacks are logged and discarded.
  void run();

  /// Shutdown the completion queue loop.
  void shutdown();

  /// The number of operations posted but not yet completed.
  std::size_t pending_operations() const;

protected:
  /// The underlying completion queue for the gRPC APIs.
  friend struct ::lh::detail::base_completion_queue_test_only;
  grpc::CompletionQueue* cq() {
    return &queue_;
  }

  /// Save a newly created operation and return its gRPC tag.
  void* register_op(char const* where, std::shared_ptr<base_async_op> op);

  /// Get an operation given its gRPC tag.
  std::shared_ptr<base_async_op> unregister_op(void* tag);

private:
  mutable std::mutex mu_;
  using pending_ops_type = std::unordered_map<std::intptr_t, std::shared_ptr<base_async_op>>;
  pending_ops_type pending_ops_;

  grpc::CompletionQueue queue_;
  std::atomic<bool> shutdown_;
};
} // namespace detail
} // namespace lh

#endif // lh_detail_base_completion_queue_hpp
