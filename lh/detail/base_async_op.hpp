#ifndef lh_detail_base_async_op_hpp
#define lh_detail_base_async_op_hpp

#include <functional>
#include <memory>
#include <string>

namespace lh {
namespace detail {

/**
 * Base class for the operations tracked by lh::completion_queue.
 *
 * The queue stores the operation in its pending table, hands its address to gRPC as the tag, and calls @c callback
 * exactly once when gRPC reports the tag back: with ok == true when the operation completed, false when it was
 * canceled or the queue shut down.
 */
struct base_async_op {
  base_async_op() {
  }

  /// Make sure full destructor of derived class is called.
  virtual ~base_async_op() {
  }

  /// Called from the queue thread, or from cancel_timer() in the mocked interceptor.
  std::function<void(base_async_op&, bool)> callback;

  /// Used in log messages, the engine names its timers after the node, e.g. heartbeat/node-1
  std::string name;
};

} // namespace detail
} // namespace lh

#endif // lh_detail_base_async_op_hpp
