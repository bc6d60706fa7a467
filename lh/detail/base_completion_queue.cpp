#include "lh/detail/base_completion_queue.hpp"
#include <lh/assert_throw.hpp>
#include <lh/log.hpp>

#include <sstream>

namespace lh {
namespace detail {

std::chrono::milliseconds constexpr base_completion_queue::loop_timeout;

base_completion_queue::base_completion_queue()
    : mu_()
    , pending_ops_()
    , queue_()
    , shutdown_(false) {
}

base_completion_queue::~base_completion_queue() {
  // ... drain the queue, gRPC requires it before the grpc::CompletionQueue destructor runs ...
  if (not shutdown_.exchange(true)) {
    queue_.Shutdown();
  }
  void* tag = nullptr;
  bool ok = false;
  while (queue_.Next(&tag, &ok)) {
  }
  if (not pending_ops_.empty()) {
    // ... the callbacks may point to deleted objects, just report the names ...
    std::ostringstream os;
    char const* sep = "";
    for (auto const& op : pending_ops_) {
      os << sep << op.second->name;
      sep = ", ";
    }
    LH_LOG(warning) << "scheduler deleted with " << pending_ops_.size() << " pending timers: " << os.str();
  }
}

void base_completion_queue::run() {
  void* tag = nullptr;
  bool ok = false;
  while (not shutdown_.load()) {
    auto deadline = std::chrono::system_clock::now() + loop_timeout;

    auto status = queue_.AsyncNext(&tag, &ok, deadline);
    if (status == grpc::CompletionQueue::SHUTDOWN) {
      LH_LOG(trace) << "scheduler loop done";
      break;
    }
    if (status == grpc::CompletionQueue::TIMEOUT) {
      continue;
    }
    if (tag == nullptr) {
      LH_LOG(warning) << "null tag in completion queue, ignored";
      continue;
    }

    // ... try to find the operation in our list of known operations ...
    std::shared_ptr<base_async_op> op = unregister_op(tag);
    if (not op) {
      LH_LOG(error) << "unknown tag in completion queue: " << std::hex << std::intptr_t(tag);
      continue;
    }
    // ... it was there, now it is removed, and the lock is released, call it.  An exception must not stop the
    // scheduler, every other node depends on it ...
    try {
      op->callback(*op, ok);
    } catch (std::exception const& ex) {
      LH_LOG(error) << "exception raised by " << op->name << ": " << ex.what();
    }
  }
}

void base_completion_queue::shutdown() {
  LH_LOG(trace) << "shutting down scheduler, pending timers=" << pending_operations();
  if (not shutdown_.exchange(true)) {
    queue_.Shutdown();
  }
}

std::size_t base_completion_queue::pending_operations() const {
  std::lock_guard<std::mutex> lock(mu_);
  return pending_ops_.size();
}

void* base_completion_queue::register_op(char const* where, std::shared_ptr<base_async_op> op) {
  void* tag = static_cast<void*>(op.get());
  auto key = reinterpret_cast<std::intptr_t>(tag);
  std::lock_guard<std::mutex> lock(mu_);
  auto r = pending_ops_.emplace(key, op);
  LH_ASSERT_THROW(r.second != false);
  return tag;
}

std::shared_ptr<base_async_op> base_completion_queue::unregister_op(void* tag) {
  std::lock_guard<std::mutex> lock(mu_);
  pending_ops_type::iterator i = pending_ops_.find(reinterpret_cast<std::intptr_t>(tag));
  if (i != pending_ops_.end()) {
    auto op = i->second;
    pending_ops_.erase(i);
    return op;
  }
  return std::shared_ptr<base_async_op>();
}

} // namespace detail
} // namespace lh
