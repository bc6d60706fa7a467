#ifndef lh_detail_async_op_counter_hpp
#define lh_detail_async_op_counter_hpp

#include <lh/detail/append_annotations.hpp>
#include <lh/log.hpp>

#include <condition_variable>
#include <mutex>
#include <utility>

namespace lh {
namespace detail {

/**
 * Helper class to track pending asynchronous operations.
 *
 * Objects that create multiple asynchronous operations sometimes need to block until all of them are finished,
 * otherwise when the operations complete they can crash the application.  The election engine counts its timers
 * with one of these, and blocks in its destructor until every canceled timer has reported back.
 */
class async_op_counter {
public:
  async_op_counter()
      : mu_()
      , cv_()
      , pending_(0)
      , shutdown_(false) {
  }

  /**
   * Block until all pending asynchronous operations complete.
   *
   * Do not call this operation from the thread running the completion queue event loop.
   */
  void block_until_all_done();

  /// Shutdown all future asynchronous operations, return false in async_op_start()
  void shutdown() {
    std::lock_guard<std::mutex> lock(mu_);
    shutdown_ = true;
  }

  /// The number of operations started but not done.
  int pending() const {
    std::lock_guard<std::mutex> lock(mu_);
    return pending_;
  }

  /**
   * Increment the count of pending asynchronous operations.
   *
   * This should be called just before the asynchronous operation starts.  If called afterwards the asynchronous
   * operation may complete before this function is called.  The annotations can be helpful in debugging.
   *
   * @tparam Annotations a variable list of annotations to help in debugging.
   * @param a the value of the annotations.
   * @return true if the operation should be started, false if the system is shutting down
   */
  template <typename... Annotations>
  bool async_op_start(Annotations&&... a) {
    LH_LOGGER_DECL(trace, lh::log::instance(), logger);
    if (logger) {
      append_annotations(logger.get(), "async_op_start(): ", std::forward<Annotations>(a)...);
      logger.write_to(lh::log::instance());
    }
    return add_op();
  }

  /**
   * Decrement the count of pending asynchronous operations.
   *
   * This should be called just after an asynchronous operation completes, either successfully or because it is
   * cancelled.  The annotations can be helpful in debugging.
   *
   * @tparam Annotations a variable list of annotations to help in debugging.
   * @param a the value of the annotations.
   */
  template <typename... Annotations>
  void async_op_done(Annotations&&... a) {
    LH_LOGGER_DECL(trace, lh::log::instance(), logger);
    if (logger) {
      append_annotations(logger.get(), "async_op_done(): ", std::forward<Annotations>(a)...);
      logger.write_to(lh::log::instance());
    }
    del_op();
  }

private:
  /// The non-template part of async_op_start()
  bool add_op();

  /// The non-template part of async_op_done()
  void del_op();

private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  int pending_;
  bool shutdown_;
};

} // namespace detail
} // namespace lh

#endif // lh_detail_async_op_counter_hpp
