#ifndef lh_detail_election_engine_impl_hpp
#define lh_detail_election_engine_impl_hpp

#include <lh/assert_throw.hpp>
#include <lh/backend_factory.hpp>
#include <lh/detail/async_op_counter.hpp>
#include <lh/detail/deadline_timer.hpp>
#include <lh/election_controller.hpp>
#include <lh/engine_config.hpp>
#include <lh/event_sink.hpp>
#include <lh/log.hpp>
#include <lh/node_registry.hpp>

#include <memory>
#include <mutex>
#include <random>
#include <sstream>
#include <string>

namespace lh {
namespace detail {

/**
 * Implement the election engine given the type of completion queue.
 *
 * All the timers (the jitter before each acquisition attempt, the backoff before a follower competes again, and the
 * leader heartbeats) are deadline timers in the completion queue, so every transition driven by time runs in the
 * thread running the queue.  Commands run in the caller's thread.  A single mutex serializes both, and the engine
 * emits events while holding it.
 *
 * Each node owns the handles of its pending timers.  Any transition that makes a timer irrelevant cancels it, and
 * each timer callback checks that it is still the node's current timer before doing anything, because a cancel can
 * race with a timer that already expired.
 */
template <typename completion_queue_type>
class election_engine_impl : public election_controller {
public:
  election_engine_impl(
      completion_queue_type& queue, engine_config config, backend_factory factory, std::shared_ptr<event_sink> sink)
      : mu_()
      , queue_(queue)
      , config_(std::move(config))
      , factory_(std::move(factory))
      , sink_(std::move(sink))
      , registry_(config_.node_count, config_.node_prefix)
      , backend_()
      , running_(false)
      , pristine_(false)
      , generator_()
      , ops_() {
    config_.validate();
    LH_ASSERT_THROW(static_cast<bool>(factory_));
    LH_ASSERT_THROW(static_cast<bool>(sink_));
    if (config_.seed == 0) {
      generator_.seed(std::random_device()());
    } else {
      generator_.seed(config_.seed);
    }
  }

  /**
   * Stop the election and wait for all the timers to report back.
   *
   * The thread running the completion queue must still be running, and must not be the thread calling the
   * destructor.
   */
  ~election_engine_impl() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      ops_.shutdown();
      stop_locked();
    }
    ops_.block_until_all_done();
  }

  void start_election(backend_kind kind) override {
    std::lock_guard<std::mutex> lock(mu_);
    stop_locked();
    auto backend = factory_(kind);
    LH_ASSERT_THROW(backend.get() != nullptr);
    backend->reset();
    backend_ = std::move(backend);
    running_ = true;
    pristine_ = false;
    LH_LOG(info) << "election started, backend=" << kind;

    std::ostringstream os;
    os << kind;
    emit(election_event::started(os.str()));
    for (auto& n : registry_.list()) {
      if (n.status() != node_status::crashed) {
        start_competition(n, "start_election()");
      }
    }
  }

  void stop_election() override {
    std::lock_guard<std::mutex> lock(mu_);
    stop_locked();
  }

  void reset_election() override {
    std::lock_guard<std::mutex> lock(mu_);
    stop_locked();
    if (pristine_) {
      return;
    }
    registry_.reset();
    pristine_ = true;
    LH_LOG(info) << "election reset";
    emit(election_event::reset());
  }

  void crash_node(std::string const& node_id) override {
    std::lock_guard<std::mutex> lock(mu_);
    node& n = registry_.get(node_id);
    if (n.status() == node_status::crashed) {
      return;
    }
    bool const was_leader = n.status() == node_status::leader;
    cancel_timers(n);
    n.crash("crash_node()");
    pristine_ = false;
    LH_LOG(info) << node_id << " crashed" << (was_leader ? " while holding the lease" : "");
    emit(election_event::crashed(node_id));
    if (not was_leader) {
      return;
    }
    if (backend_) {
      backend_->release();
    }
    emit(election_event::lost(node_id));
  }

  bool running() const override {
    std::lock_guard<std::mutex> lock(mu_);
    return running_;
  }

  backend_kind active_backend() const override {
    std::lock_guard<std::mutex> lock(mu_);
    LH_ASSERT_THROW(backend_.get() != nullptr);
    return backend_->kind();
  }

  std::vector<node_info> nodes() const override {
    std::lock_guard<std::mutex> lock(mu_);
    return registry_.snapshot();
  }

  std::string current_leader() const override {
    std::lock_guard<std::mutex> lock(mu_);
    auto const now = config_.clock();
    for (auto const& n : registry_.list()) {
      if (n.status() == node_status::leader and n.lease_expiry() > now) {
        return n.id();
      }
    }
    return std::string();
  }

  /// The number of timers created and not yet reported back, mostly for tests.
  int pending_timers() const {
    return ops_.pending();
  }

private:
  /// Stop the election, must be called with the lock held.
  void stop_locked() {
    if (running_) {
      LH_LOG(info) << "election stopped";
    }
    running_ = false;
    for (auto& n : registry_.list()) {
      cancel_timers(n);
    }
    if (backend_) {
      backend_->close();
    }
  }

  void cancel_timers(node& n) {
    for (auto& t : n.release_timers()) {
      queue_.cancel_timer(t);
    }
  }

  /// Move @a n to competing and schedule an acquisition attempt after a random delay.
  void start_competition(node& n, char const* where) {
    if (not n.start_competing(where)) {
      return;
    }
    emit_update(n);
    auto deadline = config_.clock() + jitter();
    n.competition_timer(make_timer(deadline, "competition/", n.id(), &election_engine_impl::on_competition_timer));
  }

  /// Called when a competition timer (jitter or backoff) expires.
  void on_competition_timer(detail::deadline_timer const& op, std::string const& node_id) {
    node* n = registry_.find(node_id);
    if (n == nullptr or n->competition_timer().get() != &op or not running_) {
      return;
    }
    n->competition_timer(std::shared_ptr<detail::deadline_timer>());
    switch (n->status()) {
    case node_status::follower:
      start_competition(*n, "retry after backoff");
      break;
    case node_status::competing:
      attempt_acquire(*n);
      break;
    default:
      LH_LOG(warning) << node_id << " competition timer expired in unexpected state " << n->status();
      break;
    }
  }

  void attempt_acquire(node& n) {
    auto const now = config_.clock();
    if (backend_->try_acquire(n.id(), now)) {
      n.promote("attempt_acquire()", now + config_.lease_duration);
      LH_LOG(info) << n.id() << " elected leader, lease expires at " << to_epoch_ms(n.lease_expiry());
      emit_update(n);
      emit(election_event::elected(n.id()));
      n.heartbeat_timer(make_timer(
          now + config_.heartbeat_interval, "heartbeat/", n.id(), &election_engine_impl::on_heartbeat_timer));
      return;
    }
    n.demote("attempt_acquire()");
    emit_update(n);
    n.competition_timer(make_timer(
        now + config_.follower_backoff, "backoff/", n.id(), &election_engine_impl::on_competition_timer));
  }

  /// Called when the heartbeat timer of a leader expires.
  void on_heartbeat_timer(detail::deadline_timer const& op, std::string const& node_id) {
    node* n = registry_.find(node_id);
    if (n == nullptr or n->heartbeat_timer().get() != &op or not running_) {
      return;
    }
    n->heartbeat_timer(std::shared_ptr<detail::deadline_timer>());
    if (n->status() != node_status::leader) {
      return;
    }
    auto const now = config_.clock();
    if (backend_->renew(node_id, now)) {
      n->extend_lease(now + config_.lease_duration);
      emit_update(*n);
      n->heartbeat_timer(make_timer(
          op.deadline + config_.heartbeat_interval, "heartbeat/", node_id, &election_engine_impl::on_heartbeat_timer));
      return;
    }
    LH_LOG(info) << node_id << " could not renew its lease";
    n->demote("on_heartbeat_timer()");
    emit(election_event::lost(node_id));
    emit_update(*n);
    // ... losing the lease competes again right away, there is no backoff ...
    start_competition(*n, "renewal failure");
  }

  using timer_member = void (election_engine_impl::*)(detail::deadline_timer const&, std::string const&);

  /**
   * Create a timer that calls @a member with the lock held.
   *
   * Returns a null pointer if the engine is shutting down.  Canceled timers only report back to the counter, without
   * touching the lock, because the cancel may be delivered synchronously while the lock is held.
   */
  std::shared_ptr<detail::deadline_timer> make_timer(
      clock_type::time_point deadline, char const* prefix, std::string const& node_id, timer_member member) {
    std::string name = prefix + node_id;
    if (not ops_.async_op_start(name)) {
      return std::shared_ptr<detail::deadline_timer>();
    }
    return queue_.make_deadline_timer(
        deadline, name, [this, node_id, member](detail::deadline_timer const& op, bool ok) {
          if (ok) {
            std::lock_guard<std::mutex> lock(mu_);
            try {
              (this->*member)(op, node_id);
            } catch (std::exception const& ex) {
              LH_LOG(error) << "unexpected exception in timer " << op.name << ": " << ex.what();
            }
          }
          ops_.async_op_done(op.name, ok ? "" : " canceled");
        });
  }

  void emit_update(node const& n) {
    LH_LOG(debug) << n.id() << " is now " << n.status();
    emit(election_event::update(n.info()));
  }

  void emit(election_event const& event) {
    try {
      sink_->emit(event);
    } catch (std::exception const& ex) {
      LH_LOG(error) << "event sink raised while reporting " << event << ": " << ex.what();
    }
  }

  clock_type::duration jitter() {
    if (config_.competition_jitter.count() <= 0) {
      return clock_type::duration(0);
    }
    std::uniform_int_distribution<std::int64_t> d(0, config_.competition_jitter.count() - 1);
    return std::chrono::milliseconds(d(generator_));
  }

private:
  mutable std::mutex mu_;
  completion_queue_type& queue_;
  engine_config config_;
  backend_factory factory_;
  std::shared_ptr<event_sink> sink_;
  node_registry registry_;
  std::unique_ptr<storage_backend> backend_;
  bool running_;
  /// True after a reset, until the next command changes the nodes.
  bool pristine_;
  std::mt19937_64 generator_;
  async_op_counter ops_;
};

} // namespace detail
} // namespace lh

#endif // lh_detail_election_engine_impl_hpp
