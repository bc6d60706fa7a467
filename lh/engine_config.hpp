#ifndef lh_engine_config_hpp
#define lh_engine_config_hpp

#include <lh/clock.hpp>

#include <chrono>
#include <cstdint>
#include <string>

namespace lh {

/**
 * Configure an election engine.
 *
 * The defaults reproduce the reference simulation: 5 nodes, 10 second leases renewed every 3 seconds, so a leader
 * survives two consecutive missed renewals.  Followers compete again after 5 seconds, and every acquisition attempt
 * is preceded by a random delay in [0, competition_jitter).
 */
struct engine_config {
  std::size_t node_count = 5;
  std::string node_prefix = "node-";
  std::chrono::milliseconds lease_duration = std::chrono::milliseconds(10000);
  std::chrono::milliseconds heartbeat_interval = std::chrono::milliseconds(3000);
  std::chrono::milliseconds follower_backoff = std::chrono::milliseconds(5000);
  std::chrono::milliseconds competition_jitter = std::chrono::milliseconds(2000);
  /// Seed for the jitter generator, 0 picks a non-deterministic seed.
  std::uint64_t seed = 0;
  /// The source of time for leases and timer deadlines.
  clock_function clock = system_clock_function();

  /**
   * Check the configuration.
   *
   * @throws std::invalid_argument if any value is out of range, or if the lease does not outlive a heartbeat.
   */
  void validate() const;
};

} // namespace lh

#endif // lh_engine_config_hpp
