#include "lh/engine_config.hpp"
#include <lh/log.hpp>

#include <sstream>
#include <stdexcept>

namespace lh {

namespace {
void check_positive(char const* name, std::chrono::milliseconds value) {
  if (value.count() <= 0) {
    std::ostringstream os;
    os << "engine_config::validate() - " << name << " (" << value.count() << "ms) should be > 0";
    throw std::invalid_argument(os.str());
  }
}
} // anonymous namespace

void engine_config::validate() const {
  if (node_count == 0) {
    throw std::invalid_argument("engine_config::validate() - node_count should be > 0");
  }
  check_positive("lease_duration", lease_duration);
  check_positive("heartbeat_interval", heartbeat_interval);
  check_positive("follower_backoff", follower_backoff);
  if (competition_jitter.count() < 0) {
    std::ostringstream os;
    os << "engine_config::validate() - competition_jitter (" << competition_jitter.count() << "ms) should be >= 0";
    throw std::invalid_argument(os.str());
  }
  if (lease_duration <= heartbeat_interval) {
    std::ostringstream os;
    os << "engine_config::validate() - lease_duration (" << lease_duration.count()
       << "ms) should be > heartbeat_interval (" << heartbeat_interval.count() << "ms)";
    throw std::invalid_argument(os.str());
  }
  if (not clock) {
    throw std::invalid_argument("engine_config::validate() - clock is not set");
  }
  if (lease_duration < 2 * heartbeat_interval) {
    LH_LOG(warning) << "lease_duration (" << lease_duration.count()
                    << "ms) tolerates fewer than two missed heartbeats, heartbeat_interval="
                    << heartbeat_interval.count() << "ms";
  }
}

} // namespace lh
