#include "lh/log_sink.hpp"

#include <iostream>
#include <mutex>

namespace lh {

namespace {
class stream_log_sink : public log_sink {
public:
  stream_log_sink(std::ostream& os, severity threshold)
      : mu_()
      , os_(os)
      , threshold_(threshold) {
  }

  void log(severity sev, std::string&& message) override {
    if (sev < threshold_) {
      return;
    }
    std::lock_guard<std::mutex> lock(mu_);
    os_ << message << std::endl;
  }

private:
  std::mutex mu_;
  std::ostream& os_;
  severity threshold_;
};
} // anonymous namespace

std::shared_ptr<log_sink> make_stream_log_sink(std::ostream& os, severity threshold) {
  return std::make_shared<stream_log_sink>(os, threshold);
}

} // namespace lh
