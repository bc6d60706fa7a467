#include "lh/event_sink.hpp"

#include <iostream>
#include <mutex>

namespace lh {

namespace {
class stream_event_sink : public event_sink {
public:
  explicit stream_event_sink(std::ostream& os)
      : mu_()
      , os_(os) {
  }

  void emit(election_event const& event) override {
    std::lock_guard<std::mutex> lock(mu_);
    os_ << event << std::endl;
  }

private:
  std::mutex mu_;
  std::ostream& os_;
};
} // anonymous namespace

std::shared_ptr<event_sink> make_stream_event_sink(std::ostream& os) {
  return std::make_shared<stream_event_sink>(os);
}

std::shared_ptr<event_sink> make_null_event_sink() {
  return make_event_sink([](election_event const&) {});
}

} // namespace lh
