#include "lh/election_event.hpp"

#include <sstream>

namespace lh {

std::ostream& operator<<(std::ostream& os, event_type x) {
  char const* values[] = {
      "election-started", "election-reset", "node-crashed", "node-update", "leader-elected", "leader-lost",
  };
  return os << values[int(x)];
}

namespace {
election_event make_event(event_type type, std::string node_id) {
  return election_event{type, std::move(node_id), node_status::idle, false, clock_type::time_point(), std::string()};
}

template <typename T>
std::string to_string(T const& x) {
  std::ostringstream os;
  os << x;
  return os.str();
}
} // anonymous namespace

election_event election_event::started(std::string backend) {
  auto e = make_event(event_type::election_started, std::string());
  e.backend = std::move(backend);
  return e;
}

election_event election_event::reset() {
  return make_event(event_type::election_reset, std::string());
}

election_event election_event::crashed(std::string node_id) {
  return make_event(event_type::node_crashed, std::move(node_id));
}

election_event election_event::update(node_info const& info) {
  auto e = make_event(event_type::node_update, info.id);
  e.status = info.status;
  e.has_lease = info.has_lease;
  e.lease = info.lease_expiry;
  return e;
}

election_event election_event::elected(std::string node_id) {
  return make_event(event_type::leader_elected, std::move(node_id));
}

election_event election_event::lost(std::string node_id) {
  return make_event(event_type::leader_lost, std::move(node_id));
}

Json::Value election_event::to_json() const {
  Json::Value v(Json::objectValue);
  v["type"] = to_string(type);
  switch (type) {
  case event_type::election_started:
    v["backend"] = backend;
    break;
  case event_type::election_reset:
    break;
  case event_type::node_update:
    v["nodeId"] = node_id;
    v["status"] = to_string(status);
    if (has_lease) {
      v["lease"] = Json::Int64(to_epoch_ms(lease));
    } else {
      v["lease"] = Json::Value(Json::nullValue);
    }
    break;
  case event_type::node_crashed:
  case event_type::leader_elected:
  case event_type::leader_lost:
    v["nodeId"] = node_id;
    break;
  }
  return v;
}

bool operator==(election_event const& lhs, election_event const& rhs) {
  return lhs.to_json() == rhs.to_json();
}

std::ostream& operator<<(std::ostream& os, election_event const& x) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  return os << Json::writeString(builder, x.to_json());
}

} // namespace lh
