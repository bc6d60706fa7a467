#include "lh/election_event.hpp"

#include <gtest/gtest.h>
#include <sstream>

namespace {
Json::Value parse(std::string const& text) {
  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  Json::Value v;
  std::string errors;
  EXPECT_TRUE(reader->parse(text.data(), text.data() + text.size(), &v, &errors)) << errors;
  return v;
}
} // anonymous namespace

/**
 * @test Verify that the iostream operator for lh::event_type produces the wire names.
 */
TEST(election_event, type_streaming) {
  using t = lh::event_type;
  std::ostringstream os;
  os << t::election_started << " " << t::election_reset << " " << t::node_crashed << " " << t::node_update << " "
     << t::leader_elected << " " << t::leader_lost;
  ASSERT_EQ(os.str(), "election-started election-reset node-crashed node-update leader-elected leader-lost");
}

/**
 * @test Verify the wire format of node-update events.
 */
TEST(election_event, node_update_json) {
  using namespace std::chrono_literals;
  lh::node_info info{"node-3", lh::node_status::leader, true, lh::clock_type::time_point(1500000010000ms)};

  std::ostringstream os;
  os << lh::election_event::update(info);
  EXPECT_EQ(os.str().find('\n'), std::string::npos);

  auto v = parse(os.str());
  EXPECT_EQ(v["type"].asString(), "node-update");
  EXPECT_EQ(v["nodeId"].asString(), "node-3");
  EXPECT_EQ(v["status"].asString(), "leader");
  EXPECT_EQ(v["lease"].asInt64(), 1500000010000LL);

  info.status = lh::node_status::follower;
  info.has_lease = false;
  v = parse(lh::election_event::update(info).to_json().toStyledString());
  EXPECT_EQ(v["status"].asString(), "follower");
  EXPECT_TRUE(v.isMember("lease"));
  EXPECT_TRUE(v["lease"].isNull());
}

/**
 * @test Verify the wire format of the other events.
 */
TEST(election_event, other_json) {
  auto v = lh::election_event::started("ttl-key").to_json();
  EXPECT_EQ(v["type"].asString(), "election-started");
  EXPECT_EQ(v["backend"].asString(), "ttl-key");
  EXPECT_FALSE(v.isMember("nodeId"));

  v = lh::election_event::reset().to_json();
  EXPECT_EQ(v["type"].asString(), "election-reset");
  EXPECT_EQ(v.size(), 1U);

  v = lh::election_event::crashed("node-1").to_json();
  EXPECT_EQ(v["type"].asString(), "node-crashed");
  EXPECT_EQ(v["nodeId"].asString(), "node-1");
  EXPECT_FALSE(v.isMember("status"));

  EXPECT_EQ(lh::election_event::elected("node-2").to_json()["type"].asString(), "leader-elected");
  EXPECT_EQ(lh::election_event::lost("node-2").to_json()["type"].asString(), "leader-lost");
}

/**
 * @test Verify that events compare by their wire representation.
 */
TEST(election_event, equality) {
  EXPECT_EQ(lh::election_event::elected("node-1"), lh::election_event::elected("node-1"));
  EXPECT_NE(lh::election_event::elected("node-1"), lh::election_event::lost("node-1"));
  EXPECT_NE(lh::election_event::elected("node-1"), lh::election_event::elected("node-2"));
  // ... fields that are not part of the wire format are ignored ...
  auto a = lh::election_event::reset();
  auto b = lh::election_event::reset();
  b.node_id = "ignored";
  EXPECT_EQ(a, b);
}
