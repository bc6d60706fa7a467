#include "lh/event_sink.hpp"

#include <gtest/gtest.h>
#include <sstream>
#include <vector>

/**
 * @test Verify that functors can be adapted into event sinks.
 */
TEST(event_sink, functor) {
  std::vector<lh::election_event> received;
  auto sink = lh::make_event_sink([&received](lh::election_event const& e) { received.push_back(e); });
  sink->emit(lh::election_event::started("conditional-write"));
  sink->emit(lh::election_event::elected("node-1"));

  ASSERT_EQ(received.size(), 2U);
  EXPECT_EQ(received[0].type, lh::event_type::election_started);
  EXPECT_EQ(received[1], lh::election_event::elected("node-1"));

  ASSERT_NO_THROW(lh::make_null_event_sink()->emit(lh::election_event::reset()));
}

/**
 * @test Verify that the stream sink writes one JSON object per line.
 */
TEST(event_sink, stream) {
  std::ostringstream os;
  auto sink = lh::make_stream_event_sink(os);
  sink->emit(lh::election_event::reset());
  sink->emit(lh::election_event::lost("node-4"));

  std::istringstream is(os.str());
  std::string line;
  ASSERT_TRUE(std::getline(is, line));
  EXPECT_EQ(line, R"""({"type":"election-reset"})""");
  ASSERT_TRUE(std::getline(is, line));
  EXPECT_NE(line.find(R"""("nodeId":"node-4")"""), std::string::npos);
  EXPECT_NE(line.find(R"""("type":"leader-lost")"""), std::string::npos);
  EXPECT_FALSE(std::getline(is, line));
}
