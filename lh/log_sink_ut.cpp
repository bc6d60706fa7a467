#include "lh/log_sink.hpp"

#include <gtest/gtest.h>

#include <sstream>

/**
 * @test Verify that the lh::make_log_sink works as expected.
 */
TEST(log_sink, basic) {
  std::string value;
  lh::severity sev;
  auto ls = lh::make_log_sink([&value, &sev](lh::severity s, std::string&& m) {
    value = m;
    sev = s;
  });

  ls->log(lh::severity::info, std::string("testing 1 2 3"));
  ASSERT_EQ(sev, lh::severity::info);
  ASSERT_EQ(value, "testing 1 2 3");
}

/**
 * @test Verify that lh::make_stream_log_sink filters by severity and writes one line per message.
 */
TEST(log_sink, stream) {
  std::ostringstream os;
  auto ls = lh::make_stream_log_sink(os, lh::severity::warning);

  ls->log(lh::severity::info, std::string("dropped"));
  ls->log(lh::severity::warning, std::string("kept 1"));
  ls->log(lh::severity::error, std::string("kept 2"));
  ASSERT_EQ(os.str(), "kept 1\nkept 2\n");
}
