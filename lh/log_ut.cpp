#include "lh/log.hpp"

#include <gmock/gmock.h>

namespace {
using captured_logs = std::vector<std::pair<lh::severity, std::string>>;

std::shared_ptr<lh::log_sink> capture_to(captured_logs& logs) {
  return lh::make_log_sink([&logs](lh::severity sev, std::string&& msg) { logs.emplace_back(sev, std::move(msg)); });
}
} // anonymous namespace

/**
 * @test Verify that the LH_LOG_I() and the supporting classes all work in the normal case.
 */
TEST(log, basic) {
  lh::log lg;
  // First what basically amounts to a compilation test
  ASSERT_NO_THROW(LH_LOG_I(error, lg) << "foo" << 4 << 2);
  captured_logs logs;
  lg.add_sink(capture_to(logs));

  using namespace ::testing;
  ASSERT_NO_THROW(LH_LOG_I(error, lg) << "testing 123"
                                      << " " << 42);
  ASSERT_EQ(logs.size(), 1UL);
  ASSERT_EQ(logs[0].first, lh::severity::error);
  ASSERT_THAT(logs[0].second, StartsWith("[error] testing 123 42"));
  // ... the location suffix only carries the file basename ...
  ASSERT_THAT(logs[0].second, HasSubstr("(log_ut.cpp:"));
}

/**
 * @test Verify that the LH_LOG_I() and the supporting classes all work when a log level is disabled.
 */
TEST(log, run_time_disable) {
  lh::log lg;
  captured_logs logs;
  lg.add_sink(capture_to(logs));

  using namespace ::testing;
  ASSERT_NO_THROW(LH_LOG_I(info, lg) << "testing 123"
                                     << " " << 42);
  ASSERT_EQ(logs.size(), 1UL);
  ASSERT_EQ(logs[0].first, lh::severity::info);
  ASSERT_THAT(logs[0].second, StartsWith("[info] testing 123 42"));

  logs.clear();
  int cnt = 0;
  auto f = [&cnt]() {
    ++cnt;
    return 42;
  };
  lg.min_severity(lh::severity::warning);
  ASSERT_NO_THROW(LH_LOG_I(info, lg) << "testing 123"
                                     << " " << f());
  ASSERT_EQ(logs.size(), 0UL);
  // ... also verify that disabled expressions are not even called ...
  ASSERT_EQ(cnt, 0);
  ASSERT_EQ(f(), 42);
  ASSERT_EQ(cnt, 1);
}

/**
 * @test Verify that the LH_LOG_I() and the supporting classes all work when a log level is disabled at compile-time.
 */
TEST(log, compile_time_disable) {
  lh::log lg;
  captured_logs logs;
  lg.add_sink(capture_to(logs));

  int cnt = 0;
  auto f = [&cnt]() {
    ++cnt;
    return 42;
  };
  // ... use a level that is enabled at runtime, but disabled at compile-time ...
  lg.min_severity(lh::severity::trace);
  ASSERT_NO_THROW(LH_LOG_I(debug, lg) << "testing 123"
                                      << " " << f());
  ASSERT_EQ(logs.size(), 0UL);
  ASSERT_EQ(cnt, 0);
  ASSERT_EQ(f(), 42);
}

/**
 * @test Verify that the LH_LOG() macro and the supporting singleton work as expected.
 */
TEST(log, instance_basic) {
  lh::log& lg = lh::log::instance();
  captured_logs logs;
  lg.add_sink(capture_to(logs));

  using namespace ::testing;
  ASSERT_NO_THROW(LH_LOG(info) << "testing 123 " << 42);
  ASSERT_EQ(logs.size(), 1UL);
  ASSERT_EQ(logs[0].first, lh::severity::info);
  ASSERT_THAT(logs[0].second, StartsWith("[info] testing 123 42"));
  ASSERT_NO_THROW(lg.clear_sinks());
}

/**
 * @test Verify that the LH_LOG_I() and the supporting classes work with multiple sinks.
 */
TEST(log, multiple_sinks) {
  lh::log lg;
  captured_logs logs;
  lg.add_sink(capture_to(logs));
  lg.add_sink(lh::make_log_sink([&logs](lh::severity sev, std::string&& msg) {
    auto s = std::string("(2) ") + msg;
    logs.emplace_back(sev, std::move(s));
  }));

  using namespace ::testing;
  ASSERT_NO_THROW(LH_LOG_I(error, lg) << "testing 123"
                                      << " " << 42);
  ASSERT_EQ(logs.size(), 2UL);
  ASSERT_EQ(logs[0].first, lh::severity::error);
  ASSERT_EQ(logs[1].first, lh::severity::error);
  ASSERT_THAT(logs[0].second, StartsWith("[error] testing 123 42"));
  ASSERT_THAT(logs[1].second, StartsWith("(2) [error] testing 123 42"));
}

/**
 * @test Verify that a single sink can be removed.
 */
TEST(log, remove_sink) {
  lh::log lg;
  captured_logs first;
  captured_logs second;
  auto s1 = capture_to(first);
  auto s2 = capture_to(second);
  lg.add_sink(s1);
  lg.add_sink(s2);

  EXPECT_TRUE(lg.remove_sink(s1));
  EXPECT_FALSE(lg.remove_sink(s1));
  LH_LOG_I(warning, lg) << "only the second sink";
  EXPECT_EQ(first.size(), 0UL);
  EXPECT_EQ(second.size(), 1UL);
}

/**
 * @test Complete code coverage for the lh::logger<true> class.
 */
TEST(log, logger_disabled) {
  // In normal operation neither get() nor write_to() are used for lh::logger<true>, they exist so the macros
  // compile.  Make sure they are no-op's:
  lh::log lg;
  captured_logs logs;
  lg.add_sink(capture_to(logs));
  lh::logger<true> logger(lh::severity::error, __func__, __FILE__, __LINE__, lg);

  ASSERT_EQ((bool)logger, false);
  ASSERT_NO_THROW(logger.get() << "testing " << 123 << std::string(" ") << 42);
  ASSERT_TRUE((std::is_same<decltype(logger.get()), lh::detail::null_stream&>::value));
  ASSERT_NO_THROW(logger.write_to(lg));
  ASSERT_EQ(logs.size(), 0U);
}
