#include "lh/detail/grpc_errors.hpp"
#include <lh/lease_record.pb.h>

#include <gtest/gtest.h>

/**
 * @test Verify that check_grpc_status works as expected.
 */
TEST(grpc_errors, check_grpc_status_ok) {
  using namespace lh::detail;

  grpc::Status status = grpc::Status::OK;
  ASSERT_NO_THROW(check_grpc_status(status, "test"));

  lh::proto::lease_record record;
  ASSERT_NO_THROW(check_grpc_status(status, "test", " in iteration=", 42, ", record=", print_to_stream(record)));
}

/**
 * @test Verify that check_grpc_status throws what is expected.
 */
TEST(grpc_errors, check_grpc_status_error_annotations) {
  using namespace lh::detail;

  grpc::Status status(grpc::UNKNOWN, "bad thing");
  lh::proto::lease_record record;
  record.set_owner("node-2");
  try {
    check_grpc_status(status, "test", " record=", print_to_stream(record));
    FAIL() << "expected an exception";
  } catch (std::runtime_error const& ex) {
    ASSERT_EQ(std::string(ex.what()), R"""(test grpc error: bad thing [2] record={owner: "node-2"})""");
  }
}

/**
 * @test Verify that check_grpc_status throws what is expected.
 */
TEST(grpc_errors, check_grpc_status_error_bare) {
  using namespace lh::detail;
  grpc::Status status(grpc::UNAVAILABLE, "no server");
  try {
    check_grpc_status(status, "test");
    FAIL() << "expected an exception";
  } catch (std::runtime_error const& ex) {
    ASSERT_EQ(std::string(ex.what()), "test grpc error: no server [14]");
  }
}

/**
 * @test Verify that print_to_stream works as expected.
 */
TEST(grpc_errors, print_to_stream_basic) {
  using namespace lh::detail;

  lh::proto::lease_record record;
  record.set_id("current-leader");
  record.set_expires_at(42);

  std::ostringstream os;
  os << print_to_stream(record);
  ASSERT_EQ(os.str(), R"""({id: "current-leader" expires_at: 42})""");

  os.str("");
  os << print_to_stream(lh::proto::lease_record());
  ASSERT_EQ(os.str(), "{}");
}
