/**
 * @file
 *
 * Helper functions to handle errors reported by gRPC++
 */
#ifndef lh_detail_grpc_errors_hpp
#define lh_detail_grpc_errors_hpp

#include <lh/detail/append_annotations.hpp>

#include <google/protobuf/message.h>
#include <grpc++/grpc++.h>

#include <sstream>
#include <stdexcept>

namespace lh {
namespace detail {

/**
 * Convert a failed gRPC status into an exception.
 *
 * @param status the status to check
 * @param where a string to let the user know where the error took place.
 * @param a a list of additional annotations to append (using operator<<) to the end of the exception what() message.
 * @throws std::runtime_error if the @a status.ok() is false.
 */
template <typename Location, typename... Annotations>
void check_grpc_status(grpc::Status const& status, Location const& where, Annotations&&... a) {
  if (status.ok()) {
    return;
  }
  std::ostringstream os;
  os << where << " grpc error: " << status.error_message() << " [" << status.error_code() << "]";
  detail::append_annotations(os, std::forward<Annotations>(a)...);
  throw std::runtime_error(os.str());
}

/**
 * Print a protobuf on a std::ostream.
 *
 * Uses google::protobuf::TextFormat to print a protobuf in a single line.  Typically one would use is as in:
 *
 * @code
 * lh::proto::lease_record const& record = ...;
 * LH_LOG(info) << "acquired " << print_to_stream(record);
 * @endcode
 */
struct print_to_stream {
  explicit print_to_stream(google::protobuf::Message const& m)
      : msg(m) {
  }

  google::protobuf::Message const& msg;
};

/// Streaming operator
std::ostream& operator<<(std::ostream& os, print_to_stream const& x);

} // namespace detail
} // namespace lh

#endif // lh_detail_grpc_errors_hpp
