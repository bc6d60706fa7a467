#include "lh/detail/grpc_errors.hpp"

#include <google/protobuf/text_format.h>
#include <string>

namespace lh {
namespace detail {

std::ostream& operator<<(std::ostream& os, print_to_stream const& x) {
  google::protobuf::TextFormat::Printer printer;
  printer.SetSingleLineMode(true);
  // Print and ignore errors, on failure we just get an empty string ...
  std::string formatted;
  (void)printer.PrintToString(x.msg, &formatted);
  // ... single line mode leaves a trailing space ...
  if (not formatted.empty() and formatted.back() == ' ') {
    formatted.pop_back();
  }
  return os << "{" << formatted << "}";
}

} // namespace detail
} // namespace lh
