#ifndef lh_detail_append_annotations_hpp
#define lh_detail_append_annotations_hpp

#include <utility>

namespace lh {
namespace detail {

/**
 * Append a list of annotations to a stream.
 *
 * Used to decorate log lines and exception messages with whatever context is available at the call site: node ids,
 * keys, protobuf records, etc.
 *
 * @tparam Stream the type of the stream, typically std::ostream or lh::detail::null_stream.
 * @tparam Annotations the types of the annotations, anything with a streaming operator.
 * @param os the value of the stream.
 * @param a the annotations, streamed in order.
 */
template <typename Stream, typename... Annotations>
inline Stream& append_annotations(Stream& os, Annotations&&... a) {
  // ... the classic C++14 pack expansion, the leading 0 makes the array non-empty when the pack is ...
  int expand[] = {0, ((void)(os << std::forward<Annotations>(a)), 0)...};
  (void)expand;
  return os;
}

} // namespace detail
} // namespace lh

#endif // lh_detail_append_annotations_hpp
