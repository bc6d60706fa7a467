#ifndef lh_detail_null_stream_hpp
#define lh_detail_null_stream_hpp

namespace lh {
namespace detail {
/**
 * Implements operator<< for all types, without any effect.
 *
 * The leasehold logging adaptors return an object of this class when the particular log-line is disabled at
 * compile-time.
 */
struct null_stream {

  /// Generic do-nothing streaming operator
  template <typename T>
  null_stream& operator<<(T const&) {
    return *this;
  }

  /// Do-nothing streaming operator for string literals.
  null_stream& operator<<(char const*) {
    return *this;
  }
};

} // namespace detail
} // namespace lh

#endif // lh_detail_null_stream_hpp
