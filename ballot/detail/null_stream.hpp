#ifndef ballot_detail_null_stream_hpp
#define ballot_detail_null_stream_hpp

namespace ballot {
namespace detail {
/**
 * Implements operator<< for all types, without any effect.
 *
 * The logging macros return an object of this class when a severity level is disabled at compile-time, so the whole
 * streaming expression reduces to nothing.
 */
struct null_stream {
  template <typename T>
  null_stream& operator<<(T const&) {
    return *this;
  }

  null_stream& operator<<(char const*) {
    return *this;
  }
};

} // namespace detail
} // namespace ballot

#endif // ballot_detail_null_stream_hpp
