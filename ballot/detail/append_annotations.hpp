#ifndef ballot_detail_append_annotations_hpp
#define ballot_detail_append_annotations_hpp

#include <utility>

namespace ballot {
namespace detail {

/// Append an empty list of annotations to a stream.
template <typename Stream>
inline void append_annotations(Stream&) {
}

/**
 * Append a list of annotations to a stream.
 *
 * Used to build error and log messages from a variable number of values of arbitrary types.
 *
 * @tparam Stream the type of the stream, typically std::ostream.
 * @param os the stream.
 * @param h the first annotation.
 * @param t the remaining annotations.
 */
template <typename Stream, typename H, typename... Tail>
inline void append_annotations(Stream& os, H&& h, Tail&&... t) {
  os << std::forward<H>(h);
  append_annotations(os, std::forward<Tail>(t)...);
}

} // namespace detail
} // namespace ballot

#endif // ballot_detail_append_annotations_hpp
