#ifndef ballot_assert_throw_hpp
#define ballot_assert_throw_hpp
/**
 * @file
 *
 * Check internal invariants at run-time, raising exceptions instead of aborting the program.
 */

#ifndef BALLOT_ASSERT_THROW
/**
 * Check the predicate @a P and if false raise a std::runtime_error describing the problem.
 */
#define BALLOT_ASSERT_THROW(P)                                                                                         \
  do {                                                                                                                 \
    if (not(P)) {                                                                                                      \
      ballot::assert_throw_impl(#P, __func__, __FILE__, __LINE__);                                                     \
    }                                                                                                                  \
  } while (false)
#endif // BALLOT_ASSERT_THROW

namespace ballot {

/**
 * Implement BALLOT_ASSERT_THROW() out-of-line.
 *
 * @param what the text of the predicate.
 * @param function the function where the predicate was checked.
 * @param filename the source file where the predicate was checked.
 * @param lineno the line where the predicate was checked.
 */
[[noreturn]] void assert_throw_impl(char const* what, char const* function, char const* filename, int lineno);

} // namespace ballot

#endif // ballot_assert_throw_hpp
