/**
 * @file
 *
 * Helper function to compute the end of a prefix range.
 */
#ifndef lh_prefix_end_hpp
#define lh_prefix_end_hpp

#include <string>

namespace lh {

/**
 * Returns the end of a prefix range.
 *
 * In etcd all searches are expressed as either "give me this key" or "give me all the keys between A and B".  The
 * etcd stores want "give me all the keys that start with A", which is equivalent to "give me all the keys between A
 * and the smallest string larger than every string starting with A".  This function computes that second string.
 *
 * Trailing 0xFF bytes cannot be incremented, so they are dropped before incrementing the last remaining byte.  If
 * the prefix is made only of 0xFF bytes (or empty) there is no upper bound, and the function returns "\0", which
 * etcd interprets as "all the keys greater than or equal to the start key".
 *
 * @param prefix the beginning of the prefix range
 * @returns the end of the prefix range
 */
std::string prefix_end(std::string const& prefix);

} // namespace lh

#endif // lh_prefix_end_hpp
