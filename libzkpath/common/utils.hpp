/**@file
 *****************************************************************************
 Random digests and direction bits, for tests, benchmarks and profiling.
 *****************************************************************************
 * @author     This file is part of libzkpath (see AUTHORS)
 * @copyright  MIT license (see LICENSE file)
 *****************************************************************************/
#ifndef LIBZKPATH_COMMON_UTILS_HPP_
#define LIBZKPATH_COMMON_UTILS_HPP_

#include <cstddef>
#include <type_traits>
#include <vector>

#include "libzkpath/hashing/hashing.hpp"

namespace libzkpath {

template<typename hash_type>
hash_type random_digest(const typename libff::enable_if<std::is_same<hash_type, binary_hash_digest>::value, std::size_t>::type digest_len_bytes);

template<typename hash_type>
hash_type random_digest(const typename libff::enable_if<std::is_same<hash_type, word_hash_digest>::value, std::size_t>::type digest_len_bytes);

/* Field element digest, the length is ignored. */
template<typename hash_type>
hash_type random_digest(const typename libff::enable_if<
    !std::is_same<hash_type, binary_hash_digest>::value &&
    !std::is_same<hash_type, word_hash_digest>::value, std::size_t>::type digest_len_bytes);

template<typename hash_type>
std::vector<hash_type> random_digest_vector(const std::size_t count,
                                            const std::size_t digest_len_bytes);

std::vector<bool> random_direction_bits(const std::size_t depth);

} // namespace libzkpath

#include "libzkpath/common/utils.tcc"

#endif // LIBZKPATH_COMMON_UTILS_HPP_
