/**@file
 *****************************************************************************
 BLAKE2b two-to-one hash over binary digests, and the field element
 sampler used to derive algebraic hash constants.
 *****************************************************************************
 * @author     This file is part of libzkpath (see AUTHORS)
 * @copyright  MIT license (see LICENSE file)
 *****************************************************************************/
#ifndef LIBZKPATH_HASHING_BLAKE2B_HPP_
#define LIBZKPATH_HASHING_BLAKE2B_HPP_

#include <cstddef>
#include <string>
#include <vector>

#include "libzkpath/hashing/hashing.hpp"

namespace libzkpath {

binary_hash_digest blake2b_two_to_one_hash(const binary_hash_digest &first,
                                           const binary_hash_digest &second,
                                           const std::size_t digest_len_bytes);

/* Lowercase hex encoding of a binary digest. */
std::string binary_digest_to_hex(const binary_hash_digest &digest);

/** Deterministically derives num_elements field elements from a seed.
 *  Each attempt hashes seed || counter with unkeyed BLAKE2b, the counter a
 *  64-bit little-endian integer starting at 0. The digest is read as a
 *  little-endian integer, cut to the bit length of the modulus, and kept
 *  only if it is below the modulus. */
template<typename FieldT>
std::vector<FieldT> blake2b_FieldT_from_seed(const std::string &seed,
                                             const std::size_t num_elements);

} // namespace libzkpath

#include "libzkpath/hashing/blake2b.tcc"

#endif // LIBZKPATH_HASHING_BLAKE2B_HPP_
