/**@file
 *****************************************************************************
    Enum for all supported two-to-one hashes, for configuring the verifier
 *****************************************************************************
 * @author     This file is part of libzkpath (see AUTHORS)
 * @copyright  MIT license (see LICENSE file)
 *****************************************************************************/
#ifndef LIBZKPATH_HASHING_HASH_ENUM_HPP_
#define LIBZKPATH_HASHING_HASH_ENUM_HPP_

#include <cstddef>

#include "libzkpath/hashing/hashing.hpp"
#include "libzkpath/hashing/blake2b.hpp"
#include "libzkpath/hashing/mimc.hpp"
#include "libzkpath/hashing/sha256.hpp"

namespace libzkpath {

/** One enum element for each qualitatively different two-to-one hash.
 *  Each one fixes the digest type it works over. */
enum path_hash_type {
    blake2b_type = 1, /* binary_hash_digest */
    sha256_type = 2,  /* word_hash_digest */
    mimc_type = 3     /* FieldT */
};

static const char* path_hash_type_names[] = {"", "blake2b", "sha256", "mimc"};

path_hash_type path_hash_type_from_size_t(const std::size_t hash_enum_val);

template<typename hash_type, typename FieldT>
two_to_one_hash_function<hash_type> get_two_to_one_hash(const path_hash_type hash_enum);

/* The digest width the given hash produces, or the requested one where it is configurable.
   A requested BLAKE2b width outside 1 .. crypto_generichash_blake2b_BYTES_MAX throws. */
template<typename FieldT>
std::size_t get_digest_len_bytes(const path_hash_type hash_enum,
                                 const std::size_t requested_len_bytes);

} // namespace libzkpath

#include "libzkpath/hashing/hash_enum.tcc"

#endif // LIBZKPATH_HASHING_HASH_ENUM_HPP_
