/**@file
 *****************************************************************************
 SHA-256 two-to-one hash over the reference 8 x 32-bit word digests.

 The 16 words of (first || second) are serialized big-endian into one
 64-byte block, which is hashed with SHA-256. The 32-byte result is read
 back as 8 big-endian words.
 *****************************************************************************
 * @author     This file is part of libzkpath (see AUTHORS)
 * @copyright  MIT license (see LICENSE file)
 *****************************************************************************/
#ifndef LIBZKPATH_HASHING_SHA256_HPP_
#define LIBZKPATH_HASHING_SHA256_HPP_

#include <cstddef>
#include <string>

#include "libzkpath/hashing/hashing.hpp"

namespace libzkpath {

const std::size_t sha256_digest_len_bytes = 32;

word_hash_digest sha256_two_to_one_hash(const word_hash_digest &first,
                                        const word_hash_digest &second,
                                        const std::size_t digest_len_bytes);

/* Parses 64 hex characters, most significant word first. */
word_hash_digest word_digest_from_hex(const std::string &hex);
std::string word_digest_to_hex(const word_hash_digest &digest);

} // namespace libzkpath

#endif // LIBZKPATH_HASHING_SHA256_HPP_
