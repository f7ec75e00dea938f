/**@file
 *****************************************************************************
 Digest types and the two-to-one hash interface consumed by the path verifier.
 *****************************************************************************
 * @author     This file is part of libzkpath (see AUTHORS)
 * @copyright  MIT license (see LICENSE file)
 *****************************************************************************/
#ifndef LIBZKPATH_HASHING_HASHING_HPP_
#define LIBZKPATH_HASHING_HASHING_HPP_

#include <array>
#include <cstdint>
#include <functional>
#include <string>
#include <type_traits>
#include <libff/algebra/field_utils/field_utils.hpp>

namespace libzkpath {

/* Byte string digest. The width is fixed per verifier, not per type. */
typedef std::string binary_hash_digest;

/* 256-bit digest as 8 x 32-bit words, the reference encoding. */
const std::size_t word_digest_num_words = 8;
typedef std::array<std::uint32_t, word_digest_num_words> word_hash_digest;

/** Compresses the block (first || second) into one digest.
 *  The last argument is the expected digest width in bytes. */
template<typename hash_type>
using two_to_one_hash_function = std::function<hash_type(const hash_type&, const hash_type&, const std::size_t)>;

/* Sizeof algebraic hash */
template<typename hash_type>
std::size_t get_hash_size(const typename libff::enable_if<
    !std::is_same<hash_type, binary_hash_digest>::value &&
    !std::is_same<hash_type, word_hash_digest>::value, hash_type>::type h)
{
    const std::size_t field_size =
        (libff::log_of_field_size_helper<hash_type>(hash_type::zero()) + 7) / 8;
    return field_size;
}

/* Sizeof binary hash */
template<typename hash_type>
std::size_t get_hash_size(const typename libff::enable_if<std::is_same<hash_type, binary_hash_digest>::value, hash_type>::type &h)
{
    return h.size();
}

/* Sizeof word hash */
template<typename hash_type>
std::size_t get_hash_size(const typename libff::enable_if<std::is_same<hash_type, word_hash_digest>::value, hash_type>::type &h)
{
    return h.size() * sizeof(std::uint32_t);
}

} // namespace libzkpath

#endif // LIBZKPATH_HASHING_HASHING_HPP_
