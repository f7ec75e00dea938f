/**@file
 *****************************************************************************
 Branch-free selection and comparison of digests.

 ct_select(bit, if_true, if_false) returns if_true when bit is set and
 if_false otherwise. None of the overloads branch on bit, and none of them
 index memory with it: digests are combined with an all-ones or all-zeros
 mask, field elements limb by limb on their Montgomery representation.

 ct_equal compares the full width of both digests regardless of where the
 first difference is.
 *****************************************************************************
 * @author     This file is part of libzkpath (see AUTHORS)
 * @copyright  MIT license (see LICENSE file)
 *****************************************************************************/
#ifndef LIBZKPATH_COMMON_CONSTANT_TIME_HPP_
#define LIBZKPATH_COMMON_CONSTANT_TIME_HPP_

#include <cstdint>

#include "libzkpath/hashing/hashing.hpp"

namespace libzkpath {

/* 0xFFFFFFFF for true, 0 for false */
std::uint32_t ct_word_mask(const bool bit);

word_hash_digest ct_select(const bool bit,
                           const word_hash_digest &if_true,
                           const word_hash_digest &if_false);

/* Both digests must have the same width. */
binary_hash_digest ct_select(const bool bit,
                             const binary_hash_digest &if_true,
                             const binary_hash_digest &if_false);

template<typename FieldT>
FieldT ct_select(const bool bit, const FieldT &if_true, const FieldT &if_false);

bool ct_equal(const word_hash_digest &a, const word_hash_digest &b);
/* Digest widths are public, so unequal widths return early. */
bool ct_equal(const binary_hash_digest &a, const binary_hash_digest &b);

template<typename FieldT>
bool ct_equal(const FieldT &a, const FieldT &b);

} // namespace libzkpath

#include "libzkpath/common/constant_time.tcc"

#endif // LIBZKPATH_COMMON_CONSTANT_TIME_HPP_
