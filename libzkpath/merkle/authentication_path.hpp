/**@file
 *****************************************************************************
 Merkle authentication path for a single leaf.

 Level 0 is the level directly above the leaf, level depth-1 the level
 directly below the root. direction_bit(i) is true when the running digest
 at level i is the right child (so its sibling is the left child).
 *****************************************************************************
 * @author     This file is part of libzkpath (see AUTHORS)
 * @copyright  MIT license (see LICENSE file)
 *****************************************************************************/
#ifndef LIBZKPATH_MERKLE_AUTHENTICATION_PATH_HPP_
#define LIBZKPATH_MERKLE_AUTHENTICATION_PATH_HPP_

#include <cstddef>
#include <vector>

#include "libzkpath/hashing/hashing.hpp"

namespace libzkpath {

template<typename hash_digest_type>
class merkle_authentication_path {
protected:
    std::vector<bool> direction_bits_;
    std::vector<hash_digest_type> sibling_hashes_;
public:
    /* Throws if the two vectors do not have the same length. */
    merkle_authentication_path(const std::vector<bool> &direction_bits,
                               const std::vector<hash_digest_type> &sibling_hashes);

    std::size_t depth() const;

    bool direction_bit(const std::size_t level) const;
    const hash_digest_type& sibling_hash(const std::size_t level) const;

    const std::vector<bool>& direction_bits() const;
    const std::vector<hash_digest_type>& sibling_hashes() const;

    std::size_t size_in_bytes() const;

    bool operator==(const merkle_authentication_path<hash_digest_type> &other) const;
};

/** Direction bits of the leaf at position address in a tree of the given depth,
 *  least significant bit first. */
std::vector<bool> direction_bits_from_address(const std::size_t address,
                                              const std::size_t depth);

} // namespace libzkpath

#include "libzkpath/merkle/authentication_path.tcc"

#endif // LIBZKPATH_MERKLE_AUTHENTICATION_PATH_HPP_
