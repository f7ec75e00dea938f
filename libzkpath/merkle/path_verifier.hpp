/**@file
 *****************************************************************************
 Fixed-depth Merkle authentication path verifier.

 Recomputes the root from a leaf and its authentication path, and compares
 it with a known root. The child order at every level is chosen with a
 branch-free select on the direction bit, every level is always hashed, and
 the final comparison covers the whole digest, so neither the running
 digest nor the direction bits influence control flow.

 The tree depth is fixed when the verifier is constructed. A path of any
 other depth, or a digest of the wrong width, is a caller error and throws
 std::invalid_argument before anything is hashed. A path that simply does
 not lead to the root makes verify() return false.
 *****************************************************************************
 * @author     This file is part of libzkpath (see AUTHORS)
 * @copyright  MIT license (see LICENSE file)
 *****************************************************************************/
#ifndef LIBZKPATH_MERKLE_PATH_VERIFIER_HPP_
#define LIBZKPATH_MERKLE_PATH_VERIFIER_HPP_

#include <cstddef>

#include "libzkpath/hashing/hashing.hpp"
#include "libzkpath/merkle/authentication_path.hpp"

namespace libzkpath {

template<typename hash_digest_type>
class merkle_path_verifier {
protected:
    std::size_t tree_depth_;
    two_to_one_hash_function<hash_digest_type> node_hasher_;
    std::size_t digest_len_bytes_;

    void check_digest_width(const hash_digest_type &digest, const char *name) const;
    void check_path(const merkle_authentication_path<hash_digest_type> &path) const;
public:
    merkle_path_verifier(const std::size_t tree_depth,
                         const two_to_one_hash_function<hash_digest_type> &node_hasher,
                         const std::size_t digest_len_bytes);

    bool verify(const hash_digest_type &root,
                const hash_digest_type &leaf,
                const merkle_authentication_path<hash_digest_type> &path) const;

    /* The root the given leaf and path lead to. verify() compares this with its root. */
    hash_digest_type compute_root(const hash_digest_type &leaf,
                                  const merkle_authentication_path<hash_digest_type> &path) const;

    std::size_t depth() const;
    std::size_t digest_len_bytes() const;
    /* Always one two-to-one hash per level. */
    std::size_t count_hashes_to_verify() const;
};

} // namespace libzkpath

#include "libzkpath/merkle/path_verifier.tcc"

#endif // LIBZKPATH_MERKLE_PATH_VERIFIER_HPP_
