#include <stdexcept>
#include <string>

#include "libzkpath/common/constant_time.hpp"

namespace libzkpath {

template<typename hash_digest_type>
merkle_path_verifier<hash_digest_type>::merkle_path_verifier(
    const std::size_t tree_depth,
    const two_to_one_hash_function<hash_digest_type> &node_hasher,
    const std::size_t digest_len_bytes) :
    tree_depth_(tree_depth),
    node_hasher_(node_hasher),
    digest_len_bytes_(digest_len_bytes)
{
    if (tree_depth == 0)
    {
        throw std::invalid_argument("Merkle path verifier depth must be at least 1.");
    }
    if (digest_len_bytes == 0)
    {
        throw std::invalid_argument("Digest length must be positive.");
    }
    if (!node_hasher)
    {
        throw std::invalid_argument("Merkle path verifier needs a two-to-one hash.");
    }
}

template<typename hash_digest_type>
void merkle_path_verifier<hash_digest_type>::check_digest_width(
    const hash_digest_type &digest, const char *name) const
{
    if (get_hash_size<hash_digest_type>(digest) != this->digest_len_bytes_)
    {
        throw std::invalid_argument(std::string(name) + " has width " +
                                    std::to_string(get_hash_size<hash_digest_type>(digest)) +
                                    " bytes, expected " +
                                    std::to_string(this->digest_len_bytes_) + ".");
    }
}

template<typename hash_digest_type>
void merkle_path_verifier<hash_digest_type>::check_path(
    const merkle_authentication_path<hash_digest_type> &path) const
{
    if (path.depth() != this->tree_depth_)
    {
        throw std::invalid_argument("Authentication path has " + std::to_string(path.depth()) +
                                    " levels, the verifier expects " +
                                    std::to_string(this->tree_depth_) + ".");
    }
    for (std::size_t i = 0; i < path.depth(); ++i)
    {
        this->check_digest_width(path.sibling_hash(i), "Sibling hash");
    }
}

template<typename hash_digest_type>
hash_digest_type merkle_path_verifier<hash_digest_type>::compute_root(
    const hash_digest_type &leaf,
    const merkle_authentication_path<hash_digest_type> &path) const
{
    this->check_digest_width(leaf, "Leaf hash");
    this->check_path(path);

    hash_digest_type current = leaf;
    for (std::size_t i = 0; i < this->tree_depth_; ++i)
    {
        const bool bit = path.direction_bit(i);
        const hash_digest_type &sibling = path.sibling_hash(i);

        /* bit set: (sibling, current), otherwise (current, sibling) */
        const hash_digest_type left = ct_select(bit, sibling, current);
        const hash_digest_type right = ct_select(bit, current, sibling);

        current = this->node_hasher_(left, right, this->digest_len_bytes_);
    }

    return current;
}

template<typename hash_digest_type>
bool merkle_path_verifier<hash_digest_type>::verify(
    const hash_digest_type &root,
    const hash_digest_type &leaf,
    const merkle_authentication_path<hash_digest_type> &path) const
{
    this->check_digest_width(root, "Root hash");

    const hash_digest_type computed_root = this->compute_root(leaf, path);
    return ct_equal(computed_root, root);
}

template<typename hash_digest_type>
std::size_t merkle_path_verifier<hash_digest_type>::depth() const
{
    return this->tree_depth_;
}

template<typename hash_digest_type>
std::size_t merkle_path_verifier<hash_digest_type>::digest_len_bytes() const
{
    return this->digest_len_bytes_;
}

template<typename hash_digest_type>
std::size_t merkle_path_verifier<hash_digest_type>::count_hashes_to_verify() const
{
    return this->tree_depth_;
}

} // namespace libzkpath
