#include <numeric>
#include <stdexcept>

namespace libzkpath {

template<typename hash_digest_type>
merkle_authentication_path<hash_digest_type>::merkle_authentication_path(
    const std::vector<bool> &direction_bits,
    const std::vector<hash_digest_type> &sibling_hashes) :
    direction_bits_(direction_bits),
    sibling_hashes_(sibling_hashes)
{
    if (direction_bits.size() != sibling_hashes.size())
    {
        throw std::invalid_argument("An authentication path needs exactly one direction bit per sibling hash.");
    }
}

template<typename hash_digest_type>
std::size_t merkle_authentication_path<hash_digest_type>::depth() const
{
    return this->sibling_hashes_.size();
}

template<typename hash_digest_type>
bool merkle_authentication_path<hash_digest_type>::direction_bit(const std::size_t level) const
{
    return this->direction_bits_[level];
}

template<typename hash_digest_type>
const hash_digest_type& merkle_authentication_path<hash_digest_type>::sibling_hash(const std::size_t level) const
{
    return this->sibling_hashes_[level];
}

template<typename hash_digest_type>
const std::vector<bool>& merkle_authentication_path<hash_digest_type>::direction_bits() const
{
    return this->direction_bits_;
}

template<typename hash_digest_type>
const std::vector<hash_digest_type>& merkle_authentication_path<hash_digest_type>::sibling_hashes() const
{
    return this->sibling_hashes_;
}

template<typename hash_digest_type>
std::size_t merkle_authentication_path<hash_digest_type>::size_in_bytes() const
{
    /* direction bits are packed eight to a byte */
    return std::accumulate(this->sibling_hashes_.begin(),
                           this->sibling_hashes_.end(),
                           (this->direction_bits_.size() + 7) / 8,
                           [] (const std::size_t av, const hash_digest_type &h) {
                               return av + get_hash_size<hash_digest_type>(h); });
}

template<typename hash_digest_type>
bool merkle_authentication_path<hash_digest_type>::operator==(
    const merkle_authentication_path<hash_digest_type> &other) const
{
    return (this->direction_bits_ == other.direction_bits_ &&
            this->sibling_hashes_ == other.sibling_hashes_);
}

} // namespace libzkpath
