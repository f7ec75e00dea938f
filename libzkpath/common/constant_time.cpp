#include <sodium/utils.h>
#include <stdexcept>

#include "libzkpath/common/constant_time.hpp"

namespace libzkpath {

std::uint32_t ct_word_mask(const bool bit)
{
    return ((std::uint32_t) 0) - ((std::uint32_t) bit);
}

word_hash_digest ct_select(const bool bit,
                           const word_hash_digest &if_true,
                           const word_hash_digest &if_false)
{
    const std::uint32_t mask = ct_word_mask(bit);
    word_hash_digest result;
    for (std::size_t i = 0; i < result.size(); ++i)
    {
        result[i] = (if_true[i] & mask) | (if_false[i] & ~mask);
    }
    return result;
}

binary_hash_digest ct_select(const bool bit,
                             const binary_hash_digest &if_true,
                             const binary_hash_digest &if_false)
{
    if (if_true.size() != if_false.size())
    {
        throw std::invalid_argument("Cannot select between digests of different widths.");
    }

    const unsigned char mask = (unsigned char) ct_word_mask(bit);
    binary_hash_digest result(if_true.size(), '\0');
    for (std::size_t i = 0; i < result.size(); ++i)
    {
        const unsigned char t = (unsigned char) if_true[i];
        const unsigned char f = (unsigned char) if_false[i];
        result[i] = (char) ((t & mask) | (f & (unsigned char) ~mask));
    }
    return result;
}

bool ct_equal(const word_hash_digest &a, const word_hash_digest &b)
{
    return sodium_memcmp(a.data(), b.data(), a.size() * sizeof(std::uint32_t)) == 0;
}

bool ct_equal(const binary_hash_digest &a, const binary_hash_digest &b)
{
    if (a.size() != b.size())
    {
        return false;
    }
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace libzkpath
