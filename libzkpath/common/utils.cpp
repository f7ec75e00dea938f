#include <sodium/randombytes.h>

#include "libzkpath/common/utils.hpp"

namespace libzkpath {

std::vector<bool> random_direction_bits(const std::size_t depth)
{
    std::vector<bool> bits(depth, false);
    for (std::size_t i = 0; i < depth; ++i)
    {
        bits[i] = (randombytes_uniform(2) == 1);
    }
    return bits;
}

} // namespace libzkpath
