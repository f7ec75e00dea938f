#include <stdexcept>

#include "libzkpath/merkle/authentication_path.hpp"

namespace libzkpath {

std::vector<bool> direction_bits_from_address(const std::size_t address,
                                              const std::size_t depth)
{
    if (depth < 8 * sizeof(std::size_t) && (address >> depth) != 0)
    {
        throw std::invalid_argument("Leaf address does not fit in a tree of this depth.");
    }

    std::vector<bool> bits(depth, false);
    for (std::size_t i = 0; i < depth && i < 8 * sizeof(std::size_t); ++i)
    {
        bits[i] = ((address >> i) & 1) != 0;
    }
    return bits;
}

} // namespace libzkpath
