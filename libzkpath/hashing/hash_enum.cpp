#include <stdexcept>

#include "libzkpath/hashing/hash_enum.hpp"

namespace libzkpath {

path_hash_type path_hash_type_from_size_t(const std::size_t hash_enum_val)
{
    switch (hash_enum_val)
    {
    case blake2b_type:
        return blake2b_type;
    case sha256_type:
        return sha256_type;
    case mimc_type:
        return mimc_type;
    default:
        throw std::invalid_argument("Not a path_hash_type.");
    }
}

} // namespace libzkpath
