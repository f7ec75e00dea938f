#include "libzkpath/merkle/path_verifier_constraints.hpp"

namespace libzkpath {

std::vector<bool> all_private_siblings(const std::size_t tree_depth)
{
    return std::vector<bool>(tree_depth, false);
}

} // namespace libzkpath
