/**@file
 *****************************************************************************
 The Merkle path verifier expressed as a rank-1 constraint system, with the
 MiMC two-to-one hash.

 Variable layout:
   primary:   root, then the siblings marked public, in level order
   auxiliary: leaf, direction bits, the remaining siblings,
              then per level the selected left child, the MiMC round
              wires (3 per round) and the level output

 Per level i, with running value cur and direction bit b:
   b * (1 - b)           = 0
   b * (sibling - cur)   = left - cur
   right                 = cur + sibling - left      (linear, no constraint)
   3 constraints per MiMC round keyed by left over right
   1 * (x_R + left + right) = out_i
 and finally 1 * out_{depth-1} = root.

 Which siblings are public is a deployment choice. It changes the
 primary input, not the constraints.
 *****************************************************************************
 * @author     This file is part of libzkpath (see AUTHORS)
 * @copyright  MIT license (see LICENSE file)
 *****************************************************************************/
#ifndef LIBZKPATH_MERKLE_PATH_VERIFIER_CONSTRAINTS_HPP_
#define LIBZKPATH_MERKLE_PATH_VERIFIER_CONSTRAINTS_HPP_

#include <cstddef>
#include <vector>

#include "libzkpath/hashing/mimc.hpp"
#include "libzkpath/merkle/authentication_path.hpp"
#include "libzkpath/relations/r1cs.hpp"

namespace libzkpath {

template<typename FieldT>
class merkle_path_verifier_constraints {
protected:
    std::size_t tree_depth_;
    mimc_two_to_one_hash<FieldT> hasher_;
    std::vector<bool> sibling_is_public_;

    r1cs_constraint_system<FieldT> constraint_system_;
    /* variables 1 .. num_variables */
    std::vector<FieldT> full_variable_assignment_;
    bool constraints_generated_;
    bool witness_generated_;

    std::size_t root_index_;
    std::size_t leaf_index_;
    std::vector<std::size_t> direction_indices_;
    std::vector<std::size_t> sibling_indices_;
    std::vector<std::size_t> left_indices_;
    /* per level: (u^2, u^4, x_{j+1}) for each round j */
    std::vector<std::vector<std::size_t>> round_indices_;
    std::vector<std::size_t> output_indices_;

    void allocate_variables();
    linear_combination<FieldT> current_lc(const std::size_t level) const;
    void assign(const std::size_t index, const FieldT &value);
public:
    /* sibling_is_public must have one entry per level. */
    merkle_path_verifier_constraints(const std::size_t tree_depth,
                                     const mimc_params<FieldT> &params,
                                     const std::vector<bool> &sibling_is_public);

    void generate_r1cs_constraints();
    void generate_r1cs_witness(const FieldT &root,
                               const FieldT &leaf,
                               const merkle_authentication_path<FieldT> &path);

    const r1cs_constraint_system<FieldT>& constraint_system() const;
    r1cs_primary_input<FieldT> primary_input() const;
    r1cs_auxiliary_input<FieldT> auxiliary_input() const;
    bool is_satisfied() const;

    std::size_t depth() const;
    std::size_t num_constraints() const;
    std::size_t num_primary_inputs() const;
    std::size_t num_variables() const;
    /* Variable index of the direction bit at a level, counting the constant as 0. */
    std::size_t direction_bit_variable(const std::size_t level) const;
};

/* All siblings private, only the root is public. */
std::vector<bool> all_private_siblings(const std::size_t tree_depth);

} // namespace libzkpath

#include "libzkpath/merkle/path_verifier_constraints.tcc"

#endif // LIBZKPATH_MERKLE_PATH_VERIFIER_CONSTRAINTS_HPP_
