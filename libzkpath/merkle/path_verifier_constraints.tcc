#include <stdexcept>

#include <libff/common/profiling.hpp>
#include "libzkpath/common/constant_time.hpp"

namespace libzkpath {

template<typename FieldT>
merkle_path_verifier_constraints<FieldT>::merkle_path_verifier_constraints(
    const std::size_t tree_depth,
    const mimc_params<FieldT> &params,
    const std::vector<bool> &sibling_is_public) :
    tree_depth_(tree_depth),
    hasher_(params),
    sibling_is_public_(sibling_is_public),
    constraints_generated_(false),
    witness_generated_(false)
{
    if (tree_depth == 0)
    {
        throw std::invalid_argument("Merkle path verifier depth must be at least 1.");
    }
    if (sibling_is_public.size() != tree_depth)
    {
        throw std::invalid_argument("Sibling visibility needs exactly one entry per level.");
    }

    this->allocate_variables();
}

template<typename FieldT>
void merkle_path_verifier_constraints<FieldT>::allocate_variables()
{
    const std::size_t num_rounds = this->hasher_.params().num_rounds_;
    std::size_t next_index = 1;

    /* primary inputs come first */
    this->root_index_ = next_index++;
    this->sibling_indices_.assign(this->tree_depth_, 0);
    for (std::size_t i = 0; i < this->tree_depth_; ++i)
    {
        if (this->sibling_is_public_[i])
        {
            this->sibling_indices_[i] = next_index++;
        }
    }
    this->constraint_system_.primary_input_size_ = next_index - 1;

    this->leaf_index_ = next_index++;
    this->direction_indices_.resize(this->tree_depth_);
    for (std::size_t i = 0; i < this->tree_depth_; ++i)
    {
        this->direction_indices_[i] = next_index++;
    }
    for (std::size_t i = 0; i < this->tree_depth_; ++i)
    {
        if (!this->sibling_is_public_[i])
        {
            this->sibling_indices_[i] = next_index++;
        }
    }

    this->left_indices_.resize(this->tree_depth_);
    this->round_indices_.resize(this->tree_depth_);
    this->output_indices_.resize(this->tree_depth_);
    for (std::size_t i = 0; i < this->tree_depth_; ++i)
    {
        this->left_indices_[i] = next_index++;
        this->round_indices_[i].resize(3 * num_rounds);
        for (std::size_t k = 0; k < 3 * num_rounds; ++k)
        {
            this->round_indices_[i][k] = next_index++;
        }
        this->output_indices_[i] = next_index++;
    }

    this->constraint_system_.auxiliary_input_size_ =
        (next_index - 1) - this->constraint_system_.primary_input_size_;
    this->full_variable_assignment_.assign(next_index - 1, FieldT::zero());
}

template<typename FieldT>
linear_combination<FieldT> merkle_path_verifier_constraints<FieldT>::current_lc(
    const std::size_t level) const
{
    if (level == 0)
    {
        return linear_combination<FieldT>::variable(this->leaf_index_);
    }
    return linear_combination<FieldT>::variable(this->output_indices_[level - 1]);
}

template<typename FieldT>
void merkle_path_verifier_constraints<FieldT>::assign(const std::size_t index, const FieldT &value)
{
    this->full_variable_assignment_[index - 1] = value;
}

template<typename FieldT>
void merkle_path_verifier_constraints<FieldT>::generate_r1cs_constraints()
{
    if (this->constraints_generated_)
    {
        throw std::logic_error("Attempting to generate the Merkle path constraints twice.");
    }

    libff::enter_block("Generate Merkle path R1CS constraints");
    typedef linear_combination<FieldT> lc_t;

    const mimc_params<FieldT> &params = this->hasher_.params();
    const lc_t one(FieldT::one());

    for (std::size_t i = 0; i < this->tree_depth_; ++i)
    {
        const lc_t bit = lc_t::variable(this->direction_indices_[i]);
        const lc_t current = this->current_lc(i);
        const lc_t sibling = lc_t::variable(this->sibling_indices_[i]);
        const lc_t left = lc_t::variable(this->left_indices_[i]);

        /* booleanity of the direction bit */
        this->constraint_system_.add_constraint(
            r1cs_constraint<FieldT>(bit, one - bit, lc_t()));
        /* left = current + bit * (sibling - current) */
        this->constraint_system_.add_constraint(
            r1cs_constraint<FieldT>(bit, sibling - current, left - current));
        const lc_t right = current + sibling - left;

        lc_t x = right;
        for (std::size_t j = 0; j < params.num_rounds_; ++j)
        {
            const lc_t u = x + left + lc_t(params.round_constants_[j]);
            const lc_t u2 = lc_t::variable(this->round_indices_[i][3*j]);
            const lc_t u4 = lc_t::variable(this->round_indices_[i][3*j + 1]);
            const lc_t next_x = lc_t::variable(this->round_indices_[i][3*j + 2]);

            this->constraint_system_.add_constraint(r1cs_constraint<FieldT>(u, u, u2));
            this->constraint_system_.add_constraint(r1cs_constraint<FieldT>(u2, u2, u4));
            this->constraint_system_.add_constraint(r1cs_constraint<FieldT>(u4, u, next_x));
            x = next_x;
        }

        this->constraint_system_.add_constraint(
            r1cs_constraint<FieldT>(one, x + left + right,
                                    lc_t::variable(this->output_indices_[i])));
    }

    /* the recomputed root must equal the public root */
    this->constraint_system_.add_constraint(
        r1cs_constraint<FieldT>(one,
                                lc_t::variable(this->output_indices_[this->tree_depth_ - 1]),
                                lc_t::variable(this->root_index_)));

    this->constraints_generated_ = true;
    libff::leave_block("Generate Merkle path R1CS constraints");
}

template<typename FieldT>
void merkle_path_verifier_constraints<FieldT>::generate_r1cs_witness(
    const FieldT &root,
    const FieldT &leaf,
    const merkle_authentication_path<FieldT> &path)
{
    if (path.depth() != this->tree_depth_)
    {
        throw std::invalid_argument("Authentication path depth does not match the constraint system.");
    }

    libff::enter_block("Generate Merkle path R1CS witness");
    const mimc_params<FieldT> &params = this->hasher_.params();

    this->assign(this->root_index_, root);
    this->assign(this->leaf_index_, leaf);

    FieldT current = leaf;
    for (std::size_t i = 0; i < this->tree_depth_; ++i)
    {
        const bool bit = path.direction_bit(i);
        const FieldT &sibling = path.sibling_hash(i);

        this->assign(this->direction_indices_[i], FieldT((long) bit));
        this->assign(this->sibling_indices_[i], sibling);

        const FieldT left = ct_select(bit, sibling, current);
        const FieldT right = current + sibling - left;
        this->assign(this->left_indices_[i], left);

        FieldT x = right;
        for (std::size_t j = 0; j < params.num_rounds_; ++j)
        {
            const FieldT u = x + left + params.round_constants_[j];
            const FieldT u2 = u.squared();
            const FieldT u4 = u2.squared();
            x = u4 * u;

            this->assign(this->round_indices_[i][3*j], u2);
            this->assign(this->round_indices_[i][3*j + 1], u4);
            this->assign(this->round_indices_[i][3*j + 2], x);
        }

        current = x + left + right;
        this->assign(this->output_indices_[i], current);
    }

    this->witness_generated_ = true;
    libff::leave_block("Generate Merkle path R1CS witness");
}

template<typename FieldT>
const r1cs_constraint_system<FieldT>& merkle_path_verifier_constraints<FieldT>::constraint_system() const
{
    return this->constraint_system_;
}

template<typename FieldT>
r1cs_primary_input<FieldT> merkle_path_verifier_constraints<FieldT>::primary_input() const
{
    if (!this->witness_generated_)
    {
        throw std::logic_error("Attempting to read the primary input before generating a witness.");
    }
    return r1cs_primary_input<FieldT>(
        this->full_variable_assignment_.begin(),
        this->full_variable_assignment_.begin() + this->constraint_system_.primary_input_size_);
}

template<typename FieldT>
r1cs_auxiliary_input<FieldT> merkle_path_verifier_constraints<FieldT>::auxiliary_input() const
{
    if (!this->witness_generated_)
    {
        throw std::logic_error("Attempting to read the auxiliary input before generating a witness.");
    }
    return r1cs_auxiliary_input<FieldT>(
        this->full_variable_assignment_.begin() + this->constraint_system_.primary_input_size_,
        this->full_variable_assignment_.end());
}

template<typename FieldT>
bool merkle_path_verifier_constraints<FieldT>::is_satisfied() const
{
    if (!this->constraints_generated_)
    {
        throw std::logic_error("Attempting to check satisfaction before generating constraints.");
    }
    return this->constraint_system_.is_satisfied(this->primary_input(), this->auxiliary_input());
}

template<typename FieldT>
std::size_t merkle_path_verifier_constraints<FieldT>::depth() const
{
    return this->tree_depth_;
}

template<typename FieldT>
std::size_t merkle_path_verifier_constraints<FieldT>::num_constraints() const
{
    return this->constraint_system_.num_constraints();
}

template<typename FieldT>
std::size_t merkle_path_verifier_constraints<FieldT>::num_primary_inputs() const
{
    return this->constraint_system_.num_inputs();
}

template<typename FieldT>
std::size_t merkle_path_verifier_constraints<FieldT>::num_variables() const
{
    return this->constraint_system_.num_variables();
}

template<typename FieldT>
std::size_t merkle_path_verifier_constraints<FieldT>::direction_bit_variable(const std::size_t level) const
{
    return this->direction_indices_[level];
}

} // namespace libzkpath
