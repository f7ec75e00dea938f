/**@file
 *****************************************************************************
 Declaration of interfaces for a rank-1 constraint system.

 A constraint is a triple (a, b, c) of linear combinations over the
 variables, satisfied when <a, x> * <b, x> = <c, x>. Variable 0 is the
 constant 1. Variables 1 .. primary_input_size_ are the primary (public)
 inputs, the remaining auxiliary_input_size_ variables are private.
 *****************************************************************************
 * @author     This file is part of libzkpath (see AUTHORS)
 * @copyright  MIT license (see LICENSE file)
 *****************************************************************************/
#ifndef LIBZKPATH_RELATIONS_R1CS_HPP_
#define LIBZKPATH_RELATIONS_R1CS_HPP_

#include <cstddef>
#include <vector>

namespace libzkpath {

template<typename FieldT>
using r1cs_primary_input = std::vector<FieldT>;

template<typename FieldT>
using r1cs_auxiliary_input = std::vector<FieldT>;

template<typename FieldT>
class linear_term {
public:
    std::size_t index_;
    FieldT coeff_;

    linear_term(const std::size_t index, const FieldT &coeff);
};

template<typename FieldT>
class linear_combination {
public:
    std::vector<linear_term<FieldT>> terms_;

    linear_combination() = default;
    /* The constant c */
    linear_combination(const FieldT &c);

    static linear_combination<FieldT> variable(const std::size_t index);

    void add_term(const std::size_t index, const FieldT &coeff);

    linear_combination<FieldT> operator+(const linear_combination<FieldT> &other) const;
    linear_combination<FieldT> operator-(const linear_combination<FieldT> &other) const;
    linear_combination<FieldT> operator*(const FieldT &scalar) const;

    /* assignment holds variables 1 .. n, the constant is implicit */
    FieldT evaluate(const std::vector<FieldT> &assignment) const;
    bool is_valid(const std::size_t num_variables) const;
};

template<typename FieldT>
class r1cs_constraint {
public:
    linear_combination<FieldT> a_, b_, c_;

    r1cs_constraint(const linear_combination<FieldT> &a,
                    const linear_combination<FieldT> &b,
                    const linear_combination<FieldT> &c);
};

template<typename FieldT>
class r1cs_constraint_system {
public:
    std::size_t primary_input_size_;
    std::size_t auxiliary_input_size_;

    std::vector<r1cs_constraint<FieldT>> constraints_;

    r1cs_constraint_system();

    std::size_t num_inputs() const;
    std::size_t num_variables() const;
    std::size_t num_constraints() const;

    bool is_valid() const;

    void add_constraint(const r1cs_constraint<FieldT> &c);

    /* Throws if the input sizes do not match the system. */
    bool is_satisfied(const r1cs_primary_input<FieldT> &primary_input,
                      const r1cs_auxiliary_input<FieldT> &auxiliary_input) const;
};

} // namespace libzkpath

#include "libzkpath/relations/r1cs.tcc"

#endif // LIBZKPATH_RELATIONS_R1CS_HPP_
