#include <cstdio>
#include <stdexcept>

#include <libff/common/profiling.hpp>

namespace libzkpath {

template<typename FieldT>
linear_term<FieldT>::linear_term(const std::size_t index, const FieldT &coeff) :
    index_(index),
    coeff_(coeff)
{
}

template<typename FieldT>
linear_combination<FieldT>::linear_combination(const FieldT &c)
{
    this->add_term(0, c);
}

template<typename FieldT>
linear_combination<FieldT> linear_combination<FieldT>::variable(const std::size_t index)
{
    linear_combination<FieldT> result;
    result.add_term(index, FieldT::one());
    return result;
}

template<typename FieldT>
void linear_combination<FieldT>::add_term(const std::size_t index, const FieldT &coeff)
{
    this->terms_.emplace_back(linear_term<FieldT>(index, coeff));
}

template<typename FieldT>
linear_combination<FieldT> linear_combination<FieldT>::operator+(
    const linear_combination<FieldT> &other) const
{
    linear_combination<FieldT> result = *this;
    result.terms_.insert(result.terms_.end(), other.terms_.begin(), other.terms_.end());
    return result;
}

template<typename FieldT>
linear_combination<FieldT> linear_combination<FieldT>::operator*(const FieldT &scalar) const
{
    linear_combination<FieldT> result = *this;
    for (auto &term : result.terms_)
    {
        term.coeff_ *= scalar;
    }
    return result;
}

template<typename FieldT>
linear_combination<FieldT> linear_combination<FieldT>::operator-(
    const linear_combination<FieldT> &other) const
{
    return (*this) + (other * (-FieldT::one()));
}

template<typename FieldT>
FieldT linear_combination<FieldT>::evaluate(const std::vector<FieldT> &assignment) const
{
    FieldT acc = FieldT::zero();
    for (const auto &term : this->terms_)
    {
        acc += term.coeff_ * (term.index_ == 0 ? FieldT::one() : assignment[term.index_ - 1]);
    }
    return acc;
}

template<typename FieldT>
bool linear_combination<FieldT>::is_valid(const std::size_t num_variables) const
{
    for (const auto &term : this->terms_)
    {
        if (term.index_ > num_variables)
        {
            return false;
        }
    }
    return true;
}

template<typename FieldT>
r1cs_constraint<FieldT>::r1cs_constraint(const linear_combination<FieldT> &a,
                                         const linear_combination<FieldT> &b,
                                         const linear_combination<FieldT> &c) :
    a_(a),
    b_(b),
    c_(c)
{
}

template<typename FieldT>
r1cs_constraint_system<FieldT>::r1cs_constraint_system() :
    primary_input_size_(0),
    auxiliary_input_size_(0)
{
}

template<typename FieldT>
std::size_t r1cs_constraint_system<FieldT>::num_inputs() const
{
    return this->primary_input_size_;
}

template<typename FieldT>
std::size_t r1cs_constraint_system<FieldT>::num_variables() const
{
    return this->primary_input_size_ + this->auxiliary_input_size_;
}

template<typename FieldT>
std::size_t r1cs_constraint_system<FieldT>::num_constraints() const
{
    return this->constraints_.size();
}

template<typename FieldT>
bool r1cs_constraint_system<FieldT>::is_valid() const
{
    const std::size_t n = this->num_variables();
    for (const auto &constraint : this->constraints_)
    {
        if (!(constraint.a_.is_valid(n) &&
              constraint.b_.is_valid(n) &&
              constraint.c_.is_valid(n)))
        {
            return false;
        }
    }
    return true;
}

template<typename FieldT>
void r1cs_constraint_system<FieldT>::add_constraint(const r1cs_constraint<FieldT> &c)
{
    this->constraints_.emplace_back(c);
}

template<typename FieldT>
bool r1cs_constraint_system<FieldT>::is_satisfied(
    const r1cs_primary_input<FieldT> &primary_input,
    const r1cs_auxiliary_input<FieldT> &auxiliary_input) const
{
    if (primary_input.size() != this->primary_input_size_)
    {
        throw std::invalid_argument("Primary input has the wrong size.");
    }
    if (auxiliary_input.size() != this->auxiliary_input_size_)
    {
        throw std::invalid_argument("Auxiliary input has the wrong size.");
    }

    std::vector<FieldT> full_variable_assignment = primary_input;
    full_variable_assignment.insert(full_variable_assignment.end(),
                                    auxiliary_input.begin(), auxiliary_input.end());

    for (std::size_t i = 0; i < this->constraints_.size(); ++i)
    {
        const FieldT ares = this->constraints_[i].a_.evaluate(full_variable_assignment);
        const FieldT bres = this->constraints_[i].b_.evaluate(full_variable_assignment);
        const FieldT cres = this->constraints_[i].c_.evaluate(full_variable_assignment);

        if (!(ares * bres == cres))
        {
#ifdef DEBUG
            libff::print_indent(); printf("Constraint %zu is not satisfied\n", i);
#endif
            return false;
        }
    }

    return true;
}

} // namespace libzkpath
