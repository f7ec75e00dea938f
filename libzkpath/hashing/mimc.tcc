#include <cmath>
#include <cstdio>
#include <stdexcept>

#include <libff/common/profiling.hpp>
#include "libzkpath/hashing/blake2b.hpp"

namespace libzkpath {

template<typename FieldT>
mimc_params<FieldT>::mimc_params(
    const std::size_t num_rounds,
    const std::vector<FieldT> &round_constants) :
    num_rounds_(num_rounds),
    round_constants_(round_constants)
{
    if (num_rounds == 0)
    {
        throw std::invalid_argument("MiMC needs at least one round.");
    }
    if (round_constants.size() != num_rounds)
    {
        throw std::invalid_argument("round_constants is of wrong dimension");
    }
}

template<typename FieldT>
void mimc_params<FieldT>::print() const
{
    libff::print_indent(); printf("\nMiMC parameters\n");
    libff::print_indent(); printf("* Alpha = %zu\n", mimc_two_to_one_hash<FieldT>::alpha);
    libff::print_indent(); printf("* Rounds = %zu\n", this->num_rounds_);
}

template<typename FieldT>
std::size_t default_mimc_num_rounds()
{
    const std::size_t log_field_size = libff::log_of_field_size_helper<FieldT>(FieldT::zero());
    return (std::size_t) std::ceil(((double) log_field_size) / std::log2(5.0));
}

template<typename FieldT>
mimc_params<FieldT> default_mimc_params(const std::size_t num_rounds)
{
    std::vector<FieldT> round_constants;
    round_constants.reserve(num_rounds);
    round_constants.emplace_back(FieldT::zero());

    if (num_rounds > 1)
    {
        const std::vector<FieldT> sampled =
            blake2b_FieldT_from_seed<FieldT>("libzkpath mimc round constants", num_rounds - 1);
        round_constants.insert(round_constants.end(), sampled.begin(), sampled.end());
    }

    return mimc_params<FieldT>(num_rounds, round_constants);
}

template<typename FieldT>
mimc_two_to_one_hash<FieldT>::mimc_two_to_one_hash(const mimc_params<FieldT> &params) :
    params_(params)
{
}

template<typename FieldT>
FieldT mimc_two_to_one_hash<FieldT>::round(
    const FieldT &x, const FieldT &key, const std::size_t round_index) const
{
    const FieldT u = x + key + this->params_.round_constants_[round_index];
    const FieldT u2 = u.squared();
    const FieldT u4 = u2.squared();
    return u4 * u;
}

template<typename FieldT>
FieldT mimc_two_to_one_hash<FieldT>::hash(const FieldT &left, const FieldT &right) const
{
    FieldT x = right;
    for (std::size_t j = 0; j < this->params_.num_rounds_; ++j)
    {
        x = this->round(x, left, j);
    }
    return x + left + right;
}

template<typename FieldT>
const mimc_params<FieldT>& mimc_two_to_one_hash<FieldT>::params() const
{
    return this->params_;
}

template<typename FieldT>
two_to_one_hash_function<FieldT> make_mimc_two_to_one_hash(const mimc_params<FieldT> &params)
{
    std::shared_ptr<mimc_two_to_one_hash<FieldT>> hash_class =
        std::make_shared<mimc_two_to_one_hash<FieldT>>(params);
    return [hash_class](const FieldT &left, const FieldT &right, const std::size_t unused) -> FieldT
    {
        return hash_class->hash(left, right);
    };
}

} // namespace libzkpath
