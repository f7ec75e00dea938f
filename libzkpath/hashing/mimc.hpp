/**@file
 *****************************************************************************
 MiMC based two-to-one hash over a prime field.

 The compression is Miyaguchi-Preneel over the MiMC-5 permutation, keyed by
 the left child:

     x_0     = right
     x_{j+1} = (x_j + left + c_j)^5        for j = 0 .. num_rounds-1
     h       = x_{num_rounds} + left + right

 Every round costs three multiplications, which is what makes the hash
 cheap to express as rank-1 constraints (see
 libzkpath/merkle/path_verifier_constraints.hpp).

 The exponent 5 must be coprime to (p - 1); this holds for the alt_bn128
 scalar field the library is instantiated with.
 *****************************************************************************
 * @author     This file is part of libzkpath (see AUTHORS)
 * @copyright  MIT license (see LICENSE file)
 *****************************************************************************/
#ifndef LIBZKPATH_HASHING_MIMC_HPP_
#define LIBZKPATH_HASHING_MIMC_HPP_

#include <cstddef>
#include <memory>
#include <vector>

#include "libzkpath/hashing/hashing.hpp"

namespace libzkpath {

template<typename FieldT>
class mimc_params {
public:
    std::size_t num_rounds_;
    std::vector<FieldT> round_constants_;

    mimc_params(const std::size_t num_rounds,
                const std::vector<FieldT> &round_constants);

    void print() const;
};

/* ceil(log_2(|F|) / log_2(5)) */
template<typename FieldT>
std::size_t default_mimc_num_rounds();

/** Round constants are derived from a fixed domain separator with BLAKE2b.
 *  The first constant is zero. */
template<typename FieldT>
mimc_params<FieldT> default_mimc_params(const std::size_t num_rounds = default_mimc_num_rounds<FieldT>());

template<typename FieldT>
class mimc_two_to_one_hash {
protected:
    mimc_params<FieldT> params_;
public:
    static const std::size_t alpha = 5;

    explicit mimc_two_to_one_hash(const mimc_params<FieldT> &params);

    FieldT hash(const FieldT &left, const FieldT &right) const;
    /* The S-box alone, (x + key + c_round)^5 */
    FieldT round(const FieldT &x, const FieldT &key, const std::size_t round_index) const;

    const mimc_params<FieldT>& params() const;
};

/* Binds a hasher into the signature the verifier consumes. */
template<typename FieldT>
two_to_one_hash_function<FieldT> make_mimc_two_to_one_hash(const mimc_params<FieldT> &params);

} // namespace libzkpath

#include "libzkpath/hashing/mimc.tcc"

#endif // LIBZKPATH_HASHING_MIMC_HPP_
