#include <gtest/gtest.h>
#include <vector>

#include <libff/algebra/curves/alt_bn128/alt_bn128_pp.hpp>
#include <libff/common/profiling.hpp>
#include "libzkpath/common/utils.hpp"
#include "libzkpath/hashing/mimc.hpp"
#include "libzkpath/merkle/path_verifier.hpp"
#include "libzkpath/merkle/path_verifier_constraints.hpp"
#include "libzkpath/tests/merkle/reference_tree.hpp"

namespace libzkpath {

typedef libff::alt_bn128_Fr FieldT;

const std::size_t test_mimc_rounds = 5;

void init_test_field()
{
    libff::alt_bn128_pp::init_public_params();
    libff::inhibit_profiling_info = true;
}

TEST(PathVerifierConstraintsTest, SatisfiedForMembers) {
    init_test_field();
    const mimc_params<FieldT> params = default_mimc_params<FieldT>(test_mimc_rounds);
    const two_to_one_hash_function<FieldT> node_hasher = make_mimc_two_to_one_hash<FieldT>(params);

    const std::size_t depth = 3;
    const reference_tree<FieldT> tree(random_digest_vector<FieldT>(1ull << depth, 32), node_hasher, 32);

    for (std::size_t address = 0; address < (1ull << depth); ++address)
    {
        merkle_path_verifier_constraints<FieldT> constraints(depth, params, all_private_siblings(depth));
        constraints.generate_r1cs_constraints();
        constraints.generate_r1cs_witness(tree.root(), tree.leaf(address), tree.path(address));

        EXPECT_TRUE(constraints.constraint_system().is_valid());
        EXPECT_TRUE(constraints.is_satisfied());
        EXPECT_TRUE(constraints.primary_input()[0] == tree.root());
    }
}

TEST(PathVerifierConstraintsTest, AgreesWithNativeVerifier) {
    init_test_field();
    const mimc_params<FieldT> params = default_mimc_params<FieldT>();
    const two_to_one_hash_function<FieldT> node_hasher = make_mimc_two_to_one_hash<FieldT>(params);

    const std::size_t depth = 4;
    const merkle_path_verifier<FieldT> verifier(depth, node_hasher, 32);
    const FieldT leaf = FieldT::random_element();
    const merkle_authentication_path<FieldT> path(random_direction_bits(depth),
                                                  random_digest_vector<FieldT>(depth, 32));
    const FieldT root = verifier.compute_root(leaf, path);

    merkle_path_verifier_constraints<FieldT> constraints(depth, params, all_private_siblings(depth));
    constraints.generate_r1cs_constraints();
    constraints.generate_r1cs_witness(root, leaf, path);
    EXPECT_TRUE(constraints.is_satisfied());

    constraints.generate_r1cs_witness(root + FieldT::one(), leaf, path);
    EXPECT_FALSE(constraints.is_satisfied());
}

TEST(PathVerifierConstraintsTest, UnsatisfiedForNonMembers) {
    init_test_field();
    const mimc_params<FieldT> params = default_mimc_params<FieldT>(test_mimc_rounds);
    const two_to_one_hash_function<FieldT> node_hasher = make_mimc_two_to_one_hash<FieldT>(params);

    const std::size_t depth = 3;
    const reference_tree<FieldT> tree(random_digest_vector<FieldT>(1ull << depth, 32), node_hasher, 32);
    const std::size_t address = 5;
    const merkle_authentication_path<FieldT> path = tree.path(address);

    merkle_path_verifier_constraints<FieldT> constraints(depth, params, all_private_siblings(depth));
    constraints.generate_r1cs_constraints();

    constraints.generate_r1cs_witness(tree.root(), tree.leaf(address ^ 1), path);
    EXPECT_FALSE(constraints.is_satisfied());

    for (std::size_t level = 0; level < depth; ++level)
    {
        std::vector<bool> flipped_bits = path.direction_bits();
        flipped_bits[level] = !flipped_bits[level];
        constraints.generate_r1cs_witness(tree.root(), tree.leaf(address),
                                          merkle_authentication_path<FieldT>(flipped_bits, path.sibling_hashes()));
        EXPECT_FALSE(constraints.is_satisfied());
    }
}

TEST(PathVerifierConstraintsTest, DirectionBitsMustBeBoolean) {
    init_test_field();
    const mimc_params<FieldT> params = default_mimc_params<FieldT>(test_mimc_rounds);
    const two_to_one_hash_function<FieldT> node_hasher = make_mimc_two_to_one_hash<FieldT>(params);

    const std::size_t depth = 2;
    const reference_tree<FieldT> tree(random_digest_vector<FieldT>(4, 32), node_hasher, 32);

    merkle_path_verifier_constraints<FieldT> constraints(depth, params, all_private_siblings(depth));
    constraints.generate_r1cs_constraints();
    constraints.generate_r1cs_witness(tree.root(), tree.leaf(2), tree.path(2));

    const r1cs_primary_input<FieldT> primary_input = constraints.primary_input();
    r1cs_auxiliary_input<FieldT> auxiliary_input = constraints.auxiliary_input();
    ASSERT_TRUE(constraints.constraint_system().is_satisfied(primary_input, auxiliary_input));

    const std::size_t position = constraints.direction_bit_variable(0) - primary_input.size() - 1;
    auxiliary_input[position] = FieldT(2);
    EXPECT_FALSE(constraints.constraint_system().is_satisfied(primary_input, auxiliary_input));
}

TEST(PathVerifierConstraintsTest, PublicSiblings) {
    init_test_field();
    const mimc_params<FieldT> params = default_mimc_params<FieldT>(test_mimc_rounds);
    const two_to_one_hash_function<FieldT> node_hasher = make_mimc_two_to_one_hash<FieldT>(params);

    const std::size_t depth = 3;
    const reference_tree<FieldT> tree(random_digest_vector<FieldT>(8, 32), node_hasher, 32);
    const merkle_authentication_path<FieldT> path = tree.path(6);

    merkle_path_verifier_constraints<FieldT> all_private(depth, params, all_private_siblings(depth));
    merkle_path_verifier_constraints<FieldT> first_public(depth, params, {true, false, false});
    merkle_path_verifier_constraints<FieldT> all_public(depth, params, {true, true, true});

    EXPECT_EQ(all_private.num_primary_inputs(), 1);
    EXPECT_EQ(first_public.num_primary_inputs(), 2);
    EXPECT_EQ(all_public.num_primary_inputs(), 4);

    for (merkle_path_verifier_constraints<FieldT> *constraints : {&all_private, &first_public, &all_public})
    {
        constraints->generate_r1cs_constraints();
        constraints->generate_r1cs_witness(tree.root(), tree.leaf(6), path);
        EXPECT_TRUE(constraints->is_satisfied());
        /* visibility moves variables around without changing the relation */
        EXPECT_EQ(constraints->num_variables(), all_private.num_variables());
        EXPECT_EQ(constraints->num_constraints(), all_private.num_constraints());
    }

    const r1cs_primary_input<FieldT> primary_input = first_public.primary_input();
    ASSERT_EQ(primary_input.size(), 2);
    EXPECT_TRUE(primary_input[0] == tree.root());
    EXPECT_TRUE(primary_input[1] == path.sibling_hash(0));

    const r1cs_primary_input<FieldT> all_public_input = all_public.primary_input();
    for (std::size_t level = 0; level < depth; ++level)
    {
        EXPECT_TRUE(all_public_input[1 + level] == path.sibling_hash(level));
    }
}

TEST(PathVerifierConstraintsTest, ConstraintCount) {
    init_test_field();
    for (std::size_t num_rounds : {1, 5, 110})
    {
        const mimc_params<FieldT> params = default_mimc_params<FieldT>(num_rounds);
        for (std::size_t depth = 1; depth <= 4; ++depth)
        {
            merkle_path_verifier_constraints<FieldT> constraints(depth, params, all_private_siblings(depth));
            constraints.generate_r1cs_constraints();
            EXPECT_EQ(constraints.num_constraints(), depth * (3 * num_rounds + 3) + 1);
            /* root, leaf, bits, siblings, and per level left, round wires, output */
            EXPECT_EQ(constraints.num_variables(), 2 + depth * (3 * num_rounds + 4));
            EXPECT_EQ(constraints.depth(), depth);
        }
    }
}

TEST(PathVerifierConstraintsTest, UsageErrors) {
    init_test_field();
    const mimc_params<FieldT> params = default_mimc_params<FieldT>(test_mimc_rounds);

    EXPECT_THROW((merkle_path_verifier_constraints<FieldT>(0, params, {})), std::invalid_argument);
    EXPECT_THROW((merkle_path_verifier_constraints<FieldT>(3, params, all_private_siblings(2))),
                 std::invalid_argument);

    merkle_path_verifier_constraints<FieldT> constraints(2, params, all_private_siblings(2));
    EXPECT_THROW(constraints.is_satisfied(), std::logic_error);
    EXPECT_THROW(constraints.primary_input(), std::logic_error);
    EXPECT_THROW(constraints.auxiliary_input(), std::logic_error);

    constraints.generate_r1cs_constraints();
    EXPECT_THROW(constraints.generate_r1cs_constraints(), std::logic_error);
    EXPECT_THROW(constraints.is_satisfied(), std::logic_error);

    const merkle_authentication_path<FieldT> wrong_depth(random_direction_bits(3),
                                                         random_digest_vector<FieldT>(3, 32));
    EXPECT_THROW(constraints.generate_r1cs_witness(FieldT::zero(), FieldT::zero(), wrong_depth),
                 std::invalid_argument);
}

}
