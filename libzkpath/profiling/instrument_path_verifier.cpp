#include <cstdint>
#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <string>

#include <boost/program_options.hpp>
#include <sodium/core.h>

#include <libff/algebra/curves/alt_bn128/alt_bn128_pp.hpp>
#include <libff/common/profiling.hpp>

#include "libzkpath/common/utils.hpp"
#include "libzkpath/hashing/hash_enum.hpp"
#include "libzkpath/merkle/authentication_path.hpp"
#include "libzkpath/merkle/path_verifier.hpp"
#include "libzkpath/merkle/path_verifier_constraints.hpp"

namespace po = boost::program_options;
using namespace libzkpath;

struct options {
    std::size_t tree_depth_min = 3;
    std::size_t tree_depth_max = 32;
    std::size_t hash_enum_val = (std::size_t) sha256_type;
    std::size_t digest_len_bytes = 32;
    std::size_t num_iterations = 100;
    /* bit i set: the level i sibling is a primary input */
    std::size_t public_siblings = 0;
    bool with_constraints = true;
};

po::options_description gen_options(options &options)
{
    po::options_description base("Usage");

    base.add_options()
        ("help", "print this help message")
        ("tree_depth_min", po::value<std::size_t>(&options.tree_depth_min)->default_value(options.tree_depth_min))
        ("tree_depth_max", po::value<std::size_t>(&options.tree_depth_max)->default_value(options.tree_depth_max))
        ("hash_enum", po::value<std::size_t>(&options.hash_enum_val)->default_value(options.hash_enum_val),
         "1 = blake2b, 2 = sha256, 3 = mimc")
        ("digest_len_bytes", po::value<std::size_t>(&options.digest_len_bytes)->default_value(options.digest_len_bytes),
         "Only used by blake2b")
        ("num_iterations", po::value<std::size_t>(&options.num_iterations)->default_value(options.num_iterations))
        ("public_siblings", po::value<std::size_t>(&options.public_siblings)->default_value(options.public_siblings),
         "Bit mask of levels whose sibling is a public input (mimc only)")
        ("with_constraints", po::value<bool>(&options.with_constraints)->default_value(options.with_constraints),
         "Also build the R1CS verifier (mimc only)");

    return base;
}

bool process_command_line(const int argc, const char** argv, options &options)
{
    try
    {
        po::options_description desc = gen_options(options);

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);

        if (vm.count("help"))
        {
            std::cout << desc << "\n";
            return false;
        }

        po::notify(vm);

        if (options.tree_depth_min == 0 || options.tree_depth_min > options.tree_depth_max)
        {
            throw std::invalid_argument("Need 1 <= tree_depth_min <= tree_depth_max.");
        }
        const path_hash_type hash_enum = path_hash_type_from_size_t(options.hash_enum_val);
        if (hash_enum == blake2b_type)
        {
            get_digest_len_bytes<libff::alt_bn128_Fr>(hash_enum, options.digest_len_bytes);
        }
    }
    catch(std::exception& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return false;
    }

    return true;
}

template<typename hash_type, typename FieldT>
void instrument_path_verifier(const options &options, const path_hash_type hash_enum)
{
    const std::size_t digest_len_bytes = get_digest_len_bytes<FieldT>(hash_enum, options.digest_len_bytes);
    const two_to_one_hash_function<hash_type> node_hasher = get_two_to_one_hash<hash_type, FieldT>(hash_enum);

    for (std::size_t depth = options.tree_depth_min; depth <= options.tree_depth_max; ++depth)
    {
        libff::print_separator();
        const merkle_path_verifier<hash_type> verifier(depth, node_hasher, digest_len_bytes);

        const hash_type leaf = random_digest<hash_type>(digest_len_bytes);
        const merkle_authentication_path<hash_type> path(
            random_direction_bits(depth),
            random_digest_vector<hash_type>(depth, digest_len_bytes));
        const hash_type root = verifier.compute_root(leaf, path);

        libff::enter_block("Verify authentication paths");
        std::size_t num_accepted = 0;
        for (std::size_t i = 0; i < options.num_iterations; ++i)
        {
            num_accepted += verifier.verify(root, leaf, path) ? 1 : 0;
        }
        libff::leave_block("Verify authentication paths");

        const hash_type other_root = random_digest<hash_type>(digest_len_bytes);
        const bool other_root_rejected = !verifier.verify(other_root, leaf, path);

        libff::print_indent(); printf("* Tree depth: %zu\n", depth);
        libff::print_indent(); printf("* Authentication path size in bytes: %zu\n", path.size_in_bytes());
        libff::print_indent(); printf("* Two-to-one hashes per verification: %zu\n", verifier.count_hashes_to_verify());
        libff::print_indent(); printf("* Accepted: %zu / %zu\n", num_accepted, options.num_iterations);
        libff::print_indent(); printf("* Unrelated root rejected: %s\n", other_root_rejected ? "true" : "false");
    }
}

template<typename FieldT>
void instrument_path_verifier_constraints(const options &options)
{
    const mimc_params<FieldT> params = default_mimc_params<FieldT>();
    params.print();
    const two_to_one_hash_function<FieldT> node_hasher = make_mimc_two_to_one_hash<FieldT>(params);
    const std::size_t digest_len_bytes = get_hash_size<FieldT>(FieldT::zero());

    for (std::size_t depth = options.tree_depth_min; depth <= options.tree_depth_max; ++depth)
    {
        libff::print_separator();
        std::vector<bool> sibling_is_public(depth, false);
        for (std::size_t i = 0; i < depth && i < 8 * sizeof(std::size_t); ++i)
        {
            sibling_is_public[i] = ((options.public_siblings >> i) & 1) != 0;
        }

        const merkle_path_verifier<FieldT> verifier(depth, node_hasher, digest_len_bytes);
        const FieldT leaf = FieldT::random_element();
        const merkle_authentication_path<FieldT> path(
            random_direction_bits(depth),
            random_digest_vector<FieldT>(depth, digest_len_bytes));
        const FieldT root = verifier.compute_root(leaf, path);

        merkle_path_verifier_constraints<FieldT> constraints(depth, params, sibling_is_public);
        constraints.generate_r1cs_constraints();
        constraints.generate_r1cs_witness(root, leaf, path);

        libff::print_indent(); printf("* Tree depth: %zu\n", depth);
        libff::print_indent(); printf("* Number of constraints: %zu\n", constraints.num_constraints());
        libff::print_indent(); printf("* Number of primary inputs: %zu\n", constraints.num_primary_inputs());
        libff::print_indent(); printf("* Number of variables: %zu\n", constraints.num_variables());
        libff::print_indent(); printf("* Constraint system satisfied: %s\n", constraints.is_satisfied() ? "true" : "false");
    }
}

int main(int argc, const char * argv[])
{
    options default_vals;

    if (!process_command_line(argc, argv, default_vals))
    {
        return 1;
    }

    if (sodium_init() < 0)
    {
        std::cerr << "Error: could not initialize libsodium\n";
        return 1;
    }

    libff::start_profiling();
    libff::alt_bn128_pp::init_public_params();
    typedef libff::alt_bn128_Fr FieldT;

    const path_hash_type hash_enum = path_hash_type_from_size_t(default_vals.hash_enum_val);

    printf("Selected parameters:\n");
    printf("* tree_depth_min = %zu\n", default_vals.tree_depth_min);
    printf("* tree_depth_max = %zu\n", default_vals.tree_depth_max);
    printf("* hash = %s\n", path_hash_type_names[hash_enum]);
    printf("* num_iterations = %zu\n", default_vals.num_iterations);

    switch (hash_enum)
    {
        case blake2b_type:
            instrument_path_verifier<binary_hash_digest, FieldT>(default_vals, hash_enum);
            break;
        case sha256_type:
            instrument_path_verifier<word_hash_digest, FieldT>(default_vals, hash_enum);
            break;
        case mimc_type:
            instrument_path_verifier<FieldT, FieldT>(default_vals, hash_enum);
            if (default_vals.with_constraints)
            {
                instrument_path_verifier_constraints<FieldT>(default_vals);
            }
            break;
        default:
            throw std::invalid_argument("Hash type not supported.");
    }

    return 0;
}
