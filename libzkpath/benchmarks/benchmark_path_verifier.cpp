#include <vector>
#include <benchmark/benchmark.h>

#include <libff/algebra/curves/alt_bn128/alt_bn128_pp.hpp>

#include "libzkpath/common/utils.hpp"
#include "libzkpath/hashing/blake2b.hpp"
#include "libzkpath/hashing/mimc.hpp"
#include "libzkpath/hashing/sha256.hpp"
#include "libzkpath/merkle/path_verifier.hpp"

namespace libzkpath {

template<typename hash_type>
void run_verify_benchmark(benchmark::State &state,
                          const two_to_one_hash_function<hash_type> &node_hasher,
                          const std::size_t digest_len_bytes)
{
    const std::size_t depth = state.range(0);

    const merkle_path_verifier<hash_type> verifier(depth, node_hasher, digest_len_bytes);
    const hash_type leaf = random_digest<hash_type>(digest_len_bytes);
    const merkle_authentication_path<hash_type> path(
        random_direction_bits(depth),
        random_digest_vector<hash_type>(depth, digest_len_bytes));
    const hash_type root = verifier.compute_root(leaf, path);

    for (auto _ : state)
    {
        benchmark::DoNotOptimize(verifier.verify(root, leaf, path));
    }

    state.SetItemsProcessed(state.iterations() * depth);
}

static void BM_verify_sha256(benchmark::State &state)
{
    run_verify_benchmark<word_hash_digest>(state, sha256_two_to_one_hash, sha256_digest_len_bytes);
}

BENCHMARK(BM_verify_sha256)->RangeMultiplier(2)->Range(2, 64)->Unit(benchmark::kMicrosecond);

static void BM_verify_blake2b(benchmark::State &state)
{
    run_verify_benchmark<binary_hash_digest>(state, blake2b_two_to_one_hash, 32);
}

BENCHMARK(BM_verify_blake2b)->RangeMultiplier(2)->Range(2, 64)->Unit(benchmark::kMicrosecond);

static void BM_verify_mimc(benchmark::State &state)
{
    libff::alt_bn128_pp::init_public_params();
    typedef libff::alt_bn128_Fr FieldT;

    run_verify_benchmark<FieldT>(state,
                                 make_mimc_two_to_one_hash<FieldT>(default_mimc_params<FieldT>()),
                                 get_hash_size<FieldT>(FieldT::zero()));
}

BENCHMARK(BM_verify_mimc)->RangeMultiplier(2)->Range(2, 32)->Unit(benchmark::kMicrosecond);

}

BENCHMARK_MAIN();
