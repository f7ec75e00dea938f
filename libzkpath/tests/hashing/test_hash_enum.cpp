#include <gtest/gtest.h>

#include <libff/algebra/curves/alt_bn128/alt_bn128_pp.hpp>
#include "libzkpath/hashing/hash_enum.hpp"

namespace libzkpath {

TEST(HashEnumTest, FromSizeT) {
    EXPECT_EQ(path_hash_type_from_size_t(1), blake2b_type);
    EXPECT_EQ(path_hash_type_from_size_t(2), sha256_type);
    EXPECT_EQ(path_hash_type_from_size_t(3), mimc_type);
    EXPECT_THROW(path_hash_type_from_size_t(0), std::invalid_argument);
    EXPECT_THROW(path_hash_type_from_size_t(4), std::invalid_argument);
}

TEST(HashEnumTest, HashFactory) {
    libff::alt_bn128_pp::init_public_params();
    typedef libff::alt_bn128_Fr FieldT;

    const two_to_one_hash_function<binary_hash_digest> blake2b =
        get_two_to_one_hash<binary_hash_digest, FieldT>(blake2b_type);
    const binary_hash_digest a(32, 'a');
    EXPECT_EQ(blake2b(a, a, 32), blake2b_two_to_one_hash(a, a, 32));
    EXPECT_THROW((get_two_to_one_hash<binary_hash_digest, FieldT>(sha256_type)), std::invalid_argument);

    const two_to_one_hash_function<word_hash_digest> sha256 =
        get_two_to_one_hash<word_hash_digest, FieldT>(sha256_type);
    word_hash_digest w;
    w.fill(7);
    EXPECT_EQ(sha256(w, w, 32), sha256_two_to_one_hash(w, w, 32));
    EXPECT_THROW((get_two_to_one_hash<word_hash_digest, FieldT>(mimc_type)), std::invalid_argument);

    const two_to_one_hash_function<FieldT> mimc =
        get_two_to_one_hash<FieldT, FieldT>(mimc_type);
    const mimc_two_to_one_hash<FieldT> hasher(default_mimc_params<FieldT>());
    const FieldT x = FieldT::random_element();
    EXPECT_TRUE(mimc(x, x, 32) == hasher.hash(x, x));
    EXPECT_THROW((get_two_to_one_hash<FieldT, FieldT>(blake2b_type)), std::invalid_argument);
}

TEST(HashEnumTest, DigestLengths) {
    libff::alt_bn128_pp::init_public_params();
    typedef libff::alt_bn128_Fr FieldT;

    EXPECT_EQ(get_digest_len_bytes<FieldT>(blake2b_type, 48), 48);
    EXPECT_EQ(get_digest_len_bytes<FieldT>(sha256_type, 48), 32);
    EXPECT_EQ(get_digest_len_bytes<FieldT>(mimc_type, 48), 32);
}

TEST(HashEnumTest, Blake2bDigestLengthBounds) {
    libff::alt_bn128_pp::init_public_params();
    typedef libff::alt_bn128_Fr FieldT;

    EXPECT_EQ(get_digest_len_bytes<FieldT>(blake2b_type, 1), 1);
    EXPECT_EQ(get_digest_len_bytes<FieldT>(blake2b_type, 64), 64);
    EXPECT_THROW(get_digest_len_bytes<FieldT>(blake2b_type, 0), std::invalid_argument);
    EXPECT_THROW(get_digest_len_bytes<FieldT>(blake2b_type, 65), std::invalid_argument);

    /* fixed width hashes ignore the requested length */
    EXPECT_EQ(get_digest_len_bytes<FieldT>(sha256_type, 0), 32);
    EXPECT_EQ(get_digest_len_bytes<FieldT>(mimc_type, 65), 32);
}

}
