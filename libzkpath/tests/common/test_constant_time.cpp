#include <cstdint>
#include <gtest/gtest.h>
#include <string>

#include <libff/algebra/curves/alt_bn128/alt_bn128_pp.hpp>
#include "libzkpath/common/constant_time.hpp"
#include "libzkpath/hashing/hashing.hpp"

namespace libzkpath {

TEST(ConstantTimeTest, WordMask) {
    EXPECT_EQ(ct_word_mask(true), 0xFFFFFFFFu);
    EXPECT_EQ(ct_word_mask(false), 0u);
}

TEST(ConstantTimeTest, SelectWordDigest) {
    word_hash_digest a, b;
    for (std::size_t i = 0; i < word_digest_num_words; ++i)
    {
        a[i] = 0x01010101u * (i + 1);
        b[i] = 0xF0F0F0F0u ^ i;
    }

    EXPECT_EQ(ct_select(true, a, b), a);
    EXPECT_EQ(ct_select(false, a, b), b);
    EXPECT_EQ(ct_select(true, a, a), a);
}

TEST(ConstantTimeTest, SelectBinaryDigest) {
    const binary_hash_digest a("\x00\x11\x22\x33\xff", 5);
    const binary_hash_digest b("\xaa\xbb\xcc\xdd\x00", 5);

    EXPECT_EQ(ct_select(true, a, b), a);
    EXPECT_EQ(ct_select(false, a, b), b);

    const binary_hash_digest shorter("\xaa\xbb", 2);
    EXPECT_THROW(ct_select(true, a, shorter), std::invalid_argument);
}

TEST(ConstantTimeTest, EqualBinaryDigest) {
    const binary_hash_digest a("\x00\x11\x22\x33", 4);
    binary_hash_digest b = a;
    EXPECT_TRUE(ct_equal(a, b));

    /* difference in the first and in the last byte */
    b[0] ^= 0x01;
    EXPECT_FALSE(ct_equal(a, b));
    b = a;
    b[3] ^= 0x80;
    EXPECT_FALSE(ct_equal(a, b));

    EXPECT_FALSE(ct_equal(a, a.substr(0, 3)));
}

TEST(ConstantTimeTest, EqualWordDigest) {
    word_hash_digest a;
    a.fill(0x12345678u);
    word_hash_digest b = a;
    EXPECT_TRUE(ct_equal(a, b));

    b[word_digest_num_words - 1] ^= 1;
    EXPECT_FALSE(ct_equal(a, b));
}

TEST(ConstantTimeTest, FieldSelectAndEqual) {
    libff::alt_bn128_pp::init_public_params();
    typedef libff::alt_bn128_Fr FieldT;

    const FieldT a = FieldT::random_element();
    const FieldT b = a + FieldT::one();

    EXPECT_TRUE(ct_select<FieldT>(true, a, b) == a);
    EXPECT_TRUE(ct_select<FieldT>(false, a, b) == b);

    EXPECT_TRUE(ct_equal<FieldT>(a, a));
    EXPECT_TRUE(ct_equal<FieldT>(a, (a + b) - b));
    EXPECT_FALSE(ct_equal<FieldT>(a, b));
}

TEST(ConstantTimeTest, FieldSelectKeepsValidElements) {
    libff::alt_bn128_pp::init_public_params();
    typedef libff::alt_bn128_Fr FieldT;

    const FieldT zero = FieldT::zero();
    const FieldT minus_one = -FieldT::one();

    const FieldT picked_minus_one = ct_select<FieldT>(true, minus_one, zero);
    const FieldT picked_zero = ct_select<FieldT>(false, minus_one, zero);
    EXPECT_TRUE(picked_minus_one == minus_one);
    EXPECT_TRUE(picked_zero == zero);
    EXPECT_TRUE(picked_minus_one + FieldT::one() == zero);
    EXPECT_TRUE(picked_minus_one * picked_minus_one == FieldT::one());

    for (std::size_t i = 0; i < 20; ++i)
    {
        const FieldT x = FieldT::random_element();
        const FieldT y = FieldT::random_element();
        EXPECT_TRUE(ct_select<FieldT>(true, x, y) * y == x * y);
        EXPECT_TRUE(ct_select<FieldT>(false, x, y) + x == x + y);
        EXPECT_TRUE(ct_equal<FieldT>(ct_select<FieldT>(false, x, y), y));
    }
}

}
