#include <sodium/crypto_generichash_blake2b.h>
#include <libff/algebra/field_utils/bigint.hpp>
#include <cstdint>
#include <cstring>
#include <stdexcept>

namespace libzkpath {

template<typename FieldT>
std::vector<FieldT> blake2b_FieldT_from_seed(const std::string &seed,
                                             const std::size_t num_elements)
{
    typedef libff::bigint<FieldT::num_limbs> bigint_t;

    const std::size_t bits_per_limb = 8 * sizeof(mp_limb_t);
    const std::size_t counter_len = sizeof(std::uint64_t);
    /* seed || counter, the counter is rewritten for every attempt */
    std::vector<unsigned char> input(seed.size() + counter_len);
    std::memcpy(input.data(), seed.data(), seed.size());

    std::vector<FieldT> result;
    result.reserve(num_elements);

    std::uint64_t counter = 0;
    while (result.size() < num_elements)
    {
        /* little-endian, independent of the host */
        for (std::size_t k = 0; k < counter_len; ++k)
        {
            input[seed.size() + k] = (unsigned char) (counter >> (8 * k));
        }
        ++counter;

        unsigned char digest[sizeof(mp_limb_t) * FieldT::num_limbs];
        const int status = crypto_generichash_blake2b(digest,
                                                      sizeof(digest),
                                                      input.data(),
                                                      input.size(),
                                                      NULL, 0);
        if (status != 0)
        {
            throw std::runtime_error("Got non-zero status from crypto_generichash_blake2b.");
        }

        /* the digest is read as a little-endian integer */
        bigint_t candidate;
        for (mp_size_t i = 0; i < FieldT::num_limbs; ++i)
        {
            mp_limb_t limb = 0;
            for (std::size_t k = 0; k < sizeof(mp_limb_t); ++k)
            {
                limb |= ((mp_limb_t) digest[i * sizeof(mp_limb_t) + k]) << (8 * k);
            }
            candidate.data[i] = limb;
        }

        /* clear all bits higher than MSB of modulus */
        std::size_t bitno = sizeof(candidate.data) * 8 - 1;
        while (FieldT::mod.test_bit(bitno) == false)
        {
            const std::size_t part = bitno / bits_per_limb;
            const std::size_t bit = bitno - (bits_per_limb * part);

            candidate.data[part] &= ~(((mp_limb_t) 1) << bit);
            bitno--;
        }

        /* rejection sampling */
        if (mpn_cmp(candidate.data, FieldT::mod.data, FieldT::num_limbs) < 0)
        {
            result.emplace_back(FieldT(candidate));
        }
    }

    return result;
}

} // namespace libzkpath
