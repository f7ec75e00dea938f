#include <stdexcept>
#include <string>
#include <type_traits>

#include <sodium/crypto_generichash_blake2b.h>

namespace libzkpath {

/* binary hash digest 2->1 hash */
template<typename hash_type, typename FieldT>
two_to_one_hash_function<hash_type> get_two_to_one_hash_internal(
    const typename libff::enable_if<std::is_same<hash_type, binary_hash_digest>::value, FieldT>::type _,
    const path_hash_type hash_enum)
{
    if (hash_enum == blake2b_type)
    {
        return blake2b_two_to_one_hash;
    }
    throw std::invalid_argument("path_hash_type unknown (binary two to one hash)");
}

/* word digest 2->1 hash */
template<typename hash_type, typename FieldT>
two_to_one_hash_function<hash_type> get_two_to_one_hash_internal(
    const typename libff::enable_if<std::is_same<hash_type, word_hash_digest>::value, FieldT>::type _,
    const path_hash_type hash_enum)
{
    if (hash_enum == sha256_type)
    {
        return sha256_two_to_one_hash;
    }
    throw std::invalid_argument("path_hash_type unknown (word two to one hash)");
}

/* algebraic 2->1 hash */
template<typename hash_type, typename FieldT>
two_to_one_hash_function<hash_type> get_two_to_one_hash_internal(
    const typename libff::enable_if<std::is_same<hash_type, FieldT>::value, FieldT>::type _,
    const path_hash_type hash_enum)
{
    if (hash_enum == mimc_type)
    {
        return make_mimc_two_to_one_hash<FieldT>(default_mimc_params<FieldT>());
    }
    throw std::invalid_argument("path_hash_type unknown (algebraic two to one hash)");
}

template<typename hash_type, typename FieldT>
two_to_one_hash_function<hash_type> get_two_to_one_hash(const path_hash_type hash_enum)
{
    return get_two_to_one_hash_internal<hash_type, FieldT>(FieldT::zero(), hash_enum);
}

template<typename FieldT>
std::size_t get_digest_len_bytes(const path_hash_type hash_enum,
                                 const std::size_t requested_len_bytes)
{
    switch (hash_enum)
    {
    case blake2b_type:
        if (requested_len_bytes == 0 || requested_len_bytes > crypto_generichash_blake2b_BYTES_MAX)
        {
            throw std::invalid_argument("BLAKE2b digest length must be between 1 and " +
                                        std::to_string(crypto_generichash_blake2b_BYTES_MAX) + " bytes.");
        }
        return requested_len_bytes;
    case sha256_type:
        return sha256_digest_len_bytes;
    case mimc_type:
        return get_hash_size<FieldT>(FieldT::zero());
    default:
        throw std::invalid_argument("path_hash_type unknown");
    }
}

} // namespace libzkpath
