#include <sodium/crypto_generichash_blake2b.h>
#include <sodium/utils.h>
#include <stdexcept>

#include "libzkpath/hashing/blake2b.hpp"

namespace libzkpath {

binary_hash_digest blake2b_two_to_one_hash(const binary_hash_digest &first,
                                           const binary_hash_digest &second,
                                           const std::size_t digest_len_bytes)
{
    const binary_hash_digest first_plus_second = first + second;

    binary_hash_digest result(digest_len_bytes, 'X');

    /* see https://download.libsodium.org/doc/hashing/generic_hashing.html */
    const int status = crypto_generichash_blake2b((unsigned char*)&result[0],
                                                  digest_len_bytes,
                                                  (const unsigned char*)first_plus_second.data(),
                                                  first_plus_second.size(),
                                                  NULL, 0);
    if (status != 0)
    {
        throw std::runtime_error("Got non-zero status from crypto_generichash_blake2b. (Is digest_len_bytes correct?)");
    }

    return result;
}

std::string binary_digest_to_hex(const binary_hash_digest &digest)
{
    std::string hex(2 * digest.size() + 1, '\0');
    sodium_bin2hex(&hex[0], hex.size(),
                   (const unsigned char*)digest.data(), digest.size());
    hex.resize(2 * digest.size());
    return hex;
}

} // namespace libzkpath
