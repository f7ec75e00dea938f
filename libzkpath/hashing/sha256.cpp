#include <sodium/crypto_hash_sha256.h>
#include <sodium/utils.h>
#include <stdexcept>

#include "libzkpath/hashing/sha256.hpp"

namespace libzkpath {

namespace {

void store_words_be(const word_hash_digest &digest, unsigned char *out)
{
    for (std::size_t i = 0; i < word_digest_num_words; ++i)
    {
        out[4*i]     = (unsigned char)(digest[i] >> 24);
        out[4*i + 1] = (unsigned char)(digest[i] >> 16);
        out[4*i + 2] = (unsigned char)(digest[i] >> 8);
        out[4*i + 3] = (unsigned char)(digest[i]);
    }
}

word_hash_digest load_words_be(const unsigned char *in)
{
    word_hash_digest digest;
    for (std::size_t i = 0; i < word_digest_num_words; ++i)
    {
        digest[i] = ((std::uint32_t)in[4*i] << 24) |
                    ((std::uint32_t)in[4*i + 1] << 16) |
                    ((std::uint32_t)in[4*i + 2] << 8) |
                    ((std::uint32_t)in[4*i + 3]);
    }
    return digest;
}

} // namespace

word_hash_digest sha256_two_to_one_hash(const word_hash_digest &first,
                                        const word_hash_digest &second,
                                        const std::size_t digest_len_bytes)
{
    if (digest_len_bytes != sha256_digest_len_bytes)
    {
        throw std::invalid_argument("SHA-256 digests are 32 bytes long.");
    }

    unsigned char block[2 * sha256_digest_len_bytes];
    store_words_be(first, block);
    store_words_be(second, block + sha256_digest_len_bytes);

    unsigned char out[crypto_hash_sha256_BYTES];
    const int status = crypto_hash_sha256(out, block, sizeof(block));
    if (status != 0)
    {
        throw std::runtime_error("Got non-zero status from crypto_hash_sha256.");
    }

    return load_words_be(out);
}

word_hash_digest word_digest_from_hex(const std::string &hex)
{
    if (hex.size() != 2 * sha256_digest_len_bytes)
    {
        throw std::invalid_argument("Word digests are encoded as 64 hex characters.");
    }

    unsigned char bytes[sha256_digest_len_bytes];
    std::size_t bin_len = 0;
    const int status = sodium_hex2bin(bytes, sizeof(bytes),
                                      hex.data(), hex.size(),
                                      NULL, &bin_len, NULL);
    if (status != 0 || bin_len != sizeof(bytes))
    {
        throw std::invalid_argument("Malformed hex digest.");
    }

    return load_words_be(bytes);
}

std::string word_digest_to_hex(const word_hash_digest &digest)
{
    unsigned char bytes[sha256_digest_len_bytes];
    store_words_be(digest, bytes);

    char hex[2 * sha256_digest_len_bytes + 1];
    sodium_bin2hex(hex, sizeof(hex), bytes, sizeof(bytes));
    return std::string(hex, 2 * sha256_digest_len_bytes);
}

} // namespace libzkpath
