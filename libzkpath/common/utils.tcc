#include <sodium/randombytes.h>

namespace libzkpath {

template<typename hash_type>
hash_type random_digest(const typename libff::enable_if<std::is_same<hash_type, binary_hash_digest>::value, std::size_t>::type digest_len_bytes)
{
    binary_hash_digest result(digest_len_bytes, '\0');
    if (digest_len_bytes > 0)
    {
        randombytes_buf(&result[0], digest_len_bytes);
    }
    return result;
}

template<typename hash_type>
hash_type random_digest(const typename libff::enable_if<std::is_same<hash_type, word_hash_digest>::value, std::size_t>::type digest_len_bytes)
{
    word_hash_digest result;
    randombytes_buf(result.data(), result.size() * sizeof(std::uint32_t));
    return result;
}

template<typename hash_type>
hash_type random_digest(const typename libff::enable_if<
    !std::is_same<hash_type, binary_hash_digest>::value &&
    !std::is_same<hash_type, word_hash_digest>::value, std::size_t>::type digest_len_bytes)
{
    return hash_type::random_element();
}

template<typename hash_type>
std::vector<hash_type> random_digest_vector(const std::size_t count,
                                            const std::size_t digest_len_bytes)
{
    std::vector<hash_type> result;
    result.reserve(count);
    for (std::size_t i = 0; i < count; ++i)
    {
        result.emplace_back(random_digest<hash_type>(digest_len_bytes));
    }
    return result;
}

} // namespace libzkpath
