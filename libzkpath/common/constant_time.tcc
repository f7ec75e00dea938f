#include <gmp.h>
#include <sodium/utils.h>

namespace libzkpath {

/* libff keeps elements fully reduced in Montgomery form, so equal elements
   have equal representations and a limb-wise select yields a valid element. */
template<typename FieldT>
FieldT ct_select(const bool bit, const FieldT &if_true, const FieldT &if_false)
{
    const mp_limb_t mask = ((mp_limb_t) 0) - ((mp_limb_t) bit);
    FieldT result = if_false;
    for (mp_size_t i = 0; i < FieldT::num_limbs; ++i)
    {
        result.mont_repr.data[i] = (if_true.mont_repr.data[i] & mask) |
                                   (if_false.mont_repr.data[i] & ~mask);
    }
    return result;
}

template<typename FieldT>
bool ct_equal(const FieldT &a, const FieldT &b)
{
    return sodium_memcmp(a.mont_repr.data, b.mont_repr.data, sizeof(a.mont_repr.data)) == 0;
}

} // namespace libzkpath
