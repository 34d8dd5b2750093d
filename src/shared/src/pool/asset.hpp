#pragma once
#include "crypto/identity.hpp"
#include "general/errors.hpp"
#include <algorithm>
#include <span>

namespace pool {

// One 32 byte asset slot. An all-zero mint marks a free slot.
struct PoolAsset {
    static constexpr size_t LEN { 32 };
    Identity mint;

    static PoolAsset uninitialized() { return { Identity::zero() }; }
    bool is_initialized() const { return !mint.is_zero(); }

    // never fails on zero bytes, yields an uninitialized slot instead
    static PoolAsset unpack_unchecked(std::span<const uint8_t> src)
    {
        if (src.size() != LEN)
            throw Error(EINV_ACCDATA);
        return { Identity { IdentityView(src.data()) } };
    }
    void pack_into_slice(std::span<uint8_t> dst) const
    {
        if (dst.size() < LEN)
            throw Error(EINV_ACCDATA);
        std::copy(mint.begin(), mint.end(), dst.begin());
    }
    bool operator==(const PoolAsset&) const = default;
};

}
