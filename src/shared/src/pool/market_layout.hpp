#pragma once
#include "crypto/identity.hpp"
#include "general/reader.hpp"
#include <span>

// Accessors into records owned by the external order-book market. The
// offsets are dictated by the market's storage layout.
namespace pool {

// per-trader record of the market holding the unsettled quantities
class OpenOrdersView {
public:
    static constexpr size_t FREE_BASE_OFFSET { 77 };
    static constexpr size_t TOTAL_BASE_OFFSET { 85 };
    static constexpr size_t FREE_QUOTE_OFFSET { 93 };
    static constexpr size_t TOTAL_QUOTE_OFFSET { 101 };

    explicit OpenOrdersView(std::span<const uint8_t> data)
        : data(data)
    {
    }
    uint64_t free_base() const { return readuint64_at(data, FREE_BASE_OFFSET); }
    uint64_t total_base() const { return readuint64_at(data, TOTAL_BASE_OFFSET); }
    uint64_t free_quote() const { return readuint64_at(data, FREE_QUOTE_OFFSET); }
    uint64_t total_quote() const { return readuint64_at(data, TOTAL_QUOTE_OFFSET); }

    // no outstanding quantity on either leg, a new order here opens a
    // new pending slot
    bool is_unused() const { return total_base() == 0 && total_quote() == 0; }
    // every locked quantity is free, settling drains the record
    bool is_fully_free() const
    {
        return free_quote() == total_quote() && free_base() == total_base();
    }
    bool nothing_free() const { return free_quote() == 0 && free_base() == 0; }

private:
    std::span<const uint8_t> data;
};

// market state record, only the traded asset identities are read
class MarketStateView {
public:
    static constexpr size_t COIN_MINT_OFFSET { 53 };
    static constexpr size_t PC_MINT_OFFSET { 85 };

    explicit MarketStateView(std::span<const uint8_t> data)
        : data(data)
    {
    }
    Identity coin_mint() const { return identity_at(COIN_MINT_OFFSET); }
    Identity pc_mint() const { return identity_at(PC_MINT_OFFSET); }

private:
    Identity identity_at(size_t offset) const
    {
        if (offset + Identity::byte_size() > data.size())
            throw Error(EINV_ACCDATA);
        return Identity { IdentityView(data.data() + offset) };
    }
    std::span<const uint8_t> data;
};

}
