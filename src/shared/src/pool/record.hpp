#pragma once
#include "asset.hpp"
#include "header.hpp"
#include <vector>

namespace pool {

// storage bytes needed for a pool with the given table sizes
constexpr size_t required_size(uint16_t numberOfMarkets, uint32_t maxNumberOfAssets)
{
    return PoolHeader::LEN
        + Identity::byte_size() * size_t(numberOfMarkets)
        + PoolAsset::LEN * size_t(maxNumberOfAssets);
}

// Mutable view over the whole pool storage: the header, then the market
// whitelist, then the asset slots up to the end of the buffer. The table
// offsets follow the number of markets stored in the header.
class PoolRecord {
public:
    explicit PoolRecord(std::span<uint8_t> data);

    // throws if the pool is uninitialized
    [[nodiscard]] PoolHeader header() const;
    [[nodiscard]] PoolHeader header_unchecked() const;
    void write_header(const PoolHeader&);

    // whitelisted market at the given index
    [[nodiscard]] Identity market(uint16_t index) const;
    [[nodiscard]] std::vector<Identity> markets() const;
    // number of markets must already be written to the header
    void write_markets(const std::vector<Identity>&);

    [[nodiscard]] size_t asset_capacity() const;
    [[nodiscard]] PoolAsset asset(size_t index) const;
    void write_asset(size_t index, const PoolAsset&);
    // zeroes the slot so a later trade can claim it again
    void release_asset(size_t index);
    // initialized slots in index order
    [[nodiscard]] std::vector<PoolAsset> assets() const;

    // Returns the record to Uninitialized: everything past the header is
    // zeroed, the rest of the header is kept so that the seed stays usable.
    void reset();

    std::span<const uint8_t> bytes() const { return data; }

private:
    uint16_t stored_number_of_markets() const;
    size_t asset_offset() const;
    std::span<uint8_t> asset_table() const;
    std::span<uint8_t> asset_slice(size_t index) const;
    std::span<uint8_t> data;
};

}
