#include "record.hpp"
#include "general/reader.hpp"
#include <algorithm>

namespace pool {

PoolRecord::PoolRecord(std::span<uint8_t> data)
    : data(data)
{
    if (data.size() < PoolHeader::LEN)
        throw Error(EINV_ACCDATA);
}

PoolHeader PoolRecord::header() const
{
    return PoolHeader::unpack(data.subspan(0, PoolHeader::LEN));
}

PoolHeader PoolRecord::header_unchecked() const
{
    return PoolHeader::unpack_unchecked(data.subspan(0, PoolHeader::LEN));
}

void PoolRecord::write_header(const PoolHeader& h)
{
    h.pack(data.subspan(0, PoolHeader::LEN));
}

uint16_t PoolRecord::stored_number_of_markets() const
{
    return readuint16(data.data() + 97);
}

size_t PoolRecord::asset_offset() const
{
    auto offset { PoolHeader::LEN + Identity::byte_size() * stored_number_of_markets() };
    if (offset > data.size())
        throw Error(EINV_ACCDATA);
    return offset;
}

Identity PoolRecord::market(uint16_t index) const
{
    if (index >= stored_number_of_markets())
        throw Error(EINV_ARGUMENT);
    auto offset { PoolHeader::LEN + Identity::byte_size() * index };
    if (offset + Identity::byte_size() > data.size())
        throw Error(EINV_ACCDATA);
    return Identity { IdentityView(data.data() + offset) };
}

std::vector<Identity> PoolRecord::markets() const
{
    std::vector<Identity> out;
    const auto n { stored_number_of_markets() };
    out.reserve(n);
    for (uint16_t i = 0; i < n; ++i)
        out.push_back(market(i));
    return out;
}

void PoolRecord::write_markets(const std::vector<Identity>& markets)
{
    if (markets.size() != stored_number_of_markets())
        throw Error(EINV_ARGUMENT);
    auto offset { PoolHeader::LEN };
    if (offset + Identity::byte_size() * markets.size() > data.size())
        throw Error(EINV_ACCDATA);
    for (auto& m : markets) {
        std::copy(m.begin(), m.end(), data.begin() + offset);
        offset += Identity::byte_size();
    }
}

std::span<uint8_t> PoolRecord::asset_table() const
{
    return data.subspan(asset_offset());
}

size_t PoolRecord::asset_capacity() const
{
    return asset_table().size() / PoolAsset::LEN;
}

std::span<uint8_t> PoolRecord::asset_slice(size_t index) const
{
    auto table { asset_table() };
    if (index >= table.size() / PoolAsset::LEN)
        throw Error(EINV_ARGUMENT);
    return table.subspan(index * PoolAsset::LEN, PoolAsset::LEN);
}

PoolAsset PoolRecord::asset(size_t index) const
{
    return PoolAsset::unpack_unchecked(asset_slice(index));
}

void PoolRecord::write_asset(size_t index, const PoolAsset& a)
{
    a.pack_into_slice(asset_slice(index));
}

void PoolRecord::release_asset(size_t index)
{
    auto s { asset_slice(index) };
    std::fill(s.begin(), s.end(), 0);
}

std::vector<PoolAsset> PoolRecord::assets() const
{
    std::vector<PoolAsset> out;
    const auto n { asset_capacity() };
    for (size_t i = 0; i < n; ++i) {
        auto a { asset(i) };
        if (a.is_initialized())
            out.push_back(std::move(a));
    }
    return out;
}

void PoolRecord::reset()
{
    auto h { header_unchecked() };
    std::fill(data.begin() + PoolHeader::LEN, data.end(), 0);
    h.status = status::Uninitialized {};
    write_header(h);
}

}
