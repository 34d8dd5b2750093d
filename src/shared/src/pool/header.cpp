#include "header.hpp"
#include "general/reader.hpp"
#include "general/writer.hpp"

namespace pool {

PoolHeader PoolHeader::unpack_from_slice(std::span<const uint8_t> src)
{
    if (src.size() < LEN)
        throw Error(EINV_ACCDATA);
    Reader r(src.subspan(0, LEN));
    Identity marketProgramId { r.view<32>() };
    PoolSeed seed { r.view<32>() };
    Identity signalProvider { r.view<32>() };
    auto status { PoolStatus::from_byte(r.uint8()) };
    uint16_t numberOfMarkets { r.uint16() };
    uint16_t feeRatio { r.uint16() };
    uint64_t lastFeeCollectionTimestamp { r.uint64() };
    uint64_t feeCollectionPeriod { r.uint64() };
    return {
        .marketProgramId { marketProgramId },
        .seed { seed },
        .signalProvider { signalProvider },
        .status { status },
        .numberOfMarkets = numberOfMarkets,
        .feeRatio = feeRatio,
        .lastFeeCollectionTimestamp = lastFeeCollectionTimestamp,
        .feeCollectionPeriod = feeCollectionPeriod
    };
}

PoolHeader PoolHeader::unpack_unchecked(std::span<const uint8_t> src)
{
    if (src.size() != LEN)
        throw Error(EINV_ACCDATA);
    return unpack_from_slice(src);
}

PoolHeader PoolHeader::unpack(std::span<const uint8_t> src)
{
    auto h { unpack_unchecked(src) };
    if (!h.is_initialized())
        throw Error(EUNINITACC);
    return h;
}

void PoolHeader::pack_into_slice(std::span<uint8_t> dst) const
{
    if (dst.size() < LEN)
        throw Error(EINV_ACCDATA);
    Writer w(dst.subspan(0, LEN));
    w << marketProgramId
      << seed
      << signalProvider
      << status.to_byte()
      << numberOfMarkets
      << feeRatio
      << lastFeeCollectionTimestamp
      << feeCollectionPeriod;
}

void PoolHeader::pack(std::span<uint8_t> dst) const
{
    if (dst.size() != LEN)
        throw Error(EINV_ACCDATA);
    pack_into_slice(dst);
}

}
