#pragma once
#include "crypto/identity.hpp"
#include "status.hpp"
#include <span>

namespace pool {

// Fixed 117 byte header at the start of the pool storage:
//   [0,32)    market program identity
//   [32,64)   seed
//   [64,96)   signal provider identity
//   96        status byte
//   [97,99)   number of markets
//   [99,101)  fee ratio (1/65536 units)
//   [101,109) last fee collection timestamp
//   [109,117) fee collection period in seconds
struct PoolHeader {
    static constexpr size_t LEN { 117 };

    Identity marketProgramId;
    PoolSeed seed;
    Identity signalProvider;
    PoolStatus status;
    uint16_t numberOfMarkets;
    uint16_t feeRatio;
    uint64_t lastFeeCollectionTimestamp;
    uint64_t feeCollectionPeriod;

    // decodes from the first LEN bytes, status may be Uninitialized
    static PoolHeader unpack_from_slice(std::span<const uint8_t>);
    // like unpack_from_slice but the buffer must be exactly LEN bytes
    static PoolHeader unpack_unchecked(std::span<const uint8_t>);
    // like unpack_unchecked but rejects an uninitialized pool
    static PoolHeader unpack(std::span<const uint8_t>);

    // encodes into the first LEN bytes
    void pack_into_slice(std::span<uint8_t>) const;
    // the buffer must be exactly LEN bytes
    void pack(std::span<uint8_t>) const;

    bool is_initialized() const { return status.is_initialized(); }
    bool operator==(const PoolHeader&) const = default;
};

}
