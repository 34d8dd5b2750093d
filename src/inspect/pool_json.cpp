#include "pool_json.hpp"
#include "pool/record.hpp"

namespace jsonmsg {

json to_json(const pool::PoolHeader& h)
{
    json j;
    j["marketProgramId"] = h.marketProgramId.hex_string();
    j["seed"] = h.seed.hex_string();
    j["signalProvider"] = h.signalProvider.hex_string();
    j["status"] = h.status.to_string();
    j["statusByte"] = h.status.to_byte();
    j["pendingOrders"] = h.status.pending_orders();
    j["locked"] = h.status.is_locked();
    j["numberOfMarkets"] = h.numberOfMarkets;
    j["feeRatio"] = h.feeRatio;
    j["lastFeeCollectionTimestamp"] = h.lastFeeCollectionTimestamp;
    j["feeCollectionPeriod"] = h.feeCollectionPeriod;
    return j;
}

json pool_storage_json(std::span<uint8_t> storage)
{
    pool::PoolRecord record(storage);
    const auto header { record.header_unchecked() };
    json j;
    j["size"] = storage.size();
    j["header"] = to_json(header);
    if (!header.is_initialized())
        return j;

    json markets = json::array();
    for (auto& m : record.markets())
        markets.push_back(m.hex_string());
    j["markets"] = markets;

    json assets = json::array();
    const auto capacity { record.asset_capacity() };
    for (size_t i = 0; i < capacity; ++i) {
        auto a { record.asset(i) };
        if (!a.is_initialized())
            continue;
        assets.push_back(json {
            { "index", i },
            { "mint", a.mint.hex_string() } });
    }
    j["assets"] = assets;
    j["assetCapacity"] = capacity;
    return j;
}
}
