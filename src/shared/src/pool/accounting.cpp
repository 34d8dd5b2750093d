#include "accounting.hpp"
#include "general/errors.hpp"
#include "general/prod.hpp"
#include "spdlog/spdlog.h"
#include <algorithm>
#include <limits>

namespace pool {

FeeSplit split_fee(uint64_t fee)
{
    const uint64_t signalProvider { fee / 2 };
    const uint64_t platformFee { fee / 4 };
    return {
        .signalProvider = signalProvider,
        .platformFee = platformFee,
        .buyAndBurn = fee - platformFee - signalProvider
    };
}

DepositQuote price_deposit(uint64_t requestedShares, uint64_t totalShares,
    const std::vector<uint64_t>& poolBalances,
    const std::vector<uint64_t>& sourceBalances, uint16_t feeRatio)
{
    if (poolBalances.size() != sourceBalances.size())
        throw Error(EINV_ARGUMENT);
    if (totalShares == 0)
        throw Error(EARITHMETIC);

    // The effective amount can be less than requested as the source
    // balances need to satisfy the pool asset ratios.
    uint64_t effective { std::numeric_limits<uint64_t>::max() };
    for (size_t i = 0; i < poolBalances.size(); ++i) {
        uint64_t fundable { std::numeric_limits<uint64_t>::max() };
        if (poolBalances[i] != 0) {
            fundable = mul_div_floor(sourceBalances[i], totalShares, poolBalances[i])
                           .value_or(std::numeric_limits<uint64_t>::max());
        }
        effective = std::min(effective, fundable);
    }
    effective = std::min(effective, requestedShares);

    DepositQuote q {
        .effectiveShares = effective,
        .transfers {},
        .fee = 0,
        .feeSplit {},
        .netShares = 0
    };
    q.transfers.reserve(poolBalances.size());
    bool allZero { true };
    for (auto poolBalance : poolBalances) {
        auto amount { mul_div_floor(effective, poolBalance, totalShares) };
        if (!amount)
            throw Error(EARITHMETIC);
        if (*amount != 0)
            allZero = false;
        q.transfers.push_back(*amount);
    }
    if (allZero) {
        spdlog::warn("The provided amounts cannot be all zero.");
        throw Error(EZEROAMOUNTS);
    }

    auto fee { Prod128(feeRatio, effective).shr16() };
    if (!fee)
        throw Error(EARITHMETIC);
    q.fee = *fee;
    q.feeSplit = split_fee(q.fee);
    q.netShares = effective - q.fee;
    return q;
}

std::vector<uint64_t> price_redemption(uint64_t shares, uint64_t ownedShares,
    uint64_t totalShares, const std::vector<uint64_t>& poolBalances)
{
    if (ownedShares < shares) {
        spdlog::warn("Insufficient pool token funds");
        throw Error(EINSUFFUNDS);
    }
    if (totalShares == 0 || shares > totalShares)
        throw Error(EARITHMETIC);
    std::vector<uint64_t> payouts;
    payouts.reserve(poolBalances.size());
    for (auto poolBalance : poolBalances) {
        auto amount { mul_div_floor(shares, poolBalance, totalShares) };
        if (!amount)
            throw Error(EARITHMETIC);
        payouts.push_back(*amount);
    }
    return payouts;
}

TradeSize size_trade(uint64_t poolAssetBalance, uint16_t ratio, Side side,
    uint64_t coinLotSize, uint64_t pcLotSize)
{
    if (ratio == 0)
        throw Error(EINV_ARGUMENT);
    auto amountToTrade { Prod128(poolAssetBalance, ratio).shr16().value() };

    const uint64_t lotSize { side == Side::Bid ? pcLotSize : coinLotSize };
    if (lotSize == 0)
        throw Error(EARITHMETIC);

    TradeSize t {
        .amountToTrade = amountToTrade,
        .lots = amountToTrade / lotSize,
        .maxQuoteIncludingFees = side == Side::Bid ? amountToTrade : 1,
        .exhaustsSource = poolAssetBalance == amountToTrade
    };
    if (t.maxQuoteIncludingFees == 0 || t.lots == 0) {
        spdlog::warn("Operation too small");
        throw Error(ETOOSMALL);
    }
    return t;
}

uint64_t pow_fixedpoint_u16(uint64_t x, uint64_t n)
{
    if (n == 0)
        return FIXED_POINT_ONE;
    if (n == 1)
        return x;
    const uint64_t p { pow_fixedpoint_u16(x, n >> 1) };
    const uint64_t sq { (p * p) >> 16 };
    if (n & 1)
        return (sq * x) >> 16;
    return sq;
}

FeeAccrual accrue_fees(uint16_t feeRatio, uint64_t lastCollectionTimestamp,
    uint64_t collectionPeriod, uint64_t now, uint64_t totalShares)
{
    if (collectionPeriod == 0 || now < lastCollectionTimestamp)
        throw Error(EARITHMETIC);
    const uint64_t periods { (now - lastCollectionTimestamp) / collectionPeriod };
    if (periods == 0) {
        spdlog::warn("There are currently no fees to collect");
        throw Error(ELOCKEDOP);
    }

    // retained share of the supply per period is the 16 bit complement
    // of the fee ratio
    const uint16_t feeless { uint16_t(pow_fixedpoint_u16(uint16_t(~feeRatio), periods)) };
    if (feeless == 0)
        throw Error(EARITHMETIC);
    const uint16_t collect { uint16_t(~feeless) };

    auto sharesToMint { mul_div_floor(collect, totalShares, feeless) };
    if (!sharesToMint)
        throw Error(EARITHMETIC);

    spdlog::debug("Collecting fees for {} periods, feeless ratio {}/65536, minting {} shares",
        periods, feeless, *sharesToMint);
    return {
        .periods = periods,
        .sharesToMint = *sharesToMint,
        .split = split_fee(*sharesToMint),
        // now - last >= periods * period, so this cannot overflow
        .nextCollectionTimestamp = lastCollectionTimestamp + periods * collectionPeriod
    };
}

bool fees_overdue(uint64_t lastCollectionTimestamp, uint64_t collectionPeriod, uint64_t now)
{
    if (now < lastCollectionTimestamp)
        return false;
    return now - lastCollectionTimestamp > collectionPeriod;
}
}
