#pragma once
#include "order_types.hpp"
#include <cstdint>
#include <vector>

// Share and asset arithmetic of the pool. Amounts are u64, products are
// evaluated in 128 bit and every division rounds toward zero.
namespace pool {

// 1.0 in the 1/65536 fixed-point unit of fee and trade ratios
constexpr uint64_t FIXED_POINT_ONE { 1 << 16 };

struct FeeSplit {
    uint64_t signalProvider; // one half
    uint64_t platformFee; // one quarter
    uint64_t buyAndBurn; // remainder
    uint64_t total() const { return signalProvider + platformFee + buyAndBurn; }
};
[[nodiscard]] FeeSplit split_fee(uint64_t fee);

struct DepositQuote {
    uint64_t effectiveShares;
    std::vector<uint64_t> transfers; // per asset, zero entries are skipped
    uint64_t fee;
    FeeSplit feeSplit;
    uint64_t netShares; // minted to the depositor
};

// Prices a buy-in of requestedShares. The effective amount is capped by
// what every offered source balance can fund at the current pool ratios.
[[nodiscard]] DepositQuote price_deposit(uint64_t requestedShares, uint64_t totalShares,
    const std::vector<uint64_t>& poolBalances,
    const std::vector<uint64_t>& sourceBalances, uint16_t feeRatio);

// Pro-rata payout per asset for redeeming shares out of totalShares.
[[nodiscard]] std::vector<uint64_t> price_redemption(uint64_t shares, uint64_t ownedShares,
    uint64_t totalShares, const std::vector<uint64_t>& poolBalances);

struct TradeSize {
    uint64_t amountToTrade;
    uint64_t lots;
    uint64_t maxQuoteIncludingFees;
    bool exhaustsSource; // the whole pool holding of the source asset is offered
};

// Sizes an order offering ratio/65536 of the pool's source asset holding.
// The lot size of the price currency applies to bids, the base asset lot
// size to asks.
[[nodiscard]] TradeSize size_trade(uint64_t poolAssetBalance, uint16_t ratio, Side side,
    uint64_t coinLotSize, uint64_t pcLotSize);

// x^n in 1/65536 fixed point by repeated squaring, rescaling after each
// multiplication. x must not exceed 65536.
[[nodiscard]] uint64_t pow_fixedpoint_u16(uint64_t x, uint64_t n);

struct FeeAccrual {
    uint64_t periods;
    uint64_t sharesToMint;
    FeeSplit split;
    uint64_t nextCollectionTimestamp; // advanced by whole periods only
};

// Performance fee accrued over the whole periods elapsed since the last
// collection. Throws a locked-operation error when no period has elapsed.
[[nodiscard]] FeeAccrual accrue_fees(uint16_t feeRatio, uint64_t lastCollectionTimestamp,
    uint64_t collectionPeriod, uint64_t now, uint64_t totalShares);

// Redemptions wait for fees to be collected once a period is overdue.
[[nodiscard]] bool fees_overdue(uint64_t lastCollectionTimestamp, uint64_t collectionPeriod,
    uint64_t now);
}
