#pragma once
#include "host/host.hpp"
#include "pool/order_types.hpp"
#include "tools/variant.hpp"
#include <string_view>
#include <vector>

// Decoded pool operations together with the account keys they act on.
namespace instruction {

struct Init {
    static constexpr std::string_view name { "Init" };
    PoolSeed seed;
    uint32_t maxNumberOfAssets;
    uint16_t numberOfMarkets;
    struct Accounts {
        Identity tokenProgram;
        Identity pool;
        Identity mint;
        Identity payer;
    } accounts;
};

struct Create {
    static constexpr std::string_view name { "Create Pool" };
    PoolSeed seed;
    std::vector<uint64_t> depositAmounts;
    std::vector<Identity> markets;
    uint64_t feeCollectionPeriod;
    uint16_t feeRatio;
    struct Accounts {
        Identity tokenProgram;
        Identity marketProgram;
        Identity signalProvider;
        Identity mint;
        Identity targetShareAccount;
        Identity pool;
        std::vector<Identity> poolAssets; // one per deposit amount
        AccountHandle sourceOwner;
        std::vector<Identity> sourceAssets; // one per deposit amount
    } accounts;
};

struct Deposit {
    static constexpr std::string_view name { "Deposit into Pool" };
    PoolSeed seed;
    uint64_t shareAmount;
    struct Accounts {
        Identity tokenProgram;
        Identity mint;
        Identity targetShareAccount;
        Identity signalProviderShareAccount;
        Identity platformFeeShareAccount;
        Identity buyAndBurnShareAccount;
        Identity pool;
        std::vector<Identity> poolAssets; // one per initialized asset slot
        AccountHandle sourceOwner;
        std::vector<Identity> sourceAssets;
    } accounts;
};

struct CreateOrder {
    static constexpr std::string_view name { "Create Order for Pool" };
    PoolSeed seed;
    pool::Side side;
    uint64_t limitPrice;
    uint16_t ratioOfPoolAssetsToTrade; // 1/65536 units
    pool::OrderType orderType;
    uint16_t marketIndex;
    uint64_t coinLotSize;
    uint64_t pcLotSize;
    Identity targetMint;
    uint64_t clientId;
    pool::SelfTradeBehavior selfTradeBehavior;
    uint64_t sourceIndex;
    uint64_t targetIndex;
    uint16_t limit;
    struct Accounts {
        AccountHandle signalProvider;
        Identity market;
        Identity poolAsset;
        Identity openOrders;
        Identity eventQueue;
        Identity requestQueue;
        Identity bids;
        Identity asks;
        Identity pool;
        Identity coinVault;
        Identity pcVault;
        Identity tokenProgram;
        Identity marketProgram;
        std::optional<Identity> discount;
    } accounts;
};

struct SettleFunds {
    static constexpr std::string_view name { "Settle funds for Pool" };
    PoolSeed seed;
    uint64_t pcIndex;
    uint64_t coinIndex;
    struct Accounts {
        Identity market;
        Identity openOrders;
        Identity pool;
        Identity mint;
        Identity coinVault;
        Identity pcVault;
        Identity poolCoinWallet;
        Identity poolPcWallet;
        Identity vaultSigner;
        Identity tokenProgram;
        Identity marketProgram;
        std::optional<Identity> referrer;
    } accounts;
};

struct CancelOrder {
    static constexpr std::string_view name { "Cancel Order for Pool" };
    PoolSeed seed;
    pool::Side side;
    OrderId orderId;
    struct Accounts {
        AccountHandle signalProvider;
        Identity market;
        Identity openOrders;
        Identity bids;
        Identity asks;
        Identity eventQueue;
        Identity pool;
        Identity marketProgram;
    } accounts;
};

struct Redeem {
    static constexpr std::string_view name { "Redeem out of Pool" };
    PoolSeed seed;
    uint64_t shareAmount;
    struct Accounts {
        Identity tokenProgram;
        Identity mint;
        AccountHandle sourceShareOwner;
        Identity sourceShareAccount;
        Identity pool;
        std::vector<Identity> poolAssets; // one per initialized asset slot
        std::vector<Identity> targetAssets;
    } accounts;
};

struct CollectFees {
    static constexpr std::string_view name { "Collect Fees for Pool" };
    PoolSeed seed;
    struct Accounts {
        Identity tokenProgram;
        Identity pool;
        Identity mint;
        Identity signalProviderShareAccount;
        Identity platformFeeShareAccount;
        Identity buyAndBurnShareAccount;
    } accounts;
};
}

using InstructionVariant = sp::variant<instruction::Init, instruction::Create,
    instruction::Deposit, instruction::CreateOrder, instruction::SettleFunds,
    instruction::CancelOrder, instruction::Redeem, instruction::CollectFees>;

class Instruction : public InstructionVariant {
public:
    using InstructionVariant::InstructionVariant;
    std::string_view name() const
    {
        return visit([](auto& i) { return i.name; });
    }
};
