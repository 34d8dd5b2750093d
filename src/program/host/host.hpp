#pragma once
#include "crypto/identity.hpp"
#include "general/result.hpp"
#include "pool/order_types.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

// External collaborators of the pool program. Implementations throw Error
// on failure, the processor lets these errors propagate unchanged.

struct AccountHandle {
    Identity key;
    bool isSigner { false };
};

// Execution environment: address derivation, clock and raw storage.
class Host {
public:
    virtual ~Host() = default;
    virtual Identity program_id() const = 0;

    // Deterministic address for the seed and an optional disambiguator
    // byte. Fails with EINV_SEEDS if no such address exists.
    virtual Result<Identity> derive_address(const PoolSeed& seed, std::optional<uint8_t> disambiguator) const = 0;
    virtual Identity associated_token_address(const Identity& owner, const Identity& mint) const = 0;
    virtual uint64_t unix_timestamp() const = 0;

    // allocates zeroed storage for key, signed by the seed that derives key
    virtual void create_account(const Identity& payer, const Identity& key, size_t size,
        const Identity& owner, const PoolSeed& signerSeed, std::optional<uint8_t> disambiguator)
        = 0;
    virtual Identity storage_owner(const Identity& key) const = 0;
    virtual std::span<uint8_t> storage(const Identity& key) = 0;
};

struct TokenAccount {
    Identity mint;
    Identity owner;
    uint64_t amount;
    std::optional<Identity> delegate;
    std::optional<Identity> closeAuthority;
};

struct MintInfo {
    uint64_t supply;
    uint8_t decimals;
    std::optional<Identity> mintAuthority;
};

// Fungible-token ledger. Authorities that are pool keys are signed by the
// host with the pool seed.
class TokenLedger {
public:
    static constexpr size_t MINT_STORAGE_SIZE { 82 };

    virtual ~TokenLedger() = default;
    virtual Identity program_id() const = 0;
    // throw EINV_ACCDATA if key does not hold a record of that kind
    virtual TokenAccount account(const Identity& key) const = 0;
    virtual MintInfo mint(const Identity& key) const = 0;

    virtual void initialize_mint(const Identity& mint, const Identity& mintAuthority, uint8_t decimals) = 0;
    virtual void transfer(const Identity& source, const Identity& destination,
        const Identity& authority, uint64_t amount)
        = 0;
    virtual void mint_to(const Identity& mint, const Identity& destination,
        const Identity& mintAuthority, uint64_t amount)
        = 0;
    virtual void burn(const Identity& account, const Identity& mint,
        const Identity& owner, uint64_t amount)
        = 0;
};

struct NewOrderParams {
    Identity market;
    Identity openOrders;
    Identity requestQueue;
    Identity eventQueue;
    Identity bids;
    Identity asks;
    Identity payer; // pool account holding the offered asset
    Identity owner; // the pool
    Identity coinVault;
    Identity pcVault;
    std::optional<Identity> discount;
    pool::Side side;
    uint64_t limitPrice;
    uint64_t maxCoinQty; // in lots
    uint64_t maxNativePcQtyIncludingFees;
    pool::OrderType orderType;
    uint64_t clientId;
    pool::SelfTradeBehavior selfTradeBehavior;
    uint16_t limit;
};

struct OrderId {
    uint64_t high;
    uint64_t low;
    bool operator==(const OrderId&) const = default;
};

struct CancelOrderParams {
    Identity market;
    Identity bids;
    Identity asks;
    Identity openOrders;
    Identity owner;
    Identity eventQueue;
    pool::Side side;
    OrderId orderId;
};

struct SettleFundsParams {
    Identity market;
    Identity openOrders;
    Identity owner;
    Identity coinVault;
    Identity coinWallet;
    Identity pcVault;
    Identity pcWallet;
    std::optional<Identity> referrer;
    Identity vaultSigner;
};

// Order-book market. Records are returned as raw bytes in the market's
// own layout, see pool/market_layout.hpp.
class Market {
public:
    virtual ~Market() = default;
    virtual Identity program_id() const = 0;
    virtual std::vector<uint8_t> market_data(const Identity& market) const = 0;
    virtual std::vector<uint8_t> open_orders_data(const Identity& openOrders) const = 0;

    // calls are signed by the host with the pool seed
    virtual void new_order(const NewOrderParams&, const PoolSeed& signer) = 0;
    virtual void cancel_order(const CancelOrderParams&, const PoolSeed& signer) = 0;
    virtual void settle_funds(const SettleFundsParams&, const PoolSeed& signer) = 0;
};
