#pragma once
#include "config/config.hpp"
#include "instruction.hpp"

namespace pool {
struct PoolHeader;
}

// Runs pool operations against the external collaborators. Every method
// either applies the whole operation or throws an Error. Storage writes
// are committed after the last external call, the host rolls back the
// external calls of a failed operation.
class Processor {
public:
    // applies the configured log level
    Processor(Host& host, TokenLedger& ledger, Market& market, ProgramConfig config);

    void process(const Instruction&);

    void init(const instruction::Init&);
    void create(const instruction::Create&);
    void deposit(const instruction::Deposit&);
    void create_order(const instruction::CreateOrder&);
    void settle(const instruction::SettleFunds&);
    void cancel(const instruction::CancelOrder&);
    void redeem(const instruction::Redeem&);
    void collect_fees(const instruction::CollectFees&);

private:
    Identity pool_key(const PoolSeed&) const;
    Identity mint_key(const PoolSeed&) const;
    void check_token_program(const Identity&) const;
    void check_pool_key(const PoolSeed&, const Identity& pool) const;
    void check_mint_key(const PoolSeed&, const Identity& mint) const;
    void check_program_owns(const Identity& pool) const;
    void check_signal_provider(const pool::PoolHeader&, const AccountHandle&) const;
    void check_fee_accounts(const pool::PoolHeader&, const Identity& mint,
        const Identity& signalProviderAccount, const Identity& platformFeeAccount,
        const Identity& buyAndBurnAccount) const;
    void check_pool_asset_account(const Identity& pool, const Identity& assetMint,
        const Identity& account) const;

    Host& host;
    TokenLedger& ledger;
    Market& market;
    ProgramConfig config;
};
