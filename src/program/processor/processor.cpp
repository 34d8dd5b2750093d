#include "processor.hpp"
#include "general/logging.hpp"
#include "pool/accounting.hpp"
#include "pool/market_layout.hpp"
#include "pool_storage.hpp"
#include "spdlog/spdlog.h"

using namespace pool;

namespace {
constexpr uint8_t MINT_DISAMBIGUATOR { 1 };

[[noreturn]] void reject(int32_t code, std::string_view reason)
{
    spdlog::warn("{}", reason);
    throw Error(code);
}

void check_account_count(size_t provided, size_t expected)
{
    if (provided != expected) {
        spdlog::warn("Expected {} asset accounts, got {}", expected, provided);
        throw Error(EINV_ARGUMENT);
    }
}

// an unset slot is claimed, a set slot must hold the mint
void claim_or_check_slot(PoolRecord& record, size_t index, const Identity& mint,
    std::string_view mismatchReason)
{
    auto slot { record.asset(index) };
    if (slot.is_initialized()) {
        if (slot.mint != mint)
            reject(EINV_ARGUMENT, mismatchReason);
    } else {
        spdlog::debug("Claiming asset slot {} for mint {}", index, mint.hex_string());
        record.write_asset(index, { mint });
    }
}
}

Processor::Processor(Host& host, TokenLedger& ledger, Market& market, ProgramConfig config)
    : host(host)
    , ledger(ledger)
    , market(market)
    , config(std::move(config))
{
    apply_log_level(this->config);
}

void Processor::process(const Instruction& i)
{
    spdlog::info("Instruction: {}", i.name());
    try {
        i.visit_overload(
            [&](const instruction::Init& op) { init(op); },
            [&](const instruction::Create& op) { create(op); },
            [&](const instruction::Deposit& op) { deposit(op); },
            [&](const instruction::CreateOrder& op) { create_order(op); },
            [&](const instruction::SettleFunds& op) { settle(op); },
            [&](const instruction::CancelOrder& op) { cancel(op); },
            [&](const instruction::Redeem& op) { redeem(op); },
            [&](const instruction::CollectFees& op) { collect_fees(op); });
    } catch (const Error& e) {
        spdlog::info("Instruction {} failed: {}", i.name(), e.format());
        throw;
    }
}

Identity Processor::pool_key(const PoolSeed& seed) const
{
    return host.derive_address(seed, {}).value_throw();
}

Identity Processor::mint_key(const PoolSeed& seed) const
{
    return host.derive_address(seed, MINT_DISAMBIGUATOR).value_throw();
}

void Processor::check_token_program(const Identity& tokenProgram) const
{
    if (tokenProgram != ledger.program_id())
        reject(EPROGRAMID, "Incorrect token program provided");
}

void Processor::check_pool_key(const PoolSeed& seed, const Identity& pool) const
{
    if (pool_key(seed) != pool)
        reject(EINV_ARGUMENT, "Provided pool account does not match the provided pool seed");
}

void Processor::check_mint_key(const PoolSeed& seed, const Identity& mint) const
{
    if (mint_key(seed) != mint)
        reject(EINV_ARGUMENT, "Provided mint account is invalid");
}

void Processor::check_program_owns(const Identity& pool) const
{
    if (host.storage_owner(pool) != host.program_id())
        reject(EINV_ARGUMENT, "Program should own pool account");
}

void Processor::check_signal_provider(const PoolHeader& h, const AccountHandle& signalProvider) const
{
    if (signalProvider.key != h.signalProvider)
        reject(EMISSINGSIG, "A wrong signal provider account was provided.");
    if (!signalProvider.isSigner)
        reject(EMISSINGSIG, "The signal provider's signature is required.");
}

void Processor::check_fee_accounts(const PoolHeader& h, const Identity& mint,
    const Identity& signalProviderAccount, const Identity& platformFeeAccount,
    const Identity& buyAndBurnAccount) const
{
    if (signalProviderAccount != host.associated_token_address(h.signalProvider, mint))
        reject(EINV_ARGUMENT, "The provided signal provider pool token account is invalid.");
    if (platformFeeAccount != host.associated_token_address(config.platform.feeOwner, mint))
        reject(EINV_ARGUMENT, "The provided platform fee pool token account is invalid.");
    if (buyAndBurnAccount != host.associated_token_address(config.platform.buyAndBurnOwner, mint))
        reject(EINV_ARGUMENT, "The provided buy and burn pool token account is invalid.");
}

void Processor::check_pool_asset_account(const Identity& pool, const Identity& assetMint,
    const Identity& account) const
{
    if (account != host.associated_token_address(pool, assetMint))
        reject(EINV_ARGUMENT, "Provided pool asset account is invalid");
}

void Processor::init(const instruction::Init& op)
{
    auto& a { op.accounts };
    check_token_program(a.tokenProgram);
    const auto poolKey { pool_key(op.seed) };
    if (poolKey != a.pool)
        reject(EINV_ARGUMENT, "Provided pool account is invalid");
    const auto mintKey { mint_key(op.seed) };
    if (mintKey != a.mint)
        reject(EINV_ARGUMENT, "Provided mint account is invalid");

    const auto size { required_size(op.numberOfMarkets, op.maxNumberOfAssets) };
    spdlog::debug("Allocating {} bytes for {} markets and {} assets",
        size, op.numberOfMarkets, op.maxNumberOfAssets);

    host.create_account(a.payer, poolKey, size, host.program_id(), op.seed, {});
    host.create_account(a.payer, mintKey, TokenLedger::MINT_STORAGE_SIZE,
        ledger.program_id(), op.seed, MINT_DISAMBIGUATOR);
    log_external(config, "initialize_mint {} authority {}", mintKey.hex_string(), poolKey.hex_string());
    ledger.initialize_mint(mintKey, poolKey, config.pool.shareDecimals);
}

void Processor::create(const instruction::Create& op)
{
    auto& a { op.accounts };
    check_token_program(a.tokenProgram);
    const auto now { host.unix_timestamp() };
    const auto poolKey { pool_key(op.seed) };
    const auto mintKey { mint_key(op.seed) };
    if (poolKey != a.pool)
        reject(EINV_ARGUMENT, "Provided pool account is invalid");
    if (mintKey != a.mint)
        reject(EINV_ARGUMENT, "Provided mint account is invalid");
    check_account_count(a.poolAssets.size(), op.depositAmounts.size());
    check_account_count(a.sourceAssets.size(), op.depositAmounts.size());

    PoolStorage storage(host, poolKey);
    auto record { storage.record() };
    if (record.header_unchecked().is_initialized())
        reject(EINV_ARGUMENT, "Cannot overwrite an existing pool.");
    check_program_owns(a.pool);
    if (!a.sourceOwner.isSigner)
        reject(EINV_ARGUMENT, "Source token account owner should be a signer.");
    if (op.markets.size() >> 16 != 0)
        reject(EINV_ARGUMENT, "Number of given markets is too high.");
    if (op.feeCollectionPeriod < config.pool.minFeeCollectionPeriod)
        reject(EINV_ARGUMENT, "Fee collection period should be longer than a week.");

    std::vector<PoolAsset> assets;
    for (size_t i = 0; i < op.depositAmounts.size(); ++i) {
        if (op.depositAmounts[i] == 0)
            continue;
        auto poolAsset { ledger.account(a.poolAssets[i]) };
        if (poolAsset.closeAuthority || poolAsset.delegate)
            reject(EINV_ARGUMENT, "Invalid pool asset account");
        check_pool_asset_account(poolKey, poolAsset.mint, a.poolAssets[i]);
        assets.push_back({ poolAsset.mint });
    }

    const PoolHeader header {
        .marketProgramId = a.marketProgram,
        .seed = op.seed,
        .signalProvider = a.signalProvider,
        .status = status::Unlocked {},
        .numberOfMarkets = uint16_t(op.markets.size()),
        .feeRatio = op.feeRatio,
        .lastFeeCollectionTimestamp = now,
        .feeCollectionPeriod = op.feeCollectionPeriod
    };
    record.write_header(header);
    record.write_markets(op.markets);
    for (size_t i = 0; i < assets.size(); ++i)
        record.write_asset(i, assets[i]);

    for (size_t i = 0; i < op.depositAmounts.size(); ++i) {
        if (op.depositAmounts[i] == 0)
            continue;
        log_external(config, "transfer {} from {}", op.depositAmounts[i], a.sourceAssets[i].hex_string());
        ledger.transfer(a.sourceAssets[i], a.poolAssets[i], a.sourceOwner.key, op.depositAmounts[i]);
    }
    log_external(config, "mint_to {} shares to {}", config.pool.initialShareSupply, a.targetShareAccount.hex_string());
    ledger.mint_to(mintKey, a.targetShareAccount, poolKey, config.pool.initialShareSupply);

    storage.commit();
    log_status_change(status::Uninitialized {}, header.status);
}

void Processor::deposit(const instruction::Deposit& op)
{
    auto& a { op.accounts };
    check_token_program(a.tokenProgram);

    PoolStorage storage(host, a.pool);
    auto record { storage.record() };
    const auto header { record.header() };
    const auto assets { record.assets() };
    check_account_count(a.poolAssets.size(), assets.size());
    check_account_count(a.sourceAssets.size(), assets.size());

    const auto poolKey { pool_key(op.seed) };
    const auto mintKey { mint_key(op.seed) };
    if (poolKey != a.pool)
        reject(EINV_ARGUMENT, "Provided pool account doesn't match the provided pool seed.");
    if (mintKey != a.mint)
        reject(EINV_ARGUMENT, "Provided mint account is invalid.");
    if (!a.sourceOwner.isSigner)
        reject(EINV_ARGUMENT, "Source token account owner should be a signer.");
    check_program_owns(a.pool);
    check_fee_accounts(header, mintKey, a.signalProviderShareAccount,
        a.platformFeeShareAccount, a.buyAndBurnShareAccount);
    check_accepts_deposits(header.status);

    const auto totalShares { ledger.mint(mintKey).supply };
    std::vector<uint64_t> poolBalances;
    std::vector<uint64_t> sourceBalances;
    for (size_t i = 0; i < assets.size(); ++i) {
        check_pool_asset_account(poolKey, assets[i].mint, a.poolAssets[i]);
        poolBalances.push_back(ledger.account(a.poolAssets[i]).amount);
        sourceBalances.push_back(ledger.account(a.sourceAssets[i]).amount);
    }

    const auto quote { price_deposit(op.shareAmount, totalShares, poolBalances,
        sourceBalances, header.feeRatio) };
    spdlog::debug("Deposit of {} shares requested, {} effective, fee {}",
        op.shareAmount, quote.effectiveShares, quote.fee);

    for (size_t i = 0; i < assets.size(); ++i) {
        const auto amount { quote.transfers[i] };
        if (amount == 0)
            continue;
        log_external(config, "transfer {} of {} into pool", amount, assets[i].mint.hex_string());
        ledger.transfer(a.sourceAssets[i], a.poolAssets[i], a.sourceOwner.key, amount);
    }
    log_external(config, "mint_to {} shares to {}, fee {}", quote.netShares,
        a.targetShareAccount.hex_string(), quote.fee);
    ledger.mint_to(mintKey, a.targetShareAccount, poolKey, quote.netShares);
    ledger.mint_to(mintKey, a.signalProviderShareAccount, poolKey, quote.feeSplit.signalProvider);
    ledger.mint_to(mintKey, a.platformFeeShareAccount, poolKey, quote.feeSplit.platformFee);
    ledger.mint_to(mintKey, a.buyAndBurnShareAccount, poolKey, quote.feeSplit.buyAndBurn);
}

void Processor::create_order(const instruction::CreateOrder& op)
{
    auto& a { op.accounts };
    check_token_program(a.tokenProgram);
    check_pool_key(op.seed, a.pool);

    const auto sourceAccount { ledger.account(a.poolAsset) };
    if (a.poolAsset != host.associated_token_address(a.pool, sourceAccount.mint))
        reject(EINV_ARGUMENT, "Source token account should be associated to the pool account");
    if (op.orderType != OrderType::ImmediateOrCancel)
        reject(EINV_ARGUMENT, "Order needs to be of type ImmediateOrCancel");
    if (op.limitPrice == 0)
        reject(EINV_ARGUMENT, "Limit price must be positive");

    PoolStorage storage(host, a.pool);
    auto record { storage.record() };
    auto header { record.header() };
    if (header.marketProgramId != a.marketProgram)
        reject(EINV_ARGUMENT, "The provided market program account is invalid for this pool.");
    if (market.program_id() != a.marketProgram)
        reject(EPROGRAMID, "Market service does not serve the provided market program");
    if (!a.signalProvider.isSigner)
        reject(EMISSINGSIG, "The signal provider's signature is required.");
    if (a.signalProvider.key != header.signalProvider)
        reject(EMISSINGSIG, "A wrong signal provider account was provided.");
    if (a.market != record.market(op.marketIndex))
        reject(EMISSINGSIG, "The given market account is not authorized.");

    const auto openOrdersData { market.open_orders_data(a.openOrders) };
    const OpenOrdersView openOrders(openOrdersData);
    const auto before { header.status };
    header.status = open_order(header.status, openOrders.is_unused());
    record.write_header(header);

    const auto source { record.asset(op.sourceIndex) };
    if (!source.is_initialized())
        reject(EINV_ARGUMENT, "The pool has no account at the specified source index");
    if (source.mint != sourceAccount.mint)
        reject(EINV_ARGUMENT, "Provided coin account does not match the pool source asset");
    if (sourceAccount.owner != a.pool)
        reject(EINV_ARGUMENT, "Provided coin account should be owned by the pool");
    claim_or_check_slot(record, op.targetIndex, op.targetMint,
        "Target asset mint does not match given target mint");

    const auto balance { ledger.account(a.poolAsset).amount };
    const auto trade { size_trade(balance, op.ratioOfPoolAssetsToTrade, op.side,
        op.coinLotSize, op.pcLotSize) };
    if (trade.exhaustsSource) {
        spdlog::debug("Order offers the whole pool holding, releasing asset slot {}", op.sourceIndex);
        record.release_asset(op.sourceIndex);
    }
    spdlog::debug("{} order of {} lots ({} native) on market {}", to_string(op.side),
        trade.lots, trade.amountToTrade, a.market.hex_string());

    log_external(config, "new_order on {}", a.market.hex_string());
    market.new_order(
        NewOrderParams {
            .market = a.market,
            .openOrders = a.openOrders,
            .requestQueue = a.requestQueue,
            .eventQueue = a.eventQueue,
            .bids = a.bids,
            .asks = a.asks,
            .payer = a.poolAsset,
            .owner = a.pool,
            .coinVault = a.coinVault,
            .pcVault = a.pcVault,
            .discount = a.discount,
            .side = op.side,
            .limitPrice = op.limitPrice,
            .maxCoinQty = trade.lots,
            .maxNativePcQtyIncludingFees = trade.maxQuoteIncludingFees,
            .orderType = op.orderType,
            .clientId = op.clientId,
            .selfTradeBehavior = op.selfTradeBehavior,
            .limit = op.limit },
        op.seed);

    storage.commit();
    log_status_change(before, header.status);
}

void Processor::settle(const instruction::SettleFunds& op)
{
    auto& a { op.accounts };
    check_token_program(a.tokenProgram);
    check_pool_key(op.seed, a.pool);
    if (market.program_id() != a.marketProgram)
        reject(EPROGRAMID, "Market service does not serve the provided market program");

    const auto marketData { market.market_data(a.market) };
    const MarketStateView marketState(marketData);
    const auto coinMint { marketState.coin_mint() };
    const auto pcMint { marketState.pc_mint() };

    check_mint_key(op.seed, a.mint);
    if (a.poolCoinWallet != host.associated_token_address(a.pool, coinMint))
        reject(EINV_ARGUMENT, "Provided pool coin account does not match the pool coin asset");
    if (a.poolPcWallet != host.associated_token_address(a.pool, pcMint))
        reject(EINV_ARGUMENT, "Provided pool pc account does not match the pool pc asset");

    const auto coinWallet { ledger.account(a.poolCoinWallet) };
    const auto pcWallet { ledger.account(a.poolPcWallet) };

    PoolStorage storage(host, a.pool);
    auto record { storage.record() };
    auto header { record.header() };

    if (coinWallet.owner != a.pool)
        reject(EINV_ARGUMENT, "Pool should own the provided coin account");
    if (pcWallet.owner != a.pool)
        reject(EINV_ARGUMENT, "Pool should own the provided price coin account");
    claim_or_check_slot(record, op.coinIndex, coinMint, "Coin asset does not match market coin token");
    claim_or_check_slot(record, op.pcIndex, pcMint, "Coin asset does not match market pc token");

    const auto openOrdersData { market.open_orders_data(a.openOrders) };
    const OpenOrdersView openOrders(openOrdersData);
    const auto before { header.status };
    if (openOrders.is_fully_free())
        header.status = settle_order(header.status);
    if (openOrders.nothing_free())
        reject(ELOCKEDOP, "No funds to settle.");
    record.write_header(header);

    log_external(config, "settle_funds on {}", a.market.hex_string());
    market.settle_funds(
        SettleFundsParams {
            .market = a.market,
            .openOrders = a.openOrders,
            .owner = a.pool,
            .coinVault = a.coinVault,
            .coinWallet = a.poolCoinWallet,
            .pcVault = a.pcVault,
            .pcWallet = a.poolPcWallet,
            .referrer = a.referrer,
            .vaultSigner = a.vaultSigner },
        op.seed);

    storage.commit();
    log_status_change(before, header.status);
}

void Processor::cancel(const instruction::CancelOrder& op)
{
    auto& a { op.accounts };
    check_pool_key(op.seed, a.pool);
    if (market.program_id() != a.marketProgram)
        reject(EPROGRAMID, "Market service does not serve the provided market program");

    const PoolRecord record(host.storage(a.pool));
    check_signal_provider(record.header(), a.signalProvider);

    log_external(config, "cancel_order on {}", a.market.hex_string());
    market.cancel_order(
        CancelOrderParams {
            .market = a.market,
            .bids = a.bids,
            .asks = a.asks,
            .openOrders = a.openOrders,
            .owner = a.pool,
            .eventQueue = a.eventQueue,
            .side = op.side,
            .orderId = op.orderId },
        op.seed);
}

void Processor::redeem(const instruction::Redeem& op)
{
    auto& a { op.accounts };
    check_token_program(a.tokenProgram);

    PoolStorage storage(host, a.pool);
    auto record { storage.record() };
    const auto header { record.header() };
    const auto assets { record.assets() };
    check_account_count(a.poolAssets.size(), assets.size());
    check_account_count(a.targetAssets.size(), assets.size());

    check_pool_key(op.seed, a.pool);
    const auto mintKey { mint_key(op.seed) };
    if (mintKey != a.mint)
        reject(EINV_ARGUMENT, "Provided mint account is invalid");
    if (!a.sourceShareOwner.isSigner)
        reject(EINV_ARGUMENT, "Source pooltoken account owner should be a signer.");
    check_program_owns(a.pool);
    check_accepts_redemptions(header.status);

    const auto now { host.unix_timestamp() };
    if (fees_overdue(header.lastFeeCollectionTimestamp, header.feeCollectionPeriod, now))
        reject(ELOCKEDOP, "Fees should be collected before redeeming.");

    const auto totalShares { ledger.mint(mintKey).supply };
    const auto ownedShares { ledger.account(a.sourceShareAccount).amount };
    std::vector<uint64_t> poolBalances;
    for (size_t i = 0; i < assets.size(); ++i) {
        check_pool_asset_account(a.pool, assets[i].mint, a.poolAssets[i]);
        poolBalances.push_back(ledger.account(a.poolAssets[i]).amount);
    }
    const auto payouts { price_redemption(op.shareAmount, ownedShares, totalShares, poolBalances) };

    for (size_t i = 0; i < assets.size(); ++i) {
        if (payouts[i] == 0)
            continue;
        log_external(config, "transfer {} of {} out of pool", payouts[i], assets[i].mint.hex_string());
        ledger.transfer(a.poolAssets[i], a.targetAssets[i], a.pool, payouts[i]);
    }
    ledger.burn(a.sourceShareAccount, mintKey, a.sourceShareOwner.key, op.shareAmount);

    if (op.shareAmount == totalShares) {
        spdlog::debug("Whole share supply redeemed, resetting pool {}", a.pool.hex_string());
        record.reset();
        storage.commit();
        log_status_change(header.status, status::Uninitialized {});
    }
}

void Processor::collect_fees(const instruction::CollectFees& op)
{
    auto& a { op.accounts };
    check_token_program(a.tokenProgram);
    check_pool_key(op.seed, a.pool);
    const auto mintKey { mint_key(op.seed) };
    if (mintKey != a.mint)
        reject(EINV_ARGUMENT, "Provided mint account is invalid.");

    PoolStorage storage(host, a.pool);
    auto record { storage.record() };
    auto header { record.header() };
    check_fee_accounts(header, mintKey, a.signalProviderShareAccount,
        a.platformFeeShareAccount, a.buyAndBurnShareAccount);

    const auto now { host.unix_timestamp() };
    const auto totalShares { ledger.mint(mintKey).supply };
    const auto accrual { accrue_fees(header.feeRatio, header.lastFeeCollectionTimestamp,
        header.feeCollectionPeriod, now, totalShares) };
    header.lastFeeCollectionTimestamp = accrual.nextCollectionTimestamp;

    log_external(config, "mint_to {} fee shares for {} periods", accrual.sharesToMint, accrual.periods);
    ledger.mint_to(mintKey, a.signalProviderShareAccount, a.pool, accrual.split.signalProvider);
    ledger.mint_to(mintKey, a.platformFeeShareAccount, a.pool, accrual.split.platformFee);
    ledger.mint_to(mintKey, a.buyAndBurnShareAccount, a.pool, accrual.split.buyAndBurn);

    record.write_header(header);
    storage.commit();
}
