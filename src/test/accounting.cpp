#include "expect_error.hpp"
#include "general/prod.hpp"
#include "pool/accounting.hpp"
#include <limits>
using namespace std;
using namespace pool;

constexpr uint64_t U64_MAX { numeric_limits<uint64_t>::max() };

void test_prod128()
{
    assert(mul_div_floor(10, 20, 3) == 66);
    assert(mul_div_floor(U64_MAX, U64_MAX, U64_MAX) == U64_MAX);
    assert(mul_div_floor(U64_MAX, 2, 2) == U64_MAX);
    assert(!mul_div_floor(U64_MAX, 2, 1).has_value());
    assert(mul_div_floor(uint64_t(1) << 40, uint64_t(1) << 40, uint64_t(1) << 50) == uint64_t(1) << 30);
    // (2^64-1) * 3 / 7, computed in 128 bit
    assert(mul_div_floor(U64_MAX, 3, 7) == 7905747460161236406ull);
    assert(Prod128(1 << 16, 5).shr16() == 5);
    assert(!Prod128(U64_MAX, 1 << 17).shr16().has_value());
}

void test_split_fee()
{
    auto s { split_fee(25) };
    assert(s.signalProvider == 12);
    assert(s.platformFee == 6);
    assert(s.buyAndBurn == 7);
    assert(s.total() == 25);
    assert(split_fee(0).total() == 0);
    assert(split_fee(3).buyAndBurn == 2);
}

void test_deposit_ratio_clamp()
{
    // a depositor offering [50, 50] against pool balances [100, 200]
    auto q { price_deposit(1000, 1000, { 100, 200 }, { 50, 50 }, 0) };
    assert(q.effectiveShares == 250);
    assert(q.transfers == (vector<uint64_t> { 25, 50 }));
    assert(q.fee == 0);
    assert(q.netShares == 250);

    // the requested amount caps the effective amount
    q = price_deposit(100, 1000, { 100, 200 }, { 50, 50 }, 0);
    assert(q.effectiveShares == 100);
    assert(q.transfers == (vector<uint64_t> { 10, 20 }));
}

void test_deposit_fee()
{
    auto q { price_deposit(1000, 1000, { 100, 200 }, { 50, 50 }, 6554) };
    assert(q.effectiveShares == 250);
    assert(q.fee == 25); // 6554 * 250 >> 16
    assert(q.feeSplit.signalProvider == 12);
    assert(q.feeSplit.platformFee == 6);
    assert(q.feeSplit.buyAndBurn == 7);
    assert(q.netShares == 225);
    assert(q.netShares + q.feeSplit.total() == q.effectiveShares);
}

void test_deposit_edge_cases()
{
    // an empty pool asset does not limit the deposit
    auto q { price_deposit(1000, 1000, { 0, 200 }, { 0, 50 }, 0) };
    assert(q.effectiveShares == 250);
    assert(q.transfers == (vector<uint64_t> { 0, 50 }));

    // huge offered balances saturate instead of overflowing
    q = price_deposit(U64_MAX, 1000, { 1 }, { U64_MAX }, 0);
    assert(q.effectiveShares == U64_MAX);
    assert(q.transfers[0] == mul_div_floor(q.effectiveShares, 1, 1000));

    expect_error(EZEROAMOUNTS, [] { (void)price_deposit(1, 1000, { 100, 200 }, { 50, 50 }, 0); });
    expect_error(EZEROAMOUNTS, [] { (void)price_deposit(0, 1000, { 100 }, { 50 }, 0); });
    expect_error(EINV_ARGUMENT, [] { (void)price_deposit(10, 1000, { 100 }, { 50, 50 }, 0); });
    expect_error(EARITHMETIC, [] { (void)price_deposit(10, 0, { 100 }, { 50 }, 0); });
}

void test_redemption()
{
    auto p { price_redemption(250, 500, 1000, { 125, 250, 3 }) };
    assert(p == (vector<uint64_t> { 31, 62, 0 }));

    // redeeming everything pays out everything
    p = price_redemption(1000, 1000, 1000, { 125, 250, 3 });
    assert(p == (vector<uint64_t> { 125, 250, 3 }));

    expect_error(EINSUFFUNDS, [] { (void)price_redemption(501, 500, 1000, { 125 }); });
    // payouts never exceed the pool balance
    p = price_redemption(999, 999, 1000, { U64_MAX });
    assert(p[0] <= U64_MAX);
    assert(p[0] == mul_div_floor(999, U64_MAX, 1000));
}

void test_size_trade()
{
    auto t { size_trade(1000, 32768, Side::Bid, 10, 7) };
    assert(t.amountToTrade == 500);
    assert(t.lots == 71); // pc lot size for a buy
    assert(t.maxQuoteIncludingFees == 500);
    assert(!t.exhaustsSource);

    t = size_trade(1000, 32768, Side::Ask, 10, 7);
    assert(t.lots == 50); // coin lot size for a sell
    assert(t.maxQuoteIncludingFees == 1);

    t = size_trade(65536, 65535, Side::Ask, 1, 1);
    assert(t.amountToTrade == 65535);
    assert(!t.exhaustsSource);

    expect_error(ETOOSMALL, [] { (void)size_trade(1000, 32768, Side::Ask, 501, 1); });
    expect_error(ETOOSMALL, [] { (void)size_trade(1, 1, Side::Bid, 1, 1); });
    expect_error(EARITHMETIC, [] { (void)size_trade(1000, 32768, Side::Bid, 1, 0); });
    expect_error(EINV_ARGUMENT, [] { (void)size_trade(1000, 0, Side::Bid, 1, 1); });
}

void test_pow_fixedpoint()
{
    const uint64_t half { 1 << 15 };
    for (uint64_t n = 1; n <= 16; ++n)
        assert(pow_fixedpoint_u16(half, n) == uint64_t(1) << (16 - n));
    assert(pow_fixedpoint_u16(65535, 1) == 65535);
    assert(pow_fixedpoint_u16(65535, 2) == 65534);
    assert(pow_fixedpoint_u16(FIXED_POINT_ONE, 1000) == FIXED_POINT_ONE);
    assert(pow_fixedpoint_u16(0, 5) == 0);
}

void test_accrue_fees()
{
    const uint64_t last { 1'000'000 };
    const uint64_t period { 604800 };

    expect_error(ELOCKEDOP, [&] { (void)accrue_fees(32767, last, period, last + period - 1, 1'000'000); });

    // one period at a retained factor of one half
    auto a { accrue_fees(32767, last, period, last + period, 1'000'000) };
    assert(a.periods == 1);
    assert(a.sharesToMint == 999969); // 32767 * 10^6 / 32768
    assert(a.split.signalProvider == 499984);
    assert(a.split.platformFee == 249992);
    assert(a.split.buyAndBurn == 249993);
    assert(a.nextCollectionTimestamp == last + period);

    // two whole periods, the partial third one is left for later
    a = accrue_fees(32767, last, period, last + 3 * period - 1, 1'000'000);
    assert(a.periods == 2);
    assert(a.sharesToMint == 2999938); // 49151 * 10^6 / 16384
    assert(a.nextCollectionTimestamp == last + 2 * period);

    // a zero fee ratio mints nothing
    a = accrue_fees(0, last, period, last + period, 1'000'000);
    assert(a.sharesToMint == 0);
    assert(a.split.total() == 0);

    // the retained fraction compounds to zero
    expect_error(EARITHMETIC, [&] { (void)accrue_fees(65535, last, period, last + period, 1'000'000); });
    expect_error(EARITHMETIC, [&] { (void)accrue_fees(100, last, 0, last + period, 1'000'000); });
    expect_error(EARITHMETIC, [&] { (void)accrue_fees(100, last, period, last - 1, 1'000'000); });
}

void test_fees_overdue()
{
    assert(!fees_overdue(1000, 100, 1100));
    assert(fees_overdue(1000, 100, 1101));
    assert(!fees_overdue(1000, 100, 999));
}

int main()
{
    test_prod128();
    test_split_fee();
    test_deposit_ratio_clamp();
    test_deposit_fee();
    test_deposit_edge_cases();
    test_redemption();
    test_size_trade();
    test_pow_fixedpoint();
    test_accrue_fees();
    test_fees_overdue();
    cout << "accounting tests passed" << endl;
}
