#include "expect_error.hpp"
#include "pool/status.hpp"
using namespace std;
using namespace pool;

PoolStatus pending(uint8_t n)
{
    return status::PendingOrder { PendingCount::from_number_throw(n) };
}
PoolStatus locked_pending(uint8_t n)
{
    return status::LockedPendingOrder { PendingCount::from_number_throw(n) };
}

void test_pending_count()
{
    expect_error(EINV_ARGUMENT, [] { PendingCount::from_number_throw(0); });
    expect_error(EINV_ARGUMENT, [] { PendingCount::from_number_throw(65); });
    auto c { PendingCount::one() };
    assert(c.is_one() && c.value() == 1);
    assert(c.incremented().value() == 2);
    auto m { PendingCount::from_number_throw(64) };
    assert(m.is_max());
    expect_error(EARITHMETIC, [&] { (void)m.incremented(); });
}

void test_open_order()
{
    expect_error(EUNINITACC, [] { (void)open_order(status::Uninitialized {}, true); });
    assert(open_order(status::Unlocked {}, true) == pending(1));
    // an already counted tracking record still opens the first pending slot
    assert(open_order(status::Unlocked {}, false) == pending(1));
    assert(open_order(status::Locked {}, true) == locked_pending(1));

    assert(open_order(pending(3), true) == pending(4));
    assert(open_order(pending(3), false) == pending(3));
    assert(open_order(locked_pending(63), true) == locked_pending(64));
    assert(open_order(locked_pending(5), false) == locked_pending(5));

    expect_error(EARITHMETIC, [] { (void)open_order(pending(64), true); });
    expect_error(EARITHMETIC, [] { (void)open_order(locked_pending(64), true); });
    assert(open_order(pending(64), false) == pending(64));
}

void test_settle_order()
{
    assert(settle_order(pending(1)) == status::Unlocked {});
    assert(settle_order(locked_pending(1)) == status::Locked {});
    assert(settle_order(pending(64)) == pending(63));
    assert(settle_order(locked_pending(2)) == locked_pending(1));
    expect_error(EINV_ACCDATA, [] { (void)settle_order(status::Unlocked {}); });
    expect_error(EINV_ACCDATA, [] { (void)settle_order(status::Locked {}); });
    expect_error(EINV_ACCDATA, [] { (void)settle_order(status::Uninitialized {}); });
}

void test_open_then_settle_all()
{
    PoolStatus s { status::Unlocked {} };
    for (int i = 0; i < 64; ++i)
        s = open_order(s, true);
    assert(s == pending(64));
    for (int i = 0; i < 64; ++i)
        s = settle_order(s);
    assert(s == status::Unlocked {});
}

void test_gates()
{
    check_accepts_deposits(status::Unlocked {});
    expect_error(ELOCKEDOP, [] { check_accepts_deposits(status::Locked {}); });
    expect_error(ELOCKEDOP, [] { check_accepts_deposits(pending(1)); });
    expect_error(ELOCKEDOP, [] { check_accepts_deposits(locked_pending(2)); });
    expect_error(EUNINITACC, [] { check_accepts_deposits(status::Uninitialized {}); });

    check_accepts_redemptions(status::Unlocked {});
    check_accepts_redemptions(status::Locked {});
    expect_error(ELOCKEDOP, [] { check_accepts_redemptions(pending(1)); });
    expect_error(ELOCKEDOP, [] { check_accepts_redemptions(locked_pending(1)); });
    assert(Error(ELOCKEDOP).retryable());
    assert(!Error(EARITHMETIC).retryable());
}

int main()
{
    test_pending_count();
    test_open_order();
    test_settle_order();
    test_open_then_settle_all();
    test_gates();
    cout << "status tests passed" << endl;
}
