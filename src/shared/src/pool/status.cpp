#include "status.hpp"
#include "general/errors.hpp"
#include "spdlog/spdlog.h"

namespace pool {

PendingCount PendingCount::from_number_throw(uint8_t v)
{
    if (v == 0 || v > max)
        throw Error(EINV_ARGUMENT);
    return { v, Token() };
}

PendingCount PendingCount::incremented() const
{
    if (is_max())
        throw Error(EARITHMETIC);
    return { uint8_t(n + 1), Token() };
}

PendingCount PendingCount::decremented() const
{
    if (is_one())
        throw Error(EBUG);
    return { uint8_t(n - 1), Token() };
}

PoolStatus PoolStatus::from_byte(uint8_t b)
{
    if (b == 0)
        return status::Uninitialized {};
    switch (b >> 6) {
    case 0:
        return status::Unlocked {};
    case 1:
        return status::PendingOrder { PendingCount::from_number_throw((b & PENDING_ORDER_MASK) + 1) };
    case 2:
        return status::Locked {};
    case 3:
        return status::LockedPendingOrder { PendingCount::from_number_throw((b & PENDING_ORDER_MASK) + 1) };
    }
    throw Error(EINV_ACCDATA);
}

uint8_t PoolStatus::to_byte() const
{
    return visit_overload(
        [](const status::Uninitialized&) -> uint8_t { return 0; },
        [](const status::Unlocked&) -> uint8_t { return UNLOCKED_FLAG; },
        [](const status::Locked&) -> uint8_t { return LOCKED_FLAG; },
        [](const status::PendingOrder& p) -> uint8_t {
            return PENDING_ORDER_FLAG | (PENDING_ORDER_MASK & (p.pending.value() - 1));
        },
        [](const status::LockedPendingOrder& p) -> uint8_t {
            return LOCKED_FLAG | PENDING_ORDER_FLAG | (PENDING_ORDER_MASK & (p.pending.value() - 1));
        });
}

uint8_t PoolStatus::pending_orders() const
{
    return visit_overload(
        [](const status::PendingOrder& p) -> uint8_t { return p.pending.value(); },
        [](const status::LockedPendingOrder& p) -> uint8_t { return p.pending.value(); },
        [](const auto&) -> uint8_t { return 0; });
}

std::string PoolStatus::to_string() const
{
    return visit_overload(
        [](const status::Uninitialized&) -> std::string { return "Uninitialized"; },
        [](const status::Unlocked&) -> std::string { return "Unlocked"; },
        [](const status::Locked&) -> std::string { return "Locked"; },
        [](const status::PendingOrder& p) -> std::string {
            return "PendingOrder(" + std::to_string(p.pending.value()) + ")";
        },
        [](const status::LockedPendingOrder& p) -> std::string {
            return "LockedPendingOrder(" + std::to_string(p.pending.value()) + ")";
        });
}

PoolStatus open_order(const PoolStatus& s, bool newOpenOrder)
{
    return s.visit_overload(
        [](const status::Uninitialized&) -> PoolStatus {
            throw Error(EUNINITACC);
        },
        [](const status::Unlocked&) -> PoolStatus {
            return status::PendingOrder { PendingCount::one() };
        },
        [](const status::Locked&) -> PoolStatus {
            return status::LockedPendingOrder { PendingCount::one() };
        },
        [&](const status::PendingOrder& p) -> PoolStatus {
            if (!newOpenOrder)
                return p;
            if (p.pending.is_max()) {
                spdlog::warn("Maximum number of active orders has been reached. Settle or cancel a pending order.");
                throw Error(EARITHMETIC);
            }
            return status::PendingOrder { p.pending.incremented() };
        },
        [&](const status::LockedPendingOrder& p) -> PoolStatus {
            if (!newOpenOrder)
                return p;
            if (p.pending.is_max()) {
                spdlog::warn("Maximum number of active orders has been reached. Settle or cancel a pending order.");
                throw Error(EARITHMETIC);
            }
            return status::LockedPendingOrder { p.pending.incremented() };
        });
}

PoolStatus settle_order(const PoolStatus& s)
{
    return s.visit_overload(
        [](const status::PendingOrder& p) -> PoolStatus {
            if (p.pending.is_one())
                return status::Unlocked {};
            return status::PendingOrder { p.pending.decremented() };
        },
        [](const status::LockedPendingOrder& p) -> PoolStatus {
            if (p.pending.is_one())
                return status::Locked {};
            return status::LockedPendingOrder { p.pending.decremented() };
        },
        [](const auto&) -> PoolStatus {
            spdlog::warn("The pool has no pending orders.");
            throw Error(EINV_ACCDATA);
        });
}

void check_accepts_deposits(const PoolStatus& s)
{
    s.visit_overload(
        [](const status::Unlocked&) {},
        [](const status::Locked&) {
            spdlog::warn("The signal provider has currently locked the pool. No buy-ins are possible for now.");
            throw Error(ELOCKEDOP);
        },
        [](const status::LockedPendingOrder&) {
            spdlog::warn("The signal provider has currently locked the pool. No buy-ins are possible for now.");
            throw Error(ELOCKEDOP);
        },
        [](const status::PendingOrder&) {
            spdlog::warn("The pool has one or more pending orders. No buy-ins are possible for now. Try again later.");
            throw Error(ELOCKEDOP);
        },
        [](const status::Uninitialized&) {
            throw Error(EUNINITACC);
        });
}

void check_accepts_redemptions(const PoolStatus& s)
{
    if (s.has_pending_orders()) {
        spdlog::warn("The pool has one or more pending orders. No buy-outs are possible for now. Try again later.");
        throw Error(ELOCKEDOP);
    }
}
}
