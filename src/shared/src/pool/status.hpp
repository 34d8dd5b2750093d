#pragma once
#include "tools/variant.hpp"
#include <cstdint>
#include <string>

namespace pool {

// number of unsettled orders, always in [1, 64]
class PendingCount {
    uint8_t n;
    struct Token { };
    constexpr PendingCount(uint8_t n, Token)
        : n(n)
    {
    }

public:
    static constexpr uint8_t max { 64 };
    static constexpr PendingCount one() { return { 1, Token() }; }
    static PendingCount from_number_throw(uint8_t);
    constexpr uint8_t value() const { return n; }
    bool is_max() const { return n == max; }
    bool is_one() const { return n == 1; }
    // callers check is_max() / is_one() first
    PendingCount incremented() const;
    PendingCount decremented() const;
    bool operator==(const PendingCount&) const = default;
};

namespace status {
struct Uninitialized {
    bool operator==(const Uninitialized&) const = default;
};
struct Unlocked {
    bool operator==(const Unlocked&) const = default;
};
struct Locked {
    bool operator==(const Locked&) const = default;
};
struct PendingOrder {
    PendingCount pending;
    bool operator==(const PendingOrder&) const = default;
};
struct LockedPendingOrder {
    PendingCount pending;
    bool operator==(const LockedPendingOrder&) const = default;
};
}

using PoolStatusVariant = sp::variant<status::Uninitialized, status::Unlocked,
    status::Locked, status::PendingOrder, status::LockedPendingOrder>;

// Status byte layout: the top 2 bits hold the mode, the low 6 bits hold
// the pending count minus one. A zero byte is Uninitialized.
class PoolStatus : public PoolStatusVariant {
public:
    using parent_t = PoolStatusVariant;
    using parent_t::parent_t;
    static constexpr uint8_t PENDING_ORDER_FLAG { 1 << 6 };
    static constexpr uint8_t PENDING_ORDER_MASK { 0x3f };
    static constexpr uint8_t LOCKED_FLAG { 2 << 6 };
    static constexpr uint8_t UNLOCKED_FLAG { PENDING_ORDER_MASK };

    static PoolStatus from_byte(uint8_t);
    uint8_t to_byte() const;

    bool is_initialized() const { return !holds<status::Uninitialized>(); }
    bool is_locked() const { return holds<status::Locked>() || holds<status::LockedPendingOrder>(); }
    bool has_pending_orders() const { return holds<status::PendingOrder>() || holds<status::LockedPendingOrder>(); }
    // 0 when no order is pending
    uint8_t pending_orders() const;
    std::string to_string() const;
    bool operator==(const PoolStatus& other) const
    {
        return static_cast<const parent_t&>(*this) == static_cast<const parent_t&>(other);
    }
};

// Status after a new order was placed. newOpenOrder is true when the
// order-tracking record showed zero outstanding quantity on both legs,
// otherwise the order reuses an already counted pending slot.
[[nodiscard]] PoolStatus open_order(const PoolStatus&, bool newOpenOrder);

// Status after an order-tracking record was fully drained.
[[nodiscard]] PoolStatus settle_order(const PoolStatus&);

// Deposits need an unlocked pool without pending orders.
void check_accepts_deposits(const PoolStatus&);

// Redemptions are blocked while orders are pending.
void check_accepts_redemptions(const PoolStatus&);
}
