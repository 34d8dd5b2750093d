#pragma once
#include <cstdint>

// order vocabulary of the external order-book market
namespace pool {
enum class Side : uint8_t {
    Bid = 0,
    Ask = 1
};

enum class OrderType : uint8_t {
    Limit = 0,
    ImmediateOrCancel = 1,
    PostOnly = 2
};

enum class SelfTradeBehavior : uint8_t {
    DecrementTake = 0,
    CancelProvide = 1,
    AbortTransaction = 2
};

inline const char* to_string(Side s)
{
    return s == Side::Bid ? "bid" : "ask";
}
}
