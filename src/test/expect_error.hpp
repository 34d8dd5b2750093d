#pragma once
#include "crypto/identity.hpp"
#include "general/errors.hpp"
#include <cassert>
#include <iostream>

template <typename F>
void expect_error(int32_t code, F&& f)
{
    try {
        f();
    } catch (const Error& e) {
        if (e.code != code)
            std::cerr << "expected " << Error(code).format() << ", got " << e.format() << std::endl;
        assert(e.code == code);
        return;
    }
    std::cerr << "expected " << Error(code).format() << ", nothing thrown" << std::endl;
    assert(false);
}

inline std::array<uint8_t, 32> tagged_bytes(uint8_t tag, uint8_t sub)
{
    std::array<uint8_t, 32> a {};
    a[0] = tag;
    a[1] = sub;
    a[31] = 0xa5;
    return a;
}

// distinct test identities
inline Identity tagged(uint8_t tag, uint8_t sub = 0)
{
    return Identity(tagged_bytes(tag, sub));
}
