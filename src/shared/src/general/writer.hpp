#pragma once

#include "general/byte_order.hpp"
#include "general/errors.hpp"
#include <array>
#include <cassert>
#include <cstdint>
#include <cstring>
#include <span>

// byte sequence writer with self-advancing cursor, writes integers
// little-endian
class Writer {
public:
    Writer(uint8_t* pos, size_t n)
        : pos(pos)
        , end(pos + n)
    {
    }
    Writer(std::span<uint8_t> s)
        : Writer(s.data(), s.size())
    {
    }
    ~Writer() { assert(pos <= end); }

    void write(std::span<const uint8_t> s)
    {
        if (remaining() < s.size())
            throw Error(EINV_ACCDATA);
        memcpy(pos, s.data(), s.size());
        pos += s.size();
    }

    Writer& operator<<(std::span<const uint8_t> s)
    {
        write(s);
        return *this;
    }
    template <size_t N>
    Writer& operator<<(const std::array<uint8_t, N>& a)
    {
        write(a);
        return *this;
    }
    Writer& operator<<(uint8_t v)
    {
        write({ &v, 1 });
        return *this;
    }
    Writer& operator<<(uint16_t v)
    {
        auto le { to_le16(v) };
        write({ reinterpret_cast<const uint8_t*>(&le), sizeof(le) });
        return *this;
    }
    Writer& operator<<(uint64_t v)
    {
        auto le { to_le64(v) };
        write({ reinterpret_cast<const uint8_t*>(&le), sizeof(le) });
        return *this;
    }

    uint8_t* cursor() { return pos; }
    size_t remaining()
    {
        assert(end >= pos);
        return end - pos;
    }

private:
    uint8_t* pos;
    uint8_t* const end;
};
