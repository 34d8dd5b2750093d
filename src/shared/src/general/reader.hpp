#pragma once

#include "general/byte_order.hpp"
#include "general/errors.hpp"
#include "view.hpp"
#include <cstring>
#include <span>

// inline funcitons for access
inline uint64_t readuint64(const uint8_t* pos)
{
    uint64_t val;
    memcpy(&val, pos, 8);
    return from_le64(val);
}
inline uint16_t readuint16(const uint8_t* pos)
{
    uint16_t res;
    memcpy(&res, pos, 2);
    return from_le16(res);
}
inline uint8_t readuint8(const uint8_t* pos) { return *(pos); }

// reads the little-endian u64 stored at [offset, offset+8), throws if
// the buffer is too short
inline uint64_t readuint64_at(std::span<const uint8_t> s, size_t offset)
{
    if (offset + 8 > s.size())
        throw Error(EINV_ACCDATA);
    return readuint64(s.data() + offset);
}

// byte sequence stream-like reader with self-advancing cursor
class Reader {
    inline void read(void* out, size_t bytes)
    {
        auto newpos { pos + bytes };
        if (newpos > end)
            throw Error(EINV_ACCDATA);
        memcpy(out, pos, bytes);
        pos = newpos;
    }
    template <typename T>
    T read()
    {
        T t;
        read(&t, sizeof(T));
        return t;
    }

public:
    Reader(std::span<const uint8_t> s)
        : begin(s.data())
        , pos(begin)
        , end(s.data() + s.size())
    {
    }
    uint64_t uint64()
    {
        static_assert(sizeof(uint64_t) == 8);
        return from_le64(read<uint64_t>());
    }
    uint16_t uint16()
    {
        static_assert(sizeof(uint16_t) == 2);
        return from_le16(read<uint16_t>());
    }
    uint8_t uint8()
    {
        return read<uint8_t>();
    }
    operator uint64_t()
    {
        return uint64();
    }
    operator uint16_t()
    {
        return uint16();
    }
    operator uint8_t()
    {
        return uint8();
    }
    template <size_t N>
    View<N> view()
    {
        View<N> v(pos);
        skip(N);
        return v;
    }

    template <size_t N>
    operator View<N>()
    {
        return view<N>();
    }
    template <size_t N>
    operator std::array<uint8_t, N>()
    {
        return view<N>();
    }

    void skip(size_t nbytes)
    {
        if (nbytes > remaining())
            throw Error(EINV_ACCDATA);
        pos += nbytes;
    };
    bool eof() const { return pos == end; }
    const uint8_t* cursor() const { return pos; }
    size_t offset() const { return pos - begin; }
    size_t remaining() const { return end - pos; }

private:
    const uint8_t* begin;
    const uint8_t* pos;
    const uint8_t* end;
};
