#pragma once
#include <algorithm>
#include <array>
#include <cassert>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>

// non-owning fixed-size window into a storage buffer
template <size_t N>
struct View {
    static constexpr size_t size() { return N; }
    static constexpr size_t byte_size() { return N; }
    const uint8_t* data() const { return pos; }
    uint8_t operator[](size_t i) const { return *(pos + i); }
    std::span<const uint8_t, N> span() const { return std::span<const uint8_t, N>(pos, N); }
    operator std::span<const uint8_t>() const { return span(); }
    operator std::array<uint8_t, N>() const
    {
        std::array<uint8_t, N> res;
        std::copy(pos, pos + N, res.begin());
        return res;
    }
    bool is_zero() const
    {
        return std::all_of(pos, pos + N, [](uint8_t b) { return b == 0; });
    }
    auto operator<=>(const View& v) const
    {
        auto i = memcmp(pos, v.pos, N);
        if (i < 0)
            return std::strong_ordering::less;
        else if (i > 0)
            return std::strong_ordering::greater;
        else
            return std::strong_ordering::equal;
    }
    bool operator==(const View& v) const
    {
        return operator<=>(v) == 0;
    }
    View(const std::array<uint8_t, N>& a)
        : View(a.data())
    {
    }
    explicit View(const uint8_t* pos)
        : pos(pos)
    {
        assert(pos != nullptr);
    }

protected:
    const uint8_t* pos;
};
