#pragma once
#include <cstddef>
#include <cassert>
#include <cstdint>
#include <optional>

// exact 128 bit product of two 64 bit factors
class Prod128 {
public:
  Prod128(uint64_t a, uint64_t b) {
    const uint64_t a0{a >> 32};
    const uint64_t a1{a & 0xFFFFFFFFul};
    const uint64_t b0{b >> 32};
    const uint64_t b1{b & 0xFFFFFFFFul};

    const uint64_t m00{(a0 * b0)};
    const uint64_t m01{(a0 * b1)};
    const uint64_t m10{(a1 * b0)};
    const uint64_t m11{(a1 * b1)};

    const uint64_t overlap3 =
        ((m01 & 0xFFFFFFFFull) + (m10 & 0xFFFFFFFFul) + (m11 >> 32));

    upper = m00 + ((m01 >> 32) + (m10 >> 32) + (overlap3 >> 32));
    lower = (m11 & 0xFFFFFFFFul) + (overlap3 << 32);
  }
  auto operator<=>(const Prod128 &) const = default;

  bool is_zero() const { return upper == 0 && lower == 0; }

  // the product shifted right by 16 bits, std::nullopt if it exceeds 64 bits
  [[nodiscard]] std::optional<uint64_t> shr16() const {
    if ((upper >> 16) != 0)
      return {};
    return (upper << 48) | (lower >> 16);
  }

  // returns std::nullopt on overflow, v must be nonzero
  [[nodiscard]] std::optional<uint64_t> divide_floor(uint64_t v) const {
    assert(v != 0);
    if (upper == 0)
      return lower / v;
    if (upper >= v)
      return {}; // quotient exceeds 64 bits
    uint64_t rem{upper};
    uint64_t low{lower};
    uint64_t quotient{0};
    for (size_t i{0}; i < 64; ++i) {
      const bool carry{(rem & 0x8000000000000000ull) != 0};
      rem = (rem << 1) | (low >> 63);
      low <<= 1;
      quotient <<= 1;
      if (carry || rem >= v) {
        rem -= v;
        quotient |= 1;
      }
    }
    return quotient;
  }
  auto v0() const { return upper; }
  auto v1() const { return lower; }

private:
  uint64_t upper;
  uint64_t lower;
};

// floor(a * b / c) in 128 bit precision, std::nullopt if the quotient
// does not fit 64 bits
[[nodiscard]] inline std::optional<uint64_t> mul_div_floor(uint64_t a, uint64_t b, uint64_t c) {
  return Prod128(a, b).divide_floor(c);
}
