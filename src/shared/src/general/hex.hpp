#pragma once
#include "errors.hpp"
#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

std::string serialize_hex(std::span<const uint8_t> data);

template <size_t N>
std::string serialize_hex(const std::array<uint8_t, N>& arr)
{
    return serialize_hex(std::span<const uint8_t>(arr));
}

[[nodiscard]] bool parse_hex(std::string_view in, uint8_t* out, size_t out_size);

template <size_t N>
[[nodiscard]] bool parse_hex(std::string_view in, std::array<uint8_t, N>& out)
{
    return parse_hex(in, out.data(), out.size());
}

template <size_t N>
std::array<uint8_t, N> hex_to_arr(std::string_view in)
{
    std::array<uint8_t, N> out;
    if (!parse_hex(in, out.data(), out.size()))
        throw Error(EINV_HEX);
    return out;
}

// accepts surrounding whitespace, as written by hexdump-like tools
std::vector<uint8_t> hex_to_vec(std::string_view in);
