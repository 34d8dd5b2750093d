#include "hex.hpp"
#include <cctype>

std::string serialize_hex(std::span<const uint8_t> data)
{
    constexpr const char* h = "0123456789abcdef";
    std::string out;
    out.resize(2 * data.size());
    for (size_t i = 0; i < data.size(); ++i) {
        out[2 * i] = h[data[i] >> 4];
        out[2 * i + 1] = h[data[i] & 15];
    }
    return out;
}

namespace {
inline uint8_t hexdigit(char c, bool& valid)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    valid = false;
    return 0;
}
}

bool parse_hex(std::string_view in, uint8_t* out, size_t out_size)
{
    if (in.size() != out_size * 2)
        return false;
    bool valid = true;
    for (size_t i = 0; i < out_size && valid; ++i) {
        out[i] = (hexdigit(in[2 * i], valid) << 4)
            + (hexdigit(in[2 * i + 1], valid));
    }
    return valid;
}

std::vector<uint8_t> hex_to_vec(std::string_view in)
{
    std::string compact;
    compact.reserve(in.size());
    for (char c : in) {
        if (!std::isspace(static_cast<unsigned char>(c)))
            compact.push_back(c);
    }
    if (compact.size() % 2 != 0)
        throw Error(EINV_HEX);
    std::vector<uint8_t> out(compact.size() / 2);
    if (!parse_hex(compact, out.data(), out.size()))
        throw Error(EINV_HEX);
    return out;
}
