#include "identity.hpp"
#include "general/errors.hpp"
#include "general/hex.hpp"

std::string IdentityView::hex_string() const
{
    return serialize_hex(span());
}

std::optional<Identity> Identity::parse_string(std::string_view hex)
{
    Identity i;
    if (parse_hex(hex, i))
        return i;
    return {};
}

Identity Identity::from_hex_throw(std::string_view hex)
{
    if (auto i { parse_string(hex) })
        return *i;
    throw Error(EINV_HEX);
}
