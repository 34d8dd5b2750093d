#pragma once
#include "general/view.hpp"
#include <array>
#include <cstring>
#include <optional>
#include <string>
#include <string_view>

class Identity;
class IdentityView : public View<32> {
public:
    explicit IdentityView(const uint8_t* pos)
        : View<32>(pos) { };
    IdentityView(const Identity&);
    std::string hex_string() const;
};

// 32 byte account identity as used by the host, the token ledger and
// the market
class Identity : public std::array<uint8_t, 32> {
    Identity() = default;

public:
    static constexpr size_t byte_size() { return 32; }
    [[nodiscard]] static std::optional<Identity> parse_string(std::string_view);
    static Identity from_hex_throw(std::string_view);
    static Identity zero()
    {
        Identity i;
        i.fill(0);
        return i;
    }
    Identity(std::array<uint8_t, 32> other)
        : array(std::move(other))
    {
    }
    explicit Identity(IdentityView iv)
    {
        memcpy(data(), iv.data(), 32);
    }
    Identity(const Identity&) = default;
    Identity(Identity&&) = default;
    Identity& operator=(const Identity&) = default;
    bool operator==(const Identity&) const = default;
    bool is_zero() const { return IdentityView(*this).is_zero(); }
    std::string hex_string() const { return IdentityView(*this).hex_string(); }
};

inline IdentityView::IdentityView(const Identity& i)
    : IdentityView(i.data())
{
}

inline bool operator==(const Identity& i, const IdentityView& iv)
{
    return (IdentityView(i) == iv);
};

// identity with a distinct type so that seeds and keys cannot be mixed up
template <typename T>
class GenericIdentity : public Identity {
public:
    explicit GenericIdentity(Identity i)
        : Identity(std::move(i))
    {
    }
    explicit GenericIdentity(IdentityView iv)
        : Identity(iv)
    {
    }
    explicit GenericIdentity(std::array<uint8_t, 32> other)
        : Identity(std::move(other))
    {
    }
    [[nodiscard]] static std::optional<T> parse_string(std::string_view s)
    {
        if (auto p { Identity::parse_string(s) })
            return T { *p };
        return {};
    }
};

// identity anchor of a pool, every pool-owned key is derived from it
class PoolSeed : public GenericIdentity<PoolSeed> {
public:
    using GenericIdentity::GenericIdentity;
};
