#include "config.hpp"
#include "general/errors.hpp"
#include "spdlog/spdlog.h"
#include "toml++/toml.hpp"
#include <cassert>
#include <limits>
#include <map>
#include <optional>
#include <sstream>

using namespace std;

namespace {
constexpr std::string_view PLATFORM_FEE_OWNER { "1dcd6965e51e97903aeb295859e25274e4dfc636eb9d133293422d10e1882684" };
constexpr std::string_view PLATFORM_BUY_AND_BURN_OWNER { "299b3909a2c5bd99f1ccdd4a3c241d5277cdb5b859091031563cac13cbd08449" };

std::runtime_error failed_convert(const toml::node& n)
{
    return std::runtime_error("Cannot parse configuration value starting at line "s + std::to_string(n.source().begin.line) + ", column "s + std::to_string(n.source().begin.column) + ".");
}

template <typename T>
std::optional<T> config_convert(const toml::node& n)
{
    if (auto val = n.value<T>()) {
        return val.value();
    }
    throw failed_convert(n);
}

template <>
std::optional<Identity> config_convert(const toml::node& n)
{
    if (auto sv { n.value<std::string_view>() }) {
        if (auto i { Identity::parse_string(*sv) })
            return *i;
        spdlog::error("Identity must be 64 hexadecimal characters, got \"{}\"", *sv);
    }
    throw failed_convert(n);
}

template <>
std::optional<spdlog::level::level_enum> config_convert(const toml::node& n)
{
    if (auto sv { n.value<std::string_view>() }) {
        auto l { spdlog::level::from_str(std::string(*sv)) };
        // from_str maps unknown names to off
        if (l != spdlog::level::off || *sv == "off")
            return l;
    }
    throw failed_convert(n);
}

struct TableReaderData {
    const toml::table& tbl;
    std::string_view filepath;
    mutable std::map<toml::key, bool> keyUsed;
};

struct TableReader : public TableReaderData {
    bool report { true };
    TableReader(const toml::table& tbl, std::string_view filepath)
        : TableReaderData(tbl, filepath, {})
    {
        for (auto& [k, v] : tbl) {
            keyUsed.emplace(k, false);
        }
    }
    TableReader(const TableReader&) = delete;
    TableReader(TableReader&& a)
        : TableReaderData(std::move(a))
    {
        a.report = false;
    };
    ~TableReader()
    {
        if (report) {
            for (auto& [k, used] : keyUsed) {
                if (!used) {
                    spdlog::warn("Ignoring configuration setting \""s + std::string(k.str()) + "\" at line "s + std::to_string(k.source().begin.line) + " in "s + string(filepath));
                }
            }
        }
    }

    std::optional<TableReader> subtable(std::string_view s)
    {
        if (auto it { tbl.find(s) }; it != tbl.end()) {
            keyUsed[it->first] = true;
            if (it->second.is_table() == false)
                throw std::runtime_error("Configuration "s + std::string(s) + " must be a table."s);
            auto p { it->second.as_table() };
            assert(p != nullptr);
            return TableReader { *p, filepath };
        }
        return std::nullopt;
    }

    struct Entry {
        const toml::node* v;

        template <typename T>
        std::optional<T> get() const
        {
            return config_convert<T>(*v);
        }
    };
    std::optional<Entry> operator[](std::string_view key) const
    {
        if (auto it { tbl.find(key) }; it != tbl.end()) {
            keyUsed[it->first] = true;
            return { Entry { &it->second } };
        }
        return std::nullopt;
    }
};

template <typename T>
void fill(
    T& dst,
    std::optional<TableReader>& tblreader,
    std::string_view tblkey)
{
    if (tblreader) {
        if (auto oe { (*tblreader)[tblkey] }) {
            if (auto v { oe->get<T>() }) {
                dst = *v;
                return;
            }
        }
    }
}

// TOML integers are signed 64 bit
int64_t toml_integer(uint64_t v, std::string_view key)
{
    if (v > uint64_t(std::numeric_limits<int64_t>::max()))
        throw std::runtime_error("Configuration value "s + std::string(key) + " exceeds the TOML integer range.");
    return int64_t(v);
}

ProgramConfig from_table(const toml::table& tbl, std::string_view sourceName)
{
    auto c { ProgramConfig::defaults() };
    TableReader root(tbl, sourceName);

    auto s_platform { root.subtable("platform") };
    fill(c.platform.feeOwner, s_platform, "fee_owner");
    fill(c.platform.buyAndBurnOwner, s_platform, "buy_and_burn_owner");

    auto s_pool { root.subtable("pool") };
    fill(c.pool.minFeeCollectionPeriod, s_pool, "min_fee_collection_period");
    fill(c.pool.initialShareSupply, s_pool, "initial_share_supply");
    fill(c.pool.shareDecimals, s_pool, "share_decimals");
    if (c.pool.initialShareSupply == 0)
        throw std::runtime_error("Configuration value initial_share_supply must be positive.");

    auto s_log { root.subtable("log") };
    fill(c.log.level, s_log, "level");
    fill(c.log.externalCalls, s_log, "external_calls");
    return c;
}
} // namespace

ProgramConfig ProgramConfig::defaults()
{
    return {
        .platform {
            .feeOwner = Identity::from_hex_throw(PLATFORM_FEE_OWNER),
            .buyAndBurnOwner = Identity::from_hex_throw(PLATFORM_BUY_AND_BURN_OWNER) },
        .pool {},
        .log {}
    };
}

ProgramConfig ProgramConfig::from_file(const std::string& filename)
{
    spdlog::info("Reading configuration file \"{}\"", filename);
    toml::table tbl = toml::parse_file(filename);
    return from_table(tbl, filename);
}

ProgramConfig ProgramConfig::from_string(std::string_view toml, std::string_view sourceName)
{
    toml::table tbl = toml::parse(toml, sourceName);
    return from_table(tbl, sourceName);
}

std::string ProgramConfig::dump() const
{
    toml::table tbl;
    tbl.insert_or_assign("platform",
        toml::table {
            { "fee_owner", platform.feeOwner.hex_string() },
            { "buy_and_burn_owner", platform.buyAndBurnOwner.hex_string() },
        });
    tbl.insert_or_assign("pool",
        toml::table {
            { "min_fee_collection_period", toml_integer(pool.minFeeCollectionPeriod, "min_fee_collection_period") },
            { "initial_share_supply", toml_integer(pool.initialShareSupply, "initial_share_supply") },
            { "share_decimals", int64_t(pool.shareDecimals) },
        });
    auto level { spdlog::level::to_string_view(log.level) };
    tbl.insert_or_assign("log",
        toml::table {
            { "level", std::string(level.data(), level.size()) },
            { "external_calls", log.externalCalls },
        });
    stringstream ss;
    ss << tbl << endl;
    return ss.str();
}
