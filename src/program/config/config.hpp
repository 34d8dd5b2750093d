#pragma once
#include "crypto/identity.hpp"
#include "spdlog/common.h"
#include <cstdint>
#include <string>
#include <string_view>

struct ProgramConfig {
    struct Platform {
        Identity feeOwner;
        Identity buyAndBurnOwner;
    } platform;
    struct Pool {
        uint64_t minFeeCollectionPeriod { 604800 }; // one week
        uint64_t initialShareSupply { 1000000 };
        uint8_t shareDecimals { 6 };
    } pool;
    struct Log {
        spdlog::level::level_enum level { spdlog::level::info };
        bool externalCalls { false }; // log every call into ledger and market
    } log;

    // mainnet platform identities and default pool parameters
    static ProgramConfig defaults();

    // Overwrites the defaults with the settings of a TOML file. Throws
    // std::runtime_error on bad values and toml::parse_error on syntax
    // errors.
    static ProgramConfig from_file(const std::string& filename);
    static ProgramConfig from_string(std::string_view toml, std::string_view sourceName = "<string>");

    // Throws std::runtime_error for integers beyond the signed 64 bit range
    // of TOML, which the parser can never produce.
    std::string dump() const;
};
