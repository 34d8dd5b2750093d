#pragma once
#include "config/config.hpp"
#include "pool/status.hpp"

#include "spdlog/spdlog.h"

inline void apply_log_level(const ProgramConfig& c)
{
    spdlog::set_level(c.log.level);
}

template <typename... Args>
inline void log_external(const ProgramConfig& c, spdlog::format_string_t<Args...> fmt, Args&&... args)
{
    if (c.log.externalCalls)
        spdlog::info(fmt, std::forward<Args>(args)...);
}

inline void log_status_change(const pool::PoolStatus& from, const pool::PoolStatus& to)
{
    if (from != to)
        spdlog::debug("Pool status {} -> {}", from.to_string(), to.to_string());
}
