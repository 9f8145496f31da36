#pragma once

/// @file include/sfn/log.hpp
/// @brief stderr diagnostics gated by `SingfunConfig` flags.

#include "sfn/config.hpp"

#include <fmt/core.h>

#include <cstdio>
#include <utility>

namespace sfn::log {

/// Trace line, printed only when `cfg.verbose` is set.
template <typename... Args>
void debug(const SingfunConfig& cfg, fmt::format_string<Args...> format,
           Args&&... args) {
    if (!cfg.verbose) {
        return;
    }
    fmt::print(stderr, "[sfn] {}\n",
               fmt::format(format, std::forward<Args>(args)...));
}

/// Warning line, printed unless `cfg.warnings` is cleared.
template <typename... Args>
void warn(const SingfunConfig& cfg, fmt::format_string<Args...> format,
          Args&&... args) {
    if (!cfg.warnings) {
        return;
    }
    fmt::print(stderr, "[sfn] warning: {}\n",
               fmt::format(format, std::forward<Args>(args)...));
}

} // namespace sfn::log
