#pragma once

#include <fmt/core.h>

#include <cstdio>
#include <utility>

namespace rwtxd::detail {

template <typename... Args>
void log_warning(fmt::format_string<Args...> format, Args&&... args) {
    fmt::print(stderr, "rwtxd: {}\n", fmt::format(format, std::forward<Args>(args)...));
}

// Chunk-level tracing, only with load_options::verbose
template <typename... Args>
void log_debug(bool enabled, fmt::format_string<Args...> format, Args&&... args) {
    if (!enabled) {
        return;
    }
    fmt::print(stderr, "rwtxd [debug]: {}\n", fmt::format(format, std::forward<Args>(args)...));
}

} // namespace rwtxd::detail
