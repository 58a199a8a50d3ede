#pragma once

#include <rwtxd/types.hpp>
#include <rwtxd/surface.hpp>

#include <fmt/core.h>

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace rwtxd {

// Copy RGBA8 rows to a surface
// stride: distance between rows in the source (may exceed row_bytes when padded)
// row_bytes: bytes written per row
inline void write_rows(surface& surf, const std::uint8_t* data, std::size_t stride,
                       std::size_t row_bytes, int height) {
    for (int y = 0; y < height; ++y) {
        surf.write_pixels(0, y, static_cast<int>(row_bytes),
                          data + static_cast<std::size_t>(y) * stride);
    }
}

// Bit replication: expand an N-bit channel to 8 bits the way the GPU samples it
[[nodiscard]] constexpr std::uint8_t expand5(std::uint32_t v) noexcept {
    return static_cast<std::uint8_t>(((v & 0x1F) << 3) | ((v & 0x1F) >> 2));
}

[[nodiscard]] constexpr std::uint8_t expand6(std::uint32_t v) noexcept {
    return static_cast<std::uint8_t>(((v & 0x3F) << 2) | ((v & 0x3F) >> 4));
}

[[nodiscard]] constexpr std::uint8_t expand4(std::uint32_t v) noexcept {
    return static_cast<std::uint8_t>(((v & 0x0F) << 4) | (v & 0x0F));
}

inline txd_result validate_surface_dimensions(int width, int height) {
    if (width <= 0 || height <= 0) {
        return txd_result::failure(txd_error::invalid_argument,
            fmt::format("Invalid texture dimensions {}x{}", width, height));
    }
    return txd_result::success();
}

inline txd_result size_mismatch(std::string_view what, std::size_t expected, std::size_t actual) {
    return txd_result::failure(txd_error::size_mismatch,
        fmt::format("{} data size mismatch: expected {}, got {}", what, expected, actual));
}

inline txd_result allocation_failure() {
    return txd_result::failure(txd_error::internal_error, "Failed to allocate surface");
}

} // namespace rwtxd
