#ifndef RWTXD_TYPES_HPP_
#define RWTXD_TYPES_HPP_

#include <rwtxd/rwtxd_export.h>

#include <cstddef>
#include <cstdint>
#include <string>

namespace rwtxd {

// ============================================================================
// Texture Formats
// ============================================================================

// Coarse classification stored in every texture_info. The bc1/bc2/bc3 values
// are used when the D3D format code names the DXT variant; plain `compressed`
// is the raster-flag classification where the variant is unknown.
enum class texture_format {
    rgba32,
    rgba16,
    luminance8,
    luminance_alpha8,
    palette4,
    palette8,
    compressed,
    bc1,
    bc2,
    bc3
};

[[nodiscard]] constexpr bool is_compressed(texture_format fmt) noexcept {
    return fmt == texture_format::compressed || fmt == texture_format::bc1 ||
           fmt == texture_format::bc2 || fmt == texture_format::bc3;
}

[[nodiscard]] constexpr bool is_paletted(texture_format fmt) noexcept {
    return fmt == texture_format::palette4 || fmt == texture_format::palette8;
}

// Concrete on-disk pixel encoding, resolved once when a texture is parsed.
enum class raster_encoding {
    bgra8888,
    bgra888,
    bgra565,
    bgra555,
    bgra1555,
    bgra4444,
    lum8,
    lum8a8,
    pal4,
    pal8,
    dxt1,
    dxt2,
    dxt3,
    dxt4,
    dxt5,
    compressed_unknown,  // DXT variant unknown: try BC1, then BC3
    unsupported
};

// ============================================================================
// Sampler State
// ============================================================================

enum class filter_mode : std::uint8_t {
    nearest = 0x00,
    linear = 0x01,
    mip_nearest = 0x02,
    mip_linear = 0x03,
    linear_mip_nearest = 0x04,
    linear_mip_linear = 0x05
};

enum class addressing_mode : std::uint8_t {
    wrap = 0x00,
    mirror = 0x01,
    clamp = 0x02,
    border = 0x03
};

// ============================================================================
// Platforms
// ============================================================================

enum class native_platform {
    d3d8,
    d3d9,
    raster  // every other platform id: decoded from the raster format flags
};

// D3D8 is stored as 1 by some exporters and 8 by the RenderWare SDK; D3D9 as 2 or 9.
[[nodiscard]] constexpr native_platform classify_platform(std::uint32_t platform_id) noexcept {
    switch (platform_id) {
        case 1:
        case 8:
            return native_platform::d3d8;
        case 2:
        case 9:
            return native_platform::d3d9;
        default:
            return native_platform::raster;
    }
}

// ============================================================================
// Errors
// ============================================================================

enum class txd_error {
    none,
    file_read_failed,
    file_write_failed,
    parse_error,
    size_mismatch,
    unsupported_format,
    invalid_palette,
    decompression_failed,
    not_found,
    invalid_argument,
    internal_error
};

[[nodiscard]] RWTXD_EXPORT const char* to_string(txd_error err) noexcept;
[[nodiscard]] RWTXD_EXPORT const char* to_string(texture_format fmt) noexcept;
[[nodiscard]] RWTXD_EXPORT const char* to_string(raster_encoding enc) noexcept;
[[nodiscard]] RWTXD_EXPORT const char* to_string(filter_mode mode) noexcept;
[[nodiscard]] RWTXD_EXPORT const char* to_string(addressing_mode mode) noexcept;

// Human readable name of a native platform id ("Direct3D 9", "PlayStation 2", ...).
[[nodiscard]] RWTXD_EXPORT const char* platform_name(std::uint32_t platform_id) noexcept;

// ============================================================================
// Result
// ============================================================================

struct txd_result {
    bool ok = false;
    txd_error error = txd_error::none;
    std::string message;

    [[nodiscard]] static txd_result success() {
        return {true, txd_error::none, {}};
    }

    [[nodiscard]] static txd_result failure(txd_error err, std::string msg = {}) {
        return {false, err, std::move(msg)};
    }

    explicit operator bool() const noexcept { return ok; }
};

// ============================================================================
// Load Options
// ============================================================================

struct load_options {
    // A STRUCT texture count above this is treated as a misread and the
    // archive is scanned instead.
    std::uint32_t max_plausible_texture_count = 10000;

    // Scanning mode bounds
    std::size_t scan_max_textures = 100;
    std::size_t scan_max_steps = 10000;
    std::size_t scan_max_zero_headers = 50;

    // Textures larger than this are skipped (0 = no limit)
    int max_width = 16384;
    int max_height = 16384;

    // Emit per-chunk debug output to stderr
    bool verbose = false;
};

} // namespace rwtxd

#endif // RWTXD_TYPES_HPP_
