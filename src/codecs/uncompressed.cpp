#include <rwtxd/codecs/uncompressed.hpp>
#include "../byte_io.hpp"
#include "decode_helpers.hpp"

#include <fmt/core.h>

#include <vector>

namespace rwtxd {

namespace {

std::size_t bytes_per_texel(raster_encoding enc) noexcept {
    switch (enc) {
        case raster_encoding::bgra8888: return 4;
        case raster_encoding::bgra888:  return 3;
        case raster_encoding::bgra565:
        case raster_encoding::bgra555:
        case raster_encoding::bgra1555:
        case raster_encoding::bgra4444:
        case raster_encoding::lum8a8:   return 2;
        case raster_encoding::lum8:     return 1;
        default:                        return 0;
    }
}

// Convert one source texel to RGBA8
void convert_texel(raster_encoding enc, const std::uint8_t* src, std::uint8_t* dst) {
    switch (enc) {
        case raster_encoding::bgra8888:
            dst[0] = src[2];
            dst[1] = src[1];
            dst[2] = src[0];
            dst[3] = src[3];
            break;
        case raster_encoding::bgra888:
            dst[0] = src[2];
            dst[1] = src[1];
            dst[2] = src[0];
            dst[3] = 0xFF;
            break;
        case raster_encoding::bgra565: {
            const std::uint16_t p = read_le16(src);
            dst[0] = expand5(p >> 11);
            dst[1] = expand6(p >> 5);
            dst[2] = expand5(p);
            dst[3] = 0xFF;
            break;
        }
        case raster_encoding::bgra555: {
            const std::uint16_t p = read_le16(src);
            dst[0] = expand5(p >> 10);
            dst[1] = expand5(p >> 5);
            dst[2] = expand5(p);
            dst[3] = 0xFF;
            break;
        }
        case raster_encoding::bgra1555: {
            const std::uint16_t p = read_le16(src);
            dst[0] = expand5(p >> 10);
            dst[1] = expand5(p >> 5);
            dst[2] = expand5(p);
            dst[3] = (p & 0x8000) ? 0xFF : 0x00;
            break;
        }
        case raster_encoding::bgra4444: {
            const std::uint16_t p = read_le16(src);
            dst[0] = expand4(p >> 8);
            dst[1] = expand4(p >> 4);
            dst[2] = expand4(p);
            dst[3] = expand4(p >> 12);
            break;
        }
        case raster_encoding::lum8:
            dst[0] = dst[1] = dst[2] = src[0];
            dst[3] = 0xFF;
            break;
        case raster_encoding::lum8a8:
            dst[0] = dst[1] = dst[2] = src[0];
            dst[3] = src[1];
            break;
        default:
            break;
    }
}

} // namespace

bool uncompressed_decoder::handles(raster_encoding enc) noexcept {
    return bytes_per_texel(enc) != 0;
}

std::size_t uncompressed_decoder::expected_size(raster_encoding enc, int width, int height) noexcept {
    if (width <= 0 || height <= 0) {
        return 0;
    }
    return static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * bytes_per_texel(enc);
}

txd_result uncompressed_decoder::decode(raster_encoding enc,
                                        std::span<const std::uint8_t> data,
                                        int width, int height,
                                        surface& surf) {
    if (!handles(enc)) {
        return txd_result::failure(txd_error::unsupported_format,
            fmt::format("Encoding {} is not an uncompressed raster", to_string(enc)));
    }

    auto result = validate_surface_dimensions(width, height);
    if (!result) return result;

    const std::size_t expected = expected_size(enc, width, height);
    if (data.size() != expected) {
        return size_mismatch(to_string(enc), expected, data.size());
    }

    if (!surf.set_size(width, height)) {
        return allocation_failure();
    }

    const std::size_t bpp = bytes_per_texel(enc);
    const std::size_t w = static_cast<std::size_t>(width);
    std::vector<std::uint8_t> row(w * 4);

    for (int y = 0; y < height; ++y) {
        const std::uint8_t* src = data.data() + static_cast<std::size_t>(y) * w * bpp;
        for (std::size_t x = 0; x < w; ++x) {
            convert_texel(enc, src + x * bpp, row.data() + x * 4);
        }
        surf.write_pixels(0, y, static_cast<int>(row.size()), row.data());
    }

    return txd_result::success();
}

} // namespace rwtxd
