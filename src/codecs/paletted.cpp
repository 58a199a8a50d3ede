#include <rwtxd/codecs/paletted.hpp>
#include "decode_helpers.hpp"

#include <fmt/core.h>

#include <cstring>
#include <vector>

namespace rwtxd {

std::size_t paletted_decoder::palette_size(raster_encoding enc) noexcept {
    switch (enc) {
        case raster_encoding::pal4: return PALETTE4_SIZE;
        case raster_encoding::pal8: return PALETTE8_SIZE;
        default:                    return 0;
    }
}

std::size_t paletted_decoder::expected_size(raster_encoding enc, int width, int height) noexcept {
    if (width <= 0 || height <= 0) {
        return 0;
    }
    const std::size_t pixels = static_cast<std::size_t>(width) * static_cast<std::size_t>(height);
    switch (enc) {
        case raster_encoding::pal4: return (pixels + 1) / 2;
        case raster_encoding::pal8: return pixels;
        default:                    return 0;
    }
}

txd_result paletted_decoder::decode(raster_encoding enc,
                                    std::span<const std::uint8_t> data,
                                    std::span<const std::uint8_t> palette,
                                    int width, int height,
                                    surface& surf) {
    if (!handles(enc)) {
        return txd_result::failure(txd_error::unsupported_format,
            fmt::format("Encoding {} is not paletted", to_string(enc)));
    }

    auto result = validate_surface_dimensions(width, height);
    if (!result) return result;

    const std::size_t expected_palette = palette_size(enc);
    if (palette.empty()) {
        return txd_result::failure(txd_error::invalid_palette,
            "Palette data required for paletted texture");
    }
    if (palette.size() != expected_palette) {
        return txd_result::failure(txd_error::invalid_palette,
            fmt::format("{} palette size mismatch: expected {}, got {}",
                        to_string(enc), expected_palette, palette.size()));
    }

    const std::size_t expected = expected_size(enc, width, height);
    if (data.size() != expected) {
        return size_mismatch(to_string(enc), expected, data.size());
    }

    if (!surf.set_size(width, height)) {
        return allocation_failure();
    }

    const std::size_t w = static_cast<std::size_t>(width);
    std::vector<std::uint8_t> row(w * 4);
    std::size_t texel = 0;

    for (int y = 0; y < height; ++y) {
        for (std::size_t x = 0; x < w; ++x, ++texel) {
            std::size_t index = 0;
            if (enc == raster_encoding::pal8) {
                index = data[texel];
            } else {
                const std::uint8_t packed = data[texel / 2];
                index = (texel % 2 == 0) ? (packed & 0x0F) : ((packed >> 4) & 0x0F);
            }
            std::memcpy(row.data() + x * 4, palette.data() + index * 4, 4);
        }
        surf.write_pixels(0, y, static_cast<int>(row.size()), row.data());
    }

    return txd_result::success();
}

} // namespace rwtxd
