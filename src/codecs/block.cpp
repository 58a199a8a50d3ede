#include <rwtxd/codecs/block.hpp>
#include "../byte_io.hpp"
#include "decode_helpers.hpp"

#include <fmt/core.h>

#include <cstdint>
#include <new>
#include <vector>

namespace rwtxd {

namespace {

constexpr int BLOCK_DIM = 4;

// Colour half of every BC format: two RGB565 endpoints + 2-bit indices.
// BC2/BC3 colour blocks are always four-colour; only BC1 has the
// three-colour + transparent mode when c0 <= c1.
void decode_color_block(const std::uint8_t* block, std::uint8_t* out, std::size_t stride,
                        bool allow_punch_through) {
    const std::uint16_t c0 = read_le16(block);
    const std::uint16_t c1 = read_le16(block + 2);

    std::uint8_t colors[4][4];
    colors[0][0] = expand5(c0 >> 11);
    colors[0][1] = expand6(c0 >> 5);
    colors[0][2] = expand5(c0);
    colors[0][3] = 0xFF;

    colors[1][0] = expand5(c1 >> 11);
    colors[1][1] = expand6(c1 >> 5);
    colors[1][2] = expand5(c1);
    colors[1][3] = 0xFF;

    if (c0 > c1 || !allow_punch_through) {
        for (int ch = 0; ch < 3; ++ch) {
            colors[2][ch] = static_cast<std::uint8_t>((2 * colors[0][ch] + colors[1][ch]) / 3);
            colors[3][ch] = static_cast<std::uint8_t>((colors[0][ch] + 2 * colors[1][ch]) / 3);
        }
        colors[2][3] = 0xFF;
        colors[3][3] = 0xFF;
    } else {
        for (int ch = 0; ch < 3; ++ch) {
            colors[2][ch] = static_cast<std::uint8_t>((colors[0][ch] + colors[1][ch]) / 2);
            colors[3][ch] = 0;
        }
        colors[2][3] = 0xFF;
        colors[3][3] = 0x00;
    }

    const std::uint32_t indices = read_le32(block + 4);

    for (int y = 0; y < BLOCK_DIM; ++y) {
        for (int x = 0; x < BLOCK_DIM; ++x) {
            const int idx = (indices >> (2 * (y * BLOCK_DIM + x))) & 0x03;
            std::uint8_t* pixel = out + static_cast<std::size_t>(y) * stride + static_cast<std::size_t>(x) * 4;
            pixel[0] = colors[idx][0];
            pixel[1] = colors[idx][1];
            pixel[2] = colors[idx][2];
            pixel[3] = colors[idx][3];
        }
    }
}

// BC2 alpha: 16 explicit 4-bit values, row-major, low nibble first
void apply_explicit_alpha(const std::uint8_t* block, std::uint8_t* out, std::size_t stride) {
    for (int y = 0; y < BLOCK_DIM; ++y) {
        const std::uint16_t row = read_le16(block + y * 2);
        for (int x = 0; x < BLOCK_DIM; ++x) {
            std::uint8_t* pixel = out + static_cast<std::size_t>(y) * stride + static_cast<std::size_t>(x) * 4;
            pixel[3] = expand4(row >> (4 * x));
        }
    }
}

// BC3 alpha: two 8-bit endpoints + 16 3-bit indices
void apply_interpolated_alpha(const std::uint8_t* block, std::uint8_t* out, std::size_t stride) {
    const std::uint32_t a0 = block[0];
    const std::uint32_t a1 = block[1];

    std::uint8_t alphas[8];
    alphas[0] = static_cast<std::uint8_t>(a0);
    alphas[1] = static_cast<std::uint8_t>(a1);

    if (a0 > a1) {
        for (std::uint32_t i = 1; i < 7; ++i) {
            alphas[i + 1] = static_cast<std::uint8_t>(((7 - i) * a0 + i * a1) / 7);
        }
    } else {
        for (std::uint32_t i = 1; i < 5; ++i) {
            alphas[i + 1] = static_cast<std::uint8_t>(((5 - i) * a0 + i * a1) / 5);
        }
        alphas[6] = 0;
        alphas[7] = 0xFF;
    }

    std::uint64_t bits = 0;
    for (int i = 2; i < 8; ++i) {
        bits |= static_cast<std::uint64_t>(block[i]) << ((i - 2) * 8);
    }

    for (int y = 0; y < BLOCK_DIM; ++y) {
        for (int x = 0; x < BLOCK_DIM; ++x) {
            const int idx = static_cast<int>((bits >> (3 * (y * BLOCK_DIM + x))) & 0x07);
            std::uint8_t* pixel = out + static_cast<std::size_t>(y) * stride + static_cast<std::size_t>(x) * 4;
            pixel[3] = alphas[idx];
        }
    }
}

void unpremultiply(std::vector<std::uint8_t>& rgba) {
    for (std::size_t i = 0; i + 3 < rgba.size(); i += 4) {
        const unsigned a = rgba[i + 3];
        if (a == 0 || a == 0xFF) {
            continue;
        }
        for (std::size_t ch = 0; ch < 3; ++ch) {
            const unsigned v = (rgba[i + ch] * 255u + a / 2) / a;
            rgba[i + ch] = static_cast<std::uint8_t>(v > 255u ? 255u : v);
        }
    }
}

} // namespace

bool block_decoder::handles(raster_encoding enc) noexcept {
    return block_size(enc) != 0;
}

std::size_t block_decoder::block_size(raster_encoding enc) noexcept {
    switch (enc) {
        case raster_encoding::dxt1: return 8;
        case raster_encoding::dxt2:
        case raster_encoding::dxt3:
        case raster_encoding::dxt4:
        case raster_encoding::dxt5: return 16;
        default:                    return 0;
    }
}

std::size_t block_decoder::expected_size(raster_encoding enc, int width, int height) noexcept {
    if (width <= 0 || height <= 0) {
        return 0;
    }
    const std::size_t blocks_x = (static_cast<std::size_t>(width) + 3) / 4;
    const std::size_t blocks_y = (static_cast<std::size_t>(height) + 3) / 4;
    return blocks_x * blocks_y * block_size(enc);
}

txd_result block_decoder::decode(raster_encoding enc,
                                 std::span<const std::uint8_t> data,
                                 int width, int height,
                                 surface& surf) {
    if (!handles(enc)) {
        return txd_result::failure(txd_error::unsupported_format,
            fmt::format("Encoding {} is not block compressed", to_string(enc)));
    }

    auto result = validate_surface_dimensions(width, height);
    if (!result) return result;

    const std::size_t expected = expected_size(enc, width, height);
    if (data.size() != expected) {
        return size_mismatch(to_string(enc), expected, data.size());
    }

    // Decode into a buffer padded to whole blocks, then crop
    const std::size_t blocks_x = (static_cast<std::size_t>(width) + 3) / 4;
    const std::size_t blocks_y = (static_cast<std::size_t>(height) + 3) / 4;
    const std::size_t padded_stride = blocks_x * BLOCK_DIM * 4;

    std::vector<std::uint8_t> padded;
    try {
        padded.resize(padded_stride * blocks_y * BLOCK_DIM);
    } catch (const std::bad_alloc&) {
        return allocation_failure();
    }

    const std::size_t bsize = block_size(enc);
    const std::uint8_t* block = data.data();

    for (std::size_t by = 0; by < blocks_y; ++by) {
        for (std::size_t bx = 0; bx < blocks_x; ++bx, block += bsize) {
            std::uint8_t* out = padded.data() + by * BLOCK_DIM * padded_stride + bx * BLOCK_DIM * 4;
            switch (enc) {
                case raster_encoding::dxt1:
                    decode_color_block(block, out, padded_stride, true);
                    break;
                case raster_encoding::dxt2:
                case raster_encoding::dxt3:
                    decode_color_block(block + 8, out, padded_stride, false);
                    apply_explicit_alpha(block, out, padded_stride);
                    break;
                case raster_encoding::dxt4:
                case raster_encoding::dxt5:
                    decode_color_block(block + 8, out, padded_stride, false);
                    apply_interpolated_alpha(block, out, padded_stride);
                    break;
                default:
                    return txd_result::failure(txd_error::internal_error, "Unexpected block encoding");
            }
        }
    }

    if (enc == raster_encoding::dxt2 || enc == raster_encoding::dxt4) {
        unpremultiply(padded);
    }

    if (!surf.set_size(width, height)) {
        return allocation_failure();
    }

    write_rows(surf, padded.data(), padded_stride, static_cast<std::size_t>(width) * 4, height);

    return txd_result::success();
}

txd_result block_decoder::try_decode_compressed(std::span<const std::uint8_t> data,
                                                int width, int height,
                                                surface& surf) {
    auto result = decode(raster_encoding::dxt1, data, width, height, surf);
    if (result) {
        return result;
    }

    auto fallback = decode(raster_encoding::dxt5, data, width, height, surf);
    if (fallback) {
        return fallback;
    }

    return txd_result::failure(txd_error::decompression_failed,
        fmt::format("Compressed data is neither BC1 ({}) nor BC3 ({})",
                    result.message, fallback.message));
}

} // namespace rwtxd
