#include <rwtxd/texture_info.hpp>
#include <rwtxd/txd_archive.hpp>
#include <rwtxd/codecs/block.hpp>
#include <rwtxd/codecs/paletted.hpp>
#include <rwtxd/codecs/uncompressed.hpp>
#include "byte_io.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cstdint>

namespace rwtxd {

// ============================================================================
// Size Calculation
// ============================================================================

namespace {

// Sizes that do not fit the u32 header field saturate
std::uint32_t saturate_u32(std::uint64_t value) noexcept {
    return static_cast<std::uint32_t>(std::min<std::uint64_t>(value, UINT32_MAX));
}

std::uint32_t scaled_size(std::uint64_t count, std::uint32_t bytes_each) noexcept {
    if (count > UINT32_MAX) {
        return UINT32_MAX;
    }
    return saturate_u32(count * bytes_each);
}

} // namespace

std::uint32_t level_data_size(std::uint32_t width, std::uint32_t height, texture_format format) noexcept {
    const std::uint64_t texels = static_cast<std::uint64_t>(width) * height;
    const std::uint64_t blocks = ((static_cast<std::uint64_t>(width) + 3) / 4) *
                                 ((static_cast<std::uint64_t>(height) + 3) / 4);
    switch (format) {
        case texture_format::rgba32:
            return scaled_size(texels, 4);
        case texture_format::rgba16:
        case texture_format::luminance_alpha8:
            return scaled_size(texels, 2);
        case texture_format::luminance8:
        case texture_format::palette8:
            return saturate_u32(texels);
        case texture_format::palette4:
            return saturate_u32(texels / 2);
        case texture_format::compressed:
        case texture_format::bc1:
            return scaled_size(blocks, 8);
        case texture_format::bc2:
        case texture_format::bc3:
            return scaled_size(blocks, 16);
    }
    return 0;
}

std::uint32_t texture_data_size(std::uint16_t width,
                                std::uint16_t height,
                                texture_format format,
                                std::uint32_t mipmap_count) noexcept {
    const std::uint32_t levels = mipmap_count == 0 ? 1 : mipmap_count;
    std::uint32_t w = width;
    std::uint32_t h = height;
    std::uint64_t total = 0;

    for (std::uint32_t i = 0; i < levels; ++i) {
        total += level_data_size(w, h, format);
        w = std::max<std::uint32_t>(w / 2, 1);
        h = std::max<std::uint32_t>(h / 2, 1);
    }
    return saturate_u32(total);
}

std::size_t encoded_level_size(raster_encoding enc, int width, int height) noexcept {
    switch (enc) {
        case raster_encoding::bgra8888:
        case raster_encoding::bgra888:
        case raster_encoding::bgra565:
        case raster_encoding::bgra555:
        case raster_encoding::bgra1555:
        case raster_encoding::bgra4444:
        case raster_encoding::lum8:
        case raster_encoding::lum8a8:
            return uncompressed_decoder::expected_size(enc, width, height);
        case raster_encoding::pal4:
        case raster_encoding::pal8:
            return paletted_decoder::expected_size(enc, width, height);
        case raster_encoding::dxt1:
        case raster_encoding::dxt2:
        case raster_encoding::dxt3:
        case raster_encoding::dxt4:
        case raster_encoding::dxt5:
            return block_decoder::expected_size(enc, width, height);
        case raster_encoding::compressed_unknown:
            return block_decoder::expected_size(raster_encoding::dxt1, width, height);
        case raster_encoding::unsupported:
            return 0;
    }
    return 0;
}

// ============================================================================
// Levels
// ============================================================================

namespace {

// Dimensions are u16, so every level from 16 on is 1 texel wide
int mip_dimension(std::uint16_t base, int level) noexcept {
    if (base == 0) {
        return 0;
    }
    if (level <= 0) {
        return base;
    }
    if (level >= 16) {
        return 1;
    }
    return std::max(static_cast<int>(base) >> level, 1);
}

} // namespace

int texture_info::level_width(int level) const noexcept {
    return mip_dimension(width, level);
}

int texture_info::level_height(int level) const noexcept {
    return mip_dimension(height, level);
}

std::size_t texture_info::level_size(int level) const noexcept {
    const int w = level_width(level);
    const int h = level_height(level);
    const std::size_t size = encoded_level_size(encoding, w, h);
    if (size != 0) {
        return size;
    }
    return level_data_size(static_cast<std::uint32_t>(w), static_cast<std::uint32_t>(h), format);
}

std::size_t texture_info::payload_length() const noexcept {
    const int levels = std::max<int>(mipmap_count, 1);
    std::size_t total = 0;
    for (int i = 0; i < levels; ++i) {
        if (i > 0) {
            total += 4;
        }
        total += level_size(i);
    }
    return std::max<std::size_t>(total, data_size);
}

txd_result texture_info::extract_level(std::span<const std::uint8_t> payload,
                                       int level,
                                       std::span<const std::uint8_t>& out) const {
    const int levels = std::max<int>(mipmap_count, 1);
    if (level < 0 || level >= levels) {
        return txd_result::failure(txd_error::invalid_argument,
            fmt::format("Mip level {} out of range ({} levels)", level, levels));
    }

    std::size_t offset = 0;
    for (int i = 0; i <= level; ++i) {
        const std::size_t size = level_size(i);

        // Every level after the first may carry its own length prefix
        if (i > 0 && payload.size() - offset >= 4 &&
            read_le32(payload.data() + offset) == size) {
            offset += 4;
        }

        if (payload.size() - offset < size) {
            return txd_result::failure(txd_error::size_mismatch,
                fmt::format("Texture '{}' level {} needs {} bytes, only {} available",
                            name, i, size, payload.size() - offset));
        }

        if (i == level) {
            out = payload.subspan(offset, size);
            return txd_result::success();
        }
        offset += size;
    }

    return txd_result::failure(txd_error::internal_error, "Mip level walk ended early");
}

// ============================================================================
// Decoding
// ============================================================================

txd_result texture_info::decode_level(std::span<const std::uint8_t> payload, int level,
                                      surface& surf) const {
    if (encoding == raster_encoding::unsupported) {
        return txd_result::failure(txd_error::unsupported_format,
            fmt::format("Texture '{}': unsupported raster (platform {}, d3d format {}, raster flags 0x{:08X})",
                        name, platform_id, d3d_format, raster_format_flags));
    }

    const int w = level_width(level);
    const int h = level_height(level);

    // Unknown DXT variant on a single level texture: offer BC3-sized data
    // when the payload is long enough, so the BC1 attempt can fail cleanly.
    if (encoding == raster_encoding::compressed_unknown && mipmap_count <= 1 && level == 0) {
        const std::size_t bc3_size = block_decoder::expected_size(raster_encoding::dxt5, w, h);
        if (payload.size() >= bc3_size) {
            return block_decoder::try_decode_compressed(payload.first(bc3_size), w, h, surf);
        }
    }

    std::span<const std::uint8_t> data;
    auto result = extract_level(payload, level, data);
    if (!result) return result;

    switch (encoding) {
        case raster_encoding::bgra8888:
        case raster_encoding::bgra888:
        case raster_encoding::bgra565:
        case raster_encoding::bgra555:
        case raster_encoding::bgra1555:
        case raster_encoding::bgra4444:
        case raster_encoding::lum8:
        case raster_encoding::lum8a8:
            return uncompressed_decoder::decode(encoding, data, w, h, surf);

        case raster_encoding::pal4:
        case raster_encoding::pal8: {
            std::span<const std::uint8_t> palette;
            if (palette_data) {
                palette = *palette_data;
            }
            return paletted_decoder::decode(encoding, data, palette, w, h, surf);
        }

        case raster_encoding::dxt1:
        case raster_encoding::dxt2:
        case raster_encoding::dxt3:
        case raster_encoding::dxt4:
        case raster_encoding::dxt5:
            return block_decoder::decode(encoding, data, w, h, surf);

        case raster_encoding::compressed_unknown:
            return block_decoder::try_decode_compressed(data, w, h, surf);

        case raster_encoding::unsupported:
            break;
    }

    return txd_result::failure(txd_error::unsupported_format,
        fmt::format("Texture '{}': no decoder for {}", name, to_string(encoding)));
}

txd_result texture_info::to_rgba(const txd_archive& archive, int level, surface& surf) const {
    const int levels = std::max<int>(mipmap_count, 1);
    if (level < 0 || level >= levels) {
        return txd_result::failure(txd_error::invalid_argument,
            fmt::format("Mip level {} out of range ({} levels)", level, levels));
    }

    if (has_payload()) {
        return decode_level(pixel_payload, level, surf);
    }

    std::vector<std::uint8_t> payload;
    auto result = archive.get_texture_data(*this, payload);
    if (!result) return result;

    return decode_level(payload, level, surf);
}

txd_result texture_info::to_rgba(const txd_archive& archive, int level,
                                 std::vector<std::uint8_t>& out) const {
    rgba_surface surf;
    auto result = to_rgba(archive, level, surf);
    if (!result) return result;

    out = surf.release();
    return txd_result::success();
}

} // namespace rwtxd
