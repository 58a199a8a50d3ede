#include <rwtxd/texture_native.hpp>
#include <rwtxd/chunk.hpp>
#include <rwtxd/codecs/paletted.hpp>
#include <rwtxd/version.hpp>
#include "byte_io.hpp"
#include "log.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <optional>
#include <utility>

namespace rwtxd {

namespace {

std::optional<raster_encoding> fourcc_encoding(std::uint32_t d3d_format) noexcept {
    switch (d3d_format) {
        case FOURCC_DXT1: return raster_encoding::dxt1;
        case FOURCC_DXT2: return raster_encoding::dxt2;
        case FOURCC_DXT3: return raster_encoding::dxt3;
        case FOURCC_DXT4: return raster_encoding::dxt4;
        case FOURCC_DXT5: return raster_encoding::dxt5;
        default:          return std::nullopt;
    }
}

// D3DFORMAT values used by Direct3D 9 rasters
std::optional<raster_encoding> d3d9_encoding(std::uint32_t d3d_format) noexcept {
    switch (d3d_format) {
        case 21: return raster_encoding::bgra8888;   // A8R8G8B8
        case 22: return raster_encoding::bgra888;    // X8R8G8B8
        case 23: return raster_encoding::bgra565;    // R5G6B5
        case 24: return raster_encoding::bgra555;    // X1R5G5B5
        case 25: return raster_encoding::bgra1555;   // A1R5G5B5
        case 26: return raster_encoding::bgra4444;   // A4R4G4B4
        case 50: return raster_encoding::lum8;       // L8
        case 51: return raster_encoding::lum8a8;     // A8L8
        default: return fourcc_encoding(d3d_format);
    }
}

// D3D8 stores the DXT variant in the byte after the raster type
std::optional<raster_encoding> d3d8_compression(std::uint8_t platform_properties) noexcept {
    switch (platform_properties) {
        case 1: return raster_encoding::dxt1;
        case 2: return raster_encoding::dxt2;
        case 3: return raster_encoding::dxt3;
        case 4: return raster_encoding::dxt4;
        case 5: return raster_encoding::dxt5;
        default: return std::nullopt;
    }
}

// RenderWare raster format (flags bits 8-11)
std::optional<raster_encoding> raster_code_encoding(std::uint32_t raster_format_flags) noexcept {
    switch ((raster_format_flags >> 8) & 0x0F) {
        case 0x01: return raster_encoding::bgra1555;
        case 0x02: return raster_encoding::bgra565;
        case 0x03: return raster_encoding::bgra4444;
        case 0x04: return raster_encoding::lum8;
        case 0x05: return raster_encoding::bgra8888;
        case 0x06: return raster_encoding::bgra888;
        case 0x0A: return raster_encoding::bgra555;
        default:   return std::nullopt;
    }
}

texture_format format_of(raster_encoding enc) noexcept {
    switch (enc) {
        case raster_encoding::bgra8888:
        case raster_encoding::bgra888:  return texture_format::rgba32;
        case raster_encoding::bgra565:
        case raster_encoding::bgra555:
        case raster_encoding::bgra1555:
        case raster_encoding::bgra4444: return texture_format::rgba16;
        case raster_encoding::lum8:     return texture_format::luminance8;
        case raster_encoding::lum8a8:   return texture_format::luminance_alpha8;
        case raster_encoding::pal4:     return texture_format::palette4;
        case raster_encoding::pal8:     return texture_format::palette8;
        case raster_encoding::dxt1:     return texture_format::bc1;
        case raster_encoding::dxt2:
        case raster_encoding::dxt3:     return texture_format::bc2;
        case raster_encoding::dxt4:
        case raster_encoding::dxt5:     return texture_format::bc3;
        default:                        return texture_format::compressed;
    }
}

raster_encoding raster_fallback(const texture_info& tex) noexcept {
    if (auto enc = fourcc_encoding(tex.d3d_format)) {
        return *enc;
    }
    if (is_compressed(tex.format)) {
        return raster_encoding::compressed_unknown;
    }

    const bool has_palette = tex.palette_data.has_value() && !tex.palette_data->empty();
    if (is_paletted(tex.format) && has_palette) {
        return tex.format == texture_format::palette4 ? raster_encoding::pal4 : raster_encoding::pal8;
    }
    if (auto enc = raster_code_encoding(tex.raster_format_flags)) {
        return *enc;
    }
    if (has_palette) {
        return tex.palette_data->size() <= paletted_decoder::PALETTE4_SIZE
            ? raster_encoding::pal4 : raster_encoding::pal8;
    }
    return raster_encoding::compressed_unknown;
}

filter_mode parse_filter(std::uint8_t value) noexcept {
    if (value <= static_cast<std::uint8_t>(filter_mode::linear_mip_linear)) {
        return static_cast<filter_mode>(value);
    }
    return filter_mode::linear;
}

addressing_mode parse_addressing(std::uint8_t nibble) noexcept {
    if (nibble <= static_cast<std::uint8_t>(addressing_mode::border)) {
        return static_cast<addressing_mode>(nibble);
    }
    return addressing_mode::wrap;
}

} // namespace

// ============================================================================
// Classification
// ============================================================================

texture_format classify_format(std::uint32_t platform_id,
                               std::uint32_t d3d_format,
                               std::uint32_t raster_format_flags,
                               std::uint8_t platform_properties) noexcept {
    if (auto enc = fourcc_encoding(d3d_format)) {
        return format_of(*enc);
    }

    const bool palette_flagged = (raster_format_flags & (RASTER_PAL4 | RASTER_PAL8)) != 0;

    switch (classify_platform(platform_id)) {
        case native_platform::d3d9:
            if (!palette_flagged) {
                if (auto enc = d3d9_encoding(d3d_format)) {
                    return format_of(*enc);
                }
            }
            break;
        case native_platform::d3d8:
            if (auto enc = d3d8_compression(platform_properties)) {
                return format_of(*enc);
            }
            if (!palette_flagged) {
                if (auto enc = raster_code_encoding(raster_format_flags)) {
                    return format_of(*enc);
                }
            }
            break;
        case native_platform::raster:
            break;
    }

    switch ((raster_format_flags >> 8) & 0xFF) {
        case 0x00: return texture_format::rgba32;
        case 0x01: return texture_format::rgba16;
        case 0x02: return texture_format::luminance8;
        case 0x03: return texture_format::luminance_alpha8;
        case 0x04: return texture_format::palette4;
        case 0x05: return texture_format::palette8;
        case 0x06: return texture_format::compressed;
        default:   break;
    }

    if (raster_format_flags & RASTER_PAL4) {
        return texture_format::palette4;
    }
    if (raster_format_flags & RASTER_PAL8) {
        return texture_format::palette8;
    }
    return texture_format::rgba32;
}

raster_encoding resolve_encoding(const texture_info& tex) noexcept {
    switch (classify_platform(tex.platform_id)) {
        case native_platform::d3d8:
            if (auto enc = fourcc_encoding(tex.d3d_format)) {
                return *enc;
            }
            if (auto enc = d3d8_compression(tex.platform_properties)) {
                return *enc;
            }
            return raster_fallback(tex);

        case native_platform::d3d9:
            if (is_paletted(tex.format) && tex.palette_data) {
                return raster_fallback(tex);
            }
            if (auto enc = d3d9_encoding(tex.d3d_format)) {
                return *enc;
            }
            return raster_encoding::unsupported;

        case native_platform::raster:
            return raster_fallback(tex);
    }
    return raster_encoding::unsupported;
}

// ============================================================================
// Texture Native Decoder
// ============================================================================

namespace {

// Non-zero dimensions and a depth RenderWare rasters use
bool plausible_raster_fields(std::span<const std::uint8_t> fields, std::size_t at) noexcept {
    if (at + texture_native_decoder::RASTER_FIELDS_SIZE > fields.size()) {
        return false;
    }
    const std::uint8_t* p = fields.data() + at;
    const std::uint16_t width = read_le16(p + 8);
    const std::uint16_t height = read_le16(p + 10);
    const std::uint8_t depth = p[12];
    if (width == 0 || height == 0) {
        return false;
    }
    return depth == 4 || depth == 8 || depth == 16 || depth == 24 || depth == 32;
}

} // namespace

std::size_t texture_native_decoder::mask_width(std::span<const std::uint8_t> fields,
                                               std::size_t pos,
                                               std::uint32_t platform_id,
                                               std::uint32_t version) noexcept {
    if (classify_platform(platform_id) != native_platform::raster && is_valid_version(version)) {
        return MASK_SIZE;
    }

    if (pos + 36 > fields.size()) {
        return SHORT_MASK_SIZE;
    }
    const std::uint32_t probe = read_le32(fields.data() + pos + 32);
    if (probe != 0 && probe < 0x1000000) {
        return MASK_SIZE;
    }

    // Flags of 0 or with a high byte set fail the probe. Prefer 32 bytes when
    // only that reading yields a usable raster layout.
    if (!plausible_raster_fields(fields, pos + SHORT_MASK_SIZE) &&
        plausible_raster_fields(fields, pos + MASK_SIZE)) {
        return MASK_SIZE;
    }
    return SHORT_MASK_SIZE;
}

txd_result texture_native_decoder::decode(std::span<const std::uint8_t> body,
                                          std::uint32_t version,
                                          std::uint64_t absolute_offset,
                                          texture_info& out,
                                          const load_options& options) {
    std::span<const std::uint8_t> fields = body;
    std::uint64_t fields_offset = absolute_offset;

    // Optional inner STRUCT wrapping the fields; a truncated one keeps
    // whatever bytes are left
    chunk_header inner;
    if (read_chunk_header(body, 0, inner) && inner.type == CHUNK_STRUCT && inner.version == version) {
        const std::size_t available = body.size() - CHUNK_HEADER_SIZE;
        fields = body.subspan(CHUNK_HEADER_SIZE, std::min<std::size_t>(inner.size, available));
        fields_offset += CHUNK_HEADER_SIZE;
    }

    if (fields.size() < MIN_BODY_SIZE) {
        return txd_result::failure(txd_error::parse_error,
            fmt::format("Texture native data too small: {} bytes (need at least {})",
                        fields.size(), MIN_BODY_SIZE));
    }

    texture_info tex;
    const std::uint8_t* p = fields.data();
    std::size_t pos = 0;

    tex.platform_id = read_le32(p + pos);
    pos += 4;

    const std::uint8_t filter_byte = p[pos++];
    const std::uint8_t uv_byte = p[pos++];
    pos += 2;  // padding

    tex.filter = parse_filter(filter_byte);
    tex.addressing_u = parse_addressing((uv_byte >> 4) & 0x0F);
    tex.addressing_v = parse_addressing(uv_byte & 0x0F);

    tex.name = read_fixed_string(p + pos, NAME_SIZE);
    pos += NAME_SIZE;

    const std::size_t mask_len = mask_width(fields, pos, tex.platform_id, version);
    tex.mask_name = read_fixed_string(p + pos, mask_len);
    pos += mask_len;

    if (fields.size() - pos < RASTER_FIELDS_SIZE) {
        return txd_result::failure(txd_error::parse_error,
            fmt::format("Texture native data too small for raster info: {} bytes (need at least {})",
                        fields.size(), pos + RASTER_FIELDS_SIZE));
    }

    tex.raster_format_flags = read_le32(p + pos);
    tex.d3d_format = read_le32(p + pos + 4);
    tex.width = read_le16(p + pos + 8);
    tex.height = read_le16(p + pos + 10);
    tex.depth = p[pos + 12];
    tex.mipmap_count = p[pos + 13];
    tex.raster_type = p[pos + 14];
    tex.platform_properties = p[pos + 15];
    pos += RASTER_FIELDS_SIZE;

    if (tex.mipmap_count == 0) {
        detail::log_warning("texture '{}' declares 0 mip levels, reading 1", tex.name);
        tex.mipmap_count = 1;
    }

    // A full chain ends at 1x1; levels past it repeat 1x1 sizes
    int full_chain = 1;
    for (int extent = std::max<int>(tex.width, tex.height); extent > 1; extent /= 2) {
        ++full_chain;
    }
    if (tex.mipmap_count > full_chain) {
        detail::log_warning("texture '{}' declares {} mip levels, a full chain has {}",
                            tex.name, tex.mipmap_count, full_chain);
    }

    if ((options.max_width > 0 && tex.width > options.max_width) ||
        (options.max_height > 0 && tex.height > options.max_height)) {
        return txd_result::failure(txd_error::parse_error,
            fmt::format("Texture '{}' dimensions {}x{} exceed the {}x{} limit",
                        tex.name, tex.width, tex.height, options.max_width, options.max_height));
    }

    tex.format = classify_format(tex.platform_id, tex.d3d_format,
                                 tex.raster_format_flags, tex.platform_properties);

    if (is_paletted(tex.format)) {
        const std::size_t palette_size = tex.format == texture_format::palette4
            ? paletted_decoder::PALETTE4_SIZE : paletted_decoder::PALETTE8_SIZE;
        if (fields.size() - pos < palette_size) {
            return txd_result::failure(txd_error::parse_error,
                fmt::format("Texture '{}' palette truncated: {} bytes (need {})",
                            tex.name, fields.size() - pos, palette_size));
        }
        tex.palette_data.emplace(p + pos, p + pos + palette_size);
        pos += palette_size;
    }

    // Length prefix of the first level
    if (fields.size() - pos >= 4) {
        pos += 4;
    }

    tex.data_size = texture_data_size(tex.width, tex.height, tex.format, tex.mipmap_count);
    tex.data_offset = fields_offset + pos;
    tex.stored_size = static_cast<std::uint32_t>(fields.size() - pos);
    tex.encoding = resolve_encoding(tex);

    if (tex.stored_size < tex.data_size) {
        detail::log_warning("texture '{}': {} pixel bytes stored, {} expected",
                            tex.name, tex.stored_size, tex.data_size);
    } else if (tex.stored_size > tex.payload_length()) {
        detail::log_warning("texture '{}': {} pixel bytes stored, only {} used",
                            tex.name, tex.stored_size, tex.payload_length());
    }

    detail::log_debug(options.verbose,
        "texture '{}' {}x{} {} ({}), platform {}, {} levels, data at {} ({} bytes)",
        tex.name, tex.width, tex.height, to_string(tex.format), to_string(tex.encoding),
        platform_name(tex.platform_id), tex.mipmap_count, tex.data_offset, tex.data_size);

    out = std::move(tex);
    return txd_result::success();
}

} // namespace rwtxd
