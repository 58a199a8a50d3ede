#ifndef RWTXD_TEXTURE_NATIVE_HPP_
#define RWTXD_TEXTURE_NATIVE_HPP_

#include <rwtxd/rwtxd_export.h>
#include <rwtxd/types.hpp>
#include <rwtxd/texture_info.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace rwtxd {

// ============================================================================
// Format Codes
// ============================================================================

// D3D FourCC values stored in the d3d_format field
inline constexpr std::uint32_t FOURCC_DXT1 = 0x31545844;  // 827611204
inline constexpr std::uint32_t FOURCC_DXT2 = 0x32545844;  // 844388420
inline constexpr std::uint32_t FOURCC_DXT3 = 0x33545844;  // 861165636
inline constexpr std::uint32_t FOURCC_DXT4 = 0x34545844;  // 877942852
inline constexpr std::uint32_t FOURCC_DXT5 = 0x35545844;  // 894720068

// RenderWare raster format flags
inline constexpr std::uint32_t RASTER_PAL8 = 0x2000;
inline constexpr std::uint32_t RASTER_PAL4 = 0x4000;

/**
 * Coarse format of a texture from its header fields.
 * A DXT FourCC wins; D3D9 format codes and the D3D8 compression byte come
 * next; otherwise bits 8-15 of the raster flags (0x00 rgba32 .. 0x06
 * compressed), then the palette flags, then rgba32.
 */
[[nodiscard]] RWTXD_EXPORT texture_format classify_format(std::uint32_t platform_id,
                                                          std::uint32_t d3d_format,
                                                          std::uint32_t raster_format_flags,
                                                          std::uint8_t platform_properties) noexcept;

/**
 * Concrete pixel encoding of a parsed texture (platform, D3D format,
 * raster flags, compression byte, coarse format and palette must be set).
 */
[[nodiscard]] RWTXD_EXPORT raster_encoding resolve_encoding(const texture_info& tex) noexcept;

// ============================================================================
// Texture Native Decoder
// ============================================================================

class RWTXD_EXPORT texture_native_decoder {
public:
    static constexpr std::string_view name = "texture_native";

    // Smallest body holding every header field
    static constexpr std::size_t MIN_BODY_SIZE = 87;

    static constexpr std::size_t NAME_SIZE = 32;
    static constexpr std::size_t MASK_SIZE = 32;
    static constexpr std::size_t SHORT_MASK_SIZE = 20;

    // Raster fields after the mask name: flags, d3d format, width, height,
    // depth, levels, raster type, platform properties
    static constexpr std::size_t RASTER_FIELDS_SIZE = 16;

    /**
     * Width of the mask name field at `pos`.
     * D3D8/D3D9 textures stamped with a RenderWare 3.x version always use 32
     * bytes; anything else is probed: if the u32 32 bytes ahead looks like a
     * small non-zero raster flag value the mask is 32 bytes. Otherwise 20,
     * unless only the 32-byte reading gives non-zero dimensions and a valid
     * depth.
     */
    [[nodiscard]] static std::size_t mask_width(std::span<const std::uint8_t> fields,
                                                std::size_t pos,
                                                std::uint32_t platform_id,
                                                std::uint32_t version) noexcept;

    /**
     * Parse one TEXTURENATIVE body.
     * The body may begin with an inner STRUCT header wrapping the fields;
     * both forms are accepted.
     *
     * @param body Section payload (may be truncated)
     * @param version Library id of the section header
     * @param absolute_offset File offset of body[0]
     * @param out Receives the parsed texture
     * @param options Dimension limits and verbosity
     */
    [[nodiscard]] static txd_result decode(std::span<const std::uint8_t> body,
                                           std::uint32_t version,
                                           std::uint64_t absolute_offset,
                                           texture_info& out,
                                           const load_options& options = {});
};

} // namespace rwtxd

#endif // RWTXD_TEXTURE_NATIVE_HPP_
