#ifndef RWTXD_TEXTURE_INFO_HPP_
#define RWTXD_TEXTURE_INFO_HPP_

#include <rwtxd/rwtxd_export.h>
#include <rwtxd/types.hpp>
#include <rwtxd/surface.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace rwtxd {

class txd_archive;

// ============================================================================
// Size Calculation
// ============================================================================

/**
 * Analytic payload size of a texture, summed over all mip levels.
 * Each level halves the previous one (floor, minimum 1).
 *
 * @param width Top level width
 * @param height Top level height
 * @param format Coarse format classification
 * @param mipmap_count Number of levels (0 is treated as 1)
 */
[[nodiscard]] RWTXD_EXPORT std::uint32_t texture_data_size(std::uint16_t width,
                                                           std::uint16_t height,
                                                           texture_format format,
                                                           std::uint32_t mipmap_count) noexcept;

// Bytes of a single width x height level in a coarse format
[[nodiscard]] RWTXD_EXPORT std::uint32_t level_data_size(std::uint32_t width,
                                                         std::uint32_t height,
                                                         texture_format format) noexcept;

/**
 * Exact bytes of one level in a concrete encoding.
 * compressed_unknown is sized as BC1; unsupported is 0.
 */
[[nodiscard]] RWTXD_EXPORT std::size_t encoded_level_size(raster_encoding enc, int width, int height) noexcept;

// ============================================================================
// Texture Info
// ============================================================================

/**
 * One native texture of a dictionary: header fields, optional palette and
 * the location (or owned copy) of its pixel payload.
 */
struct RWTXD_EXPORT texture_info {
    std::string name;
    std::string mask_name;

    std::uint16_t width = 0;
    std::uint16_t height = 0;
    std::uint8_t depth = 0;
    std::uint8_t mipmap_count = 1;

    texture_format format = texture_format::rgba32;
    raster_encoding encoding = raster_encoding::unsupported;

    // Raw discriminators, written back verbatim on save
    std::uint32_t platform_id = 0;
    std::uint32_t raster_format_flags = 0;
    std::uint32_t d3d_format = 0;
    std::uint8_t raster_type = 0;
    std::uint8_t platform_properties = 0;

    rwtxd::filter_mode filter = rwtxd::filter_mode::linear;
    addressing_mode addressing_u = addressing_mode::wrap;
    addressing_mode addressing_v = addressing_mode::wrap;

    // 64 (palette4) or 1024 (palette8) bytes of RGBA entries
    std::optional<std::vector<std::uint8_t>> palette_data;

    // Absolute file offset of the first pixel byte
    std::uint64_t data_offset = 0;
    // texture_data_size() of the header fields
    std::uint32_t data_size = 0;
    // Bytes between data_offset and the end of the section in the source
    std::uint32_t stored_size = 0;

    // Pixel bytes starting at data_offset. Empty until loaded from the
    // source file or assigned by the caller.
    std::vector<std::uint8_t> pixel_payload;

    [[nodiscard]] bool has_payload() const noexcept { return !pixel_payload.empty(); }

    [[nodiscard]] int level_width(int level) const noexcept;
    [[nodiscard]] int level_height(int level) const noexcept;

    /**
     * Bytes of one level in this texture's encoding (coarse format size when
     * the encoding is unsupported).
     */
    [[nodiscard]] std::size_t level_size(int level) const noexcept;

    /**
     * Bytes needed to hold every level, including the u32 length prefix in
     * front of each level after the first.
     */
    [[nodiscard]] std::size_t payload_length() const noexcept;

    /**
     * Locate one mip level inside a payload that starts at data_offset.
     * A u32 length prefix in front of a level is skipped when it matches the
     * level size.
     *
     * @param payload Pixel payload
     * @param level Mip level (0 = full size)
     * @param out Receives the level bytes
     */
    [[nodiscard]] txd_result extract_level(std::span<const std::uint8_t> payload,
                                           int level,
                                           std::span<const std::uint8_t>& out) const;

    /**
     * Decode one mip level to tightly packed RGBA8 rows.
     * The payload is the owned one when present, otherwise it is read from
     * the archive's source file.
     *
     * @param archive Archive the texture belongs to
     * @param level Mip level (0 = full size)
     * @param out Receives level_width(level) * level_height(level) * 4 bytes
     */
    [[nodiscard]] txd_result to_rgba(const txd_archive& archive, int level,
                                     std::vector<std::uint8_t>& out) const;

    [[nodiscard]] txd_result to_rgba(const txd_archive& archive, int level, surface& surf) const;

    /**
     * Decode one mip level from an explicit payload.
     */
    [[nodiscard]] txd_result decode_level(std::span<const std::uint8_t> payload, int level,
                                          surface& surf) const;
};

} // namespace rwtxd

#endif // RWTXD_TEXTURE_INFO_HPP_
