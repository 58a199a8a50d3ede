#ifndef RWTXD_CODECS_PALETTED_HPP_
#define RWTXD_CODECS_PALETTED_HPP_

#include <rwtxd/rwtxd_export.h>
#include <rwtxd/types.hpp>
#include <rwtxd/surface.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace rwtxd {

// ============================================================================
// Paletted Raster Decoder
// ============================================================================

class RWTXD_EXPORT paletted_decoder {
public:
    static constexpr std::string_view name = "paletted";

    // Palette block sizes (RGBA entries)
    static constexpr std::size_t PALETTE4_SIZE = 16 * 4;
    static constexpr std::size_t PALETTE8_SIZE = 256 * 4;

    [[nodiscard]] static bool handles(raster_encoding enc) noexcept {
        return enc == raster_encoding::pal4 || enc == raster_encoding::pal8;
    }

    /**
     * Palette length required by an encoding (0 if not paletted).
     */
    [[nodiscard]] static std::size_t palette_size(raster_encoding enc) noexcept;

    /**
     * Index bytes for one width x height level.
     * 4-bit indices are packed two per byte, low nibble first.
     */
    [[nodiscard]] static std::size_t expected_size(raster_encoding enc, int width, int height) noexcept;

    /**
     * Decode one paletted level to RGBA8.
     * Every index is looked up in the palette and the 4-byte RGBA entry is
     * copied verbatim.
     *
     * @param enc pal4 or pal8
     * @param data Index bytes, exactly expected_size()
     * @param palette Companion colour table, exactly palette_size() bytes
     * @param width Level width
     * @param height Level height
     * @param surf Destination surface
     */
    [[nodiscard]] static txd_result decode(raster_encoding enc,
                                           std::span<const std::uint8_t> data,
                                           std::span<const std::uint8_t> palette,
                                           int width, int height,
                                           surface& surf);
};

} // namespace rwtxd

#endif // RWTXD_CODECS_PALETTED_HPP_
