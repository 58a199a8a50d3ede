#ifndef RWTXD_CODECS_BLOCK_HPP_
#define RWTXD_CODECS_BLOCK_HPP_

#include <rwtxd/rwtxd_export.h>
#include <rwtxd/types.hpp>
#include <rwtxd/surface.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace rwtxd {

// ============================================================================
// Block-Compressed (DXT / BC) Decoder
// ============================================================================

class RWTXD_EXPORT block_decoder {
public:
    static constexpr std::string_view name = "block";

    [[nodiscard]] static bool handles(raster_encoding enc) noexcept;

    /**
     * Bytes per 4x4 block: 8 for DXT1, 16 for DXT2..DXT5, 0 otherwise.
     */
    [[nodiscard]] static std::size_t block_size(raster_encoding enc) noexcept;

    /**
     * Exact byte length of one width x height level (partial edge blocks
     * count as whole blocks).
     */
    [[nodiscard]] static std::size_t expected_size(raster_encoding enc, int width, int height) noexcept;

    /**
     * Decode one compressed level to RGBA8.
     * Supports:
     *   - DXT1 (BC1) with 1-bit punch-through alpha
     *   - DXT2/DXT3 (BC2) explicit 4-bit alpha
     *   - DXT4/DXT5 (BC3) interpolated alpha
     * DXT2 and DXT4 store premultiplied colour, which is divided back out.
     *
     * @param enc dxt1 .. dxt5
     * @param data Block data, exactly expected_size() bytes
     * @param width Level width
     * @param height Level height
     * @param surf Destination surface
     */
    [[nodiscard]] static txd_result decode(raster_encoding enc,
                                           std::span<const std::uint8_t> data,
                                           int width, int height,
                                           surface& surf);

    /**
     * Decode a level whose DXT variant is unknown: BC1 first, BC3 if that
     * fails.
     */
    [[nodiscard]] static txd_result try_decode_compressed(std::span<const std::uint8_t> data,
                                                          int width, int height,
                                                          surface& surf);
};

} // namespace rwtxd

#endif // RWTXD_CODECS_BLOCK_HPP_
