#ifndef RWTXD_CODECS_UNCOMPRESSED_HPP_
#define RWTXD_CODECS_UNCOMPRESSED_HPP_

#include <rwtxd/rwtxd_export.h>
#include <rwtxd/types.hpp>
#include <rwtxd/surface.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace rwtxd {

// ============================================================================
// Uncompressed Raster Decoder
// ============================================================================

class RWTXD_EXPORT uncompressed_decoder {
public:
    static constexpr std::string_view name = "uncompressed";

    /**
     * Check whether an encoding is handled by this decoder.
     */
    [[nodiscard]] static bool handles(raster_encoding enc) noexcept;

    /**
     * Exact byte length of one width x height level in the given encoding.
     * @return 0 for encodings this decoder does not handle
     */
    [[nodiscard]] static std::size_t expected_size(raster_encoding enc, int width, int height) noexcept;

    /**
     * Decode one level to RGBA8.
     * Supports:
     *   - BGRA8888, BGR888 (little-endian byte order B, G, R[, A])
     *   - 16-bit 565, 555, 1555 and 4444 (A in the top bits)
     *   - L8 and A8L8 luminance
     *
     * The input must be exactly expected_size() bytes; anything else fails
     * with txd_error::size_mismatch.
     *
     * @param enc Source encoding
     * @param data Raw texel bytes for the level
     * @param width Level width
     * @param height Level height
     * @param surf Destination surface
     * @return Decode result with success/error status
     */
    [[nodiscard]] static txd_result decode(raster_encoding enc,
                                           std::span<const std::uint8_t> data,
                                           int width, int height,
                                           surface& surf);
};

} // namespace rwtxd

#endif // RWTXD_CODECS_UNCOMPRESSED_HPP_
