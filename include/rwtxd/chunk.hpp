#ifndef RWTXD_CHUNK_HPP_
#define RWTXD_CHUNK_HPP_

#include <rwtxd/rwtxd_export.h>

#include <cstddef>
#include <cstdint>
#include <span>

namespace rwtxd {

// ============================================================================
// RenderWare Chunk Stream
// ============================================================================

// Section type ids used by texture dictionaries
inline constexpr std::uint32_t CHUNK_STRUCT = 0x01;
inline constexpr std::uint32_t CHUNK_EXTENSION = 0x03;
inline constexpr std::uint32_t CHUNK_TEXTURE_NATIVE = 0x15;
inline constexpr std::uint32_t CHUNK_TEX_DICTIONARY = 0x16;
inline constexpr std::uint32_t CHUNK_TEXTURE_NATIVE_EXT = 0x0253FF01;

inline constexpr std::size_t CHUNK_HEADER_SIZE = 12;

/**
 * 12-byte header in front of every section: type, payload size, library id.
 */
struct chunk_header {
    std::uint32_t type = 0;
    std::uint32_t size = 0;
    std::uint32_t version = 0;
};

[[nodiscard]] constexpr bool is_texture_native(std::uint32_t type) noexcept {
    return type == CHUNK_TEXTURE_NATIVE || type == CHUNK_TEXTURE_NATIVE_EXT;
}

/**
 * Read a chunk header at the given offset.
 * @return false if fewer than 12 bytes remain
 */
[[nodiscard]] RWTXD_EXPORT bool read_chunk_header(std::span<const std::uint8_t> data,
                                                  std::size_t offset,
                                                  chunk_header& out) noexcept;

/**
 * True if the declared payload of a header at `offset` fits in the buffer.
 */
[[nodiscard]] RWTXD_EXPORT bool chunk_fits(std::span<const std::uint8_t> data,
                                           std::size_t offset,
                                           const chunk_header& header) noexcept;

/**
 * Human readable section name ("Struct", "TextureNative", ...), used in
 * diagnostics.
 */
[[nodiscard]] RWTXD_EXPORT const char* chunk_name(std::uint32_t type) noexcept;

} // namespace rwtxd

#endif // RWTXD_CHUNK_HPP_
