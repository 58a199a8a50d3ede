#ifndef RWTXD_VERSION_HPP_
#define RWTXD_VERSION_HPP_

#include <rwtxd/rwtxd_export.h>

#include <cstdint>
#include <string>

namespace rwtxd {

// ============================================================================
// RenderWare Library Version Stamps
// ============================================================================

// Library id written by GTA San Andreas (3.6.0.3); used when an archive
// carries no stamp of its own.
inline constexpr std::uint32_t DEFAULT_LIBRARY_ID = 0x1803FFFF;

/**
 * Decode the version part of a chunk header library id.
 * Returns the packed form 0xMmpr (e.g. 0x36003 for 3.6.0.3).
 * Pre-3.1 stamps carry the bare version shifted right by 8.
 */
[[nodiscard]] RWTXD_EXPORT std::uint32_t unpack_library_version(std::uint32_t library_id) noexcept;

/**
 * Build number of a library id (0 for pre-3.1 stamps).
 */
[[nodiscard]] RWTXD_EXPORT std::uint32_t library_build(std::uint32_t library_id) noexcept;

/**
 * Encode a packed version (0x36003) and build into a library id.
 */
[[nodiscard]] RWTXD_EXPORT std::uint32_t pack_library_id(std::uint32_t version, std::uint32_t build) noexcept;

// True when the library id decodes into the RenderWare 3.x range.
[[nodiscard]] RWTXD_EXPORT bool is_valid_version(std::uint32_t library_id) noexcept;

// True when the library id decodes to a version listed in the game catalogue.
[[nodiscard]] RWTXD_EXPORT bool is_known_version(std::uint32_t library_id) noexcept;

// "3.6.0.3" (the fourth component is omitted when zero)
[[nodiscard]] RWTXD_EXPORT std::string version_string(std::uint32_t version);

// Game that shipped a version, or nullptr
[[nodiscard]] RWTXD_EXPORT const char* game_for_version(std::uint32_t version) noexcept;

/**
 * Display form of a library id: the version string followed by the
 * matching game in parentheses, e.g. "3.6.0.3 (GTA San Andreas)".
 */
[[nodiscard]] RWTXD_EXPORT std::string version_display_string(std::uint32_t library_id);

} // namespace rwtxd

#endif // RWTXD_VERSION_HPP_
