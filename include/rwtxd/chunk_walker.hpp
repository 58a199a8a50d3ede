#ifndef RWTXD_CHUNK_WALKER_HPP_
#define RWTXD_CHUNK_WALKER_HPP_

#include <rwtxd/rwtxd_export.h>
#include <rwtxd/types.hpp>
#include <rwtxd/texture_info.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace rwtxd {

// ============================================================================
// Chunk Walker
// ============================================================================

enum class walk_mode {
    structured,  // STRUCT texture count trusted
    scanning     // linear search for TEXTURENATIVE markers
};

[[nodiscard]] RWTXD_EXPORT const char* to_string(walk_mode mode) noexcept;

/**
 * What a walk did, for diagnostics and tests.
 */
struct walk_report {
    walk_mode mode = walk_mode::structured;
    std::uint32_t library_id = 0;      // TEXDICTIONARY header version
    std::uint32_t declared_count = 0;  // STRUCT texture count (0 if absent)
    std::uint32_t device_id = 0;
    bool count_rejected = false;       // count above max_plausible_texture_count
    std::size_t scan_steps = 0;
    std::size_t matches = 0;           // TEXTURENATIVE sections found
    std::size_t max_zero_run = 0;      // longest run of zero-type headers
    std::size_t failed_entries = 0;    // sections the decoder rejected
};

/**
 * Walks the section tree of a texture dictionary and hands every
 * TEXTURENATIVE section to texture_native_decoder.
 *
 * A texture that fails to parse is logged and skipped; only a missing or
 * wrong top level header fails the walk.
 */
class RWTXD_EXPORT chunk_walker {
public:
    explicit chunk_walker(const load_options& options = {});

    /**
     * Walk a complete TXD buffer.
     * @param data File contents
     * @param textures Receives the parsed textures in file order
     */
    [[nodiscard]] txd_result walk(std::span<const std::uint8_t> data,
                                  std::vector<texture_info>& textures);

    [[nodiscard]] const walk_report& report() const noexcept { return report_; }

private:
    void walk_structured(std::span<const std::uint8_t> data, std::size_t offset,
                         std::uint32_t count, std::vector<texture_info>& textures);

    void walk_scanning(std::span<const std::uint8_t> data, std::size_t offset,
                       std::vector<texture_info>& textures);

    // Decode one section body; failures are logged and counted
    void decode_entry(std::span<const std::uint8_t> body, std::uint32_t version,
                      std::size_t body_offset, std::vector<texture_info>& textures);

    load_options options_;
    walk_report report_;
};

} // namespace rwtxd

#endif // RWTXD_CHUNK_WALKER_HPP_
