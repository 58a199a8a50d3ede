#ifndef RWTXD_TXD_ARCHIVE_HPP_
#define RWTXD_TXD_ARCHIVE_HPP_

#include <rwtxd/rwtxd_export.h>
#include <rwtxd/types.hpp>
#include <rwtxd/texture_info.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rwtxd {

// ============================================================================
// Statistics
// ============================================================================

struct txd_statistics {
    std::size_t total_textures = 0;
    std::uint64_t total_size_bytes = 0;  // sum of data_size
    double average_width = 0.0;
    double average_height = 0.0;
    std::map<std::string, std::size_t> format_counts;  // keyed by to_string(texture_format)
    std::optional<std::string> renderware_version;
};

// ============================================================================
// TXD Archive
// ============================================================================

/**
 * An ordered collection of native textures loaded from (or destined for) a
 * RenderWare texture dictionary.
 *
 * Textures keep file order and names may repeat; lookups by name return the
 * first match. Not safe for concurrent mutation; decoding different textures
 * through a const archive is.
 */
class RWTXD_EXPORT txd_archive {
public:
    txd_archive() = default;

    /**
     * Check the TEXDICTIONARY header without parsing the archive.
     */
    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;

    /**
     * Read and parse a TXD file. Pixel payloads stay in the file and are
     * read on demand.
     *
     * @param path File to read
     * @param out Receives the archive (left untouched on failure)
     * @param options Parser limits
     */
    [[nodiscard]] static txd_result load_from_path(const std::filesystem::path& path,
                                                   txd_archive& out,
                                                   const load_options& options = {});

    /**
     * Parse a TXD held in memory.
     * With an empty path the pixel payloads are copied out of `data`, since
     * there is no file to read them from later.
     */
    [[nodiscard]] static txd_result load_from_memory(std::span<const std::uint8_t> data,
                                                     const std::filesystem::path& path,
                                                     txd_archive& out,
                                                     const load_options& options = {});

    /**
     * Write the archive as a texture dictionary.
     */
    [[nodiscard]] txd_result save_to_path(const std::filesystem::path& path) const;

    /**
     * Serialize the archive into a byte buffer (same bytes as save_to_path).
     */
    [[nodiscard]] txd_result serialize(std::vector<std::uint8_t>& out) const;

    // ------------------------------------------------------------------------
    // Textures
    // ------------------------------------------------------------------------

    [[nodiscard]] const std::vector<texture_info>& textures() const noexcept { return textures_; }
    [[nodiscard]] std::size_t total_textures() const noexcept { return total_textures_; }

    [[nodiscard]] const texture_info* get_texture_info(std::string_view name) const noexcept;
    [[nodiscard]] texture_info* find_texture(std::string_view name) noexcept;
    [[nodiscard]] std::vector<std::string> texture_names() const;

    void add_texture(texture_info texture);

    /**
     * Remove every texture with the given name.
     * @return true if at least one texture was removed
     */
    bool remove_texture(std::string_view name);

    void clear();

    // ------------------------------------------------------------------------
    // Pixel payloads
    // ------------------------------------------------------------------------

    /**
     * Raw pixel bytes of a texture, starting at its data_offset.
     * Uses the owned payload when present, otherwise reads the source file.
     */
    [[nodiscard]] txd_result get_texture_data(const texture_info& texture,
                                              std::vector<std::uint8_t>& out) const;

    /**
     * Copy every payload out of the source file so the archive no longer
     * depends on it.
     */
    [[nodiscard]] txd_result load_pixel_payloads();

    // ------------------------------------------------------------------------
    // Metadata
    // ------------------------------------------------------------------------

    [[nodiscard]] const std::filesystem::path& file_path() const noexcept { return file_path_; }
    void set_file_path(std::filesystem::path path) { file_path_ = std::move(path); }

    [[nodiscard]] const std::optional<std::string>& renderware_version() const noexcept {
        return renderware_version_;
    }

    // Library id of the TEXDICTIONARY header; 0 when built in memory
    [[nodiscard]] std::uint32_t library_id() const noexcept { return library_id_; }
    void set_library_id(std::uint32_t library_id);

    [[nodiscard]] txd_statistics get_statistics() const;

private:
    std::vector<texture_info> textures_;
    std::size_t total_textures_ = 0;
    std::filesystem::path file_path_;
    std::optional<std::string> renderware_version_;
    std::uint32_t library_id_ = 0;
};

} // namespace rwtxd

#endif // RWTXD_TXD_ARCHIVE_HPP_
