#include <rwtxd/txd_archive.hpp>
#include <rwtxd/chunk.hpp>
#include <rwtxd/chunk_walker.hpp>
#include <rwtxd/version.hpp>
#include "log.hpp"

#include <fmt/core.h>
#include <fmt/std.h>

#include <algorithm>
#include <fstream>
#include <system_error>
#include <utility>

namespace rwtxd {

namespace {

std::vector<std::uint8_t> read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return {};
    }

    const auto size = file.tellg();
    if (size <= 0) {
        return {};
    }
    file.seekg(0, std::ios::beg);

    std::vector<std::uint8_t> data(static_cast<std::size_t>(size));
    if (!file.read(reinterpret_cast<char*>(data.data()), size)) {
        return {};
    }

    return data;
}

} // namespace

// ============================================================================
// Loading
// ============================================================================

bool txd_archive::sniff(std::span<const std::uint8_t> data) noexcept {
    chunk_header header;
    return read_chunk_header(data, 0, header) && header.type == CHUNK_TEX_DICTIONARY;
}

txd_result txd_archive::load_from_path(const std::filesystem::path& path,
                                       txd_archive& out,
                                       const load_options& options) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return txd_result::failure(txd_error::file_read_failed,
            fmt::format("File not found: {}", path));
    }

    const auto data = read_file(path);
    if (data.empty()) {
        return txd_result::failure(txd_error::file_read_failed,
            fmt::format("Failed to read file: {}", path));
    }

    return load_from_memory(data, path, out, options);
}

txd_result txd_archive::load_from_memory(std::span<const std::uint8_t> data,
                                         const std::filesystem::path& path,
                                         txd_archive& out,
                                         const load_options& options) {
    std::vector<texture_info> textures;
    chunk_walker walker(options);

    auto result = walker.walk(data, textures);
    if (!result) return result;

    const auto& report = walker.report();

    txd_archive archive;
    archive.file_path_ = path;
    archive.set_library_id(report.library_id);

    for (auto& tex : textures) {
        if (path.empty() && tex.stored_size > 0 && tex.data_offset < data.size()) {
            const std::size_t begin = static_cast<std::size_t>(tex.data_offset);
            const std::size_t length = std::min<std::size_t>(tex.stored_size, data.size() - begin);
            tex.pixel_payload.assign(data.begin() + static_cast<std::ptrdiff_t>(begin),
                                     data.begin() + static_cast<std::ptrdiff_t>(begin + length));
        }
        archive.add_texture(std::move(tex));
    }

    detail::log_debug(options.verbose, "loaded {} textures ({} walk, {} rejected), RenderWare {}",
                      archive.total_textures(), to_string(report.mode), report.failed_entries,
                      archive.renderware_version_.value_or("unknown"));

    out = std::move(archive);
    return txd_result::success();
}

// ============================================================================
// Textures
// ============================================================================

const texture_info* txd_archive::get_texture_info(std::string_view name) const noexcept {
    for (const auto& tex : textures_) {
        if (tex.name == name) {
            return &tex;
        }
    }
    return nullptr;
}

texture_info* txd_archive::find_texture(std::string_view name) noexcept {
    for (auto& tex : textures_) {
        if (tex.name == name) {
            return &tex;
        }
    }
    return nullptr;
}

std::vector<std::string> txd_archive::texture_names() const {
    std::vector<std::string> names;
    names.reserve(textures_.size());
    for (const auto& tex : textures_) {
        names.push_back(tex.name);
    }
    return names;
}

void txd_archive::add_texture(texture_info texture) {
    textures_.push_back(std::move(texture));
    total_textures_ = textures_.size();
}

bool txd_archive::remove_texture(std::string_view name) {
    const auto removed = std::erase_if(textures_, [name](const texture_info& tex) {
        return tex.name == name;
    });
    total_textures_ = textures_.size();
    return removed > 0;
}

void txd_archive::clear() {
    textures_.clear();
    total_textures_ = 0;
}

// ============================================================================
// Pixel payloads
// ============================================================================

txd_result txd_archive::get_texture_data(const texture_info& texture,
                                         std::vector<std::uint8_t>& out) const {
    if (texture.has_payload()) {
        out = texture.pixel_payload;
        return txd_result::success();
    }

    if (file_path_.empty()) {
        return txd_result::failure(txd_error::not_found,
            fmt::format("Texture '{}' has no pixel payload and the archive has no source file",
                        texture.name));
    }

    std::error_code ec;
    const auto file_size = std::filesystem::file_size(file_path_, ec);
    if (ec) {
        return txd_result::failure(txd_error::file_read_failed,
            fmt::format("Failed to stat {}: {}", file_path_, ec.message()));
    }
    if (texture.data_offset >= file_size) {
        return txd_result::failure(txd_error::size_mismatch,
            fmt::format("Texture '{}' data offset {} is past the end of {} ({} bytes)",
                        texture.name, texture.data_offset, file_path_, file_size));
    }

    std::size_t length = texture.stored_size > 0 ? texture.stored_size : texture.payload_length();
    length = static_cast<std::size_t>(
        std::min<std::uint64_t>(length, file_size - texture.data_offset));

    std::ifstream file(file_path_, std::ios::binary);
    if (!file) {
        return txd_result::failure(txd_error::file_read_failed,
            fmt::format("Failed to open {}", file_path_));
    }

    std::vector<std::uint8_t> data(length);
    file.seekg(static_cast<std::streamoff>(texture.data_offset), std::ios::beg);
    if (!file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(length))) {
        return txd_result::failure(txd_error::file_read_failed,
            fmt::format("Failed to read {} bytes of '{}' at offset {}",
                        length, texture.name, texture.data_offset));
    }

    out = std::move(data);
    return txd_result::success();
}

txd_result txd_archive::load_pixel_payloads() {
    for (auto& tex : textures_) {
        if (tex.has_payload() || tex.stored_size == 0) {
            continue;
        }

        std::vector<std::uint8_t> data;
        auto result = get_texture_data(tex, data);
        if (!result) return result;

        tex.pixel_payload = std::move(data);
    }
    return txd_result::success();
}

// ============================================================================
// Metadata
// ============================================================================

void txd_archive::set_library_id(std::uint32_t library_id) {
    library_id_ = library_id;
    if (library_id == 0) {
        renderware_version_.reset();
    } else {
        renderware_version_ = version_display_string(library_id);
    }
}

txd_statistics txd_archive::get_statistics() const {
    txd_statistics stats;
    stats.total_textures = total_textures_;
    stats.renderware_version = renderware_version_;

    std::uint64_t width_sum = 0;
    std::uint64_t height_sum = 0;

    for (const auto& tex : textures_) {
        stats.total_size_bytes += tex.data_size;
        width_sum += tex.width;
        height_sum += tex.height;
        ++stats.format_counts[to_string(tex.format)];
    }

    if (!textures_.empty()) {
        stats.average_width = static_cast<double>(width_sum) / static_cast<double>(textures_.size());
        stats.average_height = static_cast<double>(height_sum) / static_cast<double>(textures_.size());
    }

    return stats;
}

} // namespace rwtxd
