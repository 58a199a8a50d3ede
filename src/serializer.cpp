#include <rwtxd/txd_archive.hpp>
#include <rwtxd/chunk.hpp>
#include <rwtxd/codecs/paletted.hpp>
#include <rwtxd/texture_native.hpp>
#include <rwtxd/version.hpp>
#include "byte_io.hpp"
#include "log.hpp"

#include <fmt/core.h>
#include <fmt/std.h>

#include <algorithm>
#include <fstream>
#include <utility>
#include <vector>

namespace rwtxd {

namespace {

// Header with a size slot patched once the payload is written
std::size_t begin_chunk(std::vector<std::uint8_t>& out, std::uint32_t type, std::uint32_t version) {
    write_le32(out, type);
    const std::size_t size_slot = out.size();
    write_le32(out, 0);
    write_le32(out, version);
    return size_slot;
}

void end_chunk(std::vector<std::uint8_t>& out, std::size_t size_slot) {
    const std::size_t payload_start = size_slot + 8;
    patch_le32(out, size_slot, static_cast<std::uint32_t>(out.size() - payload_start));
}

void write_empty_extension(std::vector<std::uint8_t>& out, std::uint32_t version) {
    write_le32(out, CHUNK_EXTENSION);
    write_le32(out, 0);
    write_le32(out, version);
}

void write_palette(std::vector<std::uint8_t>& out, const texture_info& tex) {
    const std::size_t size = tex.format == texture_format::palette4
        ? paletted_decoder::PALETTE4_SIZE : paletted_decoder::PALETTE8_SIZE;

    if (tex.palette_data && tex.palette_data->size() == size) {
        out.insert(out.end(), tex.palette_data->begin(), tex.palette_data->end());
        return;
    }

    detail::log_warning("texture '{}': palette missing or mis-sized, writing {} zero bytes",
                        tex.name, size);
    out.insert(out.end(), size, 0);
}

void write_texture_native(std::vector<std::uint8_t>& out, const texture_info& tex,
                          std::span<const std::uint8_t> payload, std::uint32_t version) {
    const std::size_t native_slot = begin_chunk(out, CHUNK_TEXTURE_NATIVE, version);
    const std::size_t struct_slot = begin_chunk(out, CHUNK_STRUCT, version);

    // Header fields, in parse order
    write_le32(out, tex.platform_id);
    write_u8(out, static_cast<std::uint8_t>(tex.filter));
    write_u8(out, static_cast<std::uint8_t>((static_cast<std::uint8_t>(tex.addressing_u) << 4) |
                                            static_cast<std::uint8_t>(tex.addressing_v)));
    write_le16(out, 0);
    write_fixed_string(out, tex.name, texture_native_decoder::NAME_SIZE);
    write_fixed_string(out, tex.mask_name, texture_native_decoder::MASK_SIZE);
    write_le32(out, tex.raster_format_flags);
    write_le32(out, tex.d3d_format);
    write_le16(out, tex.width);
    write_le16(out, tex.height);
    write_u8(out, tex.depth);
    write_u8(out, std::max<std::uint8_t>(tex.mipmap_count, 1));
    write_u8(out, tex.raster_type);
    write_u8(out, tex.platform_properties);

    if (is_paletted(tex.format)) {
        write_palette(out, tex);
    }

    // Each level is prefixed with its byte length
    const int levels = std::max<int>(tex.mipmap_count, 1);
    bool placeholder = payload.empty();

    for (int i = 0; i < levels; ++i) {
        const std::size_t size = tex.level_size(i);
        write_le32(out, static_cast<std::uint32_t>(size));

        std::span<const std::uint8_t> level;
        if (!payload.empty() && tex.extract_level(payload, i, level)) {
            out.insert(out.end(), level.begin(), level.end());
        } else {
            placeholder = true;
            out.insert(out.end(), size, 0);
        }
    }

    if (placeholder) {
        detail::log_warning("texture '{}': pixel data unavailable, wrote zero placeholder", tex.name);
    }

    end_chunk(out, struct_slot);
    write_empty_extension(out, version);
    end_chunk(out, native_slot);
}

} // namespace

// ============================================================================
// Serialization
// ============================================================================

txd_result txd_archive::serialize(std::vector<std::uint8_t>& out) const {
    const std::uint32_t version = library_id_ != 0 ? library_id_ : DEFAULT_LIBRARY_ID;

    std::vector<std::uint8_t> buffer;
    const std::size_t dictionary_slot = begin_chunk(buffer, CHUNK_TEX_DICTIONARY, version);

    // Dictionary info: texture count, device id
    const std::size_t info_slot = begin_chunk(buffer, CHUNK_STRUCT, version);
    write_le32(buffer, static_cast<std::uint32_t>(textures_.size()));
    write_le32(buffer, 0);
    end_chunk(buffer, info_slot);

    for (const auto& tex : textures_) {
        std::vector<std::uint8_t> source;
        std::span<const std::uint8_t> payload = tex.pixel_payload;

        if (!tex.has_payload() && !file_path_.empty() && tex.stored_size > 0) {
            auto result = get_texture_data(tex, source);
            if (result) {
                payload = source;
            } else {
                detail::log_warning("texture '{}': {}", tex.name, result.message);
            }
        }

        write_texture_native(buffer, tex, payload, version);
    }

    write_empty_extension(buffer, version);
    end_chunk(buffer, dictionary_slot);

    out = std::move(buffer);
    return txd_result::success();
}

txd_result txd_archive::save_to_path(const std::filesystem::path& path) const {
    std::vector<std::uint8_t> data;
    auto result = serialize(data);
    if (!result) return result;

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return txd_result::failure(txd_error::file_write_failed,
            fmt::format("Failed to open {} for writing", path));
    }

    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!file) {
        return txd_result::failure(txd_error::file_write_failed,
            fmt::format("Failed to write {} bytes to {}", data.size(), path));
    }

    return txd_result::success();
}

} // namespace rwtxd
