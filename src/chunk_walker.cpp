#include <rwtxd/chunk_walker.hpp>
#include <rwtxd/chunk.hpp>
#include <rwtxd/texture_native.hpp>
#include "byte_io.hpp"
#include "log.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <utility>

namespace rwtxd {

const char* to_string(walk_mode mode) noexcept {
    switch (mode) {
        case walk_mode::structured: return "structured";
        case walk_mode::scanning:   return "scanning";
    }
    return "unknown";
}

chunk_walker::chunk_walker(const load_options& options)
    : options_(options) {}

txd_result chunk_walker::walk(std::span<const std::uint8_t> data,
                              std::vector<texture_info>& textures) {
    report_ = {};

    chunk_header top;
    if (!read_chunk_header(data, 0, top)) {
        return txd_result::failure(txd_error::parse_error,
            fmt::format("TXD data too small: {} bytes (need at least {})", data.size(), CHUNK_HEADER_SIZE));
    }
    if (top.type != CHUNK_TEX_DICTIONARY) {
        return txd_result::failure(txd_error::parse_error,
            fmt::format("Not a texture dictionary: top section is 0x{:X} ({})", top.type, chunk_name(top.type)));
    }
    report_.library_id = top.version;

    std::size_t offset = CHUNK_HEADER_SIZE;

    chunk_header info;
    if (!read_chunk_header(data, offset, info) || info.type != CHUNK_STRUCT) {
        detail::log_debug(options_.verbose, "no dictionary STRUCT at {}, scanning", offset);
        walk_scanning(data, offset, textures);
        return txd_result::success();
    }

    const std::size_t info_offset = offset;
    offset += CHUNK_HEADER_SIZE;

    if (!chunk_fits(data, info_offset, info) || info.size < 4) {
        detail::log_warning("dictionary STRUCT unreadable (size {}), scanning for textures", info.size);
        walk_scanning(data, offset, textures);
        return txd_result::success();
    }

    const std::uint32_t count = read_le32(data.data() + offset);
    report_.declared_count = count;
    if (info.size >= 8) {
        report_.device_id = read_le32(data.data() + offset + 4);
    }
    offset += info.size;

    if (count > options_.max_plausible_texture_count) {
        report_.count_rejected = true;
        detail::log_warning("texture count {} is implausible (limit {}), scanning for textures",
                            count, options_.max_plausible_texture_count);
        walk_scanning(data, offset, textures);
        return txd_result::success();
    }
    if (count == 0) {
        walk_scanning(data, offset, textures);
        return txd_result::success();
    }

    walk_structured(data, offset, count, textures);
    return txd_result::success();
}

void chunk_walker::walk_structured(std::span<const std::uint8_t> data, std::size_t offset,
                                   std::uint32_t count, std::vector<texture_info>& textures) {
    report_.mode = walk_mode::structured;

    while (report_.matches < count) {
        chunk_header header;
        if (!read_chunk_header(data, offset, header)) {
            detail::log_warning("dictionary declares {} textures, data ends after {}",
                                count, report_.matches);
            return;
        }

        const std::size_t body_offset = offset + CHUNK_HEADER_SIZE;

        if (is_texture_native(header.type)) {
            ++report_.matches;

            if (!chunk_fits(data, offset, header)) {
                // Keep what metadata the truncated section still holds
                detail::log_warning("texture section at {} declares {} bytes, only {} present",
                                    offset, header.size, data.size() - body_offset);
                decode_entry(data.subspan(body_offset), header.version, body_offset, textures);
                return;
            }

            decode_entry(data.subspan(body_offset, header.size), header.version, body_offset, textures);
            offset = body_offset + header.size;
            continue;
        }

        detail::log_debug(options_.verbose, "skipping {} section (0x{:X}) at {}",
                          chunk_name(header.type), header.type, offset);

        if (header.size == 0 || !chunk_fits(data, offset, header)) {
            offset = body_offset;
        } else {
            offset = body_offset + header.size;
        }
    }
}

void chunk_walker::walk_scanning(std::span<const std::uint8_t> data, std::size_t offset,
                                 std::vector<texture_info>& textures) {
    report_.mode = walk_mode::scanning;
    std::size_t zero_run = 0;

    while (report_.scan_steps < options_.scan_max_steps &&
           report_.matches < options_.scan_max_textures) {
        chunk_header header;
        if (!read_chunk_header(data, offset, header)) {
            break;
        }
        ++report_.scan_steps;

        const std::size_t body_offset = offset + CHUNK_HEADER_SIZE;

        if (header.type == 0) {
            ++zero_run;
            report_.max_zero_run = std::max(report_.max_zero_run, zero_run);
            if (zero_run >= options_.scan_max_zero_headers) {
                detail::log_debug(options_.verbose, "{} zero headers in a row at {}, stopping scan",
                                  zero_run, offset);
                break;
            }
            offset = body_offset;
            continue;
        }
        zero_run = 0;

        const bool fits = chunk_fits(data, offset, header);

        if (is_texture_native(header.type)) {
            if (!fits) {
                detail::log_debug(options_.verbose, "texture marker at {} overruns the buffer, skipping header",
                                  offset);
                offset = body_offset;
                continue;
            }

            ++report_.matches;
            decode_entry(data.subspan(body_offset, header.size), header.version, body_offset, textures);
            offset = body_offset + header.size;
            continue;
        }

        if (header.size == 0 || !fits) {
            offset = body_offset;
        } else {
            offset = body_offset + header.size;
        }
    }

    detail::log_debug(options_.verbose, "scan finished: {} steps, {} textures, {} found",
                      report_.scan_steps, report_.matches, textures.size());
}

void chunk_walker::decode_entry(std::span<const std::uint8_t> body, std::uint32_t version,
                                std::size_t body_offset, std::vector<texture_info>& textures) {
    texture_info tex;
    auto result = texture_native_decoder::decode(body, version, body_offset, tex, options_);
    if (!result) {
        ++report_.failed_entries;
        detail::log_warning("skipping texture at offset {}: {}", body_offset, result.message);
        return;
    }
    textures.push_back(std::move(tex));
}

} // namespace rwtxd
