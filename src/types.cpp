#include <rwtxd/types.hpp>

namespace rwtxd {

const char* to_string(txd_error err) noexcept {
    switch (err) {
        case txd_error::none:                 return "none";
        case txd_error::file_read_failed:     return "file_read_failed";
        case txd_error::file_write_failed:    return "file_write_failed";
        case txd_error::parse_error:          return "parse_error";
        case txd_error::size_mismatch:        return "size_mismatch";
        case txd_error::unsupported_format:   return "unsupported_format";
        case txd_error::invalid_palette:      return "invalid_palette";
        case txd_error::decompression_failed: return "decompression_failed";
        case txd_error::not_found:            return "not_found";
        case txd_error::invalid_argument:     return "invalid_argument";
        case txd_error::internal_error:       return "internal_error";
    }
    return "unknown";
}

const char* to_string(texture_format fmt) noexcept {
    switch (fmt) {
        case texture_format::rgba32:           return "RGBA32";
        case texture_format::rgba16:           return "RGBA16";
        case texture_format::luminance8:       return "Luminance8";
        case texture_format::luminance_alpha8: return "LuminanceAlpha8";
        case texture_format::palette4:         return "Palette4";
        case texture_format::palette8:         return "Palette8";
        case texture_format::compressed:       return "Compressed";
        case texture_format::bc1:              return "BC1";
        case texture_format::bc2:              return "BC2";
        case texture_format::bc3:              return "BC3";
    }
    return "unknown";
}

const char* to_string(raster_encoding enc) noexcept {
    switch (enc) {
        case raster_encoding::bgra8888:           return "BGRA8888";
        case raster_encoding::bgra888:            return "BGR888";
        case raster_encoding::bgra565:            return "BGR565";
        case raster_encoding::bgra555:            return "BGR555";
        case raster_encoding::bgra1555:           return "BGRA1555";
        case raster_encoding::bgra4444:           return "BGRA4444";
        case raster_encoding::lum8:               return "L8";
        case raster_encoding::lum8a8:             return "A8L8";
        case raster_encoding::pal4:               return "PAL4";
        case raster_encoding::pal8:               return "PAL8";
        case raster_encoding::dxt1:               return "DXT1";
        case raster_encoding::dxt2:               return "DXT2";
        case raster_encoding::dxt3:               return "DXT3";
        case raster_encoding::dxt4:               return "DXT4";
        case raster_encoding::dxt5:               return "DXT5";
        case raster_encoding::compressed_unknown: return "DXT?";
        case raster_encoding::unsupported:        return "unsupported";
    }
    return "unknown";
}

const char* to_string(filter_mode mode) noexcept {
    switch (mode) {
        case filter_mode::nearest:            return "nearest";
        case filter_mode::linear:             return "linear";
        case filter_mode::mip_nearest:        return "mip_nearest";
        case filter_mode::mip_linear:         return "mip_linear";
        case filter_mode::linear_mip_nearest: return "linear_mip_nearest";
        case filter_mode::linear_mip_linear:  return "linear_mip_linear";
    }
    return "unknown";
}

const char* to_string(addressing_mode mode) noexcept {
    switch (mode) {
        case addressing_mode::wrap:   return "wrap";
        case addressing_mode::mirror: return "mirror";
        case addressing_mode::clamp:  return "clamp";
        case addressing_mode::border: return "border";
    }
    return "unknown";
}

const char* platform_name(std::uint32_t platform_id) noexcept {
    switch (platform_id) {
        case 0:  return "PC";
        case 1:  return "Direct3D 8";
        case 2:  return "Direct3D 9";
        case 4:  return "PlayStation 2";
        case 5:  return "Xbox";
        case 8:  return "Direct3D 8";
        case 9:  return "Direct3D 9";
        case 11: return "AMD TC";
        case 12: return "PowerVR";
        case 13: return "GameCube";
        case 14: return "PlayStation Portable";
        case 15: return "S3TC Mobile";
        case 16: return "Uncompressed Mobile";
        case 0x00325350: return "PlayStation 2";  // "PS2\0"
    }
    return "Unknown";
}

} // namespace rwtxd
