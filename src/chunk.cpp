#include <rwtxd/chunk.hpp>
#include "byte_io.hpp"

namespace rwtxd {

bool read_chunk_header(std::span<const std::uint8_t> data,
                       std::size_t offset,
                       chunk_header& out) noexcept {
    if (offset > data.size() || data.size() - offset < CHUNK_HEADER_SIZE) {
        return false;
    }
    const std::uint8_t* p = data.data() + offset;
    out.type = read_le32(p);
    out.size = read_le32(p + 4);
    out.version = read_le32(p + 8);
    return true;
}

bool chunk_fits(std::span<const std::uint8_t> data,
                std::size_t offset,
                const chunk_header& header) noexcept {
    if (offset > data.size() || data.size() - offset < CHUNK_HEADER_SIZE) {
        return false;
    }
    return header.size <= data.size() - offset - CHUNK_HEADER_SIZE;
}

const char* chunk_name(std::uint32_t type) noexcept {
    switch (type) {
        case 0x00: return "None";
        case CHUNK_STRUCT: return "Struct";
        case 0x02: return "String";
        case CHUNK_EXTENSION: return "Extension";
        case 0x05: return "Camera";
        case 0x06: return "Texture";
        case 0x07: return "Material";
        case 0x08: return "MaterialList";
        case 0x0E: return "FrameList";
        case 0x0F: return "Geometry";
        case 0x10: return "Clump";
        case 0x12: return "Light";
        case 0x14: return "Atomic";
        case CHUNK_TEXTURE_NATIVE: return "TextureNative";
        case CHUNK_TEX_DICTIONARY: return "TextureDictionary";
        case 0x1A: return "GeometryList";
        case 0x2B: return "PITexDictionary";
        case CHUNK_TEXTURE_NATIVE_EXT: return "TextureNative (extended)";
        default: return "Unknown";
    }
}

} // namespace rwtxd
