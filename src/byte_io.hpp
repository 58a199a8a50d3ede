#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace rwtxd {

// Little-endian readers
inline std::uint16_t read_le16(const std::uint8_t* p) {
    return static_cast<std::uint16_t>(p[0]) |
           (static_cast<std::uint16_t>(p[1]) << 8);
}

inline std::uint32_t read_le32(const std::uint8_t* p) {
    return static_cast<std::uint32_t>(p[0]) |
           (static_cast<std::uint32_t>(p[1]) << 8) |
           (static_cast<std::uint32_t>(p[2]) << 16) |
           (static_cast<std::uint32_t>(p[3]) << 24);
}

// Null-terminated string inside a fixed-width field
inline std::string read_fixed_string(const std::uint8_t* p, std::size_t width) {
    std::size_t len = 0;
    while (len < width && p[len] != 0) {
        ++len;
    }
    return std::string(reinterpret_cast<const char*>(p), len);
}

// Little-endian writers (append)
inline void write_u8(std::vector<std::uint8_t>& out, std::uint8_t v) {
    out.push_back(v);
}

inline void write_le16(std::vector<std::uint8_t>& out, std::uint16_t v) {
    out.push_back(static_cast<std::uint8_t>(v & 0xFF));
    out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
}

inline void write_le32(std::vector<std::uint8_t>& out, std::uint32_t v) {
    out.push_back(static_cast<std::uint8_t>(v & 0xFF));
    out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((v >> 16) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((v >> 24) & 0xFF));
}

// Overwrite a previously reserved 32-bit slot
inline void patch_le32(std::vector<std::uint8_t>& out, std::size_t offset, std::uint32_t v) {
    out[offset + 0] = static_cast<std::uint8_t>(v & 0xFF);
    out[offset + 1] = static_cast<std::uint8_t>((v >> 8) & 0xFF);
    out[offset + 2] = static_cast<std::uint8_t>((v >> 16) & 0xFF);
    out[offset + 3] = static_cast<std::uint8_t>((v >> 24) & 0xFF);
}

// Fixed-width, null-padded string field; always keeps a terminator
inline void write_fixed_string(std::vector<std::uint8_t>& out, std::string_view s, std::size_t width) {
    const std::size_t len = s.size() < width ? s.size() : width - 1;
    out.insert(out.end(), s.begin(), s.begin() + static_cast<std::ptrdiff_t>(len));
    out.insert(out.end(), width - len, 0);
}

} // namespace rwtxd
