#include <rwtxd/version.hpp>

#include <fmt/core.h>

#include <array>

namespace rwtxd {

namespace {

struct game_entry {
    std::uint32_t version;
    const char* name;
};

constexpr std::array<game_entry, 5> game_catalogue = {{
    {0x31001, "GTA III (PS2)"},
    {0x32000, "GTA III"},
    {0x33002, "GTA III / GTA Vice City (PS2)"},
    {0x34003, "GTA Vice City"},
    {0x36003, "GTA San Andreas"},
}};

} // namespace

std::uint32_t unpack_library_version(std::uint32_t library_id) noexcept {
    if (library_id & 0xFFFF0000) {
        return (((library_id >> 14) & 0x3FF00) + 0x30000) | ((library_id >> 16) & 0x3F);
    }
    return library_id << 8;
}

std::uint32_t library_build(std::uint32_t library_id) noexcept {
    if (library_id & 0xFFFF0000) {
        return library_id & 0xFFFF;
    }
    return 0;
}

std::uint32_t pack_library_id(std::uint32_t version, std::uint32_t build) noexcept {
    if (version < 0x31000) {
        return version >> 8;
    }
    const std::uint32_t v = version - 0x30000;
    return ((v & 0x3FF00) << 14) | ((v & 0x3F) << 16) | (build & 0xFFFF);
}

bool is_valid_version(std::uint32_t library_id) noexcept {
    const std::uint32_t version = unpack_library_version(library_id);
    return version >= 0x30000 && version <= 0x3FFFF;
}

bool is_known_version(std::uint32_t library_id) noexcept {
    return game_for_version(unpack_library_version(library_id)) != nullptr;
}

std::string version_string(std::uint32_t version) {
    const std::uint32_t major = (version >> 16) & 0xFF;
    const std::uint32_t minor = (version >> 12) & 0xF;
    const std::uint32_t patch = (version >> 8) & 0xF;
    const std::uint32_t revision = version & 0xFF;

    if (revision > 0) {
        return fmt::format("{}.{}.{}.{}", major, minor, patch, revision);
    }
    return fmt::format("{}.{}.{}", major, minor, patch);
}

const char* game_for_version(std::uint32_t version) noexcept {
    for (const auto& entry : game_catalogue) {
        if (entry.version == version) {
            return entry.name;
        }
    }
    return nullptr;
}

std::string version_display_string(std::uint32_t library_id) {
    const std::uint32_t version = unpack_library_version(library_id);
    const char* game = game_for_version(version);
    if (game == nullptr) {
        return version_string(version);
    }
    return fmt::format("{} ({})", version_string(version), game);
}

} // namespace rwtxd
