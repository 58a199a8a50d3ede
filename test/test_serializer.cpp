#include <doctest/doctest.h>
#include <rwtxd/rwtxd.hpp>

#include "helpers/txd_builder.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace {

std::uint32_t u32_at(const std::vector<std::uint8_t>& data, std::size_t offset) {
    return static_cast<std::uint32_t>(data[offset]) |
           (static_cast<std::uint32_t>(data[offset + 1]) << 8) |
           (static_cast<std::uint32_t>(data[offset + 2]) << 16) |
           (static_cast<std::uint32_t>(data[offset + 3]) << 24);
}

rwtxd::txd_archive reload(const rwtxd::txd_archive& archive) {
    std::vector<std::uint8_t> bytes;
    REQUIRE(archive.serialize(bytes).ok);

    rwtxd::txd_archive out;
    auto result = rwtxd::txd_archive::load_from_memory(bytes, {}, out);
    REQUIRE_MESSAGE(result.ok, result.message);
    return out;
}

rwtxd::txd_archive load(const std::vector<std::uint8_t>& data) {
    rwtxd::txd_archive archive;
    auto result = rwtxd::txd_archive::load_from_memory(data, {}, archive);
    REQUIRE_MESSAGE(result.ok, result.message);
    return archive;
}

txd_builder::native_texture pal8_texture() {
    txd_builder::native_texture tex;
    tex.name = "palette";
    tex.mask_name = "palette_a";
    tex.raster_flags = 0x2500;
    tex.d3d_format = 41;
    tex.depth = 8;
    for (int i = 0; i < 256; ++i) {
        tex.palette.push_back(static_cast<std::uint8_t>(i));
        tex.palette.push_back(static_cast<std::uint8_t>(255 - i));
        tex.palette.push_back(0x40);
        tex.palette.push_back(0xFF);
    }
    tex.levels = {{0, 1, 2, 255}};
    return tex;
}

} // namespace

// ============================================================================
// Serializer Tests
// ============================================================================

TEST_CASE("Serializer: round trip keeps headers and pixels") {
    auto red = txd_builder::red_texture("red");
    red.mask_name = "red_a";
    red.filter = 0x04;
    red.uv_addressing = 0x21;

    const auto original = load(txd_builder::dictionary({
        txd_builder::texture_native_section(red),
        txd_builder::texture_native_section(pal8_texture()),
    }));
    const auto copy = reload(original);

    REQUIRE(copy.total_textures() == original.total_textures());
    for (std::size_t i = 0; i < copy.textures().size(); ++i) {
        const auto& a = original.textures()[i];
        const auto& b = copy.textures()[i];
        INFO("texture ", a.name);
        CHECK(b.name == a.name);
        CHECK(b.mask_name == a.mask_name);
        CHECK(b.width == a.width);
        CHECK(b.height == a.height);
        CHECK(b.depth == a.depth);
        CHECK(b.mipmap_count == a.mipmap_count);
        CHECK(b.format == a.format);
        CHECK(b.encoding == a.encoding);
        CHECK(b.platform_id == a.platform_id);
        CHECK(b.d3d_format == a.d3d_format);
        CHECK(b.raster_format_flags == a.raster_format_flags);
        CHECK(b.raster_type == a.raster_type);
        CHECK(b.filter == a.filter);
        CHECK(b.addressing_u == a.addressing_u);
        CHECK(b.addressing_v == a.addressing_v);
        CHECK(b.data_size == a.data_size);
        CHECK(b.pixel_payload == a.pixel_payload);
        CHECK(b.palette_data == a.palette_data);
    }

    CHECK(copy.library_id() == original.library_id());
}

TEST_CASE("Serializer: decoded pixels survive a round trip") {
    const auto original = load(txd_builder::dictionary({
        txd_builder::texture_native_section(pal8_texture()),
    }));
    const auto copy = reload(original);

    std::vector<std::uint8_t> before;
    std::vector<std::uint8_t> after;
    REQUIRE(original.textures()[0].to_rgba(original, 0, before).ok);
    REQUIRE(copy.textures()[0].to_rgba(copy, 0, after).ok);
    CHECK(before == after);
    CHECK(after[4] == 1);
    CHECK(after[5] == 254);
}

TEST_CASE("Serializer: layout") {
    rwtxd::txd_archive archive;
    rwtxd::texture_info tex;
    tex.name = "blank";
    tex.width = 4;
    tex.height = 4;
    tex.depth = 32;
    tex.platform_id = 9;
    tex.d3d_format = 21;
    tex.raster_format_flags = 0x0500;
    tex.format = rwtxd::texture_format::rgba32;
    tex.encoding = rwtxd::raster_encoding::bgra8888;
    tex.data_size = 64;
    archive.add_texture(tex);

    std::vector<std::uint8_t> bytes;
    REQUIRE(archive.serialize(bytes).ok);
    REQUIRE(bytes.size() > 32);

    SUBCASE("Default library id") {
        CHECK(u32_at(bytes, 0) == rwtxd::CHUNK_TEX_DICTIONARY);
        CHECK(u32_at(bytes, 8) == rwtxd::DEFAULT_LIBRARY_ID);
    }

    SUBCASE("Section sizes") {
        CHECK(u32_at(bytes, 4) == bytes.size() - 12);

        // Dictionary STRUCT: count, device id
        CHECK(u32_at(bytes, 12) == rwtxd::CHUNK_STRUCT);
        CHECK(u32_at(bytes, 16) == 8);
        CHECK(u32_at(bytes, 24) == 1);

        const std::size_t native = 32;
        CHECK(u32_at(bytes, native) == rwtxd::CHUNK_TEXTURE_NATIVE);
        const std::uint32_t native_size = u32_at(bytes, native + 4);
        // native section, then the closing EXTENSION
        CHECK(native + 12 + native_size + 12 == bytes.size());

        const std::size_t inner = native + 12;
        CHECK(u32_at(bytes, inner) == rwtxd::CHUNK_STRUCT);
        const std::uint32_t inner_size = u32_at(bytes, inner + 4);
        // fields, level prefix, 64 pixel bytes
        CHECK(inner_size == 88 + 4 + 64);
        CHECK(u32_at(bytes, inner + 12 + inner_size) == rwtxd::CHUNK_EXTENSION);
    }

    SUBCASE("Missing pixels become a zero placeholder") {
        rwtxd::txd_archive copy;
        REQUIRE(rwtxd::txd_archive::load_from_memory(bytes, {}, copy).ok);
        REQUIRE(copy.total_textures() == 1);
        const auto& payload = copy.textures()[0].pixel_payload;
        CHECK(payload.size() == 64);
        CHECK(std::all_of(payload.begin(), payload.end(), [](std::uint8_t b) { return b == 0; }));
    }
}

TEST_CASE("Serializer: round trip on a raster platform") {
    rwtxd::texture_info tex;
    tex.name = "raster_rgba";
    tex.mask_name = "raster_rgba_a";
    tex.width = 4;
    tex.height = 4;
    tex.depth = 32;
    tex.mipmap_count = 1;
    tex.platform_id = 6;
    tex.format = rwtxd::texture_format::rgba32;
    tex.encoding = rwtxd::raster_encoding::bgra8888;
    tex.data_size = 64;
    tex.pixel_payload.assign(64, 0x7F);

    SUBCASE("Zero flags") {
        tex.raster_format_flags = 0;
    }
    SUBCASE("High flag byte set") {
        tex.raster_format_flags = 0x01000000;
    }
    SUBCASE("Mask name filling the field") {
        tex.raster_format_flags = 0;
        tex.mask_name = std::string(31, 'm');
    }

    rwtxd::txd_archive archive;
    archive.add_texture(tex);
    const auto copy = reload(archive);

    REQUIRE(copy.total_textures() == 1);
    const auto& b = copy.textures()[0];
    CHECK(b.name == tex.name);
    CHECK(b.mask_name == tex.mask_name);
    CHECK(b.platform_id == tex.platform_id);
    CHECK(b.raster_format_flags == tex.raster_format_flags);
    CHECK(b.d3d_format == tex.d3d_format);
    CHECK(b.width == tex.width);
    CHECK(b.height == tex.height);
    CHECK(b.depth == tex.depth);
    CHECK(b.mipmap_count == tex.mipmap_count);
    CHECK(b.format == tex.format);
    CHECK(b.data_size == tex.data_size);
}

TEST_CASE("Serializer: empty archive") {
    rwtxd::txd_archive archive;
    const auto copy = reload(archive);
    CHECK(copy.total_textures() == 0);
    CHECK(copy.library_id() == rwtxd::DEFAULT_LIBRARY_ID);
}

TEST_CASE("Serializer: mip chain") {
    auto tex = txd_builder::red_texture("mips");
    tex.mipmap_count = 2;
    tex.levels.push_back({0x10, 0x20, 0x30, 0x40});

    const auto original = load(txd_builder::dictionary({txd_builder::texture_native_section(tex)}));
    const auto copy = reload(original);

    std::vector<std::uint8_t> rgba;
    REQUIRE(copy.textures()[0].to_rgba(copy, 1, rgba).ok);
    CHECK(rgba == std::vector<std::uint8_t>{0x30, 0x20, 0x10, 0x40});
}

TEST_CASE("Serializer: files") {
    const auto dir = std::filesystem::temp_directory_path();
    const auto source_path = dir / "rwtxd_serializer_source.txd";
    const auto saved_path = dir / "rwtxd_serializer_saved.txd";

    {
        const auto data = txd_builder::dictionary({
            txd_builder::texture_native_section(txd_builder::red_texture("disk")),
        });
        std::ofstream file(source_path, std::ios::binary | std::ios::trunc);
        file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    }

    SUBCASE("Lazily loaded pixels are written back") {
        rwtxd::txd_archive archive;
        REQUIRE(rwtxd::txd_archive::load_from_path(source_path, archive).ok);
        REQUIRE(archive.save_to_path(saved_path).ok);

        rwtxd::txd_archive saved;
        REQUIRE(rwtxd::txd_archive::load_from_path(saved_path, saved).ok);
        REQUIRE(saved.total_textures() == 1);

        std::vector<std::uint8_t> rgba;
        REQUIRE(saved.textures()[0].to_rgba(saved, 0, rgba).ok);
        CHECK(rgba[0] == 255);
        CHECK(rgba[1] == 0);
        CHECK(rgba[3] == 255);
    }

    SUBCASE("Unwritable destination") {
        rwtxd::txd_archive archive;
        auto result = archive.save_to_path(dir / "rwtxd_missing_dir" / "nested" / "out.txd");
        CHECK(result.error == rwtxd::txd_error::file_write_failed);
    }

    std::error_code ec;
    std::filesystem::remove(source_path, ec);
    std::filesystem::remove(saved_path, ec);
}
