#include <doctest/doctest.h>
#include <rwtxd/rwtxd.hpp>

#include "helpers/txd_builder.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace {

rwtxd::txd_archive load(const std::vector<std::uint8_t>& data,
                        const std::filesystem::path& path = {}) {
    rwtxd::txd_archive archive;
    auto result = rwtxd::txd_archive::load_from_memory(data, path, archive);
    REQUIRE_MESSAGE(result.ok, result.message);
    return archive;
}

// Removes the file when the test finishes
struct temp_file {
    std::filesystem::path path;

    explicit temp_file(const std::string& name)
        : path(std::filesystem::temp_directory_path() / name) {}

    ~temp_file() {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }

    void write(const std::vector<std::uint8_t>& data) const {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    }
};

rwtxd::texture_info memory_texture(const std::string& name, std::uint16_t width, std::uint16_t height) {
    rwtxd::texture_info tex;
    tex.name = name;
    tex.width = width;
    tex.height = height;
    tex.depth = 32;
    tex.platform_id = 9;
    tex.d3d_format = 21;
    tex.raster_format_flags = 0x0500;
    tex.format = rwtxd::texture_format::rgba32;
    tex.encoding = rwtxd::raster_encoding::bgra8888;
    tex.data_size = rwtxd::texture_data_size(width, height, tex.format, 1);
    return tex;
}

} // namespace

// ============================================================================
// Archive Tests
// ============================================================================

TEST_CASE("Archive: sniff") {
    CHECK(rwtxd::txd_archive::sniff(txd_builder::dictionary({})));

    std::vector<std::uint8_t> clump;
    txd_builder::put_header(clump, 0x10, 0);
    CHECK_FALSE(rwtxd::txd_archive::sniff(clump));
    CHECK_FALSE(rwtxd::txd_archive::sniff({}));
}

TEST_CASE("Archive: load from memory") {
    const auto data = txd_builder::dictionary({
        txd_builder::texture_native_section(txd_builder::red_texture("red")),
        txd_builder::texture_native_section(txd_builder::red_texture("other")),
    });
    const auto archive = load(data);

    CHECK(archive.total_textures() == 2);
    CHECK(archive.textures().size() == 2);
    CHECK(archive.library_id() == txd_builder::SA_LIBRARY_ID);
    REQUIRE(archive.renderware_version().has_value());
    CHECK(*archive.renderware_version() == "3.6.0.3 (GTA San Andreas)");

    SUBCASE("Payloads are copied without a source path") {
        for (const auto& tex : archive.textures()) {
            CHECK(tex.has_payload());
            CHECK(tex.pixel_payload.size() == 16);
        }
    }

    SUBCASE("Decode to RGBA") {
        const auto* tex = archive.get_texture_info("red");
        REQUIRE(tex != nullptr);

        std::vector<std::uint8_t> rgba;
        auto result = tex->to_rgba(archive, 0, rgba);
        REQUIRE(result.ok);
        REQUIRE(rgba.size() == 16);
        for (std::size_t i = 0; i < rgba.size(); i += 4) {
            CHECK(rgba[i + 0] == 255);
            CHECK(rgba[i + 1] == 0);
            CHECK(rgba[i + 2] == 0);
            CHECK(rgba[i + 3] == 255);
        }
    }

    SUBCASE("Level out of range") {
        const auto* tex = archive.get_texture_info("red");
        REQUIRE(tex != nullptr);
        std::vector<std::uint8_t> rgba;
        CHECK(tex->to_rgba(archive, 1, rgba).error == rwtxd::txd_error::invalid_argument);
        CHECK(tex->to_rgba(archive, -1, rgba).error == rwtxd::txd_error::invalid_argument);
    }

    SUBCASE("Names and lookups") {
        CHECK(archive.texture_names() == std::vector<std::string>{"red", "other"});
        CHECK(archive.get_texture_info("missing") == nullptr);
    }
}

TEST_CASE("Archive: load failures") {
    rwtxd::txd_archive archive;

    SUBCASE("Missing file") {
        auto result = rwtxd::txd_archive::load_from_path("/nonexistent/rwtxd/none.txd", archive);
        CHECK(result.error == rwtxd::txd_error::file_read_failed);
    }

    SUBCASE("Not a dictionary") {
        std::vector<std::uint8_t> data;
        txd_builder::put_header(data, 0x10, 0);
        auto result = rwtxd::txd_archive::load_from_memory(data, {}, archive);
        CHECK(result.error == rwtxd::txd_error::parse_error);
        CHECK(archive.total_textures() == 0);
    }
}

TEST_CASE("Archive: lazy payloads from the source file") {
    const auto data = txd_builder::dictionary({
        txd_builder::texture_native_section(txd_builder::red_texture("lazy")),
    });
    temp_file file("rwtxd_archive_lazy.txd");
    file.write(data);

    rwtxd::txd_archive archive;
    auto result = rwtxd::txd_archive::load_from_path(file.path, archive);
    REQUIRE(result.ok);
    CHECK(archive.file_path() == file.path);
    REQUIRE(archive.total_textures() == 1);

    const auto& tex = archive.textures()[0];
    CHECK_FALSE(tex.has_payload());

    SUBCASE("get_texture_data reads at data_offset") {
        std::vector<std::uint8_t> bytes;
        REQUIRE(archive.get_texture_data(tex, bytes).ok);
        REQUIRE(bytes.size() >= 16);
        CHECK(std::vector<std::uint8_t>(bytes.begin(), bytes.begin() + 16) == txd_builder::red_bgra_2x2());
    }

    SUBCASE("to_rgba reads through the archive") {
        std::vector<std::uint8_t> rgba;
        REQUIRE(tex.to_rgba(archive, 0, rgba).ok);
        CHECK(rgba[0] == 255);
        CHECK(rgba[3] == 255);
    }

    SUBCASE("load_pixel_payloads detaches from the file") {
        REQUIRE(archive.load_pixel_payloads().ok);
        CHECK(archive.textures()[0].has_payload());
    }
}

TEST_CASE("Archive: mip levels") {
    auto tex = txd_builder::red_texture("mips");
    tex.mipmap_count = 2;
    tex.levels.push_back({0xFF, 0x00, 0x00, 0x80});  // 1x1 blue, half alpha

    const auto archive = load(txd_builder::dictionary({txd_builder::texture_native_section(tex)}));
    const auto* info = archive.get_texture_info("mips");
    REQUIRE(info != nullptr);
    CHECK(info->level_width(1) == 1);
    CHECK(info->level_height(1) == 1);

    std::vector<std::uint8_t> rgba;
    REQUIRE(info->to_rgba(archive, 1, rgba).ok);
    CHECK(rgba == std::vector<std::uint8_t>{0x00, 0x00, 0xFF, 0x80});

    REQUIRE(info->to_rgba(archive, 0, rgba).ok);
    CHECK(rgba.size() == 16);
    CHECK(rgba[0] == 0xFF);
}

TEST_CASE("Archive: paletted texture") {
    txd_builder::native_texture tex;
    tex.name = "pal";
    tex.raster_flags = 0x2500;
    tex.d3d_format = 41;
    tex.depth = 8;
    tex.palette.assign(1024, 0);
    tex.palette[4 * 3 + 0] = 10;
    tex.palette[4 * 3 + 1] = 20;
    tex.palette[4 * 3 + 2] = 30;
    tex.palette[4 * 3 + 3] = 255;
    tex.levels = {{3, 3, 3, 3}};

    const auto archive = load(txd_builder::dictionary({txd_builder::texture_native_section(tex)}));
    const auto* info = archive.get_texture_info("pal");
    REQUIRE(info != nullptr);

    std::vector<std::uint8_t> rgba;
    REQUIRE(info->to_rgba(archive, 0, rgba).ok);
    CHECK(rgba[0] == 10);
    CHECK(rgba[1] == 20);
    CHECK(rgba[2] == 30);
    CHECK(rgba[3] == 255);
}

TEST_CASE("Archive: editing") {
    rwtxd::txd_archive archive;
    CHECK(archive.total_textures() == 0);
    CHECK_FALSE(archive.renderware_version().has_value());

    archive.add_texture(memory_texture("a", 4, 4));
    archive.add_texture(memory_texture("b", 8, 8));
    archive.add_texture(memory_texture("a", 2, 2));
    CHECK(archive.total_textures() == 3);

    SUBCASE("Lookup returns the first match") {
        const auto* tex = archive.get_texture_info("a");
        REQUIRE(tex != nullptr);
        CHECK(tex->width == 4);
    }

    SUBCASE("find_texture allows edits") {
        auto* tex = archive.find_texture("b");
        REQUIRE(tex != nullptr);
        tex->name = "renamed";
        CHECK(archive.get_texture_info("renamed") != nullptr);
        CHECK(archive.get_texture_info("b") == nullptr);
    }

    SUBCASE("Remove drops every match") {
        CHECK(archive.remove_texture("a"));
        CHECK(archive.total_textures() == 1);
        CHECK(archive.textures().size() == 1);
        CHECK_FALSE(archive.remove_texture("a"));
        CHECK(archive.total_textures() == 1);
    }

    SUBCASE("Clear") {
        archive.clear();
        CHECK(archive.total_textures() == 0);
        CHECK(archive.textures().empty());
    }

    SUBCASE("No payload and no source file") {
        std::vector<std::uint8_t> bytes;
        auto result = archive.get_texture_data(archive.textures()[0], bytes);
        CHECK(result.error == rwtxd::txd_error::not_found);
    }
}

TEST_CASE("Archive: statistics") {
    rwtxd::txd_archive archive;

    SUBCASE("Empty") {
        const auto stats = archive.get_statistics();
        CHECK(stats.total_textures == 0);
        CHECK(stats.total_size_bytes == 0);
        CHECK(stats.average_width == 0.0);
        CHECK(stats.format_counts.empty());
        CHECK_FALSE(stats.renderware_version.has_value());
    }

    SUBCASE("Mixed formats") {
        archive.add_texture(memory_texture("a", 4, 4));
        archive.add_texture(memory_texture("b", 8, 2));
        auto lum = memory_texture("c", 6, 6);
        lum.format = rwtxd::texture_format::luminance8;
        lum.data_size = 36;
        archive.add_texture(lum);
        archive.set_library_id(txd_builder::SA_LIBRARY_ID);

        const auto stats = archive.get_statistics();
        CHECK(stats.total_textures == 3);
        CHECK(stats.total_size_bytes == 64 + 64 + 36);
        CHECK(stats.average_width == doctest::Approx(6.0));
        CHECK(stats.average_height == doctest::Approx(4.0));
        CHECK(stats.format_counts.at("RGBA32") == 2);
        CHECK(stats.format_counts.at("Luminance8") == 1);
        REQUIRE(stats.renderware_version.has_value());
        CHECK(*stats.renderware_version == "3.6.0.3 (GTA San Andreas)");
    }
}
