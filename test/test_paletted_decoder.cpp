#include <doctest/doctest.h>
#include <rwtxd/rwtxd.hpp>

#include <cstdint>
#include <vector>

namespace {

// Palette whose entry i is {i, 2i, 3i, 255}
std::vector<std::uint8_t> ramp_palette(std::size_t entries) {
    std::vector<std::uint8_t> palette;
    for (std::size_t i = 0; i < entries; ++i) {
        palette.push_back(static_cast<std::uint8_t>(i));
        palette.push_back(static_cast<std::uint8_t>(i * 2));
        palette.push_back(static_cast<std::uint8_t>(i * 3));
        palette.push_back(255);
    }
    return palette;
}

} // namespace

// ============================================================================
// Paletted Decoder Tests
// ============================================================================

TEST_CASE("Paletted decoder: palette sizes") {
    CHECK(rwtxd::paletted_decoder::palette_size(rwtxd::raster_encoding::pal4) == 64);
    CHECK(rwtxd::paletted_decoder::palette_size(rwtxd::raster_encoding::pal8) == 1024);
    CHECK(rwtxd::paletted_decoder::palette_size(rwtxd::raster_encoding::bgra8888) == 0);
}

TEST_CASE("Paletted decoder: PAL8") {
    SUBCASE("Index copies the palette entry verbatim") {
        auto palette = ramp_palette(256);
        palette[5 * 4 + 0] = 10;
        palette[5 * 4 + 1] = 20;
        palette[5 * 4 + 2] = 30;
        palette[5 * 4 + 3] = 40;

        const std::vector<std::uint8_t> indices = {0x05};
        rwtxd::rgba_surface surface;
        auto result = rwtxd::paletted_decoder::decode(rwtxd::raster_encoding::pal8,
                                                      indices, palette, 1, 1, surface);
        REQUIRE(result.ok);
        const auto pixels = surface.pixels();
        CHECK(pixels[0] == 10);
        CHECK(pixels[1] == 20);
        CHECK(pixels[2] == 30);
        CHECK(pixels[3] == 40);
    }

    SUBCASE("Row layout") {
        const auto palette = ramp_palette(256);
        const std::vector<std::uint8_t> indices = {1, 2, 3, 4};
        rwtxd::rgba_surface surface;
        auto result = rwtxd::paletted_decoder::decode(rwtxd::raster_encoding::pal8,
                                                      indices, palette, 2, 2, surface);
        REQUIRE(result.ok);
        // bottom-right texel is index 4
        const auto pixels = surface.pixels();
        CHECK(pixels[12] == 4);
        CHECK(pixels[13] == 8);
        CHECK(pixels[14] == 12);
    }

    SUBCASE("Missing palette") {
        const std::vector<std::uint8_t> indices = {0};
        rwtxd::rgba_surface surface;
        auto result = rwtxd::paletted_decoder::decode(rwtxd::raster_encoding::pal8,
                                                      indices, {}, 1, 1, surface);
        CHECK(result.error == rwtxd::txd_error::invalid_palette);
    }

    SUBCASE("Short palette") {
        const auto palette = ramp_palette(16);
        const std::vector<std::uint8_t> indices = {0};
        rwtxd::rgba_surface surface;
        auto result = rwtxd::paletted_decoder::decode(rwtxd::raster_encoding::pal8,
                                                      indices, palette, 1, 1, surface);
        CHECK(result.error == rwtxd::txd_error::invalid_palette);
    }

    SUBCASE("Index data size mismatch") {
        const auto palette = ramp_palette(256);
        const std::vector<std::uint8_t> indices = {0, 1, 2};
        rwtxd::rgba_surface surface;
        auto result = rwtxd::paletted_decoder::decode(rwtxd::raster_encoding::pal8,
                                                      indices, palette, 2, 2, surface);
        CHECK(result.error == rwtxd::txd_error::size_mismatch);
    }
}

TEST_CASE("Paletted decoder: PAL4") {
    SUBCASE("Low nibble first") {
        const auto palette = ramp_palette(16);
        const std::vector<std::uint8_t> indices = {0x21, 0x0F};
        rwtxd::rgba_surface surface;
        auto result = rwtxd::paletted_decoder::decode(rwtxd::raster_encoding::pal4,
                                                      indices, palette, 3, 1, surface);
        REQUIRE(result.ok);
        const auto pixels = surface.pixels();
        CHECK(pixels[0] == 1);
        CHECK(pixels[4] == 2);
        CHECK(pixels[8] == 15);
        CHECK(pixels[9] == 30);
    }

    SUBCASE("PAL8-sized palette is rejected") {
        const auto palette = ramp_palette(256);
        const std::vector<std::uint8_t> indices = {0x00};
        rwtxd::rgba_surface surface;
        auto result = rwtxd::paletted_decoder::decode(rwtxd::raster_encoding::pal4,
                                                      indices, palette, 2, 1, surface);
        CHECK(result.error == rwtxd::txd_error::invalid_palette);
    }
}
