#include <doctest/doctest.h>
#include <rwtxd/rwtxd.hpp>

// ============================================================================
// RenderWare Version Tests
// ============================================================================

TEST_CASE("Version: library id decoding") {
    SUBCASE("GTA San Andreas stamp") {
        CHECK(rwtxd::unpack_library_version(0x1803FFFF) == 0x36003);
        CHECK(rwtxd::library_build(0x1803FFFF) == 0xFFFF);
        CHECK(rwtxd::version_string(0x36003) == "3.6.0.3");
    }

    SUBCASE("GTA Vice City stamp") {
        CHECK(rwtxd::unpack_library_version(0x1003FFFF) == 0x34003);
        CHECK(rwtxd::version_string(0x34003) == "3.4.0.3");
    }

    SUBCASE("Pre-3.1 stamp carries the bare version") {
        CHECK(rwtxd::unpack_library_version(0x00000310) == 0x31000);
        CHECK(rwtxd::library_build(0x00000310) == 0);
        CHECK(rwtxd::version_string(0x31000) == "3.1.0");
    }

    SUBCASE("Packing inverts unpacking") {
        CHECK(rwtxd::pack_library_id(0x36003, 0xFFFF) == 0x1803FFFF);
        CHECK(rwtxd::pack_library_id(0x34003, 0xFFFF) == 0x1003FFFF);
    }
}

TEST_CASE("Version: validity and catalogue") {
    CHECK(rwtxd::is_valid_version(0x1803FFFF));
    CHECK(rwtxd::is_valid_version(0x0800FFFF));
    CHECK_FALSE(rwtxd::is_valid_version(0));
    CHECK_FALSE(rwtxd::is_valid_version(0x00000001));

    CHECK(rwtxd::is_known_version(0x1803FFFF));
    CHECK(rwtxd::is_known_version(0x1003FFFF));
    CHECK_FALSE(rwtxd::is_known_version(0x1C020037));

    CHECK(rwtxd::game_for_version(0x36003) != nullptr);
    CHECK(rwtxd::game_for_version(0x37002) == nullptr);
}

TEST_CASE("Version: display string") {
    CHECK(rwtxd::version_display_string(0x1803FFFF) == "3.6.0.3 (GTA San Andreas)");
    CHECK(rwtxd::version_display_string(0x1003FFFF) == "3.4.0.3 (GTA Vice City)");
    // Unknown versions show the bare number
    CHECK(rwtxd::version_display_string(0x1C020037) == "3.7.0.2");
}
