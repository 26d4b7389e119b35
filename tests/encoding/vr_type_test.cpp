/**
 * @file vr_type_test.cpp
 * @brief Unit tests for VR codes and categories
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <metaview/encoding/vr_type.hpp>

using namespace metaview::encoding;

TEST_CASE("vr_type codes", "[encoding][vr_type]") {
    SECTION("every known code parses back to itself") {
        for (const auto& entry : detail::vr_codes) {
            CHECK(to_string(entry.vr) == entry.code);
            CHECK(from_string(entry.code) == entry.vr);
        }
    }

    SECTION("enumerator value packs the two characters") {
        CHECK(static_cast<uint16_t>(vr_type::PN) == ('P' << 8 | 'N'));
        CHECK(static_cast<uint16_t>(vr_type::OW) == ('O' << 8 | 'W'));
    }

    SECTION("unknown codes") {
        CHECK(to_string(static_cast<vr_type>(0x5858)) == "??");
        CHECK_FALSE(from_string("XX").has_value());
        CHECK_FALSE(from_string("pn").has_value());
        CHECK_FALSE(from_string("P").has_value());
        CHECK_FALSE(from_string("PNX").has_value());
    }
}

TEST_CASE("vr_type categories are disjoint", "[encoding][vr_type]") {
    for (const auto& entry : detail::vr_codes) {
        const int categories = (is_string_vr(entry.vr) ? 1 : 0) +
                               (is_numeric_vr(entry.vr) ? 1 : 0) +
                               (is_binary_vr(entry.vr) ? 1 : 0);
        CHECK(categories <= 1);
    }

    CHECK_FALSE(is_string_vr(vr_type::SQ));
    CHECK_FALSE(is_numeric_vr(vr_type::AT));
}

TEST_CASE("vr_type binary codes", "[encoding][vr_type]") {
    const auto vr = GENERATE(vr_type::OB, vr_type::OD, vr_type::OF, vr_type::OL,
                             vr_type::OV, vr_type::OW, vr_type::UN);
    CHECK(is_binary_vr(vr));
    CHECK(fixed_length(vr) == 0);
}

TEST_CASE("vr_type fixed lengths and padding", "[encoding][vr_type]") {
    CHECK(fixed_length(vr_type::US) == 2);
    CHECK(fixed_length(vr_type::AT) == 4);
    CHECK(fixed_length(vr_type::FD) == 8);
    CHECK(fixed_length(vr_type::LO) == 0);

    CHECK(padding_char(vr_type::PN) == ' ');
    CHECK(padding_char(vr_type::UI) == '\0');
    CHECK(padding_char(vr_type::OB) == '\0');
}
