/**
 * @file dicom_tag_test.cpp
 * @brief Unit tests for dicom_tag class
 */

#include <catch2/catch_test_macros.hpp>

#include <metaview/core/dicom_tag.hpp>
#include <metaview/core/dicom_tag_constants.hpp>

#include <unordered_set>

using namespace metaview::core;

TEST_CASE("dicom_tag construction", "[core][dicom_tag]") {
    SECTION("default constructor creates (0000,0000)") {
        constexpr dicom_tag tag;
        STATIC_CHECK(tag.combined() == 0);
    }

    SECTION("component constructor") {
        constexpr dicom_tag tag{0x0010, 0x0020};
        STATIC_CHECK(tag.group() == 0x0010);
        STATIC_CHECK(tag.element() == 0x0020);
        STATIC_CHECK(tag.combined() == 0x00100020);
    }

    SECTION("combined constructor") {
        constexpr dicom_tag tag{0x7FE00010u};
        STATIC_CHECK(tag == tags::pixel_data);
    }
}

TEST_CASE("dicom_tag to_string", "[core][dicom_tag]") {
    CHECK(dicom_tag{0x0010, 0x0010}.to_string() == "(0010,0010)");
    CHECK(dicom_tag{0x7fe0, 0x0010}.to_string() == "(7FE0,0010)");
    CHECK(dicom_tag{0xFFFF, 0xFFFF}.to_string() == "(FFFF,FFFF)");
    CHECK(dicom_tag{}.to_string() == "(0000,0000)");
}

TEST_CASE("dicom_tag from_string", "[core][dicom_tag]") {
    SECTION("accepted forms") {
        CHECK(dicom_tag::from_string("(0010,0010)") == tags::patient_name);
        CHECK(dicom_tag::from_string("0010,0020") == tags::patient_id);
        CHECK(dicom_tag::from_string("7FE00010") == tags::pixel_data);
        CHECK(dicom_tag::from_string("(7fe0,0010)") == tags::pixel_data);
        CHECK(dicom_tag::from_string("  (0008,0060)\t") == tags::modality);
    }

    SECTION("rejected input") {
        CHECK_FALSE(dicom_tag::from_string("").has_value());
        CHECK_FALSE(dicom_tag::from_string("   ").has_value());
        CHECK_FALSE(dicom_tag::from_string("(0010;0010)").has_value());
        CHECK_FALSE(dicom_tag::from_string("(0010,001G)").has_value());
        CHECK_FALSE(dicom_tag::from_string("0010,00100").has_value());
        CHECK_FALSE(dicom_tag::from_string("(0010,0010").has_value());
        CHECK_FALSE(dicom_tag::from_string("PatientName").has_value());
    }

    SECTION("to_string output parses back") {
        const dicom_tag tag{0x0040, 0xA730};
        CHECK(dicom_tag::from_string(tag.to_string()) == tag);
    }
}

TEST_CASE("dicom_tag classification", "[core][dicom_tag]") {
    SECTION("private tags have odd groups above 0x0008") {
        CHECK(dicom_tag{0x0009, 0x0010}.is_private());
        CHECK(dicom_tag{0x0029, 0x1001}.is_private());
        CHECK_FALSE(dicom_tag{0x0007, 0x0010}.is_private());
        CHECK_FALSE(tags::patient_name.is_private());
    }

    SECTION("private creator range") {
        CHECK(dicom_tag{0x0029, 0x0010}.is_private_creator());
        CHECK(dicom_tag{0x0029, 0x00FF}.is_private_creator());
        CHECK_FALSE(dicom_tag{0x0029, 0x1010}.is_private_creator());
        CHECK_FALSE(dicom_tag{0x0028, 0x0010}.is_private_creator());
    }

    SECTION("group length") {
        CHECK(tags::file_meta_information_group_length.is_group_length());
        CHECK(dicom_tag{0x0008, 0x0000}.is_group_length());
        CHECK_FALSE(tags::patient_id.is_group_length());
    }
}

TEST_CASE("dicom_tag ordering and hashing", "[core][dicom_tag]") {
    SECTION("tags order by group then element") {
        CHECK(dicom_tag{0x0008, 0xFFFF} < dicom_tag{0x0010, 0x0000});
        CHECK(tags::patient_name < tags::patient_id);
        CHECK(tags::pixel_data > tags::waveform_data);
    }

    SECTION("equal tags hash to the same bucket") {
        std::unordered_set<dicom_tag> set;
        set.insert(dicom_tag{0x0010, 0x0010});
        set.insert(tags::patient_name);
        CHECK(set.size() == 1);
    }
}
