/**
 * @file dicom_dictionary_test.cpp
 * @brief Unit tests for dicom_dictionary and the default name resolver
 */

#include <catch2/catch_test_macros.hpp>

#include <metaview/core/dicom_dictionary.hpp>
#include <metaview/core/dicom_tag_constants.hpp>

using namespace metaview::core;
using namespace metaview::encoding;

TEST_CASE("dicom_dictionary lookup", "[core][dicom_dictionary]") {
    auto& dict = dicom_dictionary::instance();

    SECTION("standard tags are loaded") {
        CHECK(dict.standard_tag_count() > 200);
        CHECK(dict.size() >= dict.standard_tag_count());
    }

    SECTION("find by tag") {
        auto info = dict.find(tags::patient_name);
        REQUIRE(info.has_value());
        CHECK(info->name == "Patient's Name");
        CHECK(info->keyword == "PatientName");
        CHECK(info->vr == vr_type::PN);
    }

    SECTION("find by keyword") {
        auto info = dict.find_by_keyword("ReferencedImageSequence");
        REQUIRE(info.has_value());
        CHECK(info->tag == tags::referenced_image_sequence);
        CHECK(info->vr == vr_type::SQ);
    }

    SECTION("bulk payload tags are known") {
        CHECK(dict.contains(tags::pixel_data));
        CHECK(dict.contains(tags::float_pixel_data));
        CHECK(dict.contains(tags::double_float_pixel_data));
        CHECK(dict.contains(tags::waveform_data));
    }

    SECTION("unknown tags are absent") {
        CHECK_FALSE(dict.find(dicom_tag{0x0011, 0x1234}).has_value());
        CHECK_FALSE(dict.find_by_keyword("NoSuchKeyword").has_value());
    }
}

TEST_CASE("dicom_dictionary private registration", "[core][dicom_dictionary]") {
    auto& dict = dicom_dictionary::instance();

    SECTION("standard tags cannot be registered") {
        CHECK_FALSE(dict.register_private_tag(
            tag_info{tags::patient_id, vr_type::LO, "Other", "Other", false}));
    }

    SECTION("private tags are registered once") {
        const dicom_tag tag{0x0019, 0x10A1};
        std::string keyword = "VendorScanMode";
        std::string name = "Vendor Scan Mode";

        const bool first = dict.register_private_tag(
            tag_info{tag, vr_type::LO, keyword, name, false});
        keyword.assign("overwritten");
        name.assign("overwritten");

        CHECK((first || dict.contains(tag)));
        CHECK_FALSE(dict.register_private_tag(
            tag_info{tag, vr_type::LO, "Again", "Again", false}));

        auto info = dict.find(tag);
        REQUIRE(info.has_value());
        CHECK(info->name == "Vendor Scan Mode");
    }
}

TEST_CASE("dictionary_name_resolver", "[core][dicom_dictionary]") {
    const auto resolve = dictionary_name_resolver();

    CHECK(resolve(tags::patient_name) == "Patient's Name");
    CHECK(resolve(tags::patient_id) == "Patient ID");
    CHECK(resolve(tags::waveform_data) == "Waveform Data");
    CHECK(resolve(dicom_tag{0x0029, 0x0010}) == private_creator_name);
    CHECK(resolve(dicom_tag{0x0018, 0x0000}) == group_length_name);
    CHECK(resolve(dicom_tag{0x0029, 0x1010}) == unknown_tag_name);
    CHECK(resolve(dicom_tag{0x6001, 0x0000}) == group_length_name);
}
