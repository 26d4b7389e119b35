/**
 * @file dicom_element_test.cpp
 * @brief Unit tests for dicom_element class
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <metaview/core/dicom_dataset.hpp>
#include <metaview/core/dicom_element.hpp>
#include <metaview/core/dicom_tag_constants.hpp>

#include <array>
#include <vector>

using namespace metaview::core;
using namespace metaview::encoding;

// ============================================================================
// Construction Tests
// ============================================================================

TEST_CASE("dicom_element construction", "[core][dicom_element]") {
    SECTION("empty non-SQ element holds an empty scalar") {
        dicom_element elem{tags::patient_name, vr_type::PN};

        CHECK(elem.tag() == tags::patient_name);
        CHECK(elem.vr() == vr_type::PN);
        CHECK(elem.is_empty());
        CHECK_FALSE(elem.is_sequence());
        CHECK(elem.has_consistent_value());
    }

    SECTION("empty SQ element holds an empty item list") {
        dicom_element elem{tags::referenced_image_sequence, vr_type::SQ};

        CHECK(elem.is_sequence());
        CHECK(elem.sequence_items().empty());
        CHECK(elem.has_consistent_value());
    }

    SECTION("raw constructor accepts mismatched values") {
        dicom_element sq_with_text{tags::referenced_image_sequence, vr_type::SQ,
                                   scalar_value{{'A', 'B'}, std::nullopt}};
        dicom_element text_with_items{tags::patient_name, vr_type::PN,
                                      sequence_value{}};

        CHECK_FALSE(sq_with_text.has_consistent_value());
        CHECK_FALSE(text_with_items.has_consistent_value());
    }
}

// ============================================================================
// Factory Tests
// ============================================================================

TEST_CASE("dicom_element factories", "[core][dicom_element]") {
    SECTION("from_string pads odd lengths") {
        auto elem = dicom_element::from_string(tags::patient_id, vr_type::LO, "12345");

        CHECK(elem.length() == 6);
        CHECK(elem.as_string().value() == "12345");
    }

    SECTION("UI values are null padded") {
        auto elem = dicom_element::from_string(tags::sop_class_uid, vr_type::UI,
                                               "1.2.840.10008.5.1.4.1.1.2");
        const auto raw = elem.raw_data();

        REQUIRE(raw.size() == 26);
        CHECK(raw.back() == '\0');
        CHECK(elem.as_string().value() == "1.2.840.10008.5.1.4.1.1.2");
    }

    SECTION("from_strings keeps components") {
        auto elem = dicom_element::from_strings(tags::image_type, vr_type::CS,
                                                {"ORIGINAL", "PRIMARY", "AXIAL"});

        CHECK(elem.is_multi_valued());
        CHECK(elem.as_string().value() == "ORIGINAL\\PRIMARY\\AXIAL");
        CHECK(elem.as_string_list().value().size() == 3);
    }

    SECTION("scalar text splits at delimiters") {
        auto elem = dicom_element::from_string(tags::image_type, vr_type::CS,
                                               "DERIVED\\SECONDARY");
        const auto parts = elem.as_string_list();
        REQUIRE(parts.is_ok());
        REQUIRE(parts.value().size() == 2);
        CHECK(parts.value()[0] == "DERIVED");
        CHECK(parts.value()[1] == "SECONDARY");
    }

    SECTION("empty components are kept") {
        auto elem = dicom_element::from_string(tags::image_type, vr_type::CS, "A\\\\B");
        CHECK(elem.as_string_list().value() == std::vector<std::string>{"A", "", "B"});
    }

    SECTION("multi-value length counts delimiters") {
        auto elem = dicom_element::from_strings(tags::pixel_spacing, vr_type::DS,
                                                {"0.5", "0.25"});
        CHECK(elem.length() == 8);
    }

    SECTION("from_numeric stores host order bytes") {
        auto elem = dicom_element::from_numeric<uint16_t>(tags::rows, vr_type::US, 512);

        CHECK(elem.length() == 2);
        CHECK(elem.as_numeric<uint16_t>().value() == 512);
    }

    SECTION("from_numeric_list packs every value") {
        const std::array<double, 3> values{1.5, -2.0, 1e-3};
        auto elem = dicom_element::from_numeric_list<double>(
            dicom_tag{0x0018, 0x9089}, vr_type::FD, values);

        auto list = elem.as_numeric_list<double>();
        REQUIRE(list.is_ok());
        REQUIRE(list.value().size() == 3);
        CHECK_THAT(list.value()[2], Catch::Matchers::WithinRel(1e-3));
    }

    SECTION("from_sequence owns its items") {
        dicom_dataset item;
        item.set_string(tags::referenced_sop_instance_uid, vr_type::UI, "1.2.3");

        auto elem = dicom_element::from_sequence(tags::referenced_image_sequence,
                                                 {item, item});

        CHECK(elem.vr() == vr_type::SQ);
        CHECK(elem.sequence_items().size() == 2);
        CHECK(elem.length() == 0);
        CHECK(elem.has_consistent_value());
    }

    SECTION("deferred keeps the declared length only") {
        auto elem = dicom_element::deferred(tags::pixel_data, vr_type::OW, 524288);

        CHECK(elem.is_deferred());
        CHECK(elem.length() == 524288);
        CHECK(elem.raw_data().empty());
        CHECK_FALSE(elem.is_empty());
    }
}

// ============================================================================
// Value Access Tests
// ============================================================================

TEST_CASE("dicom_element value access errors", "[core][dicom_element]") {
    SECTION("sequence has no string value") {
        auto elem = dicom_element::from_sequence(tags::referenced_image_sequence, {});
        CHECK(elem.as_string().is_err());
    }

    SECTION("deferred payload has no string value") {
        auto elem = dicom_element::deferred(tags::patient_comments, vr_type::LT, 200);
        auto result = elem.as_string();

        REQUIRE(result.is_err());
        CHECK(result.error().code == metaview::error_codes::render_error);
    }

    SECTION("misaligned numeric data") {
        const std::array<uint8_t, 3> bytes{1, 2, 3};
        dicom_element elem{tags::rows, vr_type::US, std::span<const uint8_t>{bytes}};

        auto result = elem.as_numeric_list<uint16_t>();
        REQUIRE(result.is_err());
        CHECK(result.error().code == metaview::error_codes::data_size_mismatch);
    }

    SECTION("too little data for a single number") {
        dicom_element elem{tags::rows, vr_type::UL};
        CHECK(elem.as_numeric<uint32_t>().is_err());
    }
}

TEST_CASE("dicom_element copies own their items", "[core][dicom_element]") {
    dicom_dataset item;
    item.set_string(tags::referenced_sop_instance_uid, vr_type::UI, "1.2.3");

    auto original = dicom_element::from_sequence(tags::referenced_series_sequence, {item});
    auto copy = original;
    original = dicom_element::from_sequence(tags::referenced_series_sequence, {});

    CHECK(original.sequence_items().empty());
    REQUIRE(copy.sequence_items().size() == 1);
    CHECK(copy.sequence_items()[0].get_string(tags::referenced_sop_instance_uid) == "1.2.3");
}
