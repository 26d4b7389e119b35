/**
 * @file tree_walker_test.cpp
 * @brief Unit tests for the dataset tree walker
 */

#include <catch2/catch_test_macros.hpp>

#include "mocks/collecting_sink.hpp"

#include <metaview/core/dicom_dataset.hpp>
#include <metaview/core/dicom_tag_constants.hpp>
#include <metaview/render/tag_formatter.hpp>
#include <metaview/render/text_sink.hpp>
#include <metaview/render/tree_sink.hpp>
#include <metaview/render/tree_walker.hpp>

#include <algorithm>
#include <array>
#include <map>
#include <sstream>
#include <string>
#include <vector>

using namespace metaview::core;
using namespace metaview::encoding;
using namespace metaview::render;

// =============================================================================
// Test Helpers
// =============================================================================

namespace {

/**
 * @brief Resolver over a small fixed table; Image Type is deliberately absent
 */
auto stub_resolver() -> name_resolver {
    return [](dicom_tag tag) -> std::string {
        static const std::map<dicom_tag, std::string> names{
            {tags::patient_name, "Patient's Name"},
            {tags::patient_id, "Patient ID"},
            {tags::modality, "Modality"},
            {tags::rows, "Rows"},
            {tags::referenced_series_sequence, "Referenced Series Sequence"},
            {tags::referenced_image_sequence, "Referenced Image Sequence"},
            {tags::referenced_sop_instance_uid, "Referenced SOP Instance UID"},
            {tags::pixel_data, "Pixel Data"},
        };
        auto it = names.find(tag);
        return it == names.end() ? std::string{unknown_tag_name} : it->second;
    };
}

auto walk_to_text(const dicom_dataset& ds, const walk_options& options = {})
    -> std::string {
    std::ostringstream out;
    text_sink sink{out, options.indent_width};
    tree_walker walker{stub_resolver(), options};
    REQUIRE(walker.walk(ds, sink).is_ok());
    return out.str();
}

auto make_item(const std::string& uid) -> dicom_dataset {
    dicom_dataset item;
    item.set_string(tags::referenced_sop_instance_uid, vr_type::UI, uid);
    return item;
}

auto make_patient() -> dicom_dataset {
    dicom_dataset ds;
    ds.set_string(tags::patient_name, vr_type::PN, "DOE^JOHN");
    ds.set_string(tags::patient_id, vr_type::LO, "123456");
    return ds;
}

/**
 * @brief Dataset mixing every kind of element
 */
auto make_mixed() -> dicom_dataset {
    dicom_dataset ds = make_patient();
    ds.set_string(tags::modality, vr_type::CS, "CT");
    ds.set_numeric<uint16_t>(tags::rows, vr_type::US, 512);
    ds.insert(dicom_element::from_strings(tags::image_type, vr_type::CS,
                                          {"ORIGINAL", "PRIMARY"}));
    ds.insert(dicom_element::from_sequence(
        tags::referenced_image_sequence,
        {make_item("1.2.3.1"), make_item("1.2.3.2"), make_item("1.2.3.3")}));
    ds.insert(dicom_element::deferred(tags::pixel_data, vr_type::OW, 524288));
    return ds;
}

/**
 * @brief Dataset whose sequences nest the given number of levels deep
 */
auto make_nested(std::size_t levels) -> dicom_dataset {
    dicom_dataset current = make_item("1.2.3");
    for (std::size_t i = 0; i < levels; ++i) {
        dicom_dataset parent;
        parent.insert(dicom_element::from_sequence(tags::referenced_series_sequence,
                                                   {std::move(current)}));
        current = std::move(parent);
    }
    return current;
}

}  // namespace

// =============================================================================
// Scenarios
// =============================================================================

TEST_CASE("flat dataset yields one line per element", "[render][tree_walker]") {
    CHECK(walk_to_text(make_patient()) ==
          "(0010,0010) | Patient's Name | PN | DOE^JOHN\n"
          "(0010,0020) | Patient ID | LO | 123456\n");
}

TEST_CASE("binary values are replaced by a placeholder", "[render][tree_walker]") {
    const std::vector<uint8_t> payload(10000, 0xAB);
    dicom_dataset ds;
    ds.insert(dicom_element{dicom_tag{0x0009, 0x1010}, vr_type::OB,
                            std::span<const uint8_t>{payload}});

    collecting_sink sink;
    REQUIRE(walk(ds, sink, {}, stub_resolver()).is_ok());

    REQUIRE(sink.records().size() == 1);
    CHECK(sink.records()[0].kind == record_kind::binary);
    CHECK(sink.records()[0].value == "<binary, 10000 bytes>");
}

TEST_CASE("sequence with two items yields five records", "[render][tree_walker]") {
    dicom_dataset ds;
    ds.insert(dicom_element::from_sequence(tags::referenced_image_sequence,
                                           {make_item("1.2.3.1"), make_item("1.2.3.2")}));

    SECTION("record shape") {
        collecting_sink sink;
        REQUIRE(walk(ds, sink, {}, stub_resolver()).is_ok());

        const auto& recs = sink.records();
        REQUIRE(recs.size() == 5);

        CHECK(recs[0].kind == record_kind::sequence);
        CHECK(recs[0].value == "<sequence, 2 items>");
        CHECK(recs[1].kind == record_kind::item);
        CHECK(recs[1].item_index == 1u);
        CHECK(recs[2].kind == record_kind::element);
        CHECK(recs[3].item_index == 2u);
        CHECK(recs[4].value == "1.2.3.2");

        const std::vector<std::size_t> depths{0, 1, 2, 1, 2};
        for (std::size_t i = 0; i < recs.size(); ++i) {
            CHECK(recs[i].depth == depths[i]);
        }
    }

    SECTION("text output") {
        CHECK(walk_to_text(ds) ==
              "(0008,1140) | Referenced Image Sequence | SQ | <sequence, 2 items>\n"
              "  [Item 1]\n"
              "    (0008,1155) | Referenced SOP Instance UID | UI | 1.2.3.1\n"
              "  [Item 2]\n"
              "    (0008,1155) | Referenced SOP Instance UID | UI | 1.2.3.2\n");
    }

    SECTION("zero-based item numbering") {
        walk_options options;
        options.item_index_base = 0;

        const auto text = walk_to_text(ds, options);
        CHECK(text.find("  [Item 0]\n") != std::string::npos);
        CHECK(text.find("  [Item 1]\n") != std::string::npos);
        CHECK(text.find("[Item 2]") == std::string::npos);
    }
}

TEST_CASE("tags missing from the dictionary are named Unknown", "[render][tree_walker]") {
    dicom_dataset ds;
    ds.set_string(tags::image_type, vr_type::CS, "ORIGINAL");

    CHECK(walk_to_text(ds) == "(0008,0008) | Unknown | CS | ORIGINAL\n");
}

// =============================================================================
// Properties
// =============================================================================

TEST_CASE("top-level record count equals element count", "[render][tree_walker]") {
    const auto ds = make_mixed();

    collecting_sink sink;
    REQUIRE(walk(ds, sink, {}, stub_resolver()).is_ok());

    CHECK(sink.top_level_count() == ds.size());
}

TEST_CASE("each item is a direct child of its sequence", "[render][tree_walker]") {
    const auto ds = make_mixed();

    collecting_sink sink;
    REQUIRE(walk(ds, sink, {}, stub_resolver()).is_ok());

    std::size_t headers = 0;
    std::size_t items = 0;
    for (std::size_t i = 0; i < sink.records().size(); ++i) {
        const auto& rec = sink.records()[i];
        if (rec.kind == record_kind::sequence) {
            ++headers;
            CHECK(sink.level_of(i) == 0);
        } else if (rec.kind == record_kind::item) {
            ++items;
            CHECK(sink.level_of(i) == 1);
        }
    }
    CHECK(headers == 1);
    CHECK(items == 3);
    CHECK(sink.open_children() == 0);
}

TEST_CASE("record depth equals child nesting level", "[render][tree_walker]") {
    const auto ds = make_nested(5);

    collecting_sink sink;
    REQUIRE(walk(ds, sink, {}, stub_resolver()).is_ok());

    REQUIRE(sink.records().size() == 11);
    for (std::size_t i = 0; i < sink.records().size(); ++i) {
        CHECK(sink.records()[i].depth == sink.level_of(i));
    }
    CHECK(sink.records().back().depth == 10);
    CHECK(sink.open_children() == 0);
}

TEST_CASE("walking twice produces identical output", "[render][tree_walker]") {
    const auto ds = make_mixed();
    tree_walker walker{stub_resolver()};

    std::ostringstream first;
    std::ostringstream second;
    text_sink first_sink{first};
    text_sink second_sink{second};

    REQUIRE(walker.walk(ds, first_sink).is_ok());
    REQUIRE(walker.walk(ds, second_sink).is_ok());

    CHECK(first.str() == second.str());
    CHECK_FALSE(first.str().empty());
}

TEST_CASE("long values are truncated at a character boundary", "[render][tree_walker]") {
    std::string comment;
    for (int i = 0; i < 100; ++i) {
        comment += "\xC3\xA9t\xC3\xA9 ";
    }

    dicom_dataset ds;
    ds.set_string(tags::patient_comments, vr_type::LT, comment);

    walk_options options;
    options.max_display_length = 10;

    collecting_sink sink;
    REQUIRE(walk(ds, sink, options, stub_resolver()).is_ok());

    REQUIRE(sink.records().size() == 1);
    CHECK(sink.records()[0].value == "\xC3\xA9t\xC3\xA9 \xC3\xA9t\xC3\xA9 \xC3\xA9t...");
}

TEST_CASE("multi-line text stays on one output line", "[render][tree_walker]") {
    dicom_dataset ds;
    ds.set_string(tags::patient_comments, vr_type::LT, "line one\r\nline two");
    ds.set_string(tags::patient_id, vr_type::LO, "123456");

    SECTION("text output has one line per record") {
        const auto text = walk_to_text(ds);
        CHECK(std::count(text.begin(), text.end(), '\n') == 2);
        CHECK(text.find('\r') == std::string::npos);
        CHECK(text ==
              "(0010,0020) | Patient ID | LO | 123456\n"
              "(0010,4000) | Unknown | LT | line one\\r\\nline two\n");
    }

    SECTION("tree labels carry no line breaks") {
        tree_sink sink;
        REQUIRE(walk(ds, sink, {}, stub_resolver()).is_ok());

        REQUIRE(sink.roots().size() == 2);
        for (const auto& node : sink.roots()) {
            CHECK(node.label.find_first_of("\r\n") == std::string::npos);
        }
        CHECK(sink.roots()[1].rec.value == "line one\\r\\nline two");
    }

    SECTION("truncation counts the escaped text") {
        walk_options options;
        options.max_display_length = 10;

        collecting_sink sink;
        REQUIRE(walk(ds, sink, options, stub_resolver()).is_ok());

        REQUIRE(sink.records().size() == 2);
        CHECK(sink.records()[1].value == "line one\\r...");
    }
}

// =============================================================================
// Binary Handling
// =============================================================================

TEST_CASE("excluded tags stay visible by default", "[render][tree_walker]") {
    const auto ds = make_mixed();
    const auto text = walk_to_text(ds);

    CHECK(text.find("(7FE0,0010) | Pixel Data | OW | <binary, 524288 bytes>\n") !=
          std::string::npos);
}

TEST_CASE("excluded tags can be omitted", "[render][tree_walker]") {
    auto ds = make_mixed();
    ds.insert(dicom_element::deferred(dicom_tag{0x0009, 0x1010}, vr_type::OB, 16));

    walk_options options;
    options.omit_excluded_tags = true;

    tree_walker walker{stub_resolver(), options};
    collecting_sink sink;
    REQUIRE(walker.walk(ds, sink).is_ok());

    for (const auto& rec : sink.records()) {
        CHECK(rec.tag != tags::pixel_data);
    }
    CHECK(walker.last_stats().omitted == 1);
    CHECK(walker.last_stats().binary == 1);
}

// =============================================================================
// Failure Semantics
// =============================================================================

TEST_CASE("unrenderable values do not stop the walk", "[render][tree_walker]") {
    const std::array<uint8_t, 3> bytes{1, 2, 3};
    dicom_dataset ds = make_patient();
    ds.insert(dicom_element{tags::rows, vr_type::US, std::span<const uint8_t>{bytes}});
    ds.insert(dicom_element::deferred(tags::patient_comments, vr_type::LT, 1000));

    tree_walker walker{stub_resolver()};
    collecting_sink sink;
    REQUIRE(walker.walk(ds, sink).is_ok());

    REQUIRE(sink.records().size() == 4);
    CHECK(sink.records()[2].kind == record_kind::unrenderable);
    CHECK(sink.records()[2].value == "<unrenderable value>");
    CHECK(sink.records()[3].kind == record_kind::unrenderable);
    CHECK(walker.last_stats().unrenderable == 2);
}

TEST_CASE("malformed trees fail before any output", "[render][tree_walker]") {
    SECTION("SQ element without items") {
        dicom_dataset ds = make_patient();
        ds.insert(dicom_element{tags::referenced_image_sequence, vr_type::SQ,
                                scalar_value{{'X', 'Y'}, std::nullopt}});

        collecting_sink sink;
        auto result = walk(ds, sink, {}, stub_resolver());

        REQUIRE(result.is_err());
        CHECK(result.error().code == metaview::error_codes::structural_error);
        CHECK(sink.events().empty());
    }

    SECTION("items under a non-SQ element deep in the tree") {
        dicom_dataset bad_item = make_item("1.2.3");
        bad_item.insert(dicom_element{tags::patient_name, vr_type::PN,
                                      sequence_value{{make_item("4.5.6")}}});

        dicom_dataset ds = make_patient();
        ds.insert(dicom_element::from_sequence(tags::referenced_image_sequence,
                                               {make_item("1.1"), bad_item}));

        collecting_sink sink;
        auto result = walk(ds, sink, {}, stub_resolver());

        REQUIRE(result.is_err());
        CHECK(metaview::is_structural_error(result.error().code));
        CHECK(sink.events().empty());
    }
}

TEST_CASE("nesting depth is capped", "[render][tree_walker]") {
    walk_options options;
    options.max_depth = 3;

    SECTION("nesting at the cap is accepted") {
        collecting_sink sink;
        CHECK(walk(make_nested(3), sink, options, stub_resolver()).is_ok());
    }

    SECTION("nesting beyond the cap is rejected") {
        collecting_sink sink;
        auto result = walk(make_nested(4), sink, options, stub_resolver());

        REQUIRE(result.is_err());
        CHECK(result.error().code == metaview::error_codes::depth_limit_exceeded);
        CHECK(sink.records().empty());
    }

    SECTION("deep trees within the default cap are walked") {
        collecting_sink sink;
        REQUIRE(walk(make_nested(200), sink, {}, stub_resolver()).is_ok());
        CHECK(sink.records().size() == 401);
        CHECK(sink.open_children() == 0);
    }
}

TEST_CASE("invalid options are rejected", "[render][tree_walker]") {
    walk_options options;
    options.item_index_base = 2;

    collecting_sink sink;
    auto result = walk(make_patient(), sink, options, stub_resolver());

    REQUIRE(result.is_err());
    CHECK(result.error().code == metaview::error_codes::invalid_option);
    CHECK(sink.events().empty());
}

TEST_CASE("empty sequences open and close their children", "[render][tree_walker]") {
    dicom_dataset ds;
    ds.insert(dicom_element::from_sequence(tags::referenced_image_sequence, {}));

    collecting_sink sink;
    REQUIRE(walk(ds, sink, {}, stub_resolver()).is_ok());

    using kind = collecting_sink::event_kind;
    REQUIRE(sink.events().size() == 3);
    CHECK(sink.events()[0].kind == kind::record);
    CHECK(sink.events()[1].kind == kind::begin_child);
    CHECK(sink.events()[2].kind == kind::end_child);
    CHECK(sink.records()[0].value == "<sequence, 0 items>");
}

TEST_CASE("walk statistics", "[render][tree_walker]") {
    tree_walker walker{stub_resolver()};
    collecting_sink sink;
    REQUIRE(walker.walk(make_mixed(), sink).is_ok());

    const auto& stats = walker.last_stats();
    CHECK(stats.records == sink.records().size());
    CHECK(stats.sequences == 1);
    CHECK(stats.items == 3);
    CHECK(stats.binary == 1);
    CHECK(stats.unrenderable == 0);
    CHECK(stats.max_depth == 2);
}
