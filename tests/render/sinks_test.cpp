/**
 * @file sinks_test.cpp
 * @brief Unit tests for the text and tree presentation sinks
 */

#include <catch2/catch_test_macros.hpp>

#include <metaview/core/dicom_tag_constants.hpp>
#include <metaview/render/text_sink.hpp>
#include <metaview/render/tree_sink.hpp>

#include <sstream>
#include <string>

using namespace metaview::core;
using namespace metaview::render;

// =============================================================================
// Test Helpers
// =============================================================================

namespace {

auto element_record(dicom_tag tag, std::string name, std::string vr, std::string value,
                    std::size_t depth) -> record {
    record rec;
    rec.tag = tag;
    rec.name = std::move(name);
    rec.vr = std::move(vr);
    rec.value = std::move(value);
    rec.depth = depth;
    return rec;
}

auto item_record(std::size_t index, std::size_t depth) -> record {
    record rec;
    rec.kind = record_kind::item;
    rec.depth = depth;
    rec.item_index = index;
    return rec;
}

/**
 * @brief Feed the event stream of a two-item sequence followed by a plain element
 */
void feed_sequence(presentation_sink& sink) {
    auto header = element_record(tags::referenced_image_sequence, "Referenced Image Sequence",
                                 "SQ", "<sequence, 2 items>", 0);
    header.kind = record_kind::sequence;

    sink.append(header);
    sink.begin_child();
    for (std::size_t i = 1; i <= 2; ++i) {
        sink.append(item_record(i, 1));
        sink.begin_child();
        sink.append(element_record(tags::referenced_sop_instance_uid,
                                   "Referenced SOP Instance UID", "UI",
                                   "1.2." + std::to_string(i), 2));
        sink.end_child();
    }
    sink.end_child();
    sink.append(element_record(tags::patient_name, "Patient's Name", "PN", "DOE^JOHN", 0));
}

}  // namespace

// =============================================================================
// text_sink
// =============================================================================

TEST_CASE("text_sink writes one indented line per record", "[render][sinks]") {
    std::ostringstream out;
    text_sink sink{out};

    feed_sequence(sink);

    CHECK(out.str() ==
          "(0008,1140) | Referenced Image Sequence | SQ | <sequence, 2 items>\n"
          "  [Item 1]\n"
          "    (0008,1155) | Referenced SOP Instance UID | UI | 1.2.1\n"
          "  [Item 2]\n"
          "    (0008,1155) | Referenced SOP Instance UID | UI | 1.2.2\n"
          "(0010,0010) | Patient's Name | PN | DOE^JOHN\n");
    CHECK(sink.lines_written() == 6);
}

TEST_CASE("text_sink honours the indent width", "[render][sinks]") {
    std::ostringstream out;
    text_sink sink{out, 4};

    sink.append(item_record(1, 1));
    sink.append(element_record(tags::patient_id, "Patient ID", "LO", "42", 2));

    CHECK(out.str() ==
          "    [Item 1]\n"
          "        (0010,0020) | Patient ID | LO | 42\n");
}

// =============================================================================
// tree_sink
// =============================================================================

TEST_CASE("tree_sink builds a hierarchy from child scopes", "[render][sinks]") {
    tree_sink sink;
    feed_sequence(sink);

    const auto& roots = sink.roots();
    REQUIRE(roots.size() == 2);
    CHECK(sink.node_count() == 6);

    const auto& sequence = roots[0];
    CHECK(sequence.rec.kind == record_kind::sequence);
    REQUIRE(sequence.children.size() == 2);
    CHECK(sequence.children[0].label == "[Item 1]");
    CHECK(sequence.children[1].label == "[Item 2]");
    REQUIRE(sequence.children[1].children.size() == 1);
    CHECK(sequence.children[1].children[0].label ==
          "(0008,1155) | Referenced SOP Instance UID | UI | 1.2.2");

    CHECK(roots[1].label == "(0010,0010) | Patient's Name | PN | DOE^JOHN");
    CHECK(roots[1].children.empty());
}

TEST_CASE("tree_sink renders box-drawing connectors", "[render][sinks]") {
    tree_sink sink;
    feed_sequence(sink);

    std::ostringstream out;
    sink.render_tree(out);

    CHECK(out.str() ==
          "(0008,1140) | Referenced Image Sequence | SQ | <sequence, 2 items>\n"
          "├── [Item 1]\n"
          "│   └── (0008,1155) | Referenced SOP Instance UID | UI | 1.2.1\n"
          "└── [Item 2]\n"
          "    └── (0008,1155) | Referenced SOP Instance UID | UI | 1.2.2\n"
          "(0010,0010) | Patient's Name | PN | DOE^JOHN\n");
}

TEST_CASE("tree_sink tolerates unbalanced scopes", "[render][sinks]") {
    tree_sink sink;

    sink.begin_child();
    sink.append(element_record(tags::patient_id, "Patient ID", "LO", "42", 0));
    sink.end_child();
    sink.end_child();
    sink.append(element_record(tags::patient_name, "Patient's Name", "PN", "DOE", 0));

    CHECK(sink.roots().size() == 2);
    CHECK(sink.node_count() == 2);
}

TEST_CASE("tree_sink clear discards all nodes", "[render][sinks]") {
    tree_sink sink;
    feed_sequence(sink);
    sink.clear();

    CHECK(sink.roots().empty());
    CHECK(sink.node_count() == 0);

    sink.append(element_record(tags::patient_id, "Patient ID", "LO", "42", 0));
    CHECK(sink.roots().size() == 1);
}
