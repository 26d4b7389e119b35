/**
 * @file walk_options_test.cpp
 * @brief Unit tests for walk_options validation
 */

#include <catch2/catch_test_macros.hpp>

#include <metaview/render/walk_options.hpp>

using namespace metaview::render;

TEST_CASE("default walk options are valid", "[render][walk_options]") {
    walk_options options;

    CHECK(options.validate().is_ok());
    CHECK(options.indent_width == 2);
    CHECK(options.max_display_length == 128);
    CHECK(options.binary_length_threshold == 64);
    CHECK(options.item_index_base == 1);
    CHECK_FALSE(options.omit_excluded_tags);
}

TEST_CASE("out-of-range walk options are rejected", "[render][walk_options]") {
    walk_options options;

    SECTION("indent width") {
        options.indent_width = 17;
    }

    SECTION("zero display length") {
        options.max_display_length = 0;
    }

    SECTION("negative ratio") {
        options.non_printable_ratio = -0.1;
    }

    SECTION("ratio of one") {
        options.non_printable_ratio = 1.0;
    }

    SECTION("zero depth") {
        options.max_depth = 0;
    }

    SECTION("item base") {
        options.item_index_base = 2;
    }

    auto result = options.validate();
    REQUIRE(result.is_err());
    CHECK(result.error().code == metaview::error_codes::invalid_option);
}

TEST_CASE("boundary walk options are accepted", "[render][walk_options]") {
    walk_options options;
    options.indent_width = 0;
    options.max_display_length = 1;
    options.non_printable_ratio = 0.99;
    options.max_depth = 1;
    options.item_index_base = 0;

    CHECK(options.validate().is_ok());

    options.indent_width = 16;
    CHECK(options.validate().is_ok());
}
