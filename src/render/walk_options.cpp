/**
 * @file walk_options.cpp
 * @brief Validation of walk_options
 */

#include <metaview/render/walk_options.hpp>

#include <string>

namespace metaview::render {

namespace {

constexpr std::size_t max_indent_width = 16;

}  // namespace

auto walk_options::validate() const -> VoidResult {
    if (indent_width > max_indent_width) {
        return metaview_void_error(
            error_codes::invalid_option,
            "indent width must be at most " + std::to_string(max_indent_width),
            "indent_width=" + std::to_string(indent_width));
    }
    if (max_display_length == 0) {
        return metaview_void_error(error_codes::invalid_option,
                                   "max display length must be positive");
    }
    if (!(non_printable_ratio >= 0.0 && non_printable_ratio < 1.0)) {
        return metaview_void_error(
            error_codes::invalid_option,
            "non-printable ratio must be in [0, 1)",
            "non_printable_ratio=" + std::to_string(non_printable_ratio));
    }
    if (max_depth == 0) {
        return metaview_void_error(error_codes::invalid_option,
                                   "max depth must be positive");
    }
    if (item_index_base > 1) {
        return metaview_void_error(
            error_codes::invalid_option, "item index base must be 0 or 1",
            "item_index_base=" + std::to_string(item_index_base));
    }
    return ok();
}

}  // namespace metaview::render
