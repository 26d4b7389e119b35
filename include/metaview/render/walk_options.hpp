/**
 * @file walk_options.hpp
 * @brief Configuration of the metadata tree walk
 */

#pragma once

#include <metaview/core/result.hpp>

#include <cstddef>
#include <cstdint>

namespace metaview::render {

/**
 * @struct walk_options
 * @brief Layout and classification options for tree_walker
 */
struct walk_options {
    /// Spaces of indentation per nesting level
    std::size_t indent_width{2};

    /// Rendered values longer than this many characters are truncated
    std::size_t max_display_length{128};

    /// Byte length above which a value is checked for printability
    std::uint32_t binary_length_threshold{64};

    /// Fraction of non-printable characters above which a long value is binary
    double non_printable_ratio{0.0};

    /// Maximum dataset nesting level (root dataset is level 0)
    std::size_t max_depth{256};

    /// Number given to the first item of a sequence (0 or 1)
    std::size_t item_index_base{1};

    /// Drop Pixel Data and Waveform Data rows instead of showing a placeholder
    bool omit_excluded_tags{false};

    /**
     * @brief Check that every option is within its accepted range
     * @return Ok, or an invalid_option error naming the offending option
     */
    [[nodiscard]] auto validate() const -> VoidResult;
};

}  // namespace metaview::render
