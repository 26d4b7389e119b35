/**
 * @file tag_formatter.hpp
 * @brief Textual layout of metadata records
 *
 * Every listing line has the shape
 * @code
 * {indent}(GGGG,EEEE) | Name | VR | Value
 * @endcode
 * and a sequence item boundary is written as
 * @code
 * {indent}[Item N]
 * @endcode
 * This layout is the observable output of the CLI and is parsed by
 * downstream scripts, so it must stay stable.
 */

#pragma once

#include "record.hpp"
#include "walk_options.hpp"

#include <metaview/core/dicom_element.hpp>
#include <metaview/core/dicom_tag.hpp>
#include <metaview/core/result.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace metaview::render {

/// Separator between the four fields of a record line
inline constexpr std::string_view field_separator = " | ";

/// Delimiter between the components of a multi-valued element
inline constexpr char value_delimiter = '\\';

/// Marker appended to truncated values
inline constexpr std::string_view ellipsis = "...";

/// Value shown for an element whose value could not be rendered
inline constexpr std::string_view unrenderable_placeholder = "<unrenderable value>";

/**
 * @brief Whitespace prefix for a nesting depth
 */
[[nodiscard]] auto indent(std::size_t depth, std::size_t indent_width = 2) -> std::string;

/**
 * @brief "<binary, N bytes>"
 */
[[nodiscard]] auto binary_placeholder(std::uint32_t length) -> std::string;

/**
 * @brief "<sequence, K items>"
 */
[[nodiscard]] auto sequence_placeholder(std::size_t item_count) -> std::string;

/**
 * @brief Format one listing line
 *
 * @param tag Element tag
 * @param name Name returned by the name resolver
 * @param vr Two-character VR code
 * @param value Rendered value, already truncated
 * @param depth Nesting depth of the line
 * @param item_index When set, the line is an item boundary and the other
 *        fields are ignored
 * @param indent_width Spaces per depth level
 */
[[nodiscard]] auto format_record(core::dicom_tag tag, std::string_view name,
                                 std::string_view vr, std::string_view value,
                                 std::size_t depth,
                                 std::optional<std::size_t> item_index = std::nullopt,
                                 std::size_t indent_width = 2) -> std::string;

/**
 * @brief Format a record produced by the walker
 */
[[nodiscard]] auto format_record(const record& rec, std::size_t indent_width = 2)
    -> std::string;

/**
 * @brief Label of a record without indentation, as used by tree nodes
 */
[[nodiscard]] auto format_label(const record& rec) -> std::string;

/**
 * @brief Natural text of an element value, without binary elision
 *
 * - String VRs: text with trailing padding removed
 * - US SS UL SL UV SV FL FD: numbers in shortest round-trip form
 * - AT: tags as (GGGG,EEEE)
 * - Multi-values: components
 * - Other VRs: the bytes as they are
 *
 * Multiple values are joined with a backslash.
 *
 * @return The text, or render_error for sequences, deferred payloads and
 *         numeric payloads whose size does not match the VR
 */
[[nodiscard]] auto render_text(const core::dicom_element& element)
    -> Result<std::string>;

/**
 * @brief Display value of an element
 *
 * Sequences render as sequence_placeholder(), binary-classified values as
 * binary_placeholder(), everything else as render_text() passed through
 * escape_controls().
 */
[[nodiscard]] auto render_value(const core::dicom_element& element,
                                const walk_options& options = {})
    -> Result<std::string>;

/**
 * @brief Make text safe for a single output line
 *
 * Line feed, carriage return and tab become \\n, \\r and \\t. Other C0
 * control bytes and DEL become \\xNN with upper-case hex digits. All other
 * bytes, UTF-8 sequences included, pass through unchanged.
 */
[[nodiscard]] auto escape_controls(std::string_view text) -> std::string;

/**
 * @brief Limit text to a number of characters
 *
 * Text with more than limit UTF-8 characters is cut after the first
 * limit characters and gets the ellipsis appended. Multi-byte characters
 * are never split.
 */
[[nodiscard]] auto truncate_display(std::string_view text, std::size_t limit = 128)
    -> std::string;

}  // namespace metaview::render
