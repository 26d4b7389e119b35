/**
 * @file binary_classifier.hpp
 * @brief Decide whether an element's value is shown or elided as binary
 *
 * Policy, first match wins:
 * 1. Pixel Data and Waveform Data tags are binary.
 * 2. OB, OD, OF, OL, OV, OW and UN values are binary.
 * 3. Sequences are never binary.
 * 4. A value longer than binary_length_threshold bytes whose text has a
 *    non-printable fraction above non_printable_ratio is binary.
 * 5. Everything else is text.
 */

#pragma once

#include "walk_options.hpp"

#include <metaview/core/dicom_element.hpp>
#include <metaview/core/dicom_tag.hpp>

#include <string_view>

namespace metaview::render {

/**
 * @brief Check for the bulk payload tags that are never rendered
 *
 * (7FE0,0008) Float Pixel Data, (7FE0,0009) Double Float Pixel Data,
 * (7FE0,0010) Pixel Data and (5400,1010) Waveform Data.
 */
[[nodiscard]] auto is_excluded_tag(core::dicom_tag tag) noexcept -> bool;

/**
 * @brief Fraction of characters in text that are not printable
 *
 * Text is read as UTF-8. Each malformed byte counts as one non-printable
 * character, as does every C0 or C1 control other than tab, CR and LF.
 *
 * @return Value in [0, 1]; 0 for empty text
 */
[[nodiscard]] auto non_printable_fraction(std::string_view text) noexcept -> double;

/**
 * @brief Classify an element as binary
 *
 * Never fails. A value that cannot be rendered as text is reported as not
 * binary so that the walker shows it as unrenderable.
 */
[[nodiscard]] auto is_binary(const core::dicom_element& element,
                             const walk_options& options = {}) -> bool;

}  // namespace metaview::render
