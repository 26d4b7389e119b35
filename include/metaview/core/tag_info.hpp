/**
 * @file tag_info.hpp
 * @brief DICOM tag metadata information structure
 *
 * Each dictionary entry carries the tag, its VR, the keyword and the
 * descriptive name shown next to the tag in listings.
 *
 * @see DICOM PS3.6 - Data Dictionary
 */

#pragma once

#include "dicom_tag.hpp"

#include <metaview/encoding/vr_type.hpp>

#include <string_view>

namespace metaview::core {

/**
 * @brief DICOM tag metadata information
 *
 * @example
 * @code
 * constexpr tag_info patient_name_info{
 *     dicom_tag{0x0010, 0x0010},
 *     encoding::vr_type::PN,
 *     "PatientName",
 *     "Patient's Name",
 *     false
 * };
 * @endcode
 */
struct tag_info {
    dicom_tag tag;                ///< The DICOM tag
    encoding::vr_type vr;         ///< Value Representation
    std::string_view keyword;     ///< Keyword, e.g. "PatientName"
    std::string_view name;        ///< Descriptive name, e.g. "Patient's Name"
    bool retired{false};          ///< Retired from the standard

    [[nodiscard]] constexpr auto is_valid() const noexcept -> bool {
        return !keyword.empty() && !name.empty();
    }

    [[nodiscard]] constexpr auto operator==(const tag_info& other) const noexcept
        -> bool {
        return tag == other.tag;
    }
};

}  // namespace metaview::core
