/**
 * @file dicom_tag_constants.hpp
 * @brief Compile-time constants for DICOM tags referenced by metaview
 *
 * @see DICOM PS3.6 - Data Dictionary
 */

#pragma once

#include "dicom_tag.hpp"

namespace metaview::core::tags {

// ============================================================================
// File Meta Information (Group 0x0002)
// ============================================================================

/// File Meta Information Group Length
inline constexpr dicom_tag file_meta_information_group_length{0x0002, 0x0000};

/// Transfer Syntax UID
inline constexpr dicom_tag transfer_syntax_uid{0x0002, 0x0010};

// ============================================================================
// Identification (Group 0x0008)
// ============================================================================

/// Image Type
inline constexpr dicom_tag image_type{0x0008, 0x0008};

/// SOP Class UID
inline constexpr dicom_tag sop_class_uid{0x0008, 0x0016};

/// SOP Instance UID
inline constexpr dicom_tag sop_instance_uid{0x0008, 0x0018};

/// Study Date
inline constexpr dicom_tag study_date{0x0008, 0x0020};

/// Modality
inline constexpr dicom_tag modality{0x0008, 0x0060};

/// Study Description
inline constexpr dicom_tag study_description{0x0008, 0x1030};

/// Referenced Series Sequence
inline constexpr dicom_tag referenced_series_sequence{0x0008, 0x1115};

/// Referenced Image Sequence
inline constexpr dicom_tag referenced_image_sequence{0x0008, 0x1140};

/// Referenced SOP Class UID
inline constexpr dicom_tag referenced_sop_class_uid{0x0008, 0x1150};

/// Referenced SOP Instance UID
inline constexpr dicom_tag referenced_sop_instance_uid{0x0008, 0x1155};

// ============================================================================
// Patient (Group 0x0010)
// ============================================================================

/// Patient's Name
inline constexpr dicom_tag patient_name{0x0010, 0x0010};

/// Patient ID
inline constexpr dicom_tag patient_id{0x0010, 0x0020};

/// Patient's Birth Date
inline constexpr dicom_tag patient_birth_date{0x0010, 0x0030};

/// Patient Comments
inline constexpr dicom_tag patient_comments{0x0010, 0x4000};

// ============================================================================
// Image Pixel (Group 0x0028)
// ============================================================================

/// Rows
inline constexpr dicom_tag rows{0x0028, 0x0010};

/// Columns
inline constexpr dicom_tag columns{0x0028, 0x0011};

/// Pixel Spacing
inline constexpr dicom_tag pixel_spacing{0x0028, 0x0030};

// ============================================================================
// Bulk payloads
// ============================================================================

/// Waveform Data
inline constexpr dicom_tag waveform_data{0x5400, 0x1010};

/// Float Pixel Data
inline constexpr dicom_tag float_pixel_data{0x7FE0, 0x0008};

/// Double Float Pixel Data
inline constexpr dicom_tag double_float_pixel_data{0x7FE0, 0x0009};

/// Pixel Data
inline constexpr dicom_tag pixel_data{0x7FE0, 0x0010};

}  // namespace metaview::core::tags
