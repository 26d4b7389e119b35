#ifndef METAVIEW_ENCODING_VR_TYPE_HPP
#define METAVIEW_ENCODING_VR_TYPE_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace metaview::encoding {

/**
 * @brief DICOM Value Representation (VR) codes.
 *
 * Each enumerator's value packs its two ASCII characters big-endian.
 * Values outside the enumerators print as "??".
 *
 * @see DICOM PS3.5 Section 6.2 - Value Representation (VR)
 */
enum class vr_type : uint16_t {
    // String VRs
    AE = 0x4145,  ///< Application Entity
    AS = 0x4153,  ///< Age String
    CS = 0x4353,  ///< Code String
    DA = 0x4441,  ///< Date
    DS = 0x4453,  ///< Decimal String
    DT = 0x4454,  ///< Date Time
    IS = 0x4953,  ///< Integer String
    LO = 0x4C4F,  ///< Long String
    LT = 0x4C54,  ///< Long Text
    PN = 0x504E,  ///< Person Name
    SH = 0x5348,  ///< Short String
    ST = 0x5354,  ///< Short Text
    TM = 0x544D,  ///< Time
    UC = 0x5543,  ///< Unlimited Characters
    UI = 0x5549,  ///< Unique Identifier
    UR = 0x5552,  ///< Universal Resource Identifier
    UT = 0x5554,  ///< Unlimited Text

    // Numeric VRs (binary encoded)
    FL = 0x464C,  ///< Floating Point Single
    FD = 0x4644,  ///< Floating Point Double
    SL = 0x534C,  ///< Signed Long
    SS = 0x5353,  ///< Signed Short
    UL = 0x554C,  ///< Unsigned Long
    US = 0x5553,  ///< Unsigned Short
    SV = 0x5356,  ///< Signed 64-bit Very Long
    UV = 0x5556,  ///< Unsigned 64-bit Very Long

    // Opaque VRs (raw bytes)
    OB = 0x4F42,  ///< Other Byte
    OD = 0x4F44,  ///< Other Double
    OF = 0x4F46,  ///< Other Float
    OL = 0x4F4C,  ///< Other Long
    OV = 0x4F56,  ///< Other 64-bit Very Long
    OW = 0x4F57,  ///< Other Word
    UN = 0x554E,  ///< Unknown

    // Special VRs
    AT = 0x4154,  ///< Attribute Tag
    SQ = 0x5351,  ///< Sequence of Items
};

namespace detail {

struct vr_code {
    vr_type vr;
    std::string_view code;
};

inline constexpr std::array<vr_code, 34> vr_codes{{
    {vr_type::AE, "AE"}, {vr_type::AS, "AS"}, {vr_type::AT, "AT"}, {vr_type::CS, "CS"},
    {vr_type::DA, "DA"}, {vr_type::DS, "DS"}, {vr_type::DT, "DT"}, {vr_type::FD, "FD"},
    {vr_type::FL, "FL"}, {vr_type::IS, "IS"}, {vr_type::LO, "LO"}, {vr_type::LT, "LT"},
    {vr_type::OB, "OB"}, {vr_type::OD, "OD"}, {vr_type::OF, "OF"}, {vr_type::OL, "OL"},
    {vr_type::OV, "OV"}, {vr_type::OW, "OW"}, {vr_type::PN, "PN"}, {vr_type::SH, "SH"},
    {vr_type::SL, "SL"}, {vr_type::SQ, "SQ"}, {vr_type::SS, "SS"}, {vr_type::ST, "ST"},
    {vr_type::SV, "SV"}, {vr_type::TM, "TM"}, {vr_type::UC, "UC"}, {vr_type::UI, "UI"},
    {vr_type::UL, "UL"}, {vr_type::UN, "UN"}, {vr_type::UR, "UR"}, {vr_type::US, "US"},
    {vr_type::UT, "UT"}, {vr_type::UV, "UV"},
}};

}  // namespace detail

/**
 * @brief Two-character code of a VR, as printed in the VR column
 * @return The code (e.g. "PN"), or "??" for values outside the enum
 */
[[nodiscard]] constexpr std::string_view to_string(vr_type vr) noexcept {
    for (const auto& entry : detail::vr_codes) {
        if (entry.vr == vr) {
            return entry.code;
        }
    }
    return "??";
}

/**
 * @brief Parses a two-character VR code such as "PN"
 * @return The matching vr_type, or std::nullopt if the code is not a VR
 */
[[nodiscard]] constexpr std::optional<vr_type> from_string(std::string_view str) noexcept {
    for (const auto& entry : detail::vr_codes) {
        if (entry.code == str) {
            return entry.vr;
        }
    }
    return std::nullopt;
}

/// @name VR Categories
/// @{

/**
 * @brief Checks if a VR holds character data.
 */
[[nodiscard]] constexpr bool is_string_vr(vr_type vr) noexcept {
    switch (vr) {
        case vr_type::AE: case vr_type::AS: case vr_type::CS:
        case vr_type::DA: case vr_type::DS: case vr_type::DT:
        case vr_type::IS: case vr_type::LO: case vr_type::LT:
        case vr_type::PN: case vr_type::SH: case vr_type::ST:
        case vr_type::TM: case vr_type::UC: case vr_type::UI:
        case vr_type::UR: case vr_type::UT:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Checks if a VR is one of the opaque byte codes.
 *
 * OB, OD, OF, OL, OV, OW and UN carry raw payloads (pixel and waveform
 * samples among them) that are never printed.
 */
[[nodiscard]] constexpr bool is_binary_vr(vr_type vr) noexcept {
    switch (vr) {
        case vr_type::OB: case vr_type::OD: case vr_type::OF:
        case vr_type::OL: case vr_type::OV: case vr_type::OW:
        case vr_type::UN:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Checks if a VR is a binary-encoded number.
 */
[[nodiscard]] constexpr bool is_numeric_vr(vr_type vr) noexcept {
    switch (vr) {
        case vr_type::FL: case vr_type::FD:
        case vr_type::SL: case vr_type::SS: case vr_type::SV:
        case vr_type::UL: case vr_type::US: case vr_type::UV:
            return true;
        default:
            return false;
    }
}

/// @}

/// Bytes per value of a fixed-size VR, 0 for variable-length VRs
[[nodiscard]] constexpr std::size_t fixed_length(vr_type vr) noexcept {
    switch (vr) {
        case vr_type::SS: case vr_type::US:
            return 2;
        case vr_type::AT: case vr_type::FL: case vr_type::SL: case vr_type::UL:
            return 4;
        case vr_type::FD: case vr_type::SV: case vr_type::UV:
            return 8;
        default:
            return 0;
    }
}

/// Trailing pad of an odd-length value: NUL for UI and non-string VRs, else space
[[nodiscard]] constexpr char padding_char(vr_type vr) noexcept {
    return (is_string_vr(vr) && vr != vr_type::UI) ? ' ' : '\0';
}

}  // namespace metaview::encoding

#endif  // METAVIEW_ENCODING_VR_TYPE_HPP
