/**
 * @file dicom_tag.hpp
 * @brief DICOM Tag (Group, Element) identifier
 *
 * A tag names one metadata field. Together with the data dictionary it
 * gives the element its meaning; the renderer prints it as `(GGGG,EEEE)`.
 *
 * @see DICOM PS3.5 Section 7.1 - Data Elements
 */

#pragma once

#include <compare>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace metaview::core {

/**
 * @brief Immutable DICOM tag (Group, Element pair)
 *
 * Stored as a single uint32_t `(group << 16) | element`, so ordering is by
 * group first and element second.
 *
 * @example
 * @code
 * dicom_tag name{0x0010, 0x0010};
 * name.to_string();                        // "(0010,0010)"
 * auto parsed = dicom_tag::from_string("0010,0020");
 * @endcode
 */
class dicom_tag {
public:
    constexpr dicom_tag() noexcept = default;

    constexpr dicom_tag(uint16_t group, uint16_t element) noexcept
        : combined_{static_cast<uint32_t>(group) << 16 | element} {}

    /// From the packed form `(group << 16) | element`
    explicit constexpr dicom_tag(uint32_t combined) noexcept : combined_{combined} {}

    /**
     * @brief Parse a tag typed by a user or read from a listing
     *
     * Accepted forms: "(GGGG,EEEE)", "GGGG,EEEE" and "GGGGEEEE". Surrounding
     * blanks are ignored and hex digits may be either case.
     *
     * @return The tag, or nullopt if the text is not a tag
     */
    [[nodiscard]] static auto from_string(std::string_view str)
        -> std::optional<dicom_tag>;

    [[nodiscard]] constexpr auto group() const noexcept -> uint16_t {
        return static_cast<uint16_t>(combined_ >> 16);
    }

    [[nodiscard]] constexpr auto element() const noexcept -> uint16_t {
        return static_cast<uint16_t>(combined_);
    }

    [[nodiscard]] constexpr auto combined() const noexcept -> uint32_t { return combined_; }

    /// Odd group above 0008
    [[nodiscard]] constexpr auto is_private() const noexcept -> bool {
        return (group() & 1U) != 0 && group() > 0x0008;
    }

    /// Private block reservation (gggg,0010-00FF) in an odd group
    [[nodiscard]] constexpr auto is_private_creator() const noexcept -> bool {
        return is_private() && element() >= 0x0010 && element() <= 0x00FF;
    }

    /// (gggg,0000)
    [[nodiscard]] constexpr auto is_group_length() const noexcept -> bool {
        return element() == 0x0000;
    }

    /**
     * @brief Display form used in every rendered record
     * @return "(GGGG,EEEE)" with upper-case hex digits
     */
    [[nodiscard]] auto to_string() const -> std::string;

    constexpr auto operator<=>(const dicom_tag&) const noexcept = default;

private:
    uint32_t combined_{0};
};

}  // namespace metaview::core

template <>
struct std::hash<metaview::core::dicom_tag> {
    auto operator()(metaview::core::dicom_tag tag) const noexcept -> std::size_t {
        return std::hash<uint32_t>{}(tag.combined());
    }
};
