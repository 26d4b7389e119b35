/**
 * @file dicom_tag.cpp
 * @brief Implementation of dicom_tag parsing and formatting
 */

#include "metaview/core/dicom_tag.hpp"

#include "metaview/compat/format.hpp"

#include <charconv>

namespace metaview::core {

namespace {

auto trim_blanks(std::string_view text) noexcept -> std::string_view {
    const auto first = text.find_first_not_of(" \t");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

/// Exactly four hex digits, nothing else
auto parse_hex4(std::string_view text) noexcept -> std::optional<uint16_t> {
    if (text.size() != 4) {
        return std::nullopt;
    }
    uint16_t value = 0;
    const auto [end, ec] = std::from_chars(text.data(), text.data() + 4, value, 16);
    if (ec != std::errc{} || end != text.data() + 4) {
        return std::nullopt;
    }
    return value;
}

auto make_tag(std::string_view group_text, std::string_view element_text)
    -> std::optional<dicom_tag> {
    const auto group = parse_hex4(group_text);
    const auto element = parse_hex4(element_text);
    if (!group || !element) {
        return std::nullopt;
    }
    return dicom_tag{*group, *element};
}

}  // namespace

auto dicom_tag::from_string(std::string_view str) -> std::optional<dicom_tag> {
    str = trim_blanks(str);

    if (str.size() == 11 && str.front() == '(' && str.back() == ')') {
        str = str.substr(1, 9);
    }
    if (str.size() == 9 && str[4] == ',') {
        return make_tag(str.substr(0, 4), str.substr(5));
    }
    if (str.size() == 8) {
        return make_tag(str.substr(0, 4), str.substr(4));
    }
    return std::nullopt;
}

auto dicom_tag::to_string() const -> std::string {
    return compat::format("({:04X},{:04X})", group(), element());
}

}  // namespace metaview::core
