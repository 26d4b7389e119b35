/**
 * @file utf8.cpp
 * @brief Implementation of the UTF-8 scanning helpers
 */

#include <metaview/render/detail/utf8.hpp>

namespace metaview::render::detail {

namespace {

constexpr auto is_continuation(unsigned char byte) noexcept -> bool {
    return (byte & 0xC0) == 0x80;
}

}  // namespace

auto decode_at(std::string_view text, std::size_t pos) noexcept -> utf8_char {
    const auto lead = static_cast<unsigned char>(text[pos]);

    if (lead < 0x80) {
        return utf8_char{lead, 1, true};
    }

    std::size_t size = 0;
    std::uint32_t code_point = 0;
    // Bounds on the second byte reject overlong forms and surrogates
    unsigned char second_min = 0x80;
    unsigned char second_max = 0xBF;

    if (lead >= 0xC2 && lead <= 0xDF) {
        size = 2;
        code_point = lead & 0x1F;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        size = 3;
        code_point = lead & 0x0F;
        if (lead == 0xE0) {
            second_min = 0xA0;
        } else if (lead == 0xED) {
            second_max = 0x9F;
        }
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        size = 4;
        code_point = lead & 0x07;
        if (lead == 0xF0) {
            second_min = 0x90;
        } else if (lead == 0xF4) {
            second_max = 0x8F;
        }
    } else {
        return utf8_char{lead, 1, false};
    }

    if (pos + size > text.size()) {
        return utf8_char{lead, 1, false};
    }

    const auto second = static_cast<unsigned char>(text[pos + 1]);
    if (second < second_min || second > second_max) {
        return utf8_char{lead, 1, false};
    }

    for (std::size_t i = 1; i < size; ++i) {
        const auto byte = static_cast<unsigned char>(text[pos + i]);
        if (!is_continuation(byte)) {
            return utf8_char{lead, 1, false};
        }
        code_point = (code_point << 6) | (byte & 0x3F);
    }

    return utf8_char{code_point, size, true};
}

auto is_printable(const utf8_char& ch) noexcept -> bool {
    if (!ch.valid) {
        return false;
    }
    const auto cp = ch.code_point;
    if (cp == '\t' || cp == '\r' || cp == '\n') {
        return true;
    }
    if (cp < 0x20 || cp == 0x7F) {
        return false;
    }
    return cp < 0x80 || cp > 0x9F;
}

auto prefix_bytes(std::string_view text, std::size_t max_chars) noexcept
    -> std::size_t {
    std::size_t pos = 0;
    std::size_t chars = 0;
    while (pos < text.size() && chars < max_chars) {
        pos += decode_at(text, pos).size;
        ++chars;
    }
    return pos;
}

}  // namespace metaview::render::detail
