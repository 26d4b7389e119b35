/**
 * @file utf8.hpp
 * @brief UTF-8 scanning helpers shared by the classifier and the formatter
 */

#ifndef METAVIEW_RENDER_DETAIL_UTF8_HPP
#define METAVIEW_RENDER_DETAIL_UTF8_HPP

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace metaview::render::detail {

/**
 * @brief One character read from a UTF-8 string
 *
 * A malformed sequence is returned as a single invalid byte so that
 * scanning always makes progress.
 */
struct utf8_char {
    std::uint32_t code_point{0};
    std::size_t size{1};
    bool valid{false};
};

/**
 * @brief Decode the character starting at byte offset pos
 * @pre pos < text.size()
 */
[[nodiscard]] auto decode_at(std::string_view text, std::size_t pos) noexcept
    -> utf8_char;

/**
 * @brief Check a decoded character for display
 *
 * Invalid bytes and C0/C1 controls (including DEL) are not printable,
 * except tab, CR and LF.
 */
[[nodiscard]] auto is_printable(const utf8_char& ch) noexcept -> bool;

/**
 * @brief Byte offset just past the first max_chars characters
 * @return text.size() if the text has no more than max_chars characters
 */
[[nodiscard]] auto prefix_bytes(std::string_view text, std::size_t max_chars) noexcept
    -> std::size_t;

}  // namespace metaview::render::detail

#endif  // METAVIEW_RENDER_DETAIL_UTF8_HPP
