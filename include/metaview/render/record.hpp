/**
 * @file record.hpp
 * @brief Presentation record emitted by the tree walker
 */

#pragma once

#include <metaview/core/dicom_tag.hpp>

#include <cstddef>
#include <optional>
#include <string>

namespace metaview::render {

/**
 * @brief What a record stands for
 */
enum class record_kind {
    element,       ///< Ordinary element with a rendered value
    sequence,      ///< Sequence header, value is "<sequence, K items>"
    item,          ///< Item boundary inside a sequence
    binary,        ///< Element whose payload was elided
    unrenderable   ///< Element whose value could not be rendered
};

[[nodiscard]] constexpr auto to_string(record_kind kind) noexcept -> const char* {
    switch (kind) {
        case record_kind::element: return "element";
        case record_kind::sequence: return "sequence";
        case record_kind::item: return "item";
        case record_kind::binary: return "binary";
        case record_kind::unrenderable: return "unrenderable";
    }
    return "unknown";
}

/**
 * @brief One logical row of the metadata listing
 *
 * Item records carry the tag of the enclosing sequence and the item
 * number; their name, VR and value are empty. The value of every other
 * record is already truncated for display.
 */
struct record {
    record_kind kind{record_kind::element};
    std::size_t depth{0};
    core::dicom_tag tag;
    std::string name;
    std::string vr;
    std::string value;
    std::optional<std::size_t> item_index;

    [[nodiscard]] auto is_item() const noexcept -> bool {
        return kind == record_kind::item;
    }

    auto operator==(const record&) const -> bool = default;
};

}  // namespace metaview::render
