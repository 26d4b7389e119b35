/**
 * @file tag_formatter.cpp
 * @brief Implementation of the record layout and value rendering
 */

#include <metaview/render/tag_formatter.hpp>
#include <metaview/render/binary_classifier.hpp>
#include <metaview/render/detail/utf8.hpp>

#include <metaview/compat/format.hpp>
#include <metaview/core/dicom_dataset.hpp>
#include <metaview/encoding/vr_type.hpp>

#include <variant>
#include <vector>

namespace metaview::render {

namespace {

using encoding::vr_type;

template <typename T>
auto join_numbers(const core::dicom_element& element) -> Result<std::string> {
    auto values = element.as_numeric_list<T>();
    if (values.is_err()) {
        return metaview_error<std::string>(
            error_codes::render_error,
            "Cannot decode " + std::string{encoding::to_string(element.vr())} +
                " value of " + element.tag().to_string(),
            values.error().message);
    }

    std::string text;
    const auto& numbers = values.value();
    for (std::size_t i = 0; i < numbers.size(); ++i) {
        if (i > 0) {
            text += value_delimiter;
        }
        text += compat::format("{}", numbers[i]);
    }
    return ok(std::move(text));
}

auto join_attribute_tags(const core::dicom_element& element) -> Result<std::string> {
    constexpr auto tag_size = encoding::fixed_length(encoding::vr_type::AT);
    const auto data = element.raw_data();
    if (data.size() % tag_size != 0) {
        return metaview_error<std::string>(
            error_codes::render_error,
            "AT value of " + element.tag().to_string() + " is not a whole number of tags",
            "length=" + std::to_string(data.size()));
    }

    auto words = element.as_numeric_list<uint16_t>();
    if (words.is_err()) {
        return metaview_error<std::string>(error_codes::render_error,
                                           words.error().message);
    }

    std::string text;
    const auto& values = words.value();
    for (std::size_t i = 0; i + 1 < values.size(); i += 2) {
        if (i > 0) {
            text += value_delimiter;
        }
        text += core::dicom_tag{values[i], values[i + 1]}.to_string();
    }
    return ok(std::move(text));
}

}  // namespace

// ============================================================================
// Layout
// ============================================================================

auto indent(std::size_t depth, std::size_t indent_width) -> std::string {
    return std::string(depth * indent_width, ' ');
}

auto binary_placeholder(std::uint32_t length) -> std::string {
    return compat::format("<binary, {} bytes>", length);
}

auto sequence_placeholder(std::size_t item_count) -> std::string {
    return compat::format("<sequence, {} items>", item_count);
}

auto format_record(core::dicom_tag tag, std::string_view name, std::string_view vr,
                   std::string_view value, std::size_t depth,
                   std::optional<std::size_t> item_index,
                   std::size_t indent_width) -> std::string {
    if (item_index) {
        return compat::format("{}[Item {}]", indent(depth, indent_width), *item_index);
    }

    std::string line = indent(depth, indent_width);
    line += tag.to_string();
    line += field_separator;
    line += name;
    line += field_separator;
    line += vr;
    line += field_separator;
    line += value;
    return line;
}

auto format_record(const record& rec, std::size_t indent_width) -> std::string {
    return format_record(rec.tag, rec.name, rec.vr, rec.value, rec.depth,
                         rec.item_index, indent_width);
}

auto format_label(const record& rec) -> std::string {
    return format_record(rec.tag, rec.name, rec.vr, rec.value, 0, rec.item_index, 0);
}

// ============================================================================
// Value Rendering
// ============================================================================

auto render_text(const core::dicom_element& element) -> Result<std::string> {
    if (element.is_sequence()) {
        return metaview_error<std::string>(
            error_codes::render_error,
            "Sequence " + element.tag().to_string() + " has no text value");
    }
    if (element.is_deferred()) {
        return metaview_error<std::string>(
            error_codes::render_error,
            "Value of " + element.tag().to_string() + " was not loaded",
            "declared length=" + std::to_string(element.length()));
    }
    if (element.is_multi_valued()) {
        return element.as_string();
    }

    switch (element.vr()) {
        case vr_type::US: return join_numbers<uint16_t>(element);
        case vr_type::SS: return join_numbers<int16_t>(element);
        case vr_type::UL: return join_numbers<uint32_t>(element);
        case vr_type::SL: return join_numbers<int32_t>(element);
        case vr_type::UV: return join_numbers<uint64_t>(element);
        case vr_type::SV: return join_numbers<int64_t>(element);
        case vr_type::FL: return join_numbers<float>(element);
        case vr_type::FD: return join_numbers<double>(element);
        case vr_type::AT: return join_attribute_tags(element);
        default:
            return element.as_string();
    }
}

auto render_value(const core::dicom_element& element, const walk_options& options)
    -> Result<std::string> {
    if (element.is_sequence()) {
        return ok(sequence_placeholder(element.sequence_items().size()));
    }
    if (is_binary(element, options)) {
        return ok(binary_placeholder(element.length()));
    }
    auto text = render_text(element);
    if (text.is_err()) {
        return text;
    }
    return ok(escape_controls(text.value()));
}

auto escape_controls(std::string_view text) -> std::string {
    std::string escaped;
    escaped.reserve(text.size());
    for (const char c : text) {
        const auto byte = static_cast<unsigned char>(c);
        switch (c) {
            case '\n': escaped += "\\n"; break;
            case '\r': escaped += "\\r"; break;
            case '\t': escaped += "\\t"; break;
            default:
                if (byte < 0x20 || byte == 0x7F) {
                    escaped += compat::format("\\x{:02X}", static_cast<unsigned>(byte));
                } else {
                    escaped += c;
                }
                break;
        }
    }
    return escaped;
}

auto truncate_display(std::string_view text, std::size_t limit) -> std::string {
    const auto cut = detail::prefix_bytes(text, limit);
    if (cut >= text.size()) {
        return std::string{text};
    }

    std::string shortened{text.substr(0, cut)};
    shortened += ellipsis;
    return shortened;
}

}  // namespace metaview::render
