/**
 * @file binary_classifier.cpp
 * @brief Implementation of the binary value classifier
 */

#include <metaview/render/binary_classifier.hpp>
#include <metaview/render/detail/utf8.hpp>
#include <metaview/render/tag_formatter.hpp>

#include <metaview/core/dicom_tag_constants.hpp>
#include <metaview/encoding/vr_type.hpp>

#include <algorithm>
#include <array>

namespace metaview::render {

namespace {

constexpr std::array excluded_tags = {
    core::tags::waveform_data,
    core::tags::float_pixel_data,
    core::tags::double_float_pixel_data,
    core::tags::pixel_data,
};

}  // namespace

auto is_excluded_tag(core::dicom_tag tag) noexcept -> bool {
    return std::find(excluded_tags.begin(), excluded_tags.end(), tag) !=
           excluded_tags.end();
}

auto non_printable_fraction(std::string_view text) noexcept -> double {
    std::size_t total = 0;
    std::size_t non_printable = 0;

    std::size_t pos = 0;
    while (pos < text.size()) {
        const auto ch = detail::decode_at(text, pos);
        if (!detail::is_printable(ch)) {
            ++non_printable;
        }
        ++total;
        pos += ch.size;
    }

    if (total == 0) {
        return 0.0;
    }
    return static_cast<double>(non_printable) / static_cast<double>(total);
}

auto is_binary(const core::dicom_element& element, const walk_options& options)
    -> bool {
    if (is_excluded_tag(element.tag())) {
        return true;
    }
    if (encoding::is_binary_vr(element.vr())) {
        return true;
    }
    if (element.is_sequence()) {
        return false;
    }
    if (element.length() <= options.binary_length_threshold) {
        return false;
    }

    auto text = render_text(element);
    if (text.is_err()) {
        return false;
    }
    return non_printable_fraction(text.value()) > options.non_printable_ratio;
}

}  // namespace metaview::render
