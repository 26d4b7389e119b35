/**
 * @file dicom_element.cpp
 * @brief Implementation of DICOM Data Element
 */

#include <metaview/core/dicom_element.hpp>
#include <metaview/core/dicom_dataset.hpp>

#include <numeric>
#include <utility>

namespace metaview::core {

namespace {

auto initial_value(encoding::vr_type vr) -> dicom_element::value_type {
    if (vr == encoding::vr_type::SQ) {
        return sequence_value{};
    }
    return scalar_value{};
}

/// Strip the pad character and, except for UI, trailing blanks
auto remove_padding(std::string_view text, encoding::vr_type vr) -> std::string_view {
    const char pad = encoding::padding_char(vr);
    while (!text.empty() &&
           (text.back() == pad || (vr != encoding::vr_type::UI && text.back() == ' '))) {
        text.remove_suffix(1);
    }
    return text;
}

auto join_components(const std::vector<std::string>& values) -> std::string {
    std::string joined;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            joined += '\\';
        }
        joined += values[i];
    }
    return joined;
}

}  // namespace

// ============================================================================
// Constructors
// ============================================================================

dicom_element::dicom_element(dicom_tag tag, encoding::vr_type vr)
    : tag_{tag}, vr_{vr}, value_{initial_value(vr)} {}

dicom_element::dicom_element(dicom_tag tag, encoding::vr_type vr,
                             std::span<const uint8_t> data)
    : tag_{tag},
      vr_{vr},
      value_{scalar_value{std::vector<uint8_t>(data.begin(), data.end()),
                          std::nullopt}} {}

dicom_element::dicom_element(dicom_tag tag, encoding::vr_type vr, value_type value)
    : tag_{tag}, vr_{vr}, value_{std::move(value)} {}

dicom_element::dicom_element(const dicom_element&) = default;
dicom_element::dicom_element(dicom_element&&) noexcept = default;
auto dicom_element::operator=(const dicom_element&) -> dicom_element& = default;
auto dicom_element::operator=(dicom_element&&) noexcept -> dicom_element& = default;
dicom_element::~dicom_element() = default;

// ============================================================================
// Factory Methods
// ============================================================================

auto dicom_element::from_string(dicom_tag tag, encoding::vr_type vr,
                                std::string_view value) -> dicom_element {
    std::vector<uint8_t> bytes(value.begin(), value.end());
    if (bytes.size() % 2 != 0) {
        bytes.push_back(static_cast<uint8_t>(encoding::padding_char(vr)));
    }
    return dicom_element{tag, vr, scalar_value{std::move(bytes), std::nullopt}};
}

auto dicom_element::from_strings(dicom_tag tag, encoding::vr_type vr,
                                 std::vector<std::string> values) -> dicom_element {
    return dicom_element{tag, vr, multi_value{std::move(values)}};
}

auto dicom_element::from_sequence(dicom_tag tag, std::vector<dicom_dataset> items)
    -> dicom_element {
    return dicom_element{tag, encoding::vr_type::SQ, sequence_value{std::move(items)}};
}

auto dicom_element::deferred(dicom_tag tag, encoding::vr_type vr, uint32_t length)
    -> dicom_element {
    return dicom_element{tag, vr, scalar_value{{}, length}};
}

// ============================================================================
// Accessors
// ============================================================================

auto dicom_element::length() const noexcept -> uint32_t {
    if (const auto* scalar = std::get_if<scalar_value>(&value_)) {
        return scalar->deferred_length.value_or(
            static_cast<uint32_t>(scalar->bytes.size()));
    }
    if (const auto* multi = std::get_if<multi_value>(&value_)) {
        if (multi->values.empty()) {
            return 0;
        }
        const auto chars = std::accumulate(
            multi->values.begin(), multi->values.end(), size_t{0},
            [](size_t sum, const std::string& v) { return sum + v.size(); });
        return static_cast<uint32_t>(chars + multi->values.size() - 1);
    }
    return 0;
}

auto dicom_element::raw_data() const noexcept -> std::span<const uint8_t> {
    if (const auto* scalar = std::get_if<scalar_value>(&value_)) {
        return scalar->bytes;
    }
    return {};
}

auto dicom_element::is_empty() const noexcept -> bool {
    return length() == 0 && sequence_items().empty();
}

auto dicom_element::is_deferred() const noexcept -> bool {
    const auto* scalar = std::get_if<scalar_value>(&value_);
    return scalar != nullptr && scalar->deferred_length.has_value();
}

// ============================================================================
// Value Access
// ============================================================================

auto dicom_element::as_string() const -> metaview::Result<std::string> {
    if (is_sequence()) {
        return metaview::metaview_error<std::string>(
            metaview::error_codes::render_error,
            "Sequence " + tag_.to_string() + " has no string value");
    }
    if (is_deferred()) {
        return metaview::metaview_error<std::string>(
            metaview::error_codes::render_error,
            "Value of " + tag_.to_string() + " was not loaded");
    }
    if (const auto* multi = std::get_if<multi_value>(&value_)) {
        return metaview::ok(join_components(multi->values));
    }

    const auto data = raw_data();
    std::string_view raw{reinterpret_cast<const char*>(data.data()), data.size()};
    if (encoding::is_string_vr(vr_)) {
        return metaview::ok(std::string{remove_padding(raw, vr_)});
    }
    return metaview::ok(std::string{raw});
}

auto dicom_element::as_string_list() const
    -> metaview::Result<std::vector<std::string>> {
    if (const auto* multi = std::get_if<multi_value>(&value_)) {
        return metaview::Result<std::vector<std::string>>::ok(multi->values);
    }

    auto text = as_string();
    if (text.is_err()) {
        return metaview::Result<std::vector<std::string>>::err(text.error());
    }

    std::vector<std::string> components;
    std::string_view rest = text.value();
    while (!rest.empty()) {
        const auto delimiter = rest.find('\\');
        components.emplace_back(rest.substr(0, delimiter));
        if (delimiter == std::string_view::npos) {
            break;
        }
        rest.remove_prefix(delimiter + 1);
        if (rest.empty()) {
            components.emplace_back();
        }
    }
    return metaview::ok(std::move(components));
}

auto dicom_element::sequence_items() const -> const std::vector<dicom_dataset>& {
    static const std::vector<dicom_dataset> no_items;
    if (const auto* seq = std::get_if<sequence_value>(&value_)) {
        return seq->items;
    }
    return no_items;
}

}  // namespace metaview::core
