/**
 * @file dicom_element.hpp
 * @brief DICOM Data Element representation (Tag, VR, Value)
 *
 * This file defines the dicom_element class, one metadata entry of a
 * decoded DICOM object. The value is a tagged variant: a scalar byte
 * payload, a list of string components, or a list of nested datasets.
 *
 * @see DICOM PS3.5 Section 7.1 - Data Elements
 */

#pragma once

#include "dicom_tag.hpp"
#include "result.hpp"

#include <metaview/encoding/vr_type.hpp>

#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace metaview::core {

// Forward declaration to break circular dependency
class dicom_dataset;

/**
 * @brief Single value payload as delivered by the decoder
 *
 * String VRs carry their text, numeric and AT VRs carry host-order packed
 * values, opaque VRs carry raw bytes. A deferred payload has no bytes in
 * memory and only records the length the file declared for it.
 */
struct scalar_value {
    std::vector<uint8_t> bytes;
    std::optional<uint32_t> deferred_length;
};

/**
 * @brief Multi-valued (VM > 1) payload as ordered string components
 */
struct multi_value {
    std::vector<std::string> values;
};

/**
 * @brief Sequence payload: ordered nested datasets (items)
 */
struct sequence_value {
    std::vector<dicom_dataset> items;
};

/**
 * @brief Represents a DICOM Data Element (Tag, VR, Value)
 *
 * Invariant kept by the factory functions: an SQ element holds a
 * sequence_value and no other element does. The raw constructors accept any
 * combination so that decoders can hand over what they found; consumers
 * check has_consistent_value() before trusting the shape.
 *
 * @example
 * @code
 * auto name = dicom_element::from_string(tags::patient_name, vr_type::PN, "DOE^JOHN");
 * auto rows = dicom_element::from_numeric<uint16_t>(tags::rows, vr_type::US, 512);
 * auto pixels = dicom_element::deferred(tags::pixel_data, vr_type::OW, 524288);
 * @endcode
 */
class dicom_element {
public:
    using value_type = std::variant<scalar_value, multi_value, sequence_value>;

    /**
     * @brief Construct an empty element
     *
     * SQ elements start with an empty item list, all others with an empty
     * scalar payload.
     */
    dicom_element(dicom_tag tag, encoding::vr_type vr);

    /**
     * @brief Construct an element with a raw scalar payload
     */
    dicom_element(dicom_tag tag, encoding::vr_type vr,
                  std::span<const uint8_t> data);

    /**
     * @brief Construct an element from any value alternative
     */
    dicom_element(dicom_tag tag, encoding::vr_type vr, value_type value);

    dicom_element(const dicom_element&);
    dicom_element(dicom_element&&) noexcept;
    auto operator=(const dicom_element&) -> dicom_element&;
    auto operator=(dicom_element&&) noexcept -> dicom_element&;
    ~dicom_element();

    // ========================================================================
    // Factory Methods
    // ========================================================================

    /**
     * @brief Create an element from a string value
     * @param tag The DICOM tag
     * @param vr The value representation (should be a string VR)
     * @param value The string value, padded to even length on storage
     */
    [[nodiscard]] static auto from_string(dicom_tag tag, encoding::vr_type vr,
                                          std::string_view value) -> dicom_element;

    /**
     * @brief Create a multi-valued element from its components
     */
    [[nodiscard]] static auto from_strings(dicom_tag tag, encoding::vr_type vr,
                                           std::vector<std::string> values)
        -> dicom_element;

    /**
     * @brief Create an element from a numeric value
     */
    template <typename T>
        requires std::is_arithmetic_v<T>
    [[nodiscard]] static auto from_numeric(dicom_tag tag, encoding::vr_type vr,
                                           T value) -> dicom_element;

    /**
     * @brief Create an element from several numeric values (packed)
     */
    template <typename T>
        requires std::is_arithmetic_v<T>
    [[nodiscard]] static auto from_numeric_list(dicom_tag tag, encoding::vr_type vr,
                                                std::span<const T> values) -> dicom_element;

    /**
     * @brief Create an SQ element owning the given items
     */
    [[nodiscard]] static auto from_sequence(dicom_tag tag,
                                            std::vector<dicom_dataset> items)
        -> dicom_element;

    /**
     * @brief Create an element whose payload was not loaded
     * @param length The byte length declared by the file
     */
    [[nodiscard]] static auto deferred(dicom_tag tag, encoding::vr_type vr,
                                       uint32_t length) -> dicom_element;

    // ========================================================================
    // Accessors
    // ========================================================================

    [[nodiscard]] constexpr auto tag() const noexcept -> dicom_tag { return tag_; }

    [[nodiscard]] constexpr auto vr() const noexcept -> encoding::vr_type { return vr_; }

    [[nodiscard]] auto value() const noexcept -> const value_type& { return value_; }

    /**
     * @brief Get the value length in bytes
     *
     * Deferred payloads report their declared length. Multi-values count
     * their components plus one backslash delimiter between each pair.
     * Sequences report 0.
     */
    [[nodiscard]] auto length() const noexcept -> uint32_t;

    /**
     * @brief Get the in-memory scalar bytes (empty for other alternatives)
     */
    [[nodiscard]] auto raw_data() const noexcept -> std::span<const uint8_t>;

    [[nodiscard]] auto is_empty() const noexcept -> bool;

    [[nodiscard]] auto is_deferred() const noexcept -> bool;

    [[nodiscard]] auto is_multi_valued() const noexcept -> bool {
        return std::holds_alternative<multi_value>(value_);
    }

    /**
     * @brief Check if this element holds nested datasets
     */
    [[nodiscard]] auto is_sequence() const noexcept -> bool {
        return std::holds_alternative<sequence_value>(value_);
    }

    /**
     * @brief Check that the VR and the value alternative agree
     * @return true if the element is SQ exactly when it holds items
     */
    [[nodiscard]] auto has_consistent_value() const noexcept -> bool {
        return (vr_ == encoding::vr_type::SQ) == is_sequence();
    }

    // ========================================================================
    // Value Access
    // ========================================================================

    /**
     * @brief Text form of the value
     *
     * String VRs return their text with trailing padding removed,
     * multi-values are joined with the backslash delimiter, and other scalar
     * payloads are returned byte for byte.
     *
     * @return The text, or render_error for deferred payloads and sequences
     */
    [[nodiscard]] auto as_string() const -> metaview::Result<std::string>;

    /**
     * @brief Components of the value, split at backslash delimiters
     */
    [[nodiscard]] auto as_string_list() const
        -> metaview::Result<std::vector<std::string>>;

    /**
     * @brief Unpack all numeric values of a scalar payload
     * @return The values, or data_size_mismatch if the payload is not loaded
     *         or its byte count is not a multiple of sizeof(T)
     */
    template <typename T>
        requires std::is_arithmetic_v<T>
    [[nodiscard]] auto as_numeric_list() const -> metaview::Result<std::vector<T>>;

    /// First value of as_numeric_list()
    template <typename T>
        requires std::is_arithmetic_v<T>
    [[nodiscard]] auto as_numeric() const -> metaview::Result<T>;

    /**
     * @brief Nested datasets of a sequence
     * @return The items, or an empty list if the element holds none
     */
    [[nodiscard]] auto sequence_items() const -> const std::vector<dicom_dataset>&;

private:
    dicom_tag tag_;
    encoding::vr_type vr_;
    value_type value_;
};

// ============================================================================
// Template Implementations
// ============================================================================

template <typename T>
    requires std::is_arithmetic_v<T>
auto dicom_element::from_numeric(dicom_tag tag, encoding::vr_type vr,
                                 T value) -> dicom_element {
    return from_numeric_list<T>(tag, vr, std::span<const T>{&value, 1});
}

template <typename T>
    requires std::is_arithmetic_v<T>
auto dicom_element::from_numeric_list(dicom_tag tag, encoding::vr_type vr,
                                      std::span<const T> values) -> dicom_element {
    const auto bytes = std::as_bytes(values);
    std::vector<uint8_t> packed(bytes.size());
    std::memcpy(packed.data(), bytes.data(), bytes.size());
    return dicom_element{tag, vr, scalar_value{std::move(packed), std::nullopt}};
}

template <typename T>
    requires std::is_arithmetic_v<T>
auto dicom_element::as_numeric_list() const -> metaview::Result<std::vector<T>> {
    const auto* scalar = std::get_if<scalar_value>(&value_);
    if (scalar == nullptr || scalar->deferred_length) {
        return metaview::metaview_error<std::vector<T>>(
            metaview::error_codes::data_size_mismatch,
            "Element " + tag_.to_string() + " has no packed numeric payload");
    }
    if (scalar->bytes.size() % sizeof(T) != 0) {
        return metaview::metaview_error<std::vector<T>>(
            metaview::error_codes::data_size_mismatch,
            "Element " + tag_.to_string() + " holds " +
                std::to_string(scalar->bytes.size()) +
                " bytes, not a multiple of " + std::to_string(sizeof(T)));
    }

    std::vector<T> values(scalar->bytes.size() / sizeof(T));
    std::memcpy(values.data(), scalar->bytes.data(), scalar->bytes.size());
    return metaview::ok(std::move(values));
}

template <typename T>
    requires std::is_arithmetic_v<T>
auto dicom_element::as_numeric() const -> metaview::Result<T> {
    auto values = as_numeric_list<T>();
    if (values.is_err()) {
        return metaview::Result<T>::err(values.error());
    }
    if (values.value().empty()) {
        return metaview::metaview_error<T>(metaview::error_codes::data_size_mismatch,
                                           "Element " + tag_.to_string() + " is empty");
    }
    return metaview::Result<T>::ok(values.value().front());
}

}  // namespace metaview::core
