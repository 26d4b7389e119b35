/**
 * @file dicom_dataset.hpp
 * @brief Ordered collection of metadata elements, one node of the tree
 *
 * A dataset is either the root of a decoded object or the body of one
 * sequence item. Elements iterate in ascending tag order, which is the order
 * a conformant file stores them in and therefore the display order.
 *
 * @see DICOM PS3.5 Section 7.1 - Data Set
 */

#pragma once

#include "dicom_element.hpp"
#include "dicom_tag.hpp"

#include <metaview/encoding/vr_type.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace metaview::core {

/**
 * @brief Shape of a dataset tree, counted over every nesting level
 */
struct tree_summary {
    std::size_t elements{0};   ///< Elements of all datasets, sequences included
    std::size_t sequences{0};  ///< SQ elements
    std::size_t items{0};      ///< Sequence items
    std::size_t bulk{0};       ///< Elements whose payload was not loaded
    std::size_t levels{0};     ///< Deepest dataset nesting level (root is 0)
};

/**
 * @brief Ordered, tag-keyed collection of dicom_element
 *
 * Inserting a tag that is already present replaces the old element.
 * Datasets own their elements and, through sequence elements, the nested
 * item datasets.
 *
 * Thread Safety: not thread-safe for writes. Concurrent reads of a dataset
 * nobody modifies are safe.
 *
 * @example
 * @code
 * dicom_dataset ds;
 * ds.set_string(tags::patient_name, encoding::vr_type::PN, "DOE^JOHN");
 * ds.set_numeric<uint16_t>(tags::rows, encoding::vr_type::US, 512);
 *
 * for (const auto& [tag, element] : ds) {
 *     std::cout << tag.to_string() << "\n";
 * }
 * @endcode
 */
class dicom_dataset {
public:
    using storage_type = std::map<dicom_tag, dicom_element>;
    using const_iterator = storage_type::const_iterator;

    // ========================================================================
    // Lookup
    // ========================================================================

    [[nodiscard]] auto contains(dicom_tag tag) const -> bool {
        return elements_.contains(tag);
    }

    /**
     * @return Pointer to the element, or nullptr if the tag is absent
     */
    [[nodiscard]] auto get(dicom_tag tag) const -> const dicom_element*;

    /**
     * @brief Text of an element, or @p fallback if it is absent or has none
     */
    [[nodiscard]] auto get_string(dicom_tag tag, std::string_view fallback = "") const
        -> std::string;

    /**
     * @brief First numeric value of an element
     * @return The value, or nullopt if absent or not decodable as T
     */
    template <typename T>
        requires std::is_arithmetic_v<T>
    [[nodiscard]] auto get_numeric(dicom_tag tag) const -> std::optional<T>;

    // ========================================================================
    // Building
    // ========================================================================

    void insert(dicom_element element);

    void set_string(dicom_tag tag, encoding::vr_type vr, std::string_view value);

    template <typename T>
        requires std::is_arithmetic_v<T>
    void set_numeric(dicom_tag tag, encoding::vr_type vr, T value) {
        insert(dicom_element::from_numeric<T>(tag, vr, value));
    }

    /**
     * @return true if an element was removed
     */
    auto remove(dicom_tag tag) -> bool { return elements_.erase(tag) > 0; }

    // ========================================================================
    // Traversal
    // ========================================================================

    [[nodiscard]] auto begin() const noexcept -> const_iterator { return elements_.begin(); }
    [[nodiscard]] auto end() const noexcept -> const_iterator { return elements_.end(); }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return elements_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return elements_.empty(); }

    /**
     * @brief Count elements, sequences and items across the whole tree
     *
     * Walks the nested items with an explicit stack, so arbitrarily deep
     * trees do not grow the call stack.
     */
    [[nodiscard]] auto summarize() const -> tree_summary;

private:
    storage_type elements_;
};

template <typename T>
    requires std::is_arithmetic_v<T>
auto dicom_dataset::get_numeric(dicom_tag tag) const -> std::optional<T> {
    const auto* elem = get(tag);
    if (elem == nullptr) {
        return std::nullopt;
    }

    auto result = elem->as_numeric<T>();
    if (result.is_err()) {
        return std::nullopt;
    }
    return result.value();
}

}  // namespace metaview::core
