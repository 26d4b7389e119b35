/**
 * @file dicom_dataset.cpp
 * @brief Implementation of dicom_dataset
 */

#include <metaview/core/dicom_dataset.hpp>

#include <algorithm>
#include <utility>
#include <vector>

namespace metaview::core {

auto dicom_dataset::get(dicom_tag tag) const -> const dicom_element* {
    const auto it = elements_.find(tag);
    return it == elements_.end() ? nullptr : &it->second;
}

auto dicom_dataset::get_string(dicom_tag tag, std::string_view fallback) const
    -> std::string {
    if (const auto* elem = get(tag); elem != nullptr) {
        return elem->as_string().unwrap_or(std::string{fallback});
    }
    return std::string{fallback};
}

void dicom_dataset::insert(dicom_element element) {
    const auto tag = element.tag();
    elements_.insert_or_assign(tag, std::move(element));
}

void dicom_dataset::set_string(dicom_tag tag, encoding::vr_type vr,
                               std::string_view value) {
    insert(dicom_element::from_string(tag, vr, value));
}

auto dicom_dataset::summarize() const -> tree_summary {
    tree_summary summary;

    std::vector<std::pair<const dicom_dataset*, std::size_t>> pending{{this, 0}};
    while (!pending.empty()) {
        const auto [dataset, level] = pending.back();
        pending.pop_back();
        summary.levels = std::max(summary.levels, level);

        for (const auto& [tag, element] : *dataset) {
            ++summary.elements;
            if (element.is_deferred()) {
                ++summary.bulk;
            }
            if (!element.is_sequence()) {
                continue;
            }

            ++summary.sequences;
            for (const auto& item : element.sequence_items()) {
                ++summary.items;
                pending.emplace_back(&item, level + 1);
            }
        }
    }
    return summary;
}

}  // namespace metaview::core
