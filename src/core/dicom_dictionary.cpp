/**
 * @file dicom_dictionary.cpp
 * @brief Implementation of dicom_dictionary
 */

#include "metaview/core/dicom_dictionary.hpp"

#include <mutex>

namespace metaview::core {

// Defined in standard_tags_data.cpp
extern auto get_standard_tags() -> std::span<const tag_info>;

auto dicom_dictionary::instance() -> dicom_dictionary& {
    static dicom_dictionary dictionary;
    return dictionary;
}

dicom_dictionary::dicom_dictionary() {
    const auto standard = get_standard_tags();
    tag_map_.reserve(standard.size());
    keyword_map_.reserve(standard.size());

    for (const auto& info : standard) {
        add(info);
    }
    standard_count_ = standard.size();
}

// Caller holds the exclusive lock, or runs in the constructor
void dicom_dictionary::add(const tag_info& info) {
    tag_map_.emplace(info.tag, info);
    if (!info.keyword.empty()) {
        keyword_map_.emplace(info.keyword, info.tag);
    }
}

auto dicom_dictionary::find(dicom_tag tag) const -> std::optional<tag_info> {
    std::shared_lock lock(mutex_);
    if (const auto it = tag_map_.find(tag); it != tag_map_.end()) {
        return it->second;
    }
    return std::nullopt;
}

auto dicom_dictionary::find_by_keyword(std::string_view keyword) const
    -> std::optional<tag_info> {
    std::shared_lock lock(mutex_);
    const auto it = keyword_map_.find(keyword);
    if (it == keyword_map_.end()) {
        return std::nullopt;
    }
    return tag_map_.at(it->second);
}

auto dicom_dictionary::contains(dicom_tag tag) const -> bool {
    std::shared_lock lock(mutex_);
    return tag_map_.contains(tag);
}

auto dicom_dictionary::name_of(dicom_tag tag) const -> std::string {
    {
        std::shared_lock lock(mutex_);
        if (const auto it = tag_map_.find(tag); it != tag_map_.end()) {
            return std::string{it->second.name};
        }
    }

    if (tag.is_private_creator()) {
        return std::string{private_creator_name};
    }
    if (tag.is_group_length()) {
        return std::string{group_length_name};
    }
    return std::string{unknown_tag_name};
}

auto dicom_dictionary::register_private_tag(const tag_info& info) -> bool {
    if (!info.tag.is_private()) {
        return false;
    }

    std::unique_lock lock(mutex_);
    if (tag_map_.contains(info.tag)) {
        return false;
    }

    // tag_info only views its strings; keep copies alive for the process
    const std::string_view keyword = private_strings_.emplace_back(info.keyword);
    const std::string_view name = private_strings_.emplace_back(info.name);
    add(tag_info{info.tag, info.vr, keyword, name, info.retired});
    return true;
}

auto dicom_dictionary::size() const -> size_t {
    std::shared_lock lock(mutex_);
    return tag_map_.size();
}

auto dicom_dictionary::standard_tag_count() const -> size_t {
    return standard_count_;
}

auto dictionary_name_resolver() -> name_resolver {
    return [](dicom_tag tag) { return dicom_dictionary::instance().name_of(tag); };
}

}  // namespace metaview::core
