/**
 * @file dicom_dictionary.hpp
 * @brief DICOM Data Dictionary for tag name lookup
 *
 * The dictionary maps tags to their PS3.6 names. The tree walker never
 * talks to it directly; it receives a name_resolver, and
 * dictionary_name_resolver() builds the default one on top of this class.
 *
 * @see DICOM PS3.6 - Data Dictionary
 */

#pragma once

#include "dicom_tag.hpp"
#include "tag_info.hpp"

#include <cstddef>
#include <deque>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>

namespace metaview::core {

/// Name reported for tags no resolver knows
inline constexpr std::string_view unknown_tag_name = "Unknown";

/// Name reported for private creator elements (gggg,0010-00FF) of odd groups
inline constexpr std::string_view private_creator_name = "Private Creator";

/// Name reported for group length elements (gggg,0000)
inline constexpr std::string_view group_length_name = "Group Length";

/**
 * @brief Maps a tag to its human readable name
 *
 * Must return a name for every tag; unknown_tag_name is the fallback.
 */
using name_resolver = std::function<std::string(dicom_tag)>;

/**
 * @brief DICOM Data Dictionary singleton class
 *
 * Thread Safety: lookups take a shared lock, registration an exclusive one.
 *
 * @example
 * @code
 * auto& dict = dicom_dictionary::instance();
 * if (auto info = dict.find(dicom_tag{0x0010, 0x0010})) {
 *     std::cout << info->name;  // "Patient's Name"
 * }
 * @endcode
 */
class dicom_dictionary {
public:
    [[nodiscard]] static auto instance() -> dicom_dictionary&;

    dicom_dictionary(const dicom_dictionary&) = delete;
    dicom_dictionary(dicom_dictionary&&) = delete;
    auto operator=(const dicom_dictionary&) -> dicom_dictionary& = delete;
    auto operator=(dicom_dictionary&&) -> dicom_dictionary& = delete;

    [[nodiscard]] auto find(dicom_tag tag) const -> std::optional<tag_info>;

    [[nodiscard]] auto find_by_keyword(std::string_view keyword) const
        -> std::optional<tag_info>;

    [[nodiscard]] auto contains(dicom_tag tag) const -> bool;

    /**
     * @brief Display name of a tag, never empty
     *
     * Dictionary name if known, otherwise private_creator_name,
     * group_length_name or unknown_tag_name by the shape of the tag.
     */
    [[nodiscard]] auto name_of(dicom_tag tag) const -> std::string;

    /**
     * @brief Register a private tag definition
     *
     * The keyword and name are copied into dictionary owned storage.
     *
     * @return true if registered, false if the tag is not private or is
     *         already known
     */
    auto register_private_tag(const tag_info& info) -> bool;

    [[nodiscard]] auto size() const -> size_t;

    [[nodiscard]] auto standard_tag_count() const -> size_t;

private:
    dicom_dictionary();

    void add(const tag_info& info);

    std::unordered_map<dicom_tag, tag_info> tag_map_;
    std::unordered_map<std::string_view, dicom_tag> keyword_map_;

    /// Backing storage for strings of registered private tags
    std::deque<std::string> private_strings_;

    size_t standard_count_{0};

    mutable std::shared_mutex mutex_;
};

/**
 * @brief Default name resolver, forwarding to dicom_dictionary::name_of()
 */
[[nodiscard]] auto dictionary_name_resolver() -> name_resolver;

}  // namespace metaview::core
