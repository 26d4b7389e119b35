/**
 * @file tree_walker.hpp
 * @brief Depth-first traversal of a dataset into presentation records
 *
 * The walk runs in two passes over an explicit stack. The first pass
 * checks the shape of the tree (SQ elements hold items, nothing else
 * does, nesting stays within max_depth) and fails before anything is
 * emitted. The second pass emits records in dataset order:
 *
 * @code
 * (0008,1115) | Referenced Series Sequence | SQ | <sequence, 2 items>   depth d
 *   [Item 1]                                                           depth d+1
 *     (0008,1150) | Referenced SOP Class UID | UI | 1.2.840...         depth d+2
 *   [Item 2]
 *     ...
 * @endcode
 */

#pragma once

#include "presentation_sink.hpp"
#include "walk_options.hpp"

#include <metaview/core/dicom_dataset.hpp>
#include <metaview/core/dicom_dictionary.hpp>
#include <metaview/core/result.hpp>

#include <cstddef>

namespace metaview::render {

/**
 * @struct walk_stats
 * @brief Counters collected during the last walk
 */
struct walk_stats {
    std::size_t records{0};       ///< Records appended to the sink
    std::size_t elements{0};      ///< Element records with a rendered value
    std::size_t sequences{0};     ///< Sequence header records
    std::size_t items{0};         ///< Item boundary records
    std::size_t binary{0};        ///< Binary placeholder records
    std::size_t unrenderable{0};  ///< Unrenderable placeholder records
    std::size_t omitted{0};       ///< Excluded elements left out entirely
    std::size_t max_depth{0};     ///< Deepest record depth emitted
};

/**
 * @class tree_walker
 * @brief Walks a dataset and feeds a presentation_sink
 *
 * The walker never modifies the dataset. Walking the same dataset twice
 * produces the same sequence of sink calls.
 *
 * Thread Safety: one walker instance must not be used concurrently; separate
 * instances over separate sinks may run in parallel.
 *
 * @example
 * @code
 * tree_walker walker{core::dictionary_name_resolver()};
 * text_sink sink{std::cout};
 * if (auto result = walker.walk(dataset, sink); result.is_err()) {
 *     std::cerr << "Error: " << result.error().message << "\n";
 * }
 * @endcode
 */
class tree_walker {
public:
    /**
     * @brief Construct a walker
     * @param resolver Tag name lookup; must not be empty
     * @param options Layout and classification options
     */
    explicit tree_walker(core::name_resolver resolver = core::dictionary_name_resolver(),
                         walk_options options = {});

    /**
     * @brief Walk a dataset from depth 0
     *
     * @return Ok, invalid_option for bad options, structural_error for a
     *         malformed tree or depth_limit_exceeded when nesting exceeds
     *         max_depth. On error no record has been emitted.
     */
    [[nodiscard]] auto walk(const core::dicom_dataset& dataset, presentation_sink& sink)
        -> VoidResult;

    [[nodiscard]] auto options() const noexcept -> const walk_options& { return options_; }

    [[nodiscard]] auto last_stats() const noexcept -> const walk_stats& { return stats_; }

private:
    [[nodiscard]] auto validate_structure(const core::dicom_dataset& dataset) const
        -> VoidResult;

    void emit(const core::dicom_dataset& dataset, presentation_sink& sink);

    void emit_sequence_header(const core::dicom_element& element, std::size_t depth,
                              presentation_sink& sink);

    void emit_item(const core::dicom_element& sequence, std::size_t index,
                   std::size_t depth, presentation_sink& sink);

    void emit_element(const core::dicom_element& element, std::size_t depth,
                      presentation_sink& sink);

    void append(const record& rec, presentation_sink& sink);

    core::name_resolver resolver_;
    walk_options options_;
    walk_stats stats_;
};

/**
 * @brief Walk a dataset with a one-shot walker
 */
[[nodiscard]] auto walk(const core::dicom_dataset& dataset, presentation_sink& sink,
                        const walk_options& options = {},
                        core::name_resolver resolver = core::dictionary_name_resolver())
    -> VoidResult;

}  // namespace metaview::render
