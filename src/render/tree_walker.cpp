/**
 * @file tree_walker.cpp
 * @brief Implementation of the dataset tree walker
 */

#include <metaview/render/tree_walker.hpp>
#include <metaview/render/binary_classifier.hpp>
#include <metaview/render/tag_formatter.hpp>

#include <metaview/encoding/vr_type.hpp>
#include <metaview/integration/logger_adapter.hpp>

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace metaview::render {

using integration::logger_adapter;

namespace {

/**
 * @brief Position inside the tree during emission
 *
 * A dataset frame iterates the elements of one dataset. A sequence frame
 * iterates the items of one SQ element; its depth is the depth of the
 * sequence header.
 */
struct frame {
    const core::dicom_dataset* dataset{nullptr};
    core::dicom_dataset::const_iterator next{};
    const core::dicom_element* sequence{nullptr};
    std::size_t next_item{0};
    std::size_t depth{0};

    [[nodiscard]] auto is_sequence() const noexcept -> bool { return sequence != nullptr; }
};

struct pending_dataset {
    const core::dicom_dataset* dataset;
    std::size_t level;
};

}  // namespace

tree_walker::tree_walker(core::name_resolver resolver, walk_options options)
    : resolver_{std::move(resolver)}, options_{options} {}

auto tree_walker::walk(const core::dicom_dataset& dataset, presentation_sink& sink)
    -> VoidResult {
    stats_ = walk_stats{};

    if (auto valid = options_.validate(); valid.is_err()) {
        return valid;
    }
    if (!resolver_) {
        return metaview_void_error(error_codes::invalid_option,
                                   "tree walker has no name resolver");
    }

    if (auto structure = validate_structure(dataset); structure.is_err()) {
        logger_adapter::debug("Walk rejected: {}", structure.error().message);
        return structure;
    }

    emit(dataset, sink);

    logger_adapter::debug(
        "Walk finished: {} records ({} sequences, {} items, {} binary, "
        "{} unrenderable, {} omitted), max depth {}",
        stats_.records, stats_.sequences, stats_.items, stats_.binary,
        stats_.unrenderable, stats_.omitted, stats_.max_depth);
    return ok();
}

// =============================================================================
// Structural Validation
// =============================================================================

auto tree_walker::validate_structure(const core::dicom_dataset& dataset) const
    -> VoidResult {
    std::vector<pending_dataset> pending;
    pending.push_back({&dataset, 0});

    while (!pending.empty()) {
        const auto [current, level] = pending.back();
        pending.pop_back();

        if (level > options_.max_depth) {
            return metaview_void_error(
                error_codes::depth_limit_exceeded,
                "Dataset nesting exceeds the depth limit of " +
                    std::to_string(options_.max_depth));
        }

        for (const auto& [tag, element] : *current) {
            if (!element.has_consistent_value()) {
                const bool is_sq = element.vr() == encoding::vr_type::SQ;
                return metaview_void_error(
                    error_codes::structural_error,
                    "Element " + tag.to_string() +
                        (is_sq ? " has VR SQ but does not hold sequence items"
                               : " holds sequence items but has VR " +
                                     std::string{encoding::to_string(element.vr())}));
            }

            for (const auto& item : element.sequence_items()) {
                pending.push_back({&item, level + 1});
            }
        }
    }
    return ok();
}

// =============================================================================
// Emission
// =============================================================================

void tree_walker::emit(const core::dicom_dataset& dataset, presentation_sink& sink) {
    std::vector<frame> stack;
    stack.push_back(frame{&dataset, dataset.begin(), nullptr, 0, 0});

    while (!stack.empty()) {
        auto& top = stack.back();

        if (top.is_sequence()) {
            const auto& items = top.sequence->sequence_items();
            if (top.next_item == items.size()) {
                // Closes the begin_child() issued after the sequence header
                sink.end_child();
                stack.pop_back();
                continue;
            }

            const auto index = top.next_item++;
            const auto depth = top.depth;
            emit_item(*top.sequence, index, depth + 1, sink);
            sink.begin_child();
            const auto& item = items[index];
            stack.push_back(frame{&item, item.begin(), nullptr, 0, depth + 2});
            continue;
        }

        if (top.next == top.dataset->end()) {
            stack.pop_back();
            // Every dataset below the root is an item body
            if (!stack.empty()) {
                sink.end_child();
            }
            continue;
        }

        const auto& element = top.next->second;
        ++top.next;
        const auto depth = top.depth;

        if (element.is_sequence()) {
            emit_sequence_header(element, depth, sink);
            sink.begin_child();
            stack.push_back(frame{nullptr, {}, &element, 0, depth});
        } else {
            emit_element(element, depth, sink);
        }
    }
}

void tree_walker::emit_sequence_header(const core::dicom_element& element,
                                       std::size_t depth, presentation_sink& sink) {
    record rec;
    rec.kind = record_kind::sequence;
    rec.depth = depth;
    rec.tag = element.tag();
    rec.name = resolver_(element.tag());
    rec.vr = std::string{encoding::to_string(element.vr())};
    rec.value = sequence_placeholder(element.sequence_items().size());

    ++stats_.sequences;
    append(rec, sink);
}

void tree_walker::emit_item(const core::dicom_element& sequence, std::size_t index,
                            std::size_t depth, presentation_sink& sink) {
    record rec;
    rec.kind = record_kind::item;
    rec.depth = depth;
    rec.tag = sequence.tag();
    rec.item_index = options_.item_index_base + index;

    ++stats_.items;
    append(rec, sink);
}

void tree_walker::emit_element(const core::dicom_element& element, std::size_t depth,
                               presentation_sink& sink) {
    const bool binary = is_binary(element, options_);
    if (binary && options_.omit_excluded_tags && is_excluded_tag(element.tag())) {
        ++stats_.omitted;
        return;
    }

    record rec;
    rec.depth = depth;
    rec.tag = element.tag();
    rec.name = resolver_(element.tag());
    rec.vr = std::string{encoding::to_string(element.vr())};

    if (binary) {
        rec.kind = record_kind::binary;
        rec.value = binary_placeholder(element.length());
        ++stats_.binary;
    } else if (auto text = render_text(element); text.is_ok()) {
        rec.kind = record_kind::element;
        // Escaped before truncation so the limit counts what is shown.
        rec.value = truncate_display(escape_controls(text.value()),
                                     options_.max_display_length);
        ++stats_.elements;
    } else {
        logger_adapter::debug("Cannot render {}: {}", element.tag().to_string(),
                              text.error().message);
        rec.kind = record_kind::unrenderable;
        rec.value = std::string{unrenderable_placeholder};
        ++stats_.unrenderable;
    }

    append(rec, sink);
}

void tree_walker::append(const record& rec, presentation_sink& sink) {
    ++stats_.records;
    stats_.max_depth = std::max(stats_.max_depth, rec.depth);
    sink.append(rec);
}

// =============================================================================
// Free Function
// =============================================================================

auto walk(const core::dicom_dataset& dataset, presentation_sink& sink,
          const walk_options& options, core::name_resolver resolver) -> VoidResult {
    tree_walker walker{std::move(resolver), options};
    return walker.walk(dataset, sink);
}

}  // namespace metaview::render
