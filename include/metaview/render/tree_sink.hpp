/**
 * @file tree_sink.hpp
 * @brief Sink building a node hierarchy for tree widgets
 *
 * Depth is expressed structurally: the items of a sequence are children of
 * the sequence node and the elements of an item are children of the item
 * node. Labels therefore carry no indentation.
 */

#pragma once

#include "presentation_sink.hpp"

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace metaview::render {

/**
 * @brief One node of the presentation tree
 */
struct record_node {
    std::string label;
    record rec;
    std::vector<record_node> children;
};

/**
 * @class tree_sink
 * @brief Collects records into record_node roots
 *
 * @example
 * @code
 * tree_sink sink;
 * (void)walker.walk(dataset, sink);
 * for (const auto& node : sink.roots()) {
 *     widget.add_top_level_item(node.label);
 * }
 * @endcode
 */
class tree_sink final : public presentation_sink {
public:
    tree_sink();

    tree_sink(const tree_sink&) = delete;
    auto operator=(const tree_sink&) -> tree_sink& = delete;

    void append(const record& rec) override;
    void begin_child() override;
    void end_child() override;

    [[nodiscard]] auto roots() const noexcept -> const std::vector<record_node>& {
        return roots_;
    }

    /**
     * @brief Total number of nodes in the tree
     */
    [[nodiscard]] auto node_count() const -> std::size_t;

    /**
     * @brief Print the tree with box-drawing connectors
     *
     * @code
     * (0008,1115) | Referenced Series Sequence | SQ | <sequence, 1 items>
     * └── [Item 1]
     *     └── (0020,000E) | Series Instance UID | UI | 1.2.3
     * @endcode
     */
    void render_tree(std::ostream& out) const;

    void clear();

private:
    std::vector<record_node> roots_;

    /// Child lists currently receiving records, innermost last
    std::vector<std::vector<record_node>*> open_;
};

}  // namespace metaview::render
