/**
 * @file tree_sink.cpp
 * @brief Implementation of the hierarchical sink
 */

#include <metaview/render/tree_sink.hpp>
#include <metaview/render/tag_formatter.hpp>

#include <metaview/integration/logger_adapter.hpp>

namespace metaview::render {

namespace {

auto count_nodes(const std::vector<record_node>& nodes) -> std::size_t {
    std::size_t count = nodes.size();
    for (const auto& node : nodes) {
        count += count_nodes(node.children);
    }
    return count;
}

void print_nodes(std::ostream& out, const std::vector<record_node>& nodes,
                 const std::string& prefix, bool top_level) {
    for (std::size_t i = 0; i < nodes.size(); ++i) {
        const bool last = i + 1 == nodes.size();
        const auto& node = nodes[i];

        if (top_level) {
            out << node.label << '\n';
            print_nodes(out, node.children, "", false);
            continue;
        }

        out << prefix << (last ? "└── " : "├── ") << node.label << '\n';
        print_nodes(out, node.children, prefix + (last ? "    " : "│   "), false);
    }
}

}  // namespace

tree_sink::tree_sink() {
    open_.push_back(&roots_);
}

void tree_sink::append(const record& rec) {
    open_.back()->push_back(record_node{format_label(rec), rec, {}});
}

void tree_sink::begin_child() {
    auto* current = open_.back();
    if (current->empty()) {
        // Nothing to attach to; keep the level so end_child() stays balanced
        integration::logger_adapter::warn("tree_sink: begin_child() without a parent record");
        open_.push_back(current);
        return;
    }
    open_.push_back(&current->back().children);
}

void tree_sink::end_child() {
    if (open_.size() > 1) {
        open_.pop_back();
    }
}

auto tree_sink::node_count() const -> std::size_t {
    return count_nodes(roots_);
}

void tree_sink::render_tree(std::ostream& out) const {
    print_nodes(out, roots_, "", true);
}

void tree_sink::clear() {
    roots_.clear();
    open_.clear();
    open_.push_back(&roots_);
}

}  // namespace metaview::render
