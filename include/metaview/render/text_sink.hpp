/**
 * @file text_sink.hpp
 * @brief Line-oriented sink writing one formatted record per line
 */

#pragma once

#include "presentation_sink.hpp"

#include <cstddef>
#include <ostream>

namespace metaview::render {

/**
 * @class text_sink
 * @brief Writes records as indented "tag | name | VR | value" lines
 *
 * Nesting is expressed by the indentation carried in each record's depth,
 * so begin_child() and end_child() write nothing.
 */
class text_sink final : public presentation_sink {
public:
    explicit text_sink(std::ostream& out, std::size_t indent_width = 2);

    void append(const record& rec) override;
    void begin_child() override {}
    void end_child() override {}

    [[nodiscard]] auto lines_written() const noexcept -> std::size_t { return lines_; }

private:
    std::ostream& out_;
    std::size_t indent_width_;
    std::size_t lines_{0};
};

}  // namespace metaview::render
