/**
 * @file text_sink.cpp
 * @brief Implementation of the line-oriented sink
 */

#include <metaview/render/text_sink.hpp>
#include <metaview/render/tag_formatter.hpp>

namespace metaview::render {

text_sink::text_sink(std::ostream& out, std::size_t indent_width)
    : out_{out}, indent_width_{indent_width} {}

void text_sink::append(const record& rec) {
    out_ << format_record(rec, indent_width_) << '\n';
    ++lines_;
}

}  // namespace metaview::render
