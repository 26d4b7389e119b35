/**
 * @file presentation_sink.hpp
 * @brief Output capability consumed by the tree walker
 *
 * The walker knows nothing about streams or widgets. It appends records in
 * walk order and brackets the children of a sequence, and of every item,
 * with begin_child() / end_child().
 */

#pragma once

#include "record.hpp"

namespace metaview::render {

/**
 * @brief Append-only, ordered receiver of presentation records
 *
 * Calls arrive as:
 * @code
 * append(sequence header)
 * begin_child()
 *   append([Item 1])
 *   begin_child()
 *     append(...)            // records of item 1
 *   end_child()
 *   ...
 * end_child()
 * @endcode
 */
class presentation_sink {
public:
    virtual ~presentation_sink() = default;

    virtual void append(const record& rec) = 0;

    /// The following records belong to the most recently appended record
    virtual void begin_child() = 0;

    /// Close the innermost begin_child()
    virtual void end_child() = 0;
};

}  // namespace metaview::render
