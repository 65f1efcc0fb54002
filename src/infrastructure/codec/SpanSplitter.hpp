/**
 * @file SpanSplitter.hpp
 * @brief Locates the top-level object literals inside an array body.
 */

#pragma once

#include <string>
#include <vector>

namespace studytracker::infrastructure::codec {

class SpanSplitter {
public:
    /**
     * @brief Returns each top-level "{...}" span of the array body, braces included, in order.
     *
     * @param arrayBody Text strictly between the outer '[' and ']'.
     *
     * Quotes, commas and braces inside string literals do not affect the split.
     * An object still open at the end of input produces no span.
     */
    static std::vector<std::string> Split(const std::string& arrayBody);
};

} // namespace studytracker::infrastructure::codec
