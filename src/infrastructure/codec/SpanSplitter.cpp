/**
 * @file SpanSplitter.cpp
 * @brief Implementation of SpanSplitter.
 */

#include "infrastructure/codec/SpanSplitter.hpp"

namespace studytracker::infrastructure::codec {

std::vector<std::string> SpanSplitter::Split(const std::string& arrayBody) {
    std::vector<std::string> spans;

    int depth = 0;
    size_t start = 0;
    bool inString = false;
    bool escaped = false;

    for (size_t i = 0; i < arrayBody.size(); ++i) {
        char c = arrayBody[i];

        if (escaped) {
            escaped = false;
            continue;
        }
        if (c == '\\') {
            escaped = true;
            continue;
        }
        if (c == '"') {
            inString = !inString;
            continue;
        }
        if (inString) {
            continue;
        }

        if (c == '{') {
            if (depth == 0) {
                start = i;
            }
            ++depth;
        } else if (c == '}' && depth > 0) {
            --depth;
            if (depth == 0) {
                spans.push_back(arrayBody.substr(start, i - start + 1));
            }
        }
    }

    return spans;
}

} // namespace studytracker::infrastructure::codec
