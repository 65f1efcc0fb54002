/**
 * @file SessionCollectionCodec.hpp
 * @brief Text codec for an ordered list of StudySessions (array of objects).
 */

#pragma once

#include <string>
#include <vector>

#include "domain/StudySession.hpp"
#include "infrastructure/codec/CodecErrors.hpp"

namespace studytracker::infrastructure::codec {

/**
 * @struct SkippedSpan
 * @brief An array element that was dropped during a tolerant decode.
 */
struct SkippedSpan {
    size_t index;       ///< Zero-based position of the element within the array.
    std::string reason; ///< MalformedRecord message.
};

/**
 * @struct CollectionDecodeResult
 * @brief Sessions that decoded, plus what was dropped on the way.
 */
struct CollectionDecodeResult {
    std::vector<domain::StudySession> sessions;
    std::vector<SkippedSpan> skipped;
};

/**
 * @class SessionCollectionCodec
 * @brief Array-level codec built from SpanSplitter and SessionCodec.
 *
 * Decoding is tolerant per element: an element that fails SessionCodec::Decode is dropped
 * and the rest are kept. A missing outer bracket pair aborts the whole decode.
 */
class SessionCollectionCodec {
public:
    enum class Style {
        Compact,  ///< "[{...},{...}]" for wire payloads.
        Indented  ///< One element per line, two-space indent, for files.
    };

    static std::string Encode(const std::vector<domain::StudySession>& sessions, Style style = Style::Compact);

    /**
     * @brief Decodes an array literal, silently dropping elements that fail to decode.
     * @throws MalformedCollection if the trimmed text is not enclosed in '[' ... ']'.
     */
    static std::vector<domain::StudySession> Decode(const std::string& text);

    /**
     * @brief Same as Decode, but also reports every dropped element.
     * @throws MalformedCollection if the trimmed text is not enclosed in '[' ... ']'.
     */
    static CollectionDecodeResult DecodeDetailed(const std::string& text);
};

} // namespace studytracker::infrastructure::codec
