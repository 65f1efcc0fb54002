/**
 * @file SessionCodec.hpp
 * @brief Text codec for a single StudySession object literal.
 */

#pragma once

#include <map>
#include <string>

#include "domain/StudySession.hpp"
#include "infrastructure/codec/CodecErrors.hpp"

namespace studytracker::infrastructure::codec {

/**
 * @class SessionCodec
 * @brief Encodes a session as a flat JSON-like object and decodes it back.
 *
 * Output field order is fixed: id, subject, durationMinutes, date, startTime, endTime, notes.
 * Absent optionals are written as null. Decoding ignores field order and unknown keys.
 */
class SessionCodec {
public:
    /**
     * @struct FieldValue
     * @brief One classified value from an object literal.
     */
    struct FieldValue {
        enum class Kind { Null, String, Literal };
        Kind kind = Kind::Null;
        std::string text; ///< Unescaped string contents, or the trimmed bare literal.
    };

    /// Field name -> value. The first occurrence of a duplicated key is kept.
    using FieldMap = std::map<std::string, FieldValue>;

    static std::string Encode(const domain::StudySession& session);

    /**
     * @brief Decodes one object literal.
     * @throws MalformedRecord if the structure is broken or a required field is missing or invalid.
     */
    static domain::StudySession Decode(const std::string& text);

    /**
     * @brief Splits one flat object literal into classified key/value pairs in a single pass.
     * @throws MalformedRecord on broken structure (missing braces, unterminated string, missing colon).
     */
    static FieldMap Tokenize(const std::string& text);
};

} // namespace studytracker::infrastructure::codec
