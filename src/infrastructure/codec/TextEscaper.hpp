/**
 * @file TextEscaper.hpp
 * @brief Escaping of arbitrary text for use inside a double-quoted literal.
 */

#pragma once

#include <string>

namespace studytracker::infrastructure::codec {

/**
 * @class TextEscaper
 * @brief Bidirectional, lossless string literal escaping.
 *
 * Guarantees Unescape(Escape(x)) == x for every x.
 */
class TextEscaper {
public:
    /**
     * @brief Escapes backslash, double-quote, \n, \r, \t (in that order of precedence)
     *        and emits any other control character as \u00XX.
     */
    static std::string Escape(const std::string& text);

    /**
     * @brief Inverse of Escape, in a single left-to-right pass.
     *
     * Also accepts \/, \b, \f and \uXXXX (surrogate pairs are combined and written as UTF-8).
     * Unknown sequences and a trailing lone backslash are copied verbatim.
     */
    static std::string Unescape(const std::string& text);
};

} // namespace studytracker::infrastructure::codec
