/**
 * @file TextEscaper.cpp
 * @brief Implementation of TextEscaper.
 */

#include "infrastructure/codec/TextEscaper.hpp"

#include <cstdio>

namespace studytracker::infrastructure::codec {

namespace {

int HexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Reads four hex digits at pos. Returns -1 if they are not all present and valid.
long ReadHex4(const std::string& text, size_t pos) {
    if (pos + 4 > text.size()) return -1;
    long value = 0;
    for (size_t i = pos; i < pos + 4; ++i) {
        int digit = HexValue(text[i]);
        if (digit < 0) return -1;
        value = (value << 4) | digit;
    }
    return value;
}

void AppendUtf8(std::string& out, unsigned long codePoint) {
    if (codePoint < 0x80) {
        out += static_cast<char>(codePoint);
    } else if (codePoint < 0x800) {
        out += static_cast<char>(0xC0 | (codePoint >> 6));
        out += static_cast<char>(0x80 | (codePoint & 0x3F));
    } else if (codePoint < 0x10000) {
        out += static_cast<char>(0xE0 | (codePoint >> 12));
        out += static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codePoint & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (codePoint >> 18));
        out += static_cast<char>(0x80 | ((codePoint >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codePoint & 0x3F));
    }
}

constexpr unsigned long kReplacementChar = 0xFFFD;

} // namespace

std::string TextEscaper::Escape(const std::string& text) {
    std::string out;
    out.reserve(text.size() + text.size() / 8 + 2);

    for (char c : text) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    return out;
}

std::string TextEscaper::Unescape(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        char c = text[i];
        if (c != '\\') {
            out += c;
            ++i;
            continue;
        }

        if (i + 1 >= text.size()) {
            out += '\\';
            break;
        }

        char next = text[i + 1];
        switch (next) {
            case '"':  out += '"';  i += 2; break;
            case '\\': out += '\\'; i += 2; break;
            case '/':  out += '/';  i += 2; break;
            case 'n':  out += '\n'; i += 2; break;
            case 'r':  out += '\r'; i += 2; break;
            case 't':  out += '\t'; i += 2; break;
            case 'b':  out += '\b'; i += 2; break;
            case 'f':  out += '\f'; i += 2; break;
            case 'u': {
                long unit = ReadHex4(text, i + 2);
                if (unit < 0) {
                    out += "\\u";
                    i += 2;
                    break;
                }
                i += 6;

                unsigned long codePoint = static_cast<unsigned long>(unit);
                if (unit >= 0xD800 && unit <= 0xDBFF) {
                    long low = -1;
                    if (i + 1 < text.size() && text[i] == '\\' && text[i + 1] == 'u') {
                        low = ReadHex4(text, i + 2);
                    }
                    if (low >= 0xDC00 && low <= 0xDFFF) {
                        codePoint = 0x10000 + ((static_cast<unsigned long>(unit) - 0xD800) << 10) +
                                    (static_cast<unsigned long>(low) - 0xDC00);
                        i += 6;
                    } else {
                        codePoint = kReplacementChar;
                    }
                } else if (unit >= 0xDC00 && unit <= 0xDFFF) {
                    codePoint = kReplacementChar;
                }
                AppendUtf8(out, codePoint);
                break;
            }
            default:
                out += '\\';
                out += next;
                i += 2;
        }
    }
    return out;
}

} // namespace studytracker::infrastructure::codec
