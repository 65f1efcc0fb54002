/**
 * @file SessionCodec.cpp
 * @brief Implementation of SessionCodec.
 */

#include "infrastructure/codec/SessionCodec.hpp"

#include <cctype>
#include <charconv>
#include <stdexcept>
#include <system_error>

#include "infrastructure/codec/TextEscaper.hpp"

namespace studytracker::infrastructure::codec {

using domain::CalendarDate;
using domain::StudySession;
using domain::TimeOfDay;
using FieldValue = SessionCodec::FieldValue;

namespace {

const char* const kNullLiteral = "null";

bool IsSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string TrimCopy(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && IsSpace(text[begin])) ++begin;
    while (end > begin && IsSpace(text[end - 1])) --end;
    return text.substr(begin, end - begin);
}

/**
 * Cursor over one object literal. Every character is visited once.
 */
class ObjectTokenizer {
public:
    explicit ObjectTokenizer(const std::string& text) : m_text(text) {}

    SessionCodec::FieldMap run() {
        SessionCodec::FieldMap fields;

        skipWhitespace();
        expect('{', "expected '{' at start of object");

        skipWhitespace();
        if (consume('}')) {
            return finish(std::move(fields));
        }

        while (true) {
            skipWhitespace();
            if (atEnd() || m_text[m_pos] != '"') {
                fail("expected a quoted field name");
            }
            std::string key = readQuoted();

            skipWhitespace();
            expect(':', "expected ':' after field \"" + key + "\"");
            skipWhitespace();

            fields.emplace(std::move(key), readValue());

            skipWhitespace();
            if (consume(',')) {
                skipWhitespace();
                if (consume('}')) break; // tolerate a trailing comma
                continue;
            }
            if (consume('}')) break;
            fail(atEnd() ? "unterminated object" : "expected ',' or '}' after value");
        }

        return finish(std::move(fields));
    }

private:
    const std::string& m_text;
    size_t m_pos = 0;

    [[noreturn]] void fail(const std::string& message) const {
        throw MalformedRecord(message + " (offset " + std::to_string(m_pos) + ")");
    }

    bool atEnd() const { return m_pos >= m_text.size(); }

    void skipWhitespace() {
        while (!atEnd() && IsSpace(m_text[m_pos])) ++m_pos;
    }

    bool consume(char c) {
        if (!atEnd() && m_text[m_pos] == c) {
            ++m_pos;
            return true;
        }
        return false;
    }

    void expect(char c, const std::string& message) {
        if (!consume(c)) fail(message);
    }

    SessionCodec::FieldMap finish(SessionCodec::FieldMap fields) {
        skipWhitespace();
        if (!atEnd()) fail("unexpected characters after object");
        return fields;
    }

    // m_pos is on the opening quote. Leaves m_pos after the closing quote.
    std::string readQuoted() {
        size_t start = m_pos + 1;
        size_t j = start;
        while (j < m_text.size()) {
            if (m_text[j] == '"') {
                size_t backslashes = 0;
                size_t k = j;
                while (k > start && m_text[k - 1] == '\\') {
                    ++backslashes;
                    --k;
                }
                if (backslashes % 2 == 0) {
                    m_pos = j + 1;
                    return TextEscaper::Unescape(m_text.substr(start, j - start));
                }
            }
            ++j;
        }
        fail("unterminated string");
    }

    FieldValue readValue() {
        if (atEnd()) fail("missing value");

        FieldValue value;
        if (m_text[m_pos] == '"') {
            value.kind = FieldValue::Kind::String;
            value.text = readQuoted();
            return value;
        }

        std::string literal = readBare();
        if (literal.empty()) fail("missing value");
        if (literal.compare(0, 4, kNullLiteral) == 0) {
            value.kind = FieldValue::Kind::Null;
            return value;
        }
        value.kind = FieldValue::Kind::Literal;
        value.text = std::move(literal);
        return value;
    }

    // Reads up to the next ',' or '}' at this object's level. Nested groups and
    // strings inside an unrecognized value are stepped over as a unit.
    std::string readBare() {
        size_t start = m_pos;
        int depth = 0;
        bool inString = false;
        bool escaped = false;

        while (!atEnd()) {
            char c = m_text[m_pos];
            if (inString) {
                if (escaped) escaped = false;
                else if (c == '\\') escaped = true;
                else if (c == '"') inString = false;
            } else if (c == '"') {
                inString = true;
            } else if (c == '{' || c == '[') {
                ++depth;
            } else if ((c == '}' || c == ']') && depth > 0) {
                --depth;
            } else if (depth == 0 && (c == ',' || c == '}')) {
                return TrimCopy(m_text.substr(start, m_pos - start));
            }
            ++m_pos;
        }
        fail("unterminated object");
    }
};

const FieldValue* Find(const SessionCodec::FieldMap& fields, const std::string& key) {
    auto it = fields.find(key);
    return it == fields.end() ? nullptr : &it->second;
}

// Required fields may be quoted or bare; null counts as missing.
std::string RequireText(const SessionCodec::FieldMap& fields, const std::string& key) {
    const FieldValue* value = Find(fields, key);
    if (!value || value->kind == FieldValue::Kind::Null) {
        throw MalformedRecord("missing required field \"" + key + "\"");
    }
    return value->text;
}

int ParseDuration(const std::string& text) {
    const char* first = text.data();
    const char* last = text.data() + text.size();
    if (first != last && *first == '+') ++first;

    int value = 0;
    auto result = std::from_chars(first, last, value);
    if (first == last || result.ec != std::errc() || result.ptr != last) {
        throw MalformedRecord("invalid durationMinutes \"" + text + "\"");
    }
    if (value <= 0) {
        throw MalformedRecord("durationMinutes must be positive, got " + text);
    }
    return value;
}

std::optional<TimeOfDay> OptionalTime(const SessionCodec::FieldMap& fields, const std::string& key) {
    const FieldValue* value = Find(fields, key);
    if (!value || value->kind == FieldValue::Kind::Null) {
        return std::nullopt;
    }
    // Unreadable times degrade to "not recorded".
    return TimeOfDay::Parse(value->text);
}

void AppendQuoted(std::string& out, const std::string& text) {
    out += '"';
    out += TextEscaper::Escape(text);
    out += '"';
}

void AppendOptionalTime(std::string& out, const std::optional<TimeOfDay>& time) {
    if (time) {
        AppendQuoted(out, time->toString());
    } else {
        out += kNullLiteral;
    }
}

} // namespace

std::string SessionCodec::Encode(const StudySession& session) {
    std::string out;
    out.reserve(192);

    out += "{\"id\":";
    AppendQuoted(out, session.getId());
    out += ",\"subject\":";
    AppendQuoted(out, session.getSubject());
    out += ",\"durationMinutes\":";
    out += std::to_string(session.getDurationMinutes());
    out += ",\"date\":";
    AppendQuoted(out, session.getDate().toString());
    out += ",\"startTime\":";
    AppendOptionalTime(out, session.getStartTime());
    out += ",\"endTime\":";
    AppendOptionalTime(out, session.getEndTime());
    out += ",\"notes\":";
    if (session.getNotes()) {
        AppendQuoted(out, *session.getNotes());
    } else {
        out += kNullLiteral;
    }
    out += '}';
    return out;
}

SessionCodec::FieldMap SessionCodec::Tokenize(const std::string& text) {
    return ObjectTokenizer(text).run();
}

StudySession SessionCodec::Decode(const std::string& text) {
    FieldMap fields = Tokenize(text);

    std::string id = RequireText(fields, "id");
    std::string subject = RequireText(fields, "subject");
    int durationMinutes = ParseDuration(RequireText(fields, "durationMinutes"));

    std::string dateText = RequireText(fields, "date");
    auto date = CalendarDate::Parse(dateText);
    if (!date) {
        throw MalformedRecord("invalid date \"" + dateText + "\"");
    }

    std::optional<std::string> notes;
    if (const FieldValue* value = Find(fields, "notes"); value && value->kind != FieldValue::Kind::Null) {
        notes = value->text;
    }

    try {
        return StudySession(std::move(id), subject, durationMinutes, *date,
                            OptionalTime(fields, "startTime"),
                            OptionalTime(fields, "endTime"),
                            std::move(notes));
    } catch (const std::invalid_argument& e) {
        throw MalformedRecord(e.what());
    }
}

} // namespace studytracker::infrastructure::codec
