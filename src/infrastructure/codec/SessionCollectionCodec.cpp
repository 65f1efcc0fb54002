/**
 * @file SessionCollectionCodec.cpp
 * @brief Implementation of SessionCollectionCodec.
 */

#include "infrastructure/codec/SessionCollectionCodec.hpp"

#include <cctype>
#include <iostream>

#include "infrastructure/codec/SessionCodec.hpp"
#include "infrastructure/codec/SpanSplitter.hpp"

namespace studytracker::infrastructure::codec {

using domain::StudySession;

namespace {

std::string Trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    return text.substr(begin, end - begin);
}

} // namespace

std::string SessionCollectionCodec::Encode(const std::vector<StudySession>& sessions, Style style) {
    if (sessions.empty()) {
        return "[]";
    }

    std::string out;
    out.reserve(sessions.size() * 200 + 4);

    if (style == Style::Indented) {
        out += "[\n";
        for (size_t i = 0; i < sessions.size(); ++i) {
            out += "  ";
            out += SessionCodec::Encode(sessions[i]);
            if (i + 1 < sessions.size()) out += ',';
            out += '\n';
        }
        out += ']';
        return out;
    }

    out += '[';
    for (size_t i = 0; i < sessions.size(); ++i) {
        if (i > 0) out += ',';
        out += SessionCodec::Encode(sessions[i]);
    }
    out += ']';
    return out;
}

CollectionDecodeResult SessionCollectionCodec::DecodeDetailed(const std::string& text) {
    CollectionDecodeResult result;

    std::string trimmed = Trim(text);
    if (trimmed.size() < 2 || trimmed.front() != '[' || trimmed.back() != ']') {
        throw MalformedCollection("expected text enclosed in '[' and ']'");
    }

    std::string body = trimmed.substr(1, trimmed.size() - 2);
    if (Trim(body).empty()) {
        return result;
    }

    std::vector<std::string> spans = SpanSplitter::Split(body);
    result.sessions.reserve(spans.size());

    for (size_t i = 0; i < spans.size(); ++i) {
        try {
            result.sessions.push_back(SessionCodec::Decode(spans[i]));
        } catch (const MalformedRecord& e) {
            std::cerr << "[SessionCollectionCodec] Warning: Skipping session #" << i << ": " << e.what() << std::endl;
            result.skipped.push_back(SkippedSpan{i, e.what()});
        }
    }

    return result;
}

std::vector<StudySession> SessionCollectionCodec::Decode(const std::string& text) {
    return DecodeDetailed(text).sessions;
}

} // namespace studytracker::infrastructure::codec
