/**
 * @file StudySession.cpp
 * @brief Implementation of the StudySession entity.
 */

#include "domain/StudySession.hpp"

#include <cctype>
#include <cstdio>
#include <random>
#include <stdexcept>

namespace studytracker::domain {

namespace {

std::string Trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    return text.substr(begin, end - begin);
}

std::string RequireSubject(const std::string& value) {
    std::string trimmed = Trim(value);
    if (trimmed.empty()) {
        throw std::invalid_argument("StudySession: Subject cannot be empty.");
    }
    return trimmed;
}

int RequirePositiveDuration(int value) {
    if (value <= 0) {
        throw std::invalid_argument("StudySession: Duration must be positive.");
    }
    return value;
}

} // namespace

StudySession::StudySession(const std::string& subject, int durationMinutes, const CalendarDate& date)
    : id(GenerateId()),
      subject(RequireSubject(subject)),
      durationMinutes(RequirePositiveDuration(durationMinutes)),
      date(date) {}

StudySession::StudySession(std::string id,
                           const std::string& subject,
                           int durationMinutes,
                           const CalendarDate& date,
                           std::optional<TimeOfDay> startTime,
                           std::optional<TimeOfDay> endTime,
                           std::optional<std::string> notes)
    : id(std::move(id)),
      subject(RequireSubject(subject)),
      durationMinutes(RequirePositiveDuration(durationMinutes)),
      date(date),
      startTime(startTime),
      endTime(endTime) {
    if (this->id.empty()) {
        throw std::invalid_argument("StudySession: Id cannot be empty.");
    }
    setNotes(std::move(notes));
}

void StudySession::setSubject(const std::string& value) {
    subject = RequireSubject(value);
}

void StudySession::setDurationMinutes(int value) {
    durationMinutes = RequirePositiveDuration(value);
}

void StudySession::setDate(const CalendarDate& value) {
    date = value;
}

void StudySession::setNotes(std::optional<std::string> value) {
    if (value && value->empty()) {
        notes.reset();
        return;
    }
    notes = std::move(value);
}

bool StudySession::sameContent(const StudySession& other) const {
    return id == other.id &&
           subject == other.subject &&
           durationMinutes == other.durationMinutes &&
           date == other.date &&
           startTime == other.startTime &&
           endTime == other.endTime &&
           notes == other.notes;
}

std::string StudySession::toString() const {
    return "StudySession[id=" + id + ", subject='" + subject + "', duration=" +
           std::to_string(durationMinutes) + " min, date=" + date.toString() + "]";
}

std::string StudySession::GenerateId() {
    static thread_local std::mt19937_64 engine{std::random_device{}()};
    std::uniform_int_distribution<unsigned long long> dist;

    unsigned long long hi = dist(engine);
    unsigned long long lo = dist(engine);

    // RFC 4122 version 4, variant 10xx
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%08llx-%04llx-%04llx-%04llx-%012llx",
                  (hi >> 32) & 0xFFFFFFFFULL,
                  (hi >> 16) & 0xFFFFULL,
                  hi & 0xFFFFULL,
                  (lo >> 48) & 0xFFFFULL,
                  lo & 0xFFFFFFFFFFFFULL);
    return buf;
}

} // namespace studytracker::domain
