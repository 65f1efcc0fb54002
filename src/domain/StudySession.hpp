/**
 * @file StudySession.hpp
 * @brief Entity representing a single study session.
 */

#pragma once

#include <optional>
#include <string>

#include "value_objects/CalendarDate.hpp"
#include "value_objects/TimeOfDay.hpp"

namespace studytracker::domain {

/**
 * @class StudySession
 * @brief One block of time spent studying a subject on a given date.
 *
 * Invariants: id is immutable, subject is trimmed and non-empty,
 * durationMinutes is strictly positive. Start/end times and notes are optional.
 * Identity is the id: two sessions compare equal when their ids match.
 */
class StudySession {
private:
    std::string id;
    std::string subject;
    int durationMinutes;
    CalendarDate date;
    std::optional<TimeOfDay> startTime;
    std::optional<TimeOfDay> endTime;
    std::optional<std::string> notes;

public:
    /**
     * @brief Creates a brand new session with a freshly generated id.
     * @throws std::invalid_argument if subject is blank or duration is not positive.
     */
    StudySession(const std::string& subject, int durationMinutes, const CalendarDate& date);

    /**
     * @brief Rebuilds a session from stored fields, keeping the given id.
     * @throws std::invalid_argument if any invariant is violated.
     */
    StudySession(std::string id,
                 const std::string& subject,
                 int durationMinutes,
                 const CalendarDate& date,
                 std::optional<TimeOfDay> startTime,
                 std::optional<TimeOfDay> endTime,
                 std::optional<std::string> notes);

    // --- Accessors ---
    const std::string& getId() const { return id; }
    const std::string& getSubject() const { return subject; }
    int getDurationMinutes() const { return durationMinutes; }
    const CalendarDate& getDate() const { return date; }
    const std::optional<TimeOfDay>& getStartTime() const { return startTime; }
    const std::optional<TimeOfDay>& getEndTime() const { return endTime; }
    const std::optional<std::string>& getNotes() const { return notes; }

    // --- Mutators (id has none) ---
    void setSubject(const std::string& value);
    void setDurationMinutes(int value);
    void setDate(const CalendarDate& value);
    void setStartTime(std::optional<TimeOfDay> value) { startTime = value; }
    void setEndTime(std::optional<TimeOfDay> value) { endTime = value; }

    // An empty string clears the notes.
    void setNotes(std::optional<std::string> value);

    /** @brief Field-by-field comparison, including the id. */
    bool sameContent(const StudySession& other) const;

    /** @brief Short human readable form for console output. */
    std::string toString() const;

    bool operator==(const StudySession& other) const { return id == other.id; }
    bool operator!=(const StudySession& other) const { return id != other.id; }

    /** @brief Generates a random version-4 UUID string. */
    static std::string GenerateId();
};

} // namespace studytracker::domain
