/**
 * @file StudySessionService.hpp
 * @brief Application Service for recording study sessions and computing statistics.
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "domain/SessionRepository.hpp"
#include "domain/StudySession.hpp"

namespace studytracker::application {

using namespace studytracker::domain;

/**
 * @struct SessionUpdate
 * @brief Partial update; only engaged fields are applied.
 */
struct SessionUpdate {
    std::optional<std::string> subject;
    std::optional<int> durationMinutes;
    std::optional<CalendarDate> date;
    std::optional<TimeOfDay> startTime;
    std::optional<TimeOfDay> endTime;
    std::optional<std::string> notes; ///< An empty string clears the notes.
};

/**
 * @class StudySessionService
 * @brief Owns the in-memory session list and persists it after every mutation.
 *
 * Thread-safe: every call holds the service mutex for its whole load/mutate/save cycle.
 */
class StudySessionService {
public:
    /**
     * @brief Loads existing sessions from the repository.
     * @throws std::exception from the repository if the stored sessions cannot be read.
     */
    explicit StudySessionService(std::shared_ptr<SessionRepository> repository);

    // --- Commands ---

    /**
     * @brief Records a new session.
     * @throws std::invalid_argument if subject or duration are invalid.
     */
    StudySession addSession(const std::string& subject,
                            int durationMinutes,
                            const CalendarDate& date,
                            const std::optional<std::string>& notes = std::nullopt);

    StudySession addSession(const std::string& subject,
                            int durationMinutes,
                            const CalendarDate& date,
                            std::optional<TimeOfDay> startTime,
                            std::optional<TimeOfDay> endTime,
                            const std::optional<std::string>& notes);

    /**
     * @brief Applies a partial update. Either every field is applied or none.
     * @return The updated session, or nullopt if the id is unknown.
     * @throws std::invalid_argument if a new value violates an invariant.
     */
    std::optional<StudySession> updateSession(const std::string& id, const SessionUpdate& update);

    /** @return True if a session was removed. */
    bool deleteSession(const std::string& id);

    void clearAllSessions();

    // --- Queries ---
    std::optional<StudySession> getSessionById(const std::string& id) const;
    std::vector<StudySession> getAllSessions() const;

    // Inclusive on both ends.
    std::vector<StudySession> getSessionsByDateRange(const CalendarDate& from, const CalendarDate& to) const;

    // Case-insensitive substring match.
    std::vector<StudySession> getSessionsBySubject(const std::string& subject) const;

    // Newest first; sessions on the same date keep their insertion order.
    std::vector<StudySession> getSessionsSortedByDate() const;

    // --- Statistics ---
    long long getTotalMinutes() const;
    long long getTotalMinutes(const CalendarDate& from, const CalendarDate& to) const;
    std::map<std::string, long long> getTimeBySubject() const;
    size_t getSessionCount() const;
    double getAverageSessionMinutes() const;

    /** @brief "45m", "2h" or "2h 30m". */
    static std::string formatDuration(long long minutes);

private:
    std::shared_ptr<SessionRepository> m_repository;
    std::vector<StudySession> m_sessions;
    mutable std::mutex m_mutex;

    void loadSessions();
    void saveSessions();
    long long sumMinutes(const std::vector<StudySession>& sessions) const;
};

} // namespace studytracker::application
