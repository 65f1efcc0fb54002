/**
 * @file StudySessionService.cpp
 * @brief Implementation of StudySessionService.
 */

#include "application/StudySessionService.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <iterator>

namespace studytracker::application {

namespace {

std::string ToLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::optional<std::string> CleanNotes(const std::optional<std::string>& notes) {
    if (!notes) return std::nullopt;
    size_t begin = notes->find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return std::nullopt;
    size_t end = notes->find_last_not_of(" \t\r\n");
    return notes->substr(begin, end - begin + 1);
}

} // namespace

StudySessionService::StudySessionService(std::shared_ptr<SessionRepository> repository)
    : m_repository(std::move(repository)) {
    loadSessions();
}

StudySession StudySessionService::addSession(const std::string& subject,
                                             int durationMinutes,
                                             const CalendarDate& date,
                                             const std::optional<std::string>& notes) {
    return addSession(subject, durationMinutes, date, std::nullopt, std::nullopt, notes);
}

StudySession StudySessionService::addSession(const std::string& subject,
                                             int durationMinutes,
                                             const CalendarDate& date,
                                             std::optional<TimeOfDay> startTime,
                                             std::optional<TimeOfDay> endTime,
                                             const std::optional<std::string>& notes) {
    StudySession session(subject, durationMinutes, date);
    session.setStartTime(startTime);
    session.setEndTime(endTime);
    session.setNotes(CleanNotes(notes));

    std::lock_guard<std::mutex> lock(m_mutex);
    m_sessions.push_back(session);
    saveSessions();
    return session;
}

std::optional<StudySession> StudySessionService::updateSession(const std::string& id, const SessionUpdate& update) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = std::find_if(m_sessions.begin(), m_sessions.end(),
        [&](const StudySession& s) { return s.getId() == id; });
    if (it == m_sessions.end()) {
        return std::nullopt;
    }

    // Work on a copy so a rejected value leaves the stored session untouched.
    StudySession updated = *it;
    if (update.subject) updated.setSubject(*update.subject);
    if (update.durationMinutes) updated.setDurationMinutes(*update.durationMinutes);
    if (update.date) updated.setDate(*update.date);
    if (update.startTime) updated.setStartTime(update.startTime);
    if (update.endTime) updated.setEndTime(update.endTime);
    if (update.notes) updated.setNotes(*update.notes);

    *it = updated;
    saveSessions();
    return updated;
}

bool StudySessionService::deleteSession(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto newEnd = std::remove_if(m_sessions.begin(), m_sessions.end(),
        [&](const StudySession& s) { return s.getId() == id; });
    if (newEnd == m_sessions.end()) {
        return false;
    }
    m_sessions.erase(newEnd, m_sessions.end());
    saveSessions();
    return true;
}

void StudySessionService::clearAllSessions() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_sessions.clear();
    saveSessions();
}

std::optional<StudySession> StudySessionService::getSessionById(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = std::find_if(m_sessions.begin(), m_sessions.end(),
        [&](const StudySession& s) { return s.getId() == id; });
    if (it == m_sessions.end()) return std::nullopt;
    return *it;
}

std::vector<StudySession> StudySessionService::getAllSessions() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sessions;
}

std::vector<StudySession> StudySessionService::getSessionsByDateRange(const CalendarDate& from,
                                                                      const CalendarDate& to) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<StudySession> result;
    std::copy_if(m_sessions.begin(), m_sessions.end(), std::back_inserter(result),
        [&](const StudySession& s) { return s.getDate() >= from && s.getDate() <= to; });
    return result;
}

std::vector<StudySession> StudySessionService::getSessionsBySubject(const std::string& subject) const {
    std::string needle = ToLower(subject);
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<StudySession> result;
    std::copy_if(m_sessions.begin(), m_sessions.end(), std::back_inserter(result),
        [&](const StudySession& s) { return ToLower(s.getSubject()).find(needle) != std::string::npos; });
    return result;
}

std::vector<StudySession> StudySessionService::getSessionsSortedByDate() const {
    std::vector<StudySession> sorted = getAllSessions();
    std::stable_sort(sorted.begin(), sorted.end(),
        [](const StudySession& a, const StudySession& b) { return a.getDate() > b.getDate(); });
    return sorted;
}

long long StudySessionService::getTotalMinutes() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return sumMinutes(m_sessions);
}

long long StudySessionService::getTotalMinutes(const CalendarDate& from, const CalendarDate& to) const {
    return sumMinutes(getSessionsByDateRange(from, to));
}

std::map<std::string, long long> StudySessionService::getTimeBySubject() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::map<std::string, long long> bySubject;
    for (const auto& session : m_sessions) {
        bySubject[session.getSubject()] += session.getDurationMinutes();
    }
    return bySubject;
}

size_t StudySessionService::getSessionCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sessions.size();
}

double StudySessionService::getAverageSessionMinutes() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_sessions.empty()) {
        return 0.0;
    }
    return static_cast<double>(sumMinutes(m_sessions)) / static_cast<double>(m_sessions.size());
}

std::string StudySessionService::formatDuration(long long minutes) {
    if (minutes < 60) {
        return std::to_string(minutes) + "m";
    }
    long long hours = minutes / 60;
    long long remaining = minutes % 60;
    if (remaining == 0) {
        return std::to_string(hours) + "h";
    }
    return std::to_string(hours) + "h " + std::to_string(remaining) + "m";
}

void StudySessionService::loadSessions() {
    try {
        m_sessions = m_repository->loadAll();
        std::cout << "[StudySessionService] Loaded " << m_sessions.size() << " sessions." << std::endl;
    } catch (const std::exception& e) {
        // Starting empty would let the next save overwrite the stored sessions.
        std::cerr << "[StudySessionService] Error loading sessions: " << e.what() << std::endl;
        throw;
    }
}

// Caller holds m_mutex.
void StudySessionService::saveSessions() {
    if (!m_repository->saveAll(m_sessions)) {
        std::cerr << "[StudySessionService] Error saving sessions." << std::endl;
    }
}

long long StudySessionService::sumMinutes(const std::vector<StudySession>& sessions) const {
    long long total = 0;
    for (const auto& session : sessions) {
        total += session.getDurationMinutes();
    }
    return total;
}

} // namespace studytracker::application
