/**
 * @file TimeOfDay.hpp
 * @brief Value Object for a wall-clock time without date.
 */

#pragma once

#include <cstdio>
#include <optional>
#include <stdexcept>
#include <string>

namespace studytracker::domain {

/**
 * @class TimeOfDay
 * @brief Hour, minute and second of a day.
 *
 * Parses "HH:MM" or "HH:MM:SS"; always formats as "HH:MM:SS".
 */
class TimeOfDay {
public:
    TimeOfDay(int hour, int minute, int second = 0)
        : m_hour(hour), m_minute(minute), m_second(second) {
        if (!IsValid(hour, minute, second)) {
            throw std::invalid_argument("TimeOfDay: Invalid time.");
        }
    }

    int hour() const { return m_hour; }
    int minute() const { return m_minute; }
    int second() const { return m_second; }

    static std::optional<TimeOfDay> Parse(const std::string& text) {
        if (text.size() != 5 && text.size() != 8) return std::nullopt;
        if (text[2] != ':') return std::nullopt;

        int hour = 0;
        int minute = 0;
        int second = 0;
        if (!ReadPair(text, 0, hour) || !ReadPair(text, 3, minute)) return std::nullopt;
        if (text.size() == 8) {
            if (text[5] != ':' || !ReadPair(text, 6, second)) return std::nullopt;
        }
        if (!IsValid(hour, minute, second)) return std::nullopt;
        return TimeOfDay(hour, minute, second);
    }

    std::string toString() const {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d", m_hour, m_minute, m_second);
        return buf;
    }

    static bool IsValid(int hour, int minute, int second) {
        return hour >= 0 && hour <= 23 && minute >= 0 && minute <= 59 && second >= 0 && second <= 59;
    }

    bool operator==(const TimeOfDay& other) const {
        return m_hour == other.m_hour && m_minute == other.m_minute && m_second == other.m_second;
    }
    bool operator!=(const TimeOfDay& other) const { return !(*this == other); }

private:
    int m_hour;
    int m_minute;
    int m_second;

    static bool ReadPair(const std::string& text, size_t pos, int& out) {
        char a = text[pos];
        char b = text[pos + 1];
        if (a < '0' || a > '9' || b < '0' || b > '9') return false;
        out = (a - '0') * 10 + (b - '0');
        return true;
    }
};

} // namespace studytracker::domain
