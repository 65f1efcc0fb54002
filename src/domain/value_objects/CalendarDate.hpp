/**
 * @file CalendarDate.hpp
 * @brief Value Object for a Gregorian calendar date (no time zone).
 */

#pragma once

#include <cstdio>
#include <optional>
#include <stdexcept>
#include <string>

namespace studytracker::domain {

/**
 * @class CalendarDate
 * @brief A year-month-day triple.
 *
 * Invariant: always a valid Gregorian date with a four-digit year.
 * Textual form is ISO-8601 "YYYY-MM-DD".
 */
class CalendarDate {
public:
    CalendarDate(int year, int month, int day)
        : m_year(year), m_month(month), m_day(day) {
        if (!IsValid(year, month, day)) {
            throw std::invalid_argument("CalendarDate: Invalid date " + std::to_string(year) + "-" +
                                        std::to_string(month) + "-" + std::to_string(day) + ".");
        }
    }

    int year() const { return m_year; }
    int month() const { return m_month; }
    int day() const { return m_day; }

    /**
     * @brief Parses strict "YYYY-MM-DD" text.
     * @return The date, or nullopt if the text is not exactly that shape or not a real date.
     */
    static std::optional<CalendarDate> Parse(const std::string& text) {
        if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
            return std::nullopt;
        }
        int year = 0;
        int month = 0;
        int day = 0;
        if (!ReadDigits(text, 0, 4, year) || !ReadDigits(text, 5, 2, month) || !ReadDigits(text, 8, 2, day)) {
            return std::nullopt;
        }
        if (!IsValid(year, month, day)) {
            return std::nullopt;
        }
        return CalendarDate(year, month, day);
    }

    std::string toString() const {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", m_year, m_month, m_day);
        return buf;
    }

    static bool IsLeapYear(int year) {
        return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    }

    static int DaysInMonth(int year, int month) {
        static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        if (month == 2 && IsLeapYear(year)) return 29;
        return kDays[month - 1];
    }

    static bool IsValid(int year, int month, int day) {
        if (year < 1 || year > 9999) return false;
        if (month < 1 || month > 12) return false;
        return day >= 1 && day <= DaysInMonth(year, month);
    }

    bool operator==(const CalendarDate& other) const {
        return m_year == other.m_year && m_month == other.m_month && m_day == other.m_day;
    }
    bool operator!=(const CalendarDate& other) const { return !(*this == other); }

    bool operator<(const CalendarDate& other) const {
        if (m_year != other.m_year) return m_year < other.m_year;
        if (m_month != other.m_month) return m_month < other.m_month;
        return m_day < other.m_day;
    }
    bool operator>(const CalendarDate& other) const { return other < *this; }
    bool operator<=(const CalendarDate& other) const { return !(other < *this); }
    bool operator>=(const CalendarDate& other) const { return !(*this < other); }

private:
    int m_year;
    int m_month;
    int m_day;

    static bool ReadDigits(const std::string& text, size_t pos, size_t count, int& out) {
        int value = 0;
        for (size_t i = pos; i < pos + count; ++i) {
            char c = text[i];
            if (c < '0' || c > '9') return false;
            value = value * 10 + (c - '0');
        }
        out = value;
        return true;
    }
};

} // namespace studytracker::domain
