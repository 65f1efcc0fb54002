/**
 * @file CodecErrors.hpp
 * @brief Exceptions raised by the session text codecs.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace studytracker::infrastructure::codec {

/**
 * @class MalformedRecord
 * @brief One object literal could not be turned into a valid StudySession.
 */
class MalformedRecord : public std::runtime_error {
public:
    explicit MalformedRecord(const std::string& what)
        : std::runtime_error("Malformed record: " + what) {}
};

/**
 * @class MalformedCollection
 * @brief The outer array structure is missing; no partial result is produced.
 */
class MalformedCollection : public std::runtime_error {
public:
    explicit MalformedCollection(const std::string& what)
        : std::runtime_error("Malformed collection: " + what) {}
};

} // namespace studytracker::infrastructure::codec
