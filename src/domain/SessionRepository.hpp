/**
 * @file SessionRepository.hpp
 * @brief Interface for persisting the whole study session collection.
 */

#pragma once

#include <vector>
#include "StudySession.hpp"

namespace studytracker::domain {

/**
 * @class SessionRepository
 * @brief Abstract whole-collection storage. Every save replaces the previous contents.
 */
class SessionRepository {
public:
    virtual ~SessionRepository() = default;

    /** @brief Loads every stored session, in stored order. */
    virtual std::vector<StudySession> loadAll() = 0;

    /**
     * @brief Replaces the stored collection.
     * @return True if the write reached storage.
     */
    virtual bool saveAll(const std::vector<StudySession>& sessions) = 0;
};

} // namespace studytracker::domain
