/**
 * @file SessionFileStore.hpp
 * @brief File-backed SessionRepository storing the whole collection as one array file.
 */

#pragma once

#include <memory>
#include <string>
#include "domain/SessionRepository.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace studytracker::infrastructure {

/**
 * @class SessionFileStore
 * @brief Reads and rewrites the complete sessions file on every call.
 *
 * The file holds an indented array literal (see codec::SessionCollectionCodec).
 * Writes go through the shared PersistenceService, so they are atomic and serialized.
 */
class SessionFileStore : public domain::SessionRepository {
public:
    /**
     * @param filePath Path of the sessions file (e.g. "data/sessions.json").
     * @param persistence Shared single-writer I/O service.
     */
    SessionFileStore(std::string filePath, std::shared_ptr<PersistenceService> persistence);

    /**
     * @brief Loads all sessions. A missing or blank file is an empty collection.
     * @throws codec::MalformedCollection if the file is not an array literal.
     * @throws std::runtime_error if the file exists but cannot be read.
     */
    std::vector<domain::StudySession> loadAll() override;

    /** @brief Rewrites the whole file. @see domain::SessionRepository::saveAll */
    bool saveAll(const std::vector<domain::StudySession>& sessions) override;

    bool exists() const;

    /** @brief Deletes the file if present. @return True if a file was removed. */
    bool remove();

    const std::string& path() const { return m_filePath; }

private:
    std::string m_filePath;
    std::shared_ptr<PersistenceService> m_persistence;

    void ensureDataDirectoryExists();
};

} // namespace studytracker::infrastructure
