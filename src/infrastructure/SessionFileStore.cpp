/**
 * @file SessionFileStore.cpp
 * @brief Implementation of SessionFileStore.
 */

#include "infrastructure/SessionFileStore.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>

#include "infrastructure/codec/SessionCollectionCodec.hpp"

namespace studytracker::infrastructure {

namespace fs = std::filesystem;
using codec::SessionCollectionCodec;

SessionFileStore::SessionFileStore(std::string filePath, std::shared_ptr<PersistenceService> persistence)
    : m_filePath(std::move(filePath)), m_persistence(std::move(persistence)) {
    ensureDataDirectoryExists();
}

std::vector<domain::StudySession> SessionFileStore::loadAll() {
    auto content = m_persistence->loadText(m_filePath);
    if (!content) {
        return {};
    }

    bool blank = std::all_of(content->begin(), content->end(),
                             [](unsigned char c) { return std::isspace(c) != 0; });
    if (blank) {
        return {};
    }

    auto result = SessionCollectionCodec::DecodeDetailed(*content);
    if (!result.skipped.empty()) {
        std::cerr << "[SessionFileStore] " << result.skipped.size() << " damaged session(s) in " << m_filePath
                  << " were skipped and will be dropped on the next save." << std::endl;
    }
    return std::move(result.sessions);
}

bool SessionFileStore::saveAll(const std::vector<domain::StudySession>& sessions) {
    std::string text = SessionCollectionCodec::Encode(sessions, SessionCollectionCodec::Style::Indented);
    bool ok = m_persistence->saveText(m_filePath, text);
    if (!ok) {
        std::cerr << "[SessionFileStore] Error saving sessions to " << m_filePath << std::endl;
    }
    return ok;
}

bool SessionFileStore::exists() const {
    std::error_code ec;
    return fs::exists(m_filePath, ec);
}

bool SessionFileStore::remove() {
    std::error_code ec;
    bool removed = fs::remove(m_filePath, ec);
    if (ec) {
        std::cerr << "[SessionFileStore] Could not delete " << m_filePath << ": " << ec.message() << std::endl;
        return false;
    }
    return removed;
}

void SessionFileStore::ensureDataDirectoryExists() {
    fs::path dir = fs::path(m_filePath).parent_path();
    if (dir.empty()) return;

    std::error_code ec;
    if (!fs::exists(dir, ec)) {
        fs::create_directories(dir, ec);
        if (ec) {
            std::cerr << "[SessionFileStore] Warning: Could not create data directory " << dir << ": "
                      << ec.message() << std::endl;
        }
    }
}

} // namespace studytracker::infrastructure
