// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace studytracker::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();

    // <data home>/StudyTracker/sessions.json; the directory is created if missing.
    static std::filesystem::path GetDefaultSessionsFile();
};

} // namespace studytracker::infrastructure
