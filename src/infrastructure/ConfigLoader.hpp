/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading application configuration (settings.json).
 *
 * Provides a unified way to access server and storage settings
 * without scattering JSON parsing logic throughout the codebase.
 */

#pragma once

#include <string>

namespace studytracker::infrastructure {

/**
 * @struct AppConfig
 * @brief Effective settings; every field has a usable default.
 */
struct AppConfig {
    std::string host = "0.0.0.0";
    int port = 8080;
    std::string dataFile = "data/sessions.json";
    std::string webRoot = "web";
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings.json at @p configPath.
     *
     * Recognized keys: "host", "port", "data_file", "web_root", "use_xdg_data_home".
     * A missing file yields the defaults. A key with the wrong type is logged and ignored.
     */
    static AppConfig Load(const std::string& configPath);

    /**
     * @brief Writes @p config to @p configPath, preserving unrelated keys if possible.
     * @return True on success.
     */
    static bool Save(const std::string& configPath, const AppConfig& config);
};

} // namespace studytracker::infrastructure
