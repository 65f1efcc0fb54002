/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace studytracker::infrastructure {

namespace {

template <typename T>
void ReadKey(const nlohmann::json& j, const char* key, T& target) {
    if (!j.contains(key)) return;
    try {
        target = j.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[ConfigLoader] Ignoring '" << key << "': " << e.what() << std::endl;
    }
}

} // namespace

AppConfig ConfigLoader::Load(const std::string& configPath) {
    AppConfig config;
    if (!std::filesystem::exists(configPath)) {
        return config;
    }

    try {
        std::ifstream f(configPath);
        nlohmann::json j;
        f >> j;

        if (!j.is_object()) {
            std::cerr << "[ConfigLoader] " << configPath << " is not a JSON object, using defaults." << std::endl;
            return config;
        }

        ReadKey(j, "host", config.host);
        ReadKey(j, "port", config.port);
        ReadKey(j, "data_file", config.dataFile);
        ReadKey(j, "web_root", config.webRoot);

        bool useXdg = false;
        ReadKey(j, "use_xdg_data_home", useXdg);
        if (useXdg) {
            config.dataFile = PathUtils::GetDefaultSessionsFile().string();
        }

        if (config.port <= 0 || config.port > 65535) {
            std::cerr << "[ConfigLoader] Invalid port " << config.port << ", using 8080." << std::endl;
            config.port = 8080;
        }
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << configPath << ": " << e.what() << std::endl;
    }

    return config;
}

bool ConfigLoader::Save(const std::string& configPath, const AppConfig& config) {
    nlohmann::json j;

    // Try to load existing to preserve other settings
    if (std::filesystem::exists(configPath)) {
        try {
            std::ifstream f(configPath);
            f >> j;
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Overwriting unreadable " << configPath << ": " << e.what() << std::endl;
            j = nlohmann::json::object();
        }
    }
    if (!j.is_object()) {
        j = nlohmann::json::object();
    }

    j["host"] = config.host;
    j["port"] = config.port;
    j["data_file"] = config.dataFile;
    j["web_root"] = config.webRoot;

    std::ofstream f(configPath);
    if (!f) {
        std::cerr << "[ConfigLoader] Error writing " << configPath << std::endl;
        return false;
    }
    f << j.dump(4);
    return static_cast<bool>(f);
}

} // namespace studytracker::infrastructure
