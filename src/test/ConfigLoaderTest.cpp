#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>

#include "infrastructure/ConfigLoader.hpp"

using namespace studytracker::infrastructure;

int main() {
    std::cout << "[Test] Starting ConfigLoader Test..." << std::endl;

    std::string testRoot = "test_project_root_config";
    std::filesystem::remove_all(testRoot);
    std::filesystem::create_directories(testRoot);
    std::string settings = testRoot + "/settings.json";

    // Missing file -> defaults
    AppConfig defaults = ConfigLoader::Load(settings);
    assert(defaults.host == "0.0.0.0");
    assert(defaults.port == 8080);
    assert(defaults.dataFile == "data/sessions.json");
    assert(defaults.webRoot == "web");

    // Partial file with one ill-typed key
    {
        std::ofstream f(settings);
        f << R"({"port": 9090, "host": 5, "data_file": "custom/store.json", "theme": "dark"})";
    }
    AppConfig partial = ConfigLoader::Load(settings);
    assert(partial.port == 9090);
    assert(partial.host == "0.0.0.0");
    assert(partial.dataFile == "custom/store.json");
    assert(partial.webRoot == "web");

    // Out of range port falls back
    {
        std::ofstream f(settings);
        f << R"({"port": 70000})";
    }
    assert(ConfigLoader::Load(settings).port == 8080);

    // Unparseable file -> defaults
    {
        std::ofstream f(settings);
        f << "{ this is not json";
    }
    assert(ConfigLoader::Load(settings).port == 8080);

    // Save keeps unrelated keys and round-trips
    {
        std::ofstream f(settings);
        f << R"({"theme": "dark"})";
    }
    AppConfig custom;
    custom.host = "127.0.0.1";
    custom.port = 8181;
    custom.dataFile = "elsewhere.json";
    custom.webRoot = "public";
    assert(ConfigLoader::Save(settings, custom));

    AppConfig reread = ConfigLoader::Load(settings);
    assert(reread.host == "127.0.0.1");
    assert(reread.port == 8181);
    assert(reread.dataFile == "elsewhere.json");
    assert(reread.webRoot == "public");

    std::ifstream in(settings);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    assert(content.find("\"theme\"") != std::string::npos);

    // Valid JSON that is not an object is replaced.
    for (const char* text : {"[1, 2]", "5", "null"}) {
        {
            std::ofstream f(settings);
            f << text;
        }
        assert(ConfigLoader::Save(settings, custom));
        assert(ConfigLoader::Load(settings).port == 8181);
    }

    std::filesystem::remove_all(testRoot);
    std::cout << "[PASS] ConfigLoader Test." << std::endl;
    return 0;
}
