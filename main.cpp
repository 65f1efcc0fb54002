#include <atomic>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

#include "application/StudySessionService.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/SessionFileStore.hpp"
#include "infrastructure/WebServer.hpp"

using namespace studytracker;

namespace {
static_assert(std::atomic<bool>::is_always_lock_free, "signal flag must be lock-free");
std::atomic<bool> g_stopRequested{false};

void HandleSignal(int) {
    g_stopRequested = true;
}
} // namespace

int main(int argc, char** argv) {
    std::string configPath = argc > 1 ? argv[1] : "settings.json";

    std::cout << "=== Study Time Tracker ===" << std::endl;
    std::cout << "[SYSTEM] Loading configuration from " << configPath << std::endl;
    infrastructure::AppConfig config = infrastructure::ConfigLoader::Load(configPath);

    auto persistence = std::make_shared<infrastructure::PersistenceService>();
    auto store = std::make_shared<infrastructure::SessionFileStore>(config.dataFile, persistence);
    std::cout << "[SYSTEM] Data file: " << store->path() << std::endl;

    std::shared_ptr<application::StudySessionService> service;
    try {
        service = std::make_shared<application::StudySessionService>(store);
    } catch (const std::exception& e) {
        std::cerr << "[SYSTEM] Refusing to start, " << store->path() << " is unreadable: " << e.what() << std::endl;
        persistence->stop();
        return 1;
    }

    infrastructure::WebServer server(service, config);
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    std::cout << "[SYSTEM] Open http://localhost:" << config.port << " in your browser. Press Ctrl+C to stop." << std::endl;
    bool ok = server.start(g_stopRequested);

    persistence->stop();

    if (!ok) {
        std::cerr << "[SYSTEM] Error starting server." << std::endl;
        return 1;
    }
    std::cout << "[SYSTEM] Shutdown complete." << std::endl;
    return 0;
}
