/**
 * @file WebServer.hpp
 * @brief HTTP front door: REST-like session API plus static file serving.
 */

#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <string>

#include "application/StudySessionService.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace httplib {
class Server;
}

namespace studytracker::infrastructure {

/**
 * @struct ApiResponse
 * @brief Status code and JSON body produced by an API handler.
 */
struct ApiResponse {
    int status = 200;
    std::string body;
};

/**
 * @class WebServer
 * @brief Routes /api/sessions and /api/stats to the StudySessionService.
 *
 * Routes:
 *  - GET    /api/sessions[?subject=&from=&to=]  session array, newest first
 *  - POST   /api/sessions                       create from JSON body
 *  - PUT    /api/sessions?id=...                partial update from JSON body
 *  - DELETE /api/sessions?id=...
 *  - GET    /api/stats
 *  - anything else is served from the configured web root.
 */
class WebServer {
public:
    WebServer(std::shared_ptr<application::StudySessionService> service, AppConfig config);
    ~WebServer();

    WebServer(const WebServer&) = delete;
    WebServer& operator=(const WebServer&) = delete;

    /**
     * @brief Binds and serves until stop() is called.
     * @return False if the socket could not be bound.
     */
    bool start();

    /**
     * @brief Like start(), and stops the server once stopRequested becomes true.
     *
     * The flag is polled from a helper thread, so it may be set from a signal handler.
     */
    bool start(const std::atomic<bool>& stopRequested);

    void stop();

    // --- Handlers (transport independent) ---
    ApiResponse listSessions(const std::map<std::string, std::string>& query) const;
    ApiResponse createSession(const std::string& body);
    ApiResponse updateSession(const std::string& id, const std::string& body);
    ApiResponse deleteSession(const std::string& id);
    ApiResponse stats() const;

private:
    std::shared_ptr<application::StudySessionService> m_service;
    AppConfig m_config;
    std::unique_ptr<httplib::Server> m_server;

    void registerRoutes();
};

} // namespace studytracker::infrastructure
