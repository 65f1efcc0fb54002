/**
 * @file WebServer.cpp
 * @brief Implementation of WebServer.
 */

#include "infrastructure/WebServer.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "infrastructure/codec/SessionCodec.hpp"
#include "infrastructure/codec/SessionCollectionCodec.hpp"

namespace studytracker::infrastructure {

using json = nlohmann::json;
using application::SessionUpdate;
using codec::SessionCodec;
using codec::SessionCollectionCodec;
using domain::CalendarDate;
using domain::StudySession;
using domain::TimeOfDay;

namespace {

const char* const kJsonContentType = "application/json; charset=UTF-8";

ApiResponse ErrorResponse(int status, const std::string& message) {
    return ApiResponse{status, json{{"error", message}}.dump()};
}

ApiResponse Failure(const std::string& message) {
    return ApiResponse{200, json{{"success", false}, {"error", message}}.dump()};
}

ApiResponse SessionResponse(const StudySession& session) {
    return ApiResponse{200, "{\"success\":true,\"session\":" + SessionCodec::Encode(session) + "}"};
}

json ParseBody(const std::string& body) {
    if (body.empty()) {
        return json::object();
    }
    json j = json::parse(body);
    if (!j.is_object()) {
        throw std::invalid_argument("Request body must be a JSON object");
    }
    return j;
}

// null and missing are both "not provided".
std::optional<std::string> ReadString(const json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    const json& value = j.at(key);
    if (value.is_string()) return value.get<std::string>();
    if (value.is_number()) return value.dump();
    throw std::invalid_argument(std::string("Field '") + key + "' must be a string");
}

constexpr int kIntMin = std::numeric_limits<int>::min();
constexpr int kIntMax = std::numeric_limits<int>::max();

// Browsers send numbers, form-derived clients sometimes send numeric strings.
// Values outside the int range are rejected, never narrowed.
std::optional<int> ReadInt(const json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    const json& value = j.at(key);
    if (value.is_number_unsigned()) {
        std::uint64_t n = value.get<std::uint64_t>();
        if (n <= static_cast<std::uint64_t>(kIntMax)) return static_cast<int>(n);
        throw std::invalid_argument(std::string(key) + " out of range: " + value.dump());
    }
    if (value.is_number_integer()) {
        std::int64_t n = value.get<std::int64_t>();
        if (n >= kIntMin && n <= kIntMax) return static_cast<int>(n);
        throw std::invalid_argument(std::string(key) + " out of range: " + value.dump());
    }
    if (value.is_number_float()) {
        double d = value.get<double>();
        if (std::floor(d) == d) {
            if (d >= static_cast<double>(kIntMin) && d <= static_cast<double>(kIntMax)) {
                return static_cast<int>(d);
            }
            throw std::invalid_argument(std::string(key) + " out of range: " + value.dump());
        }
    }
    if (value.is_string()) {
        const std::string text = value.get<std::string>();
        size_t consumed = 0;
        try {
            int parsed = std::stoi(text, &consumed);
            if (consumed == text.size()) return parsed;
        } catch (const std::exception&) {
            // fall through to the error below
        }
    }
    throw std::invalid_argument(std::string("Invalid ") + key + ": " + value.dump());
}

std::optional<CalendarDate> ReadDate(const json& j, const char* key) {
    auto text = ReadString(j, key);
    if (!text) return std::nullopt;
    auto date = CalendarDate::Parse(*text);
    if (!date) throw std::invalid_argument("Invalid date: " + *text);
    return date;
}

std::optional<TimeOfDay> ReadTime(const json& j, const char* key) {
    auto text = ReadString(j, key);
    if (!text || text->empty()) return std::nullopt;
    auto time = TimeOfDay::Parse(*text);
    if (!time) throw std::invalid_argument(std::string("Invalid ") + key + ": " + *text);
    return time;
}

std::optional<std::string> QueryValue(const std::map<std::string, std::string>& query, const std::string& key) {
    auto it = query.find(key);
    if (it == query.end() || it->second.empty()) return std::nullopt;
    return it->second;
}

void SetResponse(httplib::Response& res, const ApiResponse& api) {
    res.status = api.status;
    res.set_content(api.body, kJsonContentType);
}

std::map<std::string, std::string> QueryMap(const httplib::Request& req) {
    std::map<std::string, std::string> query;
    for (const auto& param : req.params) {
        query.emplace(param.first, param.second);
    }
    return query;
}

std::string QueryId(const httplib::Request& req) {
    return req.has_param("id") ? req.get_param_value("id") : std::string();
}

} // namespace

WebServer::WebServer(std::shared_ptr<application::StudySessionService> service, AppConfig config)
    : m_service(std::move(service)),
      m_config(std::move(config)),
      m_server(std::make_unique<httplib::Server>()) {
    registerRoutes();
}

WebServer::~WebServer() {
    stop();
}

bool WebServer::start() {
    std::cout << "[WebServer] Listening on http://" << m_config.host << ":" << m_config.port << std::endl;
    if (!m_server->listen(m_config.host, m_config.port)) {
        std::cerr << "[WebServer] Could not bind " << m_config.host << ":" << m_config.port << std::endl;
        return false;
    }
    return true;
}

bool WebServer::start(const std::atomic<bool>& stopRequested) {
    std::atomic<bool> finished{false};
    std::thread watcher([this, &stopRequested, &finished]() {
        bool stopped = false;
        while (!finished) {
            // stop() is a no-op until listen() is running, so keep polling until it takes.
            if (stopRequested && !stopped && m_server->is_running()) {
                stop();
                stopped = true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    });

    bool ok = start();
    finished = true;
    watcher.join();
    return ok;
}

void WebServer::stop() {
    if (m_server && m_server->is_running()) {
        m_server->stop();
        std::cout << "[WebServer] Server stopped." << std::endl;
    }
}

ApiResponse WebServer::listSessions(const std::map<std::string, std::string>& query) const {
    try {
        auto subject = QueryValue(query, "subject");
        std::vector<StudySession> sessions = subject ? m_service->getSessionsBySubject(*subject)
                                                     : m_service->getAllSessions();

        std::optional<CalendarDate> from;
        std::optional<CalendarDate> to;
        if (auto text = QueryValue(query, "from")) {
            from = CalendarDate::Parse(*text);
            if (!from) return ErrorResponse(400, "Invalid date: " + *text);
        }
        if (auto text = QueryValue(query, "to")) {
            to = CalendarDate::Parse(*text);
            if (!to) return ErrorResponse(400, "Invalid date: " + *text);
        }

        sessions.erase(std::remove_if(sessions.begin(), sessions.end(),
            [&](const StudySession& s) {
                return (from && s.getDate() < *from) || (to && s.getDate() > *to);
            }), sessions.end());

        std::stable_sort(sessions.begin(), sessions.end(),
            [](const StudySession& a, const StudySession& b) { return a.getDate() > b.getDate(); });

        return ApiResponse{200, SessionCollectionCodec::Encode(sessions)};
    } catch (const std::exception& e) {
        return ErrorResponse(400, e.what());
    }
}

ApiResponse WebServer::createSession(const std::string& body) {
    try {
        json j = ParseBody(body);

        auto subject = ReadString(j, "subject");
        auto duration = ReadInt(j, "durationMinutes");
        auto date = ReadDate(j, "date");
        if (!subject || !duration || !date) {
            return Failure("Missing required fields");
        }

        StudySession session = m_service->addSession(*subject, *duration, *date,
                                                     ReadTime(j, "startTime"),
                                                     ReadTime(j, "endTime"),
                                                     ReadString(j, "notes"));
        return SessionResponse(session);
    } catch (const json::exception& e) {
        return ErrorResponse(400, std::string("Invalid JSON: ") + e.what());
    } catch (const std::exception& e) {
        return ErrorResponse(400, e.what());
    }
}

ApiResponse WebServer::updateSession(const std::string& id, const std::string& body) {
    if (id.empty()) {
        return Failure("Missing session ID");
    }

    try {
        json j = ParseBody(body);

        SessionUpdate update;
        update.subject = ReadString(j, "subject");
        update.durationMinutes = ReadInt(j, "durationMinutes");
        update.date = ReadDate(j, "date");
        update.startTime = ReadTime(j, "startTime");
        update.endTime = ReadTime(j, "endTime");
        update.notes = ReadString(j, "notes");

        auto session = m_service->updateSession(id, update);
        if (!session) {
            return Failure("Session not found");
        }
        return SessionResponse(*session);
    } catch (const json::exception& e) {
        return ErrorResponse(400, std::string("Invalid JSON: ") + e.what());
    } catch (const std::exception& e) {
        return ErrorResponse(400, e.what());
    }
}

ApiResponse WebServer::deleteSession(const std::string& id) {
    if (id.empty()) {
        return Failure("Missing session ID");
    }
    if (!m_service->deleteSession(id)) {
        return Failure("Session not found");
    }
    return ApiResponse{200, json{{"success", true}, {"message", "Session deleted"}}.dump()};
}

ApiResponse WebServer::stats() const {
    json j = {
        {"totalMinutes", m_service->getTotalMinutes()},
        {"sessionCount", m_service->getSessionCount()},
        {"averageMinutes", m_service->getAverageSessionMinutes()},
        {"bySubject", m_service->getTimeBySubject()}
    };
    return ApiResponse{200, j.dump()};
}

void WebServer::registerRoutes() {
    m_server->set_post_routing_handler([](const httplib::Request& req, httplib::Response& res) {
        if (req.path.rfind("/api/", 0) == 0) {
            res.set_header("Access-Control-Allow-Origin", "*");
            res.set_header("Access-Control-Allow-Methods", "GET, POST, PUT, DELETE, OPTIONS");
            res.set_header("Access-Control-Allow-Headers", "Content-Type");
        }
    });

    m_server->Options(R"(/api/.*)", [](const httplib::Request&, httplib::Response& res) {
        res.status = 204;
    });

    m_server->Get("/api/sessions", [this](const httplib::Request& req, httplib::Response& res) {
        SetResponse(res, listSessions(QueryMap(req)));
    });
    m_server->Post("/api/sessions", [this](const httplib::Request& req, httplib::Response& res) {
        SetResponse(res, createSession(req.body));
    });
    m_server->Put("/api/sessions", [this](const httplib::Request& req, httplib::Response& res) {
        SetResponse(res, updateSession(QueryId(req), req.body));
    });
    m_server->Delete("/api/sessions", [this](const httplib::Request& req, httplib::Response& res) {
        SetResponse(res, deleteSession(QueryId(req)));
    });
    m_server->Get("/api/stats", [this](const httplib::Request&, httplib::Response& res) {
        SetResponse(res, stats());
    });

    std::error_code ec;
    if (std::filesystem::is_directory(m_config.webRoot, ec)) {
        if (!m_server->set_mount_point("/", m_config.webRoot)) {
            std::cerr << "[WebServer] Could not mount web root " << m_config.webRoot << std::endl;
        }
    } else {
        std::cerr << "[WebServer] Web root " << m_config.webRoot << " not found, serving API only." << std::endl;
    }
}

} // namespace studytracker::infrastructure
