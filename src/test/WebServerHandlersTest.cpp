#include <atomic>
#include <cassert>
#include <filesystem>
#include <iostream>
#include <nlohmann/json.hpp>

#include "application/StudySessionService.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/SessionFileStore.hpp"
#include "infrastructure/WebServer.hpp"
#include "infrastructure/codec/SessionCollectionCodec.hpp"

using json = nlohmann::json;
using namespace studytracker::application;
using namespace studytracker::infrastructure;

int main() {
    std::cout << "[Test] Starting WebServer Handlers Test..." << std::endl;

    std::string testRoot = "test_project_root_web";
    std::filesystem::remove_all(testRoot);

    auto persistence = std::make_shared<PersistenceService>();
    auto store = std::make_shared<SessionFileStore>(testRoot + "/sessions.json", persistence);
    auto service = std::make_shared<StudySessionService>(store);

    AppConfig config;
    config.webRoot = testRoot + "/no_web_root";
    WebServer server(service, config);

    // Create
    auto created = server.createSession(
        R"({"subject":"Chemistry","durationMinutes":50,"date":"2024-05-01","startTime":"10:00","notes":"a, \"b\"\nc"})");
    assert(created.status == 200);
    json body = json::parse(created.body);
    assert(body["success"] == true);
    assert(body["session"]["subject"] == "Chemistry");
    assert(body["session"]["startTime"] == "10:00:00");
    assert(body["session"]["endTime"].is_null());
    assert(body["session"]["notes"] == "a, \"b\"\nc");
    std::string chemId = body["session"]["id"];

    auto second = server.createSession(R"({"subject":"Biology","durationMinutes":"25","date":"2024-05-03"})");
    assert(json::parse(second.body)["success"] == true);

    // Rejected input
    auto missing = server.createSession(R"({"subject":"Biology","durationMinutes":25})");
    assert(missing.status == 200 && json::parse(missing.body)["success"] == false);
    assert(server.createSession(R"({"subject":"X","durationMinutes":25,"date":"2024-13-01"})").status == 400);
    assert(server.createSession(R"({"subject":"X","durationMinutes":0,"date":"2024-01-01"})").status == 400);
    assert(server.createSession(R"({"subject":"X","durationMinutes":"ten","date":"2024-01-01"})").status == 400);
    assert(server.createSession("not json").status == 400);
    assert(server.createSession("[1,2]").status == 400);

    // Durations beyond the int range are rejected instead of wrapped or truncated.
    assert(server.createSession(R"({"subject":"X","durationMinutes":1e20,"date":"2024-01-01"})").status == 400);
    assert(server.createSession(R"({"subject":"X","durationMinutes":4294967326,"date":"2024-01-01"})").status == 400);
    assert(server.createSession(R"({"subject":"X","durationMinutes":-4294967266,"date":"2024-01-01"})").status == 400);
    assert(server.createSession(R"({"subject":"X","durationMinutes":"4294967326","date":"2024-01-01"})").status == 400);
    assert(service->getSessionCount() == 2);

    // List: wire payload is the collection encoding, newest first.
    auto list = server.listSessions({});
    assert(list.status == 200);
    auto sessions = codec::SessionCollectionCodec::Decode(list.body);
    assert(sessions.size() == 2);
    assert(sessions[0].getSubject() == "Biology");
    assert(sessions[1].getId() == chemId);

    assert(codec::SessionCollectionCodec::Decode(server.listSessions({{"subject", "chem"}}).body).size() == 1);
    assert(codec::SessionCollectionCodec::Decode(
        server.listSessions({{"from", "2024-05-02"}, {"to", "2024-05-31"}}).body).size() == 1);
    assert(server.listSessions({{"from", "May"}}).status == 400);

    // Update
    auto updated = server.updateSession(chemId, R"({"durationMinutes":75,"notes":null})");
    body = json::parse(updated.body);
    assert(body["success"] == true);
    assert(body["session"]["durationMinutes"] == 75);
    assert(body["session"]["notes"] == "a, \"b\"\nc");

    assert(json::parse(server.updateSession("", "{}").body)["error"] == "Missing session ID");
    assert(json::parse(server.updateSession("nope", "{}").body)["error"] == "Session not found");
    assert(server.updateSession(chemId, R"({"subject":"  "})").status == 400);
    assert(server.updateSession(chemId, R"({"durationMinutes":4294967326})").status == 400);
    assert(service->getSessionById(chemId)->getDurationMinutes() == 75);

    // Stats
    json stats = json::parse(server.stats().body);
    assert(stats["totalMinutes"] == 100);
    assert(stats["sessionCount"] == 2);
    assert(stats["averageMinutes"] == 50.0);
    assert(stats["bySubject"]["Chemistry"] == 75);
    assert(stats["bySubject"]["Biology"] == 25);

    // Delete
    assert(json::parse(server.deleteSession(chemId).body)["success"] == true);
    assert(json::parse(server.deleteSession(chemId).body)["success"] == false);
    assert(json::parse(server.deleteSession("").body)["error"] == "Missing session ID");
    assert(service->getSessionCount() == 1);

    // A stop flag raised before listening still shuts the server down.
    {
        AppConfig loopback;
        loopback.host = "127.0.0.1";
        loopback.port = 0;
        loopback.webRoot = config.webRoot;
        WebServer flagged(service, loopback);
        std::atomic<bool> stopRequested{true};
        assert(flagged.start(stopRequested));
    }

    persistence->stop();
    std::filesystem::remove_all(testRoot);
    std::cout << "[PASS] WebServer Handlers Test." << std::endl;
    return 0;
}
