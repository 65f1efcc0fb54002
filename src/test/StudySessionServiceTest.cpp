#include <cassert>
#include <cmath>
#include <climits>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <thread>
#include <vector>

#include "application/StudySessionService.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/SessionFileStore.hpp"
#include "infrastructure/codec/CodecErrors.hpp"

using namespace studytracker::domain;
using namespace studytracker::application;
using namespace studytracker::infrastructure;

static void testFormatDuration() {
    assert(StudySessionService::formatDuration(0) == "0m");
    assert(StudySessionService::formatDuration(45) == "45m");
    assert(StudySessionService::formatDuration(60) == "1h");
    assert(StudySessionService::formatDuration(120) == "2h");
    assert(StudySessionService::formatDuration(150) == "2h 30m");
}

static void testLargeDurationsDoNotOverflowTotals(const std::shared_ptr<PersistenceService>& persistence,
                                                  const std::string& testRoot) {
    auto store = std::make_shared<SessionFileStore>(testRoot + "/large.json", persistence);
    StudySessionService service(store);
    service.addSession("Marathon", 10, CalendarDate(2024, 6, 1));
    service.addSession("Marathon", INT_MAX, CalendarDate(2024, 6, 2));
    service.addSession("Sprint", INT_MAX, CalendarDate(2024, 6, 3));

    const long long expected = 10LL + 2LL * INT_MAX;
    assert(service.getTotalMinutes() == expected);
    assert(service.getTotalMinutes(CalendarDate(2024, 6, 2), CalendarDate(2024, 6, 3)) == 2LL * INT_MAX);
    assert(service.getTimeBySubject()["Marathon"] == 10LL + INT_MAX);
    assert(service.getAverageSessionMinutes() > static_cast<double>(INT_MAX) / 2.0);
    assert(StudySessionService::formatDuration(expected) ==
           std::to_string(expected / 60) + "h " + std::to_string(expected % 60) + "m");
}

static void testBrokenStoreIsNeverOverwritten(const std::shared_ptr<PersistenceService>& persistence,
                                              const std::string& testRoot) {
    const std::string brokenFile = testRoot + "/broken.json";
    const std::string original =
        "[\n  {\"id\":\"a\",\"subject\":\"Math\",\"durationMinutes\":30,\"date\":\"2024-01-01\"},\n"
        "  {\"id\":\"b\",\"subject\":\"Art\",\"durationMinutes\":20,\"date\":\"2024-01-02\"}\n";
    {
        std::ofstream f(brokenFile);
        f << original;
    }

    auto store = std::make_shared<SessionFileStore>(brokenFile, persistence);
    bool refused = false;
    try {
        StudySessionService service(store);
        service.addSession("Bio", 10, CalendarDate(2024, 1, 3));
    } catch (const codec::MalformedCollection&) {
        refused = true;
    }
    assert(refused);

    std::ifstream in(brokenFile);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    assert(content == original);
}

int main() {
    std::cout << "[Test] Starting StudySessionService Test..." << std::endl;

    testFormatDuration();

    std::string testRoot = "test_project_root_service";
    std::filesystem::remove_all(testRoot);
    std::string dataFile = testRoot + "/sessions.json";

    auto persistence = std::make_shared<PersistenceService>();
    auto store = std::make_shared<SessionFileStore>(dataFile, persistence);
    StudySessionService service(store);
    assert(service.getSessionCount() == 0);
    assert(service.getAverageSessionMinutes() == 0.0);

    // Create
    auto math = service.addSession("  Math  ", 45, CalendarDate(2024, 10, 1));
    auto physics = service.addSession("Physics", 90, CalendarDate(2024, 10, 3),
                                      TimeOfDay(18, 0), TimeOfDay(19, 30), std::string("waves"));
    auto review = service.addSession("math review", 30, CalendarDate(2024, 10, 2), std::string("  review  "));

    assert(math.getSubject() == "Math");
    assert(!math.getNotes());
    assert(review.getNotes() && *review.getNotes() == "review");
    assert(math.getId() != physics.getId());

    bool rejected = false;
    try {
        service.addSession("   ", 10, CalendarDate(2024, 1, 1));
    } catch (const std::invalid_argument&) {
        rejected = true;
    }
    assert(rejected);
    assert(service.getSessionCount() == 3);

    // Queries
    assert(service.getSessionById(physics.getId()));
    assert(!service.getSessionById("missing"));
    assert(service.getSessionsBySubject("MATH").size() == 2);
    assert(service.getSessionsByDateRange(CalendarDate(2024, 10, 2), CalendarDate(2024, 10, 3)).size() == 2);

    auto sorted = service.getSessionsSortedByDate();
    assert(sorted[0].getId() == physics.getId());
    assert(sorted[1].getId() == review.getId());
    assert(sorted[2].getId() == math.getId());

    // Statistics
    assert(service.getTotalMinutes() == 165);
    assert(service.getTotalMinutes(CalendarDate(2024, 10, 2), CalendarDate(2024, 10, 3)) == 120);
    assert(std::fabs(service.getAverageSessionMinutes() - 55.0) < 1e-9);
    auto bySubject = service.getTimeBySubject();
    assert(bySubject.size() == 3);
    assert(bySubject["Math"] == 45 && bySubject["Physics"] == 90 && bySubject["math review"] == 30);

    // Update
    SessionUpdate update;
    update.durationMinutes = 60;
    update.notes = std::string("");
    auto updated = service.updateSession(physics.getId(), update);
    assert(updated && updated->getDurationMinutes() == 60 && !updated->getNotes());
    assert(updated->getStartTime() && *updated->getStartTime() == TimeOfDay(18, 0));

    SessionUpdate invalid;
    invalid.subject = std::string("Renamed");
    invalid.durationMinutes = 0;
    rejected = false;
    try {
        service.updateSession(physics.getId(), invalid);
    } catch (const std::invalid_argument&) {
        rejected = true;
    }
    assert(rejected);
    auto unchanged = service.getSessionById(physics.getId());
    assert(unchanged->getSubject() == "Physics" && unchanged->getDurationMinutes() == 60);

    assert(!service.updateSession("missing", update));

    // Delete
    assert(service.deleteSession(math.getId()));
    assert(!service.deleteSession(math.getId()));
    assert(service.getSessionCount() == 2);

    // Reload from disk reproduces the collection.
    {
        StudySessionService reloaded(store);
        auto before = service.getAllSessions();
        auto after = reloaded.getAllSessions();
        assert(before.size() == after.size());
        for (size_t i = 0; i < before.size(); ++i) {
            assert(before[i].sameContent(after[i]));
        }
    }

    // Concurrent writers do not lose sessions.
    const int kThreads = 8;
    const int kPerThread = 10;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&service, t]() {
            for (int i = 0; i < kPerThread; ++i) {
                service.addSession("Thread " + std::to_string(t), 1 + i, CalendarDate(2024, 11, 1 + i));
            }
        });
    }
    for (auto& th : threads) th.join();
    assert(service.getSessionCount() == 2 + kThreads * kPerThread);

    StudySessionService afterConcurrency(store);
    assert(afterConcurrency.getSessionCount() == 2 + kThreads * kPerThread);

    service.clearAllSessions();
    assert(service.getSessionCount() == 0);
    assert(StudySessionService(store).getSessionCount() == 0);

    testLargeDurationsDoNotOverflowTotals(persistence, testRoot);
    testBrokenStoreIsNeverOverwritten(persistence, testRoot);

    persistence->stop();
    std::filesystem::remove_all(testRoot);
    std::cout << "[PASS] StudySessionService Test." << std::endl;
    return 0;
}
