#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>

#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/SessionFileStore.hpp"
#include "infrastructure/codec/SessionCodec.hpp"

using namespace studytracker::domain;
using namespace studytracker::infrastructure;

int main() {
    std::cout << "[Test] Starting SessionFileStore Test..." << std::endl;

    std::string testRoot = "test_project_root_store";
    std::filesystem::remove_all(testRoot);

    auto persistence = std::make_shared<PersistenceService>();
    SessionFileStore store(testRoot + "/data/sessions.json", persistence);

    // Constructor prepares the directory, but no file exists yet.
    assert(std::filesystem::is_directory(testRoot + "/data"));
    assert(!store.exists());
    assert(store.loadAll().empty());

    // Save / load
    std::vector<StudySession> sessions = {
        StudySession("a", "Math", 45, CalendarDate(2024, 10, 1), TimeOfDay(9, 0), std::nullopt,
                     std::string("multi\nline, \"quoted\"")),
        StudySession("b", "Physics", 60, CalendarDate(2024, 10, 2), std::nullopt, std::nullopt, std::nullopt),
    };
    assert(store.saveAll(sessions));
    assert(store.exists());

    auto text = persistence->loadText(store.path());
    assert(text && text->rfind("[\n  {", 0) == 0);

    auto loaded = store.loadAll();
    assert(loaded.size() == 2);
    assert(loaded[0].sameContent(sessions[0]));
    assert(loaded[1].sameContent(sessions[1]));

    // No temp files are left behind by the atomic write.
    size_t fileCount = 0;
    for (const auto& entry : std::filesystem::directory_iterator(testRoot + "/data")) {
        (void)entry;
        ++fileCount;
    }
    assert(fileCount == 1);

    // Blank file is an empty collection.
    assert(persistence->saveText(store.path(), "  \n"));
    assert(store.loadAll().empty());

    // One damaged record is skipped, the healthy ones survive.
    std::string damaged = "[\n  " + codec::SessionCodec::Encode(sessions[0]) +
                          ",\n  {\"id\":\"broken\",\"subject\":\"X\"},\n  " +
                          codec::SessionCodec::Encode(sessions[1]) + "\n]";
    assert(persistence->saveText(store.path(), damaged));
    loaded = store.loadAll();
    assert(loaded.size() == 2);
    assert(loaded[0].getId() == "a" && loaded[1].getId() == "b");

    // Not an array at all: structural failure propagates.
    assert(persistence->saveText(store.path(), "{\"not\":\"an array\"}"));
    bool threw = false;
    try {
        store.loadAll();
    } catch (const codec::MalformedCollection&) {
        threw = true;
    }
    assert(threw);

    // Empty list round trip.
    assert(store.saveAll({}));
    assert(*persistence->loadText(store.path()) == "[]");
    assert(store.loadAll().empty());

    assert(store.remove());
    assert(!store.exists());
    assert(!store.remove());

    // Writes after stop are refused.
    persistence->stop();
    assert(!store.saveAll(sessions));

    std::filesystem::remove_all(testRoot);
    std::cout << "[PASS] SessionFileStore Test." << std::endl;
    return 0;
}
