#include <atomic>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "domain/Errors.hpp"
#include "infrastructure/FileJobRepository.hpp"
#include "infrastructure/JobRecordCodec.hpp"
#include "infrastructure/SnapshotAggregator.hpp"

using namespace jobledger::domain;
using namespace jobledger::infrastructure;

namespace fs = std::filesystem;

template <typename E, typename F>
bool Throws(F&& f) {
    try {
        f();
    } catch (const E&) {
        return true;
    }
    return false;
}

static void WriteFile(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::trunc);
    out << content;
}

int main() {
    std::cout << "[Test] Starting Job Repository Round-Trip Test..." << std::endl;

    fs::path testRoot = "test_root_repository";
    fs::remove_all(testRoot);
    fs::create_directories(testRoot / "jobs");
    auto repo = std::make_shared<FileJobRepository>(testRoot / "jobs");

    // Create
    assert(!repo->exists("105000"));
    repo->create("105000", std::nullopt);
    assert(repo->exists("105000"));
    assert(fs::exists(repo->lockPath("105000")));
    assert(fs::file_size(repo->lockPath("105000")) == 0);
    assert(Throws<AlreadyExistsError>([&] { repo->create("105000", std::nullopt); }));
    assert(Throws<std::invalid_argument>([&] { repo->create("10500", std::nullopt); }));

    Job empty = repo->load("105000");
    assert(empty.projects().empty());
    assert(!empty.workspace());
    std::cout << "[PASS] Created empty job" << std::endl;

    // Save / load
    Job job = empty;
    job.setWorkspace(std::string("/srv/work/105000"));
    job.addProject("105000.177-43", "Turn OD per drawing", "Brandon", "01/01/2020");
    job.project("105000.177-43").addNote("Waiting on stock", "Brandon");
    repo->save("105000", job);

    Job loaded = repo->load("105000");
    assert(loaded == job);
    const Project& p = loaded.project("105000.177-43");
    assert(p.dueDate() == "01/01/2020");
    assert(p.owner() == "Brandon");
    assert(p.status() == ProjectStatus::Unassigned);
    assert(p.notes().entries()[1].text == "Waiting on stock");
    std::cout << "[PASS] Save/load round trip" << std::endl;

    // Owner typed in Latin-1
    Job latin1 = loaded;
    latin1.project("105000.177-43").setOwner("Jos\xe9");
    latin1.project("105000.177-43").addNote("Pi\xe8" "ce finie", "Jos\xe9");
    repo->save("105000", latin1);
    Job replaced = repo->load("105000");
    assert(replaced.project("105000.177-43").owner() == "Jos\xEF\xBF\xBD");
    assert(replaced.project("105000.177-43").notes().entries().back().text == "Pi\xEF\xBF\xBD" "ce finie");
    repo->save("105000", job);
    std::cout << "[PASS] Invalid UTF-8 replaced on save" << std::endl;

    // Record format
    auto record = nlohmann::json::parse(JobRecordCodec::Encode(job));
    assert(record["schema_version"] == JobRecordCodec::kSchemaVersion);
    assert(record["workspace"] == "/srv/work/105000");

    // Corrupt records
    assert(Throws<CorruptRecordError>([] { JobRecordCodec::Decode("", "105000"); }));
    assert(Throws<CorruptRecordError>([] { JobRecordCodec::Decode("{not json", "105000"); }));
    record["schema_version"] = 99;
    assert(Throws<CorruptRecordError>([&] { JobRecordCodec::Decode(record.dump(), "105000"); }));
    assert(Throws<NotFoundError>([&] { repo->load("999999"); }));
    std::cout << "[PASS] Corrupt and missing records rejected" << std::endl;

    // List and glance
    repo->create("200000", std::string("/srv/work/200000"));
    WriteFile(testRoot / "jobs" / "notes.txt", "not a job");
    auto active = repo->listActive();
    assert(active.size() == 2);
    assert(active.count("105000") && active.count("200000"));

    SnapshotAggregator aggregator(repo, testRoot / "temp", "tester");
    auto glance = aggregator.jobsAtAGlance(CalendarDate(2020, 1, 5));
    assert(glance["105000"].expired == 1);
    assert(glance["105000"].today == 0);
    assert(glance.count("200000") == 0);
    assert(aggregator.jobsAtAGlanceFor("Someone Else", CalendarDate(2020, 1, 5)).empty());
    std::cout << "[PASS] Jobs at a glance from storage" << std::endl;

    // Racing creators: one wins, the others see the job already there.
    {
        std::atomic<int> created{0};
        std::atomic<int> rejected{0};
        std::vector<std::thread> creators;
        for (int i = 0; i < 8; ++i) {
            creators.emplace_back([&] {
                try {
                    repo->create("300000", std::nullopt);
                    created++;
                } catch (const AlreadyExistsError&) {
                    rejected++;
                }
            });
        }
        for (auto& t : creators) t.join();
        assert(created == 1);
        assert(rejected == 7);
    }

    // A marker left behind with no record still blocks creation and keeps its owner.
    WriteFile(repo->lockPath("400000"), "alice");
    assert(Throws<AlreadyExistsError>([&] { repo->create("400000", std::nullopt); }));
    {
        std::ifstream marker(repo->lockPath("400000"));
        std::string owner;
        std::getline(marker, owner);
        assert(owner == "alice");
    }
    assert(repo->remove("300000") == 2);
    assert(repo->remove("400000") == 1);
    std::cout << "[PASS] Concurrent create" << std::endl;

    // Remove
    assert(repo->remove("200000") == 2);
    assert(!repo->exists("200000"));
    assert(repo->remove("200000") == 0);

    fs::remove_all(testRoot);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
