#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

#include "domain/Errors.hpp"
#include "infrastructure/FileJobRepository.hpp"
#include "infrastructure/SnapshotAggregator.hpp"

using namespace jobledger::domain;
using namespace jobledger::infrastructure;

namespace fs = std::filesystem;

static void Touch(const fs::path& path) {
    std::ofstream out(path, std::ios::trunc);
}

int main() {
    std::cout << "[Test] Starting Snapshot Aggregator Test..." << std::endl;

    fs::path testRoot = "test_root_aggregator";
    fs::remove_all(testRoot);
    fs::create_directories(testRoot / "jobs");
    auto repo = std::make_shared<FileJobRepository>(testRoot / "jobs");

    Job a("105000");
    a.addProject("105000.1", "Rough turn", "Brandon", "01/01/2020");
    a.addProject("105000-177-43-01", "Finish bore", "Ana", "01/06/2020");
    repo->create("105000", std::nullopt);
    repo->save("105000", a);

    Job b("200000");
    b.addProject("200000.1", "Balance", "Ana", "01/05/2020");
    repo->create("200000", std::nullopt);
    repo->save("200000", b);

    // A job completed mid-scan: the marker is still listed but the record is gone.
    Touch(testRoot / "jobs" / "300000.lock");
    // A job caught mid-save: the record was truncated.
    Touch(testRoot / "jobs" / "400000.lock");
    Touch(testRoot / "jobs" / "400000.job");

    assert(repo->listActive().size() == 4);

    SnapshotAggregator aggregator(repo, testRoot / "temp", "tester");
    ProjectIndex merged = aggregator.collect();
    assert(merged.size() == 3);
    assert(merged.count("105000.1") && merged.count("105000-177-43-01") && merged.count("200000.1"));
    assert(merged.at("200000.1").owner() == "Ana");
    std::cout << "[PASS] Vanished and truncated records skipped" << std::endl;

    // Every temp copy is cleaned up, including those of skipped jobs.
    assert(aggregator.tempSlot("105000") == testRoot / "temp" / "105000.tester");
    assert(fs::is_empty(testRoot / "temp"));
    std::cout << "[PASS] Temp slots removed" << std::endl;

    CalendarDate today(2020, 1, 5);
    auto glance = aggregator.jobsAtAGlance(today);
    assert(glance.size() == 2);
    assert(glance["105000"].expired == 1);
    assert(glance["105000"].approaching == 1);
    assert(glance["200000"].today == 1);

    auto mine = aggregator.jobsAtAGlanceFor("Brandon", today);
    assert(mine.size() == 1);
    assert(mine["105000"].expired == 1);
    assert(mine["105000"].approaching == 0);
    std::cout << "[PASS] Glance per owner" << std::endl;

    // Unreachable storage is the one failure that surfaces.
    auto missing = std::make_shared<FileJobRepository>(testRoot / "no_such_dir");
    SnapshotAggregator broken(missing, testRoot / "temp", "tester");
    bool threw = false;
    try {
        broken.collect();
    } catch (const StorageIOError&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] Unreachable storage reported" << std::endl;

    fs::remove_all(testRoot);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
