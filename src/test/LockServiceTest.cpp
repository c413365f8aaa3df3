#include <atomic>
#include <cassert>
#include <filesystem>
#include <iostream>
#include <thread>
#include <vector>

#include "domain/Errors.hpp"
#include "infrastructure/FileJobRepository.hpp"
#include "infrastructure/FileLockService.hpp"

using namespace jobledger::domain;
using namespace jobledger::infrastructure;

namespace fs = std::filesystem;

int main() {
    std::cout << "[Test] Starting Lock Service Test..." << std::endl;

    fs::path jobsDir = "test_root_locks";
    fs::remove_all(jobsDir);
    fs::create_directories(jobsDir);
    FileJobRepository repo(jobsDir);
    repo.create("105000", std::nullopt);

    FileLockService locks(jobsDir);
    assert(!locks.currentOwner("105000"));

    // Single poll semantics
    LockGrant first = locks.acquire("alice", "105000");
    assert(first.outcome == AcquireOutcome::Acquired && first.held());
    LockGrant again = locks.acquire("alice", "105000");
    assert(again.outcome == AcquireOutcome::AlreadyHeld && again.held());
    LockGrant other = locks.acquire("bob", "105000");
    assert(other.outcome == AcquireOutcome::HeldByOther && !other.held());
    assert(other.owner == "alice");
    assert(locks.currentOwner("105000").value() == "alice");

    assert(!locks.release("bob", "105000"));
    assert(locks.currentOwner("105000").value() == "alice");
    assert(locks.release("alice", "105000"));
    assert(!locks.currentOwner("105000"));
    std::cout << "[PASS] Acquire/release" << std::endl;

    // Many clients racing for the same job: exactly one wins.
    const int NUM_CLIENTS = 16;
    std::atomic<int> winners{0};
    std::atomic<int> losers{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < NUM_CLIENTS; ++i) {
        threads.emplace_back([&locks, &winners, &losers, i]() {
            LockGrant grant = locks.acquire("client" + std::to_string(i), "105000");
            if (grant.outcome == AcquireOutcome::Acquired) {
                winners++;
            } else {
                losers++;
            }
        });
    }
    for (auto& t : threads) {
        if (t.joinable()) t.join();
    }
    assert(winners == 1);
    assert(losers == NUM_CLIENTS - 1);

    std::string holder = locks.currentOwner("105000").value();
    assert(holder.rfind("client", 0) == 0);
    assert(locks.release(holder, "105000"));
    std::cout << "[PASS] " << NUM_CLIENTS << " racing clients, one winner" << std::endl;

    // Errors
    bool threw = false;
    try {
        locks.acquire("", "105000");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        locks.acquire("alice", "999999");
    } catch (const StorageIOError&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] Invalid owner and missing marker rejected" << std::endl;

    fs::remove_all(jobsDir);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
