/**
 * @file FileLockService.hpp
 * @brief Lock-file implementation of the LockService contract.
 */

#pragma once

#include <filesystem>
#include <mutex>
#include "domain/LockService.hpp"

namespace jobledger::infrastructure {

/**
 * @class FileLockService
 * @brief Records the holder of each job in its "<id>.lock" marker.
 *
 * An empty marker means the job is free. Every read-modify-write of a marker
 * runs under an fcntl() write lock, so cooperating processes see a consistent
 * owner. Ownership persists in the file: a crashed holder keeps the job until
 * the marker is cleared by hand.
 */
class FileLockService : public domain::LockService {
public:
    explicit FileLockService(std::filesystem::path jobsDir);

    /** @throws StorageIOError if the marker is missing or unreadable. */
    domain::LockGrant acquire(const std::string& ownerId, const std::string& resource) override;

    /** @throws StorageIOError */
    bool release(const std::string& ownerId, const std::string& resource) override;

    /** @throws StorageIOError */
    std::optional<std::string> currentOwner(const std::string& resource) override;

private:
    std::filesystem::path markerPath(const std::string& resource) const;

    std::filesystem::path m_jobsDir;
    std::mutex m_mutex; // fcntl locks are per process; this orders our own threads.
};

} // namespace jobledger::infrastructure
