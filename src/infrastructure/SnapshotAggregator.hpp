/**
 * @file SnapshotAggregator.hpp
 * @brief Lock-free, point-in-time merge of every active job's projects.
 */

#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "domain/Schedule.hpp"
#include "infrastructure/FileJobRepository.hpp"

namespace jobledger::infrastructure {

/**
 * @class SnapshotAggregator
 * @brief Reads all job records without taking their locks.
 *
 * Each record is copied to "<tempDir>/<jobId>.<callerId>", decoded from the
 * copy and the copy deleted. A record that vanishes or is unreadable while
 * being copied is skipped: a job completed by another user mid-scan is not
 * an error. Results can be stale and must never be saved back without a
 * fresh checkout.
 */
class SnapshotAggregator {
public:
    SnapshotAggregator(std::shared_ptr<FileJobRepository> repository,
                       std::filesystem::path tempDir,
                       std::string callerId);

    /**
     * @brief Merged projects of every readable active job, keyed by project key.
     * @throws StorageIOError only if the jobs directory itself cannot be listed.
     */
    domain::ProjectIndex collect();

    /** @brief collect() grouped by job and bucketed by due date relative to @p today. */
    std::map<std::string, domain::GlanceCounts> jobsAtAGlance(const domain::CalendarDate& today);

    /** @brief Same, restricted to projects owned by @p owner. */
    std::map<std::string, domain::GlanceCounts> jobsAtAGlanceFor(const std::string& owner,
                                                                 const domain::CalendarDate& today);

    std::filesystem::path tempSlot(const std::string& jobId) const;

private:
    /** @return False if the job was skipped. */
    bool mergeJob(const std::string& jobId, domain::ProjectIndex& merged);

    std::shared_ptr<FileJobRepository> m_repository;
    std::filesystem::path m_tempDir;
    std::string m_callerId;
};

} // namespace jobledger::infrastructure
