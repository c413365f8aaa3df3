/**
 * @file SnapshotAggregator.cpp
 * @brief Implementation of SnapshotAggregator.
 */

#include "infrastructure/SnapshotAggregator.hpp"

#include <iostream>

#include "domain/Errors.hpp"
#include "infrastructure/JobRecordCodec.hpp"

namespace jobledger::infrastructure {

namespace fs = std::filesystem;
using namespace jobledger::domain;

SnapshotAggregator::SnapshotAggregator(std::shared_ptr<FileJobRepository> repository,
                                       fs::path tempDir,
                                       std::string callerId)
    : m_repository(std::move(repository)),
      m_tempDir(std::move(tempDir)),
      m_callerId(std::move(callerId)) {}

fs::path SnapshotAggregator::tempSlot(const std::string& jobId) const {
    return m_tempDir / (jobId + "." + m_callerId);
}

ProjectIndex SnapshotAggregator::collect() {
    std::error_code ec;
    fs::create_directories(m_tempDir, ec);
    if (ec) {
        throw StorageIOError("cannot create temp area " + m_tempDir.string() + ": " + ec.message());
    }

    ProjectIndex merged;
    size_t skipped = 0;
    for (const auto& jobId : m_repository->listActive()) {
        if (!mergeJob(jobId, merged)) skipped++;
    }
    if (skipped > 0) {
        std::cerr << "[SnapshotAggregator] Skipped " << skipped << " job(s) that changed during the scan." << std::endl;
    }
    return merged;
}

bool SnapshotAggregator::mergeJob(const std::string& jobId, ProjectIndex& merged) {
    const fs::path slot = tempSlot(jobId);
    bool ok = false;

    std::error_code ec;
    fs::copy_file(m_repository->recordPath(jobId), slot, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        std::cerr << "[SnapshotAggregator] Job " << jobId << " not copied: " << ec.message() << std::endl;
    } else {
        try {
            Job snapshot = JobRecordCodec::DecodeFile(slot, jobId);
            for (const auto& [key, project] : snapshot.projects()) {
                merged.insert_or_assign(key, project);
            }
            ok = true;
        } catch (const JobStoreError& e) {
            std::cerr << "[SnapshotAggregator] Job " << jobId << " not readable: " << e.what() << std::endl;
        }
    }

    fs::remove(slot, ec);
    if (ec) {
        std::cerr << "[SnapshotAggregator] Could not delete " << slot << ": " << ec.message() << std::endl;
    }
    return ok;
}

std::map<std::string, GlanceCounts> SnapshotAggregator::jobsAtAGlance(const CalendarDate& today) {
    return JobsAtAGlance(GroupByJob(collect()), today);
}

std::map<std::string, GlanceCounts> SnapshotAggregator::jobsAtAGlanceFor(const std::string& owner,
                                                                         const CalendarDate& today) {
    return JobsAtAGlance(GroupByJob(FilterByOwner(collect(), owner)), today);
}

} // namespace jobledger::infrastructure
