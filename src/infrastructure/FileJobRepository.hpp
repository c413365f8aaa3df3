/**
 * @file FileJobRepository.hpp
 * @brief Flat-file implementation of the JobRepository on shared storage.
 */

#pragma once

#include <filesystem>
#include <vector>
#include "domain/JobRepository.hpp"

namespace jobledger::infrastructure {

/**
 * @class FileJobRepository
 * @brief Stores each job as "<id>.job" next to its lock marker "<id>.lock".
 *
 * Writes go straight to the record file. An interrupted save can leave a
 * truncated record, which load() then reports as corrupt.
 */
class FileJobRepository : public domain::JobRepository {
public:
    static constexpr const char* kRecordExtension = ".job";
    static constexpr const char* kLockExtension = ".lock";

    /** @param jobsDir Directory holding every job's files. It is not created here. */
    explicit FileJobRepository(std::filesystem::path jobsDir);

    bool exists(const std::string& jobId) override;
    void create(const std::string& jobId, const std::optional<std::string>& workspace) override;
    domain::Job load(const std::string& jobId) override;
    void save(const std::string& jobId, const domain::Job& job) override;
    std::set<std::string> listActive() override;
    size_t remove(const std::string& jobId) override;

    const std::filesystem::path& jobsDir() const { return m_jobsDir; }
    std::filesystem::path recordPath(const std::string& jobId) const;
    std::filesystem::path lockPath(const std::string& jobId) const;

private:
    /** @throws StorageIOError if the jobs directory cannot be listed. */
    std::vector<std::filesystem::path> listJobFiles() const;

    std::filesystem::path m_jobsDir;
};

} // namespace jobledger::infrastructure
