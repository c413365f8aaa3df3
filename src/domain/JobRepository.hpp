/**
 * @file JobRepository.hpp
 * @brief Interface for persisting Job aggregates on shared storage.
 */

#pragma once

#include <optional>
#include <set>
#include <string>
#include "Job.hpp"

namespace jobledger::domain {

/**
 * @class JobRepository
 * @brief Maps a job id to its serialized record.
 *
 * Implementations never check lock ownership: callers must hold the job's
 * LockService grant before calling save() or remove().
 */
class JobRepository {
public:
    virtual ~JobRepository() = default;

    /**
     * @brief True if any backing file for @p jobId is present.
     * @throws StorageIOError if storage is unreachable.
     */
    virtual bool exists(const std::string& jobId) = 0;

    /**
     * @brief Writes an empty lock marker and an empty Job record.
     * @throws AlreadyExistsError, StorageIOError
     */
    virtual void create(const std::string& jobId, const std::optional<std::string>& workspace) = 0;

    /**
     * @brief Reads the record of @p jobId.
     * @throws NotFoundError, CorruptRecordError, StorageIOError
     */
    virtual Job load(const std::string& jobId) = 0;

    /**
     * @brief Overwrites the record of @p jobId. Not atomic.
     * @throws StorageIOError
     */
    virtual void save(const std::string& jobId, const Job& job) = 0;

    /**
     * @brief Job ids with backing files.
     * @throws StorageIOError
     */
    virtual std::set<std::string> listActive() = 0;

    /**
     * @brief Deletes every backing file of @p jobId.
     * @return Number of files removed.
     */
    virtual size_t remove(const std::string& jobId) = 0;
};

} // namespace jobledger::domain
