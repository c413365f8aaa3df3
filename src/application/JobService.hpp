/**
 * @file JobService.hpp
 * @brief Application Service implementing the checkout protocol around the record store.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "domain/ExternalServices.hpp"
#include "domain/Job.hpp"
#include "domain/JobRepository.hpp"
#include "domain/LockService.hpp"

namespace jobledger::application {

/**
 * @class JobCheckout
 * @brief A loaded Job together with the lock grant its owner holds.
 *
 * Destroying a checkout that still holds its grant releases it.
 */
class JobCheckout {
public:
    JobCheckout(domain::Job job, std::shared_ptr<domain::LockService> locks, std::string owner);
    ~JobCheckout();

    JobCheckout(JobCheckout&& other) noexcept;
    JobCheckout& operator=(JobCheckout&& other) noexcept;
    JobCheckout(const JobCheckout&) = delete;
    JobCheckout& operator=(const JobCheckout&) = delete;

    domain::Job& job() { return m_job; }
    const domain::Job& job() const { return m_job; }
    const std::string& jobId() const { return m_job.id(); }
    const std::string& owner() const { return m_owner; }

    /** @brief False once released (or after the job's files were destroyed). */
    bool held() const { return m_held; }

    /** @brief Releases the grant. Safe to call more than once. */
    void release();

private:
    friend class JobService;
    void markReleased() { m_held = false; }

    domain::Job m_job;
    std::shared_ptr<domain::LockService> m_locks;
    std::string m_owner;
    bool m_held = true;
};

class JobService {
public:
    JobService(std::shared_ptr<domain::JobRepository> repository,
               std::shared_ptr<domain::LockService> locks,
               std::string user,
               std::shared_ptr<domain::WorkspaceValidator> workspaceValidator = nullptr);

    const std::string& user() const { return m_user; }

    bool jobExists(const std::string& jobId);

    /**
     * @brief Admits a new job with no projects.
     * @throws std::invalid_argument for a malformed id, AlreadyExistsError, StorageIOError
     */
    void createJob(const std::string& jobId, const std::optional<std::string>& workspace);

    /**
     * @brief Locks and loads a job for editing.
     *
     * If the recorded workspace is unset or unreachable here, the workspace
     * validator is asked for one and the job is saved with it.
     * @throws NotFoundError, InUseError, CorruptRecordError, StorageIOError
     */
    JobCheckout checkout(const std::string& jobId);

    /** @brief Reads a job without locking it. */
    domain::Job read(const std::string& jobId);

    /**
     * @brief Persists a checked-out job.
     * @throws SecurityViolationError unless this user still holds the job's lock.
     */
    void save(JobCheckout& checkout);

    /** @brief save() then release. */
    void saveAndRelease(JobCheckout& checkout);

    /** @throws SecurityViolationError */
    void verifyOwnership(const JobCheckout& checkout);

    /**
     * @brief Deletes the job's backing files. The checkout no longer holds anything afterwards.
     * @return Number of files removed.
     * @throws SecurityViolationError, StorageIOError
     */
    size_t destroy(JobCheckout& checkout);

    std::optional<std::string> lockOwner(const std::string& jobId);

    /**
     * @brief The one job id shared by @p keys.
     * @throws AmbiguousSelectionError if the keys are empty or span several jobs.
     */
    static std::string JobIdForSelection(const std::vector<std::string>& keys);

private:
    std::shared_ptr<domain::JobRepository> m_repository;
    std::shared_ptr<domain::LockService> m_locks;
    std::string m_user;
    std::shared_ptr<domain::WorkspaceValidator> m_workspaceValidator;
};

} // namespace jobledger::application
