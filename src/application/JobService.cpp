#include "application/JobService.hpp"

#include <filesystem>
#include <iostream>
#include <system_error>

#include "domain/Errors.hpp"
#include "domain/ProjectKey.hpp"

namespace jobledger::application {

using namespace jobledger::domain;
namespace fs = std::filesystem;

JobCheckout::JobCheckout(Job job, std::shared_ptr<LockService> locks, std::string owner)
    : m_job(std::move(job)), m_locks(std::move(locks)), m_owner(std::move(owner)) {}

JobCheckout::~JobCheckout() {
    try {
        release();
    } catch (const JobStoreError& e) {
        std::cerr << "[JobService] Could not release " << m_job.id() << ": " << e.what() << std::endl;
    }
}

JobCheckout::JobCheckout(JobCheckout&& other) noexcept
    : m_job(std::move(other.m_job)),
      m_locks(std::move(other.m_locks)),
      m_owner(std::move(other.m_owner)),
      m_held(other.m_held) {
    other.m_held = false;
}

JobCheckout& JobCheckout::operator=(JobCheckout&& other) noexcept {
    if (this != &other) {
        try {
            release();
        } catch (const JobStoreError& e) {
            std::cerr << "[JobService] Could not release " << m_job.id() << ": " << e.what() << std::endl;
        }
        m_job = std::move(other.m_job);
        m_locks = std::move(other.m_locks);
        m_owner = std::move(other.m_owner);
        m_held = other.m_held;
        other.m_held = false;
    }
    return *this;
}

void JobCheckout::release() {
    if (!m_held || !m_locks) return;
    m_held = false;
    if (!m_locks->release(m_owner, m_job.id())) {
        std::cerr << "[JobService] " << m_owner << " no longer held " << m_job.id() << " at release" << std::endl;
    }
}

JobService::JobService(std::shared_ptr<JobRepository> repository,
                       std::shared_ptr<LockService> locks,
                       std::string user,
                       std::shared_ptr<WorkspaceValidator> workspaceValidator)
    : m_repository(std::move(repository)),
      m_locks(std::move(locks)),
      m_user(std::move(user)),
      m_workspaceValidator(std::move(workspaceValidator)) {}

bool JobService::jobExists(const std::string& jobId) {
    return m_repository->exists(jobId);
}

void JobService::createJob(const std::string& jobId, const std::optional<std::string>& workspace) {
    m_repository->create(jobId, workspace);
}

JobCheckout JobService::checkout(const std::string& jobId) {
    if (!m_repository->exists(jobId)) {
        throw NotFoundError(jobId);
    }

    LockGrant grant = m_locks->acquire(m_user, jobId);
    if (!grant.held()) {
        throw InUseError(jobId, grant.owner);
    }

    // The grant is owned by the checkout from here on, so a failed load releases it.
    JobCheckout checkout(Job(jobId), m_locks, m_user);
    checkout.job() = m_repository->load(jobId);

    // A reachable recorded workspace is kept as is, whatever its folder is called.
    const auto& current = checkout.job().workspace();
    std::error_code ec;
    if (m_workspaceValidator && (!current || !fs::is_directory(*current, ec))) {
        auto validated = m_workspaceValidator->validate(jobId, current);
        if (validated && validated != current) {
            checkout.job().setWorkspace(validated);
            m_repository->save(jobId, checkout.job());
        }
    }
    return checkout;
}

Job JobService::read(const std::string& jobId) {
    return m_repository->load(jobId);
}

void JobService::verifyOwnership(const JobCheckout& checkout) {
    if (!checkout.held() || checkout.owner() != m_user) {
        throw SecurityViolationError(checkout.jobId());
    }
    auto owner = m_locks->currentOwner(checkout.jobId());
    if (!owner || *owner != m_user) {
        throw SecurityViolationError(checkout.jobId());
    }
}

void JobService::save(JobCheckout& checkout) {
    verifyOwnership(checkout);
    m_repository->save(checkout.jobId(), checkout.job());
}

void JobService::saveAndRelease(JobCheckout& checkout) {
    save(checkout);
    checkout.release();
}

size_t JobService::destroy(JobCheckout& checkout) {
    verifyOwnership(checkout);
    size_t removed = m_repository->remove(checkout.jobId());
    checkout.markReleased();
    std::cerr << "[JobService] Removed " << removed << " file(s) of job " << checkout.jobId() << std::endl;
    return removed;
}

std::optional<std::string> JobService::lockOwner(const std::string& jobId) {
    return m_locks->currentOwner(jobId);
}

std::string JobService::JobIdForSelection(const std::vector<std::string>& keys) {
    if (keys.empty()) {
        throw AmbiguousSelectionError();
    }
    std::string jobId = JobIdFromKey(keys.front());
    for (const auto& key : keys) {
        if (JobIdFromKey(key) != jobId) {
            throw AmbiguousSelectionError();
        }
    }
    return jobId;
}

} // namespace jobledger::application
