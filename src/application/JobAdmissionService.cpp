#include "application/JobAdmissionService.hpp"

#include <iostream>

#include "domain/Errors.hpp"
#include "domain/ProjectKey.hpp"

namespace jobledger::application {

using namespace jobledger::domain;

JobAdmissionService::JobAdmissionService(std::shared_ptr<JobService> jobs, std::shared_ptr<AsyncTaskManager> tasks)
    : m_jobs(std::move(jobs)), m_tasks(std::move(tasks)) {}

// Queued batches run on this service, so they must finish before it goes away.
JobAdmissionService::~JobAdmissionService() {
    m_tasks->WaitAll();
}

std::shared_ptr<TaskStatus> JobAdmissionService::submit(std::vector<AdmissionEntry> entries,
                                                        std::shared_ptr<AdmissionResult> result) {
    std::string description = "Admitting " + std::to_string(entries.size()) + " project(s)";
    return m_tasks->SubmitTask(TaskType::Admission, description,
        [this, result](std::shared_ptr<TaskStatus> status, std::vector<AdmissionEntry> batch) {
            AdmissionResult outcome = admit(batch, status);
            if (!outcome.failed.empty()) {
                status->errorMessage = std::to_string(outcome.failed.size()) + " job(s) failed";
            }
            if (result) *result = std::move(outcome);
        }, std::move(entries));
}

AdmissionResult JobAdmissionService::admit(const std::vector<AdmissionEntry>& entries,
                                           const std::shared_ptr<TaskStatus>& status) {
    std::map<std::string, std::vector<AdmissionEntry>> byJob;
    for (const auto& entry : entries) {
        byJob[JobIdFromKey(entry.aliasNum)].push_back(entry);
    }

    // Batches from different callers do not interleave.
    std::lock_guard<std::mutex> lock(m_admissionMutex);

    AdmissionResult result;
    size_t done = 0;
    for (const auto& [jobId, jobEntries] : byJob) {
        try {
            if (m_jobs->jobExists(jobId)) {
                std::cerr << "[JobAdmissionService] Job " << jobId << " already exists, skipped" << std::endl;
                result.skipped.push_back(jobId);
            } else {
                admitJob(jobId, jobEntries);
                result.admitted.push_back(jobId);
            }
        } catch (const JobStoreError& e) {
            std::cerr << "[JobAdmissionService] Job " << jobId << ": " << e.what() << std::endl;
            result.failed[jobId] = e.what();
        } catch (const std::invalid_argument& e) {
            std::cerr << "[JobAdmissionService] Job " << jobId << ": " << e.what() << std::endl;
            result.failed[jobId] = e.what();
        }
        done++;
        if (status) status->progress = static_cast<float>(done) / static_cast<float>(byJob.size());
    }
    return result;
}

void JobAdmissionService::admitJob(const std::string& jobId, const std::vector<AdmissionEntry>& entries) {
    m_jobs->createJob(jobId, std::nullopt);
    JobCheckout checkout = m_jobs->checkout(jobId);
    for (const auto& entry : entries) {
        checkout.job().addProject(entry.aliasNum, entry.workInstructions, entry.owner, entry.dueDate);
    }
    m_jobs->saveAndRelease(checkout);
}

} // namespace jobledger::application
