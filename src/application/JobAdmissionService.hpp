/**
 * @file JobAdmissionService.hpp
 * @brief Background bulk admission of new jobs and their first projects.
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "application/AsyncTaskManager.hpp"
#include "application/JobService.hpp"

namespace jobledger::application {

/**
 * @struct AdmissionEntry
 * @brief One project to admit. The job id is taken from the alias number.
 */
struct AdmissionEntry {
    std::string aliasNum;
    std::string workInstructions;
    std::string dueDate;
    std::string owner;
};

struct AdmissionResult {
    std::vector<std::string> admitted;           ///< Jobs created with all their projects.
    std::vector<std::string> skipped;            ///< Jobs that already existed.
    std::map<std::string, std::string> failed;   ///< Job id -> error message.
};

class JobAdmissionService {
public:
    JobAdmissionService(std::shared_ptr<JobService> jobs, std::shared_ptr<AsyncTaskManager> tasks);
    ~JobAdmissionService();

    /**
     * @brief Queues @p entries for admission on the background worker.
     *
     * @p result is filled before the returned status reports completion.
     */
    std::shared_ptr<TaskStatus> submit(std::vector<AdmissionEntry> entries,
                                       std::shared_ptr<AdmissionResult> result);

    /** @brief Admits @p entries on the calling thread, one job at a time. */
    AdmissionResult admit(const std::vector<AdmissionEntry>& entries,
                          const std::shared_ptr<TaskStatus>& status = nullptr);

private:
    void admitJob(const std::string& jobId, const std::vector<AdmissionEntry>& entries);

    std::mutex m_admissionMutex;
    std::shared_ptr<JobService> m_jobs;
    std::shared_ptr<AsyncTaskManager> m_tasks;
};

} // namespace jobledger::application
