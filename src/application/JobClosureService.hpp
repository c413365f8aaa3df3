/**
 * @file JobClosureService.hpp
 * @brief Closes a finished job: routes its documents, deletes it, confirms by notification.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "application/JobService.hpp"
#include "application/StatusTransitionService.hpp"
#include "domain/ExternalServices.hpp"

namespace jobledger::application {

struct ClosureReport {
    std::string jobId;
    size_t drawingCount = 0;
    size_t incompleteCount = 0;
    size_t movedDocuments = 0;
    size_t filesRemoved = 0;
    std::string latestDueDate; ///< "not found" when no project has a due date.
};

class JobClosureService {
public:
    JobClosureService(std::shared_ptr<JobService> jobs,
                      std::shared_ptr<StatusTransitionService> transitions,
                      std::shared_ptr<domain::CompletionNotifier> notifier,
                      std::vector<std::string> recipients);

    /**
     * @brief Closes the checked-out job. The checkout holds nothing afterwards.
     * @throws SecurityViolationError, DestinationUnresolvedError (nothing is changed), StorageIOError
     */
    ClosureReport closeJob(JobCheckout& checkout);

private:
    std::shared_ptr<JobService> m_jobs;
    std::shared_ptr<StatusTransitionService> m_transitions;
    std::shared_ptr<domain::CompletionNotifier> m_notifier;
    std::vector<std::string> m_recipients;
};

} // namespace jobledger::application
