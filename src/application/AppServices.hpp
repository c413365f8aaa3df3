/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/AsyncTaskManager.hpp"
#include "application/JobAdmissionService.hpp"
#include "application/JobClosureService.hpp"
#include "application/JobService.hpp"
#include "application/StatusTransitionService.hpp"
#include "infrastructure/SnapshotAggregator.hpp"

namespace jobledger::application {

struct AppServices {
    std::shared_ptr<JobService> jobService;
    std::shared_ptr<StatusTransitionService> transitionService;
    std::unique_ptr<JobClosureService> closureService;
    std::unique_ptr<JobAdmissionService> admissionService;
    std::unique_ptr<infrastructure::SnapshotAggregator> aggregator;
    std::shared_ptr<AsyncTaskManager> taskManager;
};

} // namespace jobledger::application
