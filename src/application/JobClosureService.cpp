#include "application/JobClosureService.hpp"

#include "domain/ProjectKey.hpp"

namespace jobledger::application {

using namespace jobledger::domain;

JobClosureService::JobClosureService(std::shared_ptr<JobService> jobs,
                                     std::shared_ptr<StatusTransitionService> transitions,
                                     std::shared_ptr<CompletionNotifier> notifier,
                                     std::vector<std::string> recipients)
    : m_jobs(std::move(jobs)),
      m_transitions(std::move(transitions)),
      m_notifier(std::move(notifier)),
      m_recipients(std::move(recipients)) {}

ClosureReport JobClosureService::closeJob(JobCheckout& checkout) {
    m_jobs->verifyOwnership(checkout);
    const Job& job = checkout.job();

    ClosureReport report;
    report.jobId = job.id();
    for (const auto& [key, project] : job.projects()) {
        if (!IsDrawingNumber(key)) continue;
        report.drawingCount++;
        if (!project.isCompleted()) report.incompleteCount++;
    }
    auto latest = job.latestDueDate();
    report.latestDueDate = latest ? latest->toString() : "not found";

    auto destination = m_transitions->resolver().resolve(job.id());
    report.movedDocuments = m_transitions->moveAllDocuments(job, destination).size();
    report.filesRemoved = m_jobs->destroy(checkout);

    m_notifier->notify(m_recipients, "Job " + report.jobId + " closed", {
        "Closed by: " + m_jobs->user(),
        "Drawings: " + std::to_string(report.drawingCount),
        "Incomplete drawings: " + std::to_string(report.incompleteCount),
        "Documents moved: " + std::to_string(report.movedDocuments),
        "Latest due date: " + report.latestDueDate,
    });
    return report;
}

} // namespace jobledger::application
