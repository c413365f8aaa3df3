#include "domain/Schedule.hpp"

#include "domain/ProjectKey.hpp"

namespace jobledger::domain {

std::map<std::string, std::vector<Project>> GroupByJob(const ProjectIndex& projects) {
    std::map<std::string, std::vector<Project>> jobs;
    for (const auto& [key, project] : projects) {
        jobs[JobIdFromKey(key)].push_back(project);
    }
    return jobs;
}

std::map<std::string, GlanceCounts> JobsAtAGlance(const std::map<std::string, std::vector<Project>>& jobs,
                                                  const CalendarDate& today) {
    std::map<std::string, GlanceCounts> glance;
    for (const auto& [jobId, projects] : jobs) {
        GlanceCounts counts;
        for (const auto& project : projects) {
            if (project.isCompleted()) continue;

            long delta = project.due().daysSince(today);
            if (delta < 0) {
                counts.expired++;
            } else if (delta == 0) {
                counts.today++;
            } else if (delta < 3) {
                counts.approaching++;
            }
        }
        glance[jobId] = counts;
    }
    return glance;
}

ProjectIndex FilterByOwner(const ProjectIndex& projects, const std::string& owner) {
    ProjectIndex mine;
    for (const auto& [key, project] : projects) {
        if (project.owner() == owner) {
            mine.emplace(key, project);
        }
    }
    return mine;
}

} // namespace jobledger::domain
