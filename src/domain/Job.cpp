/**
 * @file Job.cpp
 * @brief Implementation of the Job aggregate.
 */

#include "domain/Job.hpp"

#include <stdexcept>

#include "domain/Errors.hpp"
#include "domain/ProjectKey.hpp"

namespace jobledger::domain {

Job::Job(std::string jobId, std::optional<std::string> workspace)
    : m_jobId(std::move(jobId)), m_workspace(std::move(workspace)) {
    if (!IsValidJobId(m_jobId)) {
        throw std::invalid_argument("The job number must be a 6-digit integer: '" + m_jobId + "'");
    }
}

const Project* Job::findProject(const std::string& key) const {
    auto it = m_projects.find(key);
    return it == m_projects.end() ? nullptr : &it->second;
}

Project& Job::project(const std::string& key) {
    auto it = m_projects.find(key);
    if (it == m_projects.end()) throw ProjectNotFoundError(m_jobId, key);
    return it->second;
}

const Project& Job::project(const std::string& key) const {
    auto it = m_projects.find(key);
    if (it == m_projects.end()) throw ProjectNotFoundError(m_jobId, key);
    return it->second;
}

Project& Job::addProject(const std::string& key, const std::string& workInstructions,
                         const std::string& owner, const std::string& dueDate,
                         ProjectStatus status) {
    if (hasProject(key)) {
        throw std::invalid_argument("Project '" + key + "' already exists in job " + m_jobId);
    }
    auto [it, inserted] = m_projects.emplace(key, Project(key, workInstructions, owner, dueDate, status));
    return it->second;
}

void Job::putProject(const std::string& key, Project project) {
    m_projects.insert_or_assign(key, std::move(project));
}

void Job::removeProject(const std::string& key) {
    if (m_projects.erase(key) == 0) {
        throw ProjectNotFoundError(m_jobId, key);
    }
}

void Job::renameProject(const std::string& oldKey, const std::string& newKey) {
    auto it = m_projects.find(oldKey);
    if (it == m_projects.end()) throw ProjectNotFoundError(m_jobId, oldKey);
    if (oldKey == newKey) return;
    if (hasProject(newKey)) {
        throw std::invalid_argument("Project '" + newKey + "' already exists in job " + m_jobId);
    }

    auto node = m_projects.extract(it);
    node.key() = newKey;
    m_projects.insert(std::move(node));
}

std::string Job::nextCopyKey(const std::string& key) const {
    int copyNum = 2;
    while (hasProject(key + " (" + std::to_string(copyNum) + ")")) {
        ++copyNum;
    }
    return key + " (" + std::to_string(copyNum) + ")";
}

std::string Job::duplicateProject(const std::string& key) {
    const Project& source = project(key);
    std::string newKey = nextCopyKey(key);

    Project copy(source.aliasNum(), source.notes().workInstructions(), source.owner(),
                 source.dueDate(), source.status());
    m_projects.emplace(newKey, std::move(copy));
    return newKey;
}

std::vector<std::string> Job::keys() const {
    std::vector<std::string> result;
    result.reserve(m_projects.size());
    for (const auto& [key, project] : m_projects) {
        result.push_back(key);
    }
    return result;
}

std::vector<std::string> Job::drawingNumbers() const {
    return DrawingNumbersIn(keys());
}

std::optional<CalendarDate> Job::latestDueDate() const {
    std::optional<CalendarDate> latest;
    for (const auto& [key, project] : m_projects) {
        auto due = CalendarDate::Parse(project.dueDate());
        if (due && (!latest || *latest < *due)) {
            latest = due;
        }
    }
    return latest;
}

} // namespace jobledger::domain
