/**
 * @file Job.hpp
 * @brief Aggregate Root for the work orders billed under one job number.
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "Project.hpp"

namespace jobledger::domain {

/**
 * @class Job
 * @brief A 6-digit job number, its optional workspace, and its projects by key.
 *
 * Keys are renamable identities (alias or drawing numbers). The map is the
 * only index; iteration order carries no meaning.
 */
class Job {
public:
    using ProjectMap = std::map<std::string, Project>;

    /**
     * @throws std::invalid_argument if @p jobId is not six digits.
     */
    explicit Job(std::string jobId, std::optional<std::string> workspace = std::nullopt);

    const std::string& id() const { return m_jobId; }
    const std::optional<std::string>& workspace() const { return m_workspace; }
    void setWorkspace(std::optional<std::string> workspace) { m_workspace = std::move(workspace); }

    const ProjectMap& projects() const { return m_projects; }
    bool hasProject(const std::string& key) const { return m_projects.count(key) != 0; }
    const Project* findProject(const std::string& key) const;

    /** @throws ProjectNotFoundError */
    Project& project(const std::string& key);
    const Project& project(const std::string& key) const;

    // --- Commands ---

    /**
     * @brief Creates a project stored under @p key with its alias number set to the key.
     * @throws std::invalid_argument if the key is taken or the due date is invalid.
     */
    Project& addProject(const std::string& key, const std::string& workInstructions,
                        const std::string& owner, const std::string& dueDate,
                        ProjectStatus status = ProjectStatus::Unassigned);

    /** @brief Stores an existing value under @p key (used by rehydration). */
    void putProject(const std::string& key, Project project);

    /** @throws ProjectNotFoundError */
    void removeProject(const std::string& key);

    /**
     * @brief Moves the project stored under @p oldKey to @p newKey.
     *
     * A no-op when the keys are equal. The project value is left untouched.
     * @throws ProjectNotFoundError if @p oldKey is unknown.
     * @throws std::invalid_argument if @p newKey already holds another project.
     */
    void renameProject(const std::string& oldKey, const std::string& newKey);

    /**
     * @brief Copies a project under "<key> (n)" with the first free n >= 2.
     * @return The key of the copy.
     */
    std::string duplicateProject(const std::string& key);

    /** @brief The key duplicateProject would pick for @p key. */
    std::string nextCopyKey(const std::string& key) const;

    // --- Queries ---

    std::vector<std::string> keys() const;
    std::vector<std::string> drawingNumbers() const;

    /** @brief Latest parseable project due date, if any. */
    std::optional<CalendarDate> latestDueDate() const;

    bool operator==(const Job& other) const {
        return m_jobId == other.m_jobId && m_workspace == other.m_workspace && m_projects == other.m_projects;
    }
    bool operator!=(const Job& other) const { return !(*this == other); }

private:
    std::string m_jobId;
    std::optional<std::string> m_workspace;
    ProjectMap m_projects;
};

} // namespace jobledger::domain
