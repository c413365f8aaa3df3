/**
 * @file Project.hpp
 * @brief Entity representing one released work order.
 */

#pragma once

#include <string>
#include "CalendarDate.hpp"
#include "NoteLog.hpp"
#include "ProjectStatus.hpp"

namespace jobledger::domain {

/**
 * @class Project
 * @brief A unit of work tracked under a job (a drawing or a reverse engineering task).
 *
 * The key a project is stored under lives in the owning Job, not here, so a
 * rename never touches the project value.
 */
class Project {
public:
    /**
     * @throws std::invalid_argument if @p dueDate is not a MM/DD/YYYY date.
     */
    Project(std::string aliasNum, std::string workInstructions, std::string owner,
            const std::string& dueDate, ProjectStatus status = ProjectStatus::Unassigned)
        : m_aliasNum(std::move(aliasNum)),
          m_owner(std::move(owner)),
          m_dueDate(CalendarDate::ParseOrThrow(dueDate).toString()),
          m_status(status),
          m_notes(std::move(workInstructions)) {}

    /** @brief Rehydration constructor used by the record codec. */
    Project(std::string aliasNum, std::string owner, const std::string& dueDate,
            ProjectStatus status, NoteLog notes)
        : m_aliasNum(std::move(aliasNum)),
          m_owner(std::move(owner)),
          m_dueDate(CalendarDate::ParseOrThrow(dueDate).toString()),
          m_status(status),
          m_notes(std::move(notes)) {}

    const std::string& aliasNum() const { return m_aliasNum; }
    const std::string& owner() const { return m_owner; }
    const std::string& dueDate() const { return m_dueDate; }
    CalendarDate due() const { return CalendarDate::ParseOrThrow(m_dueDate); }
    ProjectStatus status() const { return m_status; }
    const NoteLog& notes() const { return m_notes; }
    bool isCompleted() const { return IsTerminal(m_status); }

    void setAliasNum(std::string aliasNum) { m_aliasNum = std::move(aliasNum); }
    void setOwner(std::string owner) { m_owner = std::move(owner); }
    void setStatus(ProjectStatus status) { m_status = status; }

    void setDueDate(const std::string& dueDate) {
        m_dueDate = CalendarDate::ParseOrThrow(dueDate).toString();
    }

    std::string addNote(const std::string& text, const std::string& author) {
        return m_notes.add(text, author);
    }

    bool operator==(const Project& other) const {
        return m_aliasNum == other.m_aliasNum && m_owner == other.m_owner &&
               m_dueDate == other.m_dueDate && m_status == other.m_status &&
               m_notes == other.m_notes;
    }
    bool operator!=(const Project& other) const { return !(*this == other); }

private:
    std::string m_aliasNum;
    std::string m_owner;
    std::string m_dueDate;
    ProjectStatus m_status;
    NoteLog m_notes;
};

} // namespace jobledger::domain
