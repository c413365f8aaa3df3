/**
 * @file ProjectStatus.hpp
 * @brief Value Object defining the lifecycle states of a project.
 */

#pragma once

#include <array>
#include <stdexcept>
#include <string>

namespace jobledger::domain {

/**
 * @enum ProjectStatus
 * @brief Fixed, ordered set of work order states. The last one is terminal.
 */
enum class ProjectStatus {
    Unassigned,   ///< Released but nobody has picked it up.
    InProcess,    ///< Owner is actively working on it.
    OnHold,       ///< Waiting on external input.
    AtReview,     ///< Submitted for checking.
    Completed     ///< Terminal. Assigning it routes finished documents.
};

inline constexpr std::array<ProjectStatus, 5> kAllStatuses = {
    ProjectStatus::Unassigned,
    ProjectStatus::InProcess,
    ProjectStatus::OnHold,
    ProjectStatus::AtReview,
    ProjectStatus::Completed
};

inline std::string StatusToString(ProjectStatus status) {
    switch (status) {
        case ProjectStatus::Unassigned: return "Unassigned";
        case ProjectStatus::InProcess: return "In Process";
        case ProjectStatus::OnHold: return "On Hold";
        case ProjectStatus::AtReview: return "At Review";
        case ProjectStatus::Completed: return "Completed";
        default: return "Unknown";
    }
}

/**
 * @brief Parses the display name of a status.
 * @throws std::invalid_argument if @p text names no status.
 */
inline ProjectStatus StatusFromString(const std::string& text) {
    for (ProjectStatus s : kAllStatuses) {
        if (StatusToString(s) == text) return s;
    }
    throw std::invalid_argument("Unknown project status: " + text);
}

inline bool IsTerminal(ProjectStatus status) {
    return status == kAllStatuses.back();
}

} // namespace jobledger::domain
