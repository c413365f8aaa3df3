/**
 * @file Schedule.hpp
 * @brief Pure reporting helpers over a merged project index.
 */

#pragma once

#include <map>
#include <string>
#include <vector>

#include "CalendarDate.hpp"
#include "Project.hpp"

namespace jobledger::domain {

/** @brief Projects from any number of jobs, keyed by project key. */
using ProjectIndex = std::map<std::string, Project>;

/**
 * @struct GlanceCounts
 * @brief Due-date proximity buckets for one job's open projects.
 */
struct GlanceCounts {
    int expired = 0;      ///< Past due.
    int today = 0;        ///< Due today.
    int approaching = 0;  ///< Due within the next two days.

    bool operator==(const GlanceCounts& other) const {
        return expired == other.expired && today == other.today && approaching == other.approaching;
    }
};

/** @brief Groups projects by the job id encoded in their keys. Keys are dropped. */
std::map<std::string, std::vector<Project>> GroupByJob(const ProjectIndex& projects);

/**
 * @brief Buckets every non-completed project by days remaining until its due date.
 *
 * Every job in @p jobs gets an entry, even if all of its counts are zero.
 */
std::map<std::string, GlanceCounts> JobsAtAGlance(const std::map<std::string, std::vector<Project>>& jobs,
                                                  const CalendarDate& today);

/** @brief The subset of @p projects owned by @p owner. */
ProjectIndex FilterByOwner(const ProjectIndex& projects, const std::string& owner);

} // namespace jobledger::domain
