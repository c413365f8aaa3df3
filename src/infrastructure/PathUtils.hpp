// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace jobledger::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();

    /** @brief <data home>/JobLedger/jobs, the default shared record directory. */
    static std::filesystem::path GetDefaultJobsDir();

    /** @brief <data home>/JobLedger/temp, where snapshot copies are staged. */
    static std::filesystem::path GetDefaultTempDir();

    /** @brief <config home>/JobLedger/settings.json */
    static std::filesystem::path GetSettingsPath();

    /** @brief Login name of the current user, "unknown" if none can be found. */
    static std::string GetCurrentUser();
};

} // namespace jobledger::infrastructure
