#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>
#include <pwd.h>
#include <unistd.h>

namespace jobledger::infrastructure {

namespace fs = std::filesystem;

namespace {

constexpr const char* kAppDir = "JobLedger";

fs::path XdgDir(const char* variable, const fs::path& homeRelative) {
    const char* xdg = std::getenv(variable);
    if (xdg && *xdg) {
        return fs::path(xdg);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / homeRelative;
    }
    return fs::current_path(); // Fallback
}

} // namespace

fs::path PathUtils::GetDataHome() {
    return XdgDir("XDG_DATA_HOME", fs::path(".local") / "share");
}

fs::path PathUtils::GetConfigHome() {
    return XdgDir("XDG_CONFIG_HOME", ".config");
}

fs::path PathUtils::GetDefaultJobsDir() {
    return GetDataHome() / kAppDir / "jobs";
}

fs::path PathUtils::GetDefaultTempDir() {
    return GetDataHome() / kAppDir / "temp";
}

fs::path PathUtils::GetSettingsPath() {
    return GetConfigHome() / kAppDir / "settings.json";
}

std::string PathUtils::GetCurrentUser() {
    for (const char* variable : {"LOGNAME", "USER", "LNAME", "USERNAME"}) {
        const char* value = std::getenv(variable);
        if (value && *value) return value;
    }
    if (const passwd* pw = getpwuid(getuid())) {
        if (pw->pw_name && *pw->pw_name) return pw->pw_name;
    }
    return "unknown";
}

} // namespace jobledger::infrastructure
