/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include "infrastructure/PathUtils.hpp"

namespace jobledger::infrastructure {

namespace fs = std::filesystem;

namespace {

template <typename T>
void ReadKey(const nlohmann::json& j, const char* key, T& target) {
    if (!j.contains(key)) return;
    try {
        target = j.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[ConfigLoader] Ignoring '" << key << "': " << e.what() << std::endl;
    }
}

void ReadPath(const nlohmann::json& j, const char* key, std::optional<fs::path>& target) {
    std::string value;
    ReadKey(j, key, value);
    if (!value.empty()) target = fs::path(value);
}

} // namespace

StoreSettings ConfigLoader::Defaults() {
    StoreSettings settings;
    settings.jobsDir = PathUtils::GetDefaultJobsDir();
    settings.tempDir = PathUtils::GetDefaultTempDir();
    settings.user = PathUtils::GetCurrentUser();
    return settings;
}

StoreSettings ConfigLoader::Load(const std::optional<fs::path>& configPath) {
    StoreSettings settings = Defaults();
    fs::path path = configPath ? *configPath : PathUtils::GetSettingsPath();

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return settings;
    }

    nlohmann::json j;
    try {
        std::ifstream f(path);
        f >> j;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << path << ": " << e.what() << std::endl;
        return settings;
    }
    if (!j.is_object()) {
        std::cerr << "[ConfigLoader] " << path << " is not a JSON object, using defaults." << std::endl;
        return settings;
    }

    std::string jobsDir;
    std::string tempDir;
    ReadKey(j, "jobs_dir", jobsDir);
    ReadKey(j, "temp_dir", tempDir);
    if (!jobsDir.empty()) settings.jobsDir = jobsDir;
    if (!tempDir.empty()) settings.tempDir = tempDir;

    std::string user;
    ReadKey(j, "user", user);
    if (!user.empty()) settings.user = user;

    ReadKey(j, "document_extension", settings.documentExtension);
    ReadPath(j, "destination_root", settings.destinationRoot);
    ReadPath(j, "workspace_root", settings.workspaceRoot);
    ReadPath(j, "notification_log", settings.notificationLog);
    ReadKey(j, "completion_recipients", settings.completionRecipients);
    ReadKey(j, "connect_attempts", settings.connectAttempts);
    ReadKey(j, "connect_delay_ms", settings.connectDelayMs);

    if (settings.connectAttempts < 1) settings.connectAttempts = 1;
    if (settings.connectDelayMs < 0) settings.connectDelayMs = 0;
    return settings;
}

} // namespace jobledger::infrastructure
