/**
 * @file WorkspaceService.hpp
 * @brief Service to validate job workspaces and lay out their folder structure.
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "domain/ExternalServices.hpp"

namespace jobledger::application {

class WorkspaceService {
public:
    /**
     * @brief Ensures the standard subdirectory layout exists under a workspace.
     *
     * Existing directories are left alone; only missing ones are created.
     */
    bool EnsureWorkspaceFolders(const std::filesystem::path& root);

    /**
     * @brief A workspace is valid if it exists and its last component is the job id.
     */
    bool IsValidWorkspace(const std::string& jobId, const std::filesystem::path& root);
};

/**
 * @class DirectoryWorkspaceValidator
 * @brief Keeps a recorded workspace that is reachable, else falls back to "<workspaceRoot>/<jobId>".
 */
class DirectoryWorkspaceValidator : public domain::WorkspaceValidator {
public:
    explicit DirectoryWorkspaceValidator(std::optional<std::filesystem::path> workspaceRoot);

    std::optional<std::string> validate(const std::string& jobId,
                                        const std::optional<std::string>& current) override;

private:
    std::optional<std::filesystem::path> m_workspaceRoot;
    WorkspaceService m_workspaces;
};

} // namespace jobledger::application
