#include "application/WorkspaceService.hpp"
#include <iostream>
#include <system_error>

namespace jobledger::application {

namespace fs = std::filesystem;

namespace {

// Department layout, leaves only.
const char* const kLayout[] = {
    "Layouts",
    "Programming",
    "Rotating/Blading",
    "Rotating/Disks/Stage 1",
    "Rotating/Impellers/Stage 1",
    "Rotating/Other",
    "Rotating/Rotors",
    "Rotating/Shafts",
    "Rotating/Sleeves",
    "Stationary/Case",
    "Stationary/Diaphragms/Stage 1",
    "Stationary/Housings",
    "Stationary/IGVs/Stage 1",
    "Stationary/Other",
};

} // namespace

bool WorkspaceService::EnsureWorkspaceFolders(const fs::path& root) {
    bool ok = true;
    for (const auto& folder : kLayout) {
        std::error_code ec;
        fs::create_directories(root / folder, ec);
        if (ec) {
            std::cerr << "[WorkspaceService] Cannot create " << (root / folder) << ": " << ec.message() << std::endl;
            ok = false;
        }
    }
    return ok;
}

bool WorkspaceService::IsValidWorkspace(const std::string& jobId, const fs::path& root) {
    if (root.empty()) return false;
    std::error_code ec;
    fs::path normalized = root.lexically_normal();
    if (!normalized.has_filename()) normalized = normalized.parent_path();
    return normalized.filename() == jobId && fs::is_directory(root, ec);
}

DirectoryWorkspaceValidator::DirectoryWorkspaceValidator(std::optional<fs::path> workspaceRoot)
    : m_workspaceRoot(std::move(workspaceRoot)) {}

std::optional<std::string> DirectoryWorkspaceValidator::validate(const std::string& jobId,
                                                                 const std::optional<std::string>& current) {
    std::error_code ec;
    if (current && fs::is_directory(*current, ec)) {
        return current;
    }
    if (!m_workspaceRoot) {
        return std::nullopt;
    }

    fs::path candidate = *m_workspaceRoot / jobId;
    if (!m_workspaces.IsValidWorkspace(jobId, candidate)) {
        return std::nullopt;
    }
    m_workspaces.EnsureWorkspaceFolders(candidate);
    std::cerr << "[WorkspaceService] Set " << jobId << " workspace to " << candidate << std::endl;
    return candidate.string();
}

} // namespace jobledger::application
