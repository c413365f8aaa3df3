/**
 * @file StatusTransitionService.hpp
 * @brief Applies status changes to projects and routes finished documents.
 */

#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "domain/ExternalServices.hpp"
#include "domain/Job.hpp"
#include "infrastructure/WorkspaceDocumentScanner.hpp"

namespace jobledger::application {

/**
 * @struct TransitionReport
 * @brief What a status change did on disk.
 */
struct TransitionReport {
    std::vector<std::string> expected;              ///< Drawing numbers among the selected keys.
    std::vector<std::filesystem::path> moved;       ///< Destination path of every moved document.
    std::vector<std::string> missing;               ///< Expected identifiers with no moved document.
};

class StatusTransitionService {
public:
    StatusTransitionService(std::shared_ptr<domain::DocumentDestinationResolver> resolver,
                            std::string documentExtension);

    /**
     * @brief Sets @p status on every project in @p keys.
     *
     * Completing a project first moves the job's matching workspace documents
     * to the resolved destination. Keys are checked before anything moves.
     * @throws ProjectNotFoundError, DestinationUnresolvedError (no status is changed)
     */
    TransitionReport apply(domain::Job& job, const std::vector<std::string>& keys,
                           domain::ProjectStatus status);

    /**
     * @brief Moves every workspace document of @p job into @p destination.
     * @return Destination paths of the documents moved.
     */
    std::vector<std::filesystem::path> moveAllDocuments(const domain::Job& job,
                                                        const std::filesystem::path& destination);

    /**
     * @brief Renames @p source into @p destinationDir, copying across devices.
     * @return The new path, or empty on failure (logged).
     */
    static std::filesystem::path MoveDocument(const std::filesystem::path& source,
                                              const std::filesystem::path& destinationDir);

    domain::DocumentDestinationResolver& resolver() { return *m_resolver; }

private:
    std::vector<std::filesystem::path> documentsOf(const domain::Job& job) const;

    std::shared_ptr<domain::DocumentDestinationResolver> m_resolver;
    infrastructure::WorkspaceDocumentScanner m_scanner;
};

} // namespace jobledger::application
