/**
 * @file ExternalServices.hpp
 * @brief Narrow interfaces to the collaborators that live outside the store.
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace jobledger::domain {

/**
 * @class DocumentDestinationResolver
 * @brief Finds the folder that receives a job's finished documents.
 */
class DocumentDestinationResolver {
public:
    virtual ~DocumentDestinationResolver() = default;

    /** @throws DestinationUnresolvedError */
    virtual std::filesystem::path resolve(const std::string& jobId) = 0;
};

/**
 * @class CompletionNotifier
 * @brief Sends completion confirmations (e-mail in production).
 */
class CompletionNotifier {
public:
    virtual ~CompletionNotifier() = default;

    virtual void notify(const std::vector<std::string>& recipients,
                        const std::string& subject,
                        const std::vector<std::string>& lines) = 0;
};

/**
 * @class WorkspaceValidator
 * @brief Supplies a workspace when a job's recorded one is missing on this machine.
 */
class WorkspaceValidator {
public:
    virtual ~WorkspaceValidator() = default;

    /**
     * @param current The recorded workspace, if any.
     * @return A usable workspace, or std::nullopt if none could be established.
     */
    virtual std::optional<std::string> validate(const std::string& jobId,
                                                const std::optional<std::string>& current) = 0;
};

} // namespace jobledger::domain
