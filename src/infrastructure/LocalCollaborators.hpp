/**
 * @file LocalCollaborators.hpp
 * @brief Filesystem-backed stand-ins for the document resolver and notifier.
 */

#pragma once

#include <filesystem>
#include <mutex>
#include <optional>

#include "domain/ExternalServices.hpp"

namespace jobledger::infrastructure {

/**
 * @class DirectoryDestinationResolver
 * @brief Resolves a job's issued documents folder as "<root>/<jobId>".
 *
 * The folder must already exist; it is never created here.
 */
class DirectoryDestinationResolver : public domain::DocumentDestinationResolver {
public:
    explicit DirectoryDestinationResolver(std::optional<std::filesystem::path> root);

    std::filesystem::path resolve(const std::string& jobId) override;

private:
    std::optional<std::filesystem::path> m_root;
};

/**
 * @class LogFileNotifier
 * @brief Appends completion confirmations to a log file, or stdout when none is set.
 */
class LogFileNotifier : public domain::CompletionNotifier {
public:
    explicit LogFileNotifier(std::optional<std::filesystem::path> logPath);

    void notify(const std::vector<std::string>& recipients,
                const std::string& subject,
                const std::vector<std::string>& lines) override;

private:
    std::optional<std::filesystem::path> m_logPath;
    std::mutex m_mutex;
};

} // namespace jobledger::infrastructure
