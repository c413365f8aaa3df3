#include "infrastructure/LocalCollaborators.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

#include "domain/Errors.hpp"
#include "domain/NoteLog.hpp"

namespace jobledger::infrastructure {

namespace fs = std::filesystem;
using namespace jobledger::domain;

DirectoryDestinationResolver::DirectoryDestinationResolver(std::optional<fs::path> root)
    : m_root(std::move(root)) {}

fs::path DirectoryDestinationResolver::resolve(const std::string& jobId) {
    if (!m_root) {
        throw DestinationUnresolvedError(jobId, "no destination root is configured");
    }
    fs::path folder = *m_root / jobId;
    std::error_code ec;
    if (!fs::is_directory(folder, ec)) {
        throw DestinationUnresolvedError(jobId, folder.string() + " does not exist");
    }
    return folder;
}

LogFileNotifier::LogFileNotifier(std::optional<fs::path> logPath)
    : m_logPath(std::move(logPath)) {}

void LogFileNotifier::notify(const std::vector<std::string>& recipients,
                             const std::string& subject,
                             const std::vector<std::string>& lines) {
    std::ostringstream message;
    message << "[" << NoteLog::Timestamp(std::chrono::system_clock::now()) << "] " << subject << " -> ";
    for (size_t i = 0; i < recipients.size(); ++i) {
        message << (i ? ", " : "") << recipients[i];
    }
    message << "\n";
    for (const auto& line : lines) {
        message << "    " << line << "\n";
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_logPath) {
        std::cout << message.str();
        return;
    }
    std::ofstream log(*m_logPath, std::ios::app);
    if (!log.is_open()) {
        std::cerr << "[LogFileNotifier] Cannot open " << *m_logPath << ", confirmation follows:" << std::endl;
        std::cerr << message.str();
        return;
    }
    log << message.str();
}

} // namespace jobledger::infrastructure
