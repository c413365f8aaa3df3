#include "application/StatusTransitionService.hpp"

#include <iostream>
#include <set>
#include <system_error>

#include "domain/Errors.hpp"
#include "domain/ProjectKey.hpp"

namespace jobledger::application {

namespace fs = std::filesystem;
using namespace jobledger::domain;

StatusTransitionService::StatusTransitionService(std::shared_ptr<DocumentDestinationResolver> resolver,
                                                 std::string documentExtension)
    : m_resolver(std::move(resolver)), m_scanner(std::move(documentExtension)) {}

TransitionReport StatusTransitionService::apply(Job& job, const std::vector<std::string>& keys,
                                                ProjectStatus status) {
    for (const auto& key : keys) {
        if (!job.hasProject(key)) throw ProjectNotFoundError(job.id(), key);
    }

    TransitionReport report;
    if (IsTerminal(status)) {
        report.expected = DrawingNumbersIn(keys);
        fs::path destination = m_resolver->resolve(job.id());

        std::set<std::string> wanted(report.expected.begin(), report.expected.end());
        std::set<std::string> found;
        for (const auto& doc : documentsOf(job)) {
            std::string token = infrastructure::WorkspaceDocumentScanner::LeadingToken(doc);
            if (!wanted.count(token)) continue;
            fs::path target = MoveDocument(doc, destination);
            if (!target.empty()) {
                report.moved.push_back(target);
                found.insert(token);
            }
        }
        for (const auto& id : report.expected) {
            if (!found.count(id)) report.missing.push_back(id);
        }
    }

    for (const auto& key : keys) {
        job.project(key).setStatus(status);
    }
    return report;
}

std::vector<fs::path> StatusTransitionService::moveAllDocuments(const Job& job, const fs::path& destination) {
    std::vector<fs::path> moved;
    for (const auto& doc : documentsOf(job)) {
        fs::path target = MoveDocument(doc, destination);
        if (!target.empty()) moved.push_back(target);
    }
    return moved;
}

std::vector<fs::path> StatusTransitionService::documentsOf(const Job& job) const {
    if (!job.workspace()) {
        std::cerr << "[StatusTransitionService] Job " << job.id() << " has no workspace to search" << std::endl;
        return {};
    }
    return m_scanner.scan(*job.workspace());
}

fs::path StatusTransitionService::MoveDocument(const fs::path& source, const fs::path& destinationDir) {
    fs::path target = destinationDir / source.filename();

    std::error_code ec;
    fs::rename(source, target, ec);
    if (!ec) return target;

    if (ec == std::errc::cross_device_link) {
        ec.clear();
        fs::copy_file(source, target, fs::copy_options::overwrite_existing, ec);
        if (!ec) {
            fs::remove(source, ec);
            if (ec) {
                std::cerr << "[StatusTransitionService] Copied " << source << " but could not remove it: "
                          << ec.message() << std::endl;
            }
            return target;
        }
    }
    std::cerr << "[StatusTransitionService] Could not move " << source << " to " << destinationDir
              << ": " << ec.message() << std::endl;
    return {};
}

} // namespace jobledger::application
