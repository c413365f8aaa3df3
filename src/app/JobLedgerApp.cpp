/**
 * @file JobLedgerApp.cpp
 * @brief Composition root and subcommands of the jobledger tool.
 */

#include "app/JobLedgerApp.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <thread>

#include <nlohmann/json.hpp>

#include "application/WorkspaceService.hpp"
#include "domain/Errors.hpp"
#include "domain/ProjectKey.hpp"
#include "infrastructure/FileJobRepository.hpp"
#include "infrastructure/FileLockService.hpp"
#include "infrastructure/LocalCollaborators.hpp"

namespace jobledger::app {

namespace fs = std::filesystem;
using namespace jobledger::domain;

namespace {

// Checks out the single job the keys belong to, applies the edit and saves.
void EditSelection(application::JobService& jobs, const std::vector<std::string>& keys,
                   const std::function<void(Job&)>& edit) {
    std::string jobId = application::JobService::JobIdForSelection(keys);
    application::JobCheckout checkout = jobs.checkout(jobId);
    edit(checkout.job());
    jobs.saveAndRelease(checkout);
}

int UsageError() {
    JobLedgerApp::PrintUsage();
    return 2;
}

std::vector<std::string> Tail(const std::vector<std::string>& params, size_t from) {
    if (from >= params.size()) return {};
    return std::vector<std::string>(params.begin() + from, params.end());
}

void PrintProject(const std::string& key, const Project& project) {
    std::cout << key << "\n"
              << "  alias:  " << project.aliasNum() << "\n"
              << "  status: " << StatusToString(project.status()) << "\n"
              << "  owner:  " << project.owner() << "\n"
              << "  due:    " << project.dueDate() << "\n";
    for (const auto& note : project.notes().entries()) {
        std::cout << "  [" << note.label << "] " << note.text << "\n";
    }
}

void PrintGlance(const std::map<std::string, GlanceCounts>& glance) {
    std::cout << std::left << std::setw(8) << "Job" << std::setw(9) << "Expired"
              << std::setw(7) << "Today" << "Approaching" << "\n";
    for (const auto& [jobId, counts] : glance) {
        std::cout << std::setw(8) << jobId << std::setw(9) << counts.expired
                  << std::setw(7) << counts.today << counts.approaching << "\n";
    }
}

} // namespace

JobLedgerApp::JobLedgerApp(infrastructure::StoreSettings settings)
    : m_settings(std::move(settings)) {}

void JobLedgerApp::PrintUsage() {
    std::cout <<
        "Usage: jobledger [--config FILE] <command> [args]\n"
        "  create <job> [workspace]\n"
        "  show <job>\n"
        "  list\n"
        "  glance [--owner NAME] [--today MM/DD/YYYY]\n"
        "  add <job> <alias> <due> <instructions> [owner]\n"
        "  admit <entries.json>\n"
        "  note <key> <text>\n"
        "  owner <owner> <keys...>\n"
        "  due <date> <keys...>\n"
        "  alias <key> <alias>\n"
        "  rename <old> <new>\n"
        "  copy <keys...>\n"
        "  delete <keys...>\n"
        "  status <status> <keys...>\n"
        "  close <job>\n"
        "  locks <job>\n";
}

bool JobLedgerApp::ConnectStorage() {
    auto repository = std::make_shared<infrastructure::FileJobRepository>(m_settings.jobsDir);
    const int attempts = std::max(1, m_settings.connectAttempts);

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        std::error_code ec;
        fs::create_directories(m_settings.jobsDir, ec);
        try {
            repository->listActive();
            return true;
        } catch (const StorageIOError& e) {
            std::cerr << "[JobLedgerApp] Storage unavailable (attempt " << attempt << "/" << attempts
                      << "): " << e.what() << std::endl;
        }
        if (attempt < attempts) {
            std::this_thread::sleep_for(std::chrono::milliseconds(m_settings.connectDelayMs));
        }
    }
    return false;
}

bool JobLedgerApp::Init() {
    if (!ConnectStorage()) {
        std::cerr << "Unable to reach the job storage at " << m_settings.jobsDir << std::endl;
        return false;
    }

    // Composition Root
    auto repository = std::make_shared<infrastructure::FileJobRepository>(m_settings.jobsDir);
    auto locks = std::make_shared<infrastructure::FileLockService>(m_settings.jobsDir);
    auto validator = std::make_shared<application::DirectoryWorkspaceValidator>(m_settings.workspaceRoot);
    auto resolver = std::make_shared<infrastructure::DirectoryDestinationResolver>(m_settings.destinationRoot);
    auto notifier = std::make_shared<infrastructure::LogFileNotifier>(m_settings.notificationLog);
    auto taskManager = std::make_shared<application::AsyncTaskManager>();

    m_services.jobService = std::make_shared<application::JobService>(repository, locks, m_settings.user, validator);
    m_services.transitionService = std::make_shared<application::StatusTransitionService>(
        resolver, m_settings.documentExtension);
    m_services.closureService = std::make_unique<application::JobClosureService>(
        m_services.jobService, m_services.transitionService, notifier, m_settings.completionRecipients);
    m_services.admissionService = std::make_unique<application::JobAdmissionService>(m_services.jobService, taskManager);
    m_services.aggregator = std::make_unique<infrastructure::SnapshotAggregator>(
        repository, m_settings.tempDir, m_settings.user);
    m_services.taskManager = taskManager;
    return true;
}

int JobLedgerApp::Run(const std::vector<std::string>& args) {
    if (args.empty()) {
        PrintUsage();
        return 2;
    }
    if (!Init()) {
        return 1;
    }

    try {
        return Dispatch(args.front(), Tail(args, 1));
    } catch (const JobStoreError& e) {
        std::cerr << "Error (" << ErrorKindToString(e.kind()) << "): " << e.what() << std::endl;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
    }
    return 1;
}

int JobLedgerApp::Dispatch(const std::string& command, const std::vector<std::string>& params) {
    if (command == "create") return CmdCreate(params);
    if (command == "show") return CmdShow(params);
    if (command == "list") return CmdList();
    if (command == "glance") return CmdGlance(params);
    if (command == "add") return CmdAdd(params);
    if (command == "admit") return CmdAdmit(params);
    if (command == "note") return CmdNote(params);
    if (command == "owner") return CmdOwner(params);
    if (command == "due") return CmdDue(params);
    if (command == "alias") return CmdAlias(params);
    if (command == "rename") return CmdRename(params);
    if (command == "copy") return CmdCopy(params);
    if (command == "delete") return CmdDelete(params);
    if (command == "status") return CmdStatus(params);
    if (command == "close") return CmdClose(params);
    if (command == "locks") return CmdLocks(params);

    std::cerr << "Unknown command: " << command << std::endl;
    PrintUsage();
    return 2;
}

int JobLedgerApp::CmdCreate(const std::vector<std::string>& params) {
    if (params.empty() || params.size() > 2) return UsageError();
    std::optional<std::string> workspace;
    if (params.size() == 2) workspace = params[1];

    m_services.jobService->createJob(params[0], workspace);
    if (workspace) {
        application::WorkspaceService().EnsureWorkspaceFolders(*workspace);
    }
    std::cout << "Created job " << params[0] << std::endl;
    return 0;
}

int JobLedgerApp::CmdShow(const std::vector<std::string>& params) {
    if (params.size() != 1) return UsageError();
    Job job = m_services.jobService->read(params[0]);

    std::cout << "Job " << job.id() << "\n"
              << "Workspace: " << job.workspace().value_or("(none)") << "\n";
    auto latest = job.latestDueDate();
    std::cout << "Latest due date: " << (latest ? latest->toString() : "not found") << "\n";
    for (const auto& [key, project] : job.projects()) {
        PrintProject(key, project);
    }
    return 0;
}

int JobLedgerApp::CmdList() {
    for (const auto& [key, project] : m_services.aggregator->collect()) {
        std::cout << std::left << std::setw(22) << key << std::setw(12) << StatusToString(project.status())
                  << std::setw(12) << project.dueDate() << project.owner() << "\n";
    }
    return 0;
}

int JobLedgerApp::CmdGlance(const std::vector<std::string>& params) {
    std::optional<std::string> owner;
    CalendarDate today = CalendarDate::Today();
    for (size_t i = 0; i < params.size(); ++i) {
        if (params[i] == "--owner" && i + 1 < params.size()) {
            owner = params[++i];
        } else if (params[i] == "--today" && i + 1 < params.size()) {
            today = CalendarDate::ParseOrThrow(params[++i]);
        } else {
            return UsageError();
        }
    }

    PrintGlance(owner ? m_services.aggregator->jobsAtAGlanceFor(*owner, today)
                      : m_services.aggregator->jobsAtAGlance(today));
    return 0;
}

int JobLedgerApp::CmdAdd(const std::vector<std::string>& params) {
    if (params.size() < 4 || params.size() > 5) return UsageError();
    const std::string& jobId = params[0];
    const std::string& alias = params[1];
    if (JobIdFromKey(alias) != jobId) {
        throw std::invalid_argument("Alias " + alias + " does not belong to job " + jobId);
    }
    std::string owner = params.size() == 5 ? params[4] : "";

    EditSelection(*m_services.jobService, {alias}, [&](Job& job) {
        job.addProject(alias, params[3], owner, params[2]);
    });
    std::cout << "Added " << alias << std::endl;
    return 0;
}

int JobLedgerApp::CmdAdmit(const std::vector<std::string>& params) {
    if (params.size() != 1) return UsageError();
    std::ifstream in(params[0]);
    if (!in.is_open()) {
        throw std::invalid_argument("Cannot open " + params[0]);
    }
    nlohmann::json j;
    in >> j;

    std::vector<application::AdmissionEntry> entries;
    for (const auto& item : j) {
        application::AdmissionEntry entry;
        entry.aliasNum = item.at("alias_num").get<std::string>();
        entry.workInstructions = item.value("work_instructions", std::string());
        entry.dueDate = item.at("due_date").get<std::string>();
        entry.owner = item.value("owner", std::string());
        entries.push_back(std::move(entry));
    }

    auto result = std::make_shared<application::AdmissionResult>();
    auto status = m_services.admissionService->submit(std::move(entries), result);
    std::cout << status->description << "..." << std::endl;
    m_services.taskManager->WaitAll();

    if (status->failed) {
        std::cerr << "Admission aborted: " << status->errorMessage << std::endl;
        return 1;
    }
    for (const auto& jobId : result->admitted) std::cout << "Admitted " << jobId << "\n";
    for (const auto& jobId : result->skipped) std::cout << "Skipped " << jobId << " (already exists)\n";
    for (const auto& [jobId, message] : result->failed) std::cout << "Failed " << jobId << ": " << message << "\n";
    return result->failed.empty() ? 0 : 1;
}

int JobLedgerApp::CmdNote(const std::vector<std::string>& params) {
    if (params.size() != 2) return UsageError();
    std::string label;
    EditSelection(*m_services.jobService, {params[0]}, [&](Job& job) {
        label = job.project(params[0]).addNote(params[1], m_settings.user);
    });
    std::cout << "Added note '" << label << "'" << std::endl;
    return 0;
}

int JobLedgerApp::CmdOwner(const std::vector<std::string>& params) {
    if (params.size() < 2) return UsageError();
    auto keys = Tail(params, 1);
    EditSelection(*m_services.jobService, keys, [&](Job& job) {
        for (const auto& key : keys) job.project(key).setOwner(params[0]);
    });
    return 0;
}

int JobLedgerApp::CmdDue(const std::vector<std::string>& params) {
    if (params.size() < 2) return UsageError();
    CalendarDate::ParseOrThrow(params[0]);
    auto keys = Tail(params, 1);
    EditSelection(*m_services.jobService, keys, [&](Job& job) {
        for (const auto& key : keys) job.project(key).setDueDate(params[0]);
    });
    return 0;
}

int JobLedgerApp::CmdAlias(const std::vector<std::string>& params) {
    if (params.size() != 2) return UsageError();
    EditSelection(*m_services.jobService, {params[0]}, [&](Job& job) {
        job.project(params[0]).setAliasNum(params[1]);
    });
    return 0;
}

int JobLedgerApp::CmdRename(const std::vector<std::string>& params) {
    if (params.size() != 2) return UsageError();
    EditSelection(*m_services.jobService, params, [&](Job& job) {
        job.renameProject(params[0], params[1]);
    });
    std::cout << "Renamed " << params[0] << " to " << params[1] << std::endl;
    return 0;
}

int JobLedgerApp::CmdCopy(const std::vector<std::string>& params) {
    if (params.empty()) return UsageError();
    std::vector<std::string> copies;
    EditSelection(*m_services.jobService, params, [&](Job& job) {
        for (const auto& key : params) copies.push_back(job.duplicateProject(key));
    });
    for (const auto& key : copies) std::cout << "Created " << key << "\n";
    return 0;
}

int JobLedgerApp::CmdDelete(const std::vector<std::string>& params) {
    if (params.empty()) return UsageError();
    EditSelection(*m_services.jobService, params, [&](Job& job) {
        for (const auto& key : params) job.removeProject(key);
    });
    return 0;
}

int JobLedgerApp::CmdStatus(const std::vector<std::string>& params) {
    if (params.size() < 2) return UsageError();
    ProjectStatus status = StatusFromString(params[0]);
    auto keys = Tail(params, 1);

    application::TransitionReport report;
    EditSelection(*m_services.jobService, keys, [&](Job& job) {
        report = m_services.transitionService->apply(job, keys, status);
    });

    for (const auto& path : report.moved) std::cout << "Moved " << path.string() << "\n";
    if (!report.missing.empty()) {
        std::cout << "No document found for:";
        for (const auto& id : report.missing) std::cout << " " << id;
        std::cout << "\n";
    }
    return 0;
}

int JobLedgerApp::CmdClose(const std::vector<std::string>& params) {
    if (params.size() != 1) return UsageError();
    application::JobCheckout checkout = m_services.jobService->checkout(params[0]);
    auto report = m_services.closureService->closeJob(checkout);

    std::cout << "Closed job " << report.jobId << ": " << report.movedDocuments << " document(s) moved, "
              << report.incompleteCount << " of " << report.drawingCount << " drawing(s) incomplete" << std::endl;
    return 0;
}

int JobLedgerApp::CmdLocks(const std::vector<std::string>& params) {
    if (params.size() != 1) return UsageError();
    auto owner = m_services.jobService->lockOwner(params[0]);
    std::cout << params[0] << ": " << (owner ? "locked by " + *owner : std::string("free")) << std::endl;
    return 0;
}

} // namespace jobledger::app
