/**
 * @file JobLedgerApp.hpp
 * @brief Command-line application class for JobLedger.
 */

#pragma once

#include <string>
#include <vector>

#include "application/AppServices.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace jobledger::app {

/**
 * @class JobLedgerApp
 * @brief Wires the services from the settings and runs one subcommand.
 */
class JobLedgerApp {
public:
    explicit JobLedgerApp(infrastructure::StoreSettings settings);

    /**
     * @brief Runs @p args (subcommand first).
     * @return Exit code: 0 on success, 1 on a failed operation, 2 on bad usage.
     */
    int Run(const std::vector<std::string>& args);

    static void PrintUsage();

private:
    /**
     * @brief Connects to the job storage and builds the service graph.
     * @return False if storage stayed unreachable after every attempt.
     */
    bool Init();

    bool ConnectStorage();
    int Dispatch(const std::string& command, const std::vector<std::string>& params);

    int CmdCreate(const std::vector<std::string>& params);
    int CmdShow(const std::vector<std::string>& params);
    int CmdList();
    int CmdGlance(const std::vector<std::string>& params);
    int CmdAdd(const std::vector<std::string>& params);
    int CmdAdmit(const std::vector<std::string>& params);
    int CmdNote(const std::vector<std::string>& params);
    int CmdOwner(const std::vector<std::string>& params);
    int CmdDue(const std::vector<std::string>& params);
    int CmdAlias(const std::vector<std::string>& params);
    int CmdRename(const std::vector<std::string>& params);
    int CmdCopy(const std::vector<std::string>& params);
    int CmdDelete(const std::vector<std::string>& params);
    int CmdStatus(const std::vector<std::string>& params);
    int CmdClose(const std::vector<std::string>& params);
    int CmdLocks(const std::vector<std::string>& params);

    infrastructure::StoreSettings m_settings;
    application::AppServices m_services;
};

} // namespace jobledger::app
