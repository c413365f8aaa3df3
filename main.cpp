#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "app/JobLedgerApp.hpp"
#include "infrastructure/ConfigLoader.hpp"

using namespace jobledger;

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    std::optional<std::filesystem::path> configPath;
    if (args.size() >= 2 && args[0] == "--config") {
        configPath = args[1];
        args.erase(args.begin(), args.begin() + 2);
    }
    if (!args.empty() && (args[0] == "-h" || args[0] == "--help")) {
        app::JobLedgerApp::PrintUsage();
        return 0;
    }

    app::JobLedgerApp app(infrastructure::ConfigLoader::Load(configPath));
    return app.Run(args);
}
