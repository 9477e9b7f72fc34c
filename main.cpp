#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <utility>

#include "app/MissionControlApp.hpp"
#include "app/ShutdownSignal.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/TcpProbe.hpp"

using namespace missioncontrol;

namespace {

struct CommandLine {
    std::optional<int> port;
    std::filesystem::path settingsFile = infrastructure::PathUtils::GetDefaultSettingsFile();
    bool help = false;
};

void PrintUsage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [port] [--config <settings.json>]" << std::endl;
}

// Returns std::nullopt and prints the reason when the arguments are unusable.
std::optional<CommandLine> ParseArgs(int argc, char** argv) {
    CommandLine cmd;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            cmd.help = true;
        } else if (arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "--config needs a path" << std::endl;
                return std::nullopt;
            }
            cmd.settingsFile = infrastructure::PathUtils::ExpandUser(argv[++i]);
        } else {
            try {
                size_t used = 0;
                int port = std::stoi(arg, &used);
                if (used != arg.size() || port <= 0 || port > 65535) {
                    std::cerr << "Invalid port: " << arg << std::endl;
                    return std::nullopt;
                }
                cmd.port = port;
            } catch (const std::exception&) {
                std::cerr << "Unknown argument: " << arg << std::endl;
                return std::nullopt;
            }
        }
    }
    return cmd;
}

} // namespace

int main(int argc, char** argv) {
    auto cmd = ParseArgs(argc, argv);
    if (!cmd) {
        PrintUsage(argv[0]);
        return 2;
    }
    if (cmd->help) {
        PrintUsage(argv[0]);
        return 0;
    }

    infrastructure::HubConfig config = infrastructure::ConfigLoader::Load(cmd->settingsFile);
    if (cmd->port) config.port = *cmd->port;

    std::error_code ec;
    if (!std::filesystem::exists(config.projectsRoot, ec)) {
        std::cerr << "Error: projects root " << config.projectsRoot.string() << " does not exist." << std::endl;
        return 1;
    }

    if (infrastructure::TcpProbe::isReachable("127.0.0.1", config.port, config.probeTimeout)) {
        std::cout << "Mission Control already running on port " << config.port << "." << std::endl;
        return 0;
    }

    app::MissionControlApp app(std::move(config));
    app::ShutdownSignal::Install();
    app::ShutdownSignal shutdown([&app]() { app.Stop(); });

    return app.Run();
}
