#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "application/AppServices.hpp"
#include "domain/PlannerErrors.hpp"
#include "infrastructure/ApiServer.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/FfprobeMediaProbe.hpp"
#include "infrastructure/FileSystemMediaScanner.hpp"
#include "infrastructure/JsonPlaylistRepository.hpp"
#include "infrastructure/JsonUsageHistoryRepository.hpp"

using namespace playoutplanner;

namespace {

enum ExitCode {
    kExitOk = 0,
    kExitPartial = 1,
    kExitInvalidTemplate = 2,
    kExitInvariantViolation = 3,
    kExitInvalidCatalog = 4,
    kExitServerError = 5,
    kExitStorageError = 6
};

struct CommandLine {
    std::string configPath = "settings.json";
    std::string command;
    std::optional<std::string> date;
    bool allowPartial = false;
};

void PrintUsage() {
    std::cerr << "Usage: playout_planner [--config FILE] <command>\n"
              << "  serve                           start the HTTP API\n"
              << "  generate [--date YYYY-MM-DD] [--allow-partial]\n"
              << "                                  build and store one day's playlist\n"
              << "  scan                            list the media catalog" << std::endl;
}

std::optional<CommandLine> ParseArgs(int argc, char** argv) {
    CommandLine cli;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            cli.configPath = argv[++i];
        } else if (arg == "--date" && i + 1 < argc) {
            cli.date = argv[++i];
        } else if (arg == "--allow-partial") {
            cli.allowPartial = true;
        } else if (cli.command.empty() && (arg == "serve" || arg == "generate" || arg == "scan")) {
            cli.command = arg;
        } else {
            std::cerr << "[Main] Unexpected argument: " << arg << std::endl;
            return std::nullopt;
        }
    }
    if (cli.command.empty()) return std::nullopt;
    return cli;
}

application::AppServices BuildServices(const infrastructure::PlannerConfig& config) {
    application::AppServices services;
    services.persistenceService = std::make_shared<infrastructure::PersistenceService>();

    auto probe = std::make_shared<infrastructure::FfprobeMediaProbe>();
    auto scanner = std::make_shared<infrastructure::FileSystemMediaScanner>(
        config.videoDirectory, config.categoryMap, probe, config.defaultDurationSeconds);
    auto playlists = std::make_shared<infrastructure::JsonPlaylistRepository>(
        config.outputDirectory, services.persistenceService);
    auto rotation = std::make_shared<infrastructure::JsonUsageHistoryRepository>(
        config.resolvedStateFile(), services.persistenceService);

    services.playlistService = std::make_unique<application::PlaylistService>(
        scanner, playlists, rotation, config.fixedSlots, config.channel, config.durationTolerance);
    return services;
}

int RunGenerate(application::PlaylistService& service, const CommandLine& cli) {
    auto date = cli.date ? domain::PlaylistDate::Parse(*cli.date) : domain::PlaylistDate::Today();
    if (!date) {
        std::cerr << "[Main] Invalid date '" << *cli.date << "', expected YYYY-MM-DD" << std::endl;
        return kExitInvalidTemplate;
    }

    try {
        auto result = service.generate(*date);
        std::cout << "Playlist generated for " << result.document.date() << ": " << result.playlistFile
                  << " (" << result.document.entries().size() << " items)" << std::endl;
        if (!result.document.isComplete() && !cli.allowPartial) {
            return kExitPartial;
        }
        return kExitOk;
    } catch (const domain::InvalidTemplate& e) {
        std::cerr << "[Main] " << e.what() << std::endl;
        return kExitInvalidTemplate;
    } catch (const domain::AssemblyInvariantViolation& e) {
        std::cerr << "[Main] " << e.what() << std::endl;
        return kExitInvariantViolation;
    } catch (const domain::InvalidCatalog& e) {
        std::cerr << "[Main] " << e.what() << std::endl;
        return kExitInvalidCatalog;
    } catch (const std::exception& e) {
        std::cerr << "[Main] Generation failed: " << e.what() << std::endl;
        return kExitStorageError;
    }
}

int RunScan(application::PlaylistService& service) {
    try {
        auto catalog = service.buildCatalog();
        for (const auto& category : catalog.categories()) {
            const auto& items = catalog.itemsFor(category);
            std::cout << category << " (" << items.size() << ")" << std::endl;
            for (const auto& item : items) {
                std::cout << "  " << item.filePath << "  " << item.durationSeconds << "s" << std::endl;
            }
        }
        return kExitOk;
    } catch (const domain::InvalidCatalog& e) {
        std::cerr << "[Main] " << e.what() << std::endl;
        return kExitInvalidCatalog;
    }
}

} // namespace

int main(int argc, char** argv) {
    auto cli = ParseArgs(argc, argv);
    if (!cli) {
        PrintUsage();
        return kExitInvalidTemplate;
    }

    auto config = infrastructure::ConfigLoader::Load(cli->configPath);
    infrastructure::ConfigLoader::ApplyEnvironment(config);
    auto services = BuildServices(config);

    int code = kExitOk;
    if (cli->command == "serve") {
        infrastructure::ApiServer server(*services.playlistService);
        if (!server.listen(config.httpHost, config.httpPort)) {
            std::cerr << "[Main] Could not bind " << config.httpHost << ":" << config.httpPort << std::endl;
            code = kExitServerError;
        }
    } else if (cli->command == "generate") {
        code = RunGenerate(*services.playlistService, *cli);
    } else {
        code = RunScan(*services.playlistService);
    }

    services.persistenceService->stop();
    if (services.persistenceService->failedWrites() > 0) {
        std::cerr << "[Main] " << services.persistenceService->failedWrites()
                  << " file write(s) failed" << std::endl;
        if (code == kExitOk || code == kExitPartial) code = kExitStorageError;
    }
    return code;
}
