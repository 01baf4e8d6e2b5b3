#include <iostream>
#include <memory>
#include <string>
#include "CapturedHost.hpp"
#include "ConfigurationManager.hpp"
#include "ReplayEngine.hpp"
#include "SnapshotArchive.hpp"
#include "SnapshotOrchestrator.hpp"

int main(int argc, char* argv[])
{
    try
    {
        ConfigurationManager configuration;
        configuration.applyCommandLine(argc, argv);
        TelemetryConfig const& config = configuration.get();

        if (config.replayFile.empty())
        {
            std::cerr << "Usage: transit_telemetry --replay <capture> [--out <file>] [--interval <s>] "
                         "[--archive <db>] [--realtime] [--no-cargo] [--no-buses]\n"
                         "No live host is attached; --replay is required.\n";
            return 1;
        }

        std::unique_ptr<SnapshotArchive> archive;
        if (!config.archivePath.empty())
        {
            archive = std::make_unique<SnapshotArchive>(config.archivePath);
            std::cout << "[System] Archiving snapshots to " << config.archivePath << std::endl;
        }

        CapturedHost host;
        if (!ReplayEngine::prime(config.replayFile, host))
            std::cerr << "[System] WARNING: no readable frame in " << config.replayFile << "\n";

        SnapshotOrchestrator orchestrator(host, config, archive.get());
        orchestrator.setup();

        ReplayStats stats = ReplayEngine::run(config.replayFile, host, orchestrator, config.realtime);

        std::cout << "[System] Done. " << orchestrator.writeCount() << " snapshots from "
                  << stats.frames << " frames." << std::endl;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Main Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
