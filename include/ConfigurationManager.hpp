#pragma once
#include <string>
#include <vector>

struct TelemetryConfig
{
    std::string outputPath = "telemetry.json";
    int writeInterval = 2;
    int trackRefreshCycles = 30;
    int signalRefreshCycles = 10;
    bool includeCargo = true;
    bool includeBuses = true;
    std::string archivePath;      // empty: no archive
    std::string replayFile;
    bool realtime = false;
};

class ConfigurationManager
{
private:
    TelemetryConfig config;

    static int parseInt(std::string const& what, std::string const& text);
    static int readInt(char const* name, int fallback);
    static bool readFlag(char const* name, bool fallback);

public:
    static inline const std::vector<int> ALLOWED_INTERVALS = {1, 2, 3, 5, 10, 15, 30};

    // Reads TRANSIT_TELEMETRY_* from the environment. Throws on invalid values.
    ConfigurationManager();

    // Command-line flags override the environment.
    void applyCommandLine(int argc, char const* const argv[]);

    [[nodiscard]] TelemetryConfig const& get() const noexcept;

    static void validateInterval(int seconds);
};
