#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include "ConfigurationManager.hpp"

int ConfigurationManager::parseInt(std::string const& what, std::string const& text)
{
    try
    {
        std::size_t used = 0;
        int value = std::stoi(text, &used);
        if (used != text.size())
            throw std::invalid_argument(text);
        return value;
    }
    catch (std::logic_error const&)
    {
        throw std::runtime_error(what + " is not an integer: " + text);
    }
}

int ConfigurationManager::readInt(char const* name, int fallback)
{
    char const* env = std::getenv(name);
    if (!env || !*env)
        return fallback;
    return parseInt(name, env);
}

bool ConfigurationManager::readFlag(char const* name, bool fallback)
{
    char const* env = std::getenv(name);
    if (!env || !*env)
        return fallback;

    std::string v = env;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "1" || v == "true" || v == "yes" || v == "on")
        return true;
    if (v == "0" || v == "false" || v == "no" || v == "off")
        return false;
    throw std::runtime_error(std::string(name) + " is not a boolean: " + env);
}

void ConfigurationManager::validateInterval(int seconds)
{
    if (std::find(ALLOWED_INTERVALS.begin(), ALLOWED_INTERVALS.end(), seconds) == ALLOWED_INTERVALS.end())
        throw std::runtime_error("write interval must be one of 1, 2, 3, 5, 10, 15, 30 (got " + std::to_string(seconds) + ")");
}

ConfigurationManager::ConfigurationManager()
{
    if (char const* out = std::getenv("TRANSIT_TELEMETRY_OUTPUT"); out && *out)
        config.outputPath = out;
    if (char const* archive = std::getenv("TRANSIT_TELEMETRY_ARCHIVE"))
        config.archivePath = archive;

    config.writeInterval = readInt("TRANSIT_TELEMETRY_INTERVAL", config.writeInterval);
    validateInterval(config.writeInterval);

    config.trackRefreshCycles = readInt("TRANSIT_TELEMETRY_TRACK_REFRESH", config.trackRefreshCycles);
    config.signalRefreshCycles = readInt("TRANSIT_TELEMETRY_SIGNAL_REFRESH", config.signalRefreshCycles);
    if (config.trackRefreshCycles <= 0 || config.signalRefreshCycles <= 0)
        throw std::runtime_error("cache refresh periods must be positive");

    config.includeCargo = readFlag("TRANSIT_TELEMETRY_INCLUDE_CARGO", config.includeCargo);
    config.includeBuses = readFlag("TRANSIT_TELEMETRY_INCLUDE_BUSES", config.includeBuses);
}

void ConfigurationManager::applyCommandLine(int argc, char const* const argv[])
{
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        if (arg == "--replay" && i + 1 < argc)
        {
            config.replayFile = argv[++i];
        }
        else if (arg == "--out" && i + 1 < argc)
        {
            config.outputPath = argv[++i];
        }
        else if (arg == "--archive" && i + 1 < argc)
        {
            config.archivePath = argv[++i];
        }
        else if (arg == "--interval" && i + 1 < argc)
        {
            int seconds = parseInt("--interval", argv[++i]);
            validateInterval(seconds);
            config.writeInterval = seconds;
        }
        else if (arg == "--realtime")
        {
            config.realtime = true;
        }
        else if (arg == "--no-cargo")
        {
            config.includeCargo = false;
        }
        else if (arg == "--no-buses")
        {
            config.includeBuses = false;
        }
        else
        {
            std::cerr << "Warning: ignoring unknown or malformed argument: " << arg << "\n";
        }
    }
}

TelemetryConfig const& ConfigurationManager::get() const noexcept { return config; }
