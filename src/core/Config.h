#pragma once
#include <cstdint>
#include <filesystem>
#include <string>

namespace nooku::core {

struct Config {
    std::filesystem::path songsDir   = "songs";
    double latitude                  = 34.221924;
    double longitude                 = -79.814693;
    std::filesystem::path apiKeyFile = "api_key";
    std::string weatherApiUrl        = "https://api.openweathermap.org/data/2.5/";
    int   weatherCooldownMinutes     = 10;
    int   weatherTimeoutSeconds      = 10;
    int   hourOffsetMs               = 500;   // fire slightly after the hour boundary
    float volume                     = 1.0f;
    int   loopSeconds                = 180;
    std::string duplicateKeys        = "last"; // last | first | reject
    std::filesystem::path logDir     = "logs";
    std::int64_t maxTrackBytes       = 64ll * 1024 * 1024;
};

// Tiny INI-style file: key=value lines. Returns false when the file is missing or unreadable.
bool LoadConfig(Config& cfg, const std::filesystem::path& file);
bool SaveConfig(const Config& cfg, const std::filesystem::path& file);

// NOOKU_WEATHER_API_KEY wins over the key file. Empty when neither is present.
std::string ResolveApiKey(const Config& cfg);

} // namespace nooku::core
