#pragma once

#include <optional>
#include <string>
#include <vector>

namespace nooku::app {

// Parsed command-line arguments for the nooku executable.
//
// Notes:
//   - All option names are case-insensitive; values keep their case.
//   - Both "--opt=value" and "--opt value" forms are supported.
struct CommandLineArgs
{
    bool showHelp = false;     // --help / -h
    bool writeConfig = false;  // --write-config (save the effective config and continue)

    std::optional<std::string> configPath; // --config <path>
    std::optional<std::string> songsDir;   // --songs <dir>
    std::optional<std::string> logDir;     // --log-dir <dir>

    // Any unknown/unsupported args are collected here (so we can show a useful error).
    std::vector<std::string> unknown;
};

// Parse argv (argv[0] is skipped).
[[nodiscard]] CommandLineArgs ParseCommandLineArgs(int argc, const char* const* argv);
[[nodiscard]] CommandLineArgs ParseCommandLineArgs(const std::vector<std::string>& args);

// Human-readable help text for the console.
[[nodiscard]] std::string BuildCommandLineHelpText();

} // namespace nooku::app
