#include "app/CommandLineArgs.h"

#include <cctype>
#include <sstream>
#include <string_view>

namespace nooku::app {

namespace {

[[nodiscard]] std::string ToLower(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return out;
}

// Splits "--opt=value" into name and value. Returns false when there is no '='.
[[nodiscard]] bool SplitInlineValue(std::string_view arg, std::string_view& name, std::string_view& value)
{
    const auto eq = arg.find('=');
    if (eq == std::string_view::npos)
        return false;
    name = arg.substr(0, eq);
    value = arg.substr(eq + 1);
    return true;
}

} // namespace

CommandLineArgs ParseCommandLineArgs(const std::vector<std::string>& args)
{
    CommandLineArgs out;

    for (std::size_t i = 0; i < args.size(); ++i)
    {
        const std::string& raw = args[i];
        if (raw.empty())
            continue;

        std::string_view nameRaw(raw);
        std::string_view inlineValue;
        const bool hasInline = SplitInlineValue(raw, nameRaw, inlineValue);
        const std::string name = ToLower(nameRaw);

        if (!hasInline)
        {
            if (name == "--help" || name == "-h" || name == "-?") { out.showHelp = true; continue; }
            if (name == "--write-config") { out.writeConfig = true; continue; }
        }

        std::optional<std::string>* dst = nullptr;
        if (name == "--config" || name == "-c")
            dst = &out.configPath;
        else if (name == "--songs" || name == "--songs-dir")
            dst = &out.songsDir;
        else if (name == "--log-dir" || name == "--logs")
            dst = &out.logDir;

        if (!dst)
        {
            out.unknown.push_back(raw);
            continue;
        }

        if (hasInline)
        {
            if (inlineValue.empty())
                out.unknown.push_back(raw);
            else
                *dst = std::string(inlineValue);
            continue;
        }

        if (i + 1 >= args.size() || args[i + 1].empty())
        {
            out.unknown.push_back(raw);
            continue;
        }
        *dst = args[++i];
    }

    return out;
}

CommandLineArgs ParseCommandLineArgs(int argc, const char* const* argv)
{
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i)
        args.emplace_back(argv[i] ? argv[i] : "");
    return ParseCommandLineArgs(args);
}

std::string BuildCommandLineHelpText()
{
    std::ostringstream oss;
    oss << "nooku - hourly, weather-aware music rotation\n\n";
    oss << "Options\n";
    oss << "  --config <path>     Settings file (default: nooku.ini)\n";
    oss << "  --songs <dir>       Song catalog directory (overrides songsDir)\n";
    oss << "  --log-dir <dir>     Where nooku.log is written (overrides logDir)\n";
    oss << "  --write-config      Save the effective settings back to the config file\n";
    oss << "  --help, -h          Show this help\n\n";

    oss << "Console commands\n";
    oss << "  play <channel>      Join a channel and start the rotation\n";
    oss << "  leave <channel>     Stop the rotation in a channel\n";
    oss << "  mute <channel>      Silence a channel without stopping the rotation\n";
    oss << "  unmute <channel>    Restore the configured volume\n";
    oss << "  weather             Report the current weather classification\n";
    oss << "  status              List active sessions\n";
    oss << "  history [n]         Show the last n messages (default 10)\n";
    oss << "  ping                Pong!\n";
    oss << "  quit                Leave every channel and exit\n\n";

    oss << "Examples\n";
    oss << "  nooku --songs ./songs\n";
    oss << "  nooku --config=/etc/nooku.ini --write-config\n";
    return oss.str();
}

} // namespace nooku::app
