#include "core/Config.h"
#include "core/Log.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string_view>
#include <system_error>

namespace nooku::core {

static inline void TrimInPlace(std::string& s)
{
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

    while (!s.empty() && is_space(static_cast<unsigned char>(s.front())))
        s.erase(s.begin());

    while (!s.empty() && is_space(static_cast<unsigned char>(s.back())))
        s.pop_back();
}

static std::string_view Trimmed(std::string_view sv) noexcept
{
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
        sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
        sv.remove_suffix(1);
    return sv;
}

template <class T>
static bool ParseNumber(std::string_view sv, T& out) noexcept
{
    sv = Trimmed(sv);
    if (!sv.empty() && sv.front() == '+')
        sv.remove_prefix(1);

    T v{};
    const char* begin = sv.data();
    const char* end = sv.data() + sv.size();
    const auto [ptr, ec] = std::from_chars(begin, end, v);
    if (ec != std::errc{} || ptr != end || begin == end)
        return false;

    out = v;
    return true;
}

static bool EqualsI(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size())
        return false;

    for (std::size_t i = 0; i < a.size(); ++i)
    {
        const unsigned char ca = static_cast<unsigned char>(a[i]);
        const unsigned char cb = static_cast<unsigned char>(b[i]);
        if (std::tolower(ca) != std::tolower(cb))
            return false;
    }

    return true;
}

static bool ParsePolicy(std::string_view sv, std::string& out)
{
    sv = Trimmed(sv);
    for (std::string_view candidate : {"last", "first", "reject"})
    {
        if (EqualsI(sv, candidate))
        {
            out = std::string(candidate);
            return true;
        }
    }
    return false;
}

static void StripInlineComment(std::string& v)
{
    const std::size_t hashPos = v.find('#');
    const std::size_t semiPos = v.find(';');

    std::size_t cut = std::string::npos;
    if (hashPos != std::string::npos) cut = hashPos;
    if (semiPos != std::string::npos && (cut == std::string::npos || semiPos < cut)) cut = semiPos;

    if (cut != std::string::npos)
    {
        v.erase(cut);
        TrimInPlace(v);
    }
}

bool LoadConfig(Config& cfg, const std::filesystem::path& file)
{
    std::ifstream f(file, std::ios::binary);
    if (!f)
        return false;

    std::ostringstream oss;
    oss << f.rdbuf();
    std::string text = oss.str();

    // Tolerate a UTF-8 BOM from editors.
    if (text.size() >= 3 && static_cast<unsigned char>(text[0]) == 0xEF &&
        static_cast<unsigned char>(text[1]) == 0xBB && static_cast<unsigned char>(text[2]) == 0xBF)
        text.erase(0, 3);

    std::istringstream iss(text);
    std::string line;
    int lineNo = 0;
    while (std::getline(iss, line))
    {
        ++lineNo;
        std::string tmp = line;
        TrimInPlace(tmp);
        if (tmp.empty()) continue;
        if (tmp[0] == '#' || tmp[0] == ';' || tmp[0] == '[') continue;

        const auto pos = tmp.find('=');
        if (pos == std::string::npos) continue;

        std::string k = tmp.substr(0, pos);
        std::string v = tmp.substr(pos + 1);
        TrimInPlace(k);
        TrimInPlace(v);

        // URLs may legitimately carry '#'; only strip comments for other keys.
        if (k != "weatherApiUrl")
            StripInlineComment(v);

        if (k.empty()) continue;

        bool ok = true;
        if (k == "songsDir")                    { if (v.empty()) ok = false; else cfg.songsDir = v; }
        else if (k == "latitude")               ok = ParseNumber(v, cfg.latitude);
        else if (k == "longitude")              ok = ParseNumber(v, cfg.longitude);
        else if (k == "apiKeyFile")             cfg.apiKeyFile = v;
        else if (k == "weatherApiUrl")          { if (v.empty()) ok = false; else cfg.weatherApiUrl = v; }
        else if (k == "weatherCooldownMinutes") ok = ParseNumber(v, cfg.weatherCooldownMinutes);
        else if (k == "weatherTimeoutSeconds")  ok = ParseNumber(v, cfg.weatherTimeoutSeconds);
        else if (k == "hourOffsetMs")           ok = ParseNumber(v, cfg.hourOffsetMs);
        else if (k == "volume")                 ok = ParseNumber(v, cfg.volume);
        else if (k == "loopSeconds")            ok = ParseNumber(v, cfg.loopSeconds);
        else if (k == "duplicateKeys")          ok = ParsePolicy(v, cfg.duplicateKeys);
        else if (k == "logDir")                 { if (v.empty()) ok = false; else cfg.logDir = v; }
        else if (k == "maxTrackBytes")          ok = ParseNumber(v, cfg.maxTrackBytes);
        else
            LOG_WARN("LoadConfig: unknown key '%s' at %s:%d", k.c_str(), file.string().c_str(), lineNo);

        if (!ok)
            LOG_WARN("LoadConfig: bad value '%s' for '%s' at %s:%d, keeping default",
                     v.c_str(), k.c_str(), file.string().c_str(), lineNo);
    }

    cfg.weatherCooldownMinutes = std::max(0, cfg.weatherCooldownMinutes);
    cfg.weatherTimeoutSeconds  = std::max(1, cfg.weatherTimeoutSeconds);
    cfg.hourOffsetMs           = std::clamp(cfg.hourOffsetMs, 0, 59'000);
    cfg.volume                 = std::clamp(cfg.volume, 0.0f, 2.0f);
    cfg.loopSeconds            = std::max(1, cfg.loopSeconds);
    cfg.maxTrackBytes          = std::max<std::int64_t>(1, cfg.maxTrackBytes);
    return true;
}

bool SaveConfig(const Config& cfg, const std::filesystem::path& file)
{
    std::error_code ec;
    if (file.has_parent_path())
    {
        std::filesystem::create_directories(file.parent_path(), ec);
        if (ec)
        {
            LOG_ERROR("SaveConfig: create_directories failed for %s (%d: %s)",
                      file.parent_path().string().c_str(), ec.value(), ec.message().c_str());
            return false;
        }
    }

    std::ostringstream oss;
    oss.precision(9);
    oss << "songsDir="               << cfg.songsDir.string() << "\n";
    oss << "latitude="               << cfg.latitude << "\n";
    oss << "longitude="              << cfg.longitude << "\n";
    oss << "apiKeyFile="             << cfg.apiKeyFile.string() << "\n";
    oss << "weatherApiUrl="          << cfg.weatherApiUrl << "\n";
    oss << "weatherCooldownMinutes=" << cfg.weatherCooldownMinutes << "\n";
    oss << "weatherTimeoutSeconds="  << cfg.weatherTimeoutSeconds << "\n";
    oss << "hourOffsetMs="           << cfg.hourOffsetMs << "\n";
    oss << "volume="                 << cfg.volume << "\n";
    oss << "loopSeconds="            << cfg.loopSeconds << "\n";
    oss << "duplicateKeys="          << cfg.duplicateKeys << "\n";
    oss << "logDir="                 << cfg.logDir.string() << "\n";
    oss << "maxTrackBytes="          << cfg.maxTrackBytes << "\n";
    const std::string text = oss.str();

    std::ofstream f(file, std::ios::binary | std::ios::trunc);
    if (!f)
    {
        LOG_ERROR("SaveConfig: cannot open %s for writing", file.string().c_str());
        return false;
    }
    f.write(text.data(), static_cast<std::streamsize>(text.size()));
    return static_cast<bool>(f);
}

std::string ResolveApiKey(const Config& cfg)
{
    if (const char* env = std::getenv("NOOKU_WEATHER_API_KEY"); env && env[0] != '\0')
        return env;

    std::ifstream f(cfg.apiKeyFile, std::ios::binary);
    if (!f)
        return {};

    std::string key;
    std::getline(f, key);
    TrimInPlace(key);
    return key;
}

} // namespace nooku::core
