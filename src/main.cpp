// src/main.cpp
//
// Console front-end: one rotation session per joined channel, all triggers
// driven by a single timer thread. Session teardown is posted to that thread
// so no trigger can be mid-flight on a sink being destroyed.

#include "app/CommandLineArgs.h"
#include "core/Config.h"
#include "core/Log.h"

#include "nooku/audio/PlaybackSink.hpp"
#include "nooku/audio/Track.hpp"
#include "nooku/notify/Notifier.hpp"
#include "nooku/rotation/SongCatalog.hpp"
#include "nooku/runtime/Clock.hpp"
#include "nooku/runtime/TimerQueue.hpp"
#include "nooku/session/SessionRegistry.hpp"
#include "nooku/weather/WeatherCache.hpp"
#include "nooku/weather/WeatherClient.hpp"

#include <charconv>
#include <chrono>
#include <cstdio>
#include <exception>
#include <functional>
#include <future>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <system_error>
#include <thread>

namespace {

constexpr const char* kConsoleChannel = "console";

// Runs `fn` on the timer thread and waits for it.
bool RunOnTimerThread(nooku::runtime::TimerQueue& timers, std::function<bool()> fn)
{
    bool ok = false;
    try
    {
        timers.Post([&] { ok = fn(); }).get();
    }
    catch (const std::exception& e)
    {
        LOG_ERROR("Timer thread task failed: %s", e.what());
        return false;
    }
    return ok;
}

std::string LocalTimeText(const nooku::runtime::IClock& clock)
{
    const std::tm local = clock.ToLocal(clock.Now());
    char text[32];
    std::snprintf(text, sizeof(text), "%02d:%02d", local.tm_hour, local.tm_min);
    return text;
}

} // namespace

int main(int argc, char** argv)
{
    using namespace nooku;

    const app::CommandLineArgs args = app::ParseCommandLineArgs(argc, argv);
    if (args.showHelp)
    {
        std::cout << app::BuildCommandLineHelpText();
        return 0;
    }
    if (!args.unknown.empty())
    {
        for (const auto& a : args.unknown)
            std::cerr << "Unknown or incomplete argument: " << a << "\n";
        std::cerr << "\n" << app::BuildCommandLineHelpText();
        return 2;
    }

    const std::filesystem::path configPath = args.configPath.value_or("nooku.ini");
    core::Config cfg;
    const bool configLoaded = core::LoadConfig(cfg, configPath);
    if (args.songsDir)
        cfg.songsDir = *args.songsDir;
    if (args.logDir)
        cfg.logDir = *args.logDir;

    core::LogInit(cfg.logDir);
    if (!configLoaded)
        LOG_INFO("No config at %s, using defaults", configPath.string().c_str());
    if (args.writeConfig && !core::SaveConfig(cfg, configPath))
        LOG_ERROR("Could not write config to %s", configPath.string().c_str());

    auto policy = rotation::ParseDuplicatePolicy(cfg.duplicateKeys);
    if (!policy)
    {
        LOG_WARN("Unknown duplicateKeys '%s', using 'last'", cfg.duplicateKeys.c_str());
        policy = rotation::DuplicatePolicy::LastWins;
    }

    auto scanned = rotation::SongCatalog::ScanDirectory(cfg.songsDir, *policy);
    if (!scanned)
    {
        LOG_CRITICAL("Song catalog unavailable: %s", scanned.error().message.c_str());
        core::LogShutdown();
        return 1;
    }
    const rotation::SongCatalog catalog = std::move(*scanned);
    LOG_INFO("Loaded %zu songs from %s", catalog.Size(), cfg.songsDir.string().c_str());

    const weather::Location location{cfg.latitude, cfg.longitude};
    LOG_INFO("Location: %.6f, %.6f", location.latitude, location.longitude);

    const std::string apiKey = core::ResolveApiKey(cfg);
    if (apiKey.empty())
        LOG_WARN("No weather API key; every hour will use the cached classification");

    runtime::SystemClock clock;
    runtime::TimerQueue timers(clock);
    audio::FileTrackDecoder decoder(static_cast<std::uintmax_t>(cfg.maxTrackBytes));
    weather::OpenWeatherClient weatherClient(cfg.weatherApiUrl, std::chrono::seconds(cfg.weatherTimeoutSeconds));
    notify::NotificationLog notes;
    notify::ConsoleNotifier notifier(notes);

    const session::SessionServices services{catalog, decoder, weatherClient, notifier, clock};
    session::SessionRegistry registry(timers, services, std::chrono::milliseconds(cfg.hourOffsetMs));

    weather::WeatherCache consoleWeather(weatherClient, location, apiKey, clock,
                                         std::chrono::minutes(cfg.weatherCooldownMinutes));

    std::thread worker([&timers] { timers.Run(); });
    LOG_INFO("Ready. Type 'help' for commands.");

    std::string line;
    while (std::getline(std::cin, line))
    {
        std::istringstream in(line);
        std::string cmd;
        std::string channel;
        in >> cmd >> channel;
        if (cmd.empty())
            continue;

        if (cmd == "quit" || cmd == "exit")
            break;

        if (cmd == "help")
        {
            std::cout << app::BuildCommandLineHelpText();
        }
        else if (cmd == "ping")
        {
            notify::PostOrLog(notifier, kConsoleChannel, "Pong!");
        }
        else if (cmd == "play")
        {
            if (channel.empty())
            {
                notify::PostOrLog(notifier, kConsoleChannel, "usage: play <channel>", notify::NotifySeverity::Warning);
                continue;
            }

            session::SessionSpec spec;
            spec.channel = channel;
            spec.location = location;
            spec.apiKey = apiKey;
            spec.weatherCooldown = std::chrono::minutes(cfg.weatherCooldownMinutes);
            spec.volume = cfg.volume;

            auto sink = std::make_unique<audio::ClockedPlaybackSink>(timers, std::chrono::seconds(cfg.loopSeconds));
            auto opened = registry.Open(std::move(spec), std::move(sink));
            if (!opened)
            {
                const auto sev = opened.error().code == session::SessionError::Code::AlreadyJoined
                                     ? notify::NotifySeverity::Info
                                     : notify::NotifySeverity::Error;
                notify::PostOrLog(notifier, channel, opened.error().message, sev);
                continue;
            }
            notify::PostOrLog(notifier, channel, "Joined " + channel + " " + LocalTimeText(clock));
        }
        else if (cmd == "leave")
        {
            const auto id = registry.FindByChannel(channel);
            if (!id)
            {
                notify::PostOrLog(notifier, kConsoleChannel, "Not in #" + channel, notify::NotifySeverity::Warning);
                continue;
            }
            if (RunOnTimerThread(timers, [&registry, id] { return registry.Close(*id); }))
                notify::PostOrLog(notifier, channel, "Left " + channel);
        }
        else if (cmd == "mute" || cmd == "unmute")
        {
            const bool mute = cmd == "mute";
            const auto id = registry.FindByChannel(channel);
            const auto s = id ? registry.Find(*id) : nullptr;
            if (!s)
            {
                notify::PostOrLog(notifier, kConsoleChannel,
                                  mute ? "Not in a voice channel" : "Not in a voice channel to unmute in",
                                  notify::NotifySeverity::Warning);
                continue;
            }
            if (mute)
                notify::PostOrLog(notifier, channel, s->SetMuted(true) ? "Now muted" : "Already muted");
            else
                notify::PostOrLog(notifier, channel, s->SetMuted(false) ? "Unmuted" : "Not muted");
        }
        else if (cmd == "history")
        {
            std::size_t count = 10;
            if (!channel.empty())
            {
                const auto [ptr, ec] = std::from_chars(channel.data(), channel.data() + channel.size(), count);
                if (ec != std::errc() || ptr != channel.data() + channel.size())
                {
                    notify::PostOrLog(notifier, kConsoleChannel, "usage: history [n]", notify::NotifySeverity::Warning);
                    continue;
                }
            }
            for (const auto& entry : notes.recent(count))
                std::cout << notify::FormatNotification(entry, clock) << "\n";
        }
        else if (cmd == "weather")
        {
            auto w = consoleWeather.Fetch();
            if (!w)
            {
                notify::PostOrLog(notifier, kConsoleChannel,
                                  std::string("Weather unavailable (") + weather::WeatherErrorName(w.error().code)
                                      + "), last known: " + weather::WeatherClassName(consoleWeather.Cached()),
                                  notify::NotifySeverity::Warning);
                continue;
            }
            notify::PostOrLog(notifier, kConsoleChannel,
                              std::string("Current weather: ") + weather::WeatherClassName(*w));
        }
        else if (cmd == "status")
        {
            const auto ids = registry.Ids();
            if (ids.empty())
                notify::PostOrLog(notifier, kConsoleChannel, "No active sessions");
            for (const auto id : ids)
            {
                const auto s = registry.Find(id);
                if (!s)
                    continue;
                const auto key = s->PlayingKey();
                std::ostringstream os;
                os << "#" << s->Channel() << " [" << id.ToString() << "] playing "
                   << (key ? key->ToString() : std::string("-")) << ", swaps " << s->SwapCount()
                   << ", cached " << s->Buffer().Size();
                notify::PostOrLog(notifier, kConsoleChannel, os.str());
            }
        }
        else
        {
            notify::PostOrLog(notifier, kConsoleChannel, "Unknown command: " + cmd, notify::NotifySeverity::Warning);
        }
    }

    if (!RunOnTimerThread(timers, [&registry] { registry.CloseAll(); return true; }))
        LOG_WARN("Timer thread unavailable at shutdown");
    timers.Stop();
    worker.join();

    LOG_INFO("Bye");
    core::LogShutdown();
    return 0;
}
