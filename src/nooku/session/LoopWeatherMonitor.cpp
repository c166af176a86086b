#include "nooku/session/LoopWeatherMonitor.hpp"

#include "core/Log.h"
#include "nooku/session/RotationSession.hpp"
#include "nooku/session/SessionRegistry.hpp"

namespace nooku::session {

LoopWeatherMonitor::~LoopWeatherMonitor()
{
    Detach();
}

void LoopWeatherMonitor::Attach(audio::IPlaybackSink& sink, SessionRegistry& registry, SessionId id)
{
    Detach();
    m_sink = &sink;
    m_sink->SetLoopListener([&registry, id] {
        if (auto session = registry.Find(id))
            OnLoop(*session);
        else
            LOG_TRACE("Loop event for closed session %s ignored", id.ToString().c_str());
    });
}

void LoopWeatherMonitor::Detach()
{
    if (!m_sink)
        return;
    m_sink->SetLoopListener(nullptr);
    m_sink = nullptr;
}

void LoopWeatherMonitor::OnLoop(RotationSession& session)
{
    std::lock_guard<std::mutex> transition(session.TransitionMutex());
    if (session.State() != SessionState::Playing)
        return;

    const auto playing = session.PlayingKey();
    if (!playing)
        return;

    // Current slot, not the playing hour: a failed hour swap leaves an older
    // hour installed and the drift swap must not pick that hour's variant.
    const auto key = session.Keys().CurrentSlot();
    const auto playingWeather = session.Weather().Playing();
    if (key.Digit() == rotation::WeatherDigit(playingWeather))
        return;

    LOG_INFO("Old weather: %s, new weather: %s, key for current hour: %s",
             weather::WeatherClassName(playingWeather), weather::WeatherClassName(key.weather),
             key.ToString().c_str());

    auto entry = session.SwapTo(key);
    if (!entry)
    {
        // Playing weather stays put, so the next loop retries.
        LOG_ERROR("Weather swap to %s skipped, keeping %s (%s: %s)", key.ToString().c_str(),
                  playing->ToString().c_str(), rotation::RotationErrorName(entry.error().code),
                  entry.error().message.c_str());
        return;
    }

    notify::PostOrLog(session.Notifier(), session.Channel(),
                      std::string("Weather changed to ") + weather::WeatherClassName(key.weather) + ".");
}

} // namespace nooku::session
