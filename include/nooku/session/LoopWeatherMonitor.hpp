#pragma once
// include/nooku/session/LoopWeatherMonitor.hpp
//
// Reacts to "track looped" notifications by checking for weather drift.
// A single subscription on the session's sink survives every track
// replacement; it is only torn down by Detach().

#include "nooku/audio/PlaybackSink.hpp"
#include "nooku/session/SessionId.hpp"

namespace nooku::session {

class RotationSession;
class SessionRegistry;

class LoopWeatherMonitor {
public:
    LoopWeatherMonitor() = default;
    ~LoopWeatherMonitor();

    LoopWeatherMonitor(const LoopWeatherMonitor&)            = delete;
    LoopWeatherMonitor& operator=(const LoopWeatherMonitor&) = delete;

    void Attach(audio::IPlaybackSink& sink, SessionRegistry& registry, SessionId id);
    void Detach();

    [[nodiscard]] bool Attached() const noexcept { return m_sink != nullptr; }

    // Recomputes the current-slot key. Weather digit unchanged since the last
    // swap: nothing to do. Changed: decode that key, swap it in and record the
    // new playing weather.
    static void OnLoop(RotationSession& session);

private:
    audio::IPlaybackSink* m_sink = nullptr;
};

} // namespace nooku::session
