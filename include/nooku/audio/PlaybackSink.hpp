#pragma once
// include/nooku/audio/PlaybackSink.hpp
//
// The voice connection's audio output, as seen by the rotation engine.

#include "nooku/audio/Track.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>

namespace nooku::runtime { class TimerQueue; }

namespace nooku::audio {

class IPlaybackSink {
public:
    using LoopListener = std::function<void()>;

    virtual ~IPlaybackSink() = default;

    // Stops whatever is playing and starts `track`. Returns a per-sink play counter.
    virtual std::uint64_t PlayOnly(TrackPtr track) = 0;
    virtual void SetVolume(float volume) = 0;
    virtual void EnableLoop(bool enabled) = 0;
    virtual void Stop() = 0;

    // One listener per sink; it keeps firing across PlayOnly() replacements.
    // Passing an empty function unsubscribes.
    virtual void SetLoopListener(LoopListener listener) = 0;
};

// Sink without an audio device: a looping track "completes" every loopPeriod,
// driven by the timer queue.
class ClockedPlaybackSink final : public IPlaybackSink {
public:
    ClockedPlaybackSink(runtime::TimerQueue& timers, std::chrono::milliseconds loopPeriod);
    ~ClockedPlaybackSink() override;

    ClockedPlaybackSink(const ClockedPlaybackSink&)            = delete;
    ClockedPlaybackSink& operator=(const ClockedPlaybackSink&) = delete;

    std::uint64_t PlayOnly(TrackPtr track) override;
    void SetVolume(float volume) override;
    void EnableLoop(bool enabled) override;
    void Stop() override;
    void SetLoopListener(LoopListener listener) override;

    [[nodiscard]] TrackPtr Current() const;

private:
    void RestartLoopTimerLocked();
    void CancelLoopTimerLocked();
    void OnLoopElapsed();

    runtime::TimerQueue& m_timers;
    const std::chrono::milliseconds m_loopPeriod;

    mutable std::mutex m_mutex;
    TrackPtr m_current;
    std::uint64_t m_plays = 0;
    std::uint64_t m_loopTimer = 0;
    float m_volume = 1.0f;
    bool m_loop = false;
    LoopListener m_listener;
};

} // namespace nooku::audio
