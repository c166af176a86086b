#include "nooku/audio/PlaybackSink.hpp"

#include "core/Log.h"
#include "nooku/runtime/TimerQueue.hpp"

namespace nooku::audio {

ClockedPlaybackSink::ClockedPlaybackSink(runtime::TimerQueue& timers, std::chrono::milliseconds loopPeriod)
    : m_timers(timers)
    , m_loopPeriod(loopPeriod)
{
}

ClockedPlaybackSink::~ClockedPlaybackSink()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_listener = nullptr;
    CancelLoopTimerLocked();
}

std::uint64_t ClockedPlaybackSink::PlayOnly(TrackPtr track)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_current = std::move(track);
    ++m_plays;
    LOG_INFO("Now playing %s (volume %.2f)",
             m_current ? m_current->source.filename().string().c_str() : "<nothing>", m_volume);
    RestartLoopTimerLocked();
    return m_plays;
}

void ClockedPlaybackSink::SetVolume(float volume)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_volume = volume;
}

void ClockedPlaybackSink::EnableLoop(bool enabled)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_loop == enabled)
        return;
    m_loop = enabled;
    RestartLoopTimerLocked();
}

void ClockedPlaybackSink::Stop()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_current.reset();
    CancelLoopTimerLocked();
}

void ClockedPlaybackSink::SetLoopListener(LoopListener listener)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_listener = std::move(listener);
}

TrackPtr ClockedPlaybackSink::Current() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_current;
}

void ClockedPlaybackSink::CancelLoopTimerLocked()
{
    if (m_loopTimer != runtime::kInvalidTimer)
    {
        if (!m_timers.Cancel(m_loopTimer))
            LOG_TRACE("Loop timer %llu already gone", static_cast<unsigned long long>(m_loopTimer));
        m_loopTimer = runtime::kInvalidTimer;
    }
}

void ClockedPlaybackSink::RestartLoopTimerLocked()
{
    CancelLoopTimerLocked();
    if (!m_current || !m_loop)
        return;

    // A replaced track starts a fresh cycle.
    m_loopTimer = m_timers.SchedulePeriodic(m_loopPeriod, m_loopPeriod, [this] { OnLoopElapsed(); });
}

void ClockedPlaybackSink::OnLoopElapsed()
{
    LoopListener listener;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_current || !m_loop)
            return;
        listener = m_listener;
    }

    // Listener may call PlayOnly() on this sink.
    if (listener)
        listener();
}

} // namespace nooku::audio
