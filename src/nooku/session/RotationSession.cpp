#include "nooku/session/RotationSession.hpp"

#include "core/Log.h"

namespace nooku::session {

RotationSession::RotationSession(SessionId id, SessionSpec spec, const SessionServices& services,
                                 std::unique_ptr<audio::IPlaybackSink> sink)
    : m_id(id)
    , m_spec(std::move(spec))
    , m_services(services)
    , m_sink(std::move(sink))
    , m_weather(services.weatherClient, m_spec.location, m_spec.apiKey, services.clock, m_spec.weatherCooldown)
    , m_keys(m_weather, services.clock)
    , m_buffer(services.catalog, services.decoder)
{
}

RotationSession::~RotationSession()
{
    Shutdown();
}

std::expected<void, rotation::RotationError> RotationSession::Prime()
{
    std::lock_guard<std::mutex> transition(m_transitionMutex);

    const auto key = m_keys.CurrentSlot();
    auto entry = SwapTo(key);
    if (!entry)
    {
        LOG_ERROR("Session %s: cannot start %s (%s: %s)", m_spec.channel.c_str(), key.ToString().c_str(),
                  rotation::RotationErrorName(entry.error().code), entry.error().message.c_str());
        return std::unexpected(std::move(entry.error()));
    }

    const auto next = m_keys.NextSlot();
    if (auto lookahead = m_buffer.EnsureLookahead(next); !lookahead)
        LOG_WARN("Session %s: no look-ahead for %s (%s: %s)", m_spec.channel.c_str(), next.ToString().c_str(),
                 rotation::RotationErrorName(lookahead.error().code), lookahead.error().message.c_str());

    LOG_INFO("Session %s primed with %s, look-ahead %s, cache size %zu", m_spec.channel.c_str(),
             key.ToString().c_str(), next.ToString().c_str(), m_buffer.Size());
    return {};
}

std::expected<rotation::PrefetchEntry, rotation::RotationError>
RotationSession::SwapTo(const rotation::SelectionKey& key)
{
    auto entry = m_buffer.EnsureCurrent(key);
    if (!entry)
        return entry;
    Install(*entry);
    m_weather.MarkPlaying(key.weather);
    return entry;
}

void RotationSession::Install(const rotation::PrefetchEntry& entry)
{
    std::lock_guard<std::mutex> swap(m_swapMutex);
    m_sink->PlayOnly(entry.track);
    m_sink->SetVolume(m_muted ? 0.0f : m_spec.volume);
    m_sink->EnableLoop(true);
    m_active = entry.track;
    m_playing = entry.key;
    m_state = SessionState::Playing;
    ++m_swaps;
}

void RotationSession::Shutdown()
{
    std::lock_guard<std::mutex> transition(m_transitionMutex);
    {
        std::lock_guard<std::mutex> swap(m_swapMutex);
        if (m_state == SessionState::Idle && !m_active)
            return;
        m_state = SessionState::Idle;
        m_playing.reset();
        m_active.reset();
        if (m_sink)
            m_sink->Stop();
    }
    m_buffer.Clear();
    LOG_INFO("Session %s stopped", m_spec.channel.c_str());
}

bool RotationSession::SetMuted(bool muted)
{
    std::lock_guard<std::mutex> swap(m_swapMutex);
    if (m_muted == muted)
        return false;
    m_muted = muted;
    m_sink->SetVolume(muted ? 0.0f : m_spec.volume);
    LOG_INFO("Session %s %s", m_spec.channel.c_str(), muted ? "muted" : "unmuted");
    return true;
}

bool RotationSession::Muted() const
{
    std::lock_guard<std::mutex> swap(m_swapMutex);
    return m_muted;
}

SessionState RotationSession::State() const
{
    std::lock_guard<std::mutex> swap(m_swapMutex);
    return m_state;
}

std::optional<rotation::SelectionKey> RotationSession::PlayingKey() const
{
    std::lock_guard<std::mutex> swap(m_swapMutex);
    return m_playing;
}

audio::TrackPtr RotationSession::ActiveTrack() const
{
    std::lock_guard<std::mutex> swap(m_swapMutex);
    return m_active;
}

std::uint64_t RotationSession::SwapCount() const
{
    std::lock_guard<std::mutex> swap(m_swapMutex);
    return m_swaps;
}

} // namespace nooku::session
