#pragma once
// include/nooku/session/RotationSession.hpp
//
// Per-session rotation context: owns its weather cache, key derivation and
// prefetch buffer, borrows the immutable catalog, and holds the active track.
//
// Locking (always acquired in this order, never the reverse):
//   transition  serializes whole trigger runs (hour vs. loop)
//   weather     inside WeatherCache
//   buffer      inside PrefetchBuffer
//   swap        guards the active track; held only for the replace itself

#include "nooku/audio/PlaybackSink.hpp"
#include "nooku/notify/Notifier.hpp"
#include "nooku/rotation/KeyDerivation.hpp"
#include "nooku/rotation/PrefetchBuffer.hpp"
#include "nooku/rotation/SongCatalog.hpp"
#include "nooku/runtime/Clock.hpp"
#include "nooku/session/SessionId.hpp"
#include "nooku/weather/WeatherCache.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace nooku::session {

struct SessionSpec
{
    std::string channel;
    weather::Location location;
    std::string apiKey;
    std::chrono::minutes weatherCooldown = weather::kDefaultFetchCooldown;
    float volume = 1.0f;
};

// Collaborators shared by every session; they must outlive the registry.
struct SessionServices
{
    const rotation::SongCatalog& catalog;
    audio::ITrackDecoder& decoder;
    weather::IWeatherClient& weatherClient;
    notify::INotifier& notifier;
    const runtime::IClock& clock;
};

enum class SessionState : std::uint8_t
{
    Idle = 0,
    Playing,
};

class RotationSession {
public:
    RotationSession(SessionId id, SessionSpec spec, const SessionServices& services,
                    std::unique_ptr<audio::IPlaybackSink> sink);
    ~RotationSession();

    RotationSession(const RotationSession&)            = delete;
    RotationSession& operator=(const RotationSession&) = delete;

    // Startup priming: current slot decoded and playing, next slot decoded into
    // the look-ahead. Failing to start the first track is fatal for the session.
    std::expected<void, rotation::RotationError> Prime();

    // Replaces the active track (volume applied, looping on). The decode
    // already happened; this only holds the swap lock.
    void Install(const rotation::PrefetchEntry& entry);

    // EnsureCurrent(key) then Install() and record the key's weather as
    // playing. Caller holds the transition lock. On failure nothing changes.
    std::expected<rotation::PrefetchEntry, rotation::RotationError> SwapTo(const rotation::SelectionKey& key);

    // Playing -> Idle. Stops the sink and drops buffered tracks.
    void Shutdown();

    // Muting drops the sink volume to 0 and survives track swaps; unmuting
    // restores the configured volume. Returns false when already in that state.
    bool SetMuted(bool muted);
    [[nodiscard]] bool Muted() const;

    [[nodiscard]] SessionId Id() const noexcept { return m_id; }
    [[nodiscard]] const std::string& Channel() const noexcept { return m_spec.channel; }
    [[nodiscard]] SessionState State() const;
    [[nodiscard]] std::optional<rotation::SelectionKey> PlayingKey() const;
    [[nodiscard]] audio::TrackPtr ActiveTrack() const;
    [[nodiscard]] std::uint64_t SwapCount() const;

    [[nodiscard]] weather::WeatherCache& Weather() noexcept { return m_weather; }
    [[nodiscard]] rotation::KeyDerivation& Keys() noexcept { return m_keys; }
    [[nodiscard]] rotation::PrefetchBuffer& Buffer() noexcept { return m_buffer; }
    [[nodiscard]] audio::IPlaybackSink& Sink() noexcept { return *m_sink; }
    [[nodiscard]] notify::INotifier& Notifier() noexcept { return m_services.notifier; }
    [[nodiscard]] const runtime::IClock& Clock() const noexcept { return m_services.clock; }
    [[nodiscard]] std::mutex& TransitionMutex() noexcept { return m_transitionMutex; }

private:
    const SessionId m_id;
    const SessionSpec m_spec;
    SessionServices m_services;
    std::unique_ptr<audio::IPlaybackSink> m_sink;

    weather::WeatherCache m_weather;
    rotation::KeyDerivation m_keys;
    rotation::PrefetchBuffer m_buffer;

    std::mutex m_transitionMutex;

    mutable std::mutex m_swapMutex;
    SessionState m_state = SessionState::Idle;
    std::optional<rotation::SelectionKey> m_playing;
    audio::TrackPtr m_active;
    std::uint64_t m_swaps = 0;
    bool m_muted = false;
};

} // namespace nooku::session
