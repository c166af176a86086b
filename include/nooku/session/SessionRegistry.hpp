#pragma once
// include/nooku/session/SessionRegistry.hpp
//
// Owns every live rotation session. Sessions sit in an index + generation
// arena; timer and loop handlers only carry a SessionId and resolve it here
// when they fire, so a closed session simply stops being found.
//
// The timer queue must be stopped (or drained) before the registry dies.

#include "nooku/audio/PlaybackSink.hpp"
#include "nooku/runtime/TimerQueue.hpp"
#include "nooku/session/HourScheduler.hpp"
#include "nooku/session/LoopWeatherMonitor.hpp"
#include "nooku/session/RotationSession.hpp"
#include "nooku/session/SessionId.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace nooku::session {

struct SessionError
{
    enum class Code : std::uint8_t
    {
        AlreadyJoined = 0,
        PrimeFailed,
        NotFound,
    };

    Code code = Code::NotFound;
    std::string message;
};

[[nodiscard]] const char* SessionErrorName(SessionError::Code code) noexcept;

class SessionRegistry {
public:
    SessionRegistry(runtime::TimerQueue& timers, SessionServices services,
                    std::chrono::milliseconds hourOffset = HourScheduler::kDefaultOffset);
    ~SessionRegistry();

    SessionRegistry(const SessionRegistry&)            = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    // Builds and primes a session, then arms its hourly trigger and loop
    // monitor. One session per channel.
    std::expected<SessionId, SessionError> Open(SessionSpec spec, std::unique_ptr<audio::IPlaybackSink> sink);

    // Disarms the triggers and stops playback. Returns false for unknown or
    // stale ids.
    bool Close(SessionId id);
    void CloseAll();

    [[nodiscard]] std::shared_ptr<RotationSession> Find(SessionId id) const;
    [[nodiscard]] std::optional<SessionId> FindByChannel(std::string_view channel) const;
    [[nodiscard]] std::size_t Count() const;
    [[nodiscard]] std::vector<SessionId> Ids() const;

private:
    struct Slot
    {
        std::uint32_t generation = 0;
        bool reserved = false;
        std::string channel;
        std::shared_ptr<RotationSession> session;
        std::unique_ptr<HourScheduler> hour;
        std::unique_ptr<LoopWeatherMonitor> loop;
    };

    SessionId ReserveLocked(const std::string& channel);
    void ReleaseLocked(std::uint32_t index);
    const Slot* SlotLocked(SessionId id) const;

    runtime::TimerQueue& m_timers;
    const SessionServices m_services;
    const std::chrono::milliseconds m_hourOffset;

    mutable std::mutex m_mutex;
    std::vector<Slot> m_slots;
    std::vector<std::uint32_t> m_free;
};

} // namespace nooku::session
