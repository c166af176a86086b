#pragma once
// include/nooku/session/HourScheduler.hpp
//
// Wall-clock aligned hourly trigger. The first firing lands just after the
// next top of the hour (offset guards against timers that wake a little
// early); later firings follow every period from that deadline.

#include "nooku/runtime/Clock.hpp"
#include "nooku/runtime/TimerQueue.hpp"
#include "nooku/session/SessionId.hpp"

#include <chrono>

namespace nooku::session {

class RotationSession;
class SessionRegistry;

class HourScheduler {
public:
    static constexpr std::chrono::milliseconds kPeriod = std::chrono::hours(1);
    static constexpr std::chrono::milliseconds kDefaultOffset{500};

    HourScheduler(runtime::TimerQueue& timers,
                  std::chrono::milliseconds offset = kDefaultOffset,
                  std::chrono::milliseconds period = kPeriod);
    ~HourScheduler();

    HourScheduler(const HourScheduler&)            = delete;
    HourScheduler& operator=(const HourScheduler&) = delete;

    // Clears this scheduler's previous timer, then schedules OnHour for `id`.
    // The handler resolves the session through the registry at fire time.
    void Arm(const runtime::IClock& clock, SessionRegistry& registry, SessionId id);
    void Disarm();

    [[nodiscard]] bool Armed() const noexcept { return m_timer != runtime::kInvalidTimer; }
    [[nodiscard]] runtime::TimerId Timer() const noexcept { return m_timer; }

    [[nodiscard]] static std::chrono::milliseconds
    DelayUntilNextHour(const runtime::IClock& clock, runtime::TimePoint now, std::chrono::milliseconds offset);

    // One hourly rotation:
    //   1-3. take the buffered current-slot track, or decode fresh when it is
    //        missing or was chosen under different weather
    //   4.   swap it in (volume, loop)
    //   5.   the session's loop monitor subscription carries over
    //   6.   refill the look-ahead for the next slot
    static void OnHour(RotationSession& session);

private:
    runtime::TimerQueue& m_timers;
    const std::chrono::milliseconds m_offset;
    const std::chrono::milliseconds m_period;
    runtime::TimerId m_timer = runtime::kInvalidTimer;
};

} // namespace nooku::session
