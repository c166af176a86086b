#include "nooku/session/HourScheduler.hpp"

#include "core/Log.h"
#include "nooku/session/RotationSession.hpp"
#include "nooku/session/SessionRegistry.hpp"

#include <cstdio>

namespace nooku::session {

HourScheduler::HourScheduler(runtime::TimerQueue& timers,
                             std::chrono::milliseconds offset,
                             std::chrono::milliseconds period)
    : m_timers(timers)
    , m_offset(offset)
    , m_period(period)
{
}

HourScheduler::~HourScheduler()
{
    Disarm();
}

std::chrono::milliseconds HourScheduler::DelayUntilNextHour(const runtime::IClock& clock,
                                                            runtime::TimePoint now,
                                                            std::chrono::milliseconds offset)
{
    const auto target = runtime::TopOfNextHour(clock, now) + offset;
    return std::chrono::ceil<std::chrono::milliseconds>(target - now);
}

void HourScheduler::Arm(const runtime::IClock& clock, SessionRegistry& registry, SessionId id)
{
    Disarm();

    const auto now = clock.Now();
    const auto delay = DelayUntilNextHour(clock, now, m_offset);
    LOG_INFO("Session %s: next hour in %lld ms", id.ToString().c_str(), static_cast<long long>(delay.count()));

    m_timer = m_timers.ScheduleAt(now + delay, m_period, [&registry, id] {
        if (auto session = registry.Find(id))
            OnHour(*session);
        else
            LOG_TRACE("Hour trigger for closed session %s ignored", id.ToString().c_str());
    });
}

void HourScheduler::Disarm()
{
    if (m_timer == runtime::kInvalidTimer)
        return;
    if (!m_timers.Cancel(m_timer))
        LOG_TRACE("Hour timer %llu was already gone", static_cast<unsigned long long>(m_timer));
    m_timer = runtime::kInvalidTimer;
}

void HourScheduler::OnHour(RotationSession& session)
{
    std::lock_guard<std::mutex> transition(session.TransitionMutex());
    if (session.State() != SessionState::Playing)
        return;

    const std::tm local = session.Clock().ToLocal(session.Clock().Now());
    char text[32];
    std::snprintf(text, sizeof(text), "It is now %02d:%02d!", local.tm_hour, local.tm_min);
    notify::PostOrLog(session.Notifier(), session.Channel(), text);

    const auto key = session.Keys().CurrentSlot();
    LOG_INFO("Current hour key: %s", key.ToString().c_str());

    if (auto entry = session.SwapTo(key); !entry)
    {
        LOG_ERROR("Hour change to %s skipped, keeping %s (%s: %s)", key.ToString().c_str(),
                  session.PlayingKey() ? session.PlayingKey()->ToString().c_str() : "-",
                  rotation::RotationErrorName(entry.error().code), entry.error().message.c_str());
    }

    const auto next = session.Keys().NextSlot();
    if (auto lookahead = session.Buffer().EnsureLookahead(next); !lookahead)
        LOG_WARN("No look-ahead for %s (%s: %s)", next.ToString().c_str(),
                 rotation::RotationErrorName(lookahead.error().code), lookahead.error().message.c_str());

    LOG_INFO("cache size: %zu", session.Buffer().Size());
}

} // namespace nooku::session
