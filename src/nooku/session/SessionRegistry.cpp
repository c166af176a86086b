#include "nooku/session/SessionRegistry.hpp"

#include "core/Log.h"

#include <utility>

namespace nooku::session {

const char* SessionErrorName(SessionError::Code code) noexcept
{
    switch (code)
    {
    case SessionError::Code::AlreadyJoined: return "AlreadyJoined";
    case SessionError::Code::PrimeFailed:   return "PrimeFailed";
    case SessionError::Code::NotFound:      return "NotFound";
    }
    return "Unknown";
}

SessionRegistry::SessionRegistry(runtime::TimerQueue& timers, SessionServices services,
                                 std::chrono::milliseconds hourOffset)
    : m_timers(timers)
    , m_services(services)
    , m_hourOffset(hourOffset)
{
}

SessionRegistry::~SessionRegistry()
{
    CloseAll();
}

SessionId SessionRegistry::ReserveLocked(const std::string& channel)
{
    std::uint32_t index = 0;
    if (!m_free.empty())
    {
        index = m_free.back();
        m_free.pop_back();
    }
    else
    {
        index = static_cast<std::uint32_t>(m_slots.size());
        m_slots.emplace_back();
    }

    Slot& slot = m_slots[index];
    if (++slot.generation == 0)
        slot.generation = 1;
    slot.reserved = true;
    slot.channel = channel;
    return SessionId{index, slot.generation};
}

void SessionRegistry::ReleaseLocked(std::uint32_t index)
{
    Slot& slot = m_slots[index];
    slot.reserved = false;
    slot.channel.clear();
    m_free.push_back(index);
}

const SessionRegistry::Slot* SessionRegistry::SlotLocked(SessionId id) const
{
    if (!id.Valid() || id.index >= m_slots.size())
        return nullptr;
    const Slot& slot = m_slots[id.index];
    if (!slot.reserved || slot.generation != id.generation || !slot.session)
        return nullptr;
    return &slot;
}

std::expected<SessionId, SessionError> SessionRegistry::Open(SessionSpec spec,
                                                             std::unique_ptr<audio::IPlaybackSink> sink)
{
    SessionId id;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const Slot& slot : m_slots)
        {
            if (slot.reserved && slot.channel == spec.channel)
                return std::unexpected(SessionError{SessionError::Code::AlreadyJoined,
                                                    "Already in same voice channel!"});
        }
        id = ReserveLocked(spec.channel);
    }

    const std::string channel = spec.channel;
    auto session = std::make_shared<RotationSession>(id, std::move(spec), m_services, std::move(sink));
    if (auto primed = session->Prime(); !primed)
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            ReleaseLocked(id.index);
        }
        return std::unexpected(SessionError{
            SessionError::Code::PrimeFailed,
            std::string(rotation::RotationErrorName(primed.error().code)) + ": " + primed.error().message});
    }

    // Handlers resolve through Find(), which only succeeds once the slot is
    // published below, so arming first is safe.
    auto hour = std::make_unique<HourScheduler>(m_timers, m_hourOffset);
    auto loop = std::make_unique<LoopWeatherMonitor>();
    hour->Arm(m_services.clock, *this, id);
    loop->Attach(session->Sink(), *this, id);

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        Slot& slot = m_slots[id.index];
        slot.session = std::move(session);
        slot.hour = std::move(hour);
        slot.loop = std::move(loop);
    }

    LOG_INFO("Session %s opened on #%s", id.ToString().c_str(), channel.c_str());
    return id;
}

bool SessionRegistry::Close(SessionId id)
{
    std::shared_ptr<RotationSession> session;
    std::unique_ptr<HourScheduler> hour;
    std::unique_ptr<LoopWeatherMonitor> loop;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!SlotLocked(id))
            return false;
        Slot& slot = m_slots[id.index];
        session = std::move(slot.session);
        hour = std::move(slot.hour);
        loop = std::move(slot.loop);
        ReleaseLocked(id.index);
    }

    hour->Disarm();
    loop->Detach();
    session->Shutdown();
    LOG_INFO("Session %s closed on #%s", id.ToString().c_str(), session->Channel().c_str());
    return true;
}

void SessionRegistry::CloseAll()
{
    for (const SessionId id : Ids())
    {
        if (!Close(id))
            LOG_TRACE("Session %s already closed", id.ToString().c_str());
    }
}

std::shared_ptr<RotationSession> SessionRegistry::Find(SessionId id) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const Slot* slot = SlotLocked(id);
    return slot ? slot->session : nullptr;
}

std::optional<SessionId> SessionRegistry::FindByChannel(std::string_view channel) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    for (std::uint32_t i = 0; i < m_slots.size(); ++i)
    {
        const Slot& slot = m_slots[i];
        if (slot.reserved && slot.session && slot.channel == channel)
            return SessionId{i, slot.generation};
    }
    return std::nullopt;
}

std::size_t SessionRegistry::Count() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::size_t n = 0;
    for (const Slot& slot : m_slots)
        n += (slot.reserved && slot.session) ? 1u : 0u;
    return n;
}

std::vector<SessionId> SessionRegistry::Ids() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<SessionId> ids;
    for (std::uint32_t i = 0; i < m_slots.size(); ++i)
    {
        const Slot& slot = m_slots[i];
        if (slot.reserved && slot.session)
            ids.push_back(SessionId{i, slot.generation});
    }
    return ids;
}

} // namespace nooku::session
