#include "nooku/runtime/TimerQueue.hpp"

#include "core/Log.h"

#include <algorithm>
#include <exception>
#include <stdexcept>

namespace nooku::runtime {

TimerQueue::TimerQueue(const IClock& clock)
    : m_clock(clock)
{
}

TimerQueue::~TimerQueue()
{
    Stop();
}

TimerId TimerQueue::ScheduleAt(TimePoint when, std::chrono::milliseconds period, Callback cb)
{
    if (!cb)
        return kInvalidTimer;

    std::lock_guard<std::mutex> lock(m_mutex);
    const TimerId id = m_nextId++;
    Timer t;
    t.due = when;
    t.period = std::max(period, std::chrono::milliseconds(0));
    t.cb = std::move(cb);
    t.alive = std::make_shared<std::atomic<bool>>(true);
    m_timers.emplace(id, std::move(t));
    ++m_changes;
    m_cv.notify_all();
    return id;
}

TimerId TimerQueue::SchedulePeriodic(std::chrono::milliseconds firstDelay,
                                     std::chrono::milliseconds period,
                                     Callback cb)
{
    return ScheduleAt(m_clock.Now() + firstDelay, period, std::move(cb));
}

TimerId TimerQueue::ScheduleOnce(std::chrono::milliseconds delay, Callback cb)
{
    return ScheduleAt(m_clock.Now() + delay, std::chrono::milliseconds(0), std::move(cb));
}

std::future<void> TimerQueue::Post(Callback fn)
{
    auto done = std::make_shared<std::promise<void>>();
    auto result = done->get_future();

    bool stopped = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        stopped = m_stop;
    }
    if (stopped)
    {
        done->set_exception(std::make_exception_ptr(std::runtime_error("timer queue stopped")));
        return result;
    }

    ScheduleOnce(std::chrono::milliseconds(0), [done, fn = std::move(fn)] {
        try
        {
            fn();
            done->set_value();
        }
        catch (...)
        {
            done->set_exception(std::current_exception());
        }
    });
    return result;
}

bool TimerQueue::Cancel(TimerId id)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_timers.find(id);
    if (it == m_timers.end())
        return false;

    it->second.alive->store(false);
    m_timers.erase(it);
    ++m_changes;
    m_cv.notify_all();
    return true;
}

std::map<TimerId, TimerQueue::Timer>::iterator TimerQueue::EarliestLocked()
{
    return std::min_element(m_timers.begin(), m_timers.end(),
                            [](const auto& a, const auto& b) {
                                if (a.second.due != b.second.due)
                                    return a.second.due < b.second.due;
                                return a.first < b.first;
                            });
}

std::size_t TimerQueue::RunDue()
{
    std::size_t fired = 0;
    const TimePoint now = m_clock.Now();

    for (;;)
    {
        Callback cb;
        std::shared_ptr<std::atomic<bool>> alive;
        TimerId id = kInvalidTimer;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = EarliestLocked();
            if (it == m_timers.end() || it->second.due > now)
                break;

            id = it->first;
            cb = it->second.cb;
            alive = it->second.alive;
            if (it->second.period.count() > 0)
            {
                Timer& t = it->second;
                t.due += t.period;
                if (t.due <= now)
                {
                    // Overdue by whole periods (suspend, clock step): fire once, stay on the grid.
                    const auto missed = (now - t.due) / t.period + 1;
                    t.due += t.period * missed;
                    LOG_WARN("Timer %llu skipped %lld missed period(s)", static_cast<unsigned long long>(id),
                             static_cast<long long>(missed));
                }
            }
            else
            {
                m_timers.erase(it);
            }
        }

        // Cancelled between dequeue and dispatch.
        if (!alive->load())
            continue;

        try
        {
            cb();
        }
        catch (const std::exception& e)
        {
            LOG_ERROR("Timer %llu callback threw: %s", static_cast<unsigned long long>(id), e.what());
        }
        ++fired;
    }

    return fired;
}

void TimerQueue::Run()
{
    for (;;)
    {
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            if (m_stop)
                break;

            const std::uint64_t seen = m_changes;
            const auto it = EarliestLocked();
            if (it == m_timers.end())
            {
                m_cv.wait(lock, [&] { return m_stop || m_changes != seen; });
                continue;
            }

            const auto wait = it->second.due - m_clock.Now();
            if (wait > TimePoint::duration::zero())
            {
                m_cv.wait_for(lock, wait, [&] { return m_stop || m_changes != seen; });
                continue;
            }
        }

        RunDue();
    }
}

void TimerQueue::Stop()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_stop = true;
    m_cv.notify_all();
}

std::size_t TimerQueue::Pending() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_timers.size();
}

std::optional<TimePoint> TimerQueue::NextDeadline() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::optional<TimePoint> best;
    for (const auto& [id, t] : m_timers)
        if (!best || t.due < *best)
            best = t.due;
    return best;
}

std::optional<TimePoint> TimerQueue::DeadlineOf(TimerId id) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_timers.find(id);
    if (it == m_timers.end())
        return std::nullopt;
    return it->second.due;
}

} // namespace nooku::runtime
