#pragma once
// include/nooku/runtime/TimerQueue.hpp
//
// Deadline-ordered timer runtime. One thread calls Run() (or tests call
// RunDue() after moving a manual clock); callbacks execute on that thread
// without the queue lock held, so they may schedule or cancel timers.
//
// Periodic timers keep their phase: the next deadline is the previous
// deadline plus the period, not "now" plus the period. A timer that fell
// several periods behind fires once and resumes at the first deadline on
// its grid that lies after "now".

#include "nooku/runtime/Clock.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>

namespace nooku::runtime {

using TimerId = std::uint64_t;
inline constexpr TimerId kInvalidTimer = 0;

class TimerQueue {
public:
    using Callback = std::function<void()>;

    explicit TimerQueue(const IClock& clock);
    ~TimerQueue();

    TimerQueue(const TimerQueue&)            = delete;
    TimerQueue& operator=(const TimerQueue&) = delete;

    // period <= 0 means one-shot.
    TimerId ScheduleAt(TimePoint when, std::chrono::milliseconds period, Callback cb);
    TimerId SchedulePeriodic(std::chrono::milliseconds firstDelay, std::chrono::milliseconds period, Callback cb);
    TimerId ScheduleOnce(std::chrono::milliseconds delay, Callback cb);

    // Runs `fn` on the timer thread at the next dispatch. The future carries
    // any exception `fn` throws; it is already failed when the queue is stopped.
    std::future<void> Post(Callback fn);

    // Returns false when the id is unknown (already fired one-shot, or cancelled).
    bool Cancel(TimerId id);

    // Fires every timer whose deadline is <= clock.Now(). Returns the number of callbacks run.
    std::size_t RunDue();

    // Blocks until Stop(); sleeps on a condition variable between deadlines.
    void Run();
    void Stop();

    [[nodiscard]] std::size_t Pending() const;
    [[nodiscard]] std::optional<TimePoint> NextDeadline() const;
    [[nodiscard]] std::optional<TimePoint> DeadlineOf(TimerId id) const;

private:
    struct Timer {
        TimePoint due;
        std::chrono::milliseconds period{0};
        Callback cb;
        std::shared_ptr<std::atomic<bool>> alive;
    };

    std::map<TimerId, Timer>::iterator EarliestLocked();

    const IClock& m_clock;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::map<TimerId, Timer> m_timers;
    TimerId m_nextId = 1;
    std::uint64_t m_changes = 0;
    bool m_stop = false;
};

} // namespace nooku::runtime
