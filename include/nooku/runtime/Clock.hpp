#pragma once
// include/nooku/runtime/Clock.hpp
//
// Wall-clock source. Everything that decides "which hour is it" goes through
// IClock so schedules can be driven deterministically.

#include <chrono>
#include <ctime>

namespace nooku::runtime {

using WallClock = std::chrono::system_clock;
using TimePoint = WallClock::time_point;

class IClock {
public:
    virtual ~IClock() = default;

    [[nodiscard]] virtual TimePoint Now() const = 0;

    // Broken-down local time for `tp`.
    [[nodiscard]] virtual std::tm ToLocal(TimePoint tp) const = 0;
};

class SystemClock final : public IClock {
public:
    [[nodiscard]] TimePoint Now() const override { return WallClock::now(); }
    [[nodiscard]] std::tm ToLocal(TimePoint tp) const override;
};

// Local hour (0-23) of `tp`.
[[nodiscard]] int LocalHour(const IClock& clock, TimePoint tp);

// Exact local top of the hour following `now` (minute, second and fraction zeroed).
[[nodiscard]] TimePoint TopOfNextHour(const IClock& clock, TimePoint now);

} // namespace nooku::runtime
