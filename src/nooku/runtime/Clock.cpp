#include "nooku/runtime/Clock.hpp"

namespace nooku::runtime {

std::tm SystemClock::ToLocal(TimePoint tp) const
{
    const std::time_t t = WallClock::to_time_t(tp);
    std::tm out{};
    if (!localtime_r(&t, &out))
        return std::tm{};
    return out;
}

int LocalHour(const IClock& clock, TimePoint tp)
{
    return clock.ToLocal(tp).tm_hour;
}

TimePoint TopOfNextHour(const IClock& clock, TimePoint now)
{
    using namespace std::chrono;

    const auto wholeSeconds = floor<seconds>(now);
    const std::tm local = clock.ToLocal(wholeSeconds);
    const auto intoHour = minutes(local.tm_min) + seconds(local.tm_sec);
    return wholeSeconds - intoHour + hours(1);
}

} // namespace nooku::runtime
