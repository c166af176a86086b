#include "nooku/rotation/KeyDerivation.hpp"

#include "core/Log.h"

namespace nooku::rotation {

weather::WeatherClass KeyDerivation::ObserveWeather()
{
    auto observed = m_weather.Fetch();
    if (observed)
        return *observed;

    const auto fallback = m_weather.Cached();
    LOG_ERROR("Error fetching weather data (%s: %s), using %s",
              weather::WeatherErrorName(observed.error().code),
              observed.error().message.c_str(),
              weather::WeatherClassName(fallback));
    return fallback;
}

SelectionKey KeyDerivation::ForHour(int hour)
{
    return SelectionKey::Make(ObserveWeather(), hour);
}

SelectionKey KeyDerivation::CurrentSlot()
{
    return ForHour(runtime::LocalHour(m_clock, m_clock.Now()));
}

SelectionKey KeyDerivation::NextSlot()
{
    const auto next = runtime::TopOfNextHour(m_clock, m_clock.Now());
    return ForHour(runtime::LocalHour(m_clock, next));
}

} // namespace nooku::rotation
