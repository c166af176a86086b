#pragma once
// include/nooku/rotation/KeyDerivation.hpp

#include "nooku/rotation/SelectionKey.hpp"
#include "nooku/runtime/Clock.hpp"
#include "nooku/weather/WeatherCache.hpp"

namespace nooku::rotation {

// Computes the key for the current or the next hour slot from clock + weather.
// Always produces a key: weather failures fall back to the cached classification.
class KeyDerivation {
public:
    KeyDerivation(weather::WeatherCache& weather, const runtime::IClock& clock)
        : m_weather(weather), m_clock(clock) {}

    [[nodiscard]] SelectionKey CurrentSlot();
    [[nodiscard]] SelectionKey NextSlot();

    // Current weather, given hour.
    [[nodiscard]] SelectionKey ForHour(int hour);

    [[nodiscard]] weather::WeatherClass ObserveWeather();

private:
    weather::WeatherCache& m_weather;
    const runtime::IClock& m_clock;
};

} // namespace nooku::rotation
