#include "nooku/weather/Weather.hpp"

#include <string>

namespace nooku::weather {

WeatherClass ClassifyConditionCode(int code) noexcept
{
    if (code < 0)
        return WeatherClass::Unknown;

    const std::string digits = std::to_string(code);
    switch (digits.front())
    {
    case '2':
    case '3':
    case '5': return WeatherClass::Rainy;
    case '6': return WeatherClass::Snowy;
    case '7': return WeatherClass::Unknown; // atmospheric phenomena
    case '8': return WeatherClass::Clear;
    default:  return WeatherClass::Unknown;
    }
}

} // namespace nooku::weather
