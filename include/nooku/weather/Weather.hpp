#pragma once
// include/nooku/weather/Weather.hpp
//
// Weather classification shared by the cache, key derivation and the front-end.

#include <cstdint>
#include <string>

namespace nooku::weather {

enum class WeatherClass : std::uint8_t
{
    Clear = 0,
    Rainy,
    Snowy,
    Unknown,
};

[[nodiscard]] inline const char* WeatherClassName(WeatherClass w) noexcept
{
    switch (w)
    {
    case WeatherClass::Clear: return "Clear";
    case WeatherClass::Rainy: return "Rainy";
    case WeatherClass::Snowy: return "Snowy";
    case WeatherClass::Unknown: return "Unknown";
    }
    return "?";
}

struct Location
{
    double latitude = 0.0;
    double longitude = 0.0;
};

// Payload distilled from the weather collaborator.
struct WeatherReport
{
    int conditionCode = 0;
    std::string description;
};

// Leading decimal digit of the condition code decides the class:
//   2xx thunderstorm, 3xx drizzle, 5xx rain -> Rainy
//   6xx snow                                 -> Snowy
//   7xx atmosphere (fog, haze, ...)          -> Unknown (not mapped to music)
//   8xx clear / clouds                       -> Clear
[[nodiscard]] WeatherClass ClassifyConditionCode(int code) noexcept;

} // namespace nooku::weather
