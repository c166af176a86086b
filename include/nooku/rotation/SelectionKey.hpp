#pragma once
// include/nooku/rotation/SelectionKey.hpp
//
// Structured catalog key: which weather, which hour. The three-character
// legacy form ("105" = rainy, 05:00) only exists at the catalog boundary.

#include "nooku/weather/Weather.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace nooku::rotation {

using weather::WeatherClass;

// Clear and Unknown share the "0" playlist.
[[nodiscard]] constexpr int WeatherDigit(WeatherClass w) noexcept
{
    switch (w)
    {
    case WeatherClass::Rainy: return 1;
    case WeatherClass::Snowy: return 2;
    case WeatherClass::Clear:
    case WeatherClass::Unknown: return 0;
    }
    return 0;
}

struct SelectionKey
{
    WeatherClass weather = WeatherClass::Clear;
    int hour = 0; // 0..23

    // Normalizes the weather to its playlist class and wraps the hour into 0..23.
    [[nodiscard]] static SelectionKey Make(WeatherClass w, int hour) noexcept;

    [[nodiscard]] int Digit() const noexcept { return WeatherDigit(weather); }
    [[nodiscard]] std::string ToString() const;

    friend bool operator==(const SelectionKey& a, const SelectionKey& b) noexcept
    {
        return a.Digit() == b.Digit() && a.hour == b.hour;
    }
};

// Accepts exactly "[0-2][00-23]".
[[nodiscard]] std::optional<SelectionKey> ParseSelectionKey(std::string_view text) noexcept;

struct SelectionKeyHash
{
    [[nodiscard]] std::size_t operator()(const SelectionKey& k) const noexcept
    {
        return static_cast<std::size_t>(k.Digit() * 24 + k.hour);
    }
};

} // namespace nooku::rotation
