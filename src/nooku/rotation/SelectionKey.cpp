#include "nooku/rotation/SelectionKey.hpp"

namespace nooku::rotation {

using weather::WeatherClass;

SelectionKey SelectionKey::Make(WeatherClass w, int hour) noexcept
{
    SelectionKey k;
    k.weather = (w == WeatherClass::Unknown) ? WeatherClass::Clear : w;
    k.hour = ((hour % 24) + 24) % 24;
    return k;
}

std::string SelectionKey::ToString() const
{
    std::string out(3, '0');
    out[0] = static_cast<char>('0' + Digit());
    out[1] = static_cast<char>('0' + hour / 10);
    out[2] = static_cast<char>('0' + hour % 10);
    return out;
}

std::optional<SelectionKey> ParseSelectionKey(std::string_view text) noexcept
{
    if (text.size() != 3)
        return std::nullopt;

    for (char c : text)
        if (c < '0' || c > '9')
            return std::nullopt;

    WeatherClass w;
    switch (text[0])
    {
    case '0': w = WeatherClass::Clear; break;
    case '1': w = WeatherClass::Rainy; break;
    case '2': w = WeatherClass::Snowy; break;
    default: return std::nullopt;
    }

    const int hour = (text[1] - '0') * 10 + (text[2] - '0');
    if (hour > 23)
        return std::nullopt;

    return SelectionKey::Make(w, hour);
}

} // namespace nooku::rotation
