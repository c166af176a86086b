// tests/test_selection_key.cpp

#include <doctest/doctest.h>

#include "nooku/rotation/KeyDerivation.hpp"
#include "nooku/rotation/SelectionKey.hpp"
#include "nooku/weather/WeatherCache.hpp"
#include "test_support/Fakes.h"

#include <cctype>

using namespace nooku;
using rotation::ParseSelectionKey;
using rotation::SelectionKey;
using weather::WeatherClass;

TEST_CASE("SelectionKey: every hour and class renders as [digit][00-23]")
{
    const struct { WeatherClass w; int code; char digit; } classes[] = {
        {WeatherClass::Clear, 800, '0'},
        {WeatherClass::Rainy, 500, '1'},
        {WeatherClass::Snowy, 600, '2'},
        {WeatherClass::Unknown, 741, '0'},
    };

    for (const auto& c : classes)
    {
        test::ManualClock clock(test::At(0));
        test::FakeWeatherClient client(c.code);
        weather::WeatherCache cache(client, weather::Location{}, "KEY", clock);
        rotation::KeyDerivation keys(cache, clock);

        for (int hour = 0; hour < 24; ++hour)
        {
            clock.Set(test::At(hour, 17, 3));
            const std::string s = keys.CurrentSlot().ToString();
            CAPTURE(s);
            REQUIRE(s.size() == 3);
            CHECK(s[0] == c.digit);
            CHECK(std::isdigit(static_cast<unsigned char>(s[1])));
            CHECK(std::isdigit(static_cast<unsigned char>(s[2])));
            CHECK((s[1] - '0') * 10 + (s[2] - '0') == hour);

            CHECK(SelectionKey::Make(c.w, hour).ToString() == s);
        }
    }
}

TEST_CASE("SelectionKey: Unknown weather shares the Clear playlist")
{
    CHECK(SelectionKey::Make(WeatherClass::Unknown, 7) == SelectionKey::Make(WeatherClass::Clear, 7));
    CHECK(SelectionKey::Make(WeatherClass::Unknown, 7).weather == WeatherClass::Clear);
    CHECK_FALSE(SelectionKey::Make(WeatherClass::Rainy, 7) == SelectionKey::Make(WeatherClass::Clear, 7));
    CHECK_FALSE(SelectionKey::Make(WeatherClass::Rainy, 7) == SelectionKey::Make(WeatherClass::Rainy, 8));
}

TEST_CASE("SelectionKey: Make wraps the hour")
{
    CHECK(SelectionKey::Make(WeatherClass::Clear, 24).hour == 0);
    CHECK(SelectionKey::Make(WeatherClass::Clear, -1).hour == 23);
}

TEST_CASE("ParseSelectionKey accepts exactly three digits in range")
{
    const auto k = ParseSelectionKey("105");
    REQUIRE(k.has_value());
    CHECK(k->weather == WeatherClass::Rainy);
    CHECK(k->hour == 5);

    REQUIRE(ParseSelectionKey("223").has_value());
    CHECK(ParseSelectionKey("223")->weather == WeatherClass::Snowy);

    CHECK_FALSE(ParseSelectionKey("").has_value());
    CHECK_FALSE(ParseSelectionKey("10").has_value());
    CHECK_FALSE(ParseSelectionKey("1050").has_value());
    CHECK_FALSE(ParseSelectionKey("305").has_value());
    CHECK_FALSE(ParseSelectionKey("124").has_value());
    CHECK_FALSE(ParseSelectionKey("REA").has_value());
    CHECK_FALSE(ParseSelectionKey("1a5").has_value());
}
