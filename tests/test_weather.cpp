// tests/test_weather.cpp
//
// Condition-code classification and OpenWeatherMap payload parsing.

#include <doctest/doctest.h>

#include "nooku/weather/Weather.hpp"
#include "nooku/weather/WeatherClient.hpp"

#include <string>

using namespace nooku::weather;

TEST_CASE("ClassifyConditionCode maps the leading digit")
{
    CHECK(ClassifyConditionCode(200) == WeatherClass::Rainy); // thunderstorm
    CHECK(ClassifyConditionCode(311) == WeatherClass::Rainy); // drizzle
    CHECK(ClassifyConditionCode(502) == WeatherClass::Rainy);
    CHECK(ClassifyConditionCode(601) == WeatherClass::Snowy);
    CHECK(ClassifyConditionCode(741) == WeatherClass::Unknown); // fog
    CHECK(ClassifyConditionCode(800) == WeatherClass::Clear);
    CHECK(ClassifyConditionCode(804) == WeatherClass::Clear);
}

TEST_CASE("ClassifyConditionCode treats odd codes as Unknown")
{
    CHECK(ClassifyConditionCode(0) == WeatherClass::Unknown);
    CHECK(ClassifyConditionCode(100) == WeatherClass::Unknown);
    CHECK(ClassifyConditionCode(-500) == WeatherClass::Unknown);
    CHECK(ClassifyConditionCode(9) == WeatherClass::Unknown);
}

TEST_CASE("ParseOpenWeatherPayload reads weather[0]")
{
    const auto r = ParseOpenWeatherPayload(
        R"({"coord":{"lon":-79.81,"lat":34.22},"weather":[{"id":501,"main":"Rain","description":"moderate rain"}],"name":"Florence"})");
    REQUIRE(r.has_value());
    CHECK(r->conditionCode == 501);
    CHECK(r->description == "moderate rain");
}

TEST_CASE("ParseOpenWeatherPayload tolerates a missing description")
{
    const auto r = ParseOpenWeatherPayload(R"({"weather":[{"id":800}]})");
    REQUIRE(r.has_value());
    CHECK(r->conditionCode == 800);
    CHECK(r->description.empty());
}

TEST_CASE("ParseOpenWeatherPayload accepts ids at the edge of int")
{
    const auto r = ParseOpenWeatherPayload(R"({"weather":[{"id":2147483647}]})");
    REQUIRE(r.has_value());
    CHECK(r->conditionCode == 2147483647);
}

TEST_CASE("ParseOpenWeatherPayload rejects malformed bodies")
{
    const char* bodies[] = {
        "",
        "not json",
        R"({"cod":401,"message":"Invalid API key"})",
        R"({"weather":[]})",
        R"({"weather":{"id":800}})",
        R"({"weather":["800"]})",
        R"({"weather":[{"id":"800"}]})",
        R"({"weather":[{"id":800.5}]})",
        R"({"weather":[{"id":4294967797}]})",
        R"({"weather":[{"id":-4294967296}]})",
        R"({"weather":[{"id":18446744073709551615}]})",
    };

    for (const char* body : bodies)
    {
        CAPTURE(body);
        const auto r = ParseOpenWeatherPayload(body);
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code == WeatherError::Code::MalformedPayload);
    }
}

TEST_CASE("OpenWeatherClient builds the current-weather URL")
{
    OpenWeatherClient client("https://api.example.test/data/2.5");
    const std::string url = client.BuildRequestUrl(Location{34.221924, -79.814693}, "KEY");
    CHECK(url == "https://api.example.test/data/2.5/weather?lat=34.221924&lon=-79.814693&appid=KEY");
}

TEST_CASE("OpenWeatherClient refuses to call out without a credential")
{
    OpenWeatherClient client("http://127.0.0.1:9/");
    const auto r = client.FetchConditionCode(Location{}, "");
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code == WeatherError::Code::MissingCredential);
}

TEST_CASE("WeatherErrorName covers every code")
{
    CHECK(std::string(WeatherErrorName(WeatherError::Code::Network)) == "Network");
    CHECK(std::string(WeatherErrorName(WeatherError::Code::HttpStatus)) == "HttpStatus");
    CHECK(std::string(WeatherErrorName(WeatherError::Code::MalformedPayload)) == "MalformedPayload");
    CHECK(std::string(WeatherErrorName(WeatherError::Code::MissingCredential)) == "MissingCredential");
}
