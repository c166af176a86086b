#pragma once
// include/nooku/weather/WeatherClient.hpp
//
// Boundary to the external weather service. OpenWeatherClient speaks the
// OpenWeatherMap "current weather" endpoint over libcurl.

#include "nooku/weather/Weather.hpp"

#include <chrono>
#include <expected>
#include <string>
#include <string_view>

namespace nooku::weather {

struct WeatherError {
    enum class Code {
        Network,
        HttpStatus,
        MalformedPayload,
        MissingCredential,
    } code{};
    std::string message;
};

[[nodiscard]] const char* WeatherErrorName(WeatherError::Code code) noexcept;

class IWeatherClient {
public:
    virtual ~IWeatherClient() = default;

    virtual std::expected<WeatherReport, WeatherError>
    FetchConditionCode(const Location& loc, std::string_view apiKey) = 0;
};

// Extracts weather[0].id (and weather[0].description when present).
[[nodiscard]] std::expected<WeatherReport, WeatherError>
ParseOpenWeatherPayload(std::string_view body);

class OpenWeatherClient final : public IWeatherClient {
public:
    explicit OpenWeatherClient(std::string apiUrl,
                               std::chrono::seconds timeout = std::chrono::seconds(10));
    ~OpenWeatherClient() override;

    OpenWeatherClient(const OpenWeatherClient&)            = delete;
    OpenWeatherClient& operator=(const OpenWeatherClient&) = delete;

    std::expected<WeatherReport, WeatherError>
    FetchConditionCode(const Location& loc, std::string_view apiKey) override;

    [[nodiscard]] std::string BuildRequestUrl(const Location& loc, std::string_view apiKey) const;

private:
    std::string m_apiUrl;
    std::chrono::seconds m_timeout;
};

} // namespace nooku::weather
