#pragma once
// include/nooku/weather/WeatherCache.hpp
//
// Cooldown-gated holder of the last fetched weather classification.
//
// Notes:
//  - A fetch happens only when now - lastFetch strictly exceeds the cooldown.
//  - The attempt time is recorded before the call, so a failing endpoint is
//    throttled exactly like a healthy one.
//  - lastFetch never moves backwards, even if the wall clock does.
//  - "Playing" weather is only written by the session when a swap happens.

#include "nooku/runtime/Clock.hpp"
#include "nooku/weather/WeatherClient.hpp"

#include <chrono>
#include <cstddef>
#include <expected>
#include <mutex>
#include <string>

namespace nooku::weather {

inline constexpr std::chrono::minutes kDefaultFetchCooldown{10};

class WeatherCache {
public:
    WeatherCache(IWeatherClient& client,
                 Location location,
                 std::string apiKey,
                 const runtime::IClock& clock,
                 std::chrono::minutes cooldown = kDefaultFetchCooldown);

    WeatherCache(const WeatherCache&)            = delete;
    WeatherCache& operator=(const WeatherCache&) = delete;

    // Fresh classification when the cooldown elapsed, cached one otherwise.
    // Errors from the collaborator surface here; the cached value is untouched.
    std::expected<WeatherClass, WeatherError> Fetch();

    [[nodiscard]] WeatherClass Cached() const;
    [[nodiscard]] WeatherClass Playing() const;
    void MarkPlaying(WeatherClass w);

    [[nodiscard]] runtime::TimePoint LastFetchTime() const;
    [[nodiscard]] std::size_t FetchAttempts() const;
    [[nodiscard]] const Location& GetLocation() const noexcept { return m_location; }

private:
    IWeatherClient& m_client;
    const Location m_location;
    const std::string m_apiKey;
    const runtime::IClock& m_clock;
    const std::chrono::minutes m_cooldown;

    mutable std::mutex m_mutex;
    runtime::TimePoint m_lastFetch{}; // epoch: first Fetch always calls out
    WeatherClass m_cached = WeatherClass::Clear;
    WeatherClass m_playing = WeatherClass::Clear;
    std::size_t m_attempts = 0;
};

} // namespace nooku::weather
